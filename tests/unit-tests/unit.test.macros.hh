#pragma once

#include "macros.hh"

/// Check that a==b
/// example: `EXPECT_EQ(int, 42, meaning_of_life())`
#define EXPECT_EQ(T, a, b)                                                     \
    do {                                                                       \
        T a_ = (T)(a);                                                         \
        T b_ = (T)(b);                                                         \
        EXPECT(                                                                \
          a_ == b_, "Expected ", #a, " == ", #b, " but ", a_, " != ", b_);     \
    } while (0)

#define EXPECT_STR_EQ(a, b)                                                    \
    do {                                                                       \
        std::string a_ = (a);                                                  \
        std::string b_ = (b);                                                  \
        EXPECT(a_ == b_,                                                       \
               "Expected ",                                                    \
               #a,                                                             \
               " == ",                                                         \
               #b,                                                             \
               " but '",                                                       \
               a_,                                                             \
               "' != '",                                                       \
               b_,                                                             \
               "'");                                                           \
    } while (0)

/// Check that evaluating `expr` throws an exception of type `ErrorType`.
#define EXPECT_THROWS(ErrorType, expr)                                         \
    do {                                                                       \
        bool thrown_ = false;                                                  \
        try {                                                                  \
            (void)(expr);                                                      \
        } catch (const ErrorType&) {                                           \
            thrown_ = true;                                                    \
        }                                                                      \
        EXPECT(thrown_, "Expected ", #expr, " to throw ", #ErrorType);         \
    } while (0)
