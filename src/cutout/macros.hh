#pragma once

#include "logger.hh"
#include "errors.hh"

#define EXPECT(e, ...)                                                         \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw std::runtime_error(__err);                                   \
        }                                                                      \
    } while (0)
#define CHECK(e) EXPECT(e, "Expression evaluated as false:\n\t", #e)

/// Like EXPECT, but throws the given dvid::Error subclass.
#define EXPECT_AS(ErrorType, e, ...)                                           \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw ErrorType(__err);                                            \
        }                                                                      \
    } while (0)

/// Throws a dvid::Error with the given status code.
#define EXPECT_STATUS(code, e, ...)                                            \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw dvid::Error((code), __err);                                  \
        }                                                                      \
    } while (0)

#define EXPECT_VALID_ARGUMENT(e, ...)                                          \
    do {                                                                       \
        if (!(e)) {                                                            \
            LOG_ERROR(__VA_ARGS__);                                            \
            return DvidStatusCode_InvalidArgument;                             \
        }                                                                      \
    } while (0)
