#include "slicing.hh"
#include "unit.test.macros.hh"

using dvid::SliceSpec;

namespace {
using Coords = std::vector<int64_t>;
using Sizes = std::vector<size_t>;
} // namespace

int
main()
{
    int retval = 0;

    try {
        const Sizes shape{ 4, 200, 200, 200 };

        // [:, 10:110, 20:120, 30:130]
        auto r = dvid::resolve_slicing(
          SliceSpec().all().range(10, 110).range(20, 120).range(30, 130),
          shape);
        CHECK((r.offset == Coords{ 0, 10, 20, 30 }));
        CHECK((r.shape == Coords{ 4, 100, 100, 100 }));
        CHECK(r.reduced_axes.empty());

        // missing trailing axes are full ranges
        r = dvid::resolve_slicing(SliceSpec().range(1, 3), shape);
        CHECK((r.offset == Coords{ 1, 0, 0, 0 }));
        CHECK((r.shape == Coords{ 2, 200, 200, 200 }));

        // [..., 5] reduces the last axis
        r = dvid::resolve_slicing(SliceSpec().ellipsis().index(5), shape);
        CHECK((r.offset == Coords{ 0, 0, 0, 5 }));
        CHECK((r.shape == Coords{ 4, 200, 200, 1 }));
        CHECK((r.reduced_axes == Sizes{ 3 }));
        CHECK((r.result_shape() == Sizes{ 4, 200, 200 }));

        // [0, ..., -1, 10:] with negative index
        r = dvid::resolve_slicing(
          SliceSpec().index(0).ellipsis().index(-1).range(10, std::nullopt),
          shape);
        CHECK((r.offset == Coords{ 0, 0, 199, 10 }));
        CHECK((r.shape == Coords{ 1, 200, 1, 190 }));
        CHECK((r.result_shape() == Sizes{ 200, 190 }));
        CHECK(r.is_reduced(0) && r.is_reduced(2) && !r.is_reduced(1));

        // negative and out-of-range bounds clamp
        r = dvid::resolve_slicing(
          SliceSpec().all().range(-50, 1000).range(150, 100).range(-500, -190),
          shape);
        CHECK((r.offset == Coords{ 0, 150, 150, 0 }));
        CHECK((r.shape == Coords{ 4, 50, 0, 10 }));

        // an ellipsis that expands to nothing
        r = dvid::resolve_slicing(
          SliceSpec().all().all().all().ellipsis().all(), shape);
        CHECK((r.shape == Coords{ 4, 200, 200, 200 }));

        EXPECT_THROWS(dvid::UnsupportedSliceError,
                      dvid::resolve_slicing(
                        SliceSpec().all().range(0, 10, 2), shape));
        EXPECT_THROWS(dvid::UnsupportedSliceError,
                      dvid::resolve_slicing(
                        SliceSpec().ellipsis().index(1).ellipsis(), shape));
        EXPECT_THROWS(dvid::BoundsError,
                      dvid::resolve_slicing(
                        SliceSpec().all().all().all().all().all(), shape));
        EXPECT_THROWS(dvid::BoundsError,
                      dvid::resolve_slicing(SliceSpec().index(4), shape));
        EXPECT_THROWS(dvid::BoundsError,
                      dvid::resolve_slicing(SliceSpec().index(-5), shape));
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
