#include "axis.transform.hh"
#include "unit.test.macros.hh"

#include <algorithm>
#include <limits>

using dvid::AxisMismatchError;
using dvid::AxisOrderMapping;
using dvid::BoundingBox;

int
main()
{
    int retval = 0;

    try {
        const auto box =
          BoundingBox::from_offset_shape({ 0, 10, 20, 30 }, { 4, 100, 100, 100 });

        const auto reversal = AxisOrderMapping::reversal("cxyz");
        EXPECT_STR_EQ(reversal.wire_labels(), "zyxc");

        const auto wire = dvid::to_wire_order(box, reversal);
        CHECK((wire.start == std::vector<int64_t>{ 30, 20, 10, 0 }));
        CHECK((wire.stop == std::vector<int64_t>{ 130, 120, 110, 4 }));
        CHECK(dvid::to_canonical_order(wire, reversal) == box);

        // every permutation of four labels round-trips
        std::string labels = "cxyz";
        std::sort(labels.begin(), labels.end());
        do {
            const AxisOrderMapping mapping("cxyz", labels);
            CHECK(dvid::to_canonical_order(dvid::to_wire_order(box, mapping),
                                           mapping) == box);
            CHECK(mapping.inverse().inverse() == mapping);
            CHECK(mapping.permute_to_canonical(
                    mapping.permute_to_wire(box.stop)) == box.stop);
        } while (std::next_permutation(labels.begin(), labels.end()));

        // regions are checked without forming offset + shape
        constexpr auto int64_max = std::numeric_limits<int64_t>::max();
        const std::vector<size_t> extent{ 4, 200, 200, 200 };
        CHECK(dvid::region_fits({ 0, 10, 20, 30 }, { 4, 100, 100, 100 }, extent));
        CHECK(dvid::region_fits({ 0, 200, 0, 0 }, { 4, 0, 200, 200 }, extent));
        CHECK(!dvid::region_fits({ 0, int64_max, 0, 0 }, { 1, 2, 1, 1 }, extent));
        CHECK(!dvid::region_fits({ 0, 1, 0, 0 }, { 1, int64_max, 1, 1 }, extent));
        CHECK(!dvid::region_fits({ 0, 10, 0, 0 }, { 1, -5, 1, 1 }, extent));
        CHECK(!dvid::region_fits({ 0, -1, 0, 0 }, { 1, 1, 1, 1 }, extent));
        CHECK(!dvid::region_fits({ 0, 0, 0 }, { 1, 1, 1 }, extent));
        EXPECT_THROWS(dvid::BoundsError,
                      BoundingBox::from_offset_shape({ int64_max }, { 2 }));
        EXPECT_THROWS(
          dvid::BoundsError,
          BoundingBox::from_offset_shape({ -int64_max }, { -int64_max }));

        // mismatched label sets and ranks
        EXPECT_THROWS(AxisMismatchError, AxisOrderMapping("cxyz", "zyxt"));
        EXPECT_THROWS(AxisMismatchError, AxisOrderMapping("cxyz", "zyx"));
        EXPECT_THROWS(AxisMismatchError, AxisOrderMapping("cxxz", "zxxc"));
        EXPECT_THROWS(
          AxisMismatchError,
          dvid::to_wire_order(
            BoundingBox::from_offset_shape({ 0, 0 }, { 1, 1 }), reversal));
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
