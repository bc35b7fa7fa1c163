#include "axis.transform.hh"
#include "unit.test.macros.hh"

using dvid::BoundingBox;

int
main()
{
    int retval = 0;

    try {
        // full (4, 5, 6) array of int32 holding its own flat index
        const std::vector<size_t> full_shape{ 4, 5, 6 };
        dvid::NdArray full(full_shape, DvidDataType_int32);
        auto values = full.values<int32_t>();
        for (size_t i = 0; i < values.size(); ++i) {
            values[i] = static_cast<int32_t>(i);
        }

        const auto box = BoundingBox::from_offset_shape({ 1, 2, 3 }, { 2, 2, 3 });
        dvid::NdArray region({ 2, 2, 3 }, DvidDataType_int32);
        dvid::copy_region_out(full.bytes(), full_shape, box, 4, region.bytes());

        for (size_t i = 0; i < 2; ++i) {
            for (size_t j = 0; j < 2; ++j) {
                for (size_t k = 0; k < 3; ++k) {
                    EXPECT_EQ(int32_t,
                              region.at<int32_t>({ i, j, k }),
                              full.flat_index({ i + 1, j + 2, k + 3 }));
                }
            }
        }

        // write the region back, negated
        for (auto& v : region.values<int32_t>()) {
            v = -v;
        }
        dvid::copy_region_in(full.bytes(), full_shape, box, 4, region.bytes());
        EXPECT_EQ(int32_t, full.at<int32_t>({ 1, 2, 3 }), -45);
        EXPECT_EQ(int32_t, full.at<int32_t>({ 2, 3, 5 }), -83);
        EXPECT_EQ(int32_t, full.at<int32_t>({ 1, 2, 2 }), 44);
        EXPECT_EQ(int32_t, full.at<int32_t>({ 3, 4, 5 }), 119);

        EXPECT_THROWS(
          dvid::BoundsError,
          dvid::copy_region_out(
            full.bytes(),
            full_shape,
            BoundingBox::from_offset_shape({ 3, 0, 0 }, { 2, 2, 3 }),
            4,
            region.bytes()));
        EXPECT_THROWS(dvid::ShapeMismatchError,
                      dvid::copy_region_out(full.bytes(),
                                            full_shape,
                                            BoundingBox::full({ 1, 1, 1 }),
                                            4,
                                            region.bytes()));
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
