#include "nd.array.hh"
#include "unit.test.macros.hh"

int
main()
{
    int retval = 0;

    try {
        auto array = dvid::NdArray::full<float>({ 2, 3, 4 }, 1.5f);
        EXPECT_EQ(int, array.dtype(), DvidDataType_float32);
        EXPECT_EQ(size_t, array.size(), 24);
        EXPECT_EQ(size_t, array.bytes_of_data(), 96);
        EXPECT_EQ(size_t, array.flat_index({ 1, 2, 3 }), 23);
        EXPECT_EQ(size_t, array.flat_index({ 1, 0, 0 }), 12);

        array.at<float>({ 0, 1, 2 }) = -2.0f;
        EXPECT_EQ(float, array.values<float>()[6], -2.0f);

        EXPECT_THROWS(dvid::DtypeMismatchError, array.values<double>());
        EXPECT_THROWS(dvid::BoundsError, array.flat_index({ 2, 0, 0 }));
        EXPECT_THROWS(dvid::BoundsError, array.flat_index({ 0, 0 }));

        const auto copy = array;
        auto reshaped = std::move(array).reshaped({ 6, 4 });
        CHECK((reshaped.shape() == std::vector<size_t>{ 6, 4 }));
        EXPECT_EQ(float, reshaped.at<float>({ 1, 2 }), -2.0f);
        CHECK(!(reshaped == copy));
        CHECK(std::move(reshaped).reshaped({ 2, 3, 4 }) == copy);

        EXPECT_THROWS(
          dvid::ShapeMismatchError,
          dvid::NdArray({ 2, 2 },
                        DvidDataType_uint16,
                        std::vector<std::byte>(7)));

        const dvid::NdArray zeros({ 3, 0, 2 }, DvidDataType_int64);
        EXPECT_EQ(size_t, zeros.size(), 0);
        EXPECT_STR_EQ(dvid::format_shape(zeros.shape()), "(3, 0, 2)");
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
