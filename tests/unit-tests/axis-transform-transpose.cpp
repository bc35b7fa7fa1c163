#include "axis.transform.hh"
#include "unit.test.macros.hh"

int
main()
{
    int retval = 0;

    try {
        const auto strides = dvid::compute_strides({ 5, 4, 3, 2 }, 2);
        CHECK((strides == std::vector<size_t>{ 48, 12, 4, 2 }));

        // canonical (c, x, y) = (2, 3, 4)
        const auto mapping = dvid::AxisOrderMapping::reversal("cxy");
        dvid::NdArray canonical({ 2, 3, 4 }, DvidDataType_uint16);
        for (size_t c = 0; c < 2; ++c) {
            for (size_t x = 0; x < 3; ++x) {
                for (size_t y = 0; y < 4; ++y) {
                    canonical.at<uint16_t>({ c, x, y }) =
                      static_cast<uint16_t>(100 * c + 10 * x + y);
                }
            }
        }

        const auto wire = dvid::to_wire_array(canonical, mapping);
        CHECK((wire.shape() == std::vector<size_t>{ 4, 3, 2 }));
        for (size_t c = 0; c < 2; ++c) {
            for (size_t x = 0; x < 3; ++x) {
                for (size_t y = 0; y < 4; ++y) {
                    EXPECT_EQ(int,
                              wire.at<uint16_t>({ y, x, c }),
                              100 * c + 10 * x + y);
                }
            }
        }

        // channel varies fastest on the wire
        const auto values = wire.values<uint16_t>();
        EXPECT_EQ(int, values[0], 0);
        EXPECT_EQ(int, values[1], 100);
        EXPECT_EQ(int, values[2], 10);

        CHECK(dvid::to_canonical_array(wire, mapping) == canonical);
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
