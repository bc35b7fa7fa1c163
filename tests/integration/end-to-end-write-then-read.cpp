#include "mock.fixture.hh"
#include "test.macros.hh"
#include "volume.accessor.hh"

int
main()
{
    int retval = 0;

    try {
        MockFixture fixture;
        const auto metadata = dvid::VolumeMetadata::default_metadata(
          { 4, 200, 200, 200 }, DvidDataType_uint8, "cxyz", 1.0, "nanometers");
        fixture.add_volume("test", "uuid1", "volume", metadata);

        dvid::VolumeAccessor accessor(fixture.pool, "uuid1", "volume");
        CHECK(accessor.metadata() == metadata);

        const std::vector<int64_t> offset{ 0, 10, 20, 30 };
        const std::vector<int64_t> shape{ 4, 100, 100, 100 };
        const auto ones = dvid::NdArray::full<uint8_t>({ 4, 100, 100, 100 }, 1);

        const auto& returned = accessor.post_subvolume(offset, shape, ones);
        CHECK(&returned == &ones);

        const auto readback = accessor.get_subvolume(offset, shape);
        CHECK((readback.shape() == std::vector<size_t>{ 4, 100, 100, 100 }));
        for (const auto v : readback.values<uint8_t>()) {
            EXPECT_EQ(int, v, 1);
        }

        // the region is surrounded by zeros
        const auto border =
          accessor.get_subvolume({ 0, 9, 19, 29 }, { 4, 102, 102, 102 });
        EXPECT_EQ(int, (border.at<uint8_t>({ 0, 0, 0, 0 })), 0);
        EXPECT_EQ(int, (border.at<uint8_t>({ 3, 1, 1, 1 })), 1);
        EXPECT_EQ(int, (border.at<uint8_t>({ 3, 100, 100, 100 })), 1);
        EXPECT_EQ(int, (border.at<uint8_t>({ 3, 101, 100, 100 })), 0);
        EXPECT_EQ(size_t, fixture.engine.requests_in_flight(), 0);
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
