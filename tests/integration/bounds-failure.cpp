#include "mock.fixture.hh"
#include "test.macros.hh"
#include "volume.accessor.hh"

#include <limits>

int
main()
{
    int retval = 0;

    try {
        MockFixture fixture;
        const auto metadata = dvid::VolumeMetadata::default_metadata(
          { 1, 100, 100, 100 }, DvidDataType_uint8, "cxyz", 1.0, "nanometers");
        fixture.add_volume("test", "uuid1", "volume", metadata);

        dvid::VolumeAccessor accessor(fixture.pool, "uuid1", "volume");

        EXPECT_THROWS(
          dvid::BoundsError,
          accessor.get_subvolume({ 0, 50, 50, 50 }, { 1, 60, 60, 60 }));
        EXPECT_THROWS(
          dvid::BoundsError,
          accessor.get_subvolume({ 0, -1, 0, 0 }, { 1, 10, 10, 10 }));
        EXPECT_THROWS(dvid::BoundsError,
                      accessor.get_subvolume({ 0, 0, 0 }, { 1, 10, 10 }));
        EXPECT_THROWS(
          dvid::BoundsError,
          accessor.get_subvolume({ 0, 0, 0, 0 }, { 2, 10, 10, 10 }));
        EXPECT_THROWS(
          dvid::BoundsError,
          accessor.get_subvolume({ 0, 10, 0, 0 }, { 1, -5, 10, 10 }));

        // offsets near the top of the coordinate range must not wrap
        constexpr auto int64_max = std::numeric_limits<int64_t>::max();
        EXPECT_THROWS(
          dvid::BoundsError,
          accessor.get_subvolume({ 0, int64_max, 0, 0 }, { 1, 2, 1, 1 }));
        EXPECT_THROWS(
          dvid::BoundsError,
          accessor.get_subvolume({ 0, 1, 0, 0 }, { 1, int64_max, 1, 1 }));

        const auto data =
          dvid::NdArray::full<uint8_t>({ 1, 60, 60, 60 }, uint8_t{ 3 });
        EXPECT_THROWS(dvid::BoundsError,
                      accessor.post_subvolume(
                        { 0, 50, 50, 50 }, { 1, 60, 60, 60 }, data));
        EXPECT_THROWS(dvid::ShapeMismatchError,
                      accessor.post_subvolume(
                        { 0, 0, 0, 0 }, { 1, 60, 60, 30 }, data));
        EXPECT_THROWS(
          dvid::DtypeMismatchError,
          accessor.post_subvolume(
            { 0, 0, 0, 0 },
            { 1, 60, 60, 60 },
            dvid::NdArray::full<uint16_t>({ 1, 60, 60, 60 }, uint16_t{ 3 })));

        // none of the rejected writes reached the server
        const auto contents =
          accessor.get_subvolume({ 0, 0, 0, 0 }, { 1, 100, 100, 100 });
        for (const auto v : contents.values<uint8_t>()) {
            EXPECT_EQ(int, v, 0);
        }

        // the largest valid region
        accessor.post_subvolume({ 0, 40, 40, 40 }, { 1, 60, 60, 60 }, data);
        EXPECT_EQ(int,
                  (accessor.get_subvolume({ 0, 99, 99, 99 }, { 1, 1, 1, 1 })
                     .at<uint8_t>({ 0, 0, 0, 0 })),
                  3);

        // empty regions need no transfer
        const auto empty =
          accessor.get_subvolume({ 0, 100, 0, 0 }, { 1, 0, 10, 10 });
        EXPECT_EQ(size_t, empty.size(), 0);

        // unknown volumes
        EXPECT_THROWS(dvid::NotFoundError,
                      dvid::VolumeAccessor(fixture.pool, "uuid1", "missing"));
        EXPECT_THROWS(dvid::NotFoundError,
                      dvid::VolumeAccessor(fixture.pool, "uuid2", "volume"));
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
