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
          { 1, 20, 30, 40 }, DvidDataType_uint32, "cxyz", 4.0, "nanometers");
        fixture.add_volume("test", "uuid1", "labels", metadata);

        dvid::ScopedConnection connection(*fixture.pool);

        // a volume name can only be taken once
        try {
            dvid::create_volume(*connection, "uuid1", "labels", metadata);
            EXPECT(false, "Expected a duplicate volume to be rejected");
        } catch (const dvid::HttpError& e) {
            EXPECT_EQ(int, e.status_code(), 409);
        }

        EXPECT_THROWS(
          dvid::NotFoundError,
          dvid::create_volume(*connection, "nonexistent", "labels", metadata));

        // the stored metadata is what was sent
        const auto fetched = dvid::get_metadata(*connection, "uuid1", "labels");
        CHECK(fetched == metadata);
        EXPECT_STR_EQ(fetched.determine_typename(), "labels32");

        EXPECT_THROWS(dvid::NotFoundError,
                      dvid::get_metadata(*connection, "uuid1", "other"));
        EXPECT_THROWS(dvid::NotFoundError,
                      dvid::VolumeAccessor(fixture.pool, "uuid1", "other"));

        dvid::VolumeAccessor accessor(fixture.pool, "uuid1", "labels");
        CHECK(accessor.metadata() == metadata);
        CHECK((accessor.shape() == std::vector<size_t>{ 1, 20, 30, 40 }));
        EXPECT_EQ(int, accessor.dtype(), DvidDataType_uint32);

        // a freshly created volume reads as zeros
        const auto contents =
          accessor.get_subvolume({ 0, 0, 0, 0 }, { 1, 20, 30, 40 });
        for (const auto v : contents.values<uint32_t>()) {
            EXPECT_EQ(uint32_t, v, 0);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
