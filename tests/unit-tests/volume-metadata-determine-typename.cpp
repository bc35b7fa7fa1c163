#include "volume.metadata.hh"
#include "unit.test.macros.hh"

namespace {
std::string
typename_of(size_t channels, DvidDataType dtype)
{
    return dvid::VolumeMetadata::default_metadata(
             { channels, 16, 16, 16 }, dtype, "cxyz", 1.0, "nm")
      .determine_typename();
}
} // namespace

int
main()
{
    int retval = 0;

    try {
        EXPECT_STR_EQ(typename_of(1, DvidDataType_uint8), "grayscale8");
        EXPECT_STR_EQ(typename_of(1, DvidDataType_uint32), "labels32");
        EXPECT_STR_EQ(typename_of(1, DvidDataType_uint64), "labels64");
        EXPECT_STR_EQ(typename_of(4, DvidDataType_uint8), "rgba8");

        EXPECT_STR_EQ(typename_of(4, DvidDataType_uint16), "voxels");
        EXPECT_STR_EQ(typename_of(2, DvidDataType_uint8), "voxels");
        EXPECT_STR_EQ(typename_of(1, DvidDataType_float32), "voxels");
        EXPECT_STR_EQ(typename_of(1, DvidDataType_int64), "voxels");
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
