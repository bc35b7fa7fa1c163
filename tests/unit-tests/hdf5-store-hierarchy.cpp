#include "hdf5.store.hh"
#include "volume.store.checks.hh"

#include <hdf5.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace {
/// Add a volume without metadata, as another tool would write it.
void
write_bare_dataset(const fs::path& path)
{
    const auto file = H5Fopen(path.string().c_str(), H5F_ACC_RDWR, H5P_DEFAULT);
    CHECK(file >= 0);

    const hsize_t dims[] = { 6, 5, 3 };
    const auto space = H5Screate_simple(3, dims, nullptr);
    const auto dataset = H5Dcreate2(file,
                                    "/datasets/fly/nodes/ccc/bare",
                                    H5T_NATIVE_UINT32,
                                    space,
                                    H5P_DEFAULT,
                                    H5P_DEFAULT,
                                    H5P_DEFAULT);
    CHECK(dataset >= 0);

    CHECK(H5Dclose(dataset) >= 0);
    CHECK(H5Sclose(space) >= 0);
    CHECK(H5Fclose(file) >= 0);
}
} // namespace

int
main()
{
    int retval = 0;
    fs::path tmp_path = fs::temp_directory_path() / (TEST ".h5");

    try {
        CHECK(!fs::exists(tmp_path));

        {
            dvid::mock::Hdf5Store store(tmp_path.string());
            check_store_hierarchy(store);
            check_store_regions(store);
        }

        // the hierarchy and the data persist
        {
            dvid::mock::Hdf5Store store(tmp_path.string());
            CHECK((store.list_children({ "mouse" }) ==
                   std::vector<std::string>{ "bbb", "aaa" }));

            auto handle = store.open("aaa", "grayscale");
            dvid::NdArray value({ 1, 1, 1, 1 }, DvidDataType_uint16);
            handle->read_region(
              dvid::BoundingBox::from_offset_shape({ 5, 5, 5, 1 },
                                                   { 1, 1, 1, 1 }),
              value.bytes());
            EXPECT_EQ(int, value.values<uint16_t>()[0], 120);
        }

        // datasets without metadata get a default description
        write_bare_dataset(tmp_path);
        {
            dvid::mock::Hdf5Store store(tmp_path.string());
            const auto handle = store.open("ccc", "bare");
            const auto& metadata = handle->metadata();
            CHECK((metadata.shape() == std::vector<size_t>{ 3, 5, 6 }));
            EXPECT_STR_EQ(metadata.axis_labels(), "cxy");
            EXPECT_EQ(int, metadata.dtype(), DvidDataType_uint32);
            CHECK((metadata.resolution() == std::vector<double>{ 1.0, 1.0 }));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    std::error_code ec;
    if (!fs::remove(tmp_path, ec)) {
        LOG_ERROR("Failed to remove file: ", ec.message());
        retval = 1;
    }

    return retval;
}
