#include "hdf5.store.hh"
#include "macros.hh"

#include <algorithm>
#include <filesystem>
#include <mutex>
#include <optional>
#include <utility>

namespace fs = std::filesystem;

namespace {
constexpr const char* metadata_attribute = "dvid_metadata";

/// The HDF5 library is not reentrant unless built thread-safe.
std::mutex&
hdf5_mutex()
{
    static std::mutex mutex;
    return mutex;
}

/// Owns an HDF5 identifier.
class H5Object
{
  public:
    using Closer = herr_t (*)(hid_t);

    H5Object(hid_t id, Closer close, std::string_view what)
      : id_{ id }
      , close_{ close }
    {
        EXPECT_STATUS(DvidStatusCode_IOError, id_ >= 0, "HDF5: failed to ", what);
    }

    ~H5Object() noexcept { reset(); }

    H5Object(H5Object&& other) noexcept
      : id_{ other.id_ }
      , close_{ other.close_ }
    {
        other.id_ = H5I_INVALID_HID;
    }

    H5Object(const H5Object&) = delete;
    H5Object& operator=(const H5Object&) = delete;

    hid_t get() const noexcept { return id_; }

    void reset() noexcept
    {
        if (id_ >= 0 && close_(id_) < 0) {
            LOG_ERROR("HDF5: failed to close object ", id_);
        }
        id_ = H5I_INVALID_HID;
    }

  private:
    hid_t id_;
    Closer close_;
};

void
check_status(herr_t status, std::string_view what)
{
    EXPECT_STATUS(DvidStatusCode_IOError, status >= 0, "HDF5: failed to ", what);
}

hid_t
native_type(DvidDataType dtype)
{
    switch (dtype) {
        case DvidDataType_uint8:
            return H5T_NATIVE_UINT8;
        case DvidDataType_uint16:
            return H5T_NATIVE_UINT16;
        case DvidDataType_uint32:
            return H5T_NATIVE_UINT32;
        case DvidDataType_uint64:
            return H5T_NATIVE_UINT64;
        case DvidDataType_int8:
            return H5T_NATIVE_INT8;
        case DvidDataType_int16:
            return H5T_NATIVE_INT16;
        case DvidDataType_int32:
            return H5T_NATIVE_INT32;
        case DvidDataType_int64:
            return H5T_NATIVE_INT64;
        case DvidDataType_float32:
            return H5T_NATIVE_FLOAT;
        case DvidDataType_float64:
            return H5T_NATIVE_DOUBLE;
        default:
            throw dvid::SchemaError("Invalid data type: " +
                                    std::to_string(dtype));
    }
}

DvidDataType
data_type_of(hid_t type)
{
    const auto size = H5Tget_size(type);
    switch (H5Tget_class(type)) {
        case H5T_INTEGER: {
            const bool is_signed = H5Tget_sign(type) == H5T_SGN_2;
            switch (size) {
                case 1:
                    return is_signed ? DvidDataType_int8 : DvidDataType_uint8;
                case 2:
                    return is_signed ? DvidDataType_int16 : DvidDataType_uint16;
                case 4:
                    return is_signed ? DvidDataType_int32 : DvidDataType_uint32;
                case 8:
                    return is_signed ? DvidDataType_int64 : DvidDataType_uint64;
                default:
                    break;
            }
            break;
        }
        case H5T_FLOAT:
            if (size == 4) {
                return DvidDataType_float32;
            } else if (size == 8) {
                return DvidDataType_float64;
            }
            break;
        default:
            break;
    }

    throw dvid::SchemaError("Unsupported HDF5 element type of size " +
                            std::to_string(size));
}

H5Object
make_group_creation_plist()
{
    H5Object gcpl(H5Pcreate(H5P_GROUP_CREATE), H5Pclose, "create plist");
    check_status(H5Pset_link_creation_order(
                   gcpl.get(), H5P_CRT_ORDER_TRACKED | H5P_CRT_ORDER_INDEXED),
                 "track link creation order");
    return gcpl;
}

bool
exists(hid_t file, const std::string& path)
{
    // H5Lexists requires every intermediate link to exist
    size_t pos = 0;
    while ((pos = path.find('/', pos + 1)) != std::string::npos) {
        if (H5Lexists(file, path.substr(0, pos).c_str(), H5P_DEFAULT) <= 0) {
            return false;
        }
    }
    return H5Lexists(file, path.c_str(), H5P_DEFAULT) > 0;
}

void
ensure_group(hid_t file, const std::string& path)
{
    if (exists(file, path)) {
        return;
    }

    const auto gcpl = make_group_creation_plist();
    H5Object group(
      H5Gcreate2(file, path.c_str(), H5P_DEFAULT, gcpl.get(), H5P_DEFAULT),
      H5Gclose,
      "create group " + path);
}

/// Link names of a group, in creation order where the group tracks it.
std::vector<std::string>
list_links(hid_t file, const std::string& path)
{
    H5Object group(
      H5Gopen2(file, path.c_str(), H5P_DEFAULT), H5Gclose, "open " + path);

    H5G_info_t info;
    check_status(H5Gget_info(group.get(), &info), "query " + path);

    unsigned flags = 0;
    {
        H5Object gcpl(
          H5Gget_create_plist(group.get()), H5Pclose, "get create plist");
        check_status(H5Pget_link_creation_order(gcpl.get(), &flags),
                     "query link creation order");
    }
    const auto index =
      (flags & H5P_CRT_ORDER_INDEXED) ? H5_INDEX_CRT_ORDER : H5_INDEX_NAME;

    std::vector<std::string> names;
    for (hsize_t i = 0; i < info.nlinks; ++i) {
        const auto n = H5Lget_name_by_idx(
          group.get(), ".", index, H5_ITER_INC, i, nullptr, 0, H5P_DEFAULT);
        EXPECT_STATUS(DvidStatusCode_IOError,
                      n >= 0,
                      "HDF5: failed to get link name in ",
                      path);

        std::string name(static_cast<size_t>(n) + 1, '\0');
        const auto m = H5Lget_name_by_idx(group.get(),
                                          ".",
                                          index,
                                          H5_ITER_INC,
                                          i,
                                          name.data(),
                                          name.size(),
                                          H5P_DEFAULT);
        EXPECT_STATUS(DvidStatusCode_IOError,
                      m == n,
                      "HDF5: failed to get link name in ",
                      path);
        name.resize(static_cast<size_t>(n));
        names.push_back(std::move(name));
    }

    return names;
}

std::optional<std::string>
find_node_path(hid_t file, std::string_view uuid)
{
    if (!exists(file, "/datasets")) {
        return std::nullopt;
    }

    for (const auto& dataset : list_links(file, "/datasets")) {
        auto path = "/datasets/" + dataset + "/nodes/" + std::string(uuid);
        if (exists(file, path)) {
            return path;
        }
    }

    return std::nullopt;
}

std::string
read_string_attribute(hid_t object, const char* name)
{
    H5Object attr(
      H5Aopen(object, name, H5P_DEFAULT), H5Aclose, "open attribute");
    H5Object type(H5Aget_type(attr.get()), H5Tclose, "get attribute type");

    if (H5Tis_variable_str(type.get()) > 0) {
        H5Object mem_type(H5Tcopy(H5T_C_S1), H5Tclose, "copy string type");
        check_status(H5Tset_size(mem_type.get(), H5T_VARIABLE),
                     "set string size");
        char* value = nullptr;
        check_status(H5Aread(attr.get(), mem_type.get(), &value),
                     "read attribute");
        std::string result = value ? value : "";
        H5free_memory(value);
        return result;
    }

    const auto size = H5Tget_size(type.get());
    std::string value(size, '\0');
    check_status(H5Aread(attr.get(), type.get(), value.data()),
                 "read attribute");
    if (const auto nul = value.find('\0'); nul != std::string::npos) {
        value.resize(nul);
    }
    return value;
}

void
write_string_attribute(hid_t object, const char* name, const std::string& value)
{
    H5Object type(H5Tcopy(H5T_C_S1), H5Tclose, "copy string type");
    check_status(H5Tset_size(type.get(), std::max<size_t>(value.size(), 1)),
                 "set string size");
    H5Object space(H5Screate(H5S_SCALAR), H5Sclose, "create scalar space");
    H5Object attr(
      H5Acreate2(
        object, name, type.get(), space.get(), H5P_DEFAULT, H5P_DEFAULT),
      H5Aclose,
      "create attribute");
    check_status(H5Awrite(attr.get(), type.get(), value.c_str()),
                 "write attribute");
}

std::vector<hsize_t>
dataset_dims(hid_t dataset)
{
    H5Object space(H5Dget_space(dataset), H5Sclose, "get dataspace");
    const auto rank = H5Sget_simple_extent_ndims(space.get());
    EXPECT_STATUS(
      DvidStatusCode_IOError, rank >= 0, "HDF5: failed to get dataset rank");

    std::vector<hsize_t> dims(static_cast<size_t>(rank));
    if (rank > 0) {
        EXPECT_STATUS(DvidStatusCode_IOError,
                      H5Sget_simple_extent_dims(space.get(), dims.data(), nullptr) ==
                        rank,
                      "HDF5: failed to get dataset extent");
    }
    return dims;
}

dvid::VolumeMetadata
load_metadata(hid_t dataset)
{
    const auto dims = dataset_dims(dataset);

    // stored in wire order
    std::vector<size_t> wire_shape(dims.begin(), dims.end());

    if (H5Aexists(dataset, metadata_attribute) > 0) {
        auto metadata = dvid::VolumeMetadata::parse(
          read_string_attribute(dataset, metadata_attribute));
        EXPECT_AS(
          dvid::SchemaError,
          metadata.wire_mapping().permute_to_wire(metadata.shape()) ==
            wire_shape,
          "Metadata shape ",
          dvid::format_shape(metadata.shape()),
          " does not match the stored shape ",
          dvid::format_shape(wire_shape));
        return metadata;
    }

    H5Object type(H5Dget_type(dataset), H5Tclose, "get dataset type");
    const auto dtype = data_type_of(type.get());

    EXPECT_AS(dvid::SchemaError,
              !wire_shape.empty() &&
                wire_shape.size() <= dvid::valid_axis_labels.size(),
              "Cannot describe a dataset of rank ",
              wire_shape.size());
    const auto labels = dvid::valid_axis_labels.substr(0, wire_shape.size());
    std::vector<size_t> shape(wire_shape.rbegin(), wire_shape.rend());
    LOG_DEBUG("No ",
              metadata_attribute,
              " attribute. Describing the dataset as '",
              labels,
              "'");

    return dvid::VolumeMetadata::default_metadata(
      std::move(shape), dtype, labels, 1.0, "");
}

/// Select a region of a dataset's file space, returning it with a matching
/// memory space.
std::pair<H5Object, H5Object>
select_region(hid_t dataset, const dvid::BoundingBox& wire_box)
{
    H5Object file_space(H5Dget_space(dataset), H5Sclose, "get dataspace");

    const auto shape = wire_box.shape();
    std::vector<hsize_t> start(wire_box.start.begin(), wire_box.start.end());
    std::vector<hsize_t> count(shape.begin(), shape.end());

    check_status(H5Sselect_hyperslab(file_space.get(),
                                     H5S_SELECT_SET,
                                     start.data(),
                                     nullptr,
                                     count.data(),
                                     nullptr),
                 "select hyperslab");

    H5Object mem_space(
      H5Screate_simple(static_cast<int>(count.size()), count.data(), nullptr),
      H5Sclose,
      "create memory space");

    return { std::move(file_space), std::move(mem_space) };
}
} // namespace

class dvid::mock::Hdf5Store::Handle : public VolumeHandle
{
  public:
    Handle(H5Object&& dataset, VolumeMetadata metadata)
      : dataset_{ std::move(dataset) }
      , metadata_{ std::move(metadata) }
      , wire_shape_{ metadata_.wire_mapping().permute_to_wire(
          metadata_.shape()) }
    {
    }

    ~Handle() noexcept override
    {
        std::scoped_lock lock(hdf5_mutex());
        dataset_.reset();
    }

    const VolumeMetadata& metadata() const override { return metadata_; }

    void read_region(const BoundingBox& wire_box,
                     std::span<std::byte> out) override
    {
        if (!check_region_(wire_box, out.size())) {
            return;
        }

        std::scoped_lock lock(hdf5_mutex());
        auto [file_space, mem_space] = select_region(dataset_.get(), wire_box);
        check_status(H5Dread(dataset_.get(),
                             native_type(metadata_.dtype()),
                             mem_space.get(),
                             file_space.get(),
                             H5P_DEFAULT,
                             out.data()),
                     "read region " + to_string(wire_box));
    }

    void write_region(const BoundingBox& wire_box,
                      std::span<const std::byte> in) override
    {
        if (!check_region_(wire_box, in.size())) {
            return;
        }

        std::scoped_lock lock(hdf5_mutex());
        auto [file_space, mem_space] = select_region(dataset_.get(), wire_box);
        check_status(H5Dwrite(dataset_.get(),
                              native_type(metadata_.dtype()),
                              mem_space.get(),
                              file_space.get(),
                              H5P_DEFAULT,
                              in.data()),
                     "write region " + to_string(wire_box));
    }

  private:
    H5Object dataset_;
    VolumeMetadata metadata_;
    std::vector<size_t> wire_shape_;

    /// Returns false if the region is empty.
    bool check_region_(const BoundingBox& wire_box, size_t nbytes) const
    {
        EXPECT_AS(BoundsError,
                  wire_box.is_within(wire_shape_),
                  "Region ",
                  to_string(wire_box),
                  " does not fit a volume of shape ",
                  format_shape(wire_shape_));

        const auto expected =
          product(wire_box.shape()) * bytes_of_type(metadata_.dtype());
        EXPECT_AS(ShapeMismatchError,
                  nbytes == expected,
                  "Expected a region buffer of ",
                  expected,
                  " bytes, got ",
                  nbytes);

        return expected > 0;
    }
};

dvid::mock::Hdf5Store::Hdf5Store(const std::string& path)
  : path_{ path }
  , file_{ H5I_INVALID_HID }
{
    std::scoped_lock lock(hdf5_mutex());

    if (fs::exists(path_)) {
        file_ = H5Fopen(path_.c_str(), H5F_ACC_RDWR, H5P_DEFAULT);
    } else {
        file_ =
          H5Fcreate(path_.c_str(), H5F_ACC_EXCL, H5P_DEFAULT, H5P_DEFAULT);
    }
    EXPECT_STATUS(DvidStatusCode_IOError,
                  file_ >= 0,
                  "HDF5: failed to open ",
                  path_);

    ensure_group(file_, "/datasets");
}

dvid::mock::Hdf5Store::~Hdf5Store() noexcept
{
    std::scoped_lock lock(hdf5_mutex());
    if (file_ >= 0 && H5Fclose(file_) < 0) {
        LOG_ERROR("HDF5: failed to close ", path_);
    }
}

std::vector<std::string>
dvid::mock::Hdf5Store::list_children(const std::vector<std::string>& path) const
{
    std::scoped_lock lock(hdf5_mutex());

    std::string group;
    switch (path.size()) {
        case 0:
            group = "/datasets";
            break;
        case 1:
            group = "/datasets/" + path[0] + "/nodes";
            break;
        case 2:
            group = "/datasets/" + path[0] + "/nodes/" + path[1];
            break;
        default:
            break;
    }

    EXPECT_AS(NotFoundError,
              !group.empty() && link_exists_(group),
              "No such path in ",
              path_,
              ": ",
              group);
    return list_links(file_, group);
}

std::unique_ptr<dvid::mock::VolumeHandle>
dvid::mock::Hdf5Store::open(std::string_view uuid, std::string_view name)
{
    std::scoped_lock lock(hdf5_mutex());

    const auto volume_path = node_path_(uuid) + "/" + std::string(name);
    EXPECT_AS(NotFoundError,
              link_exists_(volume_path),
              "No volume named '",
              name,
              "' in node ",
              uuid);

    H5Object dataset(H5Dopen2(file_, volume_path.c_str(), H5P_DEFAULT),
                     H5Dclose,
                     "open " + volume_path);
    auto metadata = load_metadata(dataset.get());

    return std::make_unique<Handle>(std::move(dataset), std::move(metadata));
}

void
dvid::mock::Hdf5Store::create_node(std::string_view dataset,
                                   std::string_view uuid)
{
    std::scoped_lock lock(hdf5_mutex());

    EXPECT_AS(ConflictError,
              !find_node_path(file_, uuid).has_value(),
              "Node ",
              uuid,
              " already exists");

    const auto dataset_path = "/datasets/" + std::string(dataset);
    ensure_group(file_, dataset_path);
    ensure_group(file_, dataset_path + "/nodes");
    ensure_group(file_, dataset_path + "/nodes/" + std::string(uuid));
    check_status(H5Fflush(file_, H5F_SCOPE_LOCAL), "flush " + path_);
}

void
dvid::mock::Hdf5Store::create_volume(std::string_view uuid,
                                     std::string_view name,
                                     const VolumeMetadata& metadata)
{
    std::scoped_lock lock(hdf5_mutex());

    const auto volume_path = node_path_(uuid) + "/" + std::string(name);
    EXPECT_AS(ConflictError,
              !link_exists_(volume_path),
              "Volume '",
              name,
              "' already exists in node ",
              uuid);

    const auto wire_shape =
      metadata.wire_mapping().permute_to_wire(metadata.shape());
    std::vector<hsize_t> dims(wire_shape.begin(), wire_shape.end());

    H5Object space(
      H5Screate_simple(static_cast<int>(dims.size()), dims.data(), nullptr),
      H5Sclose,
      "create dataspace");
    H5Object dataset(H5Dcreate2(file_,
                                volume_path.c_str(),
                                native_type(metadata.dtype()),
                                space.get(),
                                H5P_DEFAULT,
                                H5P_DEFAULT,
                                H5P_DEFAULT),
                     H5Dclose,
                     "create " + volume_path);
    write_string_attribute(dataset.get(), metadata_attribute, metadata.to_json());
    check_status(H5Fflush(file_, H5F_SCOPE_LOCAL), "flush " + path_);

    LOG_DEBUG("Created ", volume_path, " with shape ", format_shape(wire_shape));
}

bool
dvid::mock::Hdf5Store::link_exists_(const std::string& path) const
{
    return exists(file_, path);
}

std::string
dvid::mock::Hdf5Store::node_path_(std::string_view uuid) const
{
    auto path = find_node_path(file_, uuid);
    EXPECT_AS(NotFoundError, path.has_value(), "No such node: ", uuid);
    return *path;
}
