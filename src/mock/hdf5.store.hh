#pragma once

#include "volume.store.hh"

#include <hdf5.h>

#include <string>

namespace dvid::mock {
/**
 * @brief Keeps the hierarchy in a single HDF5 file.
 * @details The file is laid out as /datasets/<dataset>/nodes/<uuid>/<volume>.
 * Each volume is a C-contiguous HDF5 dataset in wire order, carrying its
 * serialized metadata in the "dvid_metadata" attribute. Groups track link
 * creation order, so nodes list in the order they were created. Volumes
 * without the attribute are described with default metadata.
 */
class Hdf5Store : public VolumeStore
{
  public:
    /// Open @p path for reading and writing, creating it if it does not exist.
    explicit Hdf5Store(const std::string& path);
    ~Hdf5Store() noexcept override;

    Hdf5Store(const Hdf5Store&) = delete;
    Hdf5Store& operator=(const Hdf5Store&) = delete;

    std::vector<std::string> list_children(
      const std::vector<std::string>& path) const override;
    std::unique_ptr<VolumeHandle> open(std::string_view uuid,
                                       std::string_view name) override;
    void create_node(std::string_view dataset, std::string_view uuid) override;
    void create_volume(std::string_view uuid,
                       std::string_view name,
                       const VolumeMetadata& metadata) override;

    const std::string& path() const noexcept { return path_; }

  private:
    std::string path_;
    hid_t file_;

    class Handle;

    bool link_exists_(const std::string& path) const;
    std::string node_path_(std::string_view uuid) const;
};
} // namespace dvid::mock
