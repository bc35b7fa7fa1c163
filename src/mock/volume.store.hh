#pragma once

#include "axis.transform.hh"
#include "volume.metadata.hh"

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dvid::mock {
/**
 * @brief An open volume in a backing store.
 * @details Regions are addressed in wire order. A handle serves one request
 * at a time.
 */
class VolumeHandle
{
  public:
    virtual ~VolumeHandle() = default;

    virtual const VolumeMetadata& metadata() const = 0;

    /**
     * @brief Copy a region of the volume into @p out.
     * @param wire_box The region, in wire order.
     * @param out Receives product(wire_box.shape()) elements.
     * @throw dvid::BoundsError if the region does not fit the volume.
     */
    virtual void read_region(const BoundingBox& wire_box,
                             std::span<std::byte> out) = 0;

    /**
     * @brief Overwrite a region of the volume with @p in.
     * @throw dvid::BoundsError if the region does not fit the volume.
     */
    virtual void write_region(const BoundingBox& wire_box,
                              std::span<const std::byte> in) = 0;

    /// The volume's shape, in wire order.
    std::vector<size_t> wire_shape() const;
};

/**
 * @brief The dataset -> node -> volume hierarchy served by the mock server.
 */
class VolumeStore
{
  public:
    virtual ~VolumeStore() = default;

    /**
     * @brief List the children of a path in the hierarchy.
     * @details {} lists the datasets, {dataset} lists its nodes in creation
     * order, and {dataset, uuid} lists the node's volumes.
     * @throw dvid::NotFoundError if the path does not exist.
     */
    virtual std::vector<std::string> list_children(
      const std::vector<std::string>& path) const = 0;

    /**
     * @brief Open a volume for reading and writing.
     * @throw dvid::NotFoundError if the node or volume does not exist.
     */
    virtual std::unique_ptr<VolumeHandle> open(std::string_view uuid,
                                               std::string_view name) = 0;

    /**
     * @brief Append a node to a dataset, creating the dataset if needed.
     * @throw dvid::ConflictError if a node with this UUID exists anywhere in
     * the store.
     */
    virtual void create_node(std::string_view dataset,
                             std::string_view uuid) = 0;

    /**
     * @brief Create a zero-filled volume under a node.
     * @throw dvid::NotFoundError if the node does not exist.
     * @throw dvid::ConflictError if the volume already exists.
     */
    virtual void create_volume(std::string_view uuid,
                               std::string_view name,
                               const VolumeMetadata& metadata) = 0;
};

/**
 * @brief Find the dataset that owns a node.
 * @return The dataset name, or std::nullopt if no dataset has the node.
 */
std::optional<std::string>
find_dataset(const VolumeStore& store, std::string_view uuid);
} // namespace dvid::mock
