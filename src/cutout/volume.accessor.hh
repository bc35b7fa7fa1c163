#pragma once

#include "client.settings.hh"
#include "cutout.codec.hh"
#include "http.connection.hh"
#include "nd.array.hh"
#include "slicing.hh"
#include "volume.metadata.hh"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace dvid {
/**
 * @brief Reads and writes regions of a remote voxels volume.
 * @details Offsets, shapes and arrays are in canonical order, channel first.
 * The wire protocol always transfers every channel: reads of a channel
 * sub-range fetch all channels and extract the range, and writes must cover
 * every channel. Each call leases one connection from the pool for its
 * duration, so accessors sharing a pool may be used from several threads.
 */
class VolumeAccessor
{
  public:
    /**
     * @brief Open a volume, fetching its metadata.
     * @param pool The connections to the server.
     * @param uuid The node holding the volume.
     * @param name The volume's name.
     * @param stream_chunk_size Upper bound on the size of a request body chunk.
     * @param query_args Extra query arguments appended to every cutout URI,
     * e.g., {"throttle", "on"}.
     * @throw dvid::NotFoundError if the volume does not exist.
     */
    VolumeAccessor(std::shared_ptr<ConnectionPool> pool,
                   std::string_view uuid,
                   std::string_view name,
                   size_t stream_chunk_size = default_stream_chunk_size,
                   std::map<std::string, std::string> query_args = {});

    /// Open a volume using the stream chunk size and query arguments of
    /// @p settings.
    VolumeAccessor(std::shared_ptr<ConnectionPool> pool,
                   std::string_view uuid,
                   std::string_view name,
                   const ClientSettings& settings);

    const VolumeMetadata& metadata() const noexcept { return metadata_; }
    const VolumeId& volume_id() const noexcept { return volume_id_; }
    const std::vector<size_t>& shape() const noexcept
    {
        return metadata_.shape();
    }
    DvidDataType dtype() const noexcept { return metadata_.dtype(); }

    /**
     * @brief Read the region [offset, offset + shape).
     * @return An array of shape @p shape.
     * @throw dvid::BoundsError if the rank differs from the volume's, or the
     * region is not within the volume.
     */
    NdArray get_subvolume(const std::vector<int64_t>& offset,
                          const std::vector<int64_t>& shape);

    /**
     * @brief Overwrite the region [offset, offset + shape) with @p data.
     * @return @p data.
     * @throw dvid::BoundsError if the region is not within the volume or does
     * not cover every channel.
     * @throw dvid::ShapeMismatchError if @p data does not have shape @p shape.
     * @throw dvid::DtypeMismatchError if @p data has the wrong element type.
     */
    const NdArray& post_subvolume(const std::vector<int64_t>& offset,
                                  const std::vector<int64_t>& shape,
                                  const NdArray& data);

    /// Read a slice. Axes selected with an integer index are dropped.
    NdArray get_slice(const SliceSpec& spec);

    /**
     * @brief Write a slice.
     * @details @p data may omit the axes selected with an integer index.
     * @return @p data.
     * @throw dvid::UnsupportedSliceError if the channel axis is selected with
     * an integer index.
     */
    const NdArray& post_slice(const SliceSpec& spec, const NdArray& data);

  private:
    std::shared_ptr<ConnectionPool> pool_;
    VolumeId volume_id_;
    VolumeMetadata metadata_;
    AxisOrderMapping mapping_;
    size_t stream_chunk_size_;
    std::map<std::string, std::string> query_args_;

    BoundingBox check_bounds_(const std::vector<int64_t>& offset,
                              const std::vector<int64_t>& shape) const;
};
} // namespace dvid
