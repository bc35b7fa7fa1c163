#pragma once

#include "axis.transform.hh"
#include "byte.stream.hh"
#include "dvid.common.hh"
#include "nd.array.hh"

#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dvid {
/// Addresses a volume: a named data instance under a node.
struct VolumeId
{
    std::string uuid;
    std::string name;
};

/// Everything a transport needs to issue a cutout request.
struct RequestDescriptor
{
    std::string method;
    std::string uri;

    /// Empty for reads.
    std::string content_type;

    /// The length of the request body for writes, or of the expected response
    /// body for reads.
    size_t content_length;
};

/**
 * @brief Build the request for reading or writing a region of a volume.
 * @param volume_id The volume to address.
 * @param wire_box The region, in wire order. Must span all channels.
 * @param mapping The volume's axis order mapping.
 * @param dtype The volume's element type.
 * @param method "GET" to read, "POST" to write.
 * @param query_args Extra query arguments appended to the URI.
 * @throw dvid::AxisMismatchError if the box does not match the mapping or the
 * mapping has no leading channel axis.
 */
RequestDescriptor
build_request(const VolumeId& volume_id,
              const BoundingBox& wire_box,
              const AxisOrderMapping& mapping,
              DvidDataType dtype,
              std::string_view method,
              const std::map<std::string, std::string>& query_args = {});

/// Format the content type of a raw payload, e.g.,
/// "application/octet-stream; dtype=uint8".
std::string
format_volume_content_type(DvidDataType dtype);

/**
 * @brief Parse the dtype parameter of a raw payload content type.
 * @return The data type, or std::nullopt if the content type carries none.
 * @throw dvid::DtypeMismatchError if the dtype parameter is not recognized.
 */
std::optional<DvidDataType>
parse_volume_content_type(std::string_view content_type);

/**
 * @brief Decodes a raw response body, pushed in chunks, into a preallocated
 * array.
 * @details Chunks must arrive in order. The decoder may be fed any number of
 * chunks of any size; it holds no state beyond the output buffer and the
 * number of bytes received.
 */
class CutoutDecoder : public Sink
{
  public:
    CutoutDecoder(std::vector<size_t> shape, DvidDataType dtype);

    /// @throw dvid::OversizedPayloadError if the chunk overruns the buffer.
    bool write(size_t offset, std::span<const std::byte> buf) override;

    size_t bytes_expected() const noexcept { return array_.bytes_of_data(); }
    size_t bytes_received() const noexcept { return bytes_received_; }
    bool is_complete() const noexcept
    {
        return bytes_received_ == bytes_expected();
    }

    /**
     * @brief Take the decoded array.
     * @throw dvid::TruncatedPayloadError if the payload is incomplete.
     */
    NdArray take();

  protected:
    /// @throw dvid::TruncatedPayloadError if the payload is incomplete.
    bool flush_() override;

  private:
    NdArray array_;
    size_t bytes_received_;
};

/**
 * @brief Read a raw payload from @p source into a new array.
 * @param source The payload.
 * @param shape The shape of the payload, in wire order.
 * @param dtype The element type.
 * @param chunk_size Upper bound on the bytes requested by a single read.
 * @throw dvid::TruncatedPayloadError if the source ends early.
 * @throw dvid::OversizedPayloadError if the source has bytes left over.
 */
NdArray
decode_stream(Source& source,
              const std::vector<size_t>& shape,
              DvidDataType dtype,
              size_t chunk_size = default_stream_chunk_size);

/**
 * @brief Serves the bytes of a raw payload in chunks of bounded size.
 * @details The encoder views the payload; it does not copy it. The payload
 * must outlive the encoder.
 */
class CutoutEncoder : public Source
{
  public:
    CutoutEncoder(std::span<const std::byte> payload, size_t chunk_size);

    size_t read(std::span<std::byte> buf) override;

    /// The next chunk of at most chunk_size bytes, or std::nullopt at the end.
    std::optional<std::span<const std::byte>> next_chunk();

    size_t chunk_size() const noexcept { return chunk_size_; }
    size_t bytes_remaining() const noexcept
    {
        return payload_.size() - offset_;
    }

  private:
    std::span<const std::byte> payload_;
    size_t chunk_size_;
    size_t offset_;
};

/**
 * @brief Encode an array, already in wire order, as a raw payload.
 * @param array The array. Must outlive the returned encoder.
 * @param chunk_size Upper bound on the size of a chunk.
 */
CutoutEncoder
encode_stream(const NdArray& array,
              size_t chunk_size = default_stream_chunk_size);

/**
 * @brief Partitions a wire-order box into row-major sub-boxes of bounded size.
 * @details Concatenating the payloads of the sub-boxes, in the order they are
 * returned, yields the payload of the whole box. Each sub-box holds at most
 * chunk_size bytes, or a single element if one element is larger.
 */
class RegionChunker
{
  public:
    RegionChunker(BoundingBox box, size_t dtype_size, size_t chunk_size);

    /// The next sub-box, or std::nullopt when the box is exhausted.
    std::optional<BoundingBox> next();

  private:
    BoundingBox box_;
    size_t split_axis_;
    int64_t step_;
    std::vector<int64_t> cursor_;
    bool done_;
};
} // namespace dvid
