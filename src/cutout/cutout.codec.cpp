#include "cutout.codec.hh"
#include "macros.hh"

#include <algorithm>
#include <cstring>

dvid::RequestDescriptor
dvid::build_request(const VolumeId& volume_id,
                    const BoundingBox& wire_box,
                    const AxisOrderMapping& mapping,
                    DvidDataType dtype,
                    std::string_view method,
                    const std::map<std::string, std::string>& query_args)
{
    EXPECT_AS(AxisMismatchError,
              !mapping.canonical_labels().empty() &&
                mapping.canonical_labels().front() == 'c',
              "Expected a leading channel axis, got '",
              mapping.canonical_labels(),
              "'");
    EXPECT(method == "GET" || method == "POST",
           "Unsupported cutout method: ",
           method);

    const auto box = to_canonical_order(wire_box, mapping);
    const auto shape = box.shape();

    // the channel axis is implied: all channels are always transferred
    std::vector<int64_t> offset(box.start.begin() + 1, box.start.end());
    std::vector<int64_t> extent(shape.begin() + 1, shape.end());
    std::vector<int64_t> dims(extent.size());
    for (size_t i = 0; i < dims.size(); ++i) {
        dims[i] = static_cast<int64_t>(i);
    }

    RequestDescriptor request;
    request.method = method;
    request.uri = "/api/node/" + volume_id.uuid + "/" + volume_id.name +
                  "/raw/" + join_coordinates(dims) + "/" +
                  join_coordinates(extent) + "/" + join_coordinates(offset) +
                  format_query(query_args);
    if (method == "POST") {
        request.content_type = format_volume_content_type(dtype);
    }
    request.content_length = product(shape) * bytes_of_type(dtype);

    return request;
}

std::string
dvid::format_volume_content_type(DvidDataType dtype)
{
    return std::string(volume_mimetype) +
           "; dtype=" + data_type_to_string(dtype);
}

std::optional<DvidDataType>
dvid::parse_volume_content_type(std::string_view content_type)
{
    size_t begin = content_type.find(';');
    while (begin != std::string_view::npos) {
        const auto end = content_type.find(';', begin + 1);
        const auto param = trim(content_type.substr(
          begin + 1,
          end == std::string_view::npos ? std::string_view::npos
                                        : end - begin - 1));

        constexpr std::string_view key = "dtype=";
        if (param.starts_with(key)) {
            const auto name = param.substr(key.size());
            const auto dtype = data_type_from_string(name);
            EXPECT_AS(DtypeMismatchError,
                      dtype.has_value(),
                      "Unrecognized dtype in content type: ",
                      content_type);
            return dtype;
        }

        begin = end;
    }

    return std::nullopt;
}

dvid::CutoutDecoder::CutoutDecoder(std::vector<size_t> shape,
                                   DvidDataType dtype)
  : array_(std::move(shape), dtype)
  , bytes_received_{ 0 }
{
}

bool
dvid::CutoutDecoder::write(size_t offset, std::span<const std::byte> buf)
{
    if (offset != bytes_received_) {
        LOG_ERROR("Out-of-order chunk at offset ",
                  offset,
                  ", expected offset ",
                  bytes_received_);
        return false;
    }

    EXPECT_AS(OversizedPayloadError,
              buf.size() <= bytes_expected() - bytes_received_,
              "Received more data than expected: ",
              bytes_received_ + buf.size(),
              " bytes, expected ",
              bytes_expected());

    if (!buf.empty()) {
        std::memcpy(
          array_.bytes().data() + bytes_received_, buf.data(), buf.size());
        bytes_received_ += buf.size();
    }
    return true;
}

dvid::NdArray
dvid::CutoutDecoder::take()
{
    CHECK(flush_());
    bytes_received_ = 0;
    return std::move(array_);
}

bool
dvid::CutoutDecoder::flush_()
{
    EXPECT_AS(TruncatedPayloadError,
              is_complete(),
              "Payload ended after ",
              bytes_received_,
              " bytes, expected ",
              bytes_expected());
    return true;
}

dvid::NdArray
dvid::decode_stream(Source& source,
                    const std::vector<size_t>& shape,
                    DvidDataType dtype,
                    size_t chunk_size)
{
    EXPECT(chunk_size > 0, "Chunk size must be positive");

    NdArray array(shape, dtype);
    auto buffer = array.bytes();

    size_t bytes_received = 0;
    while (bytes_received < buffer.size()) {
        const auto n = source.read(buffer.subspan(
          bytes_received, std::min(chunk_size, buffer.size() - bytes_received)));
        EXPECT_AS(TruncatedPayloadError,
                  n > 0,
                  "Payload ended after ",
                  bytes_received,
                  " bytes, expected ",
                  buffer.size());
        bytes_received += n;
    }

    std::byte probe;
    EXPECT_AS(OversizedPayloadError,
              source.read({ &probe, 1 }) == 0,
              "Received more data than expected: ",
              buffer.size(),
              " bytes");

    return array;
}

dvid::CutoutEncoder::CutoutEncoder(std::span<const std::byte> payload,
                                   size_t chunk_size)
  : payload_{ payload }
  , chunk_size_{ chunk_size }
  , offset_{ 0 }
{
    EXPECT(chunk_size_ > 0, "Chunk size must be positive");
}

size_t
dvid::CutoutEncoder::read(std::span<std::byte> buf)
{
    const auto n = std::min({ buf.size(), chunk_size_, bytes_remaining() });
    if (n > 0) {
        std::memcpy(buf.data(), payload_.data() + offset_, n);
        offset_ += n;
    }
    return n;
}

std::optional<std::span<const std::byte>>
dvid::CutoutEncoder::next_chunk()
{
    if (bytes_remaining() == 0) {
        return std::nullopt;
    }

    const auto chunk =
      payload_.subspan(offset_, std::min(chunk_size_, bytes_remaining()));
    offset_ += chunk.size();
    return chunk;
}

dvid::CutoutEncoder
dvid::encode_stream(const NdArray& array, size_t chunk_size)
{
    return { array.bytes(), chunk_size };
}

dvid::RegionChunker::RegionChunker(BoundingBox box,
                                   size_t dtype_size,
                                   size_t chunk_size)
  : box_{ std::move(box) }
  , split_axis_{ 0 }
  , step_{ 1 }
  , cursor_(box_.start)
  , done_{ false }
{
    EXPECT(chunk_size > 0, "Chunk size must be positive");
    EXPECT(dtype_size > 0, "Element size must be positive");

    const auto shape = box_.shape();
    const auto ndims = shape.size();
    if (product(shape) == 0) {
        done_ = true;
        return;
    }
    if (ndims == 0) {
        return;
    }

    // split along the outermost axis whose rows fit within a chunk
    split_axis_ = ndims - 1;
    size_t inner_bytes = dtype_size;
    for (auto axis = ndims; axis-- > 0;) {
        if (inner_bytes > chunk_size) {
            break;
        }
        split_axis_ = axis;
        if (axis > 0) {
            inner_bytes *= shape[axis];
        }
    }

    const size_t row_bytes = product(std::vector<int64_t>(
                               shape.begin() + split_axis_ + 1, shape.end())) *
                             dtype_size;
    step_ = std::clamp<int64_t>(static_cast<int64_t>(chunk_size / row_bytes),
                                1,
                                shape[split_axis_]);
}

std::optional<dvid::BoundingBox>
dvid::RegionChunker::next()
{
    if (done_) {
        return std::nullopt;
    }

    if (box_.ndims() == 0) {
        done_ = true;
        return box_;
    }

    BoundingBox sub = box_;
    for (size_t i = 0; i < split_axis_; ++i) {
        sub.start[i] = cursor_[i];
        sub.stop[i] = cursor_[i] + 1;
    }
    sub.start[split_axis_] = cursor_[split_axis_];
    sub.stop[split_axis_] =
      std::min(cursor_[split_axis_] + step_, box_.stop[split_axis_]);

    // advance the cursor in row-major order
    cursor_[split_axis_] = sub.stop[split_axis_];
    auto axis = static_cast<int64_t>(split_axis_);
    for (; axis >= 0; --axis) {
        if (cursor_[axis] < box_.stop[axis]) {
            break;
        }
        cursor_[axis] = box_.start[axis];
        if (axis > 0) {
            ++cursor_[axis - 1];
        }
    }
    done_ = axis < 0;

    return sub;
}
