#include "volume.accessor.hh"
#include "macros.hh"
#include "voxels.hh"

namespace {
dvid::VolumeMetadata
fetch_metadata(dvid::ConnectionPool& pool,
               std::string_view uuid,
               std::string_view name)
{
    dvid::ScopedConnection connection(pool);
    return dvid::get_metadata(*connection, uuid, name);
}

std::vector<size_t>
to_sizes(const std::vector<int64_t>& shape)
{
    return { shape.begin(), shape.end() };
}
} // namespace

dvid::VolumeAccessor::VolumeAccessor(
  std::shared_ptr<ConnectionPool> pool,
  std::string_view uuid,
  std::string_view name,
  size_t stream_chunk_size,
  std::map<std::string, std::string> query_args)
  : pool_{ std::move(pool) }
  , volume_id_{ std::string(uuid), std::string(name) }
  , metadata_{ fetch_metadata(*pool_, uuid, name) }
  , mapping_{ metadata_.wire_mapping() }
  , stream_chunk_size_{ stream_chunk_size }
  , query_args_{ std::move(query_args) }
{
    EXPECT(stream_chunk_size_ > 0, "Stream chunk size must be positive");
}

dvid::VolumeAccessor::VolumeAccessor(std::shared_ptr<ConnectionPool> pool,
                                     std::string_view uuid,
                                     std::string_view name,
                                     const ClientSettings& settings)
  : VolumeAccessor(std::move(pool),
                   uuid,
                   name,
                   settings.stream_chunk_size,
                   settings.query_args)
{
}

dvid::BoundingBox
dvid::VolumeAccessor::check_bounds_(const std::vector<int64_t>& offset,
                                    const std::vector<int64_t>& shape) const
{
    const auto ndims = metadata_.ndims();
    EXPECT_AS(BoundsError,
              offset.size() == ndims && shape.size() == ndims,
              "Expected ",
              ndims,
              " dimensions, got an offset of ",
              offset.size(),
              " and a shape of ",
              shape.size());

    EXPECT_AS(BoundsError,
              region_fits(offset, shape, metadata_.shape()),
              "Region at offset ",
              join_coordinates(offset, ','),
              " with shape ",
              join_coordinates(shape, ','),
              " is not within the volume extent ",
              format_shape(metadata_.shape()));

    return BoundingBox::from_offset_shape(offset, shape);
}

dvid::NdArray
dvid::VolumeAccessor::get_subvolume(const std::vector<int64_t>& offset,
                                    const std::vector<int64_t>& shape)
{
    const auto box = check_bounds_(offset, shape);
    if (product(shape) == 0) {
        return { to_sizes(shape), metadata_.dtype() };
    }

    // fetch every channel, then extract the requested range
    auto all_channels = box;
    all_channels.start[0] = 0;
    all_channels.stop[0] = static_cast<int64_t>(metadata_.num_channels());

    const auto wire_box = to_wire_order(all_channels, mapping_);
    const auto descriptor = build_request(
      volume_id_, wire_box, mapping_, metadata_.dtype(), "GET", query_args_);

    HttpRequest request{ descriptor.method, descriptor.uri };
    CutoutDecoder decoder(to_sizes(wire_box.shape()), metadata_.dtype());
    {
        ScopedConnection connection(*pool_);
        const auto response = connection->perform(request, &decoder);
        check_response("Reading cutout", request, response);
    }

    auto canonical = to_canonical_array(decoder.take(), mapping_);
    if (all_channels == box) {
        return canonical;
    }

    NdArray subset(to_sizes(shape), metadata_.dtype());
    auto channels = BoundingBox::full(canonical.shape());
    channels.start[0] = box.start[0];
    channels.stop[0] = box.stop[0];
    copy_region_out(canonical.bytes(),
                    canonical.shape(),
                    channels,
                    bytes_of_type(metadata_.dtype()),
                    subset.bytes());
    return subset;
}

const dvid::NdArray&
dvid::VolumeAccessor::post_subvolume(const std::vector<int64_t>& offset,
                                     const std::vector<int64_t>& shape,
                                     const NdArray& data)
{
    const auto box = check_bounds_(offset, shape);
    EXPECT_AS(BoundsError,
              box.start[0] == 0 && box.stop[0] == static_cast<int64_t>(
                                                   metadata_.num_channels()),
              "Writes must cover every channel: expected channels [0, ",
              metadata_.num_channels(),
              "), got [",
              box.start[0],
              ", ",
              box.stop[0],
              ")");
    EXPECT_AS(ShapeMismatchError,
              data.shape() == to_sizes(shape),
              "Data of shape ",
              format_shape(data.shape()),
              " does not match the region shape ",
              format_shape(to_sizes(shape)));
    EXPECT_AS(DtypeMismatchError,
              data.dtype() == metadata_.dtype(),
              "Data of type ",
              data_type_to_string(data.dtype()),
              " does not match the volume type ",
              data_type_to_string(metadata_.dtype()));

    if (data.size() == 0) {
        return data;
    }

    const auto wire = to_wire_array(data, mapping_);
    const auto descriptor = build_request(volume_id_,
                                          to_wire_order(box, mapping_),
                                          mapping_,
                                          metadata_.dtype(),
                                          "POST",
                                          query_args_);

    auto body = encode_stream(wire, stream_chunk_size_);
    HttpRequest request{
        descriptor.method,   descriptor.uri, descriptor.content_type,
        descriptor.content_length, &body,
    };

    ScopedConnection connection(*pool_);
    const auto response = connection->perform(request, nullptr);
    check_response("Writing cutout", request, response);

    return data;
}

dvid::NdArray
dvid::VolumeAccessor::get_slice(const SliceSpec& spec)
{
    const auto slicing = resolve_slicing(spec, metadata_.shape());
    return get_subvolume(slicing.offset, slicing.shape)
      .reshaped(slicing.result_shape());
}

const dvid::NdArray&
dvid::VolumeAccessor::post_slice(const SliceSpec& spec, const NdArray& data)
{
    const auto slicing = resolve_slicing(spec, metadata_.shape());
    EXPECT_AS(UnsupportedSliceError,
              !slicing.is_reduced(0),
              "The channel axis must be sliced with a range when writing");

    if (slicing.reduced_axes.empty() || data.shape() != slicing.result_shape()) {
        return post_subvolume(slicing.offset, slicing.shape, data);
    }

    // reinsert the reduced axes
    std::vector<std::byte> bytes(data.bytes().begin(), data.bytes().end());
    const NdArray expanded(to_sizes(slicing.shape), data.dtype(), std::move(bytes));
    post_subvolume(slicing.offset, slicing.shape, expanded);
    return data;
}
