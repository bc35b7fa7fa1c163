#include "axis.transform.hh"
#include "macros.hh"

#include <algorithm>
#include <cstring>
#include <limits>
#include <sstream>

namespace {
bool
is_identity(const std::vector<size_t>& axes)
{
    for (size_t i = 0; i < axes.size(); ++i) {
        if (axes[i] != i) {
            return false;
        }
    }
    return true;
}

void
check_region(const std::vector<size_t>& full_shape,
             const dvid::BoundingBox& box,
             size_t bytes_of_full,
             size_t dtype_size,
             size_t bytes_of_buf)
{
    EXPECT_AS(dvid::BoundsError,
              box.is_within(full_shape),
              "Region ",
              dvid::to_string(box),
              " does not fit an array of shape ",
              dvid::format_shape(full_shape));
    EXPECT_AS(dvid::ShapeMismatchError,
              bytes_of_full == dvid::product(full_shape) * dtype_size,
              "Expected a full array of ",
              dvid::product(full_shape) * dtype_size,
              " bytes, got ",
              bytes_of_full);
    EXPECT_AS(dvid::ShapeMismatchError,
              bytes_of_buf == dvid::product(box.shape()) * dtype_size,
              "Expected a region buffer of ",
              dvid::product(box.shape()) * dtype_size,
              " bytes, got ",
              bytes_of_buf);
}

/// Invoke f(full_offset, buf_offset, row_bytes) for each contiguous row of
/// @p box, in row-major order.
template<typename F>
void
for_each_row(const std::vector<size_t>& full_shape,
             const dvid::BoundingBox& box,
             size_t dtype_size,
             F&& f)
{
    const auto ndims = static_cast<int64_t>(full_shape.size());
    if (ndims == 0) {
        f(0, 0, dtype_size);
        return;
    }

    const auto shape = box.shape();
    if (dvid::product(shape) == 0) {
        return;
    }

    const auto strides = dvid::compute_strides(full_shape, dtype_size);
    const size_t row_bytes = shape.back() * dtype_size;

    std::vector<int64_t> index(box.start);
    size_t buf_offset = 0;
    while (true) {
        size_t full_offset = 0;
        for (auto i = 0; i < ndims; ++i) {
            full_offset += index[i] * strides[i];
        }
        f(full_offset, buf_offset, row_bytes);
        buf_offset += row_bytes;

        // the last axis is covered by the row itself
        auto axis = ndims - 2;
        for (; axis >= 0; --axis) {
            if (++index[axis] < box.stop[axis]) {
                break;
            }
            index[axis] = box.start[axis];
        }
        if (axis < 0) {
            break;
        }
    }
}
} // namespace

dvid::BoundingBox
dvid::BoundingBox::from_offset_shape(const std::vector<int64_t>& offset,
                                     const std::vector<int64_t>& shape)
{
    EXPECT_AS(BoundsError,
              offset.size() == shape.size(),
              "Offset has ",
              offset.size(),
              " dimensions, but shape has ",
              shape.size());

    constexpr auto max = std::numeric_limits<int64_t>::max();
    constexpr auto min = std::numeric_limits<int64_t>::min();

    BoundingBox box{ offset, offset };
    for (size_t i = 0; i < shape.size(); ++i) {
        EXPECT_AS(BoundsError,
                  shape[i] >= 0 ? offset[i] <= max - shape[i]
                                : offset[i] >= min - shape[i],
                  "Region at offset ",
                  offset[i],
                  " with shape ",
                  shape[i],
                  " overflows axis ",
                  i);
        box.stop[i] += shape[i];
    }
    return box;
}

dvid::BoundingBox
dvid::BoundingBox::full(const std::vector<size_t>& shape)
{
    BoundingBox box;
    box.start.resize(shape.size(), 0);
    box.stop.assign(shape.begin(), shape.end());
    return box;
}

std::vector<int64_t>
dvid::BoundingBox::shape() const
{
    std::vector<int64_t> shape(start.size());
    for (size_t i = 0; i < shape.size(); ++i) {
        shape[i] = stop[i] - start[i];
    }
    return shape;
}

bool
dvid::BoundingBox::is_within(const std::vector<size_t>& extent) const
{
    if (start.size() != extent.size() || stop.size() != extent.size()) {
        return false;
    }

    for (size_t i = 0; i < extent.size(); ++i) {
        if (start[i] < 0 || stop[i] < start[i] ||
            stop[i] > static_cast<int64_t>(extent[i])) {
            return false;
        }
    }
    return true;
}

bool
dvid::region_fits(const std::vector<int64_t>& offset,
                  const std::vector<int64_t>& shape,
                  const std::vector<size_t>& extent)
{
    if (offset.size() != extent.size() || shape.size() != extent.size()) {
        return false;
    }

    for (size_t i = 0; i < extent.size(); ++i) {
        const auto n = static_cast<int64_t>(extent[i]);
        if (offset[i] < 0 || shape[i] < 0 || shape[i] > n ||
            offset[i] > n - shape[i]) {
            return false;
        }
    }
    return true;
}

std::string
dvid::to_string(const BoundingBox& box)
{
    std::ostringstream ss;
    ss << "[(" << join_coordinates(box.start, ',') << "), ("
       << join_coordinates(box.stop, ',') << "))";
    return ss.str();
}

dvid::AxisOrderMapping::AxisOrderMapping(std::string_view canonical_labels,
                                         std::string_view wire_labels)
  : canonical_labels_(canonical_labels)
  , wire_labels_(wire_labels)
{
    EXPECT_AS(AxisMismatchError,
              canonical_labels_.size() == wire_labels_.size(),
              "Axis labels '",
              canonical_labels_,
              "' and '",
              wire_labels_,
              "' have different lengths");

    auto sorted = canonical_labels_;
    std::sort(sorted.begin(), sorted.end());
    EXPECT_AS(AxisMismatchError,
              std::adjacent_find(sorted.begin(), sorted.end()) == sorted.end(),
              "Duplicate axis label in '",
              canonical_labels_,
              "'");

    wire_axes_.resize(ndims());
    canonical_axes_.resize(ndims());
    for (size_t i = 0; i < wire_labels_.size(); ++i) {
        const auto pos = canonical_labels_.find(wire_labels_[i]);
        EXPECT_AS(AxisMismatchError,
                  pos != std::string::npos,
                  "Axis '",
                  wire_labels_[i],
                  "' of '",
                  wire_labels_,
                  "' does not appear in '",
                  canonical_labels_,
                  "'");
        wire_axes_[i] = pos;
        canonical_axes_[pos] = i;
    }
}

dvid::AxisOrderMapping
dvid::AxisOrderMapping::reversal(std::string_view canonical_labels)
{
    std::string wire_labels(canonical_labels.rbegin(),
                            canonical_labels.rend());
    return { canonical_labels, wire_labels };
}

dvid::AxisOrderMapping
dvid::AxisOrderMapping::inverse() const
{
    return { wire_labels_, canonical_labels_ };
}

bool
dvid::AxisOrderMapping::operator==(const AxisOrderMapping& other) const
{
    return canonical_labels_ == other.canonical_labels_ &&
           wire_labels_ == other.wire_labels_;
}

void
dvid::AxisOrderMapping::check_rank_(size_t ndims) const
{
    EXPECT_AS(AxisMismatchError,
              ndims == this->ndims(),
              "Expected ",
              this->ndims(),
              " axes for mapping '",
              canonical_labels_,
              "' -> '",
              wire_labels_,
              "', got ",
              ndims);
}

dvid::BoundingBox
dvid::to_wire_order(const BoundingBox& canonical_box,
                    const AxisOrderMapping& mapping)
{
    return { mapping.permute_to_wire(canonical_box.start),
             mapping.permute_to_wire(canonical_box.stop) };
}

dvid::BoundingBox
dvid::to_canonical_order(const BoundingBox& wire_box,
                         const AxisOrderMapping& mapping)
{
    return { mapping.permute_to_canonical(wire_box.start),
             mapping.permute_to_canonical(wire_box.stop) };
}

std::vector<size_t>
dvid::compute_strides(const std::vector<size_t>& shape, size_t dtype_size)
{
    std::vector<size_t> strides(shape.size());

    size_t stride = dtype_size;
    for (auto i = shape.size(); i-- > 0;) {
        strides[i] = stride;
        stride *= shape[i];
    }

    return strides;
}

void
dvid::transpose(std::span<const std::byte> in,
                const std::vector<size_t>& in_shape,
                const std::vector<size_t>& axes,
                size_t dtype_size,
                std::span<std::byte> out)
{
    const auto ndims = in_shape.size();
    EXPECT_AS(AxisMismatchError,
              axes.size() == ndims,
              "Permutation has ",
              axes.size(),
              " axes, but the array has ",
              ndims);

    auto sorted = axes;
    std::sort(sorted.begin(), sorted.end());
    EXPECT_AS(AxisMismatchError, is_identity(sorted), "Invalid permutation");

    const auto nbytes = product(in_shape) * dtype_size;
    EXPECT(in.size() == nbytes && out.size() == nbytes,
           "Expected buffers of ",
           nbytes,
           " bytes, got ",
           in.size(),
           " and ",
           out.size());

    if (is_identity(axes)) {
        std::copy(in.begin(), in.end(), out.begin());
        return;
    }

    const auto in_strides = compute_strides(in_shape, dtype_size);
    std::vector<size_t> out_shape(ndims), steps(ndims);
    for (size_t i = 0; i < ndims; ++i) {
        out_shape[i] = in_shape[axes[i]];
        steps[i] = in_strides[axes[i]];
    }

    // walk the output in row-major order, tracking the input offset
    std::vector<size_t> index(ndims, 0);
    size_t in_offset = 0;
    const auto n = product(out_shape);
    for (size_t k = 0; k < n; ++k) {
        std::memcpy(out.data() + k * dtype_size,
                    in.data() + in_offset,
                    dtype_size);

        for (auto axis = ndims; axis-- > 0;) {
            in_offset += steps[axis];
            if (++index[axis] < out_shape[axis]) {
                break;
            }
            in_offset -= steps[axis] * out_shape[axis];
            index[axis] = 0;
        }
    }
}

dvid::NdArray
dvid::to_wire_array(const NdArray& canonical, const AxisOrderMapping& mapping)
{
    const auto wire_shape = mapping.permute_to_wire(canonical.shape());
    NdArray wire(wire_shape, canonical.dtype());
    transpose(canonical.bytes(),
              canonical.shape(),
              mapping.wire_axes(),
              bytes_of_type(canonical.dtype()),
              wire.bytes());
    return wire;
}

dvid::NdArray
dvid::to_canonical_array(const NdArray& wire, const AxisOrderMapping& mapping)
{
    const auto canonical_shape = mapping.permute_to_canonical(wire.shape());
    NdArray canonical(canonical_shape, wire.dtype());
    transpose(wire.bytes(),
              wire.shape(),
              mapping.canonical_axes(),
              bytes_of_type(wire.dtype()),
              canonical.bytes());
    return canonical;
}

void
dvid::copy_region_out(std::span<const std::byte> full,
                      const std::vector<size_t>& full_shape,
                      const BoundingBox& box,
                      size_t dtype_size,
                      std::span<std::byte> out)
{
    check_region(full_shape, box, full.size(), dtype_size, out.size());

    for_each_row(full_shape,
                 box,
                 dtype_size,
                 [&](size_t full_offset, size_t buf_offset, size_t nbytes) {
                     std::memcpy(
                       out.data() + buf_offset, full.data() + full_offset, nbytes);
                 });
}

void
dvid::copy_region_in(std::span<std::byte> full,
                     const std::vector<size_t>& full_shape,
                     const BoundingBox& box,
                     size_t dtype_size,
                     std::span<const std::byte> in)
{
    check_region(full_shape, box, full.size(), dtype_size, in.size());

    for_each_row(full_shape,
                 box,
                 dtype_size,
                 [&](size_t full_offset, size_t buf_offset, size_t nbytes) {
                     std::memcpy(
                       full.data() + full_offset, in.data() + buf_offset, nbytes);
                 });
}
