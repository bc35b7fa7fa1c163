#pragma once

#include "nd.array.hh"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dvid {
/**
 * @brief A half-open, axis-aligned region [start, stop).
 */
struct BoundingBox
{
    std::vector<int64_t> start;
    std::vector<int64_t> stop;

    static BoundingBox from_offset_shape(const std::vector<int64_t>& offset,
                                         const std::vector<int64_t>& shape);
    static BoundingBox full(const std::vector<size_t>& shape);

    size_t ndims() const noexcept { return start.size(); }
    std::vector<int64_t> shape() const;

    /// True if the box has matching rank and lies within [0, extent).
    bool is_within(const std::vector<size_t>& extent) const;

    bool operator==(const BoundingBox&) const = default;
};

std::string
to_string(const BoundingBox& box);

/**
 * @brief Check that [offset, offset + shape) lies within [0, extent) without
 * forming offset + shape.
 * @return False on a rank mismatch, a negative offset or shape, or a region
 * that ends past the extent.
 */
bool
region_fits(const std::vector<int64_t>& offset,
            const std::vector<int64_t>& shape,
            const std::vector<size_t>& extent);

/**
 * @brief A permutation between the canonical (channel first) axis order and
 * the order used on the wire and in storage.
 */
class AxisOrderMapping
{
  public:
    /**
     * @param canonical_labels Axis labels in canonical order, e.g., "cxyz".
     * @param wire_labels The same labels in wire order, e.g., "zyxc".
     * @throw dvid::AxisMismatchError if the labels are not a permutation of
     * one another, or if either contains duplicates.
     */
    AxisOrderMapping(std::string_view canonical_labels,
                     std::string_view wire_labels);

    /// The DVID convention: the wire order is the reverse of the canonical.
    static AxisOrderMapping reversal(std::string_view canonical_labels);

    const std::string& canonical_labels() const noexcept
    {
        return canonical_labels_;
    }
    const std::string& wire_labels() const noexcept { return wire_labels_; }
    size_t ndims() const noexcept { return canonical_labels_.size(); }

    /// For each wire axis, the index of the same axis in canonical order.
    const std::vector<size_t>& wire_axes() const noexcept
    {
        return wire_axes_;
    }

    /// For each canonical axis, the index of the same axis in wire order.
    const std::vector<size_t>& canonical_axes() const noexcept
    {
        return canonical_axes_;
    }

    AxisOrderMapping inverse() const;

    template<typename T>
    std::vector<T> permute_to_wire(const std::vector<T>& canonical) const
    {
        check_rank_(canonical.size());
        std::vector<T> wire(canonical.size());
        for (size_t i = 0; i < wire.size(); ++i) {
            wire[i] = canonical[wire_axes_[i]];
        }
        return wire;
    }

    template<typename T>
    std::vector<T> permute_to_canonical(const std::vector<T>& wire) const
    {
        check_rank_(wire.size());
        std::vector<T> canonical(wire.size());
        for (size_t i = 0; i < wire.size(); ++i) {
            canonical[wire_axes_[i]] = wire[i];
        }
        return canonical;
    }

    bool operator==(const AxisOrderMapping& other) const;

  private:
    std::string canonical_labels_;
    std::string wire_labels_;
    std::vector<size_t> wire_axes_;
    std::vector<size_t> canonical_axes_;

    void check_rank_(size_t ndims) const;
};

/**
 * @brief Permute a canonical-order box into wire order.
 * @throw dvid::AxisMismatchError if the rank of the box differs from the
 * mapping.
 */
BoundingBox
to_wire_order(const BoundingBox& canonical_box,
              const AxisOrderMapping& mapping);

/**
 * @brief Permute a wire-order box into canonical order. The exact inverse of
 * to_wire_order().
 */
BoundingBox
to_canonical_order(const BoundingBox& wire_box,
                   const AxisOrderMapping& mapping);

/**
 * @brief Compute row-major byte strides: the last axis varies fastest.
 * @param shape The shape of the array, in wire order.
 * @param dtype_size The size of one element, in bytes.
 */
std::vector<size_t>
compute_strides(const std::vector<size_t>& shape, size_t dtype_size);

/**
 * @brief Transpose a row-major array.
 * @details Axis i of the output is axis @p axes[i] of the input.
 * @param in The input buffer.
 * @param in_shape The shape of the input.
 * @param axes The permutation to apply.
 * @param dtype_size The size of one element, in bytes.
 * @param out The output buffer, the same size as @p in.
 */
void
transpose(std::span<const std::byte> in,
          const std::vector<size_t>& in_shape,
          const std::vector<size_t>& axes,
          size_t dtype_size,
          std::span<std::byte> out);

/// Reorder a canonical-order array into wire order.
NdArray
to_wire_array(const NdArray& canonical, const AxisOrderMapping& mapping);

/// Reorder a wire-order array into canonical order.
NdArray
to_canonical_array(const NdArray& wire, const AxisOrderMapping& mapping);

/**
 * @brief Copy the region @p box of a full row-major array into a contiguous
 * buffer.
 * @throw dvid::BoundsError if the box does not fit the array.
 */
void
copy_region_out(std::span<const std::byte> full,
                const std::vector<size_t>& full_shape,
                const BoundingBox& box,
                size_t dtype_size,
                std::span<std::byte> out);

/**
 * @brief Copy a contiguous buffer into the region @p box of a full row-major
 * array.
 * @throw dvid::BoundsError if the box does not fit the array.
 */
void
copy_region_in(std::span<std::byte> full,
               const std::vector<size_t>& full_shape,
               const BoundingBox& box,
               size_t dtype_size,
               std::span<const std::byte> in);
} // namespace dvid
