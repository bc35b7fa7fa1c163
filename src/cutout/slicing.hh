#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace dvid {
/**
 * @brief One entry of a slice specification: an integer index, a
 * [start, stop) range with a step, or an ellipsis.
 */
struct SliceItem
{
    enum class Kind
    {
        Index,
        Range,
        Ellipsis,
    };

    Kind kind;

    /// The index, for Kind::Index.
    int64_t index = 0;

    /// Range bounds; std::nullopt means "from the start" / "to the end".
    std::optional<int64_t> start;
    std::optional<int64_t> stop;
    int64_t step = 1;
};

/**
 * @brief Builds a NumPy-style basic slicing expression, one item per axis.
 * @details E.g., `a[:, 10:110, 5, ...]` is
 * `SliceSpec().all().range(10, 110).index(5).ellipsis()`.
 */
class SliceSpec
{
  public:
    /// An integer index. Negative indices count from the end of the axis.
    SliceSpec& index(int64_t i);

    /// A range. Negative bounds count from the end; out-of-range bounds clamp.
    SliceSpec& range(std::optional<int64_t> start,
                     std::optional<int64_t> stop,
                     int64_t step = 1);

    /// The full extent of an axis, i.e., `:`.
    SliceSpec& all();

    /// Full ranges over as many axes as needed, i.e., `...`.
    SliceSpec& ellipsis();

    const std::vector<SliceItem>& items() const noexcept { return items_; }

  private:
    std::vector<SliceItem> items_;
};

/**
 * @brief A slice specification resolved against a concrete shape.
 */
struct ResolvedSlicing
{
    std::vector<int64_t> offset;
    std::vector<int64_t> shape;

    /// Axes selected with an integer index, in ascending order.
    std::vector<size_t> reduced_axes;

    /// The shape of the sliced array, with the reduced axes dropped.
    std::vector<size_t> result_shape() const;

    /// True if @p axis was selected with an integer index.
    bool is_reduced(size_t axis) const;
};

/**
 * @brief Resolve @p spec against an array of shape @p shape.
 * @throw dvid::UnsupportedSliceError if a step is not 1 or there is more than
 * one ellipsis.
 * @throw dvid::BoundsError if there are more items than axes, or an integer
 * index is out of range.
 */
ResolvedSlicing
resolve_slicing(const SliceSpec& spec, const std::vector<size_t>& shape);
} // namespace dvid
