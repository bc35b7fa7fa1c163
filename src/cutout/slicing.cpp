#include "slicing.hh"
#include "macros.hh"

#include <algorithm>

namespace {
int64_t
clamp_bound(int64_t bound, int64_t extent)
{
    if (bound < 0) {
        bound += extent;
    }
    return std::clamp<int64_t>(bound, 0, extent);
}
} // namespace

dvid::SliceSpec&
dvid::SliceSpec::index(int64_t i)
{
    items_.push_back({ SliceItem::Kind::Index, i });
    return *this;
}

dvid::SliceSpec&
dvid::SliceSpec::range(std::optional<int64_t> start,
                       std::optional<int64_t> stop,
                       int64_t step)
{
    items_.push_back({ SliceItem::Kind::Range, 0, start, stop, step });
    return *this;
}

dvid::SliceSpec&
dvid::SliceSpec::all()
{
    return range(std::nullopt, std::nullopt);
}

dvid::SliceSpec&
dvid::SliceSpec::ellipsis()
{
    items_.push_back({ SliceItem::Kind::Ellipsis });
    return *this;
}

std::vector<size_t>
dvid::ResolvedSlicing::result_shape() const
{
    std::vector<size_t> result;
    for (size_t i = 0; i < shape.size(); ++i) {
        if (!is_reduced(i)) {
            result.push_back(static_cast<size_t>(shape[i]));
        }
    }
    return result;
}

bool
dvid::ResolvedSlicing::is_reduced(size_t axis) const
{
    return std::binary_search(reduced_axes.begin(), reduced_axes.end(), axis);
}

dvid::ResolvedSlicing
dvid::resolve_slicing(const SliceSpec& spec, const std::vector<size_t>& shape)
{
    const auto& items = spec.items();
    const auto n_ellipses =
      std::count_if(items.begin(), items.end(), [](const SliceItem& item) {
          return item.kind == SliceItem::Kind::Ellipsis;
      });
    EXPECT_AS(UnsupportedSliceError,
              n_ellipses <= 1,
              "An index can only have a single ellipsis, got ",
              n_ellipses);

    const auto ndims = shape.size();
    const auto n_explicit = items.size() - static_cast<size_t>(n_ellipses);
    EXPECT_AS(BoundsError,
              n_explicit <= ndims,
              "Too many indices: ",
              n_explicit,
              " for an array of ",
              ndims,
              " dimensions");

    // expand the ellipsis, then pad with full ranges
    std::vector<SliceItem> expanded;
    for (const auto& item : items) {
        if (item.kind == SliceItem::Kind::Ellipsis) {
            expanded.insert(expanded.end(),
                            ndims - n_explicit,
                            SliceItem{ SliceItem::Kind::Range });
        } else {
            expanded.push_back(item);
        }
    }
    expanded.resize(ndims, SliceItem{ SliceItem::Kind::Range });

    ResolvedSlicing resolved;
    resolved.offset.resize(ndims);
    resolved.shape.resize(ndims);

    for (size_t axis = 0; axis < ndims; ++axis) {
        const auto& item = expanded[axis];
        const auto extent = static_cast<int64_t>(shape[axis]);

        if (item.kind == SliceItem::Kind::Index) {
            const auto i = item.index < 0 ? item.index + extent : item.index;
            EXPECT_AS(BoundsError,
                      i >= 0 && i < extent,
                      "Index ",
                      item.index,
                      " is out of bounds for axis ",
                      axis,
                      " with size ",
                      extent);
            resolved.offset[axis] = i;
            resolved.shape[axis] = 1;
            resolved.reduced_axes.push_back(axis);
            continue;
        }

        EXPECT_AS(UnsupportedSliceError,
                  item.step == 1,
                  "Slices must have a step of 1, got ",
                  item.step,
                  " on axis ",
                  axis);

        const auto start = item.start ? clamp_bound(*item.start, extent) : 0;
        const auto stop =
          item.stop ? clamp_bound(*item.stop, extent) : extent;
        resolved.offset[axis] = start;
        resolved.shape[axis] = std::max<int64_t>(stop - start, 0);
    }

    return resolved;
}
