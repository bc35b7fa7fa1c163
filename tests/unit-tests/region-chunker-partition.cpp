#include "cutout.codec.hh"
#include "unit.test.macros.hh"

#include <algorithm>

namespace {
/// Concatenating the sub-box payloads must reproduce the box payload.
void
check_partition(const std::vector<size_t>& full_shape,
                const dvid::BoundingBox& box,
                size_t chunk_size)
{
    constexpr size_t dtype_size = 2;

    dvid::NdArray full(full_shape, DvidDataType_uint16);
    auto values = full.values<uint16_t>();
    for (size_t i = 0; i < values.size(); ++i) {
        values[i] = static_cast<uint16_t>(i);
    }

    std::vector<std::byte> expected(dvid::product(box.shape()) * dtype_size);
    dvid::copy_region_out(full.bytes(), full_shape, box, dtype_size, expected);

    std::vector<std::byte> concatenated;
    dvid::RegionChunker chunker(box, dtype_size, chunk_size);
    while (const auto sub = chunker.next()) {
        const auto nbytes = dvid::product(sub->shape()) * dtype_size;
        EXPECT(nbytes > 0, "Empty sub-box ", dvid::to_string(*sub));
        EXPECT(nbytes <= std::max(chunk_size, dtype_size),
               "Sub-box ",
               dvid::to_string(*sub),
               " holds ",
               nbytes,
               " bytes, more than ",
               chunk_size);
        CHECK(sub->is_within(full_shape));

        std::vector<std::byte> buf(nbytes);
        dvid::copy_region_out(full.bytes(), full_shape, *sub, dtype_size, buf);
        concatenated.insert(concatenated.end(), buf.begin(), buf.end());
    }

    CHECK(concatenated == expected);
}
} // namespace

int
main()
{
    int retval = 0;

    try {
        const std::vector<size_t> shape{ 6, 7, 8, 3 };
        const auto box =
          dvid::BoundingBox::from_offset_shape({ 1, 2, 3, 0 }, { 4, 5, 4, 3 });

        check_partition(shape, box, 1 << 20); // one chunk
        check_partition(shape, box, 480);     // whole rows of the outer axis
        check_partition(shape, box, 100);     // ragged planes
        check_partition(shape, box, 6);       // single rows
        check_partition(shape, box, 4);       // partial rows
        check_partition(shape, box, 1);       // element larger than a chunk
        check_partition(shape, dvid::BoundingBox::full(shape), 333);

        // an empty box has no sub-boxes
        dvid::RegionChunker empty(
          dvid::BoundingBox::from_offset_shape({ 0, 0 }, { 0, 5 }), 1, 16);
        CHECK(!empty.next());
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
