#include "volume.store.hh"

#include <algorithm>

std::vector<size_t>
dvid::mock::VolumeHandle::wire_shape() const
{
    const auto& meta = metadata();
    return meta.wire_mapping().permute_to_wire(meta.shape());
}

std::optional<std::string>
dvid::mock::find_dataset(const VolumeStore& store, std::string_view uuid)
{
    for (const auto& dataset : store.list_children({})) {
        const auto nodes = store.list_children({ dataset });
        if (std::find(nodes.begin(), nodes.end(), uuid) != nodes.end()) {
            return dataset;
        }
    }

    return std::nullopt;
}
