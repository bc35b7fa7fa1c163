#include "memory.store.hh"
#include "macros.hh"

#include <algorithm>
#include <iterator>

class dvid::mock::MemoryStore::Handle : public VolumeHandle
{
  public:
    Handle(std::shared_ptr<std::mutex> mutex, std::shared_ptr<Volume> volume)
      : mutex_{ std::move(mutex) }
      , volume_{ std::move(volume) }
    {
    }

    const VolumeMetadata& metadata() const override
    {
        return volume_->metadata;
    }

    void read_region(const BoundingBox& wire_box,
                     std::span<std::byte> out) override
    {
        std::scoped_lock lock(*mutex_);
        copy_region_out(volume_->data,
                        volume_->wire_shape,
                        wire_box,
                        bytes_of_type(volume_->metadata.dtype()),
                        out);
    }

    void write_region(const BoundingBox& wire_box,
                      std::span<const std::byte> in) override
    {
        std::scoped_lock lock(*mutex_);
        copy_region_in(volume_->data,
                       volume_->wire_shape,
                       wire_box,
                       bytes_of_type(volume_->metadata.dtype()),
                       in);
    }

  private:
    std::shared_ptr<std::mutex> mutex_;
    std::shared_ptr<Volume> volume_;
};

dvid::mock::MemoryStore::MemoryStore()
  : mutex_{ std::make_shared<std::mutex>() }
{
}

std::vector<std::string>
dvid::mock::MemoryStore::list_children(
  const std::vector<std::string>& path) const
{
    std::scoped_lock lock(*mutex_);

    std::vector<std::string> children;
    switch (path.size()) {
        case 0:
            for (const auto& [dataset, nodes] : datasets_) {
                children.push_back(dataset);
            }
            return children;
        case 1:
            for (const auto& [dataset, nodes] : datasets_) {
                if (dataset == path[0]) {
                    return nodes;
                }
            }
            break;
        case 2:
            for (const auto& [dataset, nodes] : datasets_) {
                if (dataset != path[0] ||
                    std::find(nodes.begin(), nodes.end(), path[1]) ==
                      nodes.end()) {
                    continue;
                }
                for (const auto& [name, volume] : nodes_.at(path[1])) {
                    children.push_back(name);
                }
                return children;
            }
            break;
        default:
            break;
    }

    std::string joined;
    for (const auto& segment : path) {
        joined += "/" + segment;
    }
    EXPECT_AS(NotFoundError, false, "No such path: ", joined);
    return children;
}

std::unique_ptr<dvid::mock::VolumeHandle>
dvid::mock::MemoryStore::open(std::string_view uuid, std::string_view name)
{
    std::scoped_lock lock(*mutex_);

    const auto node = nodes_.find(uuid);
    EXPECT_AS(NotFoundError, node != nodes_.end(), "No such node: ", uuid);

    const auto volume = node->second.find(name);
    EXPECT_AS(NotFoundError,
              volume != node->second.end(),
              "No volume named '",
              name,
              "' in node ",
              uuid);

    return std::make_unique<Handle>(mutex_, volume->second);
}

void
dvid::mock::MemoryStore::create_node(std::string_view dataset,
                                     std::string_view uuid)
{
    std::scoped_lock lock(*mutex_);

    EXPECT_AS(ConflictError,
              nodes_.find(uuid) == nodes_.end(),
              "Node ",
              uuid,
              " already exists");

    auto it = std::find_if(datasets_.begin(),
                           datasets_.end(),
                           [&](const auto& entry) { return entry.first == dataset; });
    if (it == datasets_.end()) {
        datasets_.emplace_back(std::string(dataset),
                               std::vector<std::string>{});
        it = std::prev(datasets_.end());
    }

    it->second.emplace_back(uuid);
    nodes_.emplace(std::string(uuid), Node{});
}

void
dvid::mock::MemoryStore::create_volume(std::string_view uuid,
                                       std::string_view name,
                                       const VolumeMetadata& metadata)
{
    std::scoped_lock lock(*mutex_);

    const auto node = nodes_.find(uuid);
    EXPECT_AS(NotFoundError, node != nodes_.end(), "No such node: ", uuid);
    EXPECT_AS(ConflictError,
              node->second.find(name) == node->second.end(),
              "Volume '",
              name,
              "' already exists in node ",
              uuid);

    auto volume = std::make_shared<Volume>(Volume{
      metadata,
      metadata.wire_mapping().permute_to_wire(metadata.shape()),
      std::vector<std::byte>(metadata.bytes_of_volume(), std::byte{ 0 }),
    });
    node->second.emplace(std::string(name), std::move(volume));
}
