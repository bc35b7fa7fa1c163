#pragma once

#include "volume.store.hh"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace dvid::mock {
/// Keeps every volume in memory. Intended for tests.
class MemoryStore : public VolumeStore
{
  public:
    MemoryStore();

    std::vector<std::string> list_children(
      const std::vector<std::string>& path) const override;
    std::unique_ptr<VolumeHandle> open(std::string_view uuid,
                                       std::string_view name) override;
    void create_node(std::string_view dataset, std::string_view uuid) override;
    void create_volume(std::string_view uuid,
                       std::string_view name,
                       const VolumeMetadata& metadata) override;

  private:
    struct Volume
    {
        VolumeMetadata metadata;
        std::vector<size_t> wire_shape;
        std::vector<std::byte> data;
    };
    using Node = std::map<std::string, std::shared_ptr<Volume>, std::less<>>;

    class Handle;

    mutable std::shared_ptr<std::mutex> mutex_;

    // datasets and their nodes, in creation order
    std::vector<std::pair<std::string, std::vector<std::string>>> datasets_;
    std::map<std::string, Node, std::less<>> nodes_;
};
} // namespace dvid::mock
