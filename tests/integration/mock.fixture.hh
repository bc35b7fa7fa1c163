#pragma once

#include "loopback.connection.hh"
#include "memory.store.hh"
#include "mock.server.hh"
#include "voxels.hh"

#include <memory>

/// An in-memory mock server with a pool of loopback connections to it.
struct MockFixture
{
    explicit MockFixture(size_t n_connections = 1,
                         size_t stream_chunk_size = 1 << 16)
      : engine{ store, { stream_chunk_size } }
      , pool{ std::make_shared<dvid::ConnectionPool>(
          n_connections,
          dvid::mock::loopback_factory(engine)) }
    {
    }

    /// Create a node and a volume in it.
    void add_volume(std::string_view dataset,
                    std::string_view uuid,
                    std::string_view name,
                    const dvid::VolumeMetadata& metadata)
    {
        if (!dvid::mock::find_dataset(store, uuid)) {
            store.create_node(dataset, uuid);
        }
        dvid::ScopedConnection connection(*pool);
        dvid::create_volume(*connection, uuid, name, metadata);
    }

    dvid::mock::MemoryStore store;
    dvid::mock::MockServerEngine engine;
    std::shared_ptr<dvid::ConnectionPool> pool;
};
