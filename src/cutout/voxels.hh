#pragma once

#include "http.connection.hh"
#include "volume.metadata.hh"

#include <string_view>

namespace dvid {
/**
 * @brief Create a voxels volume under a node.
 * @details The DVID type name is derived from the metadata with
 * VolumeMetadata::determine_typename().
 * @throw dvid::NotFoundError if the node does not exist.
 * @throw dvid::HttpError if the server rejects the volume, e.g., because it
 * already exists.
 */
void
create_volume(HttpConnection& connection,
              std::string_view uuid,
              std::string_view name,
              const VolumeMetadata& metadata);

/**
 * @brief Fetch the metadata of a volume.
 * @throw dvid::NotFoundError if the node or volume does not exist.
 * @throw dvid::SchemaError if the server's description is malformed.
 */
VolumeMetadata
get_metadata(HttpConnection& connection,
             std::string_view uuid,
             std::string_view name);
} // namespace dvid
