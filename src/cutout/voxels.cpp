#include "voxels.hh"
#include "general.hh"
#include "macros.hh"

void
dvid::create_volume(HttpConnection& connection,
                    std::string_view uuid,
                    std::string_view name,
                    const VolumeMetadata& metadata)
{
    const auto body = metadata.to_json();
    BufferSource source(body);

    HttpRequest request{
        "POST",
        "/api/dataset/" + std::string(uuid) + "/new/" +
          metadata.determine_typename() + "/" + std::string(name),
        std::string(json_mimetype),
        body.size(),
        &source,
    };

    const auto response = connection.perform(request, nullptr);
    check_response("Creating volume", request, response);

    LOG_DEBUG("Created volume '", name, "' in node ", uuid);
}

dvid::VolumeMetadata
dvid::get_metadata(HttpConnection& connection,
                   std::string_view uuid,
                   std::string_view name)
{
    const auto uri = "/api/node/" + std::string(uuid) + "/" +
                     std::string(name) + "/metadata";
    return VolumeMetadata::parse(get_json(connection, uri));
}
