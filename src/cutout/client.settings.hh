#pragma once

#include "dvid.common.hh"
#include "http.connection.hh"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace dvid {
struct ClientSettings
{
    /// The server, e.g., "localhost:8000".
    std::string server_url;

    /// The number of connections in the pool.
    size_t max_connections = 1;

    /// Upper bound on the size of a streamed chunk.
    size_t stream_chunk_size = default_stream_chunk_size;

    /// Transfer timeout in milliseconds, or 0 for none.
    long timeout_ms = 0;

    /// Extra query arguments appended to every cutout URI.
    std::map<std::string, std::string> query_args;

    DvidLogLevel log_level = DvidLogLevel_Info;
};

/// @return True if the settings are valid, false otherwise.
[[nodiscard]]
bool
validate_settings(const ClientSettings& settings);

/**
 * @brief Read settings from a JSON object.
 * @details Recognized keys: "server", "max_connections", "stream_chunk_size",
 * "timeout_ms", "query_args" (an object of strings), and "log_level" (one of
 * "debug", "info", "warning", "error", "none"). Missing keys keep their
 * defaults.
 * @throw dvid::SchemaError if a key has the wrong type or value.
 */
ClientSettings
settings_from_json(const nlohmann::json& json);

/**
 * @brief Read settings from a JSON file.
 * @throw dvid::Error with DvidStatusCode_IOError if the file cannot be read.
 * @throw dvid::SchemaError if the file is not a valid settings object.
 */
ClientSettings
settings_from_file(const std::string& path);

/**
 * @brief Create a pool of libcurl connections to the configured server.
 * @throw std::runtime_error if the settings are invalid.
 */
std::shared_ptr<ConnectionPool>
make_connection_pool(const ClientSettings& settings);
} // namespace dvid
