#pragma once

#include "http.connection.hh"

#include <nlohmann/json.hpp>

#include <string_view>

namespace dvid {
/**
 * @brief GET a JSON document.
 * @param connection The connection to issue the request on.
 * @param uri The path and query, e.g., "/api/server/info".
 * @throw dvid::NotFoundError on 404, dvid::HttpError on other failures.
 * @throw dvid::SchemaError if the body is not valid JSON.
 */
nlohmann::json
get_json(HttpConnection& connection, std::string_view uri);

nlohmann::json
get_server_info(HttpConnection& connection);

nlohmann::json
get_server_types(HttpConnection& connection);

/// A mapping from each dataset's name to its root node UUID.
nlohmann::json
get_datasets_list(HttpConnection& connection);

/// A mapping from each dataset's name to its node hierarchy.
nlohmann::json
get_datasets_info(HttpConnection& connection);
} // namespace dvid
