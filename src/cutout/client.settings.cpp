#include "client.settings.hh"
#include "curl.connection.hh"
#include "macros.hh"

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace {
DvidLogLevel
parse_log_level(std::string_view name)
{
    if (name == "debug") {
        return DvidLogLevel_Debug;
    }
    if (name == "info") {
        return DvidLogLevel_Info;
    }
    if (name == "warning") {
        return DvidLogLevel_Warning;
    }
    if (name == "error") {
        return DvidLogLevel_Error;
    }
    EXPECT_AS(
      dvid::SchemaError, name == "none", "Invalid log level: '", name, "'");
    return DvidLogLevel_None;
}

template<typename T>
T
get_or(const json& object, const char* key, T fallback)
{
    const auto it = object.find(key);
    if (it == object.end()) {
        return fallback;
    }

    try {
        return it->get<T>();
    } catch (const json::exception& e) {
        EXPECT_AS(dvid::SchemaError,
                  false,
                  "Invalid value for '",
                  key,
                  "': ",
                  e.what());
    }
    return fallback;
}
} // namespace

bool
dvid::validate_settings(const ClientSettings& settings)
{
    if (is_empty_string(settings.server_url, "Server URL is empty")) {
        return false;
    }

    if (settings.max_connections == 0) {
        LOG_ERROR("Connection pool must hold at least one connection");
        return false;
    }

    if (settings.stream_chunk_size == 0) {
        LOG_ERROR("Stream chunk size must be positive");
        return false;
    }

    if (settings.timeout_ms < 0) {
        LOG_ERROR("Invalid timeout: ", settings.timeout_ms, " ms");
        return false;
    }

    for (const auto& [key, value] : settings.query_args) {
        if (is_empty_string(key, "Query argument name is empty")) {
            return false;
        }
    }

    if (settings.log_level >= DvidLogLevelCount) {
        LOG_ERROR("Invalid log level: ", settings.log_level);
        return false;
    }

    return true;
}

dvid::ClientSettings
dvid::settings_from_json(const json& object)
{
    EXPECT_AS(SchemaError,
              object.is_object(),
              "Expected a settings object, got ",
              object.type_name());

    ClientSettings settings;
    settings.server_url = get_or<std::string>(object, "server", "");
    settings.max_connections =
      get_or<size_t>(object, "max_connections", settings.max_connections);
    settings.stream_chunk_size =
      get_or<size_t>(object, "stream_chunk_size", settings.stream_chunk_size);
    settings.timeout_ms = get_or<long>(object, "timeout_ms", 0);
    settings.query_args = get_or<std::map<std::string, std::string>>(
      object, "query_args", {});

    if (const auto it = object.find("log_level"); it != object.end()) {
        EXPECT_AS(SchemaError,
                  it->is_string(),
                  "Invalid value for 'log_level': ",
                  it->dump());
        settings.log_level = parse_log_level(it->get<std::string>());
    }

    return settings;
}

dvid::ClientSettings
dvid::settings_from_file(const std::string& path)
{
    std::ifstream file(path);
    EXPECT_STATUS(DvidStatusCode_IOError,
                  file.is_open(),
                  "Failed to open settings file '",
                  path,
                  "'");

    std::stringstream ss;
    ss << file.rdbuf();

    const auto object = json::parse(ss.str(),
                                    nullptr, // callback
                                    false,   // allow exceptions
                                    true     // ignore comments
    );
    EXPECT_AS(SchemaError,
              !object.is_discarded(),
              "Invalid JSON in settings file '",
              path,
              "'");

    return settings_from_json(object);
}

std::shared_ptr<dvid::ConnectionPool>
dvid::make_connection_pool(const ClientSettings& settings)
{
    EXPECT(validate_settings(settings), "Invalid client settings");

    Logger::set_log_level(settings.log_level);

    const auto server_url = settings.server_url;
    const auto timeout_ms = settings.timeout_ms;
    return std::make_shared<ConnectionPool>(
      settings.max_connections,
      [server_url, timeout_ms]() -> std::unique_ptr<HttpConnection> {
          return std::make_unique<CurlConnection>(server_url, timeout_ms);
      });
}
