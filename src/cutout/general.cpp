#include "general.hh"
#include "macros.hh"

using json = nlohmann::json;

json
dvid::get_json(HttpConnection& connection, std::string_view uri)
{
    HttpRequest request{ "GET", std::string(uri) };
    BufferSink sink;

    const auto response = connection.perform(request, &sink);
    check_response("Fetching JSON", request, response);

    auto val = json::parse(sink.str(),
                           nullptr, // callback
                           false    // allow exceptions
    );
    EXPECT_AS(SchemaError,
              !val.is_discarded(),
              "Invalid JSON in the response to ",
              uri);

    return val;
}

json
dvid::get_server_info(HttpConnection& connection)
{
    return get_json(connection, "/api/server/info");
}

json
dvid::get_server_types(HttpConnection& connection)
{
    return get_json(connection, "/api/server/types");
}

json
dvid::get_datasets_list(HttpConnection& connection)
{
    return get_json(connection, "/api/datasets/list");
}

json
dvid::get_datasets_info(HttpConnection& connection)
{
    return get_json(connection, "/api/datasets/info");
}
