#include "mock.server.hh"
#include "cutout.codec.hh"
#include "macros.hh"

#include <algorithm>
#include <initializer_list>
#include <thread>

using json = nlohmann::json;

namespace {
constexpr std::string_view text_mimetype = "text/plain";

/// A parsed /api/node/<uuid>/<name>/raw/<dims>/<shape>/<offset> request.
struct CutoutAddress
{
    std::unique_ptr<dvid::mock::VolumeHandle> handle;
    dvid::BoundingBox wire_box;
    size_t content_length;
};

void
expect_method(const dvid::mock::ServerRequest& request,
              std::initializer_list<std::string_view> allowed)
{
    for (const auto& method : allowed) {
        if (request.method == method) {
            return;
        }
    }

    EXPECT_STATUS(DvidStatusCode_MethodNotAllowed,
                  false,
                  "Method ",
                  request.method,
                  " is not allowed for ",
                  request.uri);
}

std::vector<int64_t>
parse_tuple(std::string_view text, std::string_view what)
{
    auto coords = dvid::parse_coordinates(text);
    EXPECT_STATUS(DvidStatusCode_InvalidArgument,
                  coords.has_value(),
                  "Malformed ",
                  what,
                  ": '",
                  text,
                  "'");
    return std::move(*coords);
}

/// The dims segment must name every non-channel axis, in order, either by
/// index ("0_1_2") or by label ("xyz").
void
check_dims(std::string_view dims, const dvid::VolumeMetadata& metadata)
{
    const auto spatial = std::string_view(metadata.axis_labels()).substr(1);
    if (dims == spatial) {
        return;
    }

    std::vector<int64_t> expected(spatial.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        expected[i] = static_cast<int64_t>(i);
    }

    const auto parsed = dvid::parse_coordinates(dims);
    EXPECT_STATUS(DvidStatusCode_InvalidArgument,
                  parsed.has_value() && *parsed == expected,
                  "Cutouts must include every axis, in order. Expected dims '",
                  dvid::join_coordinates(expected),
                  "' or '",
                  spatial,
                  "', got '",
                  dims,
                  "'");
}

CutoutAddress
parse_cutout(dvid::mock::VolumeStore& store,
             const std::vector<std::string>& segments)
{
    const auto& uuid = segments[2];
    const auto& name = segments[3];

    const auto& dims = segments[5];
    const auto shape = parse_tuple(segments[6], "cutout shape");
    const auto offset = parse_tuple(segments[7], "cutout offset");

    auto handle = store.open(uuid, name);
    const auto& metadata = handle->metadata();
    check_dims(dims, metadata);

    const auto nspatial = metadata.ndims() - 1;
    EXPECT_AS(dvid::BoundsError,
              shape.size() == nspatial && offset.size() == nspatial,
              "Expected ",
              nspatial,
              " coordinates in shape '",
              segments[6],
              "' and offset '",
              segments[7],
              "'");

    // prepend the channel axis: all channels are always transferred
    std::vector<int64_t> full_offset{ 0 }, full_shape{
        static_cast<int64_t>(metadata.num_channels())
    };
    full_offset.insert(full_offset.end(), offset.begin(), offset.end());
    full_shape.insert(full_shape.end(), shape.begin(), shape.end());

    EXPECT_AS(dvid::BoundsError,
              dvid::region_fits(full_offset, full_shape, metadata.shape()),
              "Cutout of shape '",
              segments[6],
              "' at offset '",
              segments[7],
              "' exceeds the volume extent ",
              dvid::format_shape(metadata.shape()));
    const auto box =
      dvid::BoundingBox::from_offset_shape(full_offset, full_shape);

    const auto content_length =
      dvid::product(box.shape()) * dvid::bytes_of_type(metadata.dtype());
    return { std::move(handle),
             dvid::to_wire_order(box, metadata.wire_mapping()),
             content_length };
}

std::string
read_body(const dvid::mock::ServerRequest& request)
{
    EXPECT_STATUS(DvidStatusCode_LengthRequired,
                  request.content_length.has_value(),
                  "Missing Content-Length for ",
                  request.method,
                  " ",
                  request.uri);

    std::string body(*request.content_length, '\0');
    size_t nbytes = 0;
    if (request.body) {
        nbytes = dvid::read_fully(
          *request.body, std::as_writable_bytes(std::span(body)));
    }
    EXPECT_AS(dvid::TruncatedPayloadError,
              nbytes == body.size(),
              "Request body ended after ",
              nbytes,
              " bytes, expected ",
              body.size());

    return body;
}

/// Decrements a counter when leaving scope.
struct InFlightGuard
{
    std::atomic<size_t>& counter;

    explicit InFlightGuard(std::atomic<size_t>& counter)
      : counter{ counter }
    {
        ++counter;
    }
    ~InFlightGuard() { --counter; }
};
} // namespace

struct dvid::mock::MockServerEngine::RequestContext
{
    const ServerRequest& request;
    ResponseWriter& writer;
    std::vector<std::string> segments;
    RequestState state = RequestState::Idle;
    bool started = false;
};

bool
dvid::mock::validate_settings(const MockServerSettings& settings)
{
    if (settings.stream_chunk_size == 0) {
        LOG_ERROR("Stream chunk size must be positive");
        return false;
    }
    return true;
}

const char*
dvid::mock::to_string(RequestState state)
{
    switch (state) {
        case RequestState::Idle:
            return "idle";
        case RequestState::Parsing:
            return "parsing";
        case RequestState::Serving:
            return "serving";
    }
    return "unknown";
}

dvid::mock::MockServerEngine::MockServerEngine(
  VolumeStore& store,
  const MockServerSettings& settings)
  : store_{ store }
  , settings_{ settings }
  , in_flight_{ 0 }
{
    EXPECT(validate_settings(settings_), "Invalid mock server settings");
}

void
dvid::mock::MockServerEngine::handle(const ServerRequest& request,
                                     ResponseWriter& writer)
{
    InFlightGuard guard(in_flight_);
    RequestContext context{ request, writer };

    try {
        transition_(context, RequestState::Parsing);
        dispatch_(context);
    } catch (const Error& e) {
        if (context.started) {
            transition_(context, RequestState::Idle);
            throw;
        }
        send_error_(context, http_status_for(e.code()), e.what());
    } catch (const std::exception& e) {
        if (context.started) {
            transition_(context, RequestState::Idle);
            throw;
        }
        send_error_(context, 500, e.what());
    }

    transition_(context, RequestState::Idle);
}

void
dvid::mock::MockServerEngine::transition_(RequestContext& context,
                                          RequestState state)
{
    LOG_DEBUG(context.request.method,
              " ",
              context.request.uri,
              ": ",
              to_string(context.state),
              " -> ",
              to_string(state));
    context.state = state;
}

void
dvid::mock::MockServerEngine::dispatch_(RequestContext& context)
{
    const auto& request = context.request;
    context.segments = split_path(request.uri);
    const auto& s = context.segments;

    EXPECT_STATUS(DvidStatusCode_InvalidArgument,
                  s.size() >= 3 && s[0] == "api",
                  "Bad query syntax: ",
                  request.uri);
    for (const auto& segment : s) {
        EXPECT_STATUS(DvidStatusCode_InvalidArgument,
                      !segment.empty(),
                      "Empty path segment in ",
                      request.uri);
    }

    if (s.size() == 3 && s[1] == "server" && s[2] == "info") {
        expect_method(request, { "GET" });
        get_server_info_(context);
    } else if (s.size() == 3 && s[1] == "server" && s[2] == "types") {
        expect_method(request, { "GET" });
        get_server_types_(context);
    } else if (s.size() == 3 && s[1] == "datasets" && s[2] == "list") {
        expect_method(request, { "GET" });
        get_datasets_list_(context);
    } else if (s.size() == 3 && s[1] == "datasets" && s[2] == "info") {
        expect_method(request, { "GET" });
        get_datasets_info_(context);
    } else if (s.size() == 6 && s[1] == "dataset" && s[3] == "new") {
        expect_method(request, { "POST" });
        post_new_volume_(context);
    } else if (s.size() == 5 && s[1] == "node" && s[4] == "metadata") {
        expect_method(request, { "GET" });
        get_metadata_(context);
    } else if (s.size() == 8 && s[1] == "node" && s[4] == "raw") {
        expect_method(request, { "GET", "POST" });
        if (request.method == "GET") {
            get_cutout_(context);
        } else {
            post_cutout_(context);
        }
    } else {
        EXPECT_STATUS(DvidStatusCode_InvalidArgument,
                      false,
                      "Bad query syntax: ",
                      request.uri);
    }
}

void
dvid::mock::MockServerEngine::get_server_info_(RequestContext& context)
{
    transition_(context, RequestState::Serving);

    const auto cores = std::max(1u, std::thread::hardware_concurrency());
    send_json_(context,
               json{
                 { "DVID Version", "dvid-cutout mock server" },
                 { "Cores", cores },
                 { "Maximum Cores", cores },
                 { "Stream Chunk Size", settings_.stream_chunk_size },
               });
}

void
dvid::mock::MockServerEngine::get_server_types_(RequestContext& context)
{
    transition_(context, RequestState::Serving);

    constexpr std::string_view voxels_url =
      "github.com/janelia-flyem/dvid/datatype/voxels";

    json types = json::object();
    for (const auto* name :
         { "grayscale8", "labels32", "labels64", "rgba8", "voxels" }) {
        types[name] = voxels_url;
    }
    send_json_(context, types);
}

void
dvid::mock::MockServerEngine::get_datasets_list_(RequestContext& context)
{
    transition_(context, RequestState::Serving);

    json list = json::object();
    for (const auto& dataset : store_.list_children({})) {
        const auto nodes = store_.list_children({ dataset });
        if (!nodes.empty()) {
            list[dataset] = nodes.front();
        }
    }
    send_json_(context, list);
}

void
dvid::mock::MockServerEngine::get_datasets_info_(RequestContext& context)
{
    transition_(context, RequestState::Serving);

    json info = json::object();
    for (const auto& dataset : store_.list_children({})) {
        const auto uuids = store_.list_children({ dataset });
        if (uuids.empty()) {
            continue;
        }

        // nodes form a linear version chain in creation order
        json nodes = json::object();
        for (size_t i = 0; i < uuids.size(); ++i) {
            json data_map = json::object();
            for (const auto& name : store_.list_children({ dataset, uuids[i] })) {
                const auto handle = store_.open(uuids[i], name);
                data_map[name] = {
                    { "Name", name },
                    { "TypeName", handle->metadata().determine_typename() },
                };
            }

            nodes[uuids[i]] = {
                { "Parents",
                  i > 0 ? json::array({ uuids[i - 1] }) : json::array() },
                { "Children",
                  i + 1 < uuids.size() ? json::array({ uuids[i + 1] })
                                       : json::array() },
                { "DataMap", data_map },
            };
        }

        info[dataset] = {
            { "Root", uuids.front() },
            { "Nodes", nodes },
        };
    }
    send_json_(context, info);
}

void
dvid::mock::MockServerEngine::post_new_volume_(RequestContext& context)
{
    const auto& s = context.segments;
    const auto& uuid = s[2];
    const auto& typename_ = s[4];
    const auto& name = s[5];

    const auto metadata = VolumeMetadata::parse(read_body(context.request));
    const auto expected_typename = metadata.determine_typename();
    EXPECT_STATUS(DvidStatusCode_InvalidArgument,
                  typename_ == expected_typename,
                  "Cannot create volume. REST typename was ",
                  typename_,
                  ", but the metadata implies typename ",
                  expected_typename);
    EXPECT_AS(NotFoundError,
              find_dataset(store_, uuid).has_value(),
              "No such node with uuid ",
              uuid);

    transition_(context, RequestState::Serving);
    store_.create_volume(uuid, name, metadata);
    LOG_INFO("Created volume '",
             name,
             "' in node ",
             uuid,
             " with shape ",
             format_shape(metadata.shape()));

    context.started = true;
    context.writer.start(200, text_mimetype, 0);
}

void
dvid::mock::MockServerEngine::get_metadata_(RequestContext& context)
{
    const auto& s = context.segments;
    const auto handle = store_.open(s[2], s[3]);

    transition_(context, RequestState::Serving);
    send_json_(context, handle->metadata().serialize());
}

void
dvid::mock::MockServerEngine::get_cutout_(RequestContext& context)
{
    auto cutout = parse_cutout(store_, context.segments);
    const auto dtype_size = bytes_of_type(cutout.handle->metadata().dtype());

    transition_(context, RequestState::Serving);
    context.started = true;
    context.writer.start(200, volume_mimetype, cutout.content_length);

    RegionChunker chunker(
      cutout.wire_box, dtype_size, settings_.stream_chunk_size);
    std::vector<std::byte> buffer;
    while (const auto sub = chunker.next()) {
        buffer.resize(product(sub->shape()) * dtype_size);
        cutout.handle->read_region(*sub, buffer);
        EXPECT_STATUS(DvidStatusCode_IOError,
                      context.writer.write(buffer),
                      "Client rejected ",
                      buffer.size(),
                      " bytes of ",
                      context.request.uri);
    }
}

void
dvid::mock::MockServerEngine::post_cutout_(RequestContext& context)
{
    const auto& request = context.request;
    auto cutout = parse_cutout(store_, context.segments);
    const auto& metadata = cutout.handle->metadata();
    const auto dtype_size = bytes_of_type(metadata.dtype());

    EXPECT_STATUS(DvidStatusCode_LengthRequired,
                  request.content_length.has_value(),
                  "Missing Content-Length for ",
                  request.uri);
    EXPECT_AS(OversizedPayloadError,
              *request.content_length <= cutout.content_length,
              "Declared Content-Length ",
              *request.content_length,
              " exceeds the ",
              cutout.content_length,
              " bytes of the cutout");
    EXPECT_AS(TruncatedPayloadError,
              *request.content_length >= cutout.content_length,
              "Declared Content-Length ",
              *request.content_length,
              " is short of the ",
              cutout.content_length,
              " bytes of the cutout");

    if (const auto dtype = parse_volume_content_type(request.content_type)) {
        EXPECT_AS(DtypeMismatchError,
                  *dtype == metadata.dtype(),
                  "Payload of type ",
                  data_type_to_string(*dtype),
                  " does not match the volume type ",
                  data_type_to_string(metadata.dtype()));
    }

    transition_(context, RequestState::Serving);

    RegionChunker chunker(
      cutout.wire_box, dtype_size, settings_.stream_chunk_size);
    std::vector<std::byte> buffer;
    size_t bytes_received = 0;
    while (const auto sub = chunker.next()) {
        buffer.resize(product(sub->shape()) * dtype_size);

        const auto nbytes =
          request.body ? read_fully(*request.body, buffer) : size_t{ 0 };
        bytes_received += nbytes;
        EXPECT_AS(TruncatedPayloadError,
                  nbytes == buffer.size(),
                  "Request body ended after ",
                  bytes_received,
                  " bytes, expected ",
                  cutout.content_length);

        cutout.handle->write_region(*sub, buffer);
    }

    context.started = true;
    context.writer.start(200, text_mimetype, 0);
}

void
dvid::mock::MockServerEngine::send_json_(RequestContext& context,
                                         const json& body)
{
    const auto text = body.dump();

    context.started = true;
    context.writer.start(200, json_mimetype, text.size());
    EXPECT_STATUS(DvidStatusCode_IOError,
                  context.writer.write(std::as_bytes(std::span(text))),
                  "Client rejected the response to ",
                  context.request.uri);
}

void
dvid::mock::MockServerEngine::send_error_(RequestContext& context,
                                          int status,
                                          std::string_view message)
{
    LOG_WARNING(context.request.method,
                " ",
                context.request.uri,
                ": ",
                status,
                " (",
                reason_phrase(status),
                ")");

    context.started = true;
    context.writer.start(status, text_mimetype, message.size());
    if (!context.writer.write(
          std::as_bytes(std::span(message.data(), message.size())))) {
        LOG_ERROR("Client rejected the error response to ",
                  context.request.uri);
    }
}
