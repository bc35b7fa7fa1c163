#pragma once

#include "byte.stream.hh"
#include "dvid.common.hh"
#include "volume.store.hh"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dvid::mock {
struct MockServerSettings
{
    /// Upper bound on the bytes moved between the body and the store at once.
    size_t stream_chunk_size = default_stream_chunk_size;
};

/// @return True if the settings are valid, false otherwise.
[[nodiscard]]
bool
validate_settings(const MockServerSettings& settings);

struct ServerRequest
{
    std::string method;
    std::string uri;
    std::string content_type;
    std::optional<size_t> content_length;
    Source* body = nullptr;
};

/// Receives a response from the engine.
class ResponseWriter
{
  public:
    virtual ~ResponseWriter() = default;

    /// Called exactly once per request, before any body bytes.
    virtual void start(int status,
                       std::string_view content_type,
                       size_t content_length) = 0;

    /// @return True if the chunk was accepted, false otherwise.
    [[nodiscard]] virtual bool write(std::span<const std::byte> chunk) = 0;
};

enum class RequestState
{
    Idle,
    Parsing,
    Serving,
};

const char*
to_string(RequestState state);

/**
 * @brief Serves the DVID REST address space from a VolumeStore.
 * @details Each request moves through Idle -> Parsing -> Serving -> Idle.
 * Validation happens while parsing, so a rejected request never touches the
 * store. Errors map to HTTP statuses with http_status_for(). Requests may be
 * handled concurrently from several threads.
 */
class MockServerEngine
{
  public:
    MockServerEngine(VolumeStore& store, const MockServerSettings& settings);

    /**
     * @brief Handle one request.
     * @details Failures detected before the response starts are answered with
     * an error status. Failures after the response has started, e.g., a
     * client sink that rejects the body, propagate to the caller.
     */
    void handle(const ServerRequest& request, ResponseWriter& writer);

    /// The number of requests currently past the Idle state.
    size_t requests_in_flight() const noexcept { return in_flight_; }

    VolumeStore& store() noexcept { return store_; }

  private:
    struct RequestContext;

    VolumeStore& store_;
    MockServerSettings settings_;
    std::atomic<size_t> in_flight_;

    void transition_(RequestContext& context, RequestState state);
    void dispatch_(RequestContext& context);

    void get_server_info_(RequestContext& context);
    void get_server_types_(RequestContext& context);
    void get_datasets_list_(RequestContext& context);
    void get_datasets_info_(RequestContext& context);
    void post_new_volume_(RequestContext& context);
    void get_metadata_(RequestContext& context);
    void get_cutout_(RequestContext& context);
    void post_cutout_(RequestContext& context);

    void send_json_(RequestContext& context, const nlohmann::json& body);
    void send_error_(RequestContext& context,
                     int status,
                     std::string_view message);
};
} // namespace dvid::mock
