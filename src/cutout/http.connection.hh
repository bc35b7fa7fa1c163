#pragma once

#include "byte.stream.hh"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dvid {
struct HttpRequest
{
    std::string method;

    /// The path and query, e.g., "/api/datasets/list".
    std::string uri;

    std::string content_type;
    std::optional<size_t> content_length;

    /// The request body, or nullptr if there is none.
    Source* body = nullptr;
};

struct HttpResponse
{
    int status = 0;
    std::string content_type;
    std::optional<size_t> content_length;

    /// The body of a non-2xx response. Successful bodies go to the sink.
    std::string error_body;

    bool ok() const noexcept { return status >= 200 && status < 300; }
};

/**
 * @brief A connection to a DVID server.
 * @details A connection serves one request at a time. Lease connections from
 * a ConnectionPool to issue concurrent requests.
 */
class HttpConnection
{
  public:
    virtual ~HttpConnection() = default;

    /**
     * @brief Issue a request and stream the response body.
     * @param request The request.
     * @param body_sink Receives the body of a 2xx response, then is finalized.
     * May be nullptr if no body is expected.
     * @return The response status and headers.
     * @throw dvid::Error with DvidStatusCode_IOError on transport failure.
     */
    virtual HttpResponse perform(const HttpRequest& request,
                                 Sink* body_sink) = 0;
};

/**
 * @brief Raise if @p response is not a success.
 * @param action What the request was for, e.g., "Fetching metadata".
 * @throw dvid::NotFoundError on 404.
 * @throw dvid::HttpError on any other non-2xx status.
 */
void
check_response(std::string_view action,
               const HttpRequest& request,
               const HttpResponse& response);

using ConnectionFactory = std::function<std::unique_ptr<HttpConnection>()>;

class ConnectionPool
{
  public:
    ConnectionPool(size_t n_connections, const ConnectionFactory& factory);
    ~ConnectionPool() noexcept;

    /// Block until a connection is free. Returns nullptr during teardown.
    std::unique_ptr<HttpConnection> get_connection();
    void return_connection(std::unique_ptr<HttpConnection>&& conn);

    size_t size() const noexcept { return size_; }

  private:
    std::vector<std::unique_ptr<HttpConnection>> connections_;
    mutable std::mutex connections_mutex_;
    std::condition_variable cv_;
    size_t size_;

    std::atomic<bool> is_accepting_connections_{ true };
};

/**
 * @brief Leases a connection from a pool for the lifetime of the object.
 */
class ScopedConnection
{
  public:
    explicit ScopedConnection(ConnectionPool& pool);
    ~ScopedConnection() noexcept;

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    HttpConnection& operator*() const noexcept { return *connection_; }
    HttpConnection* operator->() const noexcept { return connection_.get(); }

  private:
    ConnectionPool& pool_;
    std::unique_ptr<HttpConnection> connection_;
};
} // namespace dvid
