#pragma once

#include "http.connection.hh"
#include "mock.server.hh"

namespace dvid::mock {
/**
 * @brief An in-process HttpConnection that hands requests straight to a
 * MockServerEngine.
 * @details Bodies stream between the client and the engine in the engine's
 * chunks; nothing is buffered beyond the response headers. The engine must
 * outlive the connection.
 */
class LoopbackConnection : public HttpConnection
{
  public:
    explicit LoopbackConnection(MockServerEngine& engine);

    HttpResponse perform(const HttpRequest& request, Sink* body_sink) override;

  private:
    MockServerEngine& engine_;
};

/// A factory for a ConnectionPool of loopback connections to @p engine.
ConnectionFactory
loopback_factory(MockServerEngine& engine);
} // namespace dvid::mock
