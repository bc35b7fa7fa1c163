#include "http.connection.hh"
#include "macros.hh"

dvid::ConnectionPool::ConnectionPool(size_t n_connections,
                                     const ConnectionFactory& factory)
  : size_{ 0 }
{
    EXPECT(n_connections > 0, "Connection pool must not be empty");
    EXPECT(factory, "Connection factory must not be empty");

    for (size_t i = 0; i < n_connections; ++i) {
        auto connection = factory();
        CHECK(connection);
        connections_.push_back(std::move(connection));
    }
    size_ = connections_.size();
}

dvid::ConnectionPool::~ConnectionPool() noexcept
{
    is_accepting_connections_ = false;
    cv_.notify_all();
}

std::unique_ptr<dvid::HttpConnection>
dvid::ConnectionPool::get_connection()
{
    std::unique_lock lock(connections_mutex_);
    cv_.wait(lock, [this] {
        return !is_accepting_connections_ || !connections_.empty();
    });

    if (!is_accepting_connections_ || connections_.empty()) {
        return nullptr;
    }

    auto conn = std::move(connections_.back());
    connections_.pop_back();
    return conn;
}

void
dvid::ConnectionPool::return_connection(std::unique_ptr<HttpConnection>&& conn)
{
    std::unique_lock lock(connections_mutex_);
    connections_.push_back(std::move(conn));
    cv_.notify_one();
}

dvid::ScopedConnection::ScopedConnection(ConnectionPool& pool)
  : pool_{ pool }
  , connection_{ pool.get_connection() }
{
    EXPECT_STATUS(DvidStatusCode_IOError,
                  connection_ != nullptr,
                  "Connection pool is shutting down");
}

dvid::ScopedConnection::~ScopedConnection() noexcept
{
    if (connection_) {
        pool_.return_connection(std::move(connection_));
    }
}

void
dvid::check_response(std::string_view action,
                     const HttpRequest& request,
                     const HttpResponse& response)
{
    if (response.ok()) {
        return;
    }

    EXPECT_AS(NotFoundError,
              response.status != 404,
              action,
              " failed: ",
              request.method,
              " ",
              request.uri,
              " returned 404 (Not Found): ",
              response.error_body);

    HttpError error(
      action, response.status, request.method, request.uri, response.error_body);
    LOG_ERROR(error.what());
    throw error;
}
