#pragma once

#include "http.connection.hh"

#include <curl/curl.h>

#include <memory>
#include <string>
#include <string_view>

namespace dvid {
/**
 * @brief An HTTP connection to a DVID server, backed by a libcurl easy handle.
 * @details The handle keeps its connection alive between requests.
 */
class CurlConnection : public HttpConnection
{
  public:
    /**
     * @param server_url The server, e.g., "localhost:8000" or
     * "http://emdata:8000".
     * @param timeout_ms Transfer timeout in milliseconds, or 0 for none.
     */
    explicit CurlConnection(std::string_view server_url, long timeout_ms = 0);

    HttpResponse perform(const HttpRequest& request, Sink* body_sink) override;

    const std::string& base_url() const noexcept { return base_url_; }

  private:
    struct CurlDeleter
    {
        void operator()(CURL* curl) const noexcept { curl_easy_cleanup(curl); }
    };

    std::unique_ptr<CURL, CurlDeleter> handle_;
    std::string base_url_;
    long timeout_ms_;
};
} // namespace dvid
