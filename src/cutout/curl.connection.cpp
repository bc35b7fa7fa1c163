#include "curl.connection.hh"
#include "dvid.common.hh"
#include "macros.hh"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <exception>
#include <mutex>

namespace {
void
init_curl_once()
{
    static std::once_flag flag;
    std::call_once(flag, [] {
        const auto code = curl_global_init(CURL_GLOBAL_DEFAULT);
        EXPECT_STATUS(DvidStatusCode_IOError,
                      code == CURLE_OK,
                      "Failed to initialize libcurl: ",
                      curl_easy_strerror(code));
    });
}

struct Transfer
{
    CURL* curl;
    dvid::Source* body;
    dvid::Sink* sink;
    dvid::HttpResponse response;
    size_t bytes_of_body;
    std::exception_ptr error;
};

bool
starts_with_ignore_case(std::string_view line, std::string_view prefix)
{
    if (line.size() < prefix.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), line.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    });
}

size_t
header_callback(char* ptr, size_t size, size_t nmemb, void* userdata) noexcept
{
    auto* transfer = static_cast<Transfer*>(userdata);
    const auto total = size * nmemb;
    std::string_view line(ptr, total);

    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    constexpr std::string_view content_type = "content-type:";
    constexpr std::string_view content_length = "content-length:";

    try {
        if (line.starts_with("HTTP/")) {
            // a new status line, e.g., after a redirect
            transfer->response.content_type.clear();
            transfer->response.content_length.reset();
        } else if (starts_with_ignore_case(line, content_type)) {
            transfer->response.content_type =
              dvid::trim(line.substr(content_type.size()));
        } else if (starts_with_ignore_case(line, content_length)) {
            const auto value = dvid::trim(line.substr(content_length.size()));
            size_t length = 0;
            const auto [p, ec] =
              std::from_chars(value.data(), value.data() + value.size(), length);
            if (ec == std::errc()) {
                transfer->response.content_length = length;
            }
        }
    } catch (const std::exception&) {
        transfer->error = std::current_exception();
        return 0;
    }

    return total;
}

size_t
write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) noexcept
{
    auto* transfer = static_cast<Transfer*>(userdata);
    const auto total = size * nmemb;

    try {
        if (transfer->response.status == 0) {
            long status = 0;
            curl_easy_getinfo(transfer->curl, CURLINFO_RESPONSE_CODE, &status);
            transfer->response.status = static_cast<int>(status);
        }

        if (!transfer->response.ok()) {
            transfer->response.error_body.append(ptr, total);
            return total;
        }

        if (transfer->sink == nullptr) {
            LOG_WARNING("Discarding ", total, " bytes of unexpected body");
            return total;
        }

        const auto* data = reinterpret_cast<const std::byte*>(ptr);
        if (!transfer->sink->write(transfer->bytes_of_body, { data, total })) {
            LOG_ERROR("Failed to write ",
                      total,
                      " bytes to sink at offset ",
                      transfer->bytes_of_body);
            return 0;
        }
        transfer->bytes_of_body += total;
    } catch (const std::exception&) {
        transfer->error = std::current_exception();
        return 0;
    }

    return total;
}

size_t
read_callback(char* buffer, size_t size, size_t nmemb, void* userdata) noexcept
{
    auto* transfer = static_cast<Transfer*>(userdata);

    try {
        return transfer->body->read(
          { reinterpret_cast<std::byte*>(buffer), size * nmemb });
    } catch (const std::exception&) {
        transfer->error = std::current_exception();
        return CURL_READFUNC_ABORT;
    }
}

std::string
make_base_url(std::string_view server_url)
{
    std::string url = dvid::trim(server_url);
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    if (url.find("://") == std::string::npos) {
        url = "http://" + url;
    }
    return url;
}

struct HeaderList
{
    curl_slist* list = nullptr;

    ~HeaderList() { curl_slist_free_all(list); }

    void append(const std::string& header)
    {
        auto* appended = curl_slist_append(list, header.c_str());
        EXPECT_STATUS(DvidStatusCode_IOError,
                      appended != nullptr,
                      "Failed to append header: ",
                      header);
        list = appended;
    }
};
} // namespace

dvid::CurlConnection::CurlConnection(std::string_view server_url,
                                     long timeout_ms)
  : base_url_{ make_base_url(server_url) }
  , timeout_ms_{ timeout_ms }
{
    EXPECT(!is_empty_string(server_url, "Server URL is empty"),
           "Invalid server URL");

    init_curl_once();
    handle_.reset(curl_easy_init());
    EXPECT_STATUS(DvidStatusCode_IOError,
                  handle_ != nullptr,
                  "Failed to create a libcurl handle");
}

dvid::HttpResponse
dvid::CurlConnection::perform(const HttpRequest& request, Sink* body_sink)
{
    auto* curl = handle_.get();
    curl_easy_reset(curl);

    Transfer transfer{ curl, request.body, body_sink, {}, 0, nullptr };
    const auto url = base_url_ + request.uri;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (timeout_ms_ > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
    }

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &transfer);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer);

    HeaderList headers;
    if (request.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        if (request.body) {
            curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
            curl_easy_setopt(curl, CURLOPT_READDATA, &transfer);
            curl_easy_setopt(
              curl,
              CURLOPT_POSTFIELDSIZE_LARGE,
              request.content_length
                ? static_cast<curl_off_t>(*request.content_length)
                : static_cast<curl_off_t>(-1));
        } else {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, "");
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, curl_off_t{ 0 });
        }
        // stream the body immediately instead of waiting for 100-continue
        headers.append("Expect:");
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    if (!request.content_type.empty()) {
        headers.append("Content-Type: " + request.content_type);
    }
    if (headers.list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.list);
    }

    LOG_DEBUG(request.method, " ", url);
    const auto code = curl_easy_perform(curl);

    if (transfer.error) {
        std::rethrow_exception(transfer.error);
    }
    EXPECT_STATUS(DvidStatusCode_IOError,
                  code == CURLE_OK,
                  request.method,
                  " ",
                  url,
                  " failed: ",
                  curl_easy_strerror(code));

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    transfer.response.status = static_cast<int>(status);

    if (transfer.response.ok() && body_sink) {
        EXPECT_STATUS(DvidStatusCode_IOError,
                      finalize_sink(*body_sink),
                      "Failed to finalize the response body of ",
                      request.method,
                      " ",
                      url);
    }

    return std::move(transfer.response);
}
