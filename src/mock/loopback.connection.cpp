#include "loopback.connection.hh"
#include "macros.hh"

namespace {
class SinkWriter : public dvid::mock::ResponseWriter
{
  public:
    SinkWriter(dvid::HttpResponse& response, dvid::Sink* sink)
      : response_{ response }
      , sink_{ sink }
      , offset_{ 0 }
    {
    }

    void start(int status,
               std::string_view content_type,
               size_t content_length) override
    {
        response_.status = status;
        response_.content_type = content_type;
        response_.content_length = content_length;
    }

    bool write(std::span<const std::byte> chunk) override
    {
        if (!response_.ok()) {
            response_.error_body.append(
              reinterpret_cast<const char*>(chunk.data()), chunk.size());
            return true;
        }

        if (sink_ == nullptr) {
            LOG_WARNING("Discarding ", chunk.size(), " bytes of unexpected body");
            return true;
        }

        if (!sink_->write(offset_, chunk)) {
            LOG_ERROR("Failed to write ",
                      chunk.size(),
                      " bytes to sink at offset ",
                      offset_);
            return false;
        }
        offset_ += chunk.size();
        return true;
    }

  private:
    dvid::HttpResponse& response_;
    dvid::Sink* sink_;
    size_t offset_;
};
} // namespace

dvid::mock::LoopbackConnection::LoopbackConnection(MockServerEngine& engine)
  : engine_{ engine }
{
}

dvid::HttpResponse
dvid::mock::LoopbackConnection::perform(const HttpRequest& request,
                                        Sink* body_sink)
{
    ServerRequest server_request{
        request.method,
        request.uri,
        request.content_type,
        request.content_length,
        request.body,
    };

    HttpResponse response;
    SinkWriter writer(response, body_sink);

    LOG_DEBUG(request.method, " ", request.uri);
    try {
        engine_.handle(server_request, writer);
    } catch (const Error&) {
        throw;
    } catch (const std::exception& e) {
        EXPECT_STATUS(DvidStatusCode_IOError,
                      false,
                      request.method,
                      " ",
                      request.uri,
                      " failed: ",
                      e.what());
    }

    if (response.ok() && body_sink) {
        EXPECT_STATUS(DvidStatusCode_IOError,
                      finalize_sink(*body_sink),
                      "Failed to finalize the response body of ",
                      request.method,
                      " ",
                      request.uri);
    }

    return response;
}

dvid::ConnectionFactory
dvid::mock::loopback_factory(MockServerEngine& engine)
{
    return [&engine]() -> std::unique_ptr<HttpConnection> {
        return std::make_unique<LoopbackConnection>(engine);
    };
}
