#include "errors.hh"

#include <sstream>

namespace {
std::string
format_http_error(std::string_view action,
                  int status_code,
                  std::string_view method,
                  std::string_view uri,
                  std::string_view response_body)
{
    std::ostringstream ss;
    ss << "While attempting \"" << action << "\" the server returned an error: "
       << status_code << " (" << dvid::reason_phrase(status_code) << ")\n"
       << "Request METHOD: " << method << "\n"
       << "Request URI: " << uri << "\n"
       << "Response body from server was:\n"
       << response_body << "\n";
    return ss.str();
}
} // namespace

dvid::Error::Error(DvidStatusCode code, const std::string& what)
  : std::runtime_error(what)
  , code_{ code }
{
}

dvid::HttpError::HttpError(std::string_view action,
                           int status_code,
                           std::string_view method,
                           std::string_view uri,
                           std::string_view response_body)
  : Error(DvidStatusCode_HttpError,
          format_http_error(action, status_code, method, uri, response_body))
  , status_code_{ status_code }
  , method_{ method }
  , uri_{ uri }
  , body_{ response_body }
{
}

int
dvid::http_status_for(DvidStatusCode code)
{
    switch (code) {
        case DvidStatusCode_Success:
            return 200;
        case DvidStatusCode_InvalidArgument:
        case DvidStatusCode_SchemaError:
        case DvidStatusCode_AxisMismatch:
        case DvidStatusCode_OutOfBounds:
        case DvidStatusCode_ShapeMismatch:
        case DvidStatusCode_DtypeMismatch:
        case DvidStatusCode_TruncatedPayload:
        case DvidStatusCode_UnsupportedSlice:
            return 400;
        case DvidStatusCode_NotFound:
            return 404;
        case DvidStatusCode_MethodNotAllowed:
            return 405;
        case DvidStatusCode_Conflict:
            return 409;
        case DvidStatusCode_LengthRequired:
            return 411;
        case DvidStatusCode_OversizedPayload:
            return 413;
        default:
            return 500;
    }
}

const char*
dvid::reason_phrase(int http_status)
{
    switch (http_status) {
        case 200:
            return "OK";
        case 204:
            return "No Content";
        case 400:
            return "Bad Request";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 409:
            return "Conflict";
        case 411:
            return "Length Required";
        case 413:
            return "Payload Too Large";
        case 500:
            return "Internal Server Error";
        case 503:
            return "Service Unavailable";
        default:
            return "Unknown";
    }
}
