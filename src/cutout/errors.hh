#pragma once

#include "dvid.types.h"

#include <stdexcept>
#include <string>
#include <string_view>

namespace dvid {
/**
 * @brief Base class for all errors raised by the cutout library.
 * @details Every error carries a status code, which the mock server maps to an
 * HTTP status with http_status_for().
 */
class Error : public std::runtime_error
{
  public:
    Error(DvidStatusCode code, const std::string& what);

    DvidStatusCode code() const noexcept { return code_; }

  private:
    DvidStatusCode code_;
};

#define DVID_DECLARE_ERROR(name, status)                                       \
    class name : public Error                                                  \
    {                                                                          \
      public:                                                                  \
        explicit name(const std::string& what)                                 \
          : Error(status, what)                                                \
        {                                                                      \
        }                                                                      \
    }

/// Malformed or incomplete metadata.
DVID_DECLARE_ERROR(SchemaError, DvidStatusCode_SchemaError);

/// Axis label sets (or ranks) disagree.
DVID_DECLARE_ERROR(AxisMismatchError, DvidStatusCode_AxisMismatch);

/// Requested region exceeds the volume extent or has the wrong rank.
DVID_DECLARE_ERROR(BoundsError, DvidStatusCode_OutOfBounds);

DVID_DECLARE_ERROR(ShapeMismatchError, DvidStatusCode_ShapeMismatch);
DVID_DECLARE_ERROR(DtypeMismatchError, DvidStatusCode_DtypeMismatch);

/// The payload stream ended before the declared number of bytes arrived.
DVID_DECLARE_ERROR(TruncatedPayloadError, DvidStatusCode_TruncatedPayload);

/// More bytes arrived (or were declared) than the shape implies.
DVID_DECLARE_ERROR(OversizedPayloadError, DvidStatusCode_OversizedPayload);

DVID_DECLARE_ERROR(UnsupportedSliceError, DvidStatusCode_UnsupportedSlice);

/// Unknown dataset, node, or volume.
DVID_DECLARE_ERROR(NotFoundError, DvidStatusCode_NotFound);

DVID_DECLARE_ERROR(ConflictError, DvidStatusCode_Conflict);

#undef DVID_DECLARE_ERROR

/**
 * @brief Raised when the server answers a request with a non-2xx status.
 */
class HttpError : public Error
{
  public:
    HttpError(std::string_view action,
              int status_code,
              std::string_view method,
              std::string_view uri,
              std::string_view response_body);

    int status_code() const noexcept { return status_code_; }
    const std::string& method() const noexcept { return method_; }
    const std::string& uri() const noexcept { return uri_; }
    const std::string& response_body() const noexcept { return body_; }

  private:
    int status_code_;
    std::string method_;
    std::string uri_;
    std::string body_;
};

/**
 * @brief Map a status code to the HTTP status the mock server responds with.
 * @param code The status code.
 * @return The HTTP status code, e.g., 400 for a bounds error.
 */
int
http_status_for(DvidStatusCode code);

/**
 * @brief Get the standard reason phrase for an HTTP status code.
 * @param http_status The HTTP status code.
 * @return The reason phrase, e.g., "Not Found" for 404.
 */
const char*
reason_phrase(int http_status);
} // namespace dvid
