#include "dvid.h"
#include "macros.hh"

#include <cstdint> // uint32_t

#define DVID_CUTOUT_API_VERSION 0

extern "C"
{
    uint32_t Dvid_get_api_version()
    {
        return DVID_CUTOUT_API_VERSION;
    }

    const char* Dvid_get_status_message(DvidStatusCode status)
    {
        switch (status) {
            case DvidStatusCode_Success:
                return "Success";
            case DvidStatusCode_InvalidArgument:
                return "Invalid argument";
            case DvidStatusCode_SchemaError:
                return "Malformed or incomplete metadata";
            case DvidStatusCode_AxisMismatch:
                return "Axis labels do not match";
            case DvidStatusCode_OutOfBounds:
                return "Region out of bounds";
            case DvidStatusCode_ShapeMismatch:
                return "Shape mismatch";
            case DvidStatusCode_DtypeMismatch:
                return "Data type mismatch";
            case DvidStatusCode_TruncatedPayload:
                return "Truncated payload";
            case DvidStatusCode_OversizedPayload:
                return "Oversized payload";
            case DvidStatusCode_UnsupportedSlice:
                return "Unsupported slice";
            case DvidStatusCode_NotFound:
                return "Not found";
            case DvidStatusCode_Conflict:
                return "Conflict";
            case DvidStatusCode_MethodNotAllowed:
                return "Method not allowed";
            case DvidStatusCode_LengthRequired:
                return "Content length required";
            case DvidStatusCode_HttpError:
                return "HTTP error";
            case DvidStatusCode_IOError:
                return "I/O error";
            case DvidStatusCode_InternalError:
                return "Internal error";
            default:
                return "Unknown error";
        }
    }

    DvidStatusCode Dvid_set_log_level(DvidLogLevel level)
    {
        EXPECT_VALID_ARGUMENT(
          level < DvidLogLevelCount, "Invalid log level: ", level);

        Logger::set_log_level(level);
        return DvidStatusCode_Success;
    }

    DvidLogLevel Dvid_get_log_level()
    {
        return Logger::get_log_level();
    }
}
