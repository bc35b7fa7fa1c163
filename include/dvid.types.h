#ifndef H_DVID_CUTOUT_TYPES_V0
#define H_DVID_CUTOUT_TYPES_V0

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

    typedef enum
    {
        DvidStatusCode_Success = 0,
        DvidStatusCode_InvalidArgument,
        DvidStatusCode_SchemaError,
        DvidStatusCode_AxisMismatch,
        DvidStatusCode_OutOfBounds,
        DvidStatusCode_ShapeMismatch,
        DvidStatusCode_DtypeMismatch,
        DvidStatusCode_TruncatedPayload,
        DvidStatusCode_OversizedPayload,
        DvidStatusCode_UnsupportedSlice,
        DvidStatusCode_NotFound,
        DvidStatusCode_Conflict,
        DvidStatusCode_MethodNotAllowed,
        DvidStatusCode_LengthRequired,
        DvidStatusCode_HttpError,
        DvidStatusCode_IOError,
        DvidStatusCode_InternalError,
        DvidStatusCodeCount,
    } DvidStatusCode;

    typedef enum
    {
        DvidLogLevel_Debug,
        DvidLogLevel_Info,
        DvidLogLevel_Warning,
        DvidLogLevel_Error,
        DvidLogLevel_None,
        DvidLogLevelCount
    } DvidLogLevel;

    typedef enum
    {
        DvidDataType_uint8,
        DvidDataType_uint16,
        DvidDataType_uint32,
        DvidDataType_uint64,
        DvidDataType_int8,
        DvidDataType_int16,
        DvidDataType_int32,
        DvidDataType_int64,
        DvidDataType_float32,
        DvidDataType_float64,
        DvidDataTypeCount
    } DvidDataType;

#ifdef __cplusplus
}
#endif

#endif // H_DVID_CUTOUT_TYPES_V0
