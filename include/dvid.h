#ifndef H_DVID_CUTOUT_V0
#define H_DVID_CUTOUT_V0

#include "dvid.types.h"

#ifdef __cplusplus
extern "C"
{
#endif

    /**
     * @brief Get the version of the cutout API.
     * @return The version of the cutout API.
     */
    uint32_t Dvid_get_api_version();

    /**
     * @brief Get the message for the given status code.
     * @param status The status code.
     * @return A human-readable status message.
     */
    const char* Dvid_get_status_message(DvidStatusCode status);

    /**
     * @brief Set the log level for the library.
     * @param level The log level.
     * @return DvidStatusCode_Success on success, or an error code on failure.
     */
    DvidStatusCode Dvid_set_log_level(DvidLogLevel level);

    /**
     * @brief Get the log level for the library.
     * @return The log level.
     */
    DvidLogLevel Dvid_get_log_level();

#ifdef __cplusplus
}
#endif

#endif // H_DVID_CUTOUT_V0
