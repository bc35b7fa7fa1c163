#include "dvid.h"
#include "errors.hh"
#include "unit.test.macros.hh"

int
main()
{
    int retval = 0;

    try {
        EXPECT_EQ(int, Dvid_get_api_version(), 0);
        EXPECT_STR_EQ(Dvid_get_status_message(DvidStatusCode_Success),
                      "Success");
        EXPECT_STR_EQ(Dvid_get_status_message(DvidStatusCode_NotFound),
                      "Not found");
        EXPECT_STR_EQ(Dvid_get_status_message(DvidStatusCodeCount),
                      "Unknown error");

        EXPECT_EQ(int,
                  Dvid_set_log_level(DvidLogLevel_Debug),
                  DvidStatusCode_Success);
        EXPECT_EQ(int, Dvid_get_log_level(), DvidLogLevel_Debug);
        EXPECT_EQ(int,
                  Dvid_set_log_level(DvidLogLevelCount),
                  DvidStatusCode_InvalidArgument);
        EXPECT_EQ(int, Dvid_get_log_level(), DvidLogLevel_Debug);
        EXPECT_EQ(int,
                  Dvid_set_log_level(DvidLogLevel_Info),
                  DvidStatusCode_Success);

        // messages below the current level are still formatted
        const auto message = LOG_DEBUG("hidden ", 42);
        CHECK(message.find("hidden 42") != std::string::npos);
        CHECK(message.find("[DEBUG]") != std::string::npos);

        // every error maps to a deterministic HTTP status
        EXPECT_EQ(int, dvid::http_status_for(DvidStatusCode_OutOfBounds), 400);
        EXPECT_EQ(int, dvid::http_status_for(DvidStatusCode_SchemaError), 400);
        EXPECT_EQ(
          int, dvid::http_status_for(DvidStatusCode_TruncatedPayload), 400);
        EXPECT_EQ(
          int, dvid::http_status_for(DvidStatusCode_UnsupportedSlice), 400);
        EXPECT_EQ(int, dvid::http_status_for(DvidStatusCode_NotFound), 404);
        EXPECT_EQ(
          int, dvid::http_status_for(DvidStatusCode_MethodNotAllowed), 405);
        EXPECT_EQ(int, dvid::http_status_for(DvidStatusCode_Conflict), 409);
        EXPECT_EQ(
          int, dvid::http_status_for(DvidStatusCode_LengthRequired), 411);
        EXPECT_EQ(
          int, dvid::http_status_for(DvidStatusCode_OversizedPayload), 413);
        EXPECT_EQ(int, dvid::http_status_for(DvidStatusCode_IOError), 500);
        EXPECT_STR_EQ(dvid::reason_phrase(404), "Not Found");
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
