#include "volume.metadata.hh"
#include "unit.test.macros.hh"

using dvid::SchemaError;
using dvid::VolumeMetadata;

int
main()
{
    int retval = 0;

    try {
        // not JSON, or not an object
        EXPECT_THROWS(SchemaError, VolumeMetadata::parse("{\"Axes\": ["));
        EXPECT_THROWS(SchemaError, VolumeMetadata::parse("[1, 2, 3]"));

        // missing fields
        EXPECT_THROWS(SchemaError, VolumeMetadata::parse("{\"Values\": []}"));
        EXPECT_THROWS(SchemaError, VolumeMetadata::parse("{\"Axes\": []}"));
        EXPECT_THROWS(
          SchemaError,
          VolumeMetadata::parse(R"({"Axes": [{"Label": "X", "Resolution": 1,
                                   "Units": "nm"}],
                                   "Values": [{"DataType": "uint8"}]})"));

        // wrong types
        EXPECT_THROWS(
          SchemaError,
          VolumeMetadata::parse(R"({"Axes": [{"Label": "X", "Resolution": "1",
                                   "Units": "nm", "Size": 10}],
                                   "Values": [{"DataType": "uint8"}]})"));
        EXPECT_THROWS(
          SchemaError,
          VolumeMetadata::parse(R"({"Axes": [{"Label": "X", "Resolution": 1,
                                   "Units": "nm", "Size": -10}],
                                   "Values": [{"DataType": "uint8"}]})"));

        // heterogeneous channels and units
        EXPECT_THROWS(
          SchemaError,
          VolumeMetadata::parse(R"({"Axes": [{"Label": "X", "Resolution": 1,
                                   "Units": "nm", "Size": 10}],
                                   "Values": [{"DataType": "uint8"},
                                              {"DataType": "uint16"}]})"));
        EXPECT_THROWS(
          SchemaError,
          VolumeMetadata::parse(R"({"Axes": [{"Label": "X", "Resolution": 1,
                                   "Units": "nm", "Size": 10},
                                  {"Label": "Y", "Resolution": 1,
                                   "Units": "um", "Size": 10}],
                                   "Values": [{"DataType": "uint8"}]})"));

        // duplicate and unknown labels
        EXPECT_THROWS(
          SchemaError,
          VolumeMetadata::parse(R"({"Axes": [{"Label": "X", "Resolution": 1,
                                   "Units": "nm", "Size": 10},
                                  {"Label": "X", "Resolution": 1,
                                   "Units": "nm", "Size": 10}],
                                   "Values": [{"DataType": "uint8"}]})"));
        EXPECT_THROWS(
          SchemaError,
          VolumeMetadata::parse(R"({"Axes": [{"Label": "Q", "Resolution": 1,
                                   "Units": "nm", "Size": 10}],
                                   "Values": [{"DataType": "uint8"}]})"));

        // no spatial axis
        EXPECT_THROWS(SchemaError,
                      VolumeMetadata::default_metadata(
                        { 3 }, DvidDataType_uint8, "c", 1.0, "nanometers"));
        EXPECT_THROWS(SchemaError,
                      VolumeMetadata::parse(R"({"Axes": [],
                                   "Values": [{"DataType": "uint8"}]})"));

        // constructor invariants
        EXPECT_THROWS(SchemaError,
                      VolumeMetadata({ 1, 10 }, DvidDataType_uint8, "cxy",
                                     { 1.0, 1.0 }, ""));
        EXPECT_THROWS(SchemaError,
                      VolumeMetadata({ 1, 10, 10 }, DvidDataType_uint8, "cxy",
                                     { 1.0 }, ""));
        EXPECT_THROWS(SchemaError,
                      VolumeMetadata({ 1, 10, 10 }, DvidDataType_uint8, "xcy",
                                     { 1.0, 1.0 }, ""));
        EXPECT_THROWS(SchemaError,
                      VolumeMetadata({ 1, 0, 10 }, DvidDataType_uint8, "cxy",
                                     { 1.0, 1.0 }, ""));
        EXPECT_THROWS(SchemaError,
                      VolumeMetadata({ 2, 10, 10 }, DvidDataType_uint8, "cxy",
                                     { 1.0, 1.0 }, "", { "only one" }));
        EXPECT_THROWS(SchemaError,
                      VolumeMetadata({ 1, 10, 10 }, DvidDataType_uint8, "cxy",
                                     { 1.0, -1.0 }, ""));
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    return retval;
}
