#include "volume.metadata.hh"
#include "macros.hh"

#include <cctype>
#include <cmath>
#include <optional>

using json = nlohmann::json;

namespace {
const json&
require_field(const json& object, const char* key, const char* context)
{
    EXPECT_AS(dvid::SchemaError,
              object.is_object(),
              "Expected ",
              context,
              " to be a JSON object");

    const auto it = object.find(key);
    EXPECT_AS(dvid::SchemaError,
              it != object.end(),
              "Missing field '",
              key,
              "' in ",
              context);
    return *it;
}

std::string
require_string(const json& object, const char* key, const char* context)
{
    const auto& value = require_field(object, key, context);
    EXPECT_AS(dvid::SchemaError,
              value.is_string(),
              "Field '",
              key,
              "' in ",
              context,
              " must be a string");
    return value.get<std::string>();
}

std::string
lower(std::string_view s)
{
    std::string lowered(s);
    for (auto& c : lowered) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lowered;
}
} // namespace

dvid::VolumeMetadata::VolumeMetadata(std::vector<size_t> shape,
                                     DvidDataType dtype,
                                     std::string axis_labels,
                                     std::vector<double> resolution,
                                     std::string resolution_unit,
                                     std::vector<std::string> channel_labels)
  : shape_{ std::move(shape) }
  , dtype_{ dtype }
  , axis_labels_{ std::move(axis_labels) }
  , resolution_{ std::move(resolution) }
  , resolution_unit_{ std::move(resolution_unit) }
  , channel_labels_{ std::move(channel_labels) }
{
    if (channel_labels_.empty() && !shape_.empty()) {
        channel_labels_.resize(shape_.front());
    }

    validate_();
}

dvid::VolumeMetadata
dvid::VolumeMetadata::parse(std::string_view json_text)
{
    auto val = json::parse(json_text,
                           nullptr, // callback
                           false    // allow exceptions
    );
    EXPECT_AS(SchemaError, !val.is_discarded(), "Invalid JSON: ", json_text);

    return parse(val);
}

dvid::VolumeMetadata
dvid::VolumeMetadata::parse(const json& j)
{
    const auto& axes = require_field(j, "Axes", "metadata");
    EXPECT_AS(SchemaError, axes.is_array(), "'Axes' must be an array");

    const auto& values = require_field(j, "Values", "metadata");
    EXPECT_AS(SchemaError, values.is_array(), "'Values' must be an array");
    EXPECT_AS(SchemaError, !values.empty(), "'Values' must not be empty");

    // channels
    std::optional<DvidDataType> dtype;
    std::vector<std::string> channel_labels;
    for (const auto& channel : values) {
        const auto dtype_name = require_string(channel, "DataType", "'Values'");
        const auto channel_dtype = data_type_from_string(dtype_name);
        EXPECT_AS(SchemaError,
                  channel_dtype.has_value(),
                  "Unsupported data type: ",
                  dtype_name);
        EXPECT_AS(SchemaError,
                  !dtype || *dtype == *channel_dtype,
                  "Channels have heterogeneous data types: ",
                  data_type_to_string(*dtype),
                  " and ",
                  dtype_name);
        dtype = channel_dtype;

        std::string label;
        if (channel.contains("Label")) {
            label = require_string(channel, "Label", "'Values'");
        }
        channel_labels.push_back(std::move(label));
    }

    // spatial axes
    std::vector<size_t> shape{ values.size() };
    std::string axis_labels = "c";
    std::vector<double> resolution;
    std::optional<std::string> unit;
    for (const auto& axis : axes) {
        const auto label = require_string(axis, "Label", "'Axes'");
        EXPECT_AS(SchemaError,
                  label.size() == 1,
                  "Axis label must be a single character, got '",
                  label,
                  "'");
        axis_labels += lower(label);

        const auto& size = require_field(axis, "Size", "'Axes'");
        EXPECT_AS(SchemaError,
                  size.is_number_integer() && size.get<int64_t>() > 0,
                  "Size of axis ",
                  label,
                  " must be a positive integer, got ",
                  size.dump());
        shape.push_back(size.get<size_t>());

        const auto& res = require_field(axis, "Resolution", "'Axes'");
        EXPECT_AS(SchemaError,
                  res.is_number(),
                  "Resolution of axis ",
                  label,
                  " must be a number, got ",
                  res.dump());
        resolution.push_back(res.get<double>());

        const auto units = require_string(axis, "Units", "'Axes'");
        EXPECT_AS(SchemaError,
                  !unit || *unit == units,
                  "Axes have heterogeneous units: ",
                  *unit,
                  " and ",
                  units);
        unit = units;
    }

    return { std::move(shape),
             *dtype,
             std::move(axis_labels),
             std::move(resolution),
             unit.value_or(""),
             std::move(channel_labels) };
}

dvid::VolumeMetadata
dvid::VolumeMetadata::default_metadata(std::vector<size_t> shape,
                                       DvidDataType dtype,
                                       std::string_view axis_labels,
                                       double resolution_scale,
                                       std::string_view unit)
{
    EXPECT_AS(SchemaError,
              !axis_labels.empty(),
              "Axis labels must not be empty");

    return { std::move(shape),
             dtype,
             std::string(axis_labels),
             std::vector<double>(axis_labels.size() - 1, resolution_scale),
             std::string(unit) };
}

json
dvid::VolumeMetadata::serialize() const
{
    json axes = json::array();
    for (size_t i = 1; i < ndims(); ++i) {
        axes.push_back({
          { "Label", std::string(1, static_cast<char>(std::toupper(
                                      static_cast<unsigned char>(
                                        axis_labels_[i])))) },
          { "Resolution", resolution_[i - 1] },
          { "Units", resolution_unit_ },
          { "Size", shape_[i] },
        });
    }

    json values = json::array();
    for (const auto& label : channel_labels_) {
        values.push_back({
          { "DataType", data_type_to_string(dtype_) },
          { "Label", label },
        });
    }

    return json{ { "Axes", axes }, { "Values", values } };
}

std::string
dvid::VolumeMetadata::to_json() const
{
    return serialize().dump();
}

size_t
dvid::VolumeMetadata::bytes_of_volume() const
{
    return product(shape_) * bytes_of_type(dtype_);
}

dvid::VolumeMetadata
dvid::VolumeMetadata::with_resolution(std::vector<double> resolution) const
{
    auto copy = *this;
    copy.resolution_ = std::move(resolution);
    copy.validate_();
    return copy;
}

dvid::VolumeMetadata
dvid::VolumeMetadata::with_channel_labels(std::vector<std::string> labels) const
{
    auto copy = *this;
    copy.channel_labels_ = std::move(labels);
    copy.validate_();
    return copy;
}

std::string
dvid::VolumeMetadata::determine_typename() const
{
    const auto channels = num_channels();
    if (channels == 1) {
        switch (dtype_) {
            case DvidDataType_uint8:
                return "grayscale8";
            case DvidDataType_uint32:
                return "labels32";
            case DvidDataType_uint64:
                return "labels64";
            default:
                break;
        }
    } else if (channels == 4 && dtype_ == DvidDataType_uint8) {
        return "rgba8";
    }

    LOG_DEBUG("No dedicated type name for ",
              channels,
              " channel(s) of ",
              data_type_to_string(dtype_),
              ". Using 'voxels'.");
    return "voxels";
}

dvid::AxisOrderMapping
dvid::VolumeMetadata::wire_mapping() const
{
    return AxisOrderMapping::reversal(axis_labels_);
}

void
dvid::VolumeMetadata::validate_() const
{
    EXPECT_AS(SchemaError,
              shape_.size() >= 2,
              "Shape must include the channel axis and at least one spatial "
              "axis, got ",
              format_shape(shape_));
    for (const auto& s : shape_) {
        EXPECT_AS(SchemaError,
                  s > 0,
                  "Shape must be positive, got ",
                  format_shape(shape_));
    }

    EXPECT_AS(SchemaError,
              dtype_ < DvidDataTypeCount,
              "Invalid data type: ",
              dtype_);

    EXPECT_AS(SchemaError,
              axis_labels_.size() == shape_.size(),
              "Axis labels '",
              axis_labels_,
              "' do not match shape ",
              format_shape(shape_));
    EXPECT_AS(SchemaError,
              axis_labels_.front() == 'c',
              "Channel axis must be first, got '",
              axis_labels_,
              "'");
    for (size_t i = 0; i < axis_labels_.size(); ++i) {
        const auto label = axis_labels_[i];
        EXPECT_AS(SchemaError,
                  valid_axis_labels.find(label) != std::string_view::npos,
                  "Invalid axis label '",
                  label,
                  "'");
        EXPECT_AS(SchemaError,
                  axis_labels_.find(label) == i,
                  "Duplicate axis label '",
                  label,
                  "'");
    }

    EXPECT_AS(SchemaError,
              resolution_.size() == shape_.size() - 1,
              "Expected ",
              shape_.size() - 1,
              " resolution values, got ",
              resolution_.size());
    for (const auto& r : resolution_) {
        EXPECT_AS(SchemaError,
                  std::isfinite(r) && r > 0,
                  "Resolution must be positive, got ",
                  r);
    }

    EXPECT_AS(SchemaError,
              channel_labels_.size() == shape_.front(),
              "Expected ",
              shape_.front(),
              " channel labels, got ",
              channel_labels_.size());
}
