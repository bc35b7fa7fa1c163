#pragma once

#include "axis.transform.hh"
#include "dvid.common.hh"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace dvid {
/// Labels an axis may carry. The channel axis 'c' is always first.
constexpr std::string_view valid_axis_labels = "cxyzt";

/**
 * @brief Describes a voxel volume: its shape, element type, axis labels and
 * resolution.
 * @details Shape and labels are in canonical order, channel first. Instances
 * are immutable; the with_*() methods return modified copies.
 */
class VolumeMetadata
{
  public:
    /**
     * @throw dvid::SchemaError if the fields are inconsistent, e.g., if the
     * number of labels differs from the number of dimensions.
     */
    VolumeMetadata(std::vector<size_t> shape,
                   DvidDataType dtype,
                   std::string axis_labels,
                   std::vector<double> resolution,
                   std::string resolution_unit,
                   std::vector<std::string> channel_labels = {});

    /**
     * @brief Parse DVID voxels metadata.
     * @throw dvid::SchemaError if a required field is missing or has the wrong
     * type, or if the description is inconsistent.
     */
    static VolumeMetadata parse(std::string_view json_text);
    static VolumeMetadata parse(const nlohmann::json& json);
    static VolumeMetadata parse(const std::string& json_text)
    {
        return parse(std::string_view(json_text));
    }
    static VolumeMetadata parse(const char* json_text)
    {
        return parse(std::string_view(json_text));
    }

    /**
     * @brief Create metadata with uniform resolution on every spatial axis.
     * @param shape The shape, channel first.
     * @param dtype The element type.
     * @param axis_labels The axis labels, e.g., "cxyz".
     * @param resolution_scale The resolution of every non-channel axis.
     * @param unit The resolution unit, e.g., "nanometers".
     */
    static VolumeMetadata default_metadata(std::vector<size_t> shape,
                                           DvidDataType dtype,
                                           std::string_view axis_labels,
                                           double resolution_scale,
                                           std::string_view unit);

    /// Serialize to the DVID JSON form. The inverse of parse().
    nlohmann::json serialize() const;
    std::string to_json() const;

    const std::vector<size_t>& shape() const noexcept { return shape_; }
    DvidDataType dtype() const noexcept { return dtype_; }
    const std::string& axis_labels() const noexcept { return axis_labels_; }
    const std::vector<double>& resolution() const noexcept
    {
        return resolution_;
    }
    const std::string& resolution_unit() const noexcept
    {
        return resolution_unit_;
    }
    const std::vector<std::string>& channel_labels() const noexcept
    {
        return channel_labels_;
    }

    size_t ndims() const noexcept { return shape_.size(); }
    size_t num_channels() const noexcept { return shape_.front(); }
    size_t bytes_of_volume() const;

    VolumeMetadata with_resolution(std::vector<double> resolution) const;
    VolumeMetadata with_channel_labels(std::vector<std::string> labels) const;

    /**
     * @brief Get the DVID type name used to create a volume with this
     * metadata, e.g., "grayscale8" for single-channel uint8.
     */
    std::string determine_typename() const;

    /// The mapping between this volume's canonical and wire axis orders.
    AxisOrderMapping wire_mapping() const;

    bool operator==(const VolumeMetadata&) const = default;

  private:
    std::vector<size_t> shape_;
    DvidDataType dtype_;
    std::string axis_labels_;
    std::vector<double> resolution_;
    std::string resolution_unit_;
    std::vector<std::string> channel_labels_;

    void validate_() const;
};
} // namespace dvid
