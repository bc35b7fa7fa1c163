#pragma once

#include "dvid.types.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dvid {
/// Content type of raw cutout bodies.
constexpr std::string_view volume_mimetype = "application/octet-stream";

/// Content type of JSON bodies.
constexpr std::string_view json_mimetype = "application/json";

/// Default bound on the size of a single streamed chunk.
constexpr size_t default_stream_chunk_size = 4 << 20;

/**
 * @brief Trim whitespace from a string.
 * @param s The string to trim.
 * @return The string with leading and trailing whitespace removed.
 */
[[nodiscard]]
std::string
trim(std::string_view s);

/**
 * @brief Check if a string is empty, including whitespace.
 * @param s The string to check.
 * @param err_on_empty The message to log if the string is empty.
 * @return True if the string is empty, false otherwise.
 */
bool
is_empty_string(std::string_view s, std::string_view err_on_empty);

/**
 * @brief Get the number of bytes for a given data type.
 * @param data_type The data type.
 * @return The number of bytes for the data type.
 * @throw std::invalid_argument if the data type is not recognized.
 */
size_t
bytes_of_type(DvidDataType data_type);

/**
 * @brief Get the NumPy-style name of a data type, e.g., "uint8".
 * @throw std::invalid_argument if the data type is not recognized.
 */
const char*
data_type_to_string(DvidDataType data_type);

/**
 * @brief Parse a NumPy-style data type name.
 * @return The data type, or std::nullopt if @p name is not recognized.
 */
std::optional<DvidDataType>
data_type_from_string(std::string_view name);

/**
 * @brief Get the number of elements in an array of the given shape.
 * @details The product of an empty shape is 1.
 */
template<typename T>
size_t
product(const std::vector<T>& shape)
{
    size_t n = 1;
    for (const auto& s : shape) {
        n *= static_cast<size_t>(s);
    }
    return n;
}

/**
 * @brief Join integers with a separator, e.g., {10, 20, 30} -> "10_20_30".
 */
std::string
join_coordinates(const std::vector<int64_t>& coords, char separator = '_');

/**
 * @brief Parse a list of integers separated by '_' or ','.
 * @return The integers, or std::nullopt if any element is not an integer.
 */
std::optional<std::vector<int64_t>>
parse_coordinates(std::string_view text);

/**
 * @brief Split a URI path on '/', dropping the query string and empty leading
 * and trailing segments.
 */
std::vector<std::string>
split_path(std::string_view uri);

/**
 * @brief Percent-encode a string for use in a URI query.
 */
std::string
url_encode(std::string_view s);

/**
 * @brief Format query arguments as "?k1=v1&k2=v2", or "" if there are none.
 */
std::string
format_query(const std::map<std::string, std::string>& query_args);
} // namespace dvid
