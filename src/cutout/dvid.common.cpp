#include "macros.hh"
#include "dvid.common.hh"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

std::string
dvid::trim(std::string_view s)
{
    if (s.empty()) {
        return {};
    }

    // trim left
    std::string trimmed(s);
    trimmed.erase(trimmed.begin(),
                  std::find_if(trimmed.begin(), trimmed.end(), [](char c) {
                      return !std::isspace(static_cast<unsigned char>(c));
                  }));

    // trim right
    trimmed.erase(std::find_if(trimmed.rbegin(),
                               trimmed.rend(),
                               [](char c) {
                                   return !std::isspace(
                                     static_cast<unsigned char>(c));
                               })
                    .base(),
                  trimmed.end());

    return trimmed;
}

bool
dvid::is_empty_string(std::string_view s, std::string_view err_on_empty)
{
    auto trimmed = trim(s);
    if (trimmed.empty()) {
        LOG_ERROR(err_on_empty);
        return true;
    }
    return false;
}

size_t
dvid::bytes_of_type(DvidDataType data_type)
{
    switch (data_type) {
        case DvidDataType_int8:
        case DvidDataType_uint8:
            return 1;
        case DvidDataType_int16:
        case DvidDataType_uint16:
            return 2;
        case DvidDataType_int32:
        case DvidDataType_uint32:
        case DvidDataType_float32:
            return 4;
        case DvidDataType_int64:
        case DvidDataType_uint64:
        case DvidDataType_float64:
            return 8;
        default:
            throw std::invalid_argument("Invalid data type: " +
                                        std::to_string(data_type));
    }
}

const char*
dvid::data_type_to_string(DvidDataType data_type)
{
    switch (data_type) {
        case DvidDataType_uint8:
            return "uint8";
        case DvidDataType_uint16:
            return "uint16";
        case DvidDataType_uint32:
            return "uint32";
        case DvidDataType_uint64:
            return "uint64";
        case DvidDataType_int8:
            return "int8";
        case DvidDataType_int16:
            return "int16";
        case DvidDataType_int32:
            return "int32";
        case DvidDataType_int64:
            return "int64";
        case DvidDataType_float32:
            return "float32";
        case DvidDataType_float64:
            return "float64";
        default:
            throw std::invalid_argument("Invalid data type: " +
                                        std::to_string(data_type));
    }
}

std::optional<DvidDataType>
dvid::data_type_from_string(std::string_view name)
{
    for (auto i = 0; i < DvidDataTypeCount; ++i) {
        const auto data_type = static_cast<DvidDataType>(i);
        if (name == data_type_to_string(data_type)) {
            return data_type;
        }
    }

    return std::nullopt;
}

std::string
dvid::join_coordinates(const std::vector<int64_t>& coords, char separator)
{
    std::string joined;
    for (size_t i = 0; i < coords.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += std::to_string(coords[i]);
    }
    return joined;
}

std::optional<std::vector<int64_t>>
dvid::parse_coordinates(std::string_view text)
{
    if (text.empty()) {
        return std::nullopt;
    }

    std::vector<int64_t> coords;
    size_t begin = 0;
    while (begin <= text.size()) {
        size_t end = text.find_first_of("_,", begin);
        if (end == std::string_view::npos) {
            end = text.size();
        }

        const auto token = text.substr(begin, end - begin);
        int64_t value = 0;
        const auto [ptr, ec] =
          std::from_chars(token.data(), token.data() + token.size(), value);
        if (token.empty() || ec != std::errc() ||
            ptr != token.data() + token.size()) {
            return std::nullopt;
        }
        coords.push_back(value);

        begin = end + 1;
    }

    return coords;
}

std::vector<std::string>
dvid::split_path(std::string_view uri)
{
    if (const auto q = uri.find('?'); q != std::string_view::npos) {
        uri = uri.substr(0, q);
    }

    std::vector<std::string> segments;
    size_t begin = 0;
    while (begin <= uri.size()) {
        size_t end = uri.find('/', begin);
        if (end == std::string_view::npos) {
            end = uri.size();
        }
        segments.emplace_back(uri.substr(begin, end - begin));
        begin = end + 1;
    }

    while (!segments.empty() && segments.front().empty()) {
        segments.erase(segments.begin());
    }
    while (!segments.empty() && segments.back().empty()) {
        segments.pop_back();
    }

    return segments;
}

std::string
dvid::url_encode(std::string_view s)
{
    static constexpr char hex[] = "0123456789ABCDEF";

    std::string encoded;
    for (const char c : s) {
        const auto u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded += c;
        } else {
            encoded += '%';
            encoded += hex[u >> 4];
            encoded += hex[u & 0xF];
        }
    }
    return encoded;
}

std::string
dvid::format_query(const std::map<std::string, std::string>& query_args)
{
    std::string query;
    for (const auto& [key, value] : query_args) {
        query += query.empty() ? '?' : '&';
        query += url_encode(key) + "=" + url_encode(value);
    }
    return query;
}
