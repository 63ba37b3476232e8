#ifndef FLUME_STRING_UTILS_HEADER
#define FLUME_STRING_UTILS_HEADER

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <iterator>
#include <memory>
#include <string>

namespace flume {
namespace util {

template <typename String>
inline void trim(String& s)
{
    s.erase(std::begin(s), std::find_if(std::begin(s), std::end(s), [](const auto& c) {
        return !std::isspace(static_cast<unsigned char>(c));
    }));
    s.erase(std::find_if(std::rbegin(s), std::rend(s),
                    [](const auto& c) { return !std::isspace(static_cast<unsigned char>(c)); })
                    .base(),
            std::end(s));
}

template <typename String>
inline void to_lower(String& s)
{
    std::transform(std::begin(s), std::end(s), std::begin(s),
            [](const auto& c) { return std::tolower(static_cast<unsigned char>(c)); });
}

inline bool starts_with(const std::string& s, const std::string& prefix) noexcept
{
    return s.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), s.begin());
}

/** Same as `starts_with` but ASCII letters are compared case-insensitively. */
inline bool istarts_with(const std::string& s, const std::string& prefix) noexcept
{
    return s.size() >= prefix.size()
            && std::equal(prefix.begin(), prefix.end(), s.begin(), [](char a, char b) {
                   return std::tolower(static_cast<unsigned char>(a))
                           == std::tolower(static_cast<unsigned char>(b));
               });
}

template <typename Bytes>
std::string to_hex(const Bytes& data)
{
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string hex_str;
    const size_t size = std::end(data) - std::begin(data);
    hex_str.reserve(size * 2);
    for(size_t i = 0; i < size; ++i) {
        const uint8_t byte = data[i];
        hex_str += hex_chars[byte >> 4];
        hex_str += hex_chars[byte & 0xf];
    }
    return hex_str;
}

/** Returns the value of a single hex digit or -1 if `c` is not one. */
inline int hex_digit_value(const char c) noexcept
{
    if(c >= '0' && c <= '9') {
        return c - '0';
    } else if(c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    } else if(c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

template <typename... Args>
std::string format(const char* format_str, Args&&... args)
{
    const int length = std::snprintf(nullptr, 0, format_str, args...);
    if(length <= 0) {
        return {};
    }
    std::unique_ptr<char[]> buffer(new char[length + 1]);
    std::snprintf(buffer.get(), length + 1, format_str, args...);
    return std::string(buffer.get(), buffer.get() + length);
}

/**
 * Encodes a given string using the standard URL encoding protocol, also known as
 * percent-encoding protocol as per RFC 3986.
 */
template <typename InputIt>
std::string url_encode(InputIt begin, InputIt end)
{
    static constexpr char hex_chars[] = "0123456789ABCDEF";
    std::string encoded;
    while(begin != end) {
        const auto c = static_cast<unsigned char>(*begin++);
        if(std::isalnum(c) || c == '.' || c == '-' || c == '_' || c == '~') {
            encoded += c;
        } else {
            encoded += '%';
            encoded += hex_chars[c >> 4];
            encoded += hex_chars[c & 0xf];
        }
    }
    return encoded;
}

template <typename Iterable>
std::string url_encode(const Iterable& iterable)
{
    return url_encode(std::begin(iterable), std::end(iterable));
}

/**
 * Decodes a percent-encoded string. When `space_plus_coded` is set, '+' is decoded
 * as a space (as in query strings). Malformed escapes are kept verbatim.
 */
inline std::string url_decode(const std::string& s, const bool space_plus_coded = false)
{
    std::string decoded;
    decoded.reserve(s.size());
    for(size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if(space_plus_coded && c == '+') {
            decoded += ' ';
        } else if(c == '%' && i + 2 < s.size() && hex_digit_value(s[i + 1]) != -1
                && hex_digit_value(s[i + 2]) != -1) {
            decoded += char(hex_digit_value(s[i + 1]) * 16 + hex_digit_value(s[i + 2]));
            i += 2;
        } else {
            decoded += c;
        }
    }
    return decoded;
}

/**
 * Formats a byte count the way humans read it, using decimal (SI) units, e.g.
 * 999 -> "999 B", 1234567 -> "1.2 MB", 82854982 -> "83 MB".
 */
inline std::string to_human_readable_bytes(const int64_t n)
{
    static constexpr const char* units[] = {"B", "kB", "MB", "GB", "TB", "PB", "EB"};
    if(n < 10) {
        return format("%d B", int(n));
    }
    const int exp = std::min<int>(
            std::floor(std::log(double(n)) / std::log(1000.0)), std::size(units) - 1);
    const double value = std::floor(double(n) / std::pow(1000.0, exp) * 10 + 0.5) / 10;
    return format(value < 10 ? "%.1f %s" : "%.0f %s", value, units[exp]);
}

} // namespace util
} // namespace flume

#endif // FLUME_STRING_UTILS_HEADER
