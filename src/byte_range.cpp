#include "byte_range.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace flume {

namespace {

std::string_view trim(std::string_view s) noexcept
{
    while(!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while(!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

// Only plain non-negative decimals are accepted, no sign and no overflow.
bool parse_offset(std::string_view s, int64_t& n) noexcept
{
    if(s.empty()) {
        return false;
    }
    n = 0;
    for(const char c : s) {
        if(c < '0' || c > '9') {
            return false;
        }
        if(n > (std::numeric_limits<int64_t>::max() - (c - '0')) / 10) {
            return false;
        }
        n = n * 10 + (c - '0');
    }
    return true;
}

} // namespace

range_kind parse_range_header(std::string_view header, const int64_t size,
        byte_range& range)
{
    header = trim(header);
    if(header.empty()) {
        return range_kind::whole;
    }

    constexpr std::string_view unit = "bytes=";
    if(header.size() < unit.size()
            || !std::equal(unit.begin(), unit.end(), header.begin(), [](char a, char b) {
                   return a == std::tolower(static_cast<unsigned char>(b));
               })) {
        return range_kind::unsatisfiable;
    }
    const std::string_view spec = trim(header.substr(unit.size()));
    if(spec.find(',') != std::string_view::npos) {
        return range_kind::whole;
    }

    const auto dash = spec.find('-');
    if(dash == std::string_view::npos) {
        return range_kind::unsatisfiable;
    }
    const std::string_view first_str = trim(spec.substr(0, dash));
    const std::string_view last_str = trim(spec.substr(dash + 1));

    int64_t first = 0;
    int64_t last = size - 1;
    if(first_str.empty()) {
        // suffix: the last n bytes
        int64_t n = 0;
        if(!parse_offset(last_str, n) || n == 0) {
            return range_kind::unsatisfiable;
        }
        first = std::max<int64_t>(0, size - n);
    } else {
        if(!parse_offset(first_str, first)) {
            return range_kind::unsatisfiable;
        }
        if(!last_str.empty()) {
            if(!parse_offset(last_str, last)) {
                return range_kind::unsatisfiable;
            }
            if(last < first) {
                return range_kind::unsatisfiable;
            }
            last = std::min(last, size - 1);
        }
    }

    if(first >= size || first > last) {
        return range_kind::unsatisfiable;
    }
    range.first = first;
    range.last = last;
    return range_kind::partial;
}

std::string content_range(const byte_range& range, const int64_t size)
{
    return "bytes " + std::to_string(range.first) + '-' + std::to_string(range.last)
            + '/' + std::to_string(size);
}

std::string unsatisfied_content_range(const int64_t size)
{
    return "bytes */" + std::to_string(size);
}

} // namespace flume
