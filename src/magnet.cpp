#include "magnet.hpp"
#include "session_error.hpp"
#include "string_utils.hpp"

namespace flume {

static bool decode_hex_hash(const std::string& s, sha1_hash& hash)
{
    if(s.size() != 40) {
        return false;
    }
    for(size_t i = 0; i < hash.size(); ++i) {
        const int hi = util::hex_digit_value(s[2 * i]);
        const int lo = util::hex_digit_value(s[2 * i + 1]);
        if(hi == -1 || lo == -1) {
            return false;
        }
        hash[i] = uint8_t(hi * 16 + lo);
    }
    return true;
}

/** RFC 4648 base32, as used by some older magnet links. */
static bool decode_base32_hash(const std::string& s, sha1_hash& hash)
{
    if(s.size() != 32) {
        return false;
    }
    uint64_t buffer = 0;
    int num_bits = 0;
    size_t out = 0;
    for(const char c : s) {
        int value = -1;
        if(c >= 'A' && c <= 'Z') {
            value = c - 'A';
        } else if(c >= 'a' && c <= 'z') {
            value = c - 'a';
        } else if(c >= '2' && c <= '7') {
            value = c - '2' + 26;
        }
        if(value == -1) {
            return false;
        }
        buffer = (buffer << 5) | uint64_t(value);
        num_bits += 5;
        if(num_bits >= 8) {
            num_bits -= 8;
            hash[out++] = uint8_t((buffer >> num_bits) & 0xff);
        }
    }
    return out == hash.size();
}

magnet_link parse_magnet(const std::string& uri, error_code& error)
{
    error.clear();
    magnet_link link;

    static const std::string prefix = "magnet:?";
    if(!util::istarts_with(uri, prefix)) {
        error = make_error_code(session_errc::invalid_magnet);
        return {};
    }

    bool has_info_hash = false;
    size_t pos = prefix.size();
    while(pos <= uri.size()) {
        size_t end = uri.find('&', pos);
        if(end == std::string::npos) {
            end = uri.size();
        }
        const std::string param = uri.substr(pos, end - pos);
        pos = end + 1;

        const auto eq = param.find('=');
        if(eq == std::string::npos) {
            continue;
        }
        const std::string key = param.substr(0, eq);
        const std::string value = util::url_decode(param.substr(eq + 1), true);

        if(key == "xt") {
            static const std::string btih = "urn:btih:";
            if(!util::istarts_with(value, btih)) {
                continue;
            }
            const auto hash = value.substr(btih.size());
            if(decode_hex_hash(hash, link.info_hash)
                    || decode_base32_hash(hash, link.info_hash)) {
                has_info_hash = true;
            } else {
                error = make_error_code(session_errc::invalid_magnet);
                return {};
            }
        } else if(key == "dn") {
            link.display_name = value;
        } else if(key == "tr" || util::starts_with(key, "tr.")) {
            link.trackers.push_back(value);
        } else if(key == "x.pe") {
            link.peers.push_back(value);
        }
    }

    if(!has_info_hash) {
        error = make_error_code(session_errc::invalid_magnet);
        return {};
    }
    return link;
}

} // namespace flume
