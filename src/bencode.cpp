#include "bencode.hpp"

#include <cctype>

namespace flume {

namespace {

// Deeper nesting than this is never found in torrents and would only serve to
// exhaust the stack.
constexpr int max_depth = 64;

} // namespace

/**
 * Recursive descent decoder over a borrowed buffer. Offsets are recorded for every
 * element so that callers can retrieve the raw encoding of a sub-element.
 */
class bdecoder
{
    std::string_view source_;
    size_t pos_ = 0;
    int depth_ = 0;

public:
    explicit bdecoder(std::string_view source) : source_(source) {}

    size_t position() const noexcept { return pos_; }

    bvalue decode(error_code& error)
    {
        bvalue value;
        if(pos_ >= source_.size()) {
            error = bencode_errc::unexpected_end;
            return value;
        }
        if(++depth_ > max_depth) {
            error = bencode_errc::nesting_too_deep;
            return value;
        }
        value.source_begin_ = pos_;
        const char c = source_[pos_];
        if(c == 'i') {
            ++pos_;
            value.type_ = btype::number;
            value.number_ = decode_number('e', error);
        } else if(std::isdigit(static_cast<unsigned char>(c))) {
            value.type_ = btype::string;
            value.string_ = decode_string(error);
        } else if(c == 'l') {
            ++pos_;
            value.type_ = btype::list;
            while(!error && !at_container_end(error)) {
                value.list_.emplace_back(decode(error));
            }
        } else if(c == 'd') {
            ++pos_;
            value.type_ = btype::map;
            while(!error && !at_container_end(error)) {
                if(!std::isdigit(static_cast<unsigned char>(source_[pos_]))) {
                    error = bencode_errc::invalid_map_key;
                    break;
                }
                auto key = decode_string(error);
                if(error) {
                    break;
                }
                auto element = decode(error);
                value.map_.emplace(std::move(key), std::move(element));
            }
        } else {
            error = bencode_errc::invalid_token;
        }
        value.source_end_ = pos_;
        --depth_;
        return value;
    }

private:
    /** Consumes the terminating 'e' if it's next. */
    bool at_container_end(error_code& error)
    {
        if(pos_ >= source_.size()) {
            error = bencode_errc::unexpected_end;
            return true;
        }
        if(source_[pos_] == 'e') {
            ++pos_;
            return true;
        }
        return false;
    }

    int64_t decode_number(const char terminator, error_code& error)
    {
        const size_t begin = pos_;
        bool is_negative = false;
        if(pos_ < source_.size() && source_[pos_] == '-') {
            is_negative = true;
            ++pos_;
        }
        int64_t n = 0;
        int num_digits = 0;
        while(pos_ < source_.size()
                && std::isdigit(static_cast<unsigned char>(source_[pos_]))) {
            if(++num_digits > 18) {
                error = bencode_errc::invalid_number;
                return 0;
            }
            n = n * 10 + (source_[pos_] - '0');
            ++pos_;
        }
        if(pos_ >= source_.size()) {
            error = bencode_errc::unexpected_end;
            return 0;
        }
        if(num_digits == 0 || source_[pos_] != terminator) {
            error = bencode_errc::invalid_number;
            return 0;
        }
        // leading zeros and negative zero are not allowed
        if((num_digits > 1 && source_[begin + is_negative] == '0')
                || (is_negative && n == 0)) {
            error = bencode_errc::invalid_number;
            return 0;
        }
        ++pos_;
        return is_negative ? -n : n;
    }

    std::string decode_string(error_code& error)
    {
        const int64_t length = decode_number(':', error);
        if(error) {
            if(error == bencode_errc::invalid_number) {
                error = bencode_errc::invalid_string_length;
            }
            return {};
        }
        if(length < 0) {
            error = bencode_errc::invalid_string_length;
            return {};
        }
        if(uint64_t(length) > source_.size() - pos_) {
            error = bencode_errc::unexpected_end;
            return {};
        }
        std::string s(source_.substr(pos_, length));
        pos_ += length;
        return s;
    }
};

bvalue bdecode(std::string_view encoded, error_code& error)
{
    size_t num_consumed = 0;
    auto value = bdecode_prefix(encoded, num_consumed, error);
    if(!error && num_consumed != encoded.size()) {
        error = bencode_errc::trailing_data;
        return {};
    }
    return value;
}

bvalue bdecode_prefix(std::string_view encoded, size_t& num_consumed, error_code& error)
{
    error.clear();
    bdecoder decoder(encoded);
    auto value = decoder.decode(error);
    if(error) {
        num_consumed = 0;
        return {};
    }
    num_consumed = decoder.position();
    return value;
}

namespace {

void encode(const bvalue& value, std::string& out)
{
    switch(value.type()) {
    case btype::number:
        out += 'i';
        out += std::to_string(value.number());
        out += 'e';
        break;
    case btype::string:
        out += std::to_string(value.string().size());
        out += ':';
        out += value.string();
        break;
    case btype::list:
        out += 'l';
        for(const auto& e : value.list()) {
            encode(e, out);
        }
        out += 'e';
        break;
    case btype::map:
        // std::map keeps keys in lexicographical order, as bencode requires
        out += 'd';
        for(const auto& e : value.map()) {
            out += std::to_string(e.first.size());
            out += ':';
            out += e.first;
            encode(e.second, out);
        }
        out += 'e';
        break;
    }
}

} // namespace

std::string bencode(const bvalue& value)
{
    std::string out;
    encode(value, out);
    return out;
}

const bvalue* bvalue::find(const std::string& key) const
{
    if(!is_map()) {
        return nullptr;
    }
    auto it = map_.find(key);
    return it == map_.end() ? nullptr : &it->second;
}

const bvalue* bvalue::find_number(const std::string& key) const
{
    auto v = find(key);
    return v && v->is_number() ? v : nullptr;
}

const bvalue* bvalue::find_string(const std::string& key) const
{
    auto v = find(key);
    return v && v->is_string() ? v : nullptr;
}

const bvalue* bvalue::find_list(const std::string& key) const
{
    auto v = find(key);
    return v && v->is_list() ? v : nullptr;
}

const bvalue* bvalue::find_map(const std::string& key) const
{
    auto v = find(key);
    return v && v->is_map() ? v : nullptr;
}

std::string bencode_error_category::message(int env) const
{
    switch(static_cast<bencode_errc>(env)) {
    case bencode_errc::unexpected_end: return "Unexpected end of bencoded data";
    case bencode_errc::invalid_token: return "Invalid bencode token";
    case bencode_errc::invalid_number: return "Invalid bencoded number";
    case bencode_errc::invalid_string_length: return "Invalid bencoded string length";
    case bencode_errc::invalid_map_key: return "Bencoded map key is not a string";
    case bencode_errc::nesting_too_deep: return "Bencoded data is nested too deep";
    case bencode_errc::trailing_data: return "Trailing data after bencoded element";
    default: return "Unknown bencode error";
    }
}

const bencode_error_category& bencode_category()
{
    static bencode_error_category instance;
    return instance;
}

error_code make_error_code(bencode_errc e)
{
    return error_code(static_cast<int>(e), bencode_category());
}

error_condition make_error_condition(bencode_errc e)
{
    return error_condition(static_cast<int>(e), bencode_category());
}

} // namespace flume
