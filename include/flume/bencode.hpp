#ifndef FLUME_BENCODE_HEADER
#define FLUME_BENCODE_HEADER

#include "error_code.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <map>

namespace flume {

/** All the possible bencoded types. */
enum class btype
{
    // Encoded format: i<number>e, e.g.: i3244e
    number,
    // Encoded format: <len(str)>:<str>, e.g.: 6:string
    string,
    // Encoded format: l<elements>e, e.g.: l4:abcdi53452eli234ei234eee
    list,
    // Encoded format: d<<(str)key><value> pairs>e, and keys must be in lexicographical
    // order, e.g.: d4:eggsi324e4:spami432ee
    map
};

/**
 * A decoded bencode element. Containers own their children.
 *
 * Decoded elements remember where in the source they were encoded so that the
 * exact bytes of e.g. a metainfo's info dictionary can be hashed.
 */
class bvalue
{
public:
    using list_type = std::vector<bvalue>;
    using map_type = std::map<std::string, bvalue>;

private:
    btype type_ = btype::string;
    int64_t number_ = 0;
    std::string string_;
    list_type list_;
    map_type map_;

    // [source_begin_, source_end_) in the decoded buffer, or both 0 if this element
    // was not decoded.
    size_t source_begin_ = 0;
    size_t source_end_ = 0;

    friend class bdecoder;

public:
    bvalue() = default;
    bvalue(int64_t n) : type_(btype::number), number_(n) {}
    bvalue(int n) : type_(btype::number), number_(n) {}
    bvalue(std::string s) : type_(btype::string), string_(std::move(s)) {}
    bvalue(const char* s) : type_(btype::string), string_(s) {}
    bvalue(list_type l) : type_(btype::list), list_(std::move(l)) {}
    bvalue(map_type m) : type_(btype::map), map_(std::move(m)) {}

    btype type() const noexcept { return type_; }
    bool is_number() const noexcept { return type_ == btype::number; }
    bool is_string() const noexcept { return type_ == btype::string; }
    bool is_list() const noexcept { return type_ == btype::list; }
    bool is_map() const noexcept { return type_ == btype::map; }

    int64_t number() const noexcept { return number_; }
    const std::string& string() const noexcept { return string_; }
    const list_type& list() const noexcept { return list_; }
    const map_type& map() const noexcept { return map_; }
    map_type& map() noexcept { return map_; }

    /** Returns the element at key if this is a map and key is present, or nullptr. */
    const bvalue* find(const std::string& key) const;
    const bvalue* find_number(const std::string& key) const;
    const bvalue* find_string(const std::string& key) const;
    const bvalue* find_list(const std::string& key) const;
    const bvalue* find_map(const std::string& key) const;

    size_t source_begin() const noexcept { return source_begin_; }
    size_t source_end() const noexcept { return source_end_; }
};

enum class bencode_errc
{
    unexpected_end = 1,
    invalid_token,
    invalid_number,
    invalid_string_length,
    invalid_map_key,
    nesting_too_deep,
    trailing_data
};

struct bencode_error_category : public error_category
{
    const char* name() const noexcept override { return "bencode"; }
    std::string message(int env) const override;
};

const bencode_error_category& bencode_category();
error_code make_error_code(bencode_errc e);
error_condition make_error_condition(bencode_errc e);

/**
 * Decodes exactly one bencoded element spanning all of `encoded`. On error `error`
 * is set and an empty element is returned.
 */
bvalue bdecode(std::string_view encoded, error_code& error);

/**
 * Decodes the bencoded element at the front of `encoded` and stores the number of
 * bytes it took up in `num_consumed`. Extension messages append raw data after a
 * bencoded header, hence this variant.
 */
bvalue bdecode_prefix(std::string_view encoded, size_t& num_consumed, error_code& error);

std::string bencode(const bvalue& value);

} // namespace flume

namespace FLUME_ERROR_CODE_NS {
template <>
struct is_error_code_enum<flume::bencode_errc> : public std::true_type
{};
}

#endif // FLUME_BENCODE_HEADER
