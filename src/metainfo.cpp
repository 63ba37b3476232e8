#include "metainfo.hpp"
#include "session_error.hpp"
#include "sha1_hasher.hpp"
#include "bencode.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

namespace flume {

torrent_layout metainfo::layout() const
{
    torrent_layout l;
    l.name = name;
    l.total_length = total_length;
    l.piece_length = piece_length;
    l.num_pieces = num_pieces();
    l.files = files;
    return l;
}

std::string sanitize_path(
        const std::vector<std::string>& components, const std::string& fallback)
{
    std::string path;
    for(auto component : components) {
        if(component.empty() || component == "." || component == "..") {
            continue;
        }
        std::replace(component.begin(), component.end(), '/', '_');
        std::replace(component.begin(), component.end(), '\\', '_');
        component.erase(std::remove(component.begin(), component.end(), '\0'),
                component.end());
        if(!path.empty()) {
            path += '/';
        }
        path += component;
    }
    return path.empty() ? fallback : path;
}

static void set_invalid(error_code& error)
{
    error = make_error_code(session_errc::invalid_metainfo);
}

static metainfo parse_info(const bvalue& info, std::string_view raw_info, error_code& error)
{
    metainfo m;
    m.info = std::string(raw_info);
    m.info_hash = create_sha1_digest(raw_info);

    const auto* name = info.find_string("name");
    const auto* piece_length = info.find_number("piece length");
    const auto* pieces = info.find_string("pieces");
    if(!name || !piece_length || !pieces) {
        set_invalid(error);
        return {};
    }
    if(piece_length->number() <= 0 || piece_length->number() > (1 << 26)
            || pieces->string().empty() || pieces->string().size() % 20 != 0) {
        set_invalid(error);
        return {};
    }
    m.name = sanitize_path({name->string()}, "torrent");
    m.piece_length = piece_length->number();

    const auto& hashes = pieces->string();
    m.piece_hashes.resize(hashes.size() / 20);
    for(size_t i = 0; i < m.piece_hashes.size(); ++i) {
        std::copy(hashes.begin() + i * 20, hashes.begin() + (i + 1) * 20,
                m.piece_hashes[i].begin());
    }

    if(const auto* files = info.find_list("files")) {
        // multi-file torrent: files live in a directory named after the torrent
        for(const auto& f : files->list()) {
            const auto* length = f.find_number("length");
            const auto* path = f.find_list("path");
            if(!length || !path || length->number() < 0) {
                set_invalid(error);
                return {};
            }
            std::vector<std::string> components;
            for(const auto& c : path->list()) {
                if(!c.is_string()) {
                    set_invalid(error);
                    return {};
                }
                components.push_back(c.string());
            }
            file_entry entry;
            entry.path = m.name + '/'
                    + sanitize_path(components, "file" + std::to_string(m.files.size()));
            entry.length = length->number();
            entry.offset = m.total_length;
            m.total_length += entry.length;
            m.files.push_back(std::move(entry));
        }
    } else if(const auto* length = info.find_number("length")) {
        if(length->number() < 0) {
            set_invalid(error);
            return {};
        }
        file_entry entry;
        entry.path = m.name;
        entry.length = length->number();
        entry.offset = 0;
        m.total_length = entry.length;
        m.files.push_back(std::move(entry));
    } else {
        set_invalid(error);
        return {};
    }

    // the number of piece hashes must match the total length
    const int64_t expected_pieces
            = (m.total_length + m.piece_length - 1) / m.piece_length;
    if(m.files.empty() || m.total_length == 0 || expected_pieces != m.num_pieces()) {
        set_invalid(error);
        return {};
    }
    return m;
}

metainfo parse_info_dict(std::string_view encoded, error_code& error)
{
    const auto info = bdecode(encoded, error);
    if(error) {
        return {};
    }
    if(!info.is_map()) {
        set_invalid(error);
        return {};
    }
    return parse_info(info, encoded, error);
}

metainfo parse_metainfo(std::string_view encoded, error_code& error)
{
    const auto root = bdecode(encoded, error);
    if(error) {
        return {};
    }
    const auto* info = root.find_map("info");
    if(!info) {
        set_invalid(error);
        return {};
    }
    auto m = parse_info(*info,
            encoded.substr(info->source_begin(), info->source_end() - info->source_begin()),
            error);
    if(error) {
        return {};
    }

    auto add_tracker = [&m](const std::string& url) {
        if(!url.empty()
                && std::find(m.trackers.begin(), m.trackers.end(), url) == m.trackers.end()) {
            m.trackers.push_back(url);
        }
    };
    if(const auto* tiers = root.find_list("announce-list")) {
        for(const auto& tier : tiers->list()) {
            if(!tier.is_list()) {
                continue;
            }
            for(const auto& url : tier.list()) {
                if(url.is_string()) {
                    add_tracker(url.string());
                }
            }
        }
    }
    if(const auto* announce = root.find_string("announce")) {
        add_tracker(announce->string());
    }
    return m;
}

metainfo read_metainfo_file(const std::string& path, error_code& error)
{
    error.clear();
    std::ifstream file(path, std::ios::binary);
    if(!file) {
        error = make_error_code(session_errc::file_not_found);
        return {};
    }
    const std::string contents(
            (std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return parse_metainfo(contents, error);
}

} // namespace flume
