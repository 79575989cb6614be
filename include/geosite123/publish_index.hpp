#pragma once

// publish_index - the JSON index of available lists:
//
//    {
//      "apple": "https://geo.example.com/geosite/apple",
//      ...
//    }
//
// with keys sorted.  published_index keeps the one built from the
// current archive, rebuilding it when the fingerprint changes, and,
// if it has an index_path, writes it there (PATH.tmp, then rename).

#include "geosite123/source_cache.hpp"
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace geosite123{

// URLs are geosite_base + "/" + name, with any trailing slashes on
// geosite_base removed first.
std::string build_index(const std::vector<std::string>& names, const std::string& geosite_base);

// Throws if the file can't be written.
void save_index(const std::string& path, const std::string& body);

class published_index{
public:
    // An empty base_url disables the index: refresh() does nothing.
    published_index(std::string base_url, std::string index_path);

    bool enabled() const { return !base_url_.empty(); }
    // Returns true if the index was rebuilt.  Throws if the archive
    // can't be listed or the file can't be saved; in the latter case
    // the in-memory index has already been updated.
    bool refresh(const source_snapshot& snap, const std::string& data_prefix);
    bool get(std::string* body) const;
    std::string fingerprint() const;

    const std::string& base_url() const { return base_url_; }
    const std::string& index_path() const { return index_path_; }
private:
    const std::string base_url_;
    const std::string index_path_;
    mutable std::shared_mutex mtx;
    std::string body_;
    std::string fingerprint_;
    std::mutex refresh_mtx;
};

} // namespace geosite123
