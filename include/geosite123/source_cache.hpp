#pragma once

// source_cache - the current upstream archive, its fingerprint and
// when it was fetched.  Pure storage: it never touches the network.
//
// get() only returns a snapshot that is younger than the ttl.
// get_any() returns whatever is there.  set() validates the bytes
// as a zip archive before replacing anything, so a corrupt download
// leaves the cache as it was.
//
// With a persistence path (set_persist_path or load_from_file), every
// set() and touch() also rewrites the snapshot file: PATH.tmp is
// written and then renamed over PATH.  A failure to persist is
// complained about and otherwise ignored; the in-memory state is
// authoritative.
//
// The file is a sequence of netstrings:
//    "geosite123-source-v1", fingerprint, fetch time (ns since epoch), payload

#include "geosite123/zip_archive.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

namespace geosite123{

struct source_snapshot{
    std::shared_ptr<const zip_archive> archive;
    std::string fingerprint;
    std::chrono::system_clock::time_point fetched_at;
    explicit operator bool() const { return bool(archive); }
};

class source_cache{
public:
    explicit source_cache(std::chrono::system_clock::duration ttl) : ttl_(ttl){}

    bool get(source_snapshot* out) const;
    bool get_any(source_snapshot* out) const;
    // Throws format_error if bytes isn't a zip archive.
    void set(std::string bytes, const std::string& fingerprint);
    // Restart the ttl clock without changing the contents.
    void touch();

    // Returns false if path doesn't exist.  Throws if it exists but
    // can't be read or decoded.  Either way, path becomes the
    // persistence path.
    bool load_from_file(const std::string& path);
    void set_persist_path(const std::string& path);

    std::chrono::system_clock::duration ttl() const { return ttl_; }

private:
    const std::chrono::system_clock::duration ttl_;
    mutable std::shared_mutex mtx;
    source_snapshot snap;
    // Serializes set/touch/load so that the file on disk always
    // reflects the last update.  Never held by readers.
    std::mutex update_mtx;
    std::string persist_path;
    void persist(const source_snapshot& s, const std::string& path);
};

} // namespace geosite123
