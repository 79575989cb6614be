#pragma once

// fetcher - keeps the source_cache fresh.
//
// ensure_fresh() is called on every request.  While the cached
// archive is within its ttl it is returned without any network
// traffic.  Otherwise one caller (the others wait on refresh_mtx and
// then find the cache fresh) asks the transport for the upstream
// fingerprint.  If it matches, the cache is touch()ed; if not, the
// archive is downloaded and set().  When the check fails and there
// is anything in the cache, the stale archive is served and the
// failure is complained about.
//
// force_refresh() does the same, except that it always checks upstream.  It
// is meant for the background refresh loop.

#include "geosite123/source_cache.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace geosite123{

struct download_result{
    std::string bytes;
    std::string fingerprint;   // may be empty
};

// archive_transport - how the fetcher talks to upstream.
class archive_transport{
public:
    virtual ~archive_transport() = default;
    // The upstream's current fingerprint, or "" if it doesn't
    // advertise one.  Throws transport_error.
    virtual std::string check_fingerprint() = 0;
    // Throws transport_error.
    virtual download_result download() = 0;
};

// Strip a W/ prefix and double quotes from an ETag.
std::string normalize_etag(const std::string& etag);
// "crc32-xxxxxxxx-SIZE", for upstreams that don't send ETags.
std::string content_fingerprint(const std::string& bytes);

struct fetcher_stats{
    std::atomic<uint64_t> checks{0};
    std::atomic<uint64_t> check_failures{0};
    std::atomic<uint64_t> stale_serves{0};
    std::atomic<uint64_t> unchanged{0};
    std::atomic<uint64_t> downloads{0};
};

class fetcher{
public:
    fetcher(source_cache& cache, std::shared_ptr<archive_transport> transport) :
        cache_(cache), transport_(std::move(transport)){}

    source_snapshot ensure_fresh();
    source_snapshot force_refresh();

    const fetcher_stats& stats() const { return stats_; }
private:
    source_cache& cache_;
    std::shared_ptr<archive_transport> transport_;
    std::mutex refresh_mtx;
    fetcher_stats stats_;
    source_snapshot refresh(); // called with refresh_mtx held
};

} // namespace geosite123
