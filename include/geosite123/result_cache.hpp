#pragma once

// result_cache - rendered rulesets, keyed by (name, filter, dialect).
//
// Every entry remembers the fingerprint of the archive it was
// rendered from, and lookup() only returns it if that is still the
// live fingerprint.  Entries also expire after the ttl.  Expired and
// superseded entries are logically gone as soon as they stop
// matching; sweep() reclaims the memory of the expired ones.
//
// get_or_compute() is lookup-or-render with single-flight: while one
// caller is rendering a (key, fingerprint), others asking for the
// same thing wait for its result (or its exception) instead of
// rendering it again.  A failed render stores nothing.

#include "geosite123/render.hpp"
#include <geocore/expiring.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace geosite123{

struct result_key{
    std::string name;
    std::string filter;
    geosite123::dialect dialect;

    // dialect:name@filter, or dialect:name when there's no filter
    std::string str() const;
    bool operator==(const result_key& rhs) const{
        return name == rhs.name && filter == rhs.filter && dialect == rhs.dialect;
    }
};

struct result_key_hash{
    size_t operator()(const result_key& k) const;
};

struct result_cache_stats{
    uint64_t hits;
    uint64_t misses;
    uint64_t stale;        // misses because the fingerprint moved on
    uint64_t coalesced;    // get_or_compute callers that waited for another's render
    uint64_t computes;
    uint64_t sweeps;
    uint64_t swept;
    size_t size;
};

std::ostream& operator<<(std::ostream& os, const result_cache_stats& s);

class result_cache{
public:
    using clk_t = std::chrono::system_clock;
    explicit result_cache(clk_t::duration ttl) : ttl_(ttl){}

    bool lookup(const result_key& k, const std::string& fingerprint, std::string* out);
    void store(const result_key& k, const std::string& fingerprint, std::string text);
    std::string get_or_compute(const result_key& k, const std::string& fingerprint,
                               const std::function<std::string()>& compute);
    // Returns the number of entries removed.
    size_t sweep(clk_t::time_point asifnow = clk_t::now());

    result_cache_stats stats() const;
    clk_t::duration ttl() const { return ttl_; }

private:
    struct entry{
        std::string text;
        std::string fingerprint;
    };
    const clk_t::duration ttl_;
    mutable std::shared_mutex mtx;
    std::unordered_map<result_key, geocore::expiring<entry>, result_key_hash> entries;

    std::mutex inflight_mtx;
    std::unordered_map<std::string, std::shared_future<std::string>> inflight;

    std::atomic<uint64_t> hits_{0}, misses_{0}, stale_{0}, coalesced_{0}, computes_{0}, sweeps_{0}, swept_{0};

    enum class find_result{ hit, absent, expired, stale };
    find_result find(const result_key& k, const std::string& fingerprint, std::string* out) const;
};

} // namespace geosite123
