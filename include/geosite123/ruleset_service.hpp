#pragma once

// ruleset_service - everything the http handler asks for, in terms
// of the caches, the fetcher and the published index.
//
//   render_ruleset(name, filter, dialect)
//       ensure the archive is fresh, then return the cached rendering
//       for that fingerprint, or parse and render it (once, no matter
//       how many requests are waiting for it).
//   misc_list(category, name)
//       a hand-maintained list from misc_base_url, cached for misc_ttl.
//   index_body(request_base)
//       the index file if there is one, else the published index,
//       else an index built for this request's base url.
//   refresh_source(), refresh_index(), sweep()
//       bodies of the background loops.

#include "geosite123/fetcher.hpp"
#include "geosite123/publish_index.hpp"
#include "geosite123/render.hpp"
#include "geosite123/result_cache.hpp"
#include <geocore/expiring.hpp>
#include <chrono>
#include <functional>
#include <string>

namespace geosite123{

// Returns the body of url.  Throws not_found_error if the server says
// 404, and transport_error for anything else that isn't a 200.
using misc_fetch_fn = std::function<std::string(const std::string& url)>;

struct service_options{
    std::string data_prefix = "domain-list-community-master/data/";
    std::string misc_base_url;
    std::chrono::system_clock::duration misc_ttl = std::chrono::seconds(1800);
    size_t misc_cache_size = 1000;
};

class ruleset_service{
public:
    ruleset_service(fetcher& f, result_cache& results, published_index& index,
                    const service_options& opts, misc_fetch_fn misc_fetch);

    std::string render_ruleset(const std::string& name, const std::string& filter, dialect d);
    std::string misc_list(const std::string& category, const std::string& name);
    // request_base is scheme://host, as the client sees it.
    std::string index_body(const std::string& request_base);

    // Check upstream regardless of the ttl, and rebuild the index if
    // the archive changed.
    void refresh_source();
    // Rebuild the index if the archive changed, without forcing a check.
    void refresh_index();
    size_t sweep();

    const service_options& options() const { return opts_; }
private:
    fetcher& fetcher_;
    result_cache& results_;
    published_index& index_;
    service_options opts_;
    misc_fetch_fn misc_fetch_;
    geocore::expiring_cache<std::string, std::string> misc_cache_;
};

} // namespace geosite123
