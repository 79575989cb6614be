#include "geosite123/fetcher.hpp"
#include "geosite123/errors.hpp"
#include <geocore/complaints.hpp>
#include <geocore/diag.hpp>
#include <geocore/strutils.hpp>
#include <zlib.h>
#include <algorithm>

using namespace geocore;

static auto _fetch = diag_name("fetch");

namespace geosite123{

std::string normalize_etag(const std::string& etag){
    str_view sv = sv_strip(etag);
    if(startswith(sv, "W/"))
        sv.remove_prefix(2);
    std::string ret;
    for(auto c : sv)
        if(c != '"')
            ret.push_back(c);
    return ret;
}

std::string content_fingerprint(const std::string& bytes){
    auto crc = crc32(0L, Z_NULL, 0);
    for(size_t off = 0; off < bytes.size(); ){
        uInt chunk = uInt(std::min<size_t>(bytes.size() - off, 1u<<30));
        crc = crc32(crc, reinterpret_cast<const Bytef*>(bytes.data() + off), chunk);
        off += chunk;
    }
    return fmt("crc32-%08lx-%zu", (unsigned long)crc, bytes.size());
}

source_snapshot fetcher::ensure_fresh(){
    source_snapshot s;
    if(cache_.get(&s))
        return s;
    std::lock_guard<std::mutex> lk(refresh_mtx);
    // Somebody else may have refreshed while we waited.
    if(cache_.get(&s))
        return s;
    return refresh();
}

source_snapshot fetcher::force_refresh(){
    std::lock_guard<std::mutex> lk(refresh_mtx);
    return refresh();
}

source_snapshot fetcher::refresh() /* private */{
    source_snapshot stale;
    bool have_stale = cache_.get_any(&stale);
    std::string token;
    stats_.checks++;
    try{
        token = transport_->check_fingerprint();
    }catch(std::exception& e){
        stats_.check_failures++;
        if(have_stale){
            stats_.stale_serves++;
            complain(LOG_WARNING, e, "fetcher: upstream check failed.  Serving cached archive %s", stale.fingerprint.c_str());
            return stale;
        }
        std::throw_with_nested(transport_error("fetcher: upstream check failed and nothing is cached"));
    }
    DIAG(_fetch, "check: " << (token.empty() ? "<none>" : token) << " cached: " << (have_stale ? stale.fingerprint : "<none>"));
    if(have_stale && !token.empty() && token == stale.fingerprint){
        stats_.unchanged++;
        cache_.touch();
        source_snapshot ret;
        cache_.get_any(&ret);
        return ret;
    }

    stats_.downloads++;
    auto d = transport_->download();
    std::string fp = !d.fingerprint.empty() ? d.fingerprint
        : !token.empty() ? token
        : content_fingerprint(d.bytes);
    DIAG(_fetch, "downloaded " << d.bytes.size() << " bytes, fingerprint " << fp);
    cache_.set(std::move(d.bytes), fp);
    if(have_stale)
        log_notice("fetcher: upstream archive changed from %s to %s", stale.fingerprint.c_str(), fp.c_str());
    else
        log_notice("fetcher: upstream archive %s", fp.c_str());
    source_snapshot ret;
    cache_.get_any(&ret);
    return ret;
}

} // namespace geosite123
