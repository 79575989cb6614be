#include "geosite123/result_cache.hpp"
#include <geocore/diag.hpp>
#include <exception>
#include <ostream>

using namespace geocore;

static auto _results = diag_name("results");

namespace geosite123{

std::string result_key::str() const{
    std::string ret = dialect_name(dialect);
    ret += ":";
    ret += name;
    if(!filter.empty()){
        ret += "@";
        ret += filter;
    }
    return ret;
}

size_t result_key_hash::operator()(const result_key& k) const{
    return std::hash<std::string>()(k.str());
}

std::ostream& operator<<(std::ostream& os, const result_cache_stats& s){
    return os << "hits: " << s.hits
              << " misses: " << s.misses
              << " stale: " << s.stale
              << " coalesced: " << s.coalesced
              << " computes: " << s.computes
              << " sweeps: " << s.sweeps
              << " swept: " << s.swept
              << " size: " << s.size;
}

result_cache::find_result
result_cache::find(const result_key& k, const std::string& fingerprint, std::string* out) const /*private*/{
    std::shared_lock<std::shared_mutex> lk(mtx);
    auto it = entries.find(k);
    if(it == entries.end())
        return find_result::absent;
    if(it->second.expired())
        return find_result::expired;
    if(it->second.fingerprint != fingerprint)
        return find_result::stale;
    *out = it->second.text;
    return find_result::hit;
}

bool result_cache::lookup(const result_key& k, const std::string& fingerprint, std::string* out){
    switch(find(k, fingerprint, out)){
    case find_result::hit:
        hits_++;
        DIAG(_results, "hit " << k.str() << " fp=" << fingerprint);
        return true;
    case find_result::stale:
        stale_++;
        DIAG(_results, "stale " << k.str() << " fp=" << fingerprint);
        break;
    case find_result::expired:
    case find_result::absent:
        break;
    }
    misses_++;
    return false;
}

void result_cache::store(const result_key& k, const std::string& fingerprint, std::string text){
    std::unique_lock<std::shared_mutex> lk(mtx);
    entries[k] = expiring<entry>(ttl_, entry{std::move(text), fingerprint});
}

std::string result_cache::get_or_compute(const result_key& k, const std::string& fingerprint,
                                         const std::function<std::string()>& compute){
    std::string text;
    if(lookup(k, fingerprint, &text))
        return text;

    auto ifkey = k.str() + '\n' + fingerprint;
    std::promise<std::string> prom;
    std::shared_future<std::string> fut;
    bool leader = false;
    {
        std::lock_guard<std::mutex> lk(inflight_mtx);
        auto it = inflight.find(ifkey);
        if(it != inflight.end()){
            fut = it->second;
            coalesced_++;
        }else{
            fut = prom.get_future().share();
            inflight.emplace(ifkey, fut);
            leader = true;
        }
    }
    if(!leader){
        DIAG(_results, "waiting for in-flight " << k.str());
        return fut.get();
    }

    try{
        // A previous leader may have stored it after our lookup.
        if(find(k, fingerprint, &text) != find_result::hit){
            computes_++;
            text = compute();
            store(k, fingerprint, text);
            DIAG(_results, "stored " << k.str() << " fp=" << fingerprint << " " << text.size() << " bytes");
        }
        prom.set_value(text);
    }catch(...){
        // Handed to every waiter, and rethrown below.
        prom.set_exception(std::current_exception());
    }
    {
        std::lock_guard<std::mutex> lk(inflight_mtx);
        inflight.erase(ifkey);
    }
    return fut.get();
}

size_t result_cache::sweep(clk_t::time_point asifnow){
    size_t n = 0;
    {
        std::unique_lock<std::shared_mutex> lk(mtx);
        for(auto it = entries.begin(); it != entries.end(); ){
            if(it->second.expired(asifnow)){
                it = entries.erase(it);
                n++;
            }else{
                ++it;
            }
        }
    }
    sweeps_++;
    swept_ += n;
    DIAG(_results, "sweep removed " << n);
    return n;
}

result_cache_stats result_cache::stats() const{
    size_t sz;
    {
        std::shared_lock<std::shared_mutex> lk(mtx);
        sz = entries.size();
    }
    return {hits_.load(), misses_.load(), stale_.load(), coalesced_.load(),
            computes_.load(), sweeps_.load(), swept_.load(), sz};
}

} // namespace geosite123
