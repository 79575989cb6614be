#pragma once
#include <chrono>
#include <mutex>
#include <unordered_map>

// expiring<T> - a T with a good_till time_point.  A default-constructed
// expiring<T> is already expired.
//
// expiring_cache<K,V> - a size-limited, thread-safe map of
// expiring<V>.  lookup() returns an expired value on a miss, and
// removes entries it finds expired.  When an insert pushes the size
// over max_size, some (essentially random) entries are evicted.

namespace geocore{
template<typename T, typename Clk = std::chrono::system_clock>
struct expiring : public T{
    using clk_t = Clk;
    typename Clk::time_point good_till;

    expiring() : T{}, good_till{clk_t::time_point::min()}
    {}

    template<class Rep, class Period>
    expiring(std::chrono::duration<Rep, Period> ttl, T _t) :
        expiring(clk_t::now() + std::chrono::duration_cast<typename clk_t::duration>(ttl), std::move(_t))
    {}

    expiring(const typename clk_t::time_point& _good_till, T _t) :
        T(std::move(_t)), good_till(_good_till)
    {}

    bool expired(typename clk_t::time_point asifnow = clk_t::now()) const{
        return asifnow > good_till;
    }
};

template <typename K, typename V, typename Clk = std::chrono::system_clock>
class expiring_cache{
    using eV = expiring<V, Clk>;
    const size_t max_size;
    std::unordered_map<K, eV> themap;
    std::mutex mtx;
    size_t _evictions = 0, _expirations = 0, _hits = 0, _misses = 0;
    size_t evict_bkt = 0;

    void random_eviction(){
        if(++evict_bkt>=themap.bucket_count())
            evict_bkt = 0;
        auto n = themap.bucket_size(evict_bkt);
        if(n==0)
            return;
        auto it = themap.find(themap.begin(evict_bkt)->first);
        do{
            it = themap.erase(it);
            ++_evictions;
        }while(--n && it!=themap.end());
    }

public:
    using clk_t = Clk;
    explicit expiring_cache(size_t _max_size) : max_size(_max_size) {}

    eV lookup(const K& k, typename clk_t::time_point asifnow = clk_t::now()){
        std::lock_guard<std::mutex> lk(mtx);
        auto ii = themap.find(k);
        if(ii == themap.end()){
            _misses++;
            return {};
        }
        if( ii->second.expired(asifnow) ){
            themap.erase(ii);
            _expirations++;
            return {};
        }
        _hits++;
        return ii->second;
    }

    // Replaces any existing entry for k.
    void insert(const K& k, const eV& v){
        if(max_size==0)
            return;
        std::lock_guard<std::mutex> lk(mtx);
        themap.erase(k);
        themap.emplace(k, v);
        // N.B.  might evict the one we just inserted
        while(themap.size() > max_size)
            random_eviction();
    }

    template <class Rep, class Period>
    void insert(const K& k, const V& r, std::chrono::duration<Rep, Period> ttl){
        insert(k, eV(ttl, r));
    }

    void erase_expired(typename clk_t::time_point asifnow = clk_t::now()){
        std::lock_guard<std::mutex> lk(mtx);
        for(auto i = themap.begin(), last=themap.end(); i != last; ){
            if( i->second.expired(asifnow) ){
                _expirations++;
                i = themap.erase(i);
            }else{
                ++i;
            }
        }
    }

    size_t evictions() { std::lock_guard<std::mutex> lk(mtx); return _evictions; }
    size_t hits() { std::lock_guard<std::mutex> lk(mtx); return _hits; }
    size_t misses() { std::lock_guard<std::mutex> lk(mtx); return _misses; }
    size_t expirations() { std::lock_guard<std::mutex> lk(mtx); return _expirations; }
    size_t size() { std::lock_guard<std::mutex> lk(mtx); return themap.size(); }
};
} // namespace geocore
