#include "geosite123/result_cache.hpp"
#include <geocore/ut.hpp>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace geosite123;
using namespace std::chrono;

int main(int, char **){
    result_key k{"google", "cn", dialect::surge};
    EQSTR(k.str(), "surge:google@cn");
    EQSTR((result_key{"google", "", dialect::egern}.str()), "egern:google");
    CHECK(!(k == result_key{"google", "cn", dialect::mihomo}));
    CHECK(result_key_hash()(k) == result_key_hash()(result_key{"google", "cn", dialect::surge}));

    result_cache rc(seconds(60));
    std::string text;
    CHECK(!rc.lookup(k, "fp1", &text));
    rc.store(k, "fp1", "DOMAIN,a.example");
    CHECK(rc.lookup(k, "fp1", &text));
    EQSTR(text, "DOMAIN,a.example");
    // A different dialect is a different entry.
    CHECK(!rc.lookup({"google", "cn", dialect::mihomo}, "fp1", &text));

    // Once the archive moves on, the old rendering is never returned.
    text = "untouched";
    CHECK(!rc.lookup(k, "fp2", &text));
    EQSTR(text, "untouched");
    auto st = rc.stats();
    EQUAL(st.hits, 1u);
    EQUAL(st.stale, 1u);
    EQUAL(st.misses, 3u);

    int calls = 0;
    auto r = rc.get_or_compute(k, "fp2", [&]{ calls++; return std::string("DOMAIN,b.example"); });
    EQSTR(r, "DOMAIN,b.example");
    r = rc.get_or_compute(k, "fp2", [&]{ calls++; return std::string("wrong"); });
    EQSTR(r, "DOMAIN,b.example");
    EQUAL(calls, 1);
    CHECK(!rc.lookup(k, "fp1", &text));

    // A failed render stores nothing and the next caller tries again.
    result_key kx{"broken", "", dialect::surge};
    EXPECT_THROW(rc.get_or_compute(kx, "fp2", []() -> std::string { throw std::runtime_error("render failed"); }),
                 std::runtime_error);
    CHECK(!rc.lookup(kx, "fp2", &text));
    r = rc.get_or_compute(kx, "fp2", []{ return std::string("ok"); });
    EQSTR(r, "ok");

    // Expiry and sweep.
    EQUAL(rc.stats().size, 2u);
    EQUAL(rc.sweep(), 0u);
    EQUAL(rc.sweep(result_cache::clk_t::now() + seconds(61)), 2u);
    EQUAL(rc.stats().size, 0u);
    EQUAL(rc.stats().swept, 2u);
    EQUAL(rc.stats().sweeps, 2u);

    result_cache shortlived(milliseconds(50));
    shortlived.store(k, "fp", "x");
    CHECK(shortlived.lookup(k, "fp", &text));
    std::this_thread::sleep_for(milliseconds(100));
    CHECK(!shortlived.lookup(k, "fp", &text));

    // Single flight: many concurrent callers, one render.
    result_cache sf(seconds(60));
    std::atomic<int> renders{0};
    std::vector<std::thread> threads;
    std::vector<std::string> results(8);
    for(size_t i=0; i<results.size(); ++i){
        threads.emplace_back([&, i]{
            results[i] = sf.get_or_compute(k, "fp", [&]{
                renders++;
                std::this_thread::sleep_for(milliseconds(200));
                return std::string("rendered");
            });
        });
    }
    for(auto& t : threads)
        t.join();
    EQUAL(renders.load(), 1);
    for(const auto& s : results)
        EQSTR(s, "rendered");
    st = sf.stats();
    EQUAL(st.computes, 1u);
    EQUAL(st.coalesced + st.hits, 7u);

    // Waiters see the leader's exception.
    threads.clear();
    std::atomic<int> failures{0};
    result_key ky{"slowfail", "", dialect::mihomo};
    for(int i=0; i<4; ++i){
        threads.emplace_back([&]{
            try{
                sf.get_or_compute(ky, "fp", []() -> std::string {
                    std::this_thread::sleep_for(milliseconds(200));
                    throw std::runtime_error("slow failure");
                });
            }catch(std::runtime_error&){
                failures++;
            }
        });
    }
    for(auto& t : threads)
        t.join();
    EQUAL(failures.load(), 4);
    CHECK(!sf.lookup(ky, "fp", &text));
    std::cout << sf.stats() << "\n";

    return utstatus();
}
