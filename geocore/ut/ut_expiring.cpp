#include <geocore/expiring.hpp>
#include <geocore/ut.hpp>
#include <chrono>
#include <string>

using namespace geocore;
using namespace std::chrono;

int main(int, char **){
    expiring<std::string> never_set;
    CHECK(never_set.expired());

    auto t0 = system_clock::now();
    expiring<std::string> e(t0 + seconds(10), "body");
    CHECK(!e.expired(t0));
    CHECK(!e.expired(t0 + seconds(10)));
    CHECK(e.expired(t0 + seconds(11)));
    EQSTR(e, "body");

    expiring_cache<std::string, std::string> ec(100);
    for(int i=0; i<50; ++i)
        ec.insert("k" + std::to_string(i), "v" + std::to_string(i), seconds(100));
    EQUAL(ec.size(), 50u);
    EQUAL(ec.evictions(), 0u);
    for(int i=0; i<50; ++i){
        auto v = ec.lookup("k" + std::to_string(i));
        CHECK(!v.expired());
        EQSTR(v, "v" + std::to_string(i));
    }
    EQUAL(ec.hits(), 50u);

    // insert replaces
    ec.insert("k1", "replaced", seconds(100));
    EQSTR(ec.lookup("k1"), "replaced");
    EQUAL(ec.size(), 50u);

    // misses and expirations
    CHECK(ec.lookup("nope").expired());
    EQUAL(ec.misses(), 1u);
    CHECK(ec.lookup("k2", system_clock::now() + seconds(1000)).expired());
    EQUAL(ec.expirations(), 1u);
    EQUAL(ec.size(), 49u);

    ec.erase_expired(system_clock::now() + seconds(1000));
    EQUAL(ec.size(), 0u);

    // size limit
    expiring_cache<int, std::string> small(10);
    for(int i=0; i<100; ++i)
        small.insert(i, "x", seconds(100));
    CHECK(small.size() <= 10);
    CHECK(small.evictions() >= 90);

    // a zero-sized cache holds nothing
    expiring_cache<int, std::string> none(0);
    none.insert(1, "x", seconds(100));
    EQUAL(none.size(), 0u);

    return utstatus();
}
