#include "geosite123/source_cache.hpp"
#include "geosite123/errors.hpp"
#include "ut_zipmaker.hpp"
#include <geocore/ut.hpp>
#include <chrono>
#include <fstream>
#include <string>
#include <thread>
#include <unistd.h>

using namespace geosite123;
using namespace std::chrono;

namespace{
std::string one_member_zip(const std::string& name, const std::string& body){
    zipmaker zm;
    zm.add(name, body, true);
    return zm.finish();
}
} // namespace <anon>

int main(int, char **){
    source_cache sc(milliseconds(200));
    source_snapshot s;
    CHECK(!sc.get(&s));
    CHECK(!sc.get_any(&s));
    sc.touch();    // nothing to touch
    CHECK(!sc.get_any(&s));

    sc.set(one_member_zip("data/a", "domain:a.com\n"), "fp1");
    CHECK(sc.get(&s));
    EQSTR(s.fingerprint, "fp1");
    EQSTR(s.archive->read("data/a"), "domain:a.com\n");

    // Garbage doesn't replace what's there.
    EXPECT_THROW(sc.set("definitely not a zip archive", "fp2"), format_error);
    CHECK(sc.get_any(&s));
    EQSTR(s.fingerprint, "fp1");
    EXPECT_THROW(sc.set(one_member_zip("x", "y"), ""), std::invalid_argument);

    // Past the ttl, get() says no but get_any() still has it, and
    // touch() makes it fresh again.
    std::this_thread::sleep_for(milliseconds(300));
    CHECK(!sc.get(&s));
    CHECK(sc.get_any(&s));
    EQSTR(s.fingerprint, "fp1");
    auto before = s.fetched_at;
    sc.touch();
    CHECK(sc.get(&s));
    CHECK(s.fetched_at > before);
    EQSTR(s.fingerprint, "fp1");

    // Persistence round trip.
    std::string path = "/tmp/ut_source_cache." + std::to_string(::getpid());
    ::unlink(path.c_str());
    {
        source_cache missing(seconds(100));
        CHECK(!missing.load_from_file(path));
        missing.set(one_member_zip("data/b", "full:b.example\n"), "\"etag-b\"");
    }
    {
        source_cache reloaded(seconds(100));
        CHECK(reloaded.load_from_file(path));
        CHECK(reloaded.get(&s));
        EQSTR(s.fingerprint, "\"etag-b\"");
        EQSTR(s.archive->read("data/b"), "full:b.example\n");
    }
    {
        // A snapshot older than the ttl loads, but isn't fresh.
        source_cache shortttl(milliseconds(1));
        std::this_thread::sleep_for(milliseconds(5));
        CHECK(shortttl.load_from_file(path));
        CHECK(!shortttl.get(&s));
        CHECK(shortttl.get_any(&s));
    }
    {
        std::ofstream ofs(path);
        ofs << "20:geosite123-source-v1,3:fp9,garbage";
    }
    {
        source_cache broken(seconds(100));
        EXPECT_THROW(broken.load_from_file(path), format_error);
        CHECK(!broken.get_any(&s));
    }
    ::unlink(path.c_str());

    // Persisting into a directory that isn't there yet creates it.
    std::string dir = "/tmp/ut_source_cache_dir." + std::to_string(::getpid());
    std::string deep = dir + "/var/cache/geosite.snap";
    {
        source_cache fresh(seconds(100));
        fresh.set_persist_path(deep);
        fresh.set(one_member_zip("data/c", "domain:c.example\n"), "fp-c");
        CHECK(::access(deep.c_str(), R_OK) == 0);
        CHECK(::access((deep + ".tmp").c_str(), F_OK) != 0);
    }
    {
        source_cache reloaded(seconds(100));
        CHECK(reloaded.load_from_file(deep));
        CHECK(reloaded.get(&s));
        EQSTR(s.fingerprint, "fp-c");
        EQSTR(s.archive->read("data/c"), "domain:c.example\n");
    }
    ::unlink(deep.c_str());
    ::rmdir((dir + "/var/cache").c_str());
    ::rmdir((dir + "/var").c_str());
    ::rmdir(dir.c_str());

    return utstatus();
}
