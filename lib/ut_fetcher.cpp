#include "geosite123/fetcher.hpp"
#include "geosite123/errors.hpp"
#include "ut_zipmaker.hpp"
#include <geocore/ut.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace geosite123;
using namespace std::chrono;

namespace{
// Scripted upstream.  check_fingerprint returns token, or throws if
// check_fails.  download returns bytes with etag.
struct fake_transport : public archive_transport{
    std::string token;
    bool check_fails = false;
    std::string bytes;
    std::string etag;
    int checks = 0;
    int downloads = 0;

    std::string check_fingerprint() override{
        checks++;
        if(check_fails)
            throw transport_error("fake check failure");
        return token;
    }
    download_result download() override{
        downloads++;
        return {bytes, etag};
    }
};

std::string zip_with(const std::string& body){
    zipmaker zm;
    zm.add("data/x", body);
    return zm.finish();
}
} // namespace <anon>

int main(int, char **){
    EQSTR(normalize_etag("W/\"abc\""), "abc");
    EQSTR(normalize_etag(" \"abc\" "), "abc");
    EQSTR(normalize_etag("plain"), "plain");
    // crc32 of "" is 0
    EQSTR(content_fingerprint(""), "crc32-00000000-0");
    CHECK(content_fingerprint("abc") != content_fingerprint("abd"));

    auto tp = std::make_shared<fake_transport>();
    source_cache sc(milliseconds(100));
    fetcher f(sc, tp);

    // Nothing cached and the check fails: nothing to serve.
    tp->check_fails = true;
    EXPECT_THROW(f.ensure_fresh(), transport_error);
    EQUAL(tp->downloads, 0);

    // First download.  The download's ETag wins over the check token.
    tp->check_fails = false;
    tp->token = "t1";
    tp->bytes = zip_with("v1");
    tp->etag = "e1";
    auto s = f.ensure_fresh();
    EQSTR(s.fingerprint, "e1");
    EQSTR(s.archive->read("data/x"), "v1");
    EQUAL(tp->downloads, 1);

    // Fresh: no traffic at all.
    auto checks = tp->checks;
    s = f.ensure_fresh();
    EQUAL(tp->checks, checks);
    EQUAL(tp->downloads, 1);

    // Stale, and the token matches: touched, not downloaded.
    std::this_thread::sleep_for(milliseconds(150));
    tp->token = "e1";
    s = f.ensure_fresh();
    EQUAL(tp->downloads, 1);
    EQSTR(s.fingerprint, "e1");
    EQUAL(f.stats().unchanged.load(), 1u);
    source_snapshot fresh;
    CHECK(sc.get(&fresh));

    // Stale, and the check fails: the stale archive is served.
    std::this_thread::sleep_for(milliseconds(150));
    tp->check_fails = true;
    s = f.ensure_fresh();
    EQSTR(s.fingerprint, "e1");
    EQUAL(f.stats().stale_serves.load(), 1u);
    tp->check_fails = false;

    // force_refresh checks even when fresh.  A changed token with no
    // ETag on the download: the token becomes the fingerprint.
    tp->token = "t2";
    tp->etag = "";
    tp->bytes = zip_with("v2");
    s = f.force_refresh();
    EQSTR(s.fingerprint, "t2");
    EQSTR(s.archive->read("data/x"), "v2");
    EQUAL(tp->downloads, 2);

    // No token and no ETag: the content decides, and an empty token
    // always means a download.
    tp->token = "";
    tp->bytes = zip_with("v3");
    s = f.force_refresh();
    EQSTR(s.fingerprint, content_fingerprint(tp->bytes));
    EQUAL(tp->downloads, 3);
    s = f.force_refresh();
    EQUAL(tp->downloads, 4);

    // A corrupt download leaves the cache alone.
    tp->token = "t5";
    tp->bytes = "<html>rate limited</html>";
    EXPECT_THROW(f.force_refresh(), format_error);
    source_snapshot after;
    CHECK(sc.get_any(&after));
    EQSTR(after.archive->read("data/x"), "v3");

    return utstatus();
}
