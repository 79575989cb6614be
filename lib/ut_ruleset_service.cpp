#include "geosite123/ruleset_service.hpp"
#include "geosite123/errors.hpp"
#include "ut_zipmaker.hpp"
#include <geocore/exnest.hpp>
#include <geocore/ut.hpp>
#include <chrono>
#include <fstream>
#include <map>
#include <memory>
#include <string>
#include <unistd.h>

using namespace geosite123;
using namespace std::chrono;

namespace{
struct fake_transport : public archive_transport{
    std::string token;
    std::string bytes;
    std::string check_fingerprint() override{ return token; }
    download_result download() override{ return {bytes, ""}; }
};

std::string archive(const std::string& google){
    zipmaker zm;
    zm.add("dlc/data/google", google);
    zm.add("dlc/data/youtube", "full:www.youtube.com\n", true);
    return zm.finish();
}

bool innermost_is_not_found(std::exception& e){
    auto& inner = geocore::innermost(e);
    return dynamic_cast<const not_found_error*>(&inner) != nullptr;
}
} // namespace <anon>

int main(int, char **){
    auto tp = std::make_shared<fake_transport>();
    tp->token = "t1";
    tp->bytes = archive("domain:google.com @cn\ninclude:youtube\n");
    source_cache sc(seconds(600));
    fetcher f(sc, tp);
    result_cache rc(seconds(600));
    published_index idx("", "");
    service_options so;
    so.data_prefix = "dlc/data/";
    so.misc_base_url = "https://misc.example/lists//";
    std::map<std::string, std::string> misc{{"https://misc.example/lists/surge/ads.list", "DOMAIN,ads.example\n"}};
    int misc_fetches = 0;
    ruleset_service svc(f, rc, idx, so,
                        [&](const std::string& url){
                            misc_fetches++;
                            auto p = misc.find(url);
                            if(p == misc.end())
                                throw not_found_error(url);
                            return p->second;
                        });
    EQSTR(svc.options().misc_base_url, "https://misc.example/lists");

    EQSTR(svc.render_ruleset("google", "", dialect::surge),
          "DOMAIN-SUFFIX,google.com # @cn\n"
          "# include:youtube\n"
          "DOMAIN,www.youtube.com");
    EQSTR(svc.render_ruleset("google", "", dialect::surge),
          "DOMAIN-SUFFIX,google.com # @cn\n"
          "# include:youtube\n"
          "DOMAIN,www.youtube.com");
    EQUAL(rc.stats().computes, 1u);
    EQSTR(svc.render_ruleset("google", "cn", dialect::mihomo), "DOMAIN-SUFFIX,google.com # @cn");
    EQSTR(svc.render_ruleset("google", "", dialect::egern),
          "domain_set:\n"
          "  - \"www.youtube.com\"\n"
          "domain_suffix_set:\n"
          "  - \"google.com\"");
    EQUAL(rc.stats().computes, 3u);

    try{
        svc.render_ruleset("nosuch", "", dialect::surge);
        CHECK(false);
    }catch(std::exception& e){
        CHECK(innermost_is_not_found(e));
    }

    // A new archive upstream.  The old rendering isn't served again.
    tp->token = "t2";
    tp->bytes = archive("domain:google.cn\n");
    svc.refresh_source();
    EQSTR(svc.render_ruleset("google", "", dialect::surge), "DOMAIN-SUFFIX,google.cn");

    // Misc lists are cached.
    EQSTR(svc.misc_list("surge", "ads"), "DOMAIN,ads.example\n");
    EQSTR(svc.misc_list("surge", "ads"), "DOMAIN,ads.example\n");
    EQUAL(misc_fetches, 1);
    EXPECT_THROW(svc.misc_list("surge", "nope"), not_found_error);

    // With no published index, the index is built for the request.
    auto body = svc.index_body("http://localhost:8080");
    CHECK(body.find("\"google\": \"http://localhost:8080/geosite/google\"") != std::string::npos);
    CHECK(body.find("\"youtube\": \"http://localhost:8080/geosite/youtube\"") != std::string::npos);
    svc.refresh_index();    // disabled, does nothing

    // With one, it wins.
    published_index pub("https://geo.example.com", "");
    ruleset_service svc2(f, rc, pub, so, [](const std::string& url) -> std::string { throw not_found_error(url); });
    svc2.refresh_index();
    body = svc2.index_body("http://localhost:8080");
    CHECK(body.find("\"google\": \"https://geo.example.com/geosite/google\"") != std::string::npos);

    // An index file, once written, is what's served, even if it was
    // changed behind our back.
    std::string ipath = "/tmp/ut_ruleset_service." + std::to_string(::getpid()) + "/index.json";
    published_index filed("https://geo.example.com", ipath);
    ruleset_service svc3(f, rc, filed, so, [](const std::string& url) -> std::string { throw not_found_error(url); });
    body = svc3.index_body("http://localhost:8080");
    CHECK(body.find("http://localhost:8080/geosite/google") != std::string::npos);
    svc3.refresh_index();
    CHECK(::access(ipath.c_str(), R_OK) == 0);
    {
        std::ofstream ofs(ipath);
        ofs << "{\"edited\": \"by hand\"}";
    }
    EQSTR(svc3.index_body("http://localhost:8080"), "{\"edited\": \"by hand\"}");
    // Gone again: the in-memory index answers.
    ::unlink(ipath.c_str());
    body = svc3.index_body("http://localhost:8080");
    CHECK(body.find("https://geo.example.com/geosite/google") != std::string::npos);
    ::rmdir(ipath.substr(0, ipath.rfind('/')).c_str());

    EQUAL(svc.sweep(), 0u);

    return utstatus();
}
