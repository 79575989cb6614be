#include "geosite123/rule_parser.hpp"
#include "geosite123/content_accessor.hpp"
#include "ut_zipmaker.hpp"
#include <geocore/exnest.hpp>
#include <geocore/ut.hpp>
#include <map>
#include <memory>
#include <string>

using namespace geosite123;

namespace{
struct map_accessor : public content_accessor{
    std::map<std::string, std::string> lists;
    int fetches = 0;
    std::string fetch_member(const std::string& name) override{
        fetches++;
        auto p = lists.find(name);
        if(p == lists.end())
            throw not_found_error("no such list: " + name);
        return p->second;
    }
};

size_t nrules(const std::vector<item>& items){
    size_t n = 0;
    for(auto& i : items)
        if(i.kind == item_kind::rule)
            n++;
    return n;
}
} // namespace <anon>

int main(int, char **){
    CHECK(matches_filter("", ""));
    CHECK(matches_filter("@cn", ""));
    CHECK(matches_filter("@cn", "cn"));
    CHECK(matches_filter("@ads @cn", "cn"));
    CHECK(!matches_filter("@cn", "us"));
    CHECK(!matches_filter("", "cn"));
    CHECK(!matches_filter("@cnx", "cn"));
    CHECK(!matches_filter("@ads # @cn", "cn"));
    CHECK(!matches_filter("# @cn", "cn"));

    map_accessor src;
    rule_parser p(src);

    auto items = p.parse("# header\n"
                         "\n"
                         "domain:example.com @cn\n"
                         "full:www.example.com\n"
                         "keyword:exam\n"
                         "regexp:^ex[0-9]+\\.com$\n"
                         "  plain.example.org  \t@us # trailing\n"
                         "domain:\n", "");
    EQUAL(items.size(), 6u);
    CHECK(items[0].kind == item_kind::comment);
    EQSTR(items[0].comment, "# header");
    CHECK(items[1].r.kind == rule_kind::domain_suffix);
    EQSTR(items[1].r.value, "example.com");
    EQSTR(items[1].r.comment, "@cn");
    CHECK(items[2].r.kind == rule_kind::domain);
    EQSTR(items[2].r.value, "www.example.com");
    EQSTR(items[2].r.comment, "");
    CHECK(items[3].r.kind == rule_kind::domain_keyword);
    CHECK(items[4].r.kind == rule_kind::domain_regex);
    EQSTR(items[4].r.value, "^ex[0-9]+\\.com$");
    CHECK(items[5].r.kind == rule_kind::domain_suffix);
    EQSTR(items[5].r.value, "plain.example.org");
    EQSTR(items[5].r.comment, "@us # trailing");
    EQSTR(rule_kind_name(items[5].r.kind), "domain_suffix");

    // Filters.
    EQUAL(nrules(p.parse("domain:example.com @cn\n", "cn")), 1u);
    EQUAL(nrules(p.parse("domain:example.com @cn\n", "us")), 0u);
    EQUAL(nrules(p.parse("domain:example.com @cn\n", "")), 1u);

    // Includes: a comment, then the included items.
    src.lists["google"] = "domain:google.com @cn\ninclude:youtube\n";
    src.lists["youtube"] = "domain:youtube.com\n";
    items = p.parse_member("google", "");
    EQUAL(items.size(), 3u);
    EQSTR(items[0].r.value, "google.com");
    CHECK(items[1].kind == item_kind::comment);
    EQSTR(items[1].comment, "# include:youtube");
    EQSTR(items[2].r.value, "youtube.com");

    // An include that filters down to nothing leaves no trace.
    items = p.parse_member("google", "cn");
    EQUAL(items.size(), 1u);
    EQSTR(items[0].r.value, "google.com");

    // The same list on two branches is fine.
    src.lists["diamond"] = "include:left\ninclude:right\n";
    src.lists["left"] = "include:base\n";
    src.lists["right"] = "include:base\n";
    src.lists["base"] = "full:base.example\n";
    items = p.parse_member("diamond", "");
    EQUAL(nrules(items), 2u);

    // Cycles, direct and indirect.
    src.lists["self"] = "domain:self.example\ninclude:self\n";
    EXPECT_THROW(p.parse_member("self", ""), cyclic_include_error);
    src.lists["a"] = "include:b\n";
    src.lists["b"] = "include:c\n";
    src.lists["c"] = "include:a\n";
    try{
        p.parse_member("a", "");
        CHECK(false);
    }catch(cyclic_include_error& e){
        CHECK(geocore::startswith(e.what(), "include cycle: a -> b -> c -> a"));
        EQUAL(e.code().value(), 500);
    }

    // A missing include is a 404 at the bottom of the nest.
    src.lists["broken"] = "domain:ok.example\ninclude:missing\n";
    try{
        p.parse_member("broken", "");
        CHECK(false);
    }catch(std::exception& e){
        auto& inner = geocore::innermost(e);
        CHECK(dynamic_cast<const not_found_error*>(&inner) != nullptr);
    }
    EXPECT_THROW(p.parse_member("nosuchlist", ""), std::runtime_error);

    // The same thing against a real archive.
    zipmaker zm;
    zm.add("top/data/", "");
    zm.add("top/data/apple", "domain:apple.com\ninclude:icloud\n", true);
    zm.add("top/data/icloud", "full:www.icloud.com @cn\n");
    zm.add("top/data/sub/nested", "domain:nested.example\n");
    zm.add("top/other", "domain:other.example\n");
    auto za = std::make_shared<const zip_archive>(zm.finish());
    archive_members am(za, "top/data/");
    auto names = am.list();
    EQUAL(names.size(), 2u);
    EQSTR(names[0], "apple");
    EQSTR(names[1], "icloud");
    EXPECT_THROW(am.fetch_member("nope"), not_found_error);
    EXPECT_THROW(am.fetch_member("sub/nested"), not_found_error);
    EXPECT_THROW(am.fetch_member(""), not_found_error);
    rule_parser ap(am);
    items = ap.parse_member("apple", "cn");
    EQUAL(items.size(), 2u);
    EQSTR(items[1].r.value, "www.icloud.com");

    return utstatus();
}
