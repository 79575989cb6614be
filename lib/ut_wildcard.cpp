#include "geosite123/wildcard.hpp"
#include "geosite123/regex_syntax.hpp"
#include <geocore/ut.hpp>
#include <string>

using namespace geosite123;

int main(int, char **){
    EQSTR(to_wildcard("^www\\.google\\.com$"), "www.google.com");
    CHECK(!is_dangerous("^www\\.google\\.com$"));
    EQSTR(to_wildcard("/^www\\.google\\.com$/"), "www.google.com");

    auto t = translate("[a-z]+\\.example\\.com");
    EQSTR(t.wildcard, "*.example.com");
    CHECK(t.dangerous);

    // '.' is exactly one character, so it stays precise.
    t = translate("^ad.\\.example\\.com$");
    EQSTR(t.wildcard, "ad?.example.com");
    CHECK(!t.dangerous);
    t = translate("^ad[0-9]\\.example\\.com$");
    EQSTR(t.wildcard, "ad?.example.com");
    CHECK(t.dangerous);

    t = translate("^cdn.*\\.example\\.net$");
    EQSTR(t.wildcard, "cdn*.example.net");
    CHECK(!t.dangerous);
    t = translate("(foo|bar)\\.com$");
    EQSTR(t.wildcard, "*.com");
    CHECK(t.dangerous);
    t = translate("^x{2}\\.com$");
    EQSTR(t.wildcard, "*.com");
    CHECK(t.dangerous);
    t = translate("^(a[bc])?\\.com$");
    EQSTR(t.wildcard, "*.com");
    CHECK(t.dangerous);

    // Non-capturing groups.
    t = translate("^(?:www\\.)?example\\.com$");
    EQSTR(t.wildcard, "*example.com");
    CHECK(!t.dangerous);
    t = translate("(?:a|b)\\.com");
    EQSTR(t.wildcard, "?.com");
    CHECK(t.dangerous);
    t = translate("^(?i:CDN)\\.example\\.org$");
    EQSTR(t.wildcard, "CDN.example.org");
    CHECK(!t.dangerous);

    // Too deeply nested to parse.
    CHECK(is_dangerous(std::string(200000, '(') + std::string(200000, ')')));
    EQSTR(to_wildcard(std::string(1001, '(') + "a" + std::string(1001, ')')), "");

    // Precise, but matches nearly everything.
    t = translate(".*");
    EQSTR(t.wildcard, "*");
    CHECK(t.dangerous);
    t = translate("^...$");
    EQSTR(t.wildcard, "???");
    CHECK(t.dangerous);
    CHECK(is_dangerous("^a...b$"));
    CHECK(!is_dangerous("^a..b$"));

    // Unparseable.
    t = translate("(unclosed");
    EQSTR(t.wildcard, "");
    CHECK(t.dangerous);
    EQSTR(to_wildcard(""), "");
    CHECK(!is_dangerous(""));

    CHECK(!is_broad_wildcard(""));
    CHECK(is_broad_wildcard("*.*"));
    CHECK(is_broad_wildcard("?.?"));
    CHECK(!is_broad_wildcard("*.example.com"));
    CHECK(is_broad_wildcard("a?b?c?"));

    CHECK(has_imprecise_node(parse_regex("a(b|cd)")));
    CHECK(!has_imprecise_node(parse_regex("a(bcd)+")));
    EQSTR(wildcard_of(parse_regex("\\bads\\.")), "ads.");

    return utstatus();
}
