#include "geosite123/render.hpp"
#include <geocore/ut.hpp>
#include <stdexcept>
#include <vector>

using namespace geosite123;

namespace{
std::vector<item> sample(){
    return {
        item::make_comment("# header"),
        item::make_rule(rule_kind::domain_suffix, "example.com", "@cn"),
        item::make_comment("# include:youtube"),
        item::make_rule(rule_kind::domain_regex, "^ad[0-9]\\.x\\.com$", ""),
        item::make_rule(rule_kind::domain, "www.youtube.com", ""),
        item::make_comment("# dangling"),
    };
}
} // namespace <anon>

int main(int, char **){
    EQSTR(render_surge_rule({rule_kind::domain_suffix, "example.com", ""}), "DOMAIN-SUFFIX,example.com");
    EQSTR(render_surge_rule({rule_kind::domain, "example.com", ""}), "DOMAIN,example.com");
    EQSTR(render_surge_rule({rule_kind::domain_keyword, "exam", "@ads"}), "DOMAIN-KEYWORD,exam # @ads");
    EQSTR(render_surge_rule({rule_kind::domain_regex, "^www\\.google\\.com$", ""}), "DOMAIN-WILDCARD,www.google.com");
    EQSTR(render_surge_rule({rule_kind::domain_regex, "^cdn.\\.example\\.net$", "# cdn"}), "DOMAIN-WILDCARD,cdn?.example.net # cdn");
    EQSTR(render_surge_rule({rule_kind::domain_regex, "[a-z]+\\.example\\.com", ""}), "# DANGEROUS-REGEX,[a-z]+\\.example\\.com");
    EQSTR(render_mihomo_rule({rule_kind::domain_regex, "[a-z]+\\.example\\.com", ""}), "DOMAIN-REGEX,[a-z]+\\.example\\.com");
    EQSTR(render_mihomo_rule({rule_kind::domain, "a.example", "@cn"}), "DOMAIN,a.example # @cn");

    EQSTR(append_comment("X", ""), "X");
    EQSTR(append_comment("X", "@cn"), "X # @cn");
    EQSTR(append_comment("X", "# note"), "X # note");

    // The dangerous regex becomes the pending comment in front of the
    // next rule.  The dangling comment has no rule after it.
    EQSTR(render(sample(), dialect::surge),
          "# header\n"
          "DOMAIN-SUFFIX,example.com # @cn\n"
          "# include:youtube\n"
          "# DANGEROUS-REGEX,^ad[0-9]\\.x\\.com$\n"
          "DOMAIN,www.youtube.com");
    EQSTR(render(sample(), dialect::mihomo),
          "# header\n"
          "DOMAIN-SUFFIX,example.com # @cn\n"
          "# include:youtube\n"
          "DOMAIN-REGEX,^ad[0-9]\\.x\\.com$\n"
          "DOMAIN,www.youtube.com");
    EQSTR(render(sample(), dialect::egern),
          "domain_set:\n"
          "  - \"www.youtube.com\"\n"
          "domain_suffix_set:\n"
          "  - \"example.com\"\n"
          "domain_regex_set:\n"
          "  - \"^ad[0-9]\\\\.x\\\\.com$\"");

    // A plain comment replaces the one pending before it.
    std::vector<item> two{item::make_comment("# one"), item::make_comment("# two"),
                          item::make_rule(rule_kind::domain, "d.example", "")};
    EQSTR(render(two, dialect::surge), "# two\nDOMAIN,d.example");
    EQSTR(render({}, dialect::surge), "");

    // A dangerous regex only ever shows up as the comment in front of
    // a later rule.  With no rule after it, surge says nothing at all.
    std::vector<item> only{item::make_rule(rule_kind::domain_regex, "[a-z]+\\.example\\.com", "")};
    EQSTR(render(only, dialect::surge), "");
    EQSTR(render(only, dialect::mihomo), "DOMAIN-REGEX,[a-z]+\\.example\\.com");
    only.push_back(item::make_comment("# trailing"));
    EQSTR(render(only, dialect::surge), "");
    // The second one replaces the first.
    std::vector<item> twice{item::make_rule(rule_kind::domain_regex, "^a[0-9]\\.x$", ""),
                            item::make_rule(rule_kind::domain_regex, "^b[0-9]\\.x$", ""),
                            item::make_rule(rule_kind::domain, "c.x", "")};
    EQSTR(render(twice, dialect::surge), "# DANGEROUS-REGEX,^b[0-9]\\.x$\nDOMAIN,c.x");
    twice.pop_back();
    EQSTR(render(twice, dialect::surge), "");
    EQSTR(render({}, dialect::egern), "");

    EQSTR(dialect_name(dialect_from_name("mihomo")), "mihomo");
    CHECK(dialect_from_name("egern") == dialect::egern);
    EXPECT_THROW(dialect_from_name("clash"), std::invalid_argument);
    EXPECT_THROW(dialect_from_name("Surge"), std::invalid_argument);

    EQSTR(go_quote("plain"), "\"plain\"");
    EQSTR(go_quote("a\"b\\c"), "\"a\\\"b\\\\c\"");
    EQSTR(go_quote("tab\there\n"), "\"tab\\there\\n\"");
    EQSTR(go_quote("\x01"), "\"\\x01\"");
    EQSTR(go_quote("\xe4\xb8\xad"), "\"\xe4\xb8\xad\"");
    EQSTR(go_quote("\xff"), "\"\\xff\"");
    EQSTR(go_quote("\xc2\x85"), "\"\\u0085\"");
    // overlong '/'
    EQSTR(go_quote("\xc0\xaf"), "\"\\xc0\\xaf\"");

    return utstatus();
}
