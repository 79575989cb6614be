#pragma once

// rule_parser - turns the text of one domain-list-community list
// into a sequence of items.
//
// Each line is stripped.  Blank lines are dropped and lines starting
// with '#' become comment items.  Otherwise the first whitespace
// delimited token is the rule, and anything after it is the rule's
// trailing text (attributes like @cn, and/or a '#' comment):
//
//    domain:example.com    domain_suffix
//    full:example.com      domain
//    keyword:example       domain_keyword
//    regexp:^ex.*\.com$    domain_regex
//    example.com           domain_suffix
//    include:other         the items of list 'other', inline
//
// With a non-empty filter, only rules whose trailing text carries
// @FILTER survive.  Includes are parsed with the same filter; an
// include that yields no rules contributes nothing, otherwise it
// contributes a '# include:...' comment followed by its items.
//
// The parser remembers the chain of lists it is currently expanding
// and throws cyclic_include_error if an include would revisit one.
// The same list may be included more than once on different branches.

#include "geosite123/content_accessor.hpp"
#include "geosite123/errors.hpp"
#include <geocore/strutils.hpp>
#include <string>
#include <vector>

namespace geosite123{

enum class rule_kind{ domain_suffix, domain, domain_keyword, domain_regex };

struct rule{
    rule_kind kind;
    std::string value;
    std::string comment;        // the trailing text, possibly empty
};

enum class item_kind{ rule, comment };

struct item{
    item_kind kind;
    rule r;                     // when kind == item_kind::rule
    std::string comment;        // when kind == item_kind::comment

    static item make_rule(rule_kind k, std::string value, std::string comment){
        return {item_kind::rule, {k, std::move(value), std::move(comment)}, {}};
    }
    static item make_comment(std::string text){
        return {item_kind::comment, {rule_kind::domain_suffix, {}, {}}, std::move(text)};
    }
};

const char* rule_kind_name(rule_kind k);

// Does a rule with trailing text 'trailing' pass 'filter'?
bool matches_filter(geocore::str_view trailing, const std::string& filter);

class rule_parser{
public:
    explicit rule_parser(content_accessor& src) : src_(src){}

    // Parse 'text' as if it were an anonymous top-level list.
    std::vector<item> parse(const std::string& text, const std::string& filter);
    // Fetch 'name' from the accessor and parse it.  If there's no
    // such list, the innermost exception is a not_found_error.
    std::vector<item> parse_member(const std::string& name, const std::string& filter);

private:
    content_accessor& src_;
    std::vector<item> parse(const std::string& text, const std::string& filter,
                            std::vector<std::string>& chain);
    void expand_include(geocore::str_view line, geocore::str_view name,
                        const std::string& filter,
                        std::vector<std::string>& chain, std::vector<item>& out);
};

} // namespace geosite123
