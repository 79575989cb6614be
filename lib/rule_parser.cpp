#include "geosite123/rule_parser.hpp"
#include <geocore/diag.hpp>
#include <geocore/strutils.hpp>
#include <algorithm>
#include <exception>

using namespace geocore;

static auto _parse = diag_name("parse");

namespace{
const char WS[] = " \t";

struct prefix_kind{
    geocore::str_view prefix;
    geosite123::rule_kind kind;
};

const prefix_kind prefixes[] = {
    {"domain:", geosite123::rule_kind::domain_suffix},
    {"full:", geosite123::rule_kind::domain},
    {"keyword:", geosite123::rule_kind::domain_keyword},
    {"regexp:", geosite123::rule_kind::domain_regex},
};

// Split line into its first whitespace-delimited token and whatever
// follows the separating whitespace.
void split_token(str_view line, str_view* token, str_view* rest){
    auto ws = line.find_first_of(WS);
    if(ws == str_view::npos){
        *token = line;
        *rest = {};
        return;
    }
    *token = line.substr(0, ws);
    *rest = sv_lstrip(line.substr(ws));
}

bool has_rules(const std::vector<geosite123::item>& items){
    return std::any_of(items.begin(), items.end(),
                       [](const geosite123::item& i){ return i.kind == geosite123::item_kind::rule; });
}
} // namespace <anon>

namespace geosite123{

const char* rule_kind_name(rule_kind k){
    switch(k){
    case rule_kind::domain_suffix: return "domain_suffix";
    case rule_kind::domain: return "domain";
    case rule_kind::domain_keyword: return "domain_keyword";
    case rule_kind::domain_regex: return "domain_regex";
    }
    return "unknown";
}

bool matches_filter(str_view trailing, const std::string& filter){
    if(filter.empty())
        return true;
    trailing = sv_strip(trailing);
    if(!startswith(trailing, "@"))
        return false;
    // Walk the whitespace-separated tokens.  A '#' starts a comment,
    // and nothing after it counts as an attribute.
    std::string want = "@" + filter;
    size_t pos = 0;
    while(pos < trailing.size()){
        auto b = trailing.find_first_not_of(WS, pos);
        if(b == str_view::npos)
            break;
        auto e = trailing.find_first_of(WS, b);
        auto tok = trailing.substr(b, e==str_view::npos ? str_view::npos : e-b);
        if(tok == want)
            return true;
        if(tok.find('#') != str_view::npos)
            return false;
        if(e == str_view::npos)
            break;
        pos = e;
    }
    return false;
}

std::vector<item> rule_parser::parse(const std::string& text, const std::string& filter){
    std::vector<std::string> chain;
    return parse(text, filter, chain);
}

std::vector<item> rule_parser::parse_member(const std::string& name, const std::string& filter) try {
    std::vector<std::string> chain{name};
    return parse(src_.fetch_member(name), filter, chain);
 }catch(cyclic_include_error&){
    throw;
 }catch(std::exception&){
    std::throw_with_nested(std::runtime_error(fmt("rule_parser: while parsing list '%s'", name.c_str())));
 }

std::vector<item> rule_parser::parse(const std::string& text, const std::string& filter,
                                     std::vector<std::string>& chain) /*private*/{
    std::vector<item> out;
    for(auto rawline : svsplit_exact(text, "\n")){
        auto line = sv_strip(rawline);
        if(line.empty())
            continue;
        if(startswith(line, "#")){
            out.push_back(item::make_comment(std::string(line)));
            continue;
        }
        str_view token, rest;
        split_token(line, &token, &rest);
        if(startswith(token, "include:")){
            token.remove_prefix(8);
            expand_include(line, token, filter, chain, out);
            continue;
        }
        rule_kind kind = rule_kind::domain_suffix;
        for(const auto& pk : prefixes){
            if(startswith(token, pk.prefix)){
                token.remove_prefix(pk.prefix.size());
                kind = pk.kind;
                break;
            }
        }
        if(token.empty()){
            DIAG(_parse, "dropping rule with empty value: " << line);
            continue;
        }
        if(!matches_filter(rest, filter))
            continue;
        out.push_back(item::make_rule(kind, std::string(token), std::string(rest)));
    }
    return out;
}

void rule_parser::expand_include(str_view line, str_view name, const std::string& filter,
                                 std::vector<std::string>& chain, std::vector<item>& out) /*private*/{
    std::string sname(name);
    if(std::find(chain.begin(), chain.end(), sname) != chain.end())
        throw cyclic_include_error(fmt("include cycle: %s -> %s", strbe(" -> ", chain.begin(), chain.end()).c_str(), sname.c_str()));
    DIAG(_parse, "include " << sname << " from " << (chain.empty() ? "<top>" : chain.back()) << " depth " << chain.size());
    chain.push_back(sname);
    auto sub = parse(src_.fetch_member(sname), filter, chain);
    chain.pop_back();
    if(!has_rules(sub))
        return;
    out.push_back(item::make_comment("# " + std::string(line)));
    out.insert(out.end(), std::make_move_iterator(sub.begin()), std::make_move_iterator(sub.end()));
}

} // namespace geosite123
