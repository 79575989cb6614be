#include "geosite123/wildcard.hpp"
#include "geosite123/regex_syntax.hpp"
#include <geocore/diag.hpp>

using namespace geocore;

static auto _wildcard = diag_name("wildcard");

namespace{
str_view trim_slashes(str_view p){
    if(startswith(p, "/"))
        p.remove_prefix(1);
    if(endswith(p, "/"))
        p.remove_suffix(1);
    return p;
}
} // namespace <anon>

namespace geosite123{

std::string wildcard_of(const regex_node& n){
    switch(n.kind){
    case node_kind::no_match:
    case node_kind::empty_match:
        return "";
    case node_kind::literal:
        return literal_text(n);
    case node_kind::char_class:
    case node_kind::any_char_not_nl:
    case node_kind::any_char:
        return "?";
    case node_kind::begin_line:
    case node_kind::end_line:
    case node_kind::begin_text:
    case node_kind::end_text:
    case node_kind::word_boundary:
    case node_kind::no_word_boundary:
        return "";
    case node_kind::capture:
    case node_kind::concat:{
        std::string ret;
        for(const auto& s : n.sub)
            ret += wildcard_of(s);
        return ret;
    }
    case node_kind::star:
    case node_kind::plus:
    case node_kind::quest:
    case node_kind::repeat:
    case node_kind::alternate:
        return "*";
    default:
        return "?";
    }
}

bool has_imprecise_node(const regex_node& n){
    switch(n.kind){
    case node_kind::char_class:
    case node_kind::alternate:
    case node_kind::repeat:
        return true;
    case node_kind::star:
    case node_kind::plus:
    case node_kind::quest:
    case node_kind::capture:
    case node_kind::concat:
        for(const auto& s : n.sub)
            if(has_imprecise_node(s))
                return true;
        return false;
    default:
        return false;
    }
}

// Too broad: nothing but '*', '?' and '.', or three or more '?'.
bool is_broad_wildcard(str_view w){
    if(w.empty())
        return false;
    if(w.find_first_not_of("*?.") == str_view::npos)
        return true;
    size_t nq = 0;
    for(auto c : w)
        if(c == '?')
            nq++;
    return nq >= 3;
}

wildcard_pattern translate(str_view pattern){
    auto p = trim_slashes(pattern);
    regex_node tree;
    try{
        tree = parse_regex(p);
    }catch(regex_error& e){
        DIAG(_wildcard, "unparseable regex: " << e.what());
        return {"", true};
    }
    wildcard_pattern ret{wildcard_of(tree), false};
    ret.dangerous = has_imprecise_node(tree) || is_broad_wildcard(ret.wildcard);
    DIAG(_wildcard, p << " -> " << ret.wildcard << (ret.dangerous ? " (dangerous)" : ""));
    return ret;
}

std::string to_wildcard(str_view pattern){
    return translate(pattern).wildcard;
}

bool is_dangerous(str_view pattern){
    return translate(pattern).dangerous;
}

} // namespace geosite123
