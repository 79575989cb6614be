#pragma once

// Translation of regexp: rules into Surge's DOMAIN-WILDCARD syntax,
// where '?' is any one character and '*' is any run of characters.
//
// The translation loses information: classes become '?', and every
// quantifier and alternation becomes '*'.  is_dangerous() says
// whether the loss is too much to publish, either because the regex
// uses a construct the wildcard can't bound (a class, an alternation,
// a counted repeat) or because the wildcard that comes out would
// match nearly everything.
//
// A leading and a trailing '/' are ignored, so /^foo\.com$/ and
// ^foo\.com$ translate the same way.

#include <geocore/strutils.hpp>
#include <string>

namespace geosite123{

struct regex_node;

// "" if the pattern doesn't parse.
std::string to_wildcard(geocore::str_view pattern);
// True if the pattern doesn't parse.
bool is_dangerous(geocore::str_view pattern);

struct wildcard_pattern{
    std::string wildcard;
    bool dangerous;
};

// Both of the above with a single parse.
wildcard_pattern translate(geocore::str_view pattern);

// The pieces, for callers that already have a tree.
std::string wildcard_of(const regex_node& n);
bool has_imprecise_node(const regex_node& n);
bool is_broad_wildcard(geocore::str_view w);

} // namespace geosite123
