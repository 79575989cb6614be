#pragma once

// render - turn parsed items into a ruleset in one of the client
// dialects.
//
// surge and mihomo are line-oriented (DOMAIN-SUFFIX,example.com).
// Comments are carried along, but only when a rule follows them:
// '# include:...' markers accumulate until the next emitted rule,
// while any other comment replaces the one pending before it.  A
// surge regexp: rule that can't safely be a DOMAIN-WILDCARD is
// rendered as a comment, and so becomes the pending comment itself.
// If no rule follows it, it doesn't appear in the output at all.
//
// egern is YAML, one list per rule kind, with no comments.

#include "geosite123/rule_parser.hpp"
#include <string>
#include <vector>

namespace geosite123{

enum class dialect{ surge, mihomo, egern };

const char* dialect_name(dialect d);
// Throws std::invalid_argument for anything but surge, mihomo or egern.
dialect dialect_from_name(geocore::str_view name);

std::string render(const std::vector<item>& items, dialect d);

// The pieces.
std::string render_surge_rule(const rule& r);
std::string render_mihomo_rule(const rule& r);
std::string append_comment(std::string line, const std::string& comment);
// A double-quoted string with Go strconv.Quote escapes.  Invalid
// utf-8 comes out as \xHH.
std::string go_quote(geocore::str_view s);

} // namespace geosite123
