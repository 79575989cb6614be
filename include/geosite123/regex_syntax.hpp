#pragma once

// regex_syntax - a parser for Perl-flavored regular expressions that
// produces a syntax tree rather than a matcher.  The wildcard
// translator walks the tree; nothing here ever matches anything.
//
// Supported: literals, . ^ $ [...] [^...] [[:alpha:]], | ( ) (?:...)
// (?P<name>...) (?<name>...) (?flags) (?flags:...) with flags imsU,
// * + ? {n} {n,} {n,m} and their non-greedy forms, and the escapes
// \d \D \s \S \w \W \b \B \A \z \pX \p{Name} \PX \p{^Name} \Q...\E
// \a \f \n \r \t \v \0 \123 \xHH \x{H...} \<punctuation>.
//
// The tree is simplified in a few of the ways Go's regexp/syntax
// simplifies it: runs of literal characters are a single literal
// node, a class that holds one character is a literal, and adjacent
// single-character alternatives are folded into one class.  With (?i)
// an ASCII literal letter is recorded in upper case and marked
// fold_case.
//
// Anything malformed or unsupported (backreferences, lookaround)
// throws regex_error.  So does a repeat count over 1000 and groups
// nested more than 1000 deep.

#include <geocore/strutils.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace geosite123{

struct regex_error : public std::runtime_error{
    explicit regex_error(const std::string& what) : std::runtime_error(what){}
};

enum class node_kind{
    no_match,
    empty_match,
    literal,
    char_class,
    any_char_not_nl,
    any_char,
    begin_line,
    end_line,
    begin_text,
    end_text,
    word_boundary,
    no_word_boundary,
    capture,
    star,
    plus,
    quest,
    repeat,
    concat,
    alternate
};

struct regex_node{
    node_kind kind = node_kind::empty_match;
    std::u32string runes;       // literal: the characters.  char_class: lo,hi pairs
    std::vector<std::string> unicode_classes; // char_class: "L", "^Greek", ...
    bool negated = false;       // char_class: only when unicode_classes is non-empty
    bool fold_case = false;
    bool non_greedy = false;
    int min = 0, max = 0;       // repeat.  max == -1 means unbounded
    int cap = 0;                // capture index, starting at 1
    std::string name;           // capture name, if any
    std::vector<regex_node> sub;
};

regex_node parse_regex(geocore::str_view pattern);

// The characters of a literal node, utf-8 encoded.
std::string literal_text(const regex_node& n);

// A compact rendering of the tree, e.g., cat{bot{}plus{cc{a-z}}lit{.com}}.
// For tests and diagnostics.
std::string dump(const regex_node& n);

} // namespace geosite123
