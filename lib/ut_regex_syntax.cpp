#include "geosite123/regex_syntax.hpp"
#include <geocore/ut.hpp>
#include <string>

using namespace geosite123;

namespace{
std::string d(const char* re){
    return dump(parse_regex(re));
}
} // namespace <anon>

int main(int, char **){
    EQSTR(d(""), "emp{}");
    EQSTR(d("abc"), "lit{abc}");
    EQSTR(d("^www\\.google\\.com$"), "cat{bot{}lit{www.google.com}eot{}}");
    EQSTR(d("[a-z]+\\.example\\.com"), "cat{plus{cc{a-z}}lit{.example.com}}");
    // a quantifier binds to the last character only
    EQSTR(d("abc+"), "cat{lit{ab}plus{lit{c}}}");
    EQSTR(d("a*?"), "nstar{lit{a}}");
    EQSTR(d("(?U)a*"), "nstar{lit{a}}");
    EQSTR(d("a??"), "nque{lit{a}}");
    EQSTR(d("\\d{2,3}"), "rep{2,3 cc{0-9}}");
    EQSTR(d("x{2,}"), "rep{2,-1 lit{x}}");
    EQSTR(d("."), "dnl{}");
    EQSTR(d("(?s)."), "dot{}");
    EQSTR(d("(?m)^a$"), "cat{bol{}lit{a}eol{}}");
    EQSTR(d("\\Aa\\z"), "cat{bot{}lit{a}eot{}}");
    EQSTR(d("\\bfoo\\B"), "cat{wb{}lit{foo}nwb{}}");

    // Simplifications.
    EQSTR(d("[a]"), "lit{a}");
    EQSTR(d("[Aa]"), "litfold{A}");
    EQSTR(d("(?i)abc"), "litfold{ABC}");
    EQSTR(d("(?i)a1"), "cat{litfold{A}lit{1}}");
    EQSTR(d("a|b|c"), "cc{a-c}");
    EQSTR(d("a|b|xy"), "alt{cc{a-b}lit{xy}}");
    EQSTR(d("a|"), "alt{lit{a}emp{}}");
    EQSTR(d("[^a]"), "cc{0x0-` b-0x10ffff}");
    EQSTR(d("[^\\x00-\\x{10FFFF}]"), "no{}");
    EQSTR(d("[\\x00-\\x{10FFFF}]"), "dot{}");
    EQSTR(d("[[:digit:]x]"), "cc{0-9 x}");
    EQSTR(d("(?i)[a-c]"), "cc{A-C a-c}");
    // A group's literal is neither merged into its neighbors nor split
    // by a following quantifier.
    EQSTR(d("x(?:abc)"), "cat{lit{x}lit{abc}}");
    EQSTR(d("(?:www\\.)?example"), "cat{que{lit{www.}}lit{example}}");
    EQSTR(d("(?:ab)+c"), "cat{plus{lit{ab}}lit{c}}");
    EQSTR(d("(?:a|b)"), "cc{a-b}");
    EQSTR(d("(?i:ab)c"), "cat{litfold{AB}lit{c}}");
    EQSTR(d("(?)ab"), "lit{ab}");
    EQSTR(d("(?i-s:a)"), "litfold{A}");
    EQSTR(d("\\Qa.b\\E+"), "cat{lit{a.}plus{lit{b}}}");

    // Groups.
    EQSTR(d("(a)"), "cap{lit{a}}");
    EQSTR(d("(?P<host>x)(?<tld>y)"), "cat{cap{host:lit{x}}cap{tld:lit{y}}}");
    auto n = parse_regex("(a)(b)");
    EQUAL(n.sub.size(), 2u);
    EQUAL(n.sub[1].cap, 2);

    // Unicode classes.
    EQSTR(d("\\p{Han}+"), "plus{cc{\\p{Han}}}");
    EQSTR(d("\\pL"), "cc{\\p{L}}");
    EQSTR(d("\\P{Greek}"), "cc{\\p{^Greek}}");
    EQSTR(d("[^\\p{Latin}]"), "cc{^\\p{Latin}}");

    // Escapes and literal text.
    EQSTR(literal_text(parse_regex("\\x41\\x{263a}\\101\\t")), "A\xe2\x98\xba" "A\t");
    EQSTR(literal_text(parse_regex("\xe4\xb8\xad\xe6\x96\x87")), "\xe4\xb8\xad\xe6\x96\x87");
    // A brace that isn't a repeat is a brace.
    EQSTR(literal_text(parse_regex("a{b")), "a{b");
    EQSTR(literal_text(parse_regex("a{,2}")), "a{,2}");

    // Errors.
    EXPECT_THROW(parse_regex("*a"), regex_error);
    EXPECT_THROW(parse_regex("a**"), regex_error);
    EXPECT_THROW(parse_regex("(?i)*"), regex_error);
    EXPECT_THROW(parse_regex("(ab"), regex_error);
    EXPECT_THROW(parse_regex("ab)"), regex_error);
    EXPECT_THROW(parse_regex("[ab"), regex_error);
    EXPECT_THROW(parse_regex("[z-a]"), regex_error);
    EXPECT_THROW(parse_regex("a{1001}"), regex_error);
    EXPECT_THROW(parse_regex("a{3,2}"), regex_error);
    EXPECT_THROW(parse_regex("a\\"), regex_error);
    EXPECT_THROW(parse_regex("(a)\\1"), regex_error);
    EXPECT_THROW(parse_regex("\\q"), regex_error);
    EXPECT_THROW(parse_regex("(?=a)"), regex_error);
    EXPECT_THROW(parse_regex("(?i-:a)"), regex_error);
    EXPECT_THROW(parse_regex("(?i-)a"), regex_error);
    EXPECT_THROW(parse_regex("(?--i:a)"), regex_error);
    EXPECT_THROW(parse_regex("(?<n>a)(?<n>b)"), regex_error);
    EXPECT_THROW(parse_regex("(?<>a)"), regex_error);
    EXPECT_THROW(parse_regex("\\p{Klingon}"), regex_error);
    EXPECT_THROW(parse_regex("[[:bogus:]]"), regex_error);
    EXPECT_THROW(parse_regex("\xff"), regex_error);
    EXPECT_THROW(parse_regex("\xe4\xb8"), regex_error);
    // Nesting.  1000 deep is fine, deeper is an error rather than a
    // blown stack.
    CHECK(parse_regex(std::string(1000, '(') + "a" + std::string(1000, ')')).kind == node_kind::capture);
    EXPECT_THROW(parse_regex(std::string(1001, '(') + "a" + std::string(1001, ')')), regex_error);
    EXPECT_THROW(parse_regex(std::string(200000, '(') + std::string(200000, ')')), regex_error);
    EXPECT_THROW(parse_regex(std::string(5000, '(')), regex_error);
    try{
        parse_regex(std::string(2000, '(') + std::string(2000, ')'));
        CHECK(false);
    }catch(regex_error& e){
        CHECK(std::string(e.what()).find("expression nests too deeply") != std::string::npos);
    }
    try{
        parse_regex("a{1001}");
    }catch(regex_error& e){
        CHECK(std::string(e.what()).find("invalid repeat count `{1001}`") != std::string::npos);
    }

    return utstatus();
}
