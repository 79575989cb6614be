#include "geosite123/regex_syntax.hpp"
#include <geocore/diag.hpp>
#include <algorithm>
#include <cctype>
#include <set>

using namespace geocore;

static auto _regex = diag_name("regex");

namespace{
using geosite123::regex_node;
using geosite123::node_kind;
using geosite123::regex_error;

const char32_t MAX_RUNE = 0x10FFFF;
const int MAX_REPEAT = 1000;
const int MAX_NESTING = 1000;

// Unicode classes we know the names of.  \p{Name} with any other
// name is an error, as it would be in a real regex engine.
const char* const unicode_names[] = {
    "Any",
    "C", "Cc", "Cf", "Co", "Cs",
    "L", "Ll", "Lm", "Lo", "Lt", "Lu",
    "M", "Mc", "Me", "Mn",
    "N", "Nd", "Nl", "No",
    "P", "Pc", "Pd", "Pe", "Pf", "Pi", "Po", "Ps",
    "S", "Sc", "Sk", "Sm", "So",
    "Z", "Zl", "Zp", "Zs",
    "Arabic", "Armenian", "Bengali", "Bopomofo", "Common", "Cyrillic",
    "Devanagari", "Ethiopic", "Georgian", "Greek", "Gujarati", "Gurmukhi",
    "Han", "Hangul", "Hebrew", "Hiragana", "Inherited", "Kannada",
    "Katakana", "Khmer", "Lao", "Latin", "Malayalam", "Mongolian",
    "Myanmar", "Sinhala", "Tamil", "Telugu", "Thai", "Tibetan",
};

bool known_unicode_name(str_view name){
    for(auto n : unicode_names)
        if(name == n)
            return true;
    return false;
}

struct posix_class{
    const char* name;
    const char32_t* ranges;     // lo,hi pairs, 0-terminated
};

const char32_t r_alnum[] = {'0','9','A','Z','a','z',0};
const char32_t r_alpha[] = {'A','Z','a','z',0};
const char32_t r_ascii[] = {1,0x7f,0};   // 0 is added separately
const char32_t r_blank[] = {'\t','\t',' ',' ',0};
const char32_t r_cntrl[] = {1,0x1f,0x7f,0x7f,0};
const char32_t r_digit[] = {'0','9',0};
const char32_t r_graph[] = {'!','~',0};
const char32_t r_lower[] = {'a','z',0};
const char32_t r_print[] = {' ','~',0};
const char32_t r_punct[] = {'!','/',':','@','[','`','{','~',0};
const char32_t r_space[] = {'\t','\r',' ',' ',0};
const char32_t r_upper[] = {'A','Z',0};
const char32_t r_word[] = {'0','9','A','Z','_','_','a','z',0};
const char32_t r_xdigit[] = {'0','9','A','F','a','f',0};
const char32_t r_perl_space[] = {'\t','\n','\f','\r',' ',' ',0};

const posix_class posix_classes[] = {
    {"alnum", r_alnum}, {"alpha", r_alpha}, {"ascii", r_ascii},
    {"blank", r_blank}, {"cntrl", r_cntrl}, {"digit", r_digit},
    {"graph", r_graph}, {"lower", r_lower}, {"print", r_print},
    {"punct", r_punct}, {"space", r_space}, {"upper", r_upper},
    {"word", r_word}, {"xdigit", r_xdigit},
};

void append_ranges(std::u32string& dst, const char32_t* r){
    for(; *r; r += 2){
        dst.push_back(r[0]);
        dst.push_back(r[1]);
    }
}

// Sort and merge overlapping or adjacent ranges.
std::u32string normalize(const std::u32string& in){
    std::vector<std::pair<char32_t, char32_t>> v;
    for(size_t i=0; i+1<in.size(); i+=2)
        v.emplace_back(in[i], in[i+1]);
    std::sort(v.begin(), v.end());
    std::u32string out;
    for(const auto& p : v){
        if(!out.empty() && p.first <= out.back() + 1){
            out.back() = std::max(out.back(), p.second);
            continue;
        }
        out.push_back(p.first);
        out.push_back(p.second);
    }
    return out;
}

std::u32string complement(const std::u32string& in){
    auto n = normalize(in);
    std::u32string out;
    char32_t next = 0;
    for(size_t i=0; i<n.size(); i+=2){
        if(n[i] > next){
            out.push_back(next);
            out.push_back(n[i]-1);
        }
        next = n[i+1] + 1;
    }
    if(next <= MAX_RUNE){
        out.push_back(next);
        out.push_back(MAX_RUNE);
    }
    return out;
}

std::u32string negate_ranges(const char32_t* r){
    std::u32string tmp;
    append_ranges(tmp, r);
    return complement(tmp);
}

// Add the other ASCII case of any letters in the ranges.
void add_folds(std::u32string& ranges){
    std::u32string extra;
    for(size_t i=0; i+1<ranges.size(); i+=2){
        char32_t lo = ranges[i], hi = ranges[i+1];
        char32_t a = std::max<char32_t>(lo, 'a'), b = std::min<char32_t>(hi, 'z');
        if(a <= b){
            extra.push_back(a - 'a' + 'A');
            extra.push_back(b - 'a' + 'A');
        }
        a = std::max<char32_t>(lo, 'A'); b = std::min<char32_t>(hi, 'Z');
        if(a <= b){
            extra.push_back(a - 'A' + 'a');
            extra.push_back(b - 'A' + 'a');
        }
    }
    ranges += extra;
}

bool is_ascii_letter(char32_t c){
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

char32_t min_fold(char32_t c){
    if(c >= 'a' && c <= 'z')
        return c - 'a' + 'A';
    return c;
}

void encode_utf8(std::string& out, char32_t r){
    if(r < 0x80){
        out.push_back(char(r));
    }else if(r < 0x800){
        out.push_back(char(0xC0 | (r>>6)));
        out.push_back(char(0x80 | (r & 0x3F)));
    }else if(r < 0x10000){
        out.push_back(char(0xE0 | (r>>12)));
        out.push_back(char(0x80 | ((r>>6) & 0x3F)));
        out.push_back(char(0x80 | (r & 0x3F)));
    }else{
        out.push_back(char(0xF0 | (r>>18)));
        out.push_back(char(0x80 | ((r>>12) & 0x3F)));
        out.push_back(char(0x80 | ((r>>6) & 0x3F)));
        out.push_back(char(0x80 | (r & 0x3F)));
    }
}

regex_node make(node_kind k){
    regex_node n;
    n.kind = k;
    return n;
}

regex_node make_literal(char32_t r, bool fold){
    regex_node n = make(node_kind::literal);
    if(fold && is_ascii_letter(r)){
        n.fold_case = true;
        r = min_fold(r);
    }
    n.runes.push_back(r);
    return n;
}

// Finish a char_class node: normalize its ranges and replace it with
// something simpler when there is something simpler.
regex_node finish_class(regex_node n){
    if(!n.unicode_classes.empty())
        return n;
    n.runes = normalize(n.runes);
    const auto& r = n.runes;
    if(r.empty())
        return make(node_kind::no_match);
    if(r.size() == 2 && r[0] == 0 && r[1] == MAX_RUNE)
        return make(node_kind::any_char);
    if(r.size() == 4 && r[0] == 0 && r[1] == '\n'-1 && r[2] == '\n'+1 && r[3] == MAX_RUNE)
        return make(node_kind::any_char_not_nl);
    if(r.size() == 2 && r[0] == r[1])
        return make_literal(r[0], false);
    // [Aa] and friends
    if(r.size() == 4 && r[0] == r[1] && r[2] == r[3] &&
       is_ascii_letter(r[0]) && r[2] == r[0] + ('a' - 'A'))
        return make_literal(r[0], true);
    return n;
}

class parser{
public:
    explicit parser(str_view s) : s(s){}

    regex_node run(){
        auto n = parse_alternation();
        if(!eof())   // only a stray ')' gets us here
            error("unexpected )");
        return n;
    }

private:
    str_view s;
    size_t pos = 0;
    struct flags_t{
        bool fold = false;
        bool multiline = false;
        bool dotnl = false;
        bool ungreedy = false;
    } flags;
    int ncap = 0;
    int depth = 0;      // of open groups
    std::set<std::string> capnames;

    bool eof() const { return pos >= s.size(); }
    char peek() const { return s[pos]; }
    bool lookingat(str_view t) const { return startswith(s.substr(pos), t); }

    [[noreturn]] void error(const std::string& what) const{
        throw regex_error(fmt("%s at offset %zu in `%.*s`", what.c_str(), pos, int(s.size()), s.data()));
    }

    char32_t next_rune(){
        auto c = static_cast<unsigned char>(s[pos]);
        if(c < 0x80){
            pos++;
            return c;
        }
        int n;
        char32_t r;
        if((c & 0xE0) == 0xC0){ n = 1; r = c & 0x1F; }
        else if((c & 0xF0) == 0xE0){ n = 2; r = c & 0x0F; }
        else if((c & 0xF8) == 0xF0){ n = 3; r = c & 0x07; }
        else error("invalid UTF-8");
        if(pos + n >= s.size())
            error("invalid UTF-8");
        for(int i=1; i<=n; ++i){
            auto cc = static_cast<unsigned char>(s[pos+i]);
            if((cc & 0xC0) != 0x80)
                error("invalid UTF-8");
            r = (r<<6) | (cc & 0x3F);
        }
        if(r > MAX_RUNE)
            error("invalid UTF-8");
        pos += n + 1;
        return r;
    }

    regex_node parse_alternation();
    regex_node parse_concat();
    void parse_group(std::vector<regex_node>& items, bool* flags_only);
    regex_node parse_class();
    void parse_escape(std::vector<regex_node>& items);
    char32_t parse_escape_rune();
    bool maybe_class_escape(std::u32string& ranges, std::vector<std::string>& uclasses);
    bool parse_repeat_braces(int* min, int* max);
    std::string parse_unicode_name(bool* negated);
};

regex_node parser::parse_alternation(){
    std::vector<regex_node> alts;
    alts.push_back(parse_concat());
    while(!eof() && peek() == '|'){
        pos++;
        alts.push_back(parse_concat());
    }
    if(alts.size() == 1)
        return std::move(alts.front());

    // Fold runs of single-character alternatives into one class.
    auto classable = [](const regex_node& n){
        return (n.kind == node_kind::literal && n.runes.size() == 1 && !n.fold_case) ||
            (n.kind == node_kind::char_class && n.unicode_classes.empty());
    };
    std::vector<regex_node> out;
    for(size_t i=0; i<alts.size(); ){
        size_t j = i;
        while(j < alts.size() && classable(alts[j]))
            ++j;
        if(j - i >= 2){
            regex_node cc = make(node_kind::char_class);
            for(size_t k=i; k<j; ++k){
                if(alts[k].kind == node_kind::literal){
                    cc.runes.push_back(alts[k].runes[0]);
                    cc.runes.push_back(alts[k].runes[0]);
                }else{
                    cc.runes += alts[k].runes;
                }
            }
            out.push_back(finish_class(std::move(cc)));
            i = j;
        }else{
            out.push_back(std::move(alts[i++]));
        }
    }
    if(out.size() == 1)
        return std::move(out.front());
    regex_node n = make(node_kind::alternate);
    n.sub = std::move(out);
    return n;
}

regex_node parser::parse_concat(){
    std::vector<regex_node> items;
    bool last_repeat = false;
    bool last_flags = false;
    bool last_group = false;    // items.back() is a whole (?:...)
    while(!eof() && peek() != '|' && peek() != ')'){
        char c = peek();
        if(c == '*' || c == '+' || c == '?' || c == '{'){
            regex_node q;
            size_t start = pos;
            if(c == '{'){
                if(!parse_repeat_braces(&q.min, &q.max)){
                    // Not a repeat.  The brace is just a brace.
                    pos = start + 1;
                    items.push_back(make_literal('{', flags.fold));
                    last_repeat = last_flags = last_group = false;
                    continue;
                }
                q.kind = node_kind::repeat;
            }else{
                pos++;
                q.kind = c == '*' ? node_kind::star : c == '+' ? node_kind::plus : node_kind::quest;
            }
            if(items.empty() || last_flags){
                pos = start;
                error(fmt("missing argument to repetition operator `%c`", c));
            }
            if(last_repeat){
                pos = start;
                error("invalid nested repetition operator");
            }
            q.non_greedy = flags.ungreedy;
            if(!eof() && peek() == '?'){
                pos++;
                q.non_greedy = !q.non_greedy;
            }
            q.sub.push_back(std::move(items.back()));
            // A repeat of a multi-character literal applies to its
            // last character only, unless the literal was a group.
            auto& arg = q.sub.front();
            if(!last_group && arg.kind == node_kind::literal && arg.runes.size() > 1){
                regex_node last = arg;
                last.runes = arg.runes.substr(arg.runes.size()-1);
                arg.runes.pop_back();
                items.back() = std::move(arg);
                q.sub.front() = std::move(last);
                items.push_back(std::move(q));
            }else{
                items.back() = std::move(q);
            }
            last_repeat = true;
            last_flags = last_group = false;
            continue;
        }
        last_repeat = last_flags = last_group = false;
        switch(c){
        case '(':{
            bool flags_only = false;
            parse_group(items, &flags_only);
            last_flags = flags_only;
            last_group = !flags_only;
            break;
        }
        case '[':
            items.push_back(parse_class());
            break;
        case '.':
            pos++;
            items.push_back(make(flags.dotnl ? node_kind::any_char : node_kind::any_char_not_nl));
            break;
        case '^':
            pos++;
            items.push_back(make(flags.multiline ? node_kind::begin_line : node_kind::begin_text));
            break;
        case '$':
            pos++;
            items.push_back(make(flags.multiline ? node_kind::end_line : node_kind::end_text));
            break;
        case '\\':
            parse_escape(items);
            break;
        default:
            items.push_back(make_literal(next_rune(), flags.fold));
            break;
        }
        // Merge with a preceding literal of the same case-sensitivity.
        if(items.size() >= 2 && !last_flags && !last_group){
            auto& b = items.back();
            auto& a = items[items.size()-2];
            if(a.kind == node_kind::literal && b.kind == node_kind::literal && a.fold_case == b.fold_case){
                a.runes += b.runes;
                items.pop_back();
            }
        }
    }
    if(items.empty())
        return make(node_kind::empty_match);
    if(items.size() == 1)
        return std::move(items.front());
    regex_node n = make(node_kind::concat);
    n.sub = std::move(items);
    return n;
}

// At '('.  Pushes a capture or group onto items, or, for (?flags),
// changes the flags and pushes nothing.
void parser::parse_group(std::vector<regex_node>& items, bool* flags_only){
    pos++;
    std::string name;
    bool capture = true;
    flags_t saved = flags;
    if(!eof() && peek() == '?'){
        if(lookingat("?P<") || lookingat("?<")){
            pos += lookingat("?P<") ? 3 : 2;
            auto end = s.find('>', pos);
            if(end == str_view::npos)
                error("invalid named capture");
            name = std::string(s.substr(pos, end-pos));
            if(name.empty() || name.find_first_not_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_") != std::string::npos)
                error(fmt("invalid named capture `%s`", name.c_str()));
            if(!capnames.insert(name).second)
                error(fmt("duplicate capture group name `%s`", name.c_str()));
            pos = end + 1;
        }else{
            pos++;
            // (?flags) or (?flags:re)
            bool neg = false, sawflag = false;
            flags_t nf = flags;
            for(;;){
                if(eof())
                    error("missing closing )");
                char c = s[pos++];
                switch(c){
                case 'i': nf.fold = !neg; sawflag = true; continue;
                case 'm': nf.multiline = !neg; sawflag = true; continue;
                case 's': nf.dotnl = !neg; sawflag = true; continue;
                case 'U': nf.ungreedy = !neg; sawflag = true; continue;
                case '-':
                    if(neg)
                        error("invalid or unsupported Perl syntax: double negation in flags");
                    neg = true;
                    sawflag = false;
                    continue;
                case ')':
                case ':':
                    // "(?:" and "(?)" are fine.  "(?i-:" isn't.
                    if(neg && !sawflag){
                        pos--;
                        error("invalid or unsupported Perl syntax: missing flags");
                    }
                    break;
                default:
                    pos--;
                    error(fmt("invalid or unsupported Perl syntax: `(?%c`", c));
                }
                if(c == ')'){
                    flags = nf;
                    *flags_only = true;
                    return;
                }
                break;
            }
            flags = nf;
            capture = false;
        }
    }
    int cap = 0;
    if(capture)
        cap = ++ncap;
    if(++depth > MAX_NESTING)
        error("expression nests too deeply");
    auto sub = parse_alternation();
    if(eof() || peek() != ')')
        error("missing closing )");
    pos++;
    --depth;
    flags = saved;
    if(!capture){
        items.push_back(std::move(sub));
        return;
    }
    regex_node n = make(node_kind::capture);
    n.cap = cap;
    n.name = name;
    n.sub.push_back(std::move(sub));
    items.push_back(std::move(n));
}

// At '['.
regex_node parser::parse_class(){
    size_t start = pos;
    pos++;
    regex_node n = make(node_kind::char_class);
    bool negated = false;
    if(!eof() && peek() == '^'){
        negated = true;
        pos++;
    }
    bool first = true;
    for(;;){
        if(eof()){
            pos = start;
            error("missing closing ]");
        }
        char c = peek();
        if(c == ']' && !first)
            break;
        first = false;
        // [:alpha:] and [:^alpha:]
        if(lookingat("[:")){
            auto end = s.find(":]", pos+2);
            if(end != str_view::npos){
                auto name = s.substr(pos+2, end-pos-2);
                bool neg = startswith(name, "^");
                if(neg)
                    name.remove_prefix(1);
                for(const auto& pc : posix_classes){
                    if(name == pc.name){
                        std::u32string r;
                        if(name == "ascii")
                            r += {0, 0};
                        append_ranges(r, pc.ranges);
                        n.runes += neg ? complement(r) : r;
                        pos = end + 2;
                        goto next;
                    }
                }
                error(fmt("invalid character class range `[:%.*s:]`", int(name.size()), name.data()));
            }
        }
        {
            char32_t lo;
            if(c == '\\'){
                if(maybe_class_escape(n.runes, n.unicode_classes))
                    goto next;
                pos++;
                lo = parse_escape_rune();
            }else{
                lo = next_rune();
            }
            char32_t hi = lo;
            if(pos+1 < s.size() && s[pos] == '-' && s[pos+1] != ']'){
                pos++;
                if(peek() == '\\'){
                    pos++;
                    hi = parse_escape_rune();
                }else{
                    hi = next_rune();
                }
                if(hi < lo)
                    error("invalid character class range");
            }
            n.runes.push_back(lo);
            n.runes.push_back(hi);
        }
    next:
        ;
    }
    pos++;  // the ']'
    if(flags.fold)
        add_folds(n.runes);
    if(negated){
        if(n.unicode_classes.empty())
            n.runes = complement(n.runes);
        else
            n.negated = true;
    }
    return finish_class(std::move(n));
}

// At a backslash.  If it's one of the class escapes (\d, \pL, ...),
// consume it, add to ranges/uclasses and return true.
bool parser::maybe_class_escape(std::u32string& ranges, std::vector<std::string>& uclasses){
    if(pos+1 >= s.size())
        return false;
    char c = s[pos+1];
    const char32_t* r = nullptr;
    switch(c){
    case 'd': case 'D': r = r_digit; break;
    case 's': case 'S': r = r_perl_space; break;
    case 'w': case 'W': r = r_word; break;
    case 'p': case 'P':{
        pos += 2;
        bool neg = (c == 'P');
        auto name = parse_unicode_name(&neg);
        uclasses.push_back((neg ? "^" : "") + name);
        return true;
    }
    default:
        return false;
    }
    pos += 2;
    if(std::isupper(static_cast<unsigned char>(c)))
        ranges += negate_ranges(r);
    else
        append_ranges(ranges, r);
    return true;
}

// After \p or \P.
std::string parser::parse_unicode_name(bool* negated){
    if(eof())
        error("invalid character class range");
    std::string name;
    if(peek() == '{'){
        auto end = s.find('}', pos);
        if(end == str_view::npos)
            error("invalid character class range");
        name = std::string(s.substr(pos+1, end-pos-1));
        pos = end + 1;
        if(startswith(name, "^")){
            *negated = !*negated;
            name.erase(0, 1);
        }
    }else{
        name = std::string(1, s[pos++]);
    }
    if(!known_unicode_name(name))
        error(fmt("invalid character class range `\\p{%s}`", name.c_str()));
    return name;
}

// At a backslash outside a class.
void parser::parse_escape(std::vector<regex_node>& items){
    if(pos+1 >= s.size())
        error("trailing backslash at end of expression");
    char c = s[pos+1];
    switch(c){
    case 'A': pos += 2; items.push_back(make(node_kind::begin_text)); return;
    case 'z': pos += 2; items.push_back(make(node_kind::end_text)); return;
    case 'b': pos += 2; items.push_back(make(node_kind::word_boundary)); return;
    case 'B': pos += 2; items.push_back(make(node_kind::no_word_boundary)); return;
    case 'Q':{
        pos += 2;
        auto end = s.find("\\E", pos);
        auto stop = end == str_view::npos ? s.size() : end;
        while(pos < stop){
            items.push_back(make_literal(next_rune(), flags.fold));
            if(items.size() >= 2){
                auto& a = items[items.size()-2];
                auto& b = items.back();
                if(a.kind == node_kind::literal && b.kind == node_kind::literal && a.fold_case == b.fold_case){
                    a.runes += b.runes;
                    items.pop_back();
                }
            }
        }
        if(end != str_view::npos)
            pos = end + 2;
        return;
    }
    }
    regex_node cc = make(node_kind::char_class);
    if(maybe_class_escape(cc.runes, cc.unicode_classes)){
        if(flags.fold)
            add_folds(cc.runes);
        items.push_back(finish_class(std::move(cc)));
        return;
    }
    pos++;
    items.push_back(make_literal(parse_escape_rune(), flags.fold));
}

// Just past a backslash.  Returns the character the escape stands for.
char32_t parser::parse_escape_rune(){
    if(eof())
        error("trailing backslash at end of expression");
    size_t start = pos - 1;
    char c = s[pos++];
    auto isoctal = [this](){ return !eof() && peek() >= '0' && peek() <= '7'; };
    switch(c){
    case '1': case '2': case '3': case '4': case '5': case '6': case '7':
        // \1 by itself would be a backreference.
        if(!isoctal())
            break;
        /* FALLTHROUGH */
    case '0':{
        char32_t r = c - '0';
        for(int i=1; i<3 && isoctal(); ++i)
            r = r*8 + (s[pos++] - '0');
        return r;
    }
    case 'x':{
        auto hexval = [](char h) -> int {
            if(h >= '0' && h <= '9') return h - '0';
            if(h >= 'a' && h <= 'f') return h - 'a' + 10;
            if(h >= 'A' && h <= 'F') return h - 'A' + 10;
            return -1;
        };
        if(!eof() && peek() == '{'){
            pos++;
            char32_t r = 0;
            int nd = 0;
            while(!eof() && hexval(peek()) >= 0){
                r = r*16 + hexval(s[pos++]);
                if(r > MAX_RUNE)
                    break;
                nd++;
            }
            if(nd == 0 || r > MAX_RUNE || eof() || peek() != '}')
                break;
            pos++;
            return r;
        }
        if(pos+1 < s.size() && hexval(s[pos]) >= 0 && hexval(s[pos+1]) >= 0){
            char32_t r = hexval(s[pos])*16 + hexval(s[pos+1]);
            pos += 2;
            return r;
        }
        break;
    }
    case 'a': return 7;
    case 'f': return '\f';
    case 'n': return '\n';
    case 'r': return '\r';
    case 't': return '\t';
    case 'v': return '\v';
    default:
        if(static_cast<unsigned char>(c) < 0x80 && !std::isalnum(static_cast<unsigned char>(c)))
            return static_cast<unsigned char>(c);
        break;
    }
    pos = start;
    error("invalid escape sequence");
}

// At '{'.  Returns false, leaving pos wherever, if what follows
// isn't a well-formed repeat.  Throws if it is well-formed but the
// counts are out of range.
bool parser::parse_repeat_braces(int* min, int* max){
    size_t start = pos;
    pos++;
    auto number = [this](int* out){
        size_t b = pos;
        long v = 0;
        while(!eof() && std::isdigit(static_cast<unsigned char>(peek()))){
            if(v <= MAX_REPEAT)
                v = v*10 + (s[pos] - '0');
            pos++;
        }
        if(pos == b)
            return false;
        *out = v > MAX_REPEAT ? MAX_REPEAT+1 : int(v);
        return true;
    };
    if(!number(min) || eof())
        return false;
    if(peek() != ','){
        *max = *min;
    }else{
        pos++;
        if(eof())
            return false;
        if(peek() == '}')
            *max = -1;
        else if(!number(max))
            return false;
    }
    if(eof() || peek() != '}')
        return false;
    pos++;
    if(*min > MAX_REPEAT || *max > MAX_REPEAT || (*max >= 0 && *min > *max)){
        auto text = s.substr(start, pos-start);
        pos = start;
        error(fmt("invalid repeat count `%.*s`", int(text.size()), text.data()));
    }
    return true;
}

void dump_rune(std::string& out, char32_t r){
    if(r >= 0x21 && r < 0x7f && r != '-' && r != '{' && r != '}')
        out.push_back(char(r));
    else
        out += fmt("0x%x", unsigned(r));
}

void dump_to(std::string& out, const regex_node& n){
    auto subs = [&](){
        for(const auto& s : n.sub)
            dump_to(out, s);
    };
    switch(n.kind){
    case node_kind::no_match: out += "no{}"; return;
    case node_kind::empty_match: out += "emp{}"; return;
    case node_kind::literal:
        out += n.fold_case ? "litfold{" : "lit{";
        out += geosite123::literal_text(n);
        out += "}";
        return;
    case node_kind::char_class:
        out += n.negated ? "cc{^" : "cc{";
        for(size_t i=0; i+1<n.runes.size(); i+=2){
            if(i)
                out += " ";
            dump_rune(out, n.runes[i]);
            if(n.runes[i+1] != n.runes[i]){
                out += "-";
                dump_rune(out, n.runes[i+1]);
            }
        }
        for(const auto& u : n.unicode_classes){
            if(out.back() != '{' && out.back() != '^')
                out += " ";
            out += "\\p{" + u + "}";
        }
        out += "}";
        return;
    case node_kind::any_char_not_nl: out += "dnl{}"; return;
    case node_kind::any_char: out += "dot{}"; return;
    case node_kind::begin_line: out += "bol{}"; return;
    case node_kind::end_line: out += "eol{}"; return;
    case node_kind::begin_text: out += "bot{}"; return;
    case node_kind::end_text: out += "eot{}"; return;
    case node_kind::word_boundary: out += "wb{}"; return;
    case node_kind::no_word_boundary: out += "nwb{}"; return;
    case node_kind::capture:
        out += "cap{";
        if(!n.name.empty())
            out += n.name + ":";
        subs();
        out += "}";
        return;
    case node_kind::star: out += n.non_greedy ? "nstar{" : "star{"; subs(); out += "}"; return;
    case node_kind::plus: out += n.non_greedy ? "nplus{" : "plus{"; subs(); out += "}"; return;
    case node_kind::quest: out += n.non_greedy ? "nque{" : "que{"; subs(); out += "}"; return;
    case node_kind::repeat:
        out += fmt(n.non_greedy ? "nrep{%d,%d " : "rep{%d,%d ", n.min, n.max);
        subs();
        out += "}";
        return;
    case node_kind::concat: out += "cat{"; subs(); out += "}"; return;
    case node_kind::alternate: out += "alt{"; subs(); out += "}"; return;
    }
    out += "?{}";
}
} // namespace <anon>

namespace geosite123{

regex_node parse_regex(str_view pattern){
    parser p(pattern);
    auto ret = p.run();
    DIAG(_regex, pattern << " -> " << dump(ret));
    return ret;
}

std::string literal_text(const regex_node& n){
    std::string ret;
    for(auto r : n.runes)
        encode_utf8(ret, r);
    return ret;
}

std::string dump(const regex_node& n){
    std::string ret;
    dump_to(ret, n);
    return ret;
}

} // namespace geosite123
