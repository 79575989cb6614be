#include "geosite123/render.hpp"
#include "geosite123/wildcard.hpp"
#include <geocore/diag.hpp>
#include <stdexcept>

using namespace geocore;

static auto _render = diag_name("render");

namespace{
using namespace geosite123;

// A wildcard with no literal characters at all.
bool only_wildcards(str_view w){
    return !w.empty() && w.find_first_not_of("*?") == str_view::npos;
}

std::string common_rule(const rule& r){
    switch(r.kind){
    case rule_kind::domain_suffix: return "DOMAIN-SUFFIX," + r.value;
    case rule_kind::domain: return "DOMAIN," + r.value;
    case rule_kind::domain_keyword: return "DOMAIN-KEYWORD," + r.value;
    case rule_kind::domain_regex: break;
    }
    return r.value;
}

// Shared by surge and mihomo.
template <typename RULEFN>
std::string render_lines(const std::vector<item>& items, RULEFN rulefn){
    std::vector<std::string> out;
    std::vector<std::string> includes;
    std::string pending;
    for(const auto& i : items){
        if(i.kind == item_kind::comment){
            if(startswith(sv_strip(i.comment), "# include:"))
                includes.push_back(i.comment);
            else
                pending = i.comment;
            continue;
        }
        auto line = rulefn(i.r);
        if(startswith(sv_strip(line), "#")){
            pending = std::move(line);
            continue;
        }
        out.insert(out.end(), includes.begin(), includes.end());
        includes.clear();
        if(!pending.empty()){
            out.push_back(std::move(pending));
            pending.clear();
        }
        out.push_back(std::move(line));
    }
    return strbe("\n", out.begin(), out.end());
}

std::string render_egern(const std::vector<item>& items){
    std::vector<std::string> sets[4];   // indexed like the names below
    const char* names[4] = {"domain_set", "domain_suffix_set", "domain_keyword_set", "domain_regex_set"};
    for(const auto& i : items){
        if(i.kind != item_kind::rule)
            continue;
        switch(i.r.kind){
        case rule_kind::domain: sets[0].push_back(i.r.value); break;
        case rule_kind::domain_suffix: sets[1].push_back(i.r.value); break;
        case rule_kind::domain_keyword: sets[2].push_back(i.r.value); break;
        case rule_kind::domain_regex: sets[3].push_back(i.r.value); break;
        }
    }
    std::string ret;
    for(int k=0; k<4; ++k){
        if(sets[k].empty())
            continue;
        ret += names[k];
        ret += ":\n";
        for(const auto& v : sets[k]){
            ret += "  - ";
            ret += go_quote(v);
            ret += "\n";
        }
    }
    return rstrip(ret);
}
} // namespace <anon>

namespace geosite123{

const char* dialect_name(dialect d){
    switch(d){
    case dialect::surge: return "surge";
    case dialect::mihomo: return "mihomo";
    case dialect::egern: return "egern";
    }
    return "unknown";
}

dialect dialect_from_name(str_view name){
    if(name == "surge")
        return dialect::surge;
    if(name == "mihomo")
        return dialect::mihomo;
    if(name == "egern")
        return dialect::egern;
    throw std::invalid_argument(fmt("unknown dialect: '%.*s'", int(name.size()), name.data()));
}

std::string append_comment(std::string line, const std::string& comment){
    if(comment.empty())
        return line;
    if(startswith(comment, "#"))
        return line + " " + comment;
    return line + " # " + comment;
}

std::string render_surge_rule(const rule& r){
    if(r.kind != rule_kind::domain_regex)
        return append_comment(common_rule(r), r.comment);
    auto t = translate(r.value);
    if(t.dangerous)
        return append_comment("# DANGEROUS-REGEX," + r.value, r.comment);
    if(only_wildcards(t.wildcard))
        return append_comment("# SKIPPED-DOMAIN-WILDCARD," + t.wildcard, r.comment);
    return append_comment("DOMAIN-WILDCARD," + t.wildcard, r.comment);
}

std::string render_mihomo_rule(const rule& r){
    if(r.kind == rule_kind::domain_regex)
        return append_comment("DOMAIN-REGEX," + r.value, r.comment);
    return append_comment(common_rule(r), r.comment);
}

std::string render(const std::vector<item>& items, dialect d){
    DIAG(_render, "rendering " << items.size() << " items as " << dialect_name(d));
    switch(d){
    case dialect::surge: return render_lines(items, render_surge_rule);
    case dialect::mihomo: return render_lines(items, render_mihomo_rule);
    case dialect::egern: return render_egern(items);
    }
    throw std::invalid_argument("render: unknown dialect");
}

std::string go_quote(str_view s){
    std::string ret = "\"";
    for(size_t i=0; i<s.size(); ){
        auto c = static_cast<unsigned char>(s[i]);
        if(c < 0x80){
            i++;
            switch(c){
            case '\a': ret += "\\a"; continue;
            case '\b': ret += "\\b"; continue;
            case '\f': ret += "\\f"; continue;
            case '\n': ret += "\\n"; continue;
            case '\r': ret += "\\r"; continue;
            case '\t': ret += "\\t"; continue;
            case '\v': ret += "\\v"; continue;
            case '\\': ret += "\\\\"; continue;
            case '"': ret += "\\\""; continue;
            }
            if(c < 0x20 || c == 0x7f)
                ret += fmt("\\x%02x", c);
            else
                ret.push_back(char(c));
            continue;
        }
        // Multi-byte.  Copy it through if it's well-formed.
        size_t n = (c & 0xE0) == 0xC0 ? 2 : (c & 0xF0) == 0xE0 ? 3 : (c & 0xF8) == 0xF0 ? 4 : 0;
        bool ok = n && i + n <= s.size();
        char32_t r = n==2 ? (c & 0x1F) : n==3 ? (c & 0x0F) : (c & 0x07);
        for(size_t k=1; ok && k<n; ++k){
            auto cc = static_cast<unsigned char>(s[i+k]);
            ok = (cc & 0xC0) == 0x80;
            r = (r<<6) | (cc & 0x3F);
        }
        // Reject overlong forms and surrogates as Go does.
        if(ok && ((n==2 && r < 0x80) || (n==3 && r < 0x800) || (n==4 && (r < 0x10000 || r > 0x10FFFF)) || (r >= 0xD800 && r <= 0xDFFF)))
            ok = false;
        if(!ok){
            ret += fmt("\\x%02x", c);
            i++;
            continue;
        }
        // C1 controls and the line/paragraph separators aren't printable.
        if(r < 0xA0 || r == 0xAD || r == 0x2028 || r == 0x2029 || r == 0xFEFF)
            ret += fmt("\\u%04x", unsigned(r));
        else
            ret.append(s.data()+i, n);
        i += n;
    }
    ret += "\"";
    return ret;
}

} // namespace geosite123
