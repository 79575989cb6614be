#pragma once
// various convenient string handling utilities

#include <string_view>
#include <iostream>
#include <vector>
#include <string>
#include <cstring>
#include <cstdarg>
#include <sstream>
#include <memory>
#include <stdexcept>
#include <cctype>

namespace geocore {

using str_view = std::string_view;

// endswith,startswith,lstrip,rstrip - basic string utiltities that are trickier than
// they first appear.

inline bool endswith(str_view s, str_view suf){
    if( suf.size() > s.size() )
        return false;
    return s.compare(s.size()-suf.size(), suf.size(), suf)==0;
}

inline bool startswith(str_view s, str_view pfx){
    if( pfx.size() > s.size() )
        return false;
    return s.compare(0, pfx.size(), pfx)==0;
}

inline str_view sv_rstrip(str_view s){
    auto i = s.find_last_not_of(" \r\n\t\f\v");
    if (i == s.npos)
        return "";
    return s.substr(0, i+1);
}

inline str_view sv_lstrip(str_view s){
    auto i = s.find_first_not_of(" \r\n\t\f\v");
    if (i == s.npos)
        return "";
    return s.substr(i);
}

inline str_view sv_strip(str_view s){
    return sv_lstrip(sv_rstrip(s));
}

inline std::string lstrip(str_view s) { return std::string(sv_lstrip(s)); }
inline std::string rstrip(str_view s) { return std::string(sv_rstrip(s)); }
inline std::string strip(str_view s) { return std::string(sv_strip(s)); }

// ASCII-only.  Domain names and option names are all we ever fold.
inline std::string tolower(str_view s){
    std::string ret(s);
    for(auto& c : ret)
        c = std::tolower(static_cast<unsigned char>(c));
    return ret;
}

// svsplit_exact - split a str_view, s, into a vector of str_views by
// some delimiter, d.  Only characters in s at positions greater than
// or equal to start are considered.  If start is greater than
// s.size(), an empty vector is returned.
//
// odd/surprising corner cases:
//   it's an error if delim is empty
//
//   if s[start] starts with delim, the first element of the returned
//         vector is the empty string
//
//   if s ends with delim, the last element of the returned vector
//         is the empty string.
inline auto svsplit_exact(str_view s, str_view delim, size_t start = 0)
{
    std::vector<str_view> v;
    if(delim.empty())
        throw std::invalid_argument("svsplit_exact delim must be non-empty");
    while(start <= s.size()){
        auto next = s.find(delim, start);
        v.push_back(s.substr(start, next-start));
        if(next == str_view::npos)
            break;
        start = next+delim.size();
    }
    return v;
}

namespace detail{
inline void ins_sep(std::ostream&, const char*){}

template <typename T, typename ... Rest>
void ins_sep(std::ostream& os, const char* sep, const T& first, const Rest& ... rest){
    os << first;
    if(sizeof...(rest)){
        os << sep;
        ins_sep(os, sep, rest...);
    }
}
} // namespace detail

// str_sep, str - return a string formed by inserting the arguments
// into an ostringstream, separated by sep (or a single space).
template <typename ... Types>
std::string
str_sep(const char *sep, Types const& ... values){
    std::ostringstream oss;
    detail::ins_sep(oss, sep, values...);
    return oss.str();
}

template <typename ... Types>
std::string
str(Types const& ... values){
    return str_sep(" ", values...);
}

template <typename ITER>
std::string
strbe(const char *sep, ITER b, ITER e){
    std::ostringstream oss;
    for(auto i=b; i!=e; ++i){
        if(i!=b)
            oss << sep;
        oss << *i;
    }
    return oss.str();
}

template <typename COLL>
std::string
strbe(const COLL& coll){
    return strbe(" ", std::begin(coll), std::end(coll));
}

inline std::string
vfmt(const char *fmt, va_list va){
    size_t plen = 512;
    va_list ap;
    bool retried = false;
    std::unique_ptr<char[]> p;

 retry:
    p.reset(new char[plen]);
    va_copy(ap, va);
    auto n = vsnprintf(p.get(), plen, fmt, ap);
    va_end(ap);
    if(n<0)
        throw std::runtime_error("vsnprintf returned negative in vfmt");
    if(size_t(n)>=plen){
        if(retried)
            throw std::runtime_error("vsnprintf lied to vfmt about how much space it would need");
        retried = true;
        plen = n+1;
        goto retry;
    }
    return {p.get(), size_t(n)};
}

inline std::string fmt(const char  *fmt, ...)
    __attribute__ ((__format__ (__printf__, 1, 2)));
inline std::string fmt(const char *fmt, ...){
    va_list ap;
    va_start(ap, fmt);
    auto ret = vfmt(fmt, ap);
    va_end(ap);
    return ret;
}

} // namespace geocore
