#pragma once
// netstrings, http://cr.yp.to/proto/netstrings.txt
//
//   netstring("hello") -> "5:hello,"
//
// sput_netstring writes one to an ostream.  sget_netstring reads one
// from an istream: it returns false at a clean EOF (after optional
// whitespace), and throws a runtime_error (and sets failbit) on
// anything malformed.

#include <geocore/strutils.hpp>
#include <string>
#include <stdexcept>
#include <iostream>

namespace geocore {

inline std::string netstring(str_view sv){
    auto ret = std::to_string(sv.size());
    ret.reserve(ret.size() + sv.size() + 2);
    ret.append(1, ':');
    ret.append(sv.data(), sv.size());
    ret.append(1, ',');
    return ret;
}

inline std::ostream& sput_netstring(std::ostream& out, str_view sv) {
    out << sv.size() << ':';
    out.write(sv.data(), sv.size());
    out << ',';
    return out;
}

inline bool sget_netstring(std::istream& inp, std::string* sp, size_t max_size = 999999999u) try {
    inp >> std::ws;
    if(inp.eof())
        return false;
    int c;
    size_t sz = 0;
    bool first_time = true;
    while (1) {
        c = inp.get();
        if (c == ':' && !first_time)
            break;
        if(!inp.good())
            throw std::runtime_error("sget_netstring:  reading from inp failed before end of digits");
        if(!first_time && sz==0)
            throw std::runtime_error("sget_netstring:  leading zeros not allowed on length");
        first_time = false;
        size_t digit = c - '0';
        if(digit >= 10)
            throw std::runtime_error("sget_netstring: expected a digit or colon");
        size_t oldsz = sz;
        sz = sz * 10 + digit;
        if(oldsz > sz)
            throw std::runtime_error("sget_netstring: length doesn't fit in a size_t");
    }
    if(sz > max_size)
        throw std::runtime_error("sget_netstring: length exceeds max_size argument");
    sp->resize(sz);
    inp.read(&(*sp)[0], sz);
    if(!inp.good())
        throw std::runtime_error("sget_netstring: failed to read " + std::to_string(sz) + " bytes");
    c = inp.get();
    if (c != ',')
        throw std::runtime_error("sget_netstring: did not get terminal comma");
    return true;
 }catch(std::exception&){
    inp.setstate(std::ios::failbit);
    std::string().swap(*sp);
    throw;
 }

} // namespace geocore
