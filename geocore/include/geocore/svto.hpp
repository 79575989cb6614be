#pragma once

// svto<T>(sv) - convert a str_view to a T.  Leading and trailing
// whitespace is permitted.  Anything else that isn't consumed by the
// conversion is an error, as is overflow.
//
//    auto port = svto<unsigned short>("8080");
//    auto ttl = svto<double>(" 1800.5 ");
//    auto on = svto<bool>("true");   // also 1/0, yes/no, on/off

#include "geocore/strutils.hpp"
#include <charconv>
#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace geocore{

template <typename T>
typename std::enable_if<std::is_integral<T>::value && !std::is_same<T, bool>::value, T>::type
svto(str_view sv){
    auto s = sv_strip(sv);
    if(!s.empty() && s.front() == '+')
        s.remove_prefix(1);
    T ret{};
    auto r = std::from_chars(s.data(), s.data()+s.size(), ret);
    if(s.empty() || r.ec == std::errc::invalid_argument)
        throw std::invalid_argument("svto: not an integer: \"" + std::string(sv) + "\"");
    if(r.ec == std::errc::result_out_of_range)
        throw std::out_of_range("svto: out of range: \"" + std::string(sv) + "\"");
    if(r.ptr != s.data()+s.size())
        throw std::invalid_argument("svto: trailing characters after integer: \"" + std::string(sv) + "\"");
    return ret;
}

template <typename T>
typename std::enable_if<std::is_floating_point<T>::value, T>::type
svto(str_view sv){
    std::string s(sv_strip(sv));
    if(s.empty())
        throw std::invalid_argument("svto: empty string is not a number");
    char *endp;
    errno = 0;
    long double x = ::strtold(s.c_str(), &endp);
    if(errno == ERANGE)
        throw std::out_of_range("svto: out of range: \"" + s + "\"");
    if(*endp != '\0' || endp == s.c_str())
        throw std::invalid_argument("svto: not a number: \"" + s + "\"");
    return static_cast<T>(x);
}

template <typename T>
typename std::enable_if<std::is_same<T, bool>::value, T>::type
svto(str_view sv){
    auto s = tolower(sv_strip(sv));
    if(s == "1" || s == "true" || s == "yes" || s == "on")
        return true;
    if(s == "0" || s == "false" || s == "no" || s == "off")
        return false;
    throw std::invalid_argument("svto: not a boolean: \"" + std::string(sv) + "\"");
}

template <typename T>
typename std::enable_if<std::is_same<T, std::string>::value, T>::type
svto(str_view sv){
    return std::string(sv);
}

} // namespace geocore
