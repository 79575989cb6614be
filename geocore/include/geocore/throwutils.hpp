#pragma once

#include <geocore/strutils.hpp>
#include <system_error>
#include <string>
#include <errno.h>

namespace geocore {

// se - shorthand for constructing a std::system_error in the
//   system category:
//
//     throw se(ENOENT, str("no snapshot at", path));
//     throw se("write failed");   // uses the current errno
//
inline std::system_error se(int eno, const std::string& msg){
    return std::system_error(eno, std::system_category(), msg);
}

inline std::system_error se(const std::string& msg){
    return se(errno, msg);
}

// strfunargs - a 'what' string that looks like a call:
//    strfunargs(__func__, name, filter) -> "parse(google, cn)"
template <typename ... Args>
std::string
strfunargs(const std::string& name, Args ... args){
    return name + "(" + str_sep(", ", args...) + ")";
}

} // namespace geocore
