#pragma once

// Exceptions that cross module boundaries.  They are system_errors
// in the http category, so the server can turn the innermost one
// into a reply status without knowing where it came from.
//
//   transport_error      502  upstream unreachable, non-200, timeout
//   format_error         500  bytes that can't be decoded (zip, utf-8, ...)
//   cyclic_include_error 500  a list includes itself, maybe indirectly
//   not_found_error      404  no such list in the archive

#include <geocore/http_error_category.hpp>
#include <system_error>
#include <string>

namespace geosite123{

struct transport_error : public std::system_error{
    explicit transport_error(const std::string& what) :
        std::system_error(502, geocore::http_error_category(), what){}
};

struct format_error : public std::system_error{
    explicit format_error(const std::string& what) :
        std::system_error(500, geocore::http_error_category(), what){}
};

struct cyclic_include_error : public format_error{
    explicit cyclic_include_error(const std::string& what) : format_error(what){}
};

struct not_found_error : public std::system_error{
    explicit not_found_error(const std::string& what) :
        std::system_error(404, geocore::http_error_category(), what){}
};

} // namespace geosite123
