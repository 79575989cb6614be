#include "geocore/http_error_category.hpp"

namespace geocore {

std::error_condition
http_error_category_t::default_error_condition(int ev) const noexcept {
    if(ev>=200 && ev<300) return std::error_condition(static_cast<int>(http_errc::success), *this);
    else if(ev>=400 && ev<500) return std::error_condition(static_cast<int>(http_errc::client_error), *this);
    else if(ev>=500 && ev<600) return std::error_condition(static_cast<int>(http_errc::server_error), *this);
    else return std::error_condition(static_cast<int>(http_errc::other), *this);
}

std::string
http_error_category_t::message(int ev) const{
    switch(ev){
    case 200: return "200 OK";
    case 302: return "302 Found";
    case 304: return "304 Not Modified";
    case 400: return "400 Bad Request";
    case 403: return "403 Forbidden";
    case 404: return "404 Not Found";
    case 405: return "405 Method Not Allowed";
    case 408: return "408 Request Timeout";
    case 413: return "413 Request Entity Too Large";
    case 414: return "414 Request-URI Too Long";
    case 500: return "500 Internal Server Error";
    case 501: return "501 Not Implemented";
    case 502: return "502 Bad Gateway";
    case 503: return "503 Service Unavailable";
    case 504: return "504 Gateway Timeout";
    default:  return std::to_string(ev) + " Unknown HTTP status";
    }
}

http_error_category_t& http_error_category(){
    static http_error_category_t cat;
    return cat;
}

} // namespace geocore
