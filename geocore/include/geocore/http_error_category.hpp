#pragma once
// Lets http status codes ride in std::system_error.
//
//  httpthrow(404, "no such list");
//   ...
//  }catch(std::system_error& se){
//     if(se.code().category() == http_error_category()){
//        ... se.code().value() is the status ...
//     }
//  }

#include <system_error>
#include <string>

namespace geocore {

enum class http_errc { success=0, client_error, server_error, other };

struct http_error_category_t : public std::error_category{
    const char *name() const noexcept override { return "http"; }
    std::error_condition default_error_condition(int ev) const noexcept override;
    bool equivalent(int code, const std::error_condition& condition) const noexcept override{
        return default_error_condition(code) == condition;
    }
    std::string message(int ev) const override;
};

http_error_category_t& http_error_category();

inline std::error_condition make_error_condition(http_errc e){
    return std::error_condition(static_cast<int>(e), http_error_category());
}

inline std::system_error http_exception(int status, const std::string& msg){
    return std::system_error(status, http_error_category(), msg);
}

[[noreturn]] inline void httpthrow(int status, const std::string& msg){
    throw http_exception(status, msg);
}

} // namespace geocore

namespace std{
template<> struct is_error_condition_enum<geocore::http_errc> : public true_type{};
}
