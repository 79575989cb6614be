#pragma once

// sew - system_error wrappers.  sew::foo calls ::foo, and if ::foo
// reports an error, throws a std::system_error carrying errno and a
// what() string that looks like the call, e.g.,
//
//    open(/var/cache/geo/zip.tmp, 577, 420): No such file or directory
//
// Callers write
//
//    auto fd = sew::open(path.c_str(), O_WRONLY|O_CREAT|O_TRUNC, 0644);
//    sew::write(fd, p, n);
//
// and let the exception propagate.  Only the calls geosite123 needs
// are wrapped.

#include "geocore/throwutils.hpp"
#include <system_error>
#include <string>
#include <cerrno>
#include <sys/types.h>
#include <sys/stat.h>
#include <sys/uio.h>
#include <fcntl.h>
#include <unistd.h>
#include <stdio.h>
#include <signal.h>
#include <sys/socket.h>

namespace geocore { namespace sew {

// wrap - if f returns errval, throw a system_error.  Otherwise return
// what f returned.
template <typename R, typename ... Args>
constexpr auto
wrap(R (*f)(Args...), const char *name, R errval=static_cast<R>(-1)){
    return [f,name,errval](Args ... args){
        auto ret = f(args...);
        if( ret == errval )
            throw se(strfunargs(name, args ...));
        return ret;
    };
}

// wrap_void - the return value only signals errors.
template <typename R, typename ... Args>
constexpr auto
wrap_void(R (*f)(Args...), const char *name, R errval=static_cast<R>(-1)){
    return [f,name,errval](Args ... args){
        if(f(args...) == errval)
            throw se(strfunargs(name, args...));
    };
}

#define _wrap(name) static decltype(wrap(&::name, #name)) name = wrap(&::name, #name)
#define _wrap_void(name) static decltype(wrap_void(&::name, #name)) name = wrap_void(&::name, #name)

_wrap_void(fstat);
_wrap_void(stat);
_wrap(read);
_wrap(write);
_wrap(writev);
_wrap_void(close);
_wrap_void(fsync);
_wrap_void(unlink);
_wrap_void(rename);
_wrap_void(mkdir);
_wrap(getpid);
_wrap_void(sigaction);
_wrap_void(getsockname);
_wrap_void(gethostname);

#undef _wrap
#undef _wrap_void

// open is declared with an ellipsis, so it needs special handling.
static inline int open(const char* name, int flags, mode_t mode=0){
    int ret = ::open(name, flags, mode);
    if( ret < 0 )
        throw se(strfunargs("open", name, flags, mode));
    return ret;
}

} } // namespace geocore::sew
