#include "geocore/log_channel.hpp"
#include "geocore/sew.hpp"
#include "geocore/syslog_number.hpp"
#include <cstdio>
#include <stdexcept>
#include <syslog.h>

namespace geocore{

log_channel::~log_channel(){
    try{
        _close();
    }catch(std::exception&){
        // nowhere left to report it
    }
}

void log_channel::_close() /* private */{
    dest_syslog = false;
    dest_lev = 0;
    dest_fac = 0;
    if(dest_opened)
        sew::close(dest_fd);
    dest_fd = -1;
    dest_opened = false;
}

void log_channel::open(const std::string& dest, int mode){
    std::lock_guard<std::mutex> lg(mtx);
    _close();
    opened_dest = dest;
    opened_mode = mode;
    if(dest.empty() || dest == "%none"){
        return;
    }else if(startswith(dest, "%syslog")){
        parse_dest_priority(dest);
        dest_syslog = true;
    }else if(dest == "%stderr"){
        dest_fd = fileno(stderr);
    }else if(dest == "%stdout"){
        dest_fd = fileno(stdout);
    }else if(dest[0] == '%'){
        throw std::runtime_error("log_channel::open: Unrecognized %destination: "  + dest);
    }else{
        dest_fd = sew::open(dest.c_str(), O_CLOEXEC|O_WRONLY|O_APPEND|O_CREAT, mode);
        dest_opened = true;
    }
}

void log_channel::reopen(){
    std::unique_lock<std::mutex> lk(mtx);
    auto dest = opened_dest;
    auto mode = opened_mode;
    lk.unlock();
    open(dest, mode);
}

void log_channel::send(int level, str_view sv) const {
    if(sv.size() == 0)
        return;
    std::lock_guard<std::mutex> lg(mtx);
    if(dest_syslog){
        auto lev = (level == -1) ? dest_lev : (level&0x7);
        ::syslog(dest_fac | lev, "%.*s", int(sv.size()), sv.data());
    }else if(dest_fd >= 0){
        struct iovec iov[2] = {{const_cast<char*>(sv.data()), sv.size()},
                               {const_cast<char*>("\n"), 1}};
        int iovcnt = sv[sv.size()-1] == '\n' ? 1 : 2;
        sew::writev(dest_fd, iov, iovcnt);
    }
}

// priority = facility | level, as in syslog(3).
void log_channel::parse_dest_priority(const std::string& destarg) {
    size_t percent = sizeof("%syslog") - 1;
    dest_fac = LOG_USER;
    dest_lev = LOG_NOTICE;
    if( destarg.size() == percent )
        return;
    if(destarg[percent] != '%')
        throw std::runtime_error("log_channel: expected a % after %syslog in " + destarg);
    auto args = svsplit_exact(destarg, "%", percent+1);
    if(args.size() > 2)
        throw std::runtime_error("log_channel: expected either one or two '%arguments' after %syslog");
    for(str_view arg : args){
        int n = syslog_number(std::string(arg));
        if((n & LOG_PRIMASK) == n)
            dest_lev = n;
        else
            dest_fac = n;
    }
}

} // namespace geocore
