#pragma once

// log_channel - send pre-formatted records to a destination chosen
// by name:
//
//   /some/path or relative/path - appended to, created if necessary
//   %none - discarded
//   %stdout, %stderr - file descriptor 1 or 2
//   %syslog%LOG_LEVEL%LOG_FACILITY - syslog(3).  Either or both of the
//        level and facility may be given, in either order.  Defaults
//        are LOG_NOTICE and LOG_USER.
//
// Records not sent to syslog get a newline appended if they don't
// already end with one.  reopen() closes and reopens the current
// destination, for log rotation.
//
// send(), open() and reopen() may be called concurrently.

#include "geocore/strutils.hpp"
#include <string>
#include <mutex>

namespace geocore{
struct log_channel{
    log_channel(){}
    log_channel(const std::string& dest, int mode){ open(dest, mode); }
    log_channel(const log_channel&) = delete;
    log_channel& operator=(const log_channel&) = delete;
    ~log_channel();

    void open(const std::string& dest, int mode);
    void reopen();
    void close(){ open("%none", 0); }
    // level is only consulted for syslog.  -1 means the level parsed
    // from the destination.
    void send(int level, str_view sv) const;
    void send(str_view sv) const { send(-1, sv); }
    const std::string& destination() const { return opened_dest; }

private:
    mutable std::mutex mtx;
    // At most one of dest_syslog and (dest_fd>=0) is true.
    bool dest_syslog = false;
    int dest_fd = -1;
    int dest_fac = 0;
    int dest_lev = 0;
    bool dest_opened = false;
    std::string opened_dest;
    int opened_mode = 0;
    void _close();
    void parse_dest_priority(const std::string& destarg);
};
} // namespace geocore
