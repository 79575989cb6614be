#pragma once

// complaints - the service's log of record.
//
//   complain(LOG_WARNING, "check failed, serving stale archive");
//   complain(LOG_ERR, e, "refresh loop: %s", what);
//   log_notice("listening on %s:%d", addr, port);
//
// Every complaint gets a level key (one of "GACEWNID", i.e., emerG,
// Alert, Crit, Err, Warning, Notice, Info, Debug) and a sequence
// number.  When an exception is passed, each level of its nest is
// reported on its own line with a sub-sequence number:
//
//    W[12.0] refresh loop
//    W[12.1] fetcher::force_refresh: upstream check failed
//    W[12.2] curl_easy_perform: Couldn't resolve host name
//
// Complaints with a level numerically greater than
// set_complaint_level() are discarded.  Complaints at LOG_ERR and
// below are probabilistically thinned when the recent rate (an
// exponential moving average over the averaging window) exceeds the
// max hourly rate.  Complaints go to stderr until
// set_complaint_destination names a log_channel destination.

#include <geocore/strutils.hpp>
#include <exception>
#include <string>
#include <cstdarg>
#include <syslog.h>

namespace geocore{

void set_complaint_destination(const std::string& dest, int mode);
void reopen_complaint_destination();
void set_complaint_max_hourly_rate(float rate);
float get_complaint_max_hourly_rate();
void set_complaint_averaging_window(float seconds);
float get_complaint_averaging_window();
float get_complaint_hourly_rate();
void set_complaint_level(int newlevel);
int get_complaint_level();

// Adds +seconds-since-start to the first line of every complaint.
void start_complaint_delta_timestamps();
void stop_complaint_delta_timestamps();

void complain(int priority, const std::string& msg);
void complain(int priority, const std::exception& e, const std::string& msg);
void vcomplain(int priority, const char *fmt, va_list ap);
void vcomplain(int priority, const std::exception &e, const char *fmt, va_list ap);

inline void complain(const std::exception& e, const std::string& msg){
    complain(LOG_ERR, e, msg);
}

inline void log_notice(const std::string& msg){
    complain(LOG_NOTICE, msg);
}

inline void complain(int priority, const char *fmt, ...)
    __attribute__ ((__format__ (__printf__, 2, 3)));
inline void complain(int priority, const char *fmt, ...){
    va_list args;
    va_start(args, fmt);
    vcomplain(priority, fmt, args);
    va_end(args);
}

inline void complain(int priority, const std::exception& e, const char *fmt, ...)
    __attribute__ ((__format__ (__printf__, 3, 4)));
inline void complain(int priority, const std::exception& e, const char *fmt, ...){
    va_list args;
    va_start(args, fmt);
    vcomplain(priority, e, fmt, args);
    va_end(args);
}

inline void log_notice(const char *fmt, ...)
    __attribute__ ((__format__ (__printf__, 1, 2)));
inline void log_notice(const char *fmt, ...){
    va_list args;
    va_start(args, fmt);
    vcomplain(LOG_NOTICE, fmt, args);
    va_end(args);
}

} // namespace geocore
