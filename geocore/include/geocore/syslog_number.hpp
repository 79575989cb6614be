#pragma once
#include <string>
#include <map>
#include <stdexcept>
#include <syslog.h>

namespace geocore{
// syslog_number("LOG_INFO") -> LOG_INFO.  Lets options and env-vars
// name syslog levels and facilities symbolically.

// There is no syslog level for "nothing".  LOG_LEVEL_NONE is 0, which
// still lets LOG_EMERG through LOG_UPTO.  Don't use it as a facility:
// 0 is also LOG_KERN.
#define LOG_LEVEL_NONE 0

inline int syslog_number(const std::string& s){
#define _sl_Enum(name) {std::string(#name), name}
    static const std::map<std::string, int> syslog_symbols = {
    // facilities
    _sl_Enum(LOG_DAEMON),
    _sl_Enum(LOG_LOCAL0),
    _sl_Enum(LOG_LOCAL1),
    _sl_Enum(LOG_LOCAL2),
    _sl_Enum(LOG_LOCAL3),
    _sl_Enum(LOG_LOCAL4),
    _sl_Enum(LOG_LOCAL5),
    _sl_Enum(LOG_LOCAL6),
    _sl_Enum(LOG_LOCAL7),
    _sl_Enum(LOG_USER),
    // levels
    _sl_Enum(LOG_EMERG),
    _sl_Enum(LOG_ALERT),
    _sl_Enum(LOG_CRIT),
    _sl_Enum(LOG_ERR),
    _sl_Enum(LOG_WARNING),
    _sl_Enum(LOG_NOTICE),
    _sl_Enum(LOG_INFO),
    _sl_Enum(LOG_DEBUG),
    _sl_Enum(LOG_LEVEL_NONE)
    };
#undef _sl_Enum

    auto p = syslog_symbols.find(s);
    if( p == syslog_symbols.end() ){
        // allow plain integers too, e.g., --log_min_level=4
        try{
            size_t idx;
            int ret = std::stoi(s, &idx);
            if(idx == s.size())
                return ret;
        }catch(std::logic_error&){}
        throw std::runtime_error(s + " is not a recognized syslog symbol");
    }
    return p->second;
}
} // namespace geocore
