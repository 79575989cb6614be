#pragma once
#ifdef DIAG
#error DIAG is already defined.  Are two diag headers included?
#endif

// Diagnostics that cost a single integer test when they're off.
//
//   static auto _fetch = geocore::diag_name("fetch");
//   ...
//   DIAG(_fetch, "check returned " << token);
//   DIAGf(_fetch>1, "downloaded %zu bytes", n);
//
// The second and later arguments are not evaluated unless the first
// is true.  Names are switched on with a colon-separated list of
// name[=level]:
//
//   set_diag_names("fetch:cache=2");
//
// or in the environment, read the first time the_diag() is called:
//
//   GEOCORE_DIAG_NAMES=fetch:cache=2
//   GEOCORE_DIAG_DESTINATION=/tmp/geo.diag   (default %stderr)
//
// The destination is a log_channel name (see log_channel.hpp).
//
// Record formatting is controlled by the_diag().opt_tstamp,
// opt_tid and opt_func.

#include "geocore/strutils.hpp"
#include "geocore/log_channel.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

#ifdef __GNUC__
#define __diag_unlikely(x) __builtin_expect(x, 0)
#else
#define __diag_unlikely(x) x
#endif

#define DIAGloc(BOOL, _file, _line, _func, _expr) do{                   \
        if( __diag_unlikely(bool(BOOL)) ){                              \
            geocore::diag_t& td = geocore::the_diag();                  \
            std::lock_guard<std::recursive_mutex> __diag_lg(td._diag_mtx); \
            td._diag_before( #BOOL , _file, _line, _func) << _expr;     \
            td._diag_after();                                           \
        }                                                               \
    }while(0)

#define DIAG(BOOL, expr)                        \
    DIAGloc(BOOL, __FILE__, __LINE__, __func__, expr)

#define DIAGf(BOOL, ...) \
    DIAGloc(BOOL, __FILE__, __LINE__, __func__, geocore::fmt(__VA_ARGS__))

namespace geocore{

// diag_ref - a reference to a named level.  Converts to int.
struct diag_ref{
    std::atomic<int>* p;
    operator int() const { return p->load(std::memory_order_relaxed); }
    diag_ref& operator=(int v){ p->store(v, std::memory_order_relaxed); return *this; }
};

struct diag_t{
    diag_ref diag_name(const std::string& name, int initial_value = 0);
    void set_diag_names(const std::string& names, bool clear_before_set = true);
    std::string get_diag_names(bool showall = false);
    void set_diag_destination(const std::string& dest, int mode = 0666);

    bool opt_tstamp = false;
    bool opt_tid = false;
    bool opt_func = true;

    std::recursive_mutex _diag_mtx;
    std::ostream& _diag_before(const char* why, const char *file, int line, const char *func);
    void _diag_after();

    friend diag_t& the_diag();
private:
    diag_t();
    std::mutex names_mtx;
    // unique_ptr so that diag_refs survive rebalancing of the map.
    std::map<std::string, std::unique_ptr<std::atomic<int>>> names;
    std::ostringstream os;
    log_channel logchan;
    std::atomic<int>& declare(const std::string& name, int initial_value);
};

diag_t& the_diag();

inline diag_ref diag_name(const std::string& s, int initial_value = 0){ return the_diag().diag_name(s, initial_value); }
inline void set_diag_names(const std::string& s, bool clear_before_set = true){ the_diag().set_diag_names(s, clear_before_set); }
inline std::string get_diag_names(bool showall=false){ return the_diag().get_diag_names(showall); }
inline void set_diag_destination(const std::string& dest, int mode=0666) { the_diag().set_diag_destination(dest, mode); }

} // namespace geocore
