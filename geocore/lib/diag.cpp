#include "geocore/diag.hpp"
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <unistd.h>
#include <sys/syscall.h>

namespace geocore{

diag_t& the_diag(){
    // Leaked.  DIAGs may fire during static destruction.
    static diag_t* the = new diag_t;
    return *the;
}

diag_t::diag_t() :
    logchan("%stderr", 0)
{
    const char *p;
    try{
        set_diag_names( (p=::getenv("GEOCORE_DIAG_NAMES")) ? p : "");
        set_diag_destination( (p=::getenv("GEOCORE_DIAG_DESTINATION")) ? p : "%stderr");
    }catch(std::exception& e){
        std::cerr << "WARNING: could not initialize diagnostics from the environment: " << e.what() << std::endl;
    }
}

std::atomic<int>& diag_t::declare(const std::string& name, int initial_value){
    std::lock_guard<std::mutex> lg(names_mtx);
    auto& up = names[name];
    if(!up)
        up.reset(new std::atomic<int>(initial_value));
    return *up;
}

diag_ref diag_t::diag_name(const std::string& name, int initial_value){
    return {&declare(name, initial_value)};
}

void diag_t::set_diag_names(const std::string& str, bool clear_before_set){
    if(clear_before_set){
        std::lock_guard<std::mutex> lg(names_mtx);
        for(auto& kv : names)
            *kv.second = 0;
    }
    for(auto tok : svsplit_exact(str, ":")){
        if(tok.empty())
            continue;
        int lev = 1;
        auto eq = tok.find('=');
        std::string key(tok.substr(0, eq));
        if(eq != str_view::npos)
            sscanf(std::string(tok.substr(eq+1)).c_str(), "%d", &lev);
        declare(key, 0) = lev;
    }
}

std::string diag_t::get_diag_names(bool showall){
    std::lock_guard<std::mutex> lg(names_mtx);
    const char *sep = "";
    std::ostringstream oss;
    for(const auto& kv : names){
        int v = *kv.second;
        if(showall || v != 0){
            oss << sep << kv.first << "=" << v;
            sep = ":";
        }
    }
    return oss.str();
}

void diag_t::set_diag_destination(const std::string& dest, int mode){
    std::lock_guard<std::recursive_mutex> lk(_diag_mtx);
    logchan.open(dest, mode);
}

std::ostream& diag_t::_diag_before(const char* why, const char */*file*/, int /*line*/, const char *func){
    if(opt_tstamp){
        using namespace std::chrono;
        auto now_musec = duration_cast<microseconds>( system_clock::now().time_since_epoch() ).count();
        time_t now_timet = now_musec/1000000;
        auto musec = now_musec%1000000;
        struct tm now_tm;
        if(::localtime_r(&now_timet, &now_tm)){
            auto oldfill = os.fill('0');
            os << std::setw(2)  << now_tm.tm_hour << ':' << std::setw(2) << now_tm.tm_min << ":" << std::setw(2) << now_tm.tm_sec << "." << std::setw(6) << musec << ' ';
            os.fill(oldfill);
        }
    }
    if(opt_tid)
        os << '[' << ::syscall(SYS_gettid) << "] ";
    if(opt_func)
        os << func << "() ";
    os << "[" << why << "] ";
    return os;
}

void diag_t::_diag_after(){
    logchan.send(os.str());
    os.str({});
    os.clear();
}

} // namespace geocore
