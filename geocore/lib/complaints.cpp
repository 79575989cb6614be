#include <geocore/complaints.hpp>
#include <geocore/exnest.hpp>
#include <geocore/diag.hpp>
#include <geocore/log_channel.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstring>
#include <ctime>
#include <mutex>
#include <random>
#include <stdexcept>
#include <vector>

using namespace std::chrono;

static float averaging_window = 3600.;  // one hour
static float max_hourly_rate = 1.e9;    // unlimited.
static system_clock::time_point tlast = system_clock::now();
static float rate = 0.;
static std::default_random_engine e;
static std::uniform_real_distribution<float> u01;
static std::mutex mtx; // protects the throttling vars *and* keeps the logs together
static bool delta_timestamps = false;
static system_clock::time_point delta_timestamp_zero;
static std::atomic<int> complaint_level{LOG_DEBUG};
static std::atomic<int> seq_atomic;

namespace geocore{

static log_channel& the_channel(){
    // Leaked, so that complaints work during static destruction.
    static log_channel *p = new log_channel("%stderr", 0);
    return *p;
}

void set_complaint_destination(const std::string& dest, int mode){
    the_channel().open(dest, mode);
}

void reopen_complaint_destination(){
    the_channel().reopen();
}

void set_complaint_max_hourly_rate(float new_rate){
    std::lock_guard<std::mutex> lg(mtx);
    max_hourly_rate = new_rate;
}

float get_complaint_max_hourly_rate(){
    std::lock_guard<std::mutex> lg(mtx);
    return max_hourly_rate;
}

void set_complaint_averaging_window(float new_window){
    std::lock_guard<std::mutex> lg(mtx);
    if(new_window <= 0.)
        throw std::runtime_error("set_complaint_averaging_window:  argument must be positive");
    averaging_window = new_window;
}

float get_complaint_averaging_window(){
    std::lock_guard<std::mutex> lg(mtx);
    return averaging_window;
}

float get_complaint_hourly_rate(){
    std::lock_guard<std::mutex> lg(mtx);
    return rate;
}

void set_complaint_level(int newlevel){ complaint_level = newlevel&0x7; }
int get_complaint_level(){ return complaint_level; }

void start_complaint_delta_timestamps(){
    {
        std::lock_guard<std::mutex> lgd(mtx);
        delta_timestamps = true;
        delta_timestamp_zero = system_clock::now();
    }
    auto epoch = duration_cast<milliseconds>(delta_timestamp_zero.time_since_epoch()).count();
    char epoch_buf[128];
    auto when = system_clock::to_time_t(delta_timestamp_zero);
    struct tm tm;
    if(::localtime_r( &when, &tm ) == nullptr )
        throw std::runtime_error("start_complaint_delta_timestamps: ::localtime_r failed");
    if(0 == std::strftime(epoch_buf, sizeof(epoch_buf), "%F %T%z", &tm))
        throw std::runtime_error("start_complaint_delta_timestamps:  strftime failed");
    complain(LOG_NOTICE, fmt("complaint_delta_timestamp start time: %lld.%03lld %s",
                             (long long)(epoch/1000), (long long)(epoch%1000), epoch_buf));
}

void stop_complaint_delta_timestamps(){
    std::lock_guard<std::mutex> lgd(mtx);
    delta_timestamps = false;
}

namespace {
void _do_complaint(int priority, const std::vector<std::string>& vs){
    static auto _complaints = diag_name("complaints");
    std::lock_guard<std::mutex> lgd(mtx);
    // the diag stream is never throttled
    if(_complaints){
        for(const auto& s : vs)
            DIAG(_complaints, s);
    }

    auto now = system_clock::now();
    float deltat = duration<float>(now - tlast).count();
    tlast = now;
    // Fold the instantaneous rate, vs.size()/deltat, into an
    // exponential moving average over averaging_window.
    float one_minus_alpha = -expm1f(-deltat/averaging_window);
    float deltat_hours = deltat/3600.;
    float alpha = 1. - one_minus_alpha;
    rate *= alpha;
    if(deltat_hours > 0.)
        rate += one_minus_alpha * vs.size()/deltat_hours;
    // Above LOG_ERR is always kept.  Otherwise, when over the limit,
    // keep with probability max_rate/(vs.size()*rate).  Gaps in the
    // sequence numbers show what was dropped.
    auto level = priority & 0x7;
    bool keep = level < LOG_ERR || ( rate < max_hourly_rate ) || u01(e) < max_hourly_rate / (vs.size() * rate);
    if(!keep)
        return;
    for(const auto& s : vs)
        the_channel().send(level, s);
}

void _split_lines(std::vector<std::string>& ret, char levkey, int seq, int& i, const char *p){
    const char *e = p + ::strlen(p);
    while(p<e){
        const char *nl = std::find(p, e, '\n');
        ret.push_back(fmt("%c[%d.%d] %.*s", levkey, seq, i++, int(nl - p), p));
        p = nl + (nl < e);
    }
}

std::vector<std::string>
_whatnest(int priority, const std::string& pfx, const std::exception* ep){
    char levkey = "GACEWNID"[priority&0x7];
    int seq = seq_atomic++;
    std::vector<std::string> ret;
    bool dt;
    system_clock::time_point zero;
    {
        std::lock_guard<std::mutex> lgd(mtx);
        dt = delta_timestamps;
        zero = delta_timestamp_zero;
    }
    if(dt){
        ret.push_back(fmt("%c[%d.0]+%.3f %s", levkey, seq,
                          duration<double>(system_clock::now() - zero).count(),
                          pfx.c_str()));
    }else{
        ret.push_back(fmt("%c[%d.0] %s", levkey, seq, pfx.c_str()));
    }
    if(ep){
        int i=1;
        for(auto& a : exnest(*ep))
            _split_lines(ret, levkey, seq, i, a.what());
    }
    return ret;
}
} // namespace <anon>

void complain(int priority, const std::string& msg){
    if((priority&0x7) <= complaint_level)
        _do_complaint(priority, _whatnest(priority, msg, nullptr));
}

void complain(int priority, const std::exception& ex, const std::string& msg){
    if((priority&0x7) <= complaint_level)
        _do_complaint(priority, _whatnest(priority, msg, &ex));
}

void vcomplain(int priority, const char *fmt, va_list ap){
    if((priority&0x7) <= complaint_level)
        _do_complaint(priority, _whatnest(priority, vfmt(fmt, ap), nullptr));
}

void vcomplain(int priority, const std::exception &ex, const char *fmt, va_list ap){
    if((priority&0x7) <= complaint_level)
        _do_complaint(priority, _whatnest(priority, vfmt(fmt, ap), &ex));
}

} // namespace geocore
