#include <geocore/complaints.hpp>
#include <geocore/log_channel.hpp>
#include <geocore/sew.hpp>
#include <geocore/ut.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace geocore;

namespace {
void open_does_not_exist(){
    sew::open("/does/not/exist", O_RDONLY);
}

void throws_a_nested_error(){
    try{
        open_does_not_exist();
    }catch(std::exception& e){
        std::throw_with_nested(std::runtime_error("first line\nsecond line"));
    }
}

std::vector<std::string> slurp_lines(const std::string& fname){
    std::ifstream ifs(fname);
    std::vector<std::string> ret;
    for(std::string line; getline(ifs, line);)
        ret.push_back(line);
    return ret;
}
} // namespace <anon>

int main(int, char **){
    std::string fname = "ut_complaints.log." + std::to_string(sew::getpid());
    set_complaint_destination(fname, 0644);
    set_complaint_level(LOG_INFO);

    complain(LOG_WARNING, "plain warning");
    complain(LOG_DEBUG, "filtered by level");
    log_notice("formatted %d", 42);
    try{
        throws_a_nested_error();
    }catch(std::exception& e){
        complain(LOG_ERR, e, "nested:");
    }
    set_complaint_destination("%none", 0);

    auto lines = slurp_lines(fname);
    ::unlink(fname.c_str());
    EQUAL(lines.size(), 6u);
    if(lines.size() == 6){
        CHECK(startswith(lines[0], "W["));
        CHECK(endswith(lines[0], ".0] plain warning"));
        CHECK(startswith(lines[1], "N["));
        CHECK(endswith(lines[1], "] formatted 42"));
        CHECK(startswith(lines[2], "E["));
        CHECK(endswith(lines[2], ".0] nested:"));
        CHECK(endswith(lines[3], ".1] first line"));
        CHECK(endswith(lines[4], ".2] second line"));
        CHECK(lines[5].find(".3] open(/does/not/exist") != std::string::npos);
    }

    // log_channel destinations
    log_channel lc;
    EXPECT_THROW(lc.open("%bogus", 0), std::runtime_error);
    EXPECT_THROW(lc.open("%syslog%LOG_NOPE", 0), std::runtime_error);
    lc.open("%syslog%LOG_WARNING%LOG_LOCAL3", 0);
    lc.open("%none", 0);
    lc.send("goes nowhere");

    EXPECT_THROW(set_complaint_averaging_window(-1.), std::runtime_error);
    set_complaint_max_hourly_rate(10.);
    EQUAL(get_complaint_max_hourly_rate(), 10.f);

    return utstatus();
}
