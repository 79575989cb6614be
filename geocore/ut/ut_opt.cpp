#include <geocore/opt.hpp>
#include <geocore/ut.hpp>
#include <geocore/exnest.hpp>
#include <cstdint>
#include <cstdlib>
#include <cstdio>
#include <unistd.h>
#include <fstream>
#include <sstream>
#include <string>

using namespace std;
using namespace geocore;

int main(int, char **)
{
    bool help = false;
    unsigned short port;
    uint64_t ttl;
    double window;
    std::string base_url;
    option_parser op;

    string refhelp{"    flagfile= (default=) : read flags from the named file\n"};
    EQSTR(op.helptext(), refhelp);

    op.add_option("help", "print this message", opt_true_setter(help));
    refhelp += "    help : print this message\n";
    EQUAL(help, false);
    EQSTR(op.helptext(), refhelp);

    op.add_option("port", "8080", "listen port", opt_setter(port));
    refhelp += "    port=8080 (default=8080) : listen port\n";
    EQUAL(port, 8080);
    EQSTR(op.helptext(), refhelp);

    op.add_option("zip_ttl", "1800", "archive ttl", opt_setter(ttl));
    op.add_option("log_rate_window", "3600.", "complaint averaging window", opt_setter(window));
    op.add_option("base_url", "", "public base url", opt_setter(base_url));
    EQUAL(ttl, 1800u);
    EQUAL(window, 3600.);
    EQSTR(base_url, "");

    // Adding the same name twice is an error, even with different punctuation.
    EXPECT_THROW(op.add_option("zip-ttl", "0", "dup", opt_setter(ttl)), option_error);

    // environment first ...
    ::setenv("UTGEO_ZIP_TTL", "60", 1);
    ::setenv("UTGEO_BASE_URL", "https://geo.example.com", 1);
    op.setopts_from_env("UTGEO_");
    EQUAL(ttl, 60u);
    EQSTR(base_url, "https://geo.example.com");

    // ... then argv, with leftovers returned in order.
    const char *argv[] = {"prog", "--port=9090", "positional", "--zip-TTL", "120", "--help", "--unknown=1", "--", "--port=1"};
    auto leftover = op.setopts_from_argv(sizeof(argv)/sizeof(*argv), const_cast<char**>(argv));
    EQUAL(port, 9090);
    EQUAL(ttl, 120u);
    EQUAL(help, true);
    EQUAL(leftover.size(), 3u);
    EQSTR(leftover.at(0), "positional");
    EQSTR(leftover.at(1), "--unknown=1");
    EQSTR(leftover.at(2), "--port=1");
    EQSTR(op.get_map().at("port").get_value(), "9090");
    EQSTR(op.get_map().at("port").get_default(), "8080");

    // flagfiles
    std::istringstream iss("# comment\n\n--port = 7070\nlog_rate_window=1.5\nbase_url=\n");
    op.setopts_from_istream(iss);
    EQUAL(port, 7070);
    EQUAL(window, 1.5);
    EQSTR(base_url, "");

    std::string ffname = "ut_opt.flagfile." + std::to_string(::getpid());
    {
        std::ofstream ofs(ffname);
        ofs << "port=6060\n";
    }
    op.set("flagfile", ffname);
    EQUAL(port, 6060);
    ::unlink(ffname.c_str());

    // Bad values are reported as option_error with the cause nested.
    try{
        op.set("port", "seventy");
        CHECK(false);
    }catch(option_error& e){
        int depth = 0;
        for(auto& ex : exnest(e)){
            (void)ex;
            depth++;
        }
        CHECK(depth > 1);
    }
    EXPECT_THROW(op.set("port", "70000"), option_error);
    EXPECT_THROW(op.set("nosuchoption", "1"), option_error);
    EXPECT_THROW(op.set("help", "1"), option_error);
    EXPECT_THROW(op.set("port"), option_error);
    const char *argv2[] = {"prog", "--port"};
    EXPECT_THROW(op.setopts_from_argv(2, const_cast<char**>(argv2)), option_error);

    return utstatus();
}
