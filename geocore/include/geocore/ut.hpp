#pragma once
#include <iostream>
#include <string>
#include <geocore/diag.hpp>

// Minimal unit test support: macros that count passes and failures,
// and utstatus() to report and produce an exit status.
//
// EXPECT_THROW(expr, type) passes if expr throws something that is
// caught as type.

namespace {
static auto _ut = geocore::diag_name("ut");
static unsigned utfail = 0, utpass = 0;

#define EQUAL(x, y) if ((x) != (y)) { utfail++; std::cerr << "FAILED " __FILE__ ":" << __LINE__ << " " #x " " << (x) << " != " #y " " << (y) << std::endl; } else {utpass++; DIAG(_ut, "PASSED " #x " " << (x) << " == " #y " " << (y));}
#define CHECK(expr) if(expr) { utpass++; DIAG(_ut, "PASSED " #expr " is true");} else {utfail++; std::cerr << "FAILED " __FILE__ ":" << __LINE__ << " " << #expr << " is false\n";}

#define EQSTR(x, y) _EQSTR(x, y, #x, __LINE__)
inline void _EQSTR(const std::string& x, const std::string& y, const char *xexpr, int line){
    if (x != y) {
        utfail++;
        std::cerr << "FAILED line " << line << " " << xexpr << "-> '" << x << "' != '" << y << "'" << std::endl;
    } else {
        utpass++; DIAG(_ut, "PASSED " << xexpr << "-> '" << x << "' == '" << y << "'");
    }
}

#define EXPECT_THROW(expr, type) do{                                    \
        bool _caught = false;                                           \
        try{ expr; }catch(type&){ _caught = true; }                     \
        if(_caught){ utpass++; DIAG(_ut, "PASSED " #expr " threw " #type); } \
        else{ utfail++; std::cerr << "FAILED line " << __LINE__ << " " #expr " did not throw " #type "\n"; } \
    }while(0)

// returns 0 if all tests passed, 1 if some tests failed.
inline int utstatus(bool verbose = true) {
    if (verbose) {
        std::cout << (utfail == 0 ? "OK, All " : "ERROR ");
        std::cout << utpass << " tests passed, " << utfail << " failed." << std::endl;
    }
    return utfail == 0 ? 0 : 1;
}

} // namespace <anon>
