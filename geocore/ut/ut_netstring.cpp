#include <geocore/netstring.hpp>
#include <geocore/ut.hpp>
#include <sstream>
#include <string>

using namespace geocore;

int main(int, char **){
    EQSTR(netstring(""), "0:,");
    EQSTR(netstring("hello"), "5:hello,");
    std::string binary("a\0b,c", 5);
    EQSTR(netstring(binary), "5:" + binary + ",");

    std::ostringstream oss;
    sput_netstring(oss, "geosite123-source-v1");
    sput_netstring(oss, "");
    sput_netstring(oss, binary);
    std::istringstream iss(oss.str());
    std::string s;
    CHECK(sget_netstring(iss, &s));
    EQSTR(s, "geosite123-source-v1");
    CHECK(sget_netstring(iss, &s));
    EQSTR(s, "");
    CHECK(sget_netstring(iss, &s));
    CHECK(s == binary);
    CHECK(!sget_netstring(iss, &s));

    const char* bad[] = {"5:abc,", "3:abc;", "03:abc,", "x:abc,", ":abc,", "3abc,"};
    for(auto b : bad){
        std::istringstream is(b);
        EXPECT_THROW(sget_netstring(is, &s), std::runtime_error);
        CHECK(is.fail());
        EQSTR(s, "");
    }
    std::istringstream big("12:abcdefghijkl,");
    EXPECT_THROW(sget_netstring(big, &s, 10), std::runtime_error);

    return utstatus();
}
