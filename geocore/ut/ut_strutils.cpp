#include <geocore/strutils.hpp>
#include <geocore/svto.hpp>
#include <geocore/ut.hpp>
#include <cstdint>
#include <vector>

using namespace geocore;

int main(int, char **){
    CHECK(startswith("regexp:foo", "regexp:"));
    CHECK(!startswith("reg", "regexp:"));
    CHECK(endswith("foo.list", ".list"));
    CHECK(!endswith("list", ".list"));
    EQSTR(strip("  \tdomain:example.com \r\n"), "domain:example.com");
    EQSTR(strip(" \t "), "");
    EQSTR(lstrip("  x "), "x ");
    EQSTR(rstrip("  x "), "  x");
    EQSTR(tolower("Google@CN"), "google@cn");

    auto v = svsplit_exact("a@b@@c", "@");
    EQUAL(v.size(), 4u);
    EQSTR(std::string(v[2]), "");
    EQSTR(std::string(v[3]), "c");
    EQUAL(svsplit_exact("", ":").size(), 1u);
    EXPECT_THROW(svsplit_exact("abc", ""), std::invalid_argument);

    EQSTR(str("a", 1, 2.5), "a 1 2.5");
    EQSTR(str_sep(", ", "x", "y"), "x, y");
    std::vector<int> vi{1,2,3};
    EQSTR(strbe(vi), "1 2 3");
    EQSTR(fmt("%s-%08x-%zu", "crc32", 0xbeefu, size_t(12)), "crc32-0000beef-12");
    std::string longone(2000, 'z');
    EQUAL(fmt("%s", longone.c_str()).size(), 2000u);

    EQUAL(svto<int>(" 42 "), 42);
    EQUAL(svto<uint16_t>("+8080"), 8080);
    EQUAL(svto<double>("1.5e3"), 1500.);
    EQUAL(svto<bool>("yes"), true);
    EQUAL(svto<bool>("0"), false);
    EQSTR(svto<std::string>(" as is "), " as is ");
    EXPECT_THROW(svto<int>("12abc"), std::invalid_argument);
    EXPECT_THROW(svto<int>(""), std::invalid_argument);
    EXPECT_THROW(svto<uint8_t>("300"), std::out_of_range);
    EXPECT_THROW(svto<double>("x"), std::invalid_argument);
    EXPECT_THROW(svto<bool>("maybe"), std::invalid_argument);

    return utstatus();
}
