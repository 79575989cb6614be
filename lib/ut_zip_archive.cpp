#include "geosite123/zip_archive.hpp"
#include "geosite123/errors.hpp"
#include "ut_zipmaker.hpp"
#include <geocore/ut.hpp>
#include <string>

using namespace geosite123;

int main(int, char **){
    std::string big;
    for(int i=0; i<2000; ++i)
        big += "domain:example" + std::to_string(i) + ".com @cn\n";

    zipmaker zm;
    zm.add("top/", "");
    zm.add("top/data/google", "domain:google.com\nfull:www.google.com\n");
    zm.add("top/data/big", big, true);
    zm.add("top/data/empty", "", true);
    auto bytes = zm.finish();

    zip_archive za(bytes);
    EQUAL(za.entries().size(), 4u);
    EQUAL(za.size(), bytes.size());
    CHECK(za.find("top/data/google") != nullptr);
    CHECK(za.find("top/data/nope") == nullptr);
    EQSTR(za.read("top/data/google"), "domain:google.com\nfull:www.google.com\n");
    EQSTR(za.read("top/data/big"), big);
    EQSTR(za.read("top/data/empty"), "");
    auto e = za.find("top/data/big");
    EQUAL(e->method, 8);
    EQUAL(e->uncompressed_size, big.size());
    CHECK(e->compressed_size < big.size());

    EXPECT_THROW(za.read("top/data/nope"), not_found_error);

    // Not an archive at all.
    EXPECT_THROW(zip_archive("this is not a zip file, not even close to one"), format_error);
    EXPECT_THROW(zip_archive(""), format_error);
    // Chopping off the end loses the end-of-central-directory record.
    EXPECT_THROW(zip_archive(bytes.substr(0, bytes.size()-10)), format_error);

    // A flipped payload byte gets through the directory, but not
    // the crc check.
    std::string corrupt = bytes;
    auto pos = corrupt.find("domain:google.com");
    CHECK(pos != std::string::npos);
    corrupt[pos] = 'D';
    zip_archive zc(corrupt);
    EXPECT_THROW(zc.read("top/data/google"), format_error);
    EQSTR(zc.read("top/data/big"), big);

    return utstatus();
}
