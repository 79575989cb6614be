#include "geosite123/publish_index.hpp"
#include "ut_zipmaker.hpp"
#include <geocore/ut.hpp>
#include <chrono>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <unistd.h>

using namespace geosite123;

namespace{
source_snapshot snapshot(const std::string& fp, bool with_extra){
    zipmaker zm;
    zm.add("repo/data/", "");
    zm.add("repo/data/google", "domain:google.com\n");
    zm.add("repo/data/apple", "domain:apple.com\n", true);
    if(with_extra)
        zm.add("repo/data/bilibili", "domain:bilibili.com\n");
    zm.add("repo/README.md", "readme\n");
    return {std::make_shared<const zip_archive>(zm.finish()), fp, std::chrono::system_clock::now()};
}

std::string slurp(const std::string& path){
    std::ifstream ifs(path);
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}
} // namespace <anon>

int main(int, char **){
    EQSTR(build_index({}, "https://geo.example.com/geosite"), "{}");
    EQSTR(build_index({"google", "apple"}, "https://geo.example.com/geosite//"),
          "{\n"
          "  \"apple\": \"https://geo.example.com/geosite/apple\",\n"
          "  \"google\": \"https://geo.example.com/geosite/google\"\n"
          "}");

    std::string body;
    published_index off("", "");
    CHECK(!off.enabled());
    CHECK(!off.refresh(snapshot("fp1", false), "repo/data/"));
    CHECK(!off.get(&body));

    // In memory only.
    published_index mem("https://geo.example.com/", "");
    CHECK(mem.enabled());
    CHECK(!mem.get(&body));
    CHECK(!mem.refresh(source_snapshot{}, "repo/data/"));
    CHECK(mem.refresh(snapshot("fp1", false), "repo/data/"));
    CHECK(mem.get(&body));
    EQSTR(body,
          "{\n"
          "  \"apple\": \"https://geo.example.com/geosite/apple\",\n"
          "  \"google\": \"https://geo.example.com/geosite/google\"\n"
          "}");
    EQSTR(mem.fingerprint(), "fp1");
    CHECK(!mem.refresh(snapshot("fp1", false), "repo/data/"));

    // Saved to a file in a directory that doesn't exist yet.
    std::string dir = "/tmp/ut_publish_index." + std::to_string(::getpid());
    std::string path = dir + "/public/index.json";
    published_index saved("https://geo.example.com", path);
    CHECK(saved.refresh(snapshot("fp1", false), "repo/data/"));
    EQSTR(slurp(path), body);
    CHECK(::access((path + ".tmp").c_str(), F_OK) != 0);

    // Same fingerprint: nothing to do, unless the file went away.
    CHECK(!saved.refresh(snapshot("fp1", false), "repo/data/"));
    ::unlink(path.c_str());
    CHECK(saved.refresh(snapshot("fp1", false), "repo/data/"));
    CHECK(::access(path.c_str(), F_OK) == 0);

    // A new archive with a new list.
    CHECK(saved.refresh(snapshot("fp2", true), "repo/data/"));
    CHECK(saved.get(&body));
    CHECK(body.find("\"bilibili\": \"https://geo.example.com/geosite/bilibili\"") != std::string::npos);
    EQSTR(slurp(path), body);
    EQSTR(saved.fingerprint(), "fp2");

    ::unlink(path.c_str());
    ::rmdir((dir + "/public").c_str());
    ::rmdir(dir.c_str());

    // Unwritable destination.
    EXPECT_THROW(save_index("/proc/nonexistent/index.json", "{}"), std::runtime_error);

    return utstatus();
}
