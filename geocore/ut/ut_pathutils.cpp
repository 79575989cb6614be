#include <geocore/pathutils.hpp>
#include <geocore/ut.hpp>
#include <fstream>
#include <string>
#include <stdlib.h>

using namespace geocore;

namespace{
bool isdir(const std::string& p){
    struct stat sb;
    return ::stat(p.c_str(), &sb) == 0 && S_ISDIR(sb.st_mode);
}
} // namespace <anon>

int main(int, char **){
    EQSTR(pathsplit("a/b/c").first, "a/b");
    EQSTR(pathsplit("a/b/c").second, "c");
    EQSTR(pathsplit("c").first, "");
    EQSTR(pathsplit("/c").first, "");
    EQSTR(pathsplit("/c").second, "c");

    char name[] = "/tmp/ut_pathutilsXXXXXX";
    CHECK(::mkdtemp(name) != nullptr);
    std::string top = name;

    makedirs(top + "///abc", 0777);
    CHECK(isdir(top + "/abc"));
    EXPECT_THROW(makedirs(top + "/abc/", 0777), std::system_error);
    makedirs(top + "/abc/", 0777, true);
    makedirs(top + "/abc/def/ghi", 0755);
    CHECK(isdir(top + "/abc/def/ghi"));
    makedirs("///", 0777, true);
    EXPECT_THROW(makedirs("", 0777), std::system_error);

    // Parents of a file, not the file itself.
    std::string file = top + "/x/y/z/snapshot";
    make_parent_dirs(file);
    CHECK(isdir(top + "/x/y/z"));
    CHECK(!isdir(file));
    make_parent_dirs(file);     // again is fine
    make_parent_dirs("relative_file_with_no_dir");

    {
        std::ofstream ofs(file);
        ofs << "hello\nworld";
    }
    EQSTR(slurp(file), "hello\nworld");
    try{
        slurp(top + "/no/such/file");
        CHECK(false);
    }catch(std::system_error& e){
        CHECK(e.code() == std::errc::no_such_file_or_directory);
    }
    // A plain file where a directory is needed.
    EXPECT_THROW(make_parent_dirs(file + "/under/a/file"), std::system_error);

    ::unlink(file.c_str());
    for(auto d : {"/x/y/z", "/x/y", "/x", "/abc/def/ghi", "/abc/def", "/abc", ""})
        ::rmdir((top + d).c_str());
    CHECK(!isdir(top));

    return utstatus();
}
