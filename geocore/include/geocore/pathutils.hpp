#pragma once
// Utilities for pathnames, directories and whole files.
#include <geocore/sew.hpp>
#include <geocore/strutils.hpp>
#include <geocore/throwutils.hpp>
#include <string>
#include <system_error>
#include <utility>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace geocore {

// pathsplit("a/b/c") -> {"a/b", "c"}.  With no slash, the directory
// part is empty.
inline std::pair<std::string, std::string> pathsplit(const std::string& p){
    auto last = p.find_last_of('/');
    if(last == std::string::npos)
        return {std::string(), p};
    return {p.substr(0, last), p.substr(last+1)};
}

// _makedirsat - mkdirat, and on ENOENT create the parents (with
// S_IWUSR added to mode) and try again.  p[len] must be NUL, p must
// not end in '/', and p is modified in place while recursing.
inline int _makedirsat(int dirfd, char *p, size_t len, int mode){
    int ret = ::mkdirat(dirfd, p, mode);
    if(ret==0 || errno != ENOENT)
        return ret;
    auto lastslash = str_view(p, len).find_last_of('/');
    if(lastslash == str_view::npos)
        return ret;
    auto lastnotslash = str_view(p, lastslash).find_last_not_of('/');
    if(lastnotslash == str_view::npos)
        return ret;     // "/xyz" or "///xyz"
    lastslash = lastnotslash+1;
    p[lastslash] = '\0';
    ret = _makedirsat(dirfd, p, lastslash, mode|S_IWUSR);
    p[lastslash] = '/';
    if(ret != 0 && errno != EEXIST)
        return ret;
    return ::mkdirat(dirfd, p, mode);
}

// makedirs - like python's os.makedirs.  With exist_ok, an existing
// directory at path is success.  Throws a system_error carrying the
// errno of the mkdir that failed.  Parents created before a failure
// are left in place.
inline void makedirs(std::string path, int mode, bool exist_ok = false){
    auto lastnotslash = path.find_last_not_of('/');
    auto pathlen = path.size();
    if(lastnotslash < pathlen){
        pathlen = lastnotslash+1;
        path.resize(pathlen);
    }
    if(_makedirsat(AT_FDCWD, &path[0], pathlen, mode) != 0){
        auto eno = errno;
        struct stat sb;
        if(eno == EEXIST && exist_ok && ::stat(path.c_str(), &sb)==0 && S_ISDIR(sb.st_mode))
            return;
        throw se(eno, strfunargs("makedirs", path, mode));
    }
}

// make_parent_dirs("/var/cache/geo/x.snap") makes /var/cache/geo if
// it isn't already there.
inline void make_parent_dirs(const std::string& path, int mode = 0755){
    auto dir = pathsplit(path).first;
    if(dir.empty())
        return;
    makedirs(dir, mode, true);
}

// slurp - the whole contents of the file at path.  Errors are thrown
// by sew, so ENOENT can be told apart from the others.  Interrupted
// reads are retried.
inline std::string slurp(const std::string& path){
    int fd = sew::open(path.c_str(), O_RDONLY|O_CLOEXEC);
    std::string ret;
    try{
        struct stat sb;
        sew::fstat(fd, &sb);
        ret.reserve(sb.st_size);
        char buf[64*1024];
        for(;;){
            ssize_t nr;
            try{
                nr = sew::read(fd, buf, sizeof(buf));
            }catch(std::system_error& e){
                if(e.code() == std::errc::interrupted)
                    continue;
                throw;
            }
            if(nr == 0)
                break;
            ret.append(buf, nr);
        }
    }catch(std::exception&){
        ::close(fd);
        throw;
    }
    sew::close(fd);
    return ret;
}

} // namespace geocore
