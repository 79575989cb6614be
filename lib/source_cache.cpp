#include "geosite123/source_cache.hpp"
#include "geosite123/errors.hpp"
#include <geocore/complaints.hpp>
#include <geocore/diag.hpp>
#include <geocore/netstring.hpp>
#include <geocore/pathutils.hpp>
#include <geocore/sew.hpp>
#include <geocore/svto.hpp>
#include <sstream>
#include <stdexcept>

using namespace geocore;
using namespace std::chrono;

static auto _source = diag_name("source");

namespace {
const char MAGIC[] = "geosite123-source-v1";

void write_all(int fd, const char* p, size_t n){
    while(n){
        auto nw = sew::write(fd, p, n);
        p += nw;
        n -= nw;
    }
}
} // namespace <anon>

namespace geosite123{

bool source_cache::get(source_snapshot* out) const{
    std::shared_lock<std::shared_mutex> lk(mtx);
    if(!snap || system_clock::now() - snap.fetched_at >= ttl_)
        return false;
    *out = snap;
    return true;
}

bool source_cache::get_any(source_snapshot* out) const{
    std::shared_lock<std::shared_mutex> lk(mtx);
    if(!snap)
        return false;
    *out = snap;
    return true;
}

void source_cache::set(std::string bytes, const std::string& fingerprint){
    if(fingerprint.empty())
        throw std::invalid_argument("source_cache::set: empty fingerprint");
    // Parse before taking any lock.  Throws format_error on garbage.
    auto za = std::make_shared<const zip_archive>(std::move(bytes));
    source_snapshot s{std::move(za), fingerprint, system_clock::now()};
    std::lock_guard<std::mutex> ulk(update_mtx);
    {
        std::unique_lock<std::shared_mutex> lk(mtx);
        snap = s;
    }
    DIAG(_source, "set fingerprint=" << fingerprint << " size=" << s.archive->size());
    if(!persist_path.empty())
        persist(s, persist_path);
}

void source_cache::touch(){
    std::lock_guard<std::mutex> ulk(update_mtx);
    source_snapshot s;
    {
        std::unique_lock<std::shared_mutex> lk(mtx);
        if(!snap)
            return;
        snap.fetched_at = system_clock::now();
        s = snap;
    }
    DIAG(_source, "touch fingerprint=" << s.fingerprint);
    if(!persist_path.empty())
        persist(s, persist_path);
}

void source_cache::set_persist_path(const std::string& path){
    std::lock_guard<std::mutex> ulk(update_mtx);
    persist_path = path;
}

bool source_cache::load_from_file(const std::string& path){
    std::lock_guard<std::mutex> ulk(update_mtx);
    persist_path = path;
    std::string contents;
    try{
        contents = slurp(path);
    }catch(std::system_error& e){
        if(e.code() == std::errc::no_such_file_or_directory){
            DIAG(_source, "no snapshot at " << path);
            return false;
        }
        throw;
    }
    try{
        std::istringstream iss(std::move(contents));
        std::string magic, fingerprint, nanos, payload;
        if(!sget_netstring(iss, &magic) || magic != MAGIC)
            throw format_error("not a " + std::string(MAGIC) + " snapshot");
        if(!sget_netstring(iss, &fingerprint) || fingerprint.empty())
            throw format_error("missing fingerprint");
        if(!sget_netstring(iss, &nanos))
            throw format_error("missing fetch time");
        auto fetched_at = system_clock::time_point(duration_cast<system_clock::duration>(nanoseconds(svto<int64_t>(nanos))));
        if(!sget_netstring(iss, &payload))
            throw format_error("missing payload");
        auto za = std::make_shared<const zip_archive>(std::move(payload));
        std::unique_lock<std::shared_mutex> lk(mtx);
        snap = source_snapshot{std::move(za), fingerprint, fetched_at};
    }catch(std::exception&){
        std::throw_with_nested(format_error("source_cache::load_from_file(" + path + ")"));
    }
    DIAG(_source, "loaded " << path << " fingerprint=" << snap.fingerprint);
    return true;
}

void source_cache::persist(const source_snapshot& s, const std::string& path){
    std::string tmp = path + ".tmp";
    try{
        auto nanos = duration_cast<nanoseconds>(s.fetched_at.time_since_epoch()).count();
        const std::string& payload = s.archive->bytes();
        std::string head = netstring(MAGIC) + netstring(s.fingerprint) + netstring(std::to_string(nanos))
            + std::to_string(payload.size()) + ":";
        make_parent_dirs(path);
        int fd = sew::open(tmp.c_str(), O_WRONLY|O_CREAT|O_TRUNC|O_CLOEXEC, 0644);
        try{
            write_all(fd, head.data(), head.size());
            write_all(fd, payload.data(), payload.size());
            write_all(fd, ",", 1);
            sew::fsync(fd);
        }catch(std::exception&){
            ::close(fd);
            throw;
        }
        sew::close(fd);
        sew::rename(tmp.c_str(), path.c_str());
        DIAG(_source, "persisted " << payload.size() << " bytes to " << path);
    }catch(std::exception& e){
        ::unlink(tmp.c_str());
        complain(LOG_WARNING, e, "source_cache: could not persist snapshot to %s.  Continuing with memory only.", path.c_str());
    }
}

} // namespace geosite123
