#include "geosite123/publish_index.hpp"
#include "geosite123/content_accessor.hpp"
#include <geocore/complaints.hpp>
#include <geocore/diag.hpp>
#include <geocore/pathutils.hpp>
#include <geocore/sew.hpp>
#include <geocore/strutils.hpp>
#include <nlohmann/json.hpp>

using namespace geocore;

static auto _index = diag_name("index");

namespace{
bool file_exists(const std::string& path){
    struct stat sb;
    return ::stat(path.c_str(), &sb) == 0;
}
} // namespace <anon>

namespace geosite123{

std::string build_index(const std::vector<std::string>& names, const std::string& geosite_base){
    auto base = std::string(sv_rstrip(geosite_base));
    while(endswith(base, "/"))
        base.pop_back();
    nlohmann::json j = nlohmann::json::object();
    for(const auto& n : names)
        j[n] = base + "/" + n;
    return j.dump(2);
}

void save_index(const std::string& path, const std::string& body) try {
    make_parent_dirs(path);
    std::string tmp = path + ".tmp";
    int fd = sew::open(tmp.c_str(), O_WRONLY|O_CREAT|O_TRUNC|O_CLOEXEC, 0644);
    try{
        const char* p = body.data();
        size_t n = body.size();
        while(n){
            auto nw = sew::write(fd, p, n);
            p += nw;
            n -= nw;
        }
    }catch(std::exception&){
        ::close(fd);
        ::unlink(tmp.c_str());
        throw;
    }
    sew::close(fd);
    sew::rename(tmp.c_str(), path.c_str());
 }catch(std::exception&){
    std::throw_with_nested(std::runtime_error("save_index(" + path + ")"));
 }

published_index::published_index(std::string base_url, std::string index_path) :
    base_url_(rstrip(base_url)), index_path_(strip(index_path))
{
}

bool published_index::refresh(const source_snapshot& snap, const std::string& data_prefix){
    if(!enabled() || !snap)
        return false;
    std::lock_guard<std::mutex> rlk(refresh_mtx);
    if(snap.fingerprint == fingerprint() && (index_path_.empty() || file_exists(index_path_))){
        DIAG(_index, "index is current for " << snap.fingerprint);
        return false;
    }
    archive_members members(snap.archive, data_prefix);
    std::string base = base_url_;
    while(endswith(base, "/"))
        base.pop_back();
    auto names = members.list();
    auto body = build_index(names, base + "/geosite");
    {
        std::unique_lock<std::shared_mutex> lk(mtx);
        body_ = body;
        fingerprint_ = snap.fingerprint;
    }
    DIAG(_index, "rebuilt index: " << names.size() << " lists, fingerprint " << snap.fingerprint);
    if(!index_path_.empty()){
        save_index(index_path_, body);
        log_notice("index of %zu lists saved to %s", names.size(), index_path_.c_str());
    }
    return true;
}

bool published_index::get(std::string* body) const{
    std::shared_lock<std::shared_mutex> lk(mtx);
    if(body_.empty())
        return false;
    *body = body_;
    return true;
}

std::string published_index::fingerprint() const{
    std::shared_lock<std::shared_mutex> lk(mtx);
    return fingerprint_;
}

} // namespace geosite123
