#include "geosite123/content_accessor.hpp"
#include "geosite123/errors.hpp"
#include <geocore/strutils.hpp>

using namespace geocore;

namespace geosite123{

std::string archive_members::fetch_member(const std::string& name){
    // An empty name or one with a slash would escape the data directory.
    if(name.empty() || name.find('/') != std::string::npos)
        throw not_found_error(fmt("no such list: '%s'", name.c_str()));
    auto e = archive_->find(prefix_ + name);
    if(!e)
        throw not_found_error(fmt("no such list: '%s'", name.c_str()));
    return archive_->read(*e);
}

std::vector<std::string> archive_members::list() const{
    std::vector<std::string> ret;
    for(const auto& e : archive_->entries()){
        str_view sv = e.name;
        if(!startswith(sv, prefix_))
            continue;
        sv.remove_prefix(prefix_.size());
        if(sv.empty() || sv.find('/') != str_view::npos)
            continue;
        ret.emplace_back(sv);
    }
    return ret;
}

} // namespace geosite123
