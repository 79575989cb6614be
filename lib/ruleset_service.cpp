#include "geosite123/ruleset_service.hpp"
#include "geosite123/content_accessor.hpp"
#include "geosite123/errors.hpp"
#include "geosite123/rule_parser.hpp"
#include <geocore/complaints.hpp>
#include <geocore/diag.hpp>
#include <geocore/pathutils.hpp>
#include <geocore/strutils.hpp>

using namespace geocore;

static auto _service = diag_name("service");

namespace geosite123{

ruleset_service::ruleset_service(fetcher& f, result_cache& results, published_index& index,
                                 const service_options& opts, misc_fetch_fn misc_fetch) :
    fetcher_(f), results_(results), index_(index), opts_(opts),
    misc_fetch_(std::move(misc_fetch)),
    misc_cache_(opts.misc_cache_size)
{
    while(endswith(opts_.misc_base_url, "/"))
        opts_.misc_base_url.pop_back();
}

std::string ruleset_service::render_ruleset(const std::string& name, const std::string& filter, dialect d){
    auto snap = fetcher_.ensure_fresh();
    result_key k{name, filter, d};
    return results_.get_or_compute(k, snap.fingerprint,
                                   [&](){
                                       DIAG(_service, "rendering " << k.str() << " from " << snap.fingerprint);
                                       archive_members src(snap.archive, opts_.data_prefix);
                                       rule_parser parser(src);
                                       return render(parser.parse_member(name, filter), d);
                                   });
}

std::string ruleset_service::misc_list(const std::string& category, const std::string& name){
    auto url = opts_.misc_base_url + "/" + category + "/" + name + ".list";
    auto cached = misc_cache_.lookup(url);
    if(!cached.expired()){
        DIAG(_service, "misc hit " << url);
        return cached;
    }
    std::string body = misc_fetch_(url);
    misc_cache_.insert(url, body, opts_.misc_ttl);
    DIAG(_service, "misc fetched " << url << " " << body.size() << " bytes");
    return body;
}

std::string ruleset_service::index_body(const std::string& request_base){
    std::string body;
    if(!index_.index_path().empty()){
        try{
            return slurp(index_.index_path());
        }catch(std::system_error& e){
            // Not written yet is normal.  Anything else is worth a
            // complaint, but the request can still be answered.
            if(e.code() != std::errc::no_such_file_or_directory)
                complain(LOG_WARNING, e, "could not read index file %s", index_.index_path().c_str());
        }
    }
    if(index_.get(&body))
        return body;
    auto snap = fetcher_.ensure_fresh();
    archive_members members(snap.archive, opts_.data_prefix);
    return build_index(members.list(), request_base + "/geosite");
}

void ruleset_service::refresh_source(){
    auto snap = fetcher_.force_refresh();
    index_.refresh(snap, opts_.data_prefix);
}

void ruleset_service::refresh_index(){
    if(!index_.enabled())
        return;
    index_.refresh(fetcher_.ensure_fresh(), opts_.data_prefix);
}

size_t ruleset_service::sweep(){
    auto n = results_.sweep();
    misc_cache_.erase_expired();
    DIAG(_service, "sweep: " << results_.stats());
    return n;
}

} // namespace geosite123
