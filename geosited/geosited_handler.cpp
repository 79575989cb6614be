#include "geosited_handler.hpp"
#include "geosite123/errors.hpp"
#include <geocore/complaints.hpp>
#include <geocore/diag.hpp>
#include <geocore/http_error_category.hpp>
#include <geocore/sew.hpp>
#include <geocore/syslog_number.hpp>
#include <geocore/throwutils.hpp>
#include <fstream>
#include <syslog.h>

using namespace geocore;
using geosite123::dialect;

namespace{
auto _geosited = diag_name("geosited");

const char ruleset_cc[] = "public, max-age=1800";

const char* content_type(dialect d){
    return d == dialect::egern ? "text/yaml; charset=utf-8" : "text/plain; charset=utf-8";
}

// "surge", "surge/" and "" name the index.  "surge/NAME" is a
// ruleset in that dialect.  Returns false if rest doesn't start with
// a dialect name.
bool strip_dialect(str_view& rest, dialect& d, bool& is_index){
    for(auto cand : {dialect::surge, dialect::mihomo, dialect::egern}){
        str_view dn = dialect_name(cand);
        if(!startswith(rest, dn))
            continue;
        auto after = rest.substr(dn.size());
        if(after.empty() || after == "/"){
            is_index = true;
            return true;
        }
        if(after.front() == '/'){
            d = cand;
            rest = after.substr(1);
            return true;
        }
    }
    return false;
}
} // namespace <anon>

route parse_route(str_view path){
    route r;
    if(path == "/"){
        r.kind = route_kind::root;
        return r;
    }
    if(startswith(path, "/geosite")){
        auto rest = path.substr(8);
        if(rest.empty() || rest == "/"){
            r.kind = route_kind::index;
            return r;
        }
        if(rest.front() != '/')
            return r;
        rest.remove_prefix(1);
        bool is_index = false;
        strip_dialect(rest, r.dialect, is_index);
        if(is_index){
            r.kind = route_kind::index;
            return r;
        }
        auto name_with_filter = tolower(sv_strip(rest));
        auto at = name_with_filter.find('@');
        r.name = name_with_filter.substr(0, at);
        if(at != std::string::npos)
            r.filter = name_with_filter.substr(at+1);
        if(r.name.empty())
            httpthrow(400, "invalid list name: '" + std::string(rest) + "'");
        r.kind = route_kind::ruleset;
        return r;
    }
    if(startswith(path, "/misc/")){
        auto parts = svsplit_exact(path, "/", 6);
        if(parts.size() != 2 || parts[0].empty() || parts[1].empty())
            httpthrow(400, "invalid path format, expected /misc/CATEGORY/NAME");
        r.category = tolower(parts[0]);
        r.name = tolower(parts[1]);
        if(r.category == ".." || r.name == "..")
            httpthrow(400, "invalid path format, expected /misc/CATEGORY/NAME");
        r.kind = route_kind::misc;
        return r;
    }
    return r;
}

geosited_handler::geosited_handler(const geosited_options& _opts, geosite123::ruleset_service& svc) :
    opts(_opts), service(svc)
{
    accesslog_channel.open(opts.accesslog_destination, 0666);
}

// scheme://host as the client sees it, honoring a reverse proxy's
// X-Forwarded-Proto and X-Forwarded-Host.
std::string
geosited_handler::request_base(const geosite123::req& req) const{
    auto scheme = req.get_header("X-Forwarded-Proto");
    if(scheme.empty())
        scheme = "http";
    auto host = req.get_header("X-Forwarded-Host");
    if(host.empty())
        host = req.get_header("Host");
    if(host.empty())
        host = "localhost";
    return scheme + "://" + host;
}

void
geosited_handler::handle(geosite123::req::up req) try {
    auto r = parse_route(req->path);
    DIAGf(_geosited, "route %d name=%s filter=%s", int(r.kind), r.name.c_str(), r.filter.c_str());
    switch(r.kind){
    case route_kind::root:
        return redirect_reply(std::move(req), opts.repo_url, "");
    case route_kind::index:{
        auto body = service.index_body(request_base(*req));
        return content_reply(std::move(req), body, "application/json", ruleset_cc);
    }
    case route_kind::ruleset:{
        auto body = service.render_ruleset(r.name, r.filter, r.dialect);
        return content_reply(std::move(req), body, content_type(r.dialect), ruleset_cc);
    }
    case route_kind::misc:{
        auto body = service.misc_list(r.category, r.name);
        return content_reply(std::move(req), body, "text/plain; charset=utf-8", ruleset_cc);
    }
    case route_kind::not_found:
        break;
    }
    httpthrow(404, "not found: " + std::string(req->path));
 }catch(std::exception& e){
    if(req)
        exception_reply(std::move(req), e);
    else
        complain(LOG_ERR, e, "geosited_handler::handle threw after replying");
 }

void
geosited_handler::logger(const char* remote, geosite123::method_e method, const char* uri, int status, size_t length, const char* date){
    accesslog_channel.send(fmt("%s [%s] \"%s %s\" %d %zu",
                               remote, date,
                               geosite123::method_name(method),
                               uri,
                               status, length));
}

void geosited_global_setup(const geosited_options& gopts){
    // log_channel passes the facility on every syslog call, so
    // openlog's third argument doesn't matter.
    openlog(gopts.PROGNAME, LOG_PID|LOG_NDELAY, 0);
    auto level = syslog_number(gopts.log_min_level);
    set_complaint_destination(gopts.log_destination, 0666);
    set_complaint_level(level);
    set_complaint_max_hourly_rate(gopts.log_max_hourly_rate);
    set_complaint_averaging_window(gopts.log_rate_window);
    if(!startswith(gopts.log_destination, "%syslog"))
        start_complaint_delta_timestamps();

    if(!gopts.diag_names.empty()){
        set_diag_names(gopts.diag_names);
        set_diag_destination(gopts.diag_destination);
        DIAG(true, "diags:\n" << get_diag_names() << "\n");
    }
    the_diag().opt_tstamp = true;

    if(!gopts.pidfile.empty()){
        std::ofstream ofs(gopts.pidfile.c_str());
        ofs << sew::getpid() << "\n";
        ofs.close();
        if(!ofs)
            throw se("Could not write to pidfile");
    }
}
