#pragma once

#include "geosite123/geositeserver.hpp"
#include "geosite123/render.hpp"
#include "geosite123/ruleset_service.hpp"
#include <geocore/opt.hpp>
#include <geocore/strutils.hpp>
#include <geocore/log_channel.hpp>
#include <string>

// What a request path asks for.  parse_route throws an http 400 for
// paths that are recognizably malformed (an empty list name, a /misc
// path without exactly two parts).  Anything it doesn't recognize is
// not_found.
enum class route_kind{ root, index, ruleset, misc, not_found };

struct route{
    route_kind kind = route_kind::not_found;
    geosite123::dialect dialect = geosite123::dialect::surge;
    std::string name;       // list name, or misc list name
    std::string filter;     // after the '@', possibly empty
    std::string category;   // misc only
};

route parse_route(geocore::str_view path);

struct geosited_options;

struct geosited_handler: public geosite123::handler_base{
    void handle(geosite123::req::up) override;
    void logger(const char* remote, geosite123::method_e method, const char* uri, int status, size_t length, const char* date) override;

    const geosited_options& opts;
    geosite123::ruleset_service& service;
    geocore::log_channel accesslog_channel;

    geosited_handler(const geosited_options&, geosite123::ruleset_service&);
    ~geosited_handler(){}
protected:
    std::string request_base(const geosite123::req&) const;
};

struct geosited_options{
    bool help = false;
    const char* PROGNAME;
#define ADD_ALL_OPTIONS \
        /* where the lists come from */                                 \
        ADD_OPTION(std::string, upstream_url, "https://github.com/v2fly/domain-list-community/archive/refs/heads/master.zip", "url of the zip archive of list sources"); \
        ADD_OPTION(std::string, data_prefix, "domain-list-community-master/data/", "directory in the archive that holds the lists"); \
        ADD_OPTION(std::string, misc_base_url, "https://raw.githubusercontent.com/xxxbrian/Surge-Geosite/refs/heads/main/misc", "/misc/CAT/NAME is fetched from here as CAT/NAME.list"); \
        ADD_OPTION(std::string, repo_url, "https://github.com/xxxbrian/Surge-Geosite", "where / redirects to"); \
        ADD_OPTION(uint64_t, fetch_timeout, 60, "seconds allowed for any upstream transfer"); \
        ADD_OPTION(uint64_t, connect_timeout, 15, "seconds allowed to connect to upstream"); \
        /* caching */                                                   \
        ADD_OPTION(uint64_t, zip_ttl, 1800, "seconds before the archive is checked for changes"); \
        ADD_OPTION(std::string, zip_cache_path, "", "if non-empty, the archive is persisted here and reloaded at startup"); \
        ADD_OPTION(uint64_t, zip_refresh_interval, 1800, "seconds between background refreshes of the archive.  0 disables them"); \
        ADD_OPTION(uint64_t, result_ttl, 86400, "seconds a rendered list stays cached"); \
        ADD_OPTION(uint64_t, result_sweep_interval, 600, "seconds between sweeps of expired rendered lists"); \
        ADD_OPTION(uint64_t, misc_ttl, 1800, "seconds a /misc list stays cached"); \
        ADD_OPTION(size_t, misc_cache_size, 1000, "maximum number of cached /misc lists"); \
        /* the published index */                                       \
        ADD_OPTION(std::string, base_url, "", "public base url used in the index.  Empty disables index generation"); \
        ADD_OPTION(std::string, index_path, "", "the index is written to, and served from, this file"); \
        /* startup */                                                   \
        ADD_OPTION(std::string, pidfile, "", "name of the file in which to write the pid"); \
        ADD_OPTION(std::string, portfile, "", "the bound port number is written to this file"); \
        /* logging and diagnostics */                                   \
        ADD_OPTION(std::string, diag_names, "", "string passed to diag_names"); \
        ADD_OPTION(std::string, diag_destination, "", "log_channel destination for diagnostics"); \
        ADD_OPTION(std::string, accesslog_destination, "%none", "log_channel destination for access logs"); \
        ADD_OPTION(std::string, log_destination, "%stderr", "log_channel destination for 'complaints'.  Format:  \"filename\" or \"%syslog%LOG_facility\" or \"%stdout\" or \"%stderr\" or \"%none\""); \
        ADD_OPTION(std::string, log_min_level, "LOG_INFO", "only send complaints of this severity level or higher to the log_destination"); \
        ADD_OPTION(double, log_max_hourly_rate, 3600., "limit log records to approximately this many per hour."); \
        ADD_OPTION(double, log_rate_window, 3600., "estimate log record rate with an exponentially decaying window of this many seconds."); \
        /* development and testing */                                   \
        ADD_OPTION(bool, argcheck, false, "Parse arguments and construct the server, but don't run it.")

#define ADD_OPTION(TYPE, NAME, DEFAULT, DESC) TYPE NAME = DEFAULT
    ADD_ALL_OPTIONS;
#undef ADD_OPTION
    geosited_options(geocore::option_parser& p, const char* progname) : PROGNAME(progname){
        p.add_option("help", "print this message to stderr", geocore::opt_true_setter(help));
#define ADD_OPTION(TYPE, NAME, DEFAULT, DESC) p.add_option(#NAME, geocore::str(DEFAULT), DESC, geocore::opt_setter(NAME))
        ADD_ALL_OPTIONS;
#undef ADD_OPTION
#undef ADD_ALL_OPTIONS
    }
};

void geosited_global_setup(const geosited_options&);
