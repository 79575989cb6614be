#include "geosited_handler.hpp"
#include "geosite123/curl_transport.hpp"
#include "geosite123/errors.hpp"
#include "geosite123/fetcher.hpp"
#include "geosite123/publish_index.hpp"
#include "geosite123/result_cache.hpp"
#include "geosite123/ruleset_service.hpp"
#include "geosite123/source_cache.hpp"
#include <geocore/complaints.hpp>
#include <geocore/diag.hpp>
#include <geocore/periodic.hpp>
#include <geocore/throwutils.hpp>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <arpa/inet.h>
#include <signal.h>

using namespace geocore;
using namespace geosite123;
using std::chrono::seconds;

namespace{
char PROGNAME[] = "geosited";
auto _sweep = diag_name("sweep");

// The body of a /misc list.  A 404 upstream is a 404 for our client
// too.  Anything else that isn't a 200 is upstream's fault.
std::string misc_get(const std::string& url, const http_options& ho){
    auto reply = http_get(url, ho);
    if(reply.status == 404)
        throw not_found_error("no such misc list: " + url);
    if(reply.status != 200)
        throw transport_error(fmt("GET %s: status %ld", url.c_str(), reply.status));
    return std::move(reply.body);
}
} // namespace <anon>

int main(int argc, char *argv[]) try
{
    the_diag().opt_tid = true;
    option_parser op;
    server_options server_opts(op);
    geosited_options gopts(op, PROGNAME);
    // The environment first, so the command line wins.
    op.setopts_from_env("GEO_");
    auto more_args = op.setopts_from_argv(argc, argv);
    if(gopts.help){
        std::cerr << op.helptext() << "\n";
        return 0;
    }
    if(!more_args.empty())
        throw std::runtime_error("unrecognized arguments:" + strbe(more_args));

    geosited_global_setup(gopts);

    source_cache sources(seconds(gopts.zip_ttl));
    if(!gopts.zip_cache_path.empty()){
        try{
            if(sources.load_from_file(gopts.zip_cache_path))
                log_notice("loaded archive snapshot from %s", gopts.zip_cache_path.c_str());
        }catch(std::exception& e){
            complain(LOG_WARNING, e, "could not load archive snapshot.  Starting with an empty cache");
        }
    }

    http_options ho;
    ho.timeout = seconds(gopts.fetch_timeout);
    ho.connect_timeout = seconds(gopts.connect_timeout);
    fetcher f(sources, std::make_shared<curl_transport>(gopts.upstream_url, ho));
    result_cache results(seconds(gopts.result_ttl));
    published_index index(gopts.base_url, gopts.index_path);

    service_options so;
    so.data_prefix = gopts.data_prefix;
    so.misc_base_url = gopts.misc_base_url;
    so.misc_ttl = seconds(gopts.misc_ttl);
    so.misc_cache_size = gopts.misc_cache_size;
    ruleset_service service(f, results, index, so,
                            [ho](const std::string& url){ return misc_get(url, ho); });

    geosited_handler h(gopts, service);
    server s(server_opts, h);
    s.set_signal_handlers(); // stop on TERM, INT, HUP and QUIT
    s.add_sig_handler(SIGUSR1,
                      [&](int, void*){
                          complain(LOG_NOTICE, "caught SIGUSR1.  Re-opening accesslog and complaint log");
                          h.accesslog_channel.reopen();
                          reopen_complaint_destination();
                      },
                      nullptr);
    if(gopts.argcheck)
        return 0;
    if(!gopts.portfile.empty()){
        std::ofstream ofs(gopts.portfile.c_str());
        sockaddr_in sain = s.get_sockaddr_in();
        ofs << ntohs(sain.sin_port) << "\n";
        ofs.close();
        if(!ofs)
            throw se("Could not write to portfile");
    }

    // Each loop's first call happens right away, so the refresher
    // also does the startup download and index.
    std::unique_ptr<periodic> refresher;
    if(gopts.zip_refresh_interval > 0){
        refresher = std::make_unique<periodic>([&](){
                try{
                    service.refresh_source();
                }catch(std::exception& e){
                    complain(LOG_WARNING, e, "background refresh failed");
                }
                return seconds(gopts.zip_refresh_interval);
            });
    }else{
        try{
            service.refresh_index();
        }catch(std::exception& e){
            complain(LOG_WARNING, e, "startup index refresh failed");
        }
    }
    periodic sweeper([&](){
            try{
                auto n = service.sweep();
                DIAGf(_sweep, "swept %zu", n);
            }catch(std::exception& e){
                complain(LOG_WARNING, e, "sweep failed");
            }
            return seconds(gopts.result_sweep_interval);
        });

    log_notice("%s listening on %s:%u", PROGNAME, server_opts.bindaddr.c_str(), unsigned(server_opts.port));
    s.run(); // until a signal stops it
    sweeper.stop();
    if(refresher)
        refresher->stop();
    return 0;
 }catch(std::exception& e){
    complain(LOG_ERR, e, "Shutting down because of exception caught in main");
    return 1;
 }
