#pragma once

// To serve http with geosite123 you must:
//   - construct an instance of geosite123::server_options
//   - construct an instance of a class derived from geosite123::handler_base
//   - construct a geosite123::server with the above and call run().
//
// The first is easily accomplished from the command line with
// geocore/opt.hpp.  See app_geosited.cpp.
//
// Each call to handler_base::handle must end in exactly one of:
//   - content_reply
//   - redirect_reply
//   - exception_reply
//
// The xxx_reply functions take the req::up that was passed to the
// handler.  It must be std::moved, so the handler can't touch the
// req after replying.  If the req::up goes out of scope without a
// reply, the req's destructor sends a 500.
//
// exception_reply picks the status from the innermost system_error
// in the http category (see geocore/http_error_category.hpp) anywhere
// in the exception's nest, and 500 if there is none.  Every what()
// in the nest goes into the body, one per line.
//
// Handlers are called synchronously in the thread whose event loop
// accepted the connection.  There are nlisteners such threads, all
// accepting on the same socket, so a slow handler only holds up the
// connections its own thread owns.

#include <geocore/autoclosers.hpp>
#include <geocore/opt.hpp>
#include <geocore/strutils.hpp>
#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <string>
#include <tuple>
#include <vector>
#include <cstdint>
#include <cstdlib>
#include <netinet/in.h>

extern "C"{
//  Incomplete declarations of the libevent types we hold on to.
//  Callers don't need the libevent headers.
struct evhttp_request;
struct event;
void event_free(event*);
struct event_base;
void event_base_free(event_base*);
struct evhttp;
void evhttp_free(evhttp*);
struct evhttp_bound_socket;
#define EVUTIL_SOCKET_T int
}

namespace geosite123{

enum method_e { GET, POST, HEAD, PUT, DELETE, OPTIONS, TRACE, CONNECT, PATCH };
const char* method_name(method_e);

struct server;

struct req{
    using up = std::unique_ptr<req>;
    // reqs are neither copy-able nor move-able.  They are only made
    // by make_up, and stay put until destroyed, so the destructor can
    // tell whether a reply was sent.
    req(req&&) = delete;
    req(const req&) = delete;
    req& operator=(req&&) = delete;
    req& operator=(const req&) = delete;
    static up make_up(evhttp_request* evreq, server* _server){
        return up(new req(evreq, _server));
    }
    method_e method;
    // uri is exactly what the client sent.  path is its uri-decoded
    // path component, without the query.  Both are valid until a
    // reply function is called.
    geocore::str_view uri;
    geocore::str_view path;
    geocore::str_view query;
    // The value of the named request header, or "" if there isn't one.
    std::string get_header(const char* name) const;

    ~req();
    friend server;
    friend void exception_reply(up th, const std::exception& e) { th->exception_reply(e); }
    friend void redirect_reply(up th, const std::string& location, const std::string& cc) { th->redirect_reply(location, cc); }
    friend void content_reply(up th, const std::string& body, const std::string& content_type, const std::string& cc){
        th->content_reply(body, content_type, cc); }
private:
    req(evhttp_request* evreq, server* _server);
    static void http_cb(evhttp_request* evreq, void *vserver);
    static void parse_and_handle(up req);

    evhttp_request* evhr;
    server& svr;
    bool replied;
    std::unique_ptr<char, void(*)(void*)> decoded_path{nullptr, ::free};

    void log_and_send_destructively(int status);
    void maybe_call_logger(int status);
    void exception_reply(const std::exception& e);
    void redirect_reply(const std::string& location, const std::string& cc);
    void content_reply(const std::string& body, const std::string& content_type, const std::string& cc);
};

struct handler_base{
    virtual void handle(req::up) = 0;
    // Called once per reply, just before it's sent.
    virtual void logger(const char* /*remote*/, method_e /*method*/, const char* /*uri*/, int /*status*/, size_t /*length*/, const char* /*date*/){}
    virtual ~handler_base(){}
};

#define ALLOPTS \
OPTION(unsigned, nlisteners, 4, "run with this many event-loop threads");\
OPTION(std::string, bindaddr, "0.0.0.0", "bind to this address");\
OPTION(uint16_t, port, 8080, "bind to this port.  If 0, an ephemeral port is chosen.  The port in use is available via server::get_sockaddr_in.");\
OPTION(uint64_t, max_http_headers_size, 8000, "maximum bytes in incoming request HTTP headers");\
/* requests are GET or HEAD, so there's never much of a body */ \
OPTION(uint64_t, max_http_body_size, 500, "maximum bytes in incoming request HTTP body");\
/* longer than a typical proxy's 60 second upstream timeout */ \
OPTION(uint64_t, max_http_timeout, 120, "http timeout on incoming request being complete");\
OPTION(bool, libevent_debug, false, "direct libevent debug info to complain(LOG_DEBUG, ...) (this produces a lot of output)")

struct server_options {
#define OPTION(type, name, default, desc)        \
    type name
ALLOPTS;
#undef OPTION
    server_options(geocore::option_parser& op){
#define OPTION(type, name, dflt, desc) \
        op.add_option(#name, geocore::str(dflt), desc, geocore::opt_setter(name))
ALLOPTS;
#undef OPTION
    }
};
#undef ALLOPTS

using sig_cb_adapter_data = std::tuple<int, std::function<void(int, void*)>, void*>;

struct server{
    server(const server_options&, handler_base&);
    void add_sig_handler(int signum, std::function<void(int, void*)>, void*);
    // INT, TERM, HUP and QUIT stop the server.
    void set_signal_handlers();
    void run();
    void stop();
    struct sockaddr_in get_sockaddr_in() const;
    ~server();
private:
    friend struct req;
    std::unique_ptr<const server_options> gopts;
    decltype(geocore::make_autocloser((event_base*)nullptr, event_base_free)) ebac{nullptr, ::event_base_free};
    decltype(geocore::make_autocloser((evhttp*)nullptr, evhttp_free)) ehac{nullptr, ::evhttp_free};
    decltype(geocore::make_autocloser((event*)nullptr, event_free)) donecheck_ev{nullptr, ::event_free};
    handler_base& handler;
    struct evhttp_bound_socket* ehsock = nullptr;
    std::vector<event*> events2befreed;
    // grows with every add_sig_handler, never shrinks.
    std::list<sig_cb_adapter_data> sig_cb_adapter_data_ll;
    const long thread_done_delay_secs = 1;
    static void donecheck_cb(EVUTIL_SOCKET_T, short, void *varg);
    using donecheck_cb_arg_t = std::tuple<event_base*, server*>;
    std::unique_ptr<donecheck_cb_arg_t> donecheck_cb_arg;
    std::atomic<bool> done{false};

    void setup_evhttp(struct evhttp *eh);
    void evhttp_bind_socket(struct event_base* eb, struct evhttp* eh); // called by secondary threads
};

// The status exception_reply would send for e.
int http_status_from_evnest(const std::exception& e);

} // namespace geosite123
