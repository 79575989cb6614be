#include "geosite123/geositeserver.hpp"
#include <geocore/exnest.hpp>
#include <geocore/sew.hpp>
#include <geocore/http_error_category.hpp>
#include <geocore/complaints.hpp>
#include <geocore/diag.hpp>
#include <event2/event.h>
#include <event2/http.h>
#include <event2/keyvalq_struct.h>
#include <event2/buffer.h>
#include <event2/listener.h>
#include <event2/thread.h>
#include <cstring>
#include <mutex>
#include <thread>
#include <signal.h>

using namespace geocore;

namespace {
auto _proc = diag_name("proc");
auto _server = diag_name("server");

// Under load libevent can report "too many open files" as fast as it
// can accept, so consecutive duplicates are suppressed.
void dup_suppress_log(int severity, const char *msg) {
    static std::mutex mtx;
    static std::string prevmsg;
    static unsigned long prevcount{0};
    std::lock_guard<std::mutex> lg(mtx);
    if (msg == prevmsg) {
        if (prevcount == 0) {
            prevcount++;
            complain(LOG_WARNING, "duplicate message, suppressing consecutive repeats after this...");
        }
        return;
    } else {
        prevmsg = msg;
        prevcount = 0;
    }
    int level;
    switch(severity){
    case EVENT_LOG_DEBUG:
        level = LOG_DEBUG; break;
    case EVENT_LOG_MSG:
        level = LOG_INFO; break;
    case EVENT_LOG_WARN:
        level = LOG_WARNING; break;
    case EVENT_LOG_ERR:
    default:
        level = LOG_ERR; break;
    }
    complain(level, "%s", msg);
}

geosite123::method_e
evhttp_request_get_method(const evhttp_request *evreq){
    auto cmd = evhttp_request_get_command(evreq);
    switch(cmd){
#define CASE(SYM) case EVHTTP_REQ_##SYM : return geosite123::SYM;
        CASE(GET);
        CASE(POST);
        CASE(HEAD);
        CASE(PUT);
        CASE(DELETE);
        CASE(OPTIONS);
        CASE(TRACE);
        CASE(CONNECT);
        CASE(PATCH);
#undef CASE
    default:
        break;
    }
    throw std::runtime_error(str("Unrecognized value of evhttp_command:", cmd));
}

void add_hdr(evkeyvalq* hdrs, const char* n, const std::string& v) {
    // evhttp_add_header copies both n and v.
    if( evhttp_add_header(hdrs, n, v.c_str()) != 0 )
        throw se(EINVAL, fmt("evhttp_add_header(%s, %s) returned non-zero", n, v.c_str()));
}

void sig_cb_adapter(int, short, void* _data){
    auto& data = *(geosite123::sig_cb_adapter_data*)_data;
    std::get<std::function<void(int,void*)>>(data)(std::get<int>(data), std::get<void*>(data));
}

} // namespace <anon>

namespace geosite123{

const char* method_name(method_e m){
    switch(m){
    case GET: return "GET";
    case HEAD: return "HEAD";
    default: return "OTHER";
    }
}

// Work from the bottom up.  The first system_error in the http
// category decides.  Other system_errors (errno, libcurl) say nothing
// about what the client did, so keep looking above them.
int http_status_from_evnest(const std::exception& e){
    for(auto& er : rexnest(e)) {
        auto sep = dynamic_cast<const std::system_error*>(&er);
        if(sep && sep->code().category() == http_error_category())
            return sep->code().value();
    }
    return 500;
}

req::req(evhttp_request* evreq, server* _server) :
    evhr(evreq),
    svr(*_server),
    replied(false)
{
    method = evhttp_request_get_method(evreq);
    uri = evhttp_request_get_uri(evreq); // unparsed, not decoded
}

req::~req(){
    if(!replied)
        exception_reply(http_exception(500, "geosite123::req destroyed before a reply was sent"));
}

std::string
req::get_header(const char* name) const{
    auto inheaders = evhttp_request_get_input_headers(evhr);
    if(!inheaders)
        return {};
    const char* v = evhttp_find_header(inheaders, name);
    return v ? v : "";
}

void /*private*/
req::maybe_call_logger(int status) {
    if(!evhr)
        return complain(LOG_ERR, "req::maybe_call_logger called with evhr==nullptr.  This *SHOULD NOT HAPPEN*.  Start debugging!");

    char *remote;
    uint16_t port;
    auto evcon = evhttp_request_get_connection(evhr);
    evhttp_connection_get_peer(evcon, &remote, &port);
    const char *evuri = evhttp_request_get_uri(evhr);
    auto length = evbuffer_get_length(evhttp_request_get_output_buffer(evhr));
    // libevent would add a Date header in evhttp_send_reply anyway.
    // Adding it ourselves costs nothing extra and gives the logger
    // the same string.
    auto headers = evhttp_request_get_output_headers(evhr);
    char date[50];
    if (sizeof(date) - evutil_date_rfc1123(date, sizeof(date), NULL) > 0) {
        evhttp_add_header(headers, "Date", date);
    }else{
        complain(LOG_ERR, "evutil_date_rfc1123 didn't fit in 50 chars?");
        strcpy(date, "-");
    }
    try{
        svr.handler.logger(remote, method, evuri, status, length, date);
    }catch(std::exception& e){
        complain(LOG_ERR, e, "exception thrown by logger handler");
    }
}

void /* private */
req::log_and_send_destructively(int status) try {
    if(replied)
        throw std::runtime_error("req::log_and_send_destructively has already been called");
    // Only try once.  If something in here throws, replied is still
    // set, so ~req won't try again.
    replied = true;
    DIAGf(_server, "log_and_send_destructively(%d)", status);
    maybe_call_logger(status);
    evhttp_send_reply(evhr, status, nullptr, nullptr);
    // evhr now belongs to libevent, and so does everything uri, path
    // and query point into.
    evhr = nullptr;
 }catch(std::exception& e){
    complain(LOG_CRIT, e, "Exception thrown by final log_and_send_destructively.  Reply not sent.  Client will eventually time out.");
 }

void
req::exception_reply(const std::exception& e) {
    auto status = http_status_from_evnest(e);
    // A 4xx is the client's problem, not ours.
    complain(status < 500 ? LOG_INFO : LOG_ERR, e, "%d reply to %s", status, std::string(uri).c_str());
    // Throw away anything that was associated with evhr before the
    // exception.
    evhttp_clear_headers(evhttp_request_get_output_headers(evhr));
    auto evb = evhttp_request_get_output_buffer(evhr);
    evbuffer_drain(evb, evbuffer_get_length(evb));
    evhttp_add_header(evhttp_request_get_output_headers(evhr), "Content-Type", "text/plain; charset=utf-8");
    for(auto& ep : exnest(e)){
        evbuffer_add_printf(evb, "%s\n", ep.what());
    }
    log_and_send_destructively(status);
}

void req::redirect_reply(const std::string& location, const std::string& cc) try {
    auto ohdrs = evhttp_request_get_output_headers(evhr);
    add_hdr(ohdrs, "Location", location);
    if(!cc.empty())
        add_hdr(ohdrs, "Cache-Control", cc);
    log_and_send_destructively(302);
 }catch(std::exception& e) { exception_reply(e); }

void req::content_reply(const std::string& body, const std::string& content_type, const std::string& cc) try {
    auto ohdrs = evhttp_request_get_output_headers(evhr);
    add_hdr(ohdrs, "Content-Type", content_type);
    if(!cc.empty())
        add_hdr(ohdrs, "Cache-Control", cc);
    if(evbuffer_add(evhttp_request_get_output_buffer(evhr), body.data(), body.size()) != 0)
        throw std::runtime_error("evbuffer_add failed in content_reply");
    log_and_send_destructively(200);
 }catch(std::exception& e) { exception_reply(e); }

void /* static private */
req::parse_and_handle(req::up req) try {
    switch (req->method) {
    case GET:
    case HEAD:
        break;
    default:
        httpthrow(403, "Unsupported request method " + std::to_string(evhttp_request_get_command(req->evhr)));
    }

    const evhttp_uri* uri = evhttp_request_get_evhttp_uri(req->evhr);
    if(!uri)
        httpthrow(400, "evhttp_request_get_evhttp_uri returned NULL");
    const char* uri_path = evhttp_uri_get_path(uri);
    if(!uri_path || !*uri_path)
        uri_path = "/";
    size_t pathlen;
    req->decoded_path.reset(evhttp_uridecode(uri_path, 0, &pathlen));
    if(!req->decoded_path)
        httpthrow(400, "failed to uridecode path");
    req->path = str_view(req->decoded_path.get(), pathlen);
    if(req->path.find('\0') != str_view::npos)
        httpthrow(400, "path may not contain NUL");
    const char* q = evhttp_uri_get_query(uri);
    if(q)
        req->query = q;
    DIAG(_server, "handle " << method_name(req->method) << " " << req->path);
    req->svr.handler.handle(std::move(req));
 }catch(std::exception& e){
    if(req)
        req->exception_reply(e);
    else
        complain(LOG_ERR, e, "exception thrown by handler after it replied");
 }

// http_cb is the callback that's invoked directly by libevent.
void /* static private */
req::http_cb(evhttp_request* evreq, void *varg) try {
    auto svr = static_cast<server*>(varg);
    parse_and_handle(make_up(evreq, svr));
 }catch(std::exception& e){
    complain(LOG_ERR, e, "exception thrown in http_cb");
 }

void
server::set_signal_handlers() {
    auto sigcb = [] (evutil_socket_t, short /*what*/, void *arg) -> void {
                     auto svr = static_cast<server*>(arg);
                     svr->stop();
                     event_base_loopbreak(svr->ebac);
                     complain(LOG_NOTICE, "Caught one of SIGINT, SIGTERM, SIGHUP or SIGQUIT.  Shutting down.");
                 };
    for (auto sig : {SIGINT, SIGTERM, SIGHUP, SIGQUIT}) {
        auto e = event_new(ebac, sig, EV_SIGNAL, sigcb, this);
        if (e == nullptr)
            throw se(errno, "event_new on signal failed");
        events2befreed.push_back(e);
        if (event_add(e, nullptr) < 0)
            throw se(errno, "event_add on signal failed");
    }
}

void server::add_sig_handler(int sig, std::function<void(int, void*)> cb, void* arg){
    if(!ebac)
        throw se(EINVAL, "add_sig_handler called before the event_base was created");
    sig_cb_adapter_data_ll.emplace_back(sig, cb, arg);
    auto& ad = sig_cb_adapter_data_ll.back();
    struct event* e = event_new(ebac, sig, EV_SIGNAL|EV_PERSIST,
                                sig_cb_adapter, &ad);
    if(!e)
        throw se(errno, "event_new on signal failed");
    events2befreed.push_back(e);
    if(event_add(e, nullptr) < 0)
        throw se(errno, "event_add on signal failed");
}

struct sockaddr_in
server::get_sockaddr_in() const{
    if (ehsock == nullptr)
        httpthrow(500, "get_sockaddr_in with null ehsock?");
    auto sockfd = evhttp_bound_socket_get_fd(ehsock);
    struct sockaddr_in sa;
    socklen_t salen = sizeof(sa);
    sew::getsockname(sockfd, (struct sockaddr*)&sa, &salen);
    return sa;
}

void
server::evhttp_bind_socket(struct event_base* eb, struct evhttp* eh) /*private */{
    // A secondary thread listening on the primary's socket.
    // evhttp_accept_socket_with_handle would set
    // LEV_OPT_CLOSE_ON_FREE, and then every thread would try to close
    // the shared socket on the way out.
    const int flags = LEV_OPT_REUSEABLE|LEV_OPT_CLOSE_ON_EXEC;
    auto listener = evconnlistener_new(eb, NULL, NULL, flags, 0, evhttp_bound_socket_get_fd(ehsock));
    if(!listener)
        throw se("thread failed in evconnlistener_new");
    auto bound = evhttp_bind_listener(eh, listener);
    if(!bound){
        evconnlistener_free(listener);
        throw se("thread failed in evhttp_bind_listener");
    }
}

void
server::setup_evhttp(struct evhttp *eh) {
    evhttp_set_gencb(eh, req::http_cb, this);
    evhttp_set_default_content_type(eh, "text/plain; charset=utf-8");
    evhttp_set_max_headers_size(eh, gopts->max_http_headers_size);
    evhttp_set_max_body_size(eh, gopts->max_http_body_size);
    evhttp_set_timeout(eh, gopts->max_http_timeout);
    evhttp_set_allowed_methods(eh, EVHTTP_REQ_GET|EVHTTP_REQ_HEAD);
}

server::server(const server_options& opts, handler_base& h) :
    handler(h)
{
    gopts = std::make_unique<const server_options>(opts);
    // The listener threads each have their own event_base, but
    // libevent's globals (the log callback, signal handling) are
    // shared.
    evthread_use_pthreads();

    if(gopts->libevent_debug){
#ifdef EVENT_DBG_ALL
        event_enable_debug_logging(EVENT_DBG_ALL);
        set_complaint_level(LOG_DEBUG);
#else
        complain(LOG_WARNING, "this version of libevent does not have an EVENT_DBG_ALL option");
#endif
    }

    // Clients hang up.  We'd rather see EPIPE than die.
    struct sigaction sa = {};
    sa.sa_handler = SIG_IGN;
    sew::sigaction(SIGPIPE, &sa, nullptr);

    event_set_log_callback(dup_suppress_log);
    ebac = make_autocloser(event_base_new(), ::event_base_free);
    if (!ebac)
        throw se(errno, "event_base_new failed");

    ehac = make_autocloser(evhttp_new(ebac), ::evhttp_free);
    if (!ehac)
        throw se(errno, "evhttp_new failed");
    DIAGf(_server, "evhttp_bind_socket_with_handle(%p, %s, %d)",
          (void*)ehac.get(), gopts->bindaddr.c_str(), gopts->port);
    ehsock = evhttp_bind_socket_with_handle(ehac, gopts->bindaddr.c_str(), gopts->port);
    if (ehsock == nullptr)
        throw se(errno, fmt("evhttp_bind_socket(%s, %d) failed", gopts->bindaddr.c_str(), gopts->port));
    evutil_make_listen_socket_reuseable(evhttp_bound_socket_get_fd(ehsock));

    setup_evhttp(ehac);

    donecheck_cb_arg = std::make_unique<donecheck_cb_arg_t>(ebac, this);
    donecheck_ev = make_autocloser(event_new(ebac, -1, EV_PERSIST, donecheck_cb, donecheck_cb_arg.get()), ::event_free);
    if(!donecheck_ev)
        throw se("event_new(..., donecheck_cb) failed");
    const struct timeval donecheck_tv{thread_done_delay_secs, 0};
    if (event_add(donecheck_ev, &donecheck_tv) < 0)
        throw se("event_add donecheck failed");
}

server::~server(){
    for(auto e : events2befreed)
        event_free(e);
    events2befreed.clear();
}

// The only inter-thread communication is the done atomic, which
// every loop polls once per thread_done_delay_secs.
void
server::donecheck_cb(evutil_socket_t, short, void *varg){
    auto& arg = *(donecheck_cb_arg_t*)varg;
    if (std::get<server*>(arg)->done.load())
        event_base_loopbreak(std::get<event_base*>(arg));
}

void
server::run() try {
    std::vector<std::thread> threads;
    // Each additional thread gets its own event_base and evhttp
    // listening on the already-bound socket.  Accepts land in
    // whichever thread wins, and that thread owns the connection
    // from then on, keepalives included.
    auto threadrun = [this] () {
        try {
            auto ebthr = make_autocloser(event_base_new(), ::event_base_free);
            if (!ebthr)
                throw se("thread failed to create event_base");
            auto ehthr = make_autocloser(evhttp_new(ebthr), ::evhttp_free);
            if (!ehthr)
                throw se("thread failed to create evhttp");
            evhttp_bind_socket(ebthr, ehthr);
            setup_evhttp(ehthr);
            donecheck_cb_arg_t donecheck_cb_argthr(ebthr.get(), this);
            auto e = make_autocloser(event_new(ebthr, -1, EV_PERSIST, donecheck_cb, &donecheck_cb_argthr), ::event_free);
            if(!e)
                throw se("thread failed in event_new(..., donecheck_cb)");
            const struct timeval donecheck_tv{thread_done_delay_secs, 0};
            if (event_add(e, &donecheck_tv) < 0)
                throw se("event_add donecheck failed");

            if (event_base_loop(ebthr, 0) < 0)
                throw se("thread event_base_loop failed");
        } catch(std::exception &e) {
            complain(LOG_ERR, e, "geosite123::server::run:  listener thread terminating unexpectedly on exception.");
        }
    };
    // the calling thread is listener number 0
    for (unsigned i = 1; !done.load() && i < gopts->nlisteners; i++)
        threads.emplace_back(threadrun);

    if (event_base_loop(ebac, 0) < 0)
        complain(LOG_ERR, "event_base_loop failed");

    complain(LOG_NOTICE, "server::run:  primary thread returned from event_base_loop.  Joining %zu secondary threads", threads.size());
    done.store(true);
    for (auto& t : threads)
        t.join();
    DIAGf(_proc, "finished main thread proc");
 }catch(std::exception& e){
    done.store(true);
    std::throw_with_nested(std::runtime_error("geosite123::server::run:  exception caught in primary thread.  done.store(true) called."));
 }

void server::stop(){
    done.store(true);
}

} // namespace geosite123
