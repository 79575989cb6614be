#include "geosite123/curl_transport.hpp"
#include "geosite123/errors.hpp"
#include <geocore/diag.hpp>
#include <geocore/strutils.hpp>
#include <geocore/throwutils.hpp>
#include <algorithm>
#include <exception>
#include <memory>

using namespace geocore;

static auto _http = diag_name("http");

namespace {
// libcurl wants curl_global_init called while there's only one thread.
struct curl_global_raii{
    curl_global_raii(){ curl_global_init(CURL_GLOBAL_ALL); }
    ~curl_global_raii(){ curl_global_cleanup(); }
};
static curl_global_raii curl_global;

[[noreturn]] void
libcurl_throw(CURLcode c, const std::string& msg){
    throw std::system_error(c, geosite123::libcurl_category(), msg);
}

void wrap_curl_easy_setopt(CURL* curl, CURLoption option, long l){
    auto ret = curl_easy_setopt(curl, option, l);
    if(ret != CURLE_OK)
        libcurl_throw(ret, fmt("curl_easy_setopt(%p, %d, (long)%ld)", curl, option, l));
}

void wrap_curl_easy_setopt(CURL* curl, CURLoption option, void *v){
    auto ret = curl_easy_setopt(curl, option, v);
    if(ret != CURLE_OK)
        libcurl_throw(ret, fmt("curl_easy_setopt(%p, %d, (void*)%p)", curl, option, v));
}

void wrap_curl_easy_setopt(CURL* curl, CURLoption option, const std::string& s){
    auto ret = curl_easy_setopt(curl, option, s.c_str());
    if(ret != CURLE_OK)
        libcurl_throw(ret, fmt("curl_easy_setopt(%p, %d, %s)", curl, option, s.c_str()));
}

void wrap_curl_easy_setopt(CURL *curl, CURLoption option, curl_write_callback cb){
    auto ret = curl_easy_setopt(curl, option, cb);
    if(ret != CURLE_OK)
        libcurl_throw(ret, fmt("curl_easy_setopt(%p, %d, (curl_write_callback*)%p)", curl, option, (void*)cb));
}

template <typename T>
void wrap_curl_easy_getinfo(CURL* curl, CURLINFO option, T *tp){
    auto ret = curl_easy_getinfo(curl, option, tp);
    if(ret != CURLE_OK)
        libcurl_throw(ret, fmt("curl_easy_getinfo(%p, %d, %p)", curl, option, (void*)tp));
}

struct CURLcloser{
    void operator()(CURL *c){ ::curl_easy_cleanup(c); }
};
using CURL_ptr = std::unique_ptr<CURL, CURLcloser>;

struct curl_handler{
    // Callbacks can't be non-static members, so 'this' rides in userdata.
    static size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata){
        auto ch = static_cast<curl_handler*>(userdata);
        try{
            ch->recv_hdr(str_view(buffer, size*nitems));
            return size*nitems;
        }catch(...){
            // Don't throw "over" curl_easy_perform.  Rethrown after it returns.
            ch->exptr = std::current_exception();
            return 0;
        }
    }

    static size_t write_callback(char *buffer, size_t size, size_t nitems, void *userdata){
        auto ch = static_cast<curl_handler*>(userdata);
        try{
            ch->reply.body.append(buffer, size*nitems);
            return size*nitems;
        }catch(...){
            ch->exptr = std::current_exception();
            return 0;
        }
    }

    void recv_hdr(str_view sv){
        sv = sv_rstrip(sv);
        if(startswith(sv, "HTTP/")){
            // A new response, e.g., after a redirect.  Forget the old headers.
            reply.headers.clear();
            return;
        }
        if(sv.empty())
            return;
        auto colon = sv.find(':');
        if(colon == str_view::npos)
            return;
        reply.headers[tolower(sv.substr(0, colon))] = strip(sv.substr(colon+1));
    }

    geosite123::http_reply reply;
    std::exception_ptr exptr;
    char curl_errbuf[CURL_ERROR_SIZE];
};
} // namespace <anon>

namespace geosite123{

const std::error_category& libcurl_category() noexcept{
    static libcurl_category_t libcurl_category_singleton;
    return libcurl_category_singleton;
}

http_reply http_get(const std::string& url, const http_options& opts, bool head_only) try {
    CURL_ptr curlp(curl_easy_init());
    if(!curlp)
        throw se(ENOMEM, "curl_easy_init failed");
    CURL* curl = curlp.get();
    curl_handler ch;
    ch.curl_errbuf[0] = '\0';
    wrap_curl_easy_setopt(curl, CURLOPT_URL, url);
    wrap_curl_easy_setopt(curl, CURLOPT_USERAGENT, opts.user_agent);
    wrap_curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    wrap_curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    wrap_curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    wrap_curl_easy_setopt(curl, CURLOPT_TIMEOUT, long(opts.timeout.count()));
    wrap_curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, long(opts.connect_timeout.count()));
    wrap_curl_easy_setopt(curl, CURLOPT_NOBODY, head_only ? 1L : 0L);
    wrap_curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &curl_handler::header_callback);
    wrap_curl_easy_setopt(curl, CURLOPT_HEADERDATA, (void*)&ch);
    wrap_curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &curl_handler::write_callback);
    wrap_curl_easy_setopt(curl, CURLOPT_WRITEDATA, (void*)&ch);
    wrap_curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, (void*)ch.curl_errbuf);
    DIAG(_http, (head_only ? "HEAD " : "GET ") << url);
    auto ret = curl_easy_perform(curl);
    if(ret != CURLE_OK){
        std::system_error e(ret, libcurl_category(),
                            fmt("curl_easy_perform(%s): CURLOPT_ERRORBUFFER: %s", url.c_str(), ch.curl_errbuf));
        if(ch.exptr){
            try{
                std::rethrow_exception(ch.exptr);
            }catch(std::exception&){
                std::throw_with_nested(e);
            }
        }
        throw e;
    }
    wrap_curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &ch.reply.status);
    DIAG(_http, url << " -> " << ch.reply.status << " " << ch.reply.body.size() << " bytes");
    return std::move(ch.reply);
}catch(std::exception&){
    std::throw_with_nested(transport_error(std::string(head_only ? "HEAD " : "GET ") + url + " failed"));
}

std::string curl_transport::check_fingerprint(){
    auto r = http_get(url_, opts_, true);
    if(r.status != 200)
        throw transport_error(fmt("HEAD %s returned status %ld", url_.c_str(), r.status));
    auto p = r.headers.find("etag");
    return p == r.headers.end() ? std::string() : normalize_etag(p->second);
}

download_result curl_transport::download(){
    auto r = http_get(url_, opts_, false);
    if(r.status != 200)
        throw transport_error(fmt("GET %s returned status %ld", url_.c_str(), r.status));
    auto p = r.headers.find("etag");
    return {std::move(r.body), p == r.headers.end() ? std::string() : normalize_etag(p->second)};
}

} // namespace geosite123
