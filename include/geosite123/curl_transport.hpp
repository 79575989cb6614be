#pragma once

// libcurl plumbing: a one-shot http_get, and curl_transport, the
// archive_transport that the daemon uses.
//
// Failures inside libcurl are system_errors in libcurl_category(),
// nested inside a transport_error.  A completed request with a
// status other than 200 is a transport_error whose what() names
// the url and the status.

#include "geosite123/fetcher.hpp"
#include <curl/curl.h>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <system_error>

namespace geosite123{

struct http_options{
    std::chrono::seconds timeout{60};
    std::chrono::seconds connect_timeout{15};
    std::string user_agent{"geosite123/1.0"};
};

struct http_reply{
    long status = 0;
    std::string body;
    // keys are lower-cased.  Only the final response's headers
    // survive redirects.
    std::map<std::string, std::string> headers;
};

// Redirects are followed.  Throws transport_error if the request
// can't be completed.  Does NOT throw for non-200 statuses.
http_reply http_get(const std::string& url, const http_options& opts, bool head_only = false);

class curl_transport : public archive_transport{
public:
    curl_transport(const std::string& url, const http_options& opts) :
        url_(url), opts_(opts){}
    std::string check_fingerprint() override;
    download_result download() override;
private:
    std::string url_;
    http_options opts_;
};

const std::error_category& libcurl_category() noexcept;

struct libcurl_category_t : public std::error_category{
    const char *name() const noexcept override { return "libcurl"; }
    std::string message(int ev) const override{
        static std::mutex err_mtx; // curl_easy_strerror isn't reentrant
        std::lock_guard<std::mutex> lg(err_mtx);
        return curl_easy_strerror(static_cast<CURLcode>(ev));
    }
};

} // namespace geosite123
