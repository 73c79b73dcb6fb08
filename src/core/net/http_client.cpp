/**
 * @file http_client.cpp
 */

#include "core/net/http_client.h"
#include "core/errors.h"
#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <sstream>

namespace tradegate::nethttp {

namespace {

size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlDeleter { void operator()(CURL* c) const { curl_easy_cleanup(c); } };
struct SlistDeleter { void operator()(curl_slist* l) const { curl_slist_free_all(l); } };

void ensure_global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlStringDeleter { void operator()(char* p) const { curl_free(p); } };

} // namespace

HttpClient::HttpClient(HttpOptions options) : options_(std::move(options)) {
    ensure_global_init();
}

std::string HttpClient::request(const std::string& method,
                                const std::string& url,
                                const std::vector<Header>& headers,
                                const std::string& body) const {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) throw TransportError("curl_easy_init failed");

    std::string response;
    curl_slist* raw_hdrs = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name + ": " + h.value;
        raw_hdrs = curl_slist_append(raw_hdrs, line.c_str());
    }
    std::unique_ptr<curl_slist, SlistDeleter> hdrs(raw_hdrs);

    CURL* c = curl.get();
    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_HTTPHEADER, hdrs.get());
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(c, CURLOPT_ACCEPT_ENCODING, ""); // allow compressed
    curl_easy_setopt(c, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(c, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(c, CURLOPT_SSL_VERIFYHOST, 2L);
    // Avoid signals in multithreaded use
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT_MS, options_.connect_timeout_ms);
    curl_easy_setopt(c, CURLOPT_TIMEOUT_MS, options_.total_timeout_ms);
    curl_easy_setopt(c, CURLOPT_DNS_CACHE_TIMEOUT, 60L);

    if (method == "POST") {
        curl_easy_setopt(c, CURLOPT_POST, 1L);
        curl_easy_setopt(c, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    } else if (method == "GET") {
        curl_easy_setopt(c, CURLOPT_HTTPGET, 1L);
    } else {
        throw InputError("unsupported HTTP method: " + method);
    }

    CURLcode rc = curl_easy_perform(c);
    long status = 0;
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &status);

    if (rc != CURLE_OK) {
        std::ostringstream oss; oss << "curl error: " << curl_easy_strerror(rc) << " (" << method << " " << url << ")";
        throw TransportError(oss.str());
    }
    if (status >= 400) {
        throw HttpStatusError(status, response);
    }
    return response;
}

std::string build_query(const std::vector<std::pair<std::string, std::string>>& params) {
    ensure_global_init();
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) throw TransportError("curl_easy_init failed");

    std::string out;
    for (const auto& [k, v] : params) {
        std::unique_ptr<char, CurlStringDeleter> escaped(
            curl_easy_escape(curl.get(), v.data(), static_cast<int>(v.size())));
        if (!escaped) throw TransportError("curl_easy_escape failed for " + k);
        if (!out.empty()) out.push_back('&');
        out += k;
        out.push_back('=');
        out += escaped.get();
    }
    return out;
}

} // namespace tradegate::nethttp
