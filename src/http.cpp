#include "http.hpp"

#include <curl/curl.h>
#include <iostream>
#include <string>

namespace epss {

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

namespace {

size_t append_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

// Easy handle plus the header list it points at; both freed together.
class CurlGet {
public:
    CurlGet() : curl_(curl_easy_init()) {}
    ~CurlGet() {
        curl_slist_free_all(headers_);
        if (curl_) curl_easy_cleanup(curl_);
    }
    CurlGet(const CurlGet&) = delete;
    CurlGet& operator=(const CurlGet&) = delete;

    bool ok() const { return curl_ != nullptr; }

    void prepare(const std::string& url, const std::vector<Header>& headers,
                 long timeout_seconds, std::string& body) {
        for (const auto& h : headers) {
            headers_ = curl_slist_append(headers_, (h.first + ": " + h.second).c_str());
        }
        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_seconds);
        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, timeout_seconds);
        curl_easy_setopt(curl_, CURLOPT_PROTOCOLS_STR, "http,https");
        curl_easy_setopt(curl_, CURLOPT_ACCEPT_ENCODING, "");
        curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, append_body);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &body);
    }

    // HTTP status, or 0 when the transfer failed.
    long perform(const std::string& url) {
        CURLcode rc = curl_easy_perform(curl_);
        if (rc != CURLE_OK) {
            std::cerr << "[http] GET " << url << ": " << curl_easy_strerror(rc) << "\n";
            return 0;
        }
        long status = 0;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
        return status;
    }

private:
    CURL* curl_;
    curl_slist* headers_ = nullptr;
};

} // namespace

HttpResponse CurlHttpClient::get(const std::string& url,
                                 const std::vector<Header>& headers,
                                 long timeout_seconds) {
    return http_get(url, headers, timeout_seconds);
}

HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds) {
    HttpResponse response;
    CurlGet request;
    if (!request.ok()) return response;

    request.prepare(url, headers, timeout_seconds, response.body);
    response.status_code = request.perform(url);
    if (response.status_code == 0) response.body.clear();
    return response;
}

} // namespace epss
