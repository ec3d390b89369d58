#include "http_client.hpp"

#include <algorithm>
#include <curl/curl.h>
#include <memory>

namespace update {

namespace {

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};

size_t append_body(char* data, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    body->append(data, size * nmemb);
    return size * nmemb;
}

// curl_global_init is not thread safe; run it once before the first handle.
CURLcode ensure_curl_global() {
    static const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    return rc;
}

} // namespace

HttpResponse http_get(const std::string& url, const std::string& user_agent,
                      std::chrono::milliseconds timeout) {
    HttpResponse resp;
    CURLcode init = ensure_curl_global();
    if (init != CURLE_OK) {
        resp.error = std::string("Failed to initialise libcurl: ") + curl_easy_strerror(init);
        return resp;
    }
    long timeout_ms = static_cast<long>(std::max(timeout, std::chrono::milliseconds(1)).count());
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        resp.error = "Failed to initialise libcurl";
        return resp;
    }
    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        resp.error = errbuf[0] ? errbuf : curl_easy_strerror(rc);
        return resp;
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.status);
    resp.ok = true;
    return resp;
}

} // namespace update
