#include "http.hpp"
#include <core/constants.hpp>
#include <curl/curl.h>
#include <memory>

namespace platform {

void init_http() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void shutdown_http() {
    curl_global_cleanup();
}

static size_t collect_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

Result<HttpResponse> http_post_json(const std::string& url,
                                    const std::string& json_body,
                                    const std::vector<std::string>& headers,
                                    int timeout_secs) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        return Result<HttpResponse>::Err("curl_easy_init failed");
    }

    struct curl_slist* list = nullptr;
    list = curl_slist_append(list, "Content-Type: application/json");
    for (const auto& h : headers) {
        list = curl_slist_append(list, h.c_str());
    }
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_guard(list, curl_slist_free_all);

    HttpResponse resp;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, json_body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(json_body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, collect_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(HTTP_CONNECT_TIMEOUT_SECS));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_secs));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        return Result<HttpResponse>::Err(std::string("HTTP POST failed: ") + curl_easy_strerror(rc));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.status);
    return Result<HttpResponse>::Ok(resp);
}

} // namespace platform
