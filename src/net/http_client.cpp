// src/net/http_client.cpp

#include "shroud/net/http_client.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace shroud {
namespace net {

namespace {

struct CurlDeleter {
    void operator()(CURL* handle) const {
        curl_easy_cleanup(handle);
    }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const {
        curl_slist_free_all(list);
    }
};

void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

}  // namespace

CurlHttpClient::CurlHttpClient(HttpClientConfig config) : config_(std::move(config)) {
    ensure_curl_global_init();
}

size_t CurlHttpClient::write_callback(void* contents, size_t size, size_t nmemb,
                                      std::string* user_data) {
    user_data->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

Result<HttpResponse> CurlHttpClient::get(const std::string& url) {
    return perform_request("GET", url, "", {});
}

Result<HttpResponse> CurlHttpClient::post(const std::string& url, const std::string& body,
                                          const std::vector<std::string>& headers) {
    return perform_request("POST", url, body, headers);
}

Result<HttpResponse> CurlHttpClient::perform_request(const std::string& method,
                                                     const std::string& url,
                                                     const std::string& payload,
                                                     const std::vector<std::string>& headers) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        return make_error<HttpResponse>(ErrorCode::CONNECTION_ERROR, "Failed to initialize CURL",
                                        "HttpClient");
    }

    HttpResponse response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, CurlHttpClient::write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, config_.connect_timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, config_.request_timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, config_.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    std::unique_ptr<curl_slist, SlistDeleter> header_list;
    for (const auto& header : headers) {
        curl_slist* appended = curl_slist_append(header_list.get(), header.c_str());
        if (!appended) {
            return make_error<HttpResponse>(ErrorCode::CONNECTION_ERROR,
                                            "Failed to build request headers", "HttpClient");
        }
        header_list.release();
        header_list.reset(appended);
    }
    if (header_list) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    }

    if (method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_OPERATION_TIMEDOUT) {
        return make_error<HttpResponse>(ErrorCode::TIMEOUT_ERROR,
                                        method + " " + url + " timed out", "HttpClient");
    }
    if (res != CURLE_OK) {
        return make_error<HttpResponse>(ErrorCode::CONNECTION_ERROR,
                                        "CURL error: " + std::string(curl_easy_strerror(res)),
                                        "HttpClient");
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

}  // namespace net
}  // namespace shroud
