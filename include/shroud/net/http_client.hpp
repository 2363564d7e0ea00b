// include/shroud/net/http_client.hpp
#pragma once

#include <string>
#include <vector>
#include "shroud/core/error.hpp"

namespace shroud {
namespace net {

struct HttpResponse {
    long status_code{0};
    std::string body;
};

struct HttpClientConfig {
    long connect_timeout_ms{5000};
    long request_timeout_ms{15000};
    std::string user_agent{"shroud/1.0"};
};

/**
 * @brief Minimal HTTP interface used by RPC, price and relay clients
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * @brief Performs an HTTP GET request
     * @param url Absolute URL
     * @return Response, or CONNECTION_ERROR / TIMEOUT_ERROR on transport failure
     */
    virtual Result<HttpResponse> get(const std::string& url) = 0;

    /**
     * @brief Performs an HTTP POST request
     * @param url Absolute URL
     * @param body Request body
     * @param headers Extra headers ("Name: value")
     */
    virtual Result<HttpResponse> post(const std::string& url, const std::string& body,
                                      const std::vector<std::string>& headers) = 0;
};

/**
 * @brief libcurl-backed HttpClient with bounded connect and total timeouts
 *
 * One easy handle per request; safe to share across threads.
 */
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(HttpClientConfig config = HttpClientConfig{});
    ~CurlHttpClient() override = default;

    Result<HttpResponse> get(const std::string& url) override;
    Result<HttpResponse> post(const std::string& url, const std::string& body,
                              const std::vector<std::string>& headers) override;

private:
    Result<HttpResponse> perform_request(const std::string& method, const std::string& url,
                                         const std::string& payload,
                                         const std::vector<std::string>& headers);

    static size_t write_callback(void* contents, size_t size, size_t nmemb,
                                 std::string* user_data);

    HttpClientConfig config_;
};

}  // namespace net
}  // namespace shroud
