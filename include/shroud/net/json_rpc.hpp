// include/shroud/net/json_rpc.hpp
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include "shroud/net/http_client.hpp"

namespace shroud {
namespace net {

/**
 * @brief JSON-RPC 2.0 over an HttpClient
 *
 * Transport failures (CONNECTION_ERROR, TIMEOUT_ERROR, HTTP 5xx/429) are
 * retried up to max_attempts; an RPC "error" object is returned at once
 * with the caller's error code.
 */
class JsonRpcTransport {
public:
    JsonRpcTransport(std::shared_ptr<HttpClient> http, std::string url, int max_attempts = 3);

    /**
     * @brief Call a method and return its "result" member
     * @param method RPC method name
     * @param params Positional parameters (array)
     * @param rpc_error_code Code used when the server answers with an error object
     */
    Result<nlohmann::json> call(const std::string& method, const nlohmann::json& params,
                                ErrorCode rpc_error_code);

    const std::string& url() const {
        return url_;
    }

private:
    std::shared_ptr<HttpClient> http_;
    std::string url_;
    int max_attempts_;
    uint64_t next_id_{1};
};

}  // namespace net
}  // namespace shroud
