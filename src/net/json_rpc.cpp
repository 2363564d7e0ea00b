// src/net/json_rpc.cpp

#include "shroud/net/json_rpc.hpp"
#include <algorithm>
#include "shroud/core/logger.hpp"

namespace shroud {
namespace net {

JsonRpcTransport::JsonRpcTransport(std::shared_ptr<HttpClient> http, std::string url,
                                   int max_attempts)
    : http_(std::move(http)), url_(std::move(url)), max_attempts_(std::max(1, max_attempts)) {}

Result<nlohmann::json> JsonRpcTransport::call(const std::string& method,
                                              const nlohmann::json& params,
                                              ErrorCode rpc_error_code) {
    nlohmann::json request = {{"jsonrpc", "2.0"},
                              {"id", next_id_++},
                              {"method", method},
                              {"params", params}};
    const std::string body = request.dump();
    const std::vector<std::string> headers = {"Content-Type: application/json"};

    std::string last_error;
    ErrorCode last_code = ErrorCode::CONNECTION_ERROR;
    for (int attempt = 1; attempt <= max_attempts_; ++attempt) {
        auto response = http_->post(url_, body, headers);
        if (response.is_error()) {
            last_error = response.error()->what();
            last_code = response.error()->code();
            DEBUG(method << " attempt " << attempt << " failed: " << last_error);
            continue;
        }

        const HttpResponse& http_response = response.value();
        if (http_response.status_code == 429 || http_response.status_code >= 500) {
            last_error = "HTTP " + std::to_string(http_response.status_code);
            last_code = ErrorCode::CONNECTION_ERROR;
            DEBUG(method << " attempt " << attempt << " got " << last_error);
            continue;
        }
        if (http_response.status_code != 200) {
            return make_error<nlohmann::json>(
                rpc_error_code,
                method + " returned HTTP " + std::to_string(http_response.status_code) + ": " +
                    http_response.body,
                "JsonRpc");
        }

        nlohmann::json parsed;
        try {
            parsed = nlohmann::json::parse(http_response.body);
        } catch (const nlohmann::json::exception& e) {
            return make_error<nlohmann::json>(ErrorCode::JSON_PARSE_ERROR,
                                              method + " response is not JSON: " + e.what(),
                                              "JsonRpc");
        }

        if (parsed.contains("error") && !parsed["error"].is_null()) {
            const auto& err = parsed["error"];
            std::string message = err.value("message", err.dump());
            return make_error<nlohmann::json>(rpc_error_code, method + ": " + message, "JsonRpc");
        }
        if (!parsed.contains("result")) {
            return make_error<nlohmann::json>(ErrorCode::PARSE_ERROR,
                                              method + " response has no result", "JsonRpc");
        }
        return parsed["result"];
    }

    return make_error<nlohmann::json>(last_code,
                                      method + " failed after " + std::to_string(max_attempts_) +
                                          " attempts: " + last_error,
                                      "JsonRpc");
}

}  // namespace net
}  // namespace shroud
