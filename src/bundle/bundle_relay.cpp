// src/bundle/bundle_relay.cpp

#include "shroud/bundle/bundle_relay.hpp"
#include "shroud/core/logger.hpp"

namespace shroud {
namespace bundle {

JitoRelay::JitoRelay(std::shared_ptr<net::HttpClient> http, const std::string& block_engine_url)
    : transport_(std::move(http), block_engine_url) {}

Result<std::string> JitoRelay::send_bundle(const std::vector<std::string>& transactions) {
    nlohmann::json params =
        nlohmann::json::array({transactions, {{"encoding", "base64"}}});
    auto result = transport_.call("sendBundle", params, ErrorCode::SUBMISSION_ERROR);
    if (result.is_error()) {
        return make_error<std::string>(ErrorCode::SUBMISSION_ERROR, result.error()->what(),
                                       "JitoRelay");
    }
    if (!result.value().is_string()) {
        return make_error<std::string>(ErrorCode::SUBMISSION_ERROR,
                                       "sendBundle returned no bundle id", "JitoRelay");
    }
    const std::string bundle_id = result.value().get<std::string>();
    DEBUG("Relay accepted bundle " << bundle_id << " with " << transactions.size()
                                   << " transaction(s)");
    return bundle_id;
}

Result<BundleStatus> JitoRelay::get_bundle_status(const std::string& bundle_id) {
    nlohmann::json params = nlohmann::json::array({nlohmann::json::array({bundle_id})});
    auto result = transport_.call("getBundleStatuses", params, ErrorCode::SUBMISSION_ERROR);
    if (result.is_error()) {
        return forward_error<BundleStatus>(result);
    }
    return parse_status(result.value());
}

Result<BundleStatus> JitoRelay::parse_status(const nlohmann::json& result) {
    if (!result.is_object() || !result.contains("value") || !result["value"].is_array() ||
        result["value"].empty() || result["value"][0].is_null()) {
        return BundleStatus::PENDING;
    }
    const auto& entry = result["value"][0];
    const std::string status = entry.value("confirmation_status", std::string());
    if (status == "confirmed" || status == "finalized") {
        return BundleStatus::LANDED;
    }
    if (status == "failed" || status == "rejected") {
        return BundleStatus::FAILED;
    }
    // A landed bundle whose transaction errored: {"err": {"Err": ...}}
    if (entry.contains("err") && entry["err"].is_object() && entry["err"].contains("Err")) {
        return BundleStatus::FAILED;
    }
    return BundleStatus::PENDING;
}

}  // namespace bundle
}  // namespace shroud
