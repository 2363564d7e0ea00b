// include/shroud/config/service_config.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "shroud/bundle/bundle_config.hpp"
#include "shroud/core/config_base.hpp"
#include "shroud/core/logger.hpp"
#include "shroud/execution/execution_coordinator.hpp"
#include "shroud/monitor/hermes_price_source.hpp"
#include "shroud/shield/shielded_trade_orchestrator.hpp"

namespace shroud {
namespace config {

/**
 * @brief Chain endpoints
 */
struct RpcConfig {
    std::string base_url{"https://api.mainnet-beta.solana.com"};
    std::string er_url;  // empty disables the delegated lane
    std::string commitment{"confirmed"};
    int connect_timeout_ms{5000};
    int request_timeout_ms{15000};
    int max_attempts{3};

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["base_url"] = base_url;
        j["er_url"] = er_url;
        j["commitment"] = commitment;
        j["connect_timeout_ms"] = connect_timeout_ms;
        j["request_timeout_ms"] = request_timeout_ms;
        j["max_attempts"] = max_attempts;
        return j;
    }

    void from_json(const nlohmann::json& j) {
        if (j.contains("base_url"))
            base_url = j.at("base_url").get<std::string>();
        if (j.contains("er_url"))
            er_url = j.at("er_url").get<std::string>();
        if (j.contains("commitment"))
            commitment = j.at("commitment").get<std::string>();
        if (j.contains("connect_timeout_ms"))
            connect_timeout_ms = j.at("connect_timeout_ms").get<int>();
        if (j.contains("request_timeout_ms"))
            request_timeout_ms = j.at("request_timeout_ms").get<int>();
        if (j.contains("max_attempts"))
            max_attempts = j.at("max_attempts").get<int>();
    }
};

/**
 * @brief Everything the keeper needs, one section per component
 *
 * Executor keys are never part of this file; they come from the environment.
 */
struct ServiceConfig : public ConfigBase {
    LoggerConfig logger;
    RpcConfig rpc;
    monitor::PriceFeedConfig price_feed;
    bundle::BundleConfig bundle;
    execution::CoordinatorConfig coordinator;
    shield::ShieldConfig shield;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Loads a base config file and an optional override file on top of it
 */
class ServiceConfigLoader {
public:
    /**
     * @param overrides_path Merged over the base when non-empty
     */
    static Result<ServiceConfig> load(const std::string& base_path,
                                      const std::string& overrides_path = "");

    static Result<void> validate(const ServiceConfig& config);

    static void log_summary(const ServiceConfig& config);

    /**
     * @brief Deep merge: nested objects merge, everything else overrides
     */
    static void merge_json(nlohmann::json& target, const nlohmann::json& source);

private:
    static Result<nlohmann::json> load_json_file(const std::string& path);
};

}  // namespace config
}  // namespace shroud
