// src/config/service_config.cpp

#include "shroud/config/service_config.hpp"
#include <fstream>

namespace shroud {
namespace config {

nlohmann::json ServiceConfig::to_json() const {
    nlohmann::json j;
    j["logger"] = logger.to_json();
    j["rpc"] = rpc.to_json();
    j["price_feed"] = price_feed.to_json();
    j["bundle"] = bundle.to_json();
    j["coordinator"] = coordinator.to_json();
    j["shield"] = shield.to_json();
    return j;
}

void ServiceConfig::from_json(const nlohmann::json& j) {
    if (j.contains("logger"))
        logger.from_json(j.at("logger"));
    if (j.contains("rpc"))
        rpc.from_json(j.at("rpc"));
    if (j.contains("price_feed"))
        price_feed.from_json(j.at("price_feed"));
    if (j.contains("bundle"))
        bundle.from_json(j.at("bundle"));
    if (j.contains("coordinator"))
        coordinator.from_json(j.at("coordinator"));
    if (j.contains("shield"))
        shield.from_json(j.at("shield"));
}

Result<nlohmann::json> ServiceConfigLoader::load_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error<nlohmann::json>(ErrorCode::FILE_IO_ERROR,
                                          "Failed to open config file: " + path,
                                          "ServiceConfigLoader");
    }
    try {
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const nlohmann::json::parse_error& e) {
        return make_error<nlohmann::json>(ErrorCode::JSON_PARSE_ERROR,
                                          "Failed to parse JSON file " + path + ": " + e.what(),
                                          "ServiceConfigLoader");
    }
}

void ServiceConfigLoader::merge_json(nlohmann::json& target, const nlohmann::json& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        const auto& key = it.key();
        const auto& value = it.value();
        if (target.contains(key) && target[key].is_object() && value.is_object()) {
            merge_json(target[key], value);
        } else {
            target[key] = value;
        }
    }
}

Result<ServiceConfig> ServiceConfigLoader::load(const std::string& base_path,
                                                const std::string& overrides_path) {
    auto base = load_json_file(base_path);
    if (base.is_error()) {
        return forward_error<ServiceConfig>(base);
    }
    nlohmann::json merged = base.value();

    if (!overrides_path.empty()) {
        auto overrides = load_json_file(overrides_path);
        if (overrides.is_error()) {
            return forward_error<ServiceConfig>(overrides);
        }
        merge_json(merged, overrides.value());
    }

    ServiceConfig config;
    try {
        config.from_json(merged);
    } catch (const nlohmann::json::exception& e) {
        return make_error<ServiceConfig>(ErrorCode::JSON_PARSE_ERROR,
                                         std::string("Failed to extract config: ") + e.what(),
                                         "ServiceConfigLoader");
    }

    auto valid = validate(config);
    if (valid.is_error()) {
        return forward_error<ServiceConfig>(valid);
    }
    return config;
}

Result<void> ServiceConfigLoader::validate(const ServiceConfig& config) {
    if (config.rpc.base_url.empty()) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR, "rpc.base_url is required",
                                "ServiceConfigLoader");
    }
    if (config.rpc.max_attempts <= 0) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR, "rpc.max_attempts must be positive",
                                "ServiceConfigLoader");
    }
    if (config.coordinator.poll_interval_ms <= 0) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "coordinator.poll_interval_ms must be positive",
                                "ServiceConfigLoader");
    }
    if (config.price_feed.staleness_seconds <= 0) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "price_feed.staleness_seconds must be positive",
                                "ServiceConfigLoader");
    }
    if (config.coordinator.max_triggers_per_tick == 0) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "coordinator.max_triggers_per_tick must be at least 1",
                                "ServiceConfigLoader");
    }
    if (config.bundle.tip_accounts.empty()) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR, "bundle.tip_accounts is empty",
                                "ServiceConfigLoader");
    }
    if (config.bundle.tip_escalation < 1.0) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "bundle.tip_escalation must be at least 1.0",
                                "ServiceConfigLoader");
    }
    if (config.bundle.max_transactions == 0 || config.bundle.max_transactions > 5) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "bundle.max_transactions must be in [1, 5]",
                                "ServiceConfigLoader");
    }
    return Result<void>();
}

void ServiceConfigLoader::log_summary(const ServiceConfig& config) {
    if (!Logger::instance().is_initialized()) {
        return;
    }
    INFO("Config summary: rpc=" << config.rpc.base_url
                                << ", er=" << (config.rpc.er_url.empty() ? "-" : config.rpc.er_url)
                                << ", hermes=" << config.price_feed.hermes_url);
    INFO("Config summary: poll=" << config.coordinator.poll_interval_ms
                                 << "ms, two_phase=" << config.coordinator.two_phase
                                 << ", staleness=" << config.price_feed.staleness_seconds
                                 << "s, cap=" << config.coordinator.max_triggers_per_tick);
    INFO("Config summary: block_engine=" << config.bundle.block_engine_url << ", priority="
                                         << bundle::priority_level_to_string(config.bundle.priority)
                                         << ", retries=" << config.bundle.max_retries);
}

}  // namespace config
}  // namespace shroud
