// src/bundle/bundle_config.cpp

#include "shroud/bundle/bundle_config.hpp"

namespace shroud {
namespace bundle {

std::string priority_level_to_string(PriorityLevel level) {
    switch (level) {
        case PriorityLevel::LOW:
            return "low";
        case PriorityLevel::MEDIUM:
            return "medium";
        case PriorityLevel::HIGH:
            return "high";
        default:
            return "unknown";
    }
}

bool priority_level_from_string(const std::string& name, PriorityLevel& level) {
    for (PriorityLevel candidate : {PriorityLevel::LOW, PriorityLevel::MEDIUM, PriorityLevel::HIGH}) {
        if (priority_level_to_string(candidate) == name) {
            level = candidate;
            return true;
        }
    }
    return false;
}

uint64_t priority_fee_micro_lamports(PriorityLevel level) {
    switch (level) {
        case PriorityLevel::LOW:
            return 1000;
        case PriorityLevel::HIGH:
            return 200000;
        case PriorityLevel::MEDIUM:
        default:
            return 50000;
    }
}

uint64_t base_tip_lamports(PriorityLevel level) {
    switch (level) {
        case PriorityLevel::LOW:
            return 10000;
        case PriorityLevel::HIGH:
            return 100000;
        case PriorityLevel::MEDIUM:
        default:
            return 50000;
    }
}

nlohmann::json BundleConfig::to_json() const {
    nlohmann::json j;
    j["block_engine_url"] = block_engine_url;
    j["tip_accounts"] = tip_accounts;
    j["compute_unit_limit"] = compute_unit_limit;
    j["priority"] = priority_level_to_string(priority);
    j["max_retries"] = max_retries;
    j["tip_escalation"] = tip_escalation;
    j["max_tip_lamports"] = max_tip_lamports;
    j["poll_attempts"] = poll_attempts;
    j["poll_interval_ms"] = poll_interval_ms;
    j["lookup_table_threshold_bytes"] = lookup_table_threshold_bytes;
    j["lookup_table_address"] = lookup_table_address;
    j["max_transactions"] = max_transactions;
    return j;
}

void BundleConfig::from_json(const nlohmann::json& j) {
    if (j.contains("block_engine_url"))
        block_engine_url = j.at("block_engine_url").get<std::string>();
    if (j.contains("tip_accounts"))
        tip_accounts = j.at("tip_accounts").get<std::vector<std::string>>();
    if (j.contains("compute_unit_limit"))
        compute_unit_limit = j.at("compute_unit_limit").get<uint32_t>();
    if (j.contains("priority"))
        priority_level_from_string(j.at("priority").get<std::string>(), priority);
    if (j.contains("max_retries"))
        max_retries = j.at("max_retries").get<int>();
    if (j.contains("tip_escalation"))
        tip_escalation = j.at("tip_escalation").get<double>();
    if (j.contains("max_tip_lamports"))
        max_tip_lamports = j.at("max_tip_lamports").get<uint64_t>();
    if (j.contains("poll_attempts"))
        poll_attempts = j.at("poll_attempts").get<int>();
    if (j.contains("poll_interval_ms"))
        poll_interval_ms = j.at("poll_interval_ms").get<int>();
    if (j.contains("lookup_table_threshold_bytes"))
        lookup_table_threshold_bytes = j.at("lookup_table_threshold_bytes").get<size_t>();
    if (j.contains("lookup_table_address"))
        lookup_table_address = j.at("lookup_table_address").get<std::string>();
    if (j.contains("max_transactions"))
        max_transactions = j.at("max_transactions").get<size_t>();
}

}  // namespace bundle
}  // namespace shroud
