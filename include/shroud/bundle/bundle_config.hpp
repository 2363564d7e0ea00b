// include/shroud/bundle/bundle_config.hpp
#pragma once

#include <string>
#include <vector>
#include "shroud/core/config_base.hpp"

namespace shroud {
namespace bundle {

enum class PriorityLevel { LOW, MEDIUM, HIGH };

std::string priority_level_to_string(PriorityLevel level);
bool priority_level_from_string(const std::string& name, PriorityLevel& level);

constexpr uint64_t MINIMUM_TIP_LAMPORTS = 10000;

/**
 * @brief Compute-unit price in micro-lamports for a priority level
 */
uint64_t priority_fee_micro_lamports(PriorityLevel level);

/**
 * @brief Base relay tip in lamports for a priority level
 */
uint64_t base_tip_lamports(PriorityLevel level);

/**
 * @brief Configuration for bundle building, relay submission and retries
 */
struct BundleConfig : public ConfigBase {
    std::string block_engine_url{"https://mainnet.block-engine.jito.wtf/api/v1/bundles"};
    std::vector<std::string> tip_accounts{
        "96gYZGLnJYVFmbjzopPSU6QiEV5fGqZNyN9nmNhvrZU5",
        "HFqU5x63VTqvQss8hp11i4wVV8bD44PvwucfZ2bU7gRe",
        "Cw8CFyM9FkoMi7K7Crf6HNQqf4uEMzpKw6QNghXLvLkY",
        "ADaUMid9yfUytqMBgopwjb2DTLSokTSzL1zt6iGPaS49",
        "DfXygSm4jCyNCybVYYK6DwvWqjKee8pbDmJGcLWNDXjh",
        "ADuUkR4vqLUMWXxW9gh6D6L8pMSawimctcNZ5pGwDcEt",
        "DttWaMuVvTiduZRnguLF7jNxTgiMBZ1hyAumKUiL2KRL",
        "3AVi9Tg9Uo68tJfuvoKvqKNWKkC5wPdSSdeBnizKZ6jT"};

    uint32_t compute_unit_limit{1400000};
    PriorityLevel priority{PriorityLevel::MEDIUM};

    // Retry policy
    int max_retries{3};
    double tip_escalation{1.5};
    uint64_t max_tip_lamports{500000};

    // Landing poll
    int poll_attempts{30};
    int poll_interval_ms{2000};

    // Switch to a v0 message with the lookup table above this legacy size
    size_t lookup_table_threshold_bytes{1100};
    std::string lookup_table_address;  // empty = none

    size_t max_transactions{5};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

}  // namespace bundle
}  // namespace shroud
