// include/shroud/monitor/price_source.hpp
#pragma once

#include <string>
#include <vector>
#include "shroud/core/config_base.hpp"
#include "shroud/core/error.hpp"
#include "shroud/core/types.hpp"

namespace shroud {
namespace monitor {

/**
 * @brief One oracle observation: value = price × 10^expo
 */
struct PriceQuote {
    Hash32 feed_id{};
    int64_t price{0};
    int32_t expo{0};
    uint64_t conf{0};
    int64_t publish_time{0};    // unix seconds
    int64_t received_at_ms{0};  // local clock
};

/**
 * @brief Price feed endpoint and how old a quote may be before triggers ignore it
 */
struct PriceFeedConfig : public ConfigBase {
    std::string hermes_url{"https://hermes.pyth.network"};
    long timeout_ms{5000};
    int64_t staleness_seconds{60};

    nlohmann::json to_json() const override {
        return nlohmann::json{{"hermes_url", hermes_url},
                              {"timeout_ms", timeout_ms},
                              {"staleness_seconds", staleness_seconds}};
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("hermes_url"))
            hermes_url = j.at("hermes_url").get<std::string>();
        if (j.contains("timeout_ms"))
            timeout_ms = j.at("timeout_ms").get<long>();
        if (j.contains("staleness_seconds"))
            staleness_seconds = j.at("staleness_seconds").get<int64_t>();
    }
};

/**
 * @brief Latest-price lookup for a batch of feeds
 */
class PriceSource {
public:
    virtual ~PriceSource() = default;

    /**
     * @brief Fetch the newest quote for each feed; unknown feeds are omitted
     */
    virtual Result<std::vector<PriceQuote>> fetch_latest(const std::vector<Hash32>& feed_ids) = 0;
};

}  // namespace monitor
}  // namespace shroud
