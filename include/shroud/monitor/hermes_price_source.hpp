// include/shroud/monitor/hermes_price_source.hpp
#pragma once

#include <memory>
#include <string>
#include "shroud/monitor/price_source.hpp"
#include "shroud/net/http_client.hpp"

namespace shroud {
namespace monitor {

/**
 * @brief Pyth Hermes REST price source (/v2/updates/price/latest)
 */
class HermesPriceSource : public PriceSource {
public:
    HermesPriceSource(std::shared_ptr<net::HttpClient> http, PriceFeedConfig config);

    Result<std::vector<PriceQuote>> fetch_latest(const std::vector<Hash32>& feed_ids) override;

    /**
     * @brief Parse a Hermes response body
     * @return JSON_PARSE_ERROR / PARSE_ERROR on malformed documents
     */
    static Result<std::vector<PriceQuote>> parse_response(const std::string& body);

    std::string build_url(const std::vector<Hash32>& feed_ids) const;

private:
    std::shared_ptr<net::HttpClient> http_;
    PriceFeedConfig config_;
};

}  // namespace monitor
}  // namespace shroud
