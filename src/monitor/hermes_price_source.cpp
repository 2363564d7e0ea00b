// src/monitor/hermes_price_source.cpp

#include "shroud/monitor/hermes_price_source.hpp"
#include "shroud/core/encoding.hpp"
#include "shroud/core/logger.hpp"

namespace shroud {
namespace monitor {

namespace {

// Hermes encodes 64-bit numbers as strings
int64_t as_int64(const nlohmann::json& v) {
    if (v.is_string()) {
        return std::stoll(v.get<std::string>());
    }
    return v.get<int64_t>();
}

uint64_t as_uint64(const nlohmann::json& v) {
    if (v.is_string()) {
        return std::stoull(v.get<std::string>());
    }
    return v.get<uint64_t>();
}

}  // namespace

HermesPriceSource::HermesPriceSource(std::shared_ptr<net::HttpClient> http,
                                     PriceFeedConfig config)
    : http_(std::move(http)), config_(std::move(config)) {}

std::string HermesPriceSource::build_url(const std::vector<Hash32>& feed_ids) const {
    std::string url = config_.hermes_url + "/v2/updates/price/latest";
    char separator = '?';
    for (const auto& id : feed_ids) {
        url += separator;
        url += "ids[]=0x" + encoding::to_hex(id);
        separator = '&';
    }
    return url;
}

Result<std::vector<PriceQuote>> HermesPriceSource::fetch_latest(
    const std::vector<Hash32>& feed_ids) {
    if (feed_ids.empty()) {
        return std::vector<PriceQuote>{};
    }
    auto response = http_->get(build_url(feed_ids));
    if (response.is_error()) {
        return forward_error<std::vector<PriceQuote>>(response);
    }
    if (response.value().status_code != 200) {
        return make_error<std::vector<PriceQuote>>(
            ErrorCode::CONNECTION_ERROR,
            "Hermes returned HTTP " + std::to_string(response.value().status_code),
            "HermesPriceSource");
    }
    return parse_response(response.value().body);
}

Result<std::vector<PriceQuote>> HermesPriceSource::parse_response(const std::string& body) {
    using Out = std::vector<PriceQuote>;
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        return make_error<Out>(ErrorCode::JSON_PARSE_ERROR,
                               std::string("Hermes response is not JSON: ") + e.what(),
                               "HermesPriceSource");
    }

    Out quotes;
    try {
        if (!doc.contains("parsed") || !doc["parsed"].is_array()) {
            return make_error<Out>(ErrorCode::PARSE_ERROR, "Hermes response has no parsed[]",
                                   "HermesPriceSource");
        }
        for (const auto& entry : doc["parsed"]) {
            auto id = encoding::from_hex_fixed<32>(entry.at("id").get<std::string>());
            if (id.is_error()) {
                WARN("Skipping Hermes entry with bad id: " << id.error()->what());
                continue;
            }
            const auto& price = entry.at("price");
            PriceQuote quote;
            quote.feed_id = id.value();
            quote.price = as_int64(price.at("price"));
            quote.conf = as_uint64(price.at("conf"));
            quote.expo = price.at("expo").get<int32_t>();
            quote.publish_time = as_int64(price.at("publish_time"));
            quotes.push_back(quote);
        }
    } catch (const nlohmann::json::exception& e) {
        return make_error<Out>(ErrorCode::PARSE_ERROR,
                               std::string("Malformed Hermes price: ") + e.what(),
                               "HermesPriceSource");
    } catch (const std::logic_error& e) {
        // std::stoll / std::stoull on non-numeric strings
        return make_error<Out>(ErrorCode::PARSE_ERROR,
                               std::string("Malformed Hermes number: ") + e.what(),
                               "HermesPriceSource");
    }
    return quotes;
}

}  // namespace monitor
}  // namespace shroud
