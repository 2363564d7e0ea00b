// include/shroud/bundle/bundle_relay.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "shroud/net/json_rpc.hpp"

namespace shroud {
namespace bundle {

enum class BundleStatus { PENDING, LANDED, FAILED };

/**
 * @brief Block-engine relay that lands transactions atomically
 */
class BundleRelay {
public:
    virtual ~BundleRelay() = default;

    /**
     * @brief Submit base64-encoded signed transactions as one bundle
     * @return Bundle id, or SUBMISSION_ERROR
     */
    virtual Result<std::string> send_bundle(const std::vector<std::string>& transactions) = 0;

    virtual Result<BundleStatus> get_bundle_status(const std::string& bundle_id) = 0;
};

/**
 * @brief Jito block-engine JSON-RPC relay (sendBundle / getBundleStatuses)
 */
class JitoRelay : public BundleRelay {
public:
    JitoRelay(std::shared_ptr<net::HttpClient> http, const std::string& block_engine_url);

    Result<std::string> send_bundle(const std::vector<std::string>& transactions) override;
    Result<BundleStatus> get_bundle_status(const std::string& bundle_id) override;

    /**
     * @brief Map a getBundleStatuses result document to a status
     */
    static Result<BundleStatus> parse_status(const nlohmann::json& result);

private:
    net::JsonRpcTransport transport_;
};

}  // namespace bundle
}  // namespace shroud
