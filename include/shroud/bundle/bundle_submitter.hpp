// include/shroud/bundle/bundle_submitter.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "shroud/bundle/bundle_config.hpp"
#include "shroud/bundle/bundle_relay.hpp"
#include "shroud/chain/rpc_client.hpp"
#include "shroud/crypto/secure_random.hpp"

namespace shroud {
namespace bundle {

/**
 * @brief Outcome of a bundle submission
 *
 * On failure phase is one of "blockhash", "build", "simulate", "sign",
 * "submit" or "landing".
 */
struct BundleResult {
    bool success{false};
    std::string signature;
    std::string bundle_id;
    std::string error;
    ErrorCode error_code{ErrorCode::NONE};
    std::string phase;
    int attempts{0};
    uint64_t final_tip{0};

    /**
     * @brief Build, simulation and signing failures are never retried
     */
    bool retryable() const {
        return !success && phase != "build" && phase != "simulate" && phase != "sign";
    }
};

enum class LandingStatus { LANDED, FAILED, TIMEOUT };

std::string landing_status_to_string(LandingStatus status);

/**
 * @brief One transaction in a multi-transaction bundle
 */
struct BundleTransaction {
    std::vector<chain::Instruction> instructions;
    std::vector<const chain::Keypair*> extra_signers;
};

/**
 * @brief Builds, simulates, signs and lands atomic bundles through a relay
 */
class BundleSubmitter {
public:
    BundleSubmitter(std::shared_ptr<chain::RpcClient> rpc, std::shared_ptr<BundleRelay> relay,
                    crypto::RandomSource& random, BundleConfig config);

    /**
     * @brief Fetch and cache the configured address lookup table
     */
    Result<void> initialize();

    void set_lookup_table(chain::AddressLookupTable table) {
        lookup_table_ = std::move(table);
    }

    /**
     * @brief Base tip for the level, never below the relay minimum
     */
    uint64_t estimate_tip(PriorityLevel level) const;

    /**
     * @brief Transfer to a uniformly chosen tip account
     */
    Result<chain::Instruction> tip_instruction(const chain::PublicKey& payer, uint64_t lamports);

    /**
     * @brief Prepend compute budget, append the tip (when non-zero) and compile
     *
     * Compiles legacy unless the legacy size exceeds the threshold and a lookup
     * table is available.
     */
    Result<chain::Message> build_atomic_bundle(const std::vector<chain::Instruction>& instructions,
                                               const chain::PublicKey& payer, uint64_t tip,
                                               const Hash32& recent_blockhash);

    /**
     * @brief One attempt: build, simulate, sign, send and wait for landing
     */
    BundleResult submit(const std::vector<chain::Instruction>& instructions,
                        const chain::Keypair& payer, uint64_t tip,
                        const std::vector<const chain::Keypair*>& extra_signers = {});

    /**
     * @brief submit() with tip escalation; simulation failures return at once
     * @param initial_tip Starting tip; estimate_tip(config priority) when empty
     */
    BundleResult submit_with_retry(const std::vector<chain::Instruction>& instructions,
                                   const chain::Keypair& payer,
                                   std::optional<uint64_t> initial_tip = std::nullopt,
                                   const std::vector<const chain::Keypair*>& extra_signers = {});

    /**
     * @brief Up to max_transactions transactions sharing one blockhash, all
     *        simulated before any is sent; the tip rides on the last one
     */
    BundleResult submit_multi(const std::vector<BundleTransaction>& transactions,
                              const chain::Keypair& payer, uint64_t tip);

    BundleResult submit_multi_with_retry(const std::vector<BundleTransaction>& transactions,
                                         const chain::Keypair& payer,
                                         std::optional<uint64_t> initial_tip = std::nullopt);

    /**
     * @brief Poll the relay at a fixed interval for a bounded number of attempts
     */
    LandingStatus poll_landing(const std::string& bundle_id);

    /**
     * @brief Next tip in the escalation sequence
     */
    uint64_t escalate_tip(uint64_t tip) const;

    const BundleConfig& config() const {
        return config_;
    }

private:
    template <typename Attempt>
    BundleResult retry_loop(uint64_t initial_tip, Attempt attempt);

    BundleResult finish(std::vector<std::string> encoded, std::string signature, uint64_t tip);

    std::shared_ptr<chain::RpcClient> rpc_;
    std::shared_ptr<BundleRelay> relay_;
    crypto::RandomSource& random_;
    BundleConfig config_;
    std::vector<chain::PublicKey> tip_accounts_;
    std::optional<chain::AddressLookupTable> lookup_table_;
};

}  // namespace bundle
}  // namespace shroud
