// include/shroud/execution/execution_coordinator.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "shroud/bundle/bundle_submitter.hpp"
#include "shroud/chain/transaction_sender.hpp"
#include "shroud/core/config_base.hpp"
#include "shroud/monitor/trigger_monitor.hpp"
#include "shroud/order/order_codec.hpp"
#include "shroud/program/order_program_client.hpp"

namespace shroud {
namespace execution {

/**
 * @brief Configuration for the execution loop
 */
struct CoordinatorConfig : public ConfigBase {
    std::string component_id{"execution_coordinator"};
    int poll_interval_ms{1000};
    bool two_phase{false};
    size_t max_triggers_per_tick{3};
    bool redelegate_after{true};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Local progress of a watched order
 *
 * TRIGGERED means phase one (mark_ready) landed and execution is pending;
 * the on-chain status stays Active until trigger_and_execute lands.
 */
enum class WatchPhase { WATCHING, TRIGGERED };

std::string watch_phase_to_string(WatchPhase phase);

struct MonitoredOrder {
    chain::PublicKey address;
    std::optional<program::EncryptedOrderAccount> account;
    std::optional<order::OrderPayload> payload;
    bool delegated{false};
    WatchPhase phase{WatchPhase::WATCHING};
    int64_t triggered_price{0};
    bool trigger_notified{false};
    int decrypt_failures{0};
    int execution_failures{0};
    std::string last_error;
};

struct TickSummary {
    size_t monitored{0};
    size_t decrypted{0};
    size_t decrypt_failures{0};
    size_t matched{0};
    size_t marked_ready{0};
    size_t executed{0};
    size_t errors{0};
    size_t removed{0};
};

/**
 * @brief Everything the coordinator talks to; shared with the rest of the service
 */
struct CoordinatorDependencies {
    std::shared_ptr<chain::RpcClient> rpc;
    std::shared_ptr<chain::RpcClient> er_rpc;  // optional; reads delegated orders
    std::shared_ptr<monitor::TriggerMonitor> monitor;
    std::shared_ptr<bundle::BundleSubmitter> bundles;
    std::shared_ptr<chain::TransactionSender> er_sender;  // delegated execution lane
    std::shared_ptr<program::DriftAccountResolver> drift;
    std::shared_ptr<const order::OrderCodec> codec;
    program::OrderProgramClient program;
};

/**
 * @brief Watches encrypted orders, evaluates triggers and executes them
 *
 * One worker thread runs run_tick() every poll interval. A tick refreshes
 * watched orders from chain, decrypts new ones, refreshes prices once and
 * executes up to max_triggers_per_tick matches sequentially. An order
 * leaves the watch set when it executes, is cancelled, or its account is
 * closed; any failure leaves it in place for the next tick.
 */
class ExecutionCoordinator {
public:
    using TriggeredCallback =
        std::function<void(const chain::PublicKey&, const order::OrderPayload&, int64_t)>;
    using ReadyCallback = std::function<void(const chain::PublicKey&, const order::OrderPayload&)>;
    using ExecutedCallback = std::function<void(const chain::PublicKey&, const std::string&)>;
    using ErrorCallback = std::function<void(const chain::PublicKey&, const ShroudError&)>;

    ExecutionCoordinator(CoordinatorDependencies deps, chain::Keypair executor,
                         Bytes decryption_key, CoordinatorConfig config = CoordinatorConfig{});
    ~ExecutionCoordinator();

    ExecutionCoordinator(const ExecutionCoordinator&) = delete;
    ExecutionCoordinator& operator=(const ExecutionCoordinator&) = delete;

    /**
     * @brief Validate dependencies and register with the state manager
     */
    Result<void> initialize();

    /**
     * @brief Start the worker thread
     */
    Result<void> start();

    /**
     * @brief Stop scheduling ticks; a tick already running completes
     */
    Result<void> stop();

    bool is_running() const {
        return running_.load();
    }

    /**
     * @brief Watch an order account; adding a watched order is a no-op
     */
    Result<void> add_order(const chain::PublicKey& address);

    /**
     * @return false if the order was not watched
     */
    bool remove_order(const chain::PublicKey& address);

    std::vector<MonitoredOrder> get_monitored_orders() const;

    /**
     * @brief Add every Active order account of the program
     * @return Number of newly watched orders
     */
    Result<size_t> discover_orders();

    /**
     * @brief One pass of refresh, decrypt, evaluate and execute
     */
    Result<TickSummary> run_tick();

    void set_on_order_triggered(TriggeredCallback cb) {
        on_order_triggered_ = std::move(cb);
    }
    void set_on_order_ready_for_execution(ReadyCallback cb) {
        on_order_ready_for_execution_ = std::move(cb);
    }
    void set_on_order_executed(ExecutedCallback cb) {
        on_order_executed_ = std::move(cb);
    }
    void set_on_order_error(ErrorCallback cb) {
        on_order_error_ = std::move(cb);
    }

    const CoordinatorConfig& config() const {
        return config_;
    }

private:
    enum class RefreshOutcome { KEEP, REMOVE, SKIP };

    RefreshOutcome refresh_order(MonitoredOrder& order, TickSummary& summary);
    void decrypt_order(MonitoredOrder& order, TickSummary& summary);
    Result<void> check_authorized(const order::OrderPayload& payload);
    Result<void> mark_ready(MonitoredOrder& order, int64_t execution_price);
    Result<std::string> execute(MonitoredOrder& order);
    Result<std::string> send(const std::vector<chain::Instruction>& instructions, bool delegated);

    void report_error(MonitoredOrder& order, const ShroudError& error, TickSummary& summary);
    void notify(const char* name, const std::function<void()>& fn);
    void publish_metrics(const TickSummary& summary);
    void worker_loop();

    CoordinatorDependencies deps_;
    chain::Keypair executor_;
    Bytes decryption_key_;
    CoordinatorConfig config_;

    mutable std::mutex orders_mutex_;
    std::map<chain::PublicKey, MonitoredOrder> orders_;

    std::mutex tick_mutex_;
    std::mutex wake_mutex_;
    std::condition_variable wake_;
    std::atomic<bool> running_{false};
    std::atomic<bool> initialized_{false};
    std::thread worker_;

    size_t total_executions_{0};
    size_t total_errors_{0};
    size_t total_decrypt_failures_{0};

    TriggeredCallback on_order_triggered_;
    ReadyCallback on_order_ready_for_execution_;
    ExecutedCallback on_order_executed_;
    ErrorCallback on_order_error_;
};

}  // namespace execution
}  // namespace shroud
