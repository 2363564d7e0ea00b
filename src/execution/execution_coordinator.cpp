// src/execution/execution_coordinator.cpp

#include "shroud/execution/execution_coordinator.hpp"
#include <algorithm>
#include <chrono>
#include "shroud/core/logger.hpp"
#include "shroud/core/state_manager.hpp"

namespace shroud {
namespace execution {

namespace {

constexpr const char* COMPONENT = "ExecutionCoordinator";

std::string short_address(const chain::PublicKey& key) {
    const std::string text = key.to_base58();
    return text.size() > 8 ? text.substr(0, 8) : text;
}

}  // namespace

nlohmann::json CoordinatorConfig::to_json() const {
    nlohmann::json j;
    j["component_id"] = component_id;
    j["poll_interval_ms"] = poll_interval_ms;
    j["two_phase"] = two_phase;
    j["max_triggers_per_tick"] = max_triggers_per_tick;
    j["redelegate_after"] = redelegate_after;
    return j;
}

void CoordinatorConfig::from_json(const nlohmann::json& j) {
    if (j.contains("component_id"))
        component_id = j.at("component_id").get<std::string>();
    if (j.contains("poll_interval_ms"))
        poll_interval_ms = j.at("poll_interval_ms").get<int>();
    if (j.contains("two_phase"))
        two_phase = j.at("two_phase").get<bool>();
    if (j.contains("max_triggers_per_tick"))
        max_triggers_per_tick = j.at("max_triggers_per_tick").get<size_t>();
    if (j.contains("redelegate_after"))
        redelegate_after = j.at("redelegate_after").get<bool>();
}

std::string watch_phase_to_string(WatchPhase phase) {
    switch (phase) {
        case WatchPhase::WATCHING:
            return "WATCHING";
        case WatchPhase::TRIGGERED:
            return "TRIGGERED";
        default:
            return "UNKNOWN";
    }
}

ExecutionCoordinator::ExecutionCoordinator(CoordinatorDependencies deps, chain::Keypair executor,
                                           Bytes decryption_key, CoordinatorConfig config)
    : deps_(std::move(deps)),
      executor_(std::move(executor)),
      decryption_key_(std::move(decryption_key)),
      config_(std::move(config)) {}

ExecutionCoordinator::~ExecutionCoordinator() {
    running_.store(false);
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

Result<void> ExecutionCoordinator::initialize() {
    if (!deps_.rpc || !deps_.monitor || !deps_.bundles || !deps_.drift || !deps_.codec) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED,
                                "Coordinator is missing a required dependency", COMPONENT);
    }
    if (decryption_key_.size() != crypto::EciesCipher::PRIVATE_KEY_LEN) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Decryption key must be 32 bytes", COMPONENT);
    }

    ComponentInfo info{ComponentType::EXECUTION_COORDINATOR,
                       ComponentState::INITIALIZED,
                       config_.component_id,
                       "",
                       std::chrono::system_clock::now(),
                       {{"monitored_orders", 0.0}, {"executions", 0.0}, {"errors", 0.0}}};
    auto registered = StateManager::instance().register_component(info);
    if (registered.is_error()) {
        return registered;
    }

    initialized_.store(true);
    INFO("Execution coordinator initialized for executor " << executor_.public_key().to_base58()
                                                           << (config_.two_phase ? " (two-phase)"
                                                                                 : ""));
    return Result<void>();
}

Result<void> ExecutionCoordinator::start() {
    if (!initialized_.load()) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED, "Coordinator not initialized",
                                COMPONENT);
    }
    if (running_.exchange(true)) {
        return Result<void>();
    }
    if (worker_.joinable()) {
        worker_.join();
    }

    auto state = StateManager::instance().update_state(config_.component_id,
                                                       ComponentState::RUNNING);
    if (state.is_error()) {
        running_.store(false);
        return state;
    }

    worker_ = std::thread(&ExecutionCoordinator::worker_loop, this);
    INFO("Execution coordinator started, polling every " << config_.poll_interval_ms << "ms");
    return Result<void>();
}

Result<void> ExecutionCoordinator::stop() {
    if (!running_.exchange(false)) {
        return Result<void>();
    }
    wake_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
    INFO("Execution coordinator stopped");
    return StateManager::instance().update_state(config_.component_id, ComponentState::STOPPED);
}

void ExecutionCoordinator::worker_loop() {
    Logger::register_component(COMPONENT);
    while (running_.load()) {
        auto summary = run_tick();
        if (summary.is_error()) {
            ERROR("Tick failed: " << summary.error()->what());
        }

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_.wait_for(lock, std::chrono::milliseconds(config_.poll_interval_ms),
                       [this] { return !running_.load(); });
    }
}

Result<void> ExecutionCoordinator::add_order(const chain::PublicKey& address) {
    if (address.is_zero()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Order address is empty",
                                COMPONENT);
    }
    std::lock_guard<std::mutex> lock(orders_mutex_);
    if (orders_.count(address)) {
        return Result<void>();
    }
    MonitoredOrder order;
    order.address = address;
    orders_.emplace(address, std::move(order));
    INFO("Watching order " << address.to_base58());
    return Result<void>();
}

bool ExecutionCoordinator::remove_order(const chain::PublicKey& address) {
    std::lock_guard<std::mutex> lock(orders_mutex_);
    return orders_.erase(address) > 0;
}

std::vector<MonitoredOrder> ExecutionCoordinator::get_monitored_orders() const {
    std::lock_guard<std::mutex> lock(orders_mutex_);
    std::vector<MonitoredOrder> out;
    out.reserve(orders_.size());
    for (const auto& entry : orders_) {
        out.push_back(entry.second);
    }
    return out;
}

Result<size_t> ExecutionCoordinator::discover_orders() {
    chain::ProgramAccountsFilter filter;
    filter.data_size = program::EncryptedOrderAccount::LEN;
    // status byte sits just before is_delegated and bump
    filter.memcmp.push_back(chain::MemcmpFilter{
        program::EncryptedOrderAccount::LEN - 3,
        Bytes{static_cast<uint8_t>(program::OrderStatus::ACTIVE)}});

    auto accounts = deps_.rpc->get_program_accounts(deps_.program.program_id(), filter);
    if (accounts.is_error()) {
        return forward_error<size_t>(accounts);
    }
    size_t added = 0;
    for (const auto& keyed : accounts.value()) {
        bool is_new = false;
        {
            std::lock_guard<std::mutex> lock(orders_mutex_);
            is_new = orders_.count(keyed.address) == 0;
        }
        if (is_new && add_order(keyed.address).is_ok()) {
            ++added;
        }
    }
    INFO("Discovered " << added << " new active order(s)");
    return added;
}

ExecutionCoordinator::RefreshOutcome ExecutionCoordinator::refresh_order(MonitoredOrder& order,
                                                                         TickSummary& summary) {
    auto info = deps_.rpc->get_account_info(order.address);
    const bool owned_by_delegation = info.is_ok() && info.value() &&
                                     info.value()->owner == program::delegation_program_id();
    if (owned_by_delegation && deps_.er_rpc) {
        // Delegated accounts are authoritative on the rollup
        info = deps_.er_rpc->get_account_info(order.address);
    }
    if (info.is_error()) {
        WARN("Could not read order " << short_address(order.address) << ": "
                                     << info.error()->what());
        return RefreshOutcome::SKIP;
    }
    if (!info.value()) {
        INFO("Order " << order.address.to_base58() << " account closed, no longer watching");
        return RefreshOutcome::REMOVE;
    }

    auto parsed = program::parse_encrypted_order(info.value()->data);
    if (parsed.is_error()) {
        report_error(order, *parsed.error(), summary);
        return RefreshOutcome::SKIP;
    }

    const program::EncryptedOrderAccount& account = parsed.value();
    if (account.status == program::OrderStatus::EXECUTED ||
        account.status == program::OrderStatus::CANCELLED) {
        INFO("Order " << order.address.to_base58() << " is "
                      << program::order_status_to_string(account.status)
                      << ", no longer watching");
        return RefreshOutcome::REMOVE;
    }
    if (order.account && order.account->order_hash != account.order_hash) {
        // Account was closed and recreated under the same address
        order.payload.reset();
        order.phase = WatchPhase::WATCHING;
        order.trigger_notified = false;
    }
    // Mode gate follows the current delegation state, never a cached one
    order.delegated = owned_by_delegation || account.is_delegated;
    order.account = account;
    if (account.status == program::OrderStatus::TRIGGERED) {
        DEBUG("Order " << short_address(order.address) << " already triggered on-chain");
        return RefreshOutcome::SKIP;
    }
    return RefreshOutcome::KEEP;
}

void ExecutionCoordinator::decrypt_order(MonitoredOrder& order, TickSummary& summary) {
    const program::EncryptedOrderAccount& account = *order.account;
    auto payload = deps_.codec->decrypt(account.ciphertext(), decryption_key_);
    if (payload.is_error()) {
        ++order.decrypt_failures;
        ++summary.decrypt_failures;
        report_error(order, *payload.error(), summary);
        return;
    }

    auto hash = deps_.codec->hash(payload.value());
    if (hash.is_error() || hash.value() != account.order_hash ||
        payload.value().owner != account.owner || payload.value().feed_id != account.feed_id) {
        ++order.decrypt_failures;
        ++summary.decrypt_failures;
        report_error(order,
                     ShroudError(ErrorCode::DECRYPTION_ERROR,
                                 "Decrypted order does not match its on-chain commitment",
                                 COMPONENT),
                     summary);
        return;
    }

    order.payload = payload.value();
    ++summary.decrypted;
    DEBUG("Decrypted order " << short_address(order.address) << ": market "
                             << order.payload->market_index << " trigger "
                             << order.payload->trigger_price);
}

Result<void> ExecutionCoordinator::check_authorized(const order::OrderPayload& payload) {
    if (executor_.public_key() == payload.owner) {
        return Result<void>();
    }
    auto authority = deps_.program.executor_authority_address(payload.owner);
    if (authority.is_error()) {
        return forward_error<void>(authority);
    }
    auto info = deps_.rpc->get_account_info(authority.value().address);
    if (info.is_ok() && info.value() && info.value()->owner == program::delegation_program_id() &&
        deps_.er_rpc) {
        info = deps_.er_rpc->get_account_info(authority.value().address);
    }
    if (info.is_error()) {
        return forward_error<void>(info);
    }
    if (!info.value()) {
        return make_error<void>(ErrorCode::CHAIN_READ_ERROR,
                                "Executor authority account not found", COMPONENT);
    }
    auto parsed = program::parse_executor_authority(info.value()->data);
    if (parsed.is_error()) {
        return forward_error<void>(parsed);
    }
    if (!parsed.value().can_execute(executor_.public_key())) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "Executor " + executor_.public_key().to_base58() +
                                    " is not authorized by the order owner",
                                COMPONENT);
    }
    return Result<void>();
}

Result<std::string> ExecutionCoordinator::send(const std::vector<chain::Instruction>& instructions,
                                               bool delegated) {
    if (delegated) {
        if (!deps_.er_sender) {
            return make_error<std::string>(ErrorCode::NOT_INITIALIZED,
                                           "Order is delegated but no rollup lane is configured",
                                           COMPONENT);
        }
        return deps_.er_sender->send_and_confirm(instructions, executor_);
    }

    bundle::BundleResult result = deps_.bundles->submit_with_retry(instructions, executor_);
    if (!result.success) {
        return make_error<std::string>(
            result.error_code == ErrorCode::NONE ? ErrorCode::SUBMISSION_ERROR : result.error_code,
            result.phase + ": " + result.error, COMPONENT);
    }
    return result.signature;
}

Result<void> ExecutionCoordinator::mark_ready(MonitoredOrder& order, int64_t execution_price) {
    chain::Instruction ix =
        deps_.program.mark_ready(executor_.public_key(), order.address, execution_price);
    auto sent = send({ix}, order.delegated);
    if (sent.is_error()) {
        return forward_error<void>(sent);
    }
    INFO("Order " << order.address.to_base58() << " marked ready at " << execution_price
                  << " (" << sent.value() << ")");
    return Result<void>();
}

Result<std::string> ExecutionCoordinator::execute(MonitoredOrder& order) {
    const order::OrderPayload& payload = *order.payload;

    auto authorized = check_authorized(payload);
    if (authorized.is_error()) {
        return forward_error<std::string>(authorized);
    }

    // Venue accounts are looked up for every attempt
    auto drift = deps_.drift->resolve(payload.owner, payload.market_index);
    if (drift.is_error()) {
        return forward_error<std::string>(drift);
    }

    program::TriggerExecuteParams params;
    params.payer = executor_.public_key();
    params.order_address = order.address;
    params.order = payload;
    params.drift = drift.value();
    params.redelegate_after = order.delegated && config_.redelegate_after;

    auto ix = deps_.program.trigger_and_execute(params);
    if (ix.is_error()) {
        return forward_error<std::string>(ix);
    }
    return send({ix.value()}, order.delegated);
}

void ExecutionCoordinator::report_error(MonitoredOrder& order, const ShroudError& error,
                                        TickSummary& summary) {
    ++summary.errors;
    order.last_error = error.what();
    WARN("Order " << short_address(order.address) << ": " << error.to_string());
    if (on_order_error_) {
        notify("on_order_error", [&] { on_order_error_(order.address, error); });
    }
}

void ExecutionCoordinator::notify(const char* name, const std::function<void()>& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        ERROR(name << " callback threw: " << e.what());
    }
}

Result<TickSummary> ExecutionCoordinator::run_tick() {
    std::lock_guard<std::mutex> tick_lock(tick_mutex_);
    ScopedLogComponent log_component(COMPONENT);
    TickSummary summary;

    std::vector<MonitoredOrder> work;
    {
        std::lock_guard<std::mutex> lock(orders_mutex_);
        for (const auto& entry : orders_) {
            work.push_back(entry.second);
        }
    }
    summary.monitored = work.size();

    // 1. refresh from chain, 2. decrypt what is new
    std::vector<bool> remove(work.size(), false);
    std::vector<bool> eligible(work.size(), false);
    for (size_t i = 0; i < work.size(); ++i) {
        RefreshOutcome outcome = refresh_order(work[i], summary);
        if (outcome == RefreshOutcome::REMOVE) {
            remove[i] = true;
            continue;
        }
        if (outcome == RefreshOutcome::SKIP || !work[i].account) {
            continue;
        }
        if (!work[i].payload) {
            decrypt_order(work[i], summary);
        }
        eligible[i] = work[i].payload.has_value();
    }

    // 3. one price refresh for every feed in play
    std::vector<Hash32> feeds;
    for (size_t i = 0; i < work.size(); ++i) {
        if (eligible[i] &&
            std::find(feeds.begin(), feeds.end(), work[i].payload->feed_id) == feeds.end()) {
            feeds.push_back(work[i].payload->feed_id);
        }
    }
    auto refreshed = deps_.monitor->refresh(feeds);
    if (refreshed.is_error()) {
        WARN("Using cached prices this tick: " << refreshed.error()->what());
    }

    // 4. evaluate and execute, capped per tick
    for (size_t i = 0; i < work.size(); ++i) {
        if (!eligible[i]) {
            continue;
        }
        if (summary.matched >= config_.max_triggers_per_tick) {
            DEBUG("Trigger cap reached, deferring remaining orders");
            break;
        }
        MonitoredOrder& order = work[i];
        const monitor::TriggerEvaluation eval = deps_.monitor->evaluate(*order.payload);
        if (!eval.matched()) {
            TRACE("Order " << short_address(order.address) << ": "
                           << monitor::trigger_outcome_to_string(eval.outcome));
            continue;
        }
        ++summary.matched;

        if (!order.trigger_notified && on_order_triggered_) {
            notify("on_order_triggered", [&] {
                on_order_triggered_(order.address, *order.payload, eval.execution_price);
            });
        }
        order.trigger_notified = true;

        if (config_.two_phase && order.phase == WatchPhase::WATCHING) {
            auto marked = mark_ready(order, eval.execution_price);
            if (marked.is_error()) {
                ++order.execution_failures;
                report_error(order, *marked.error(), summary);
                continue;
            }
            order.phase = WatchPhase::TRIGGERED;
            order.triggered_price = eval.execution_price;
            ++summary.marked_ready;
            if (on_order_ready_for_execution_) {
                notify("on_order_ready_for_execution",
                       [&] { on_order_ready_for_execution_(order.address, *order.payload); });
            }
            continue;
        }

        auto signature = execute(order);
        if (signature.is_error()) {
            ++order.execution_failures;
            report_error(order, *signature.error(), summary);
            continue;
        }
        INFO("Executed order " << order.address.to_base58() << " at " << eval.execution_price
                               << " (" << signature.value() << ")");
        ++summary.executed;
        remove[i] = true;
        if (on_order_executed_) {
            notify("on_order_executed",
                   [&] { on_order_executed_(order.address, signature.value()); });
        }
    }

    // Write back, respecting add/remove calls made while the tick ran
    {
        std::lock_guard<std::mutex> lock(orders_mutex_);
        for (size_t i = 0; i < work.size(); ++i) {
            auto it = orders_.find(work[i].address);
            if (it == orders_.end()) {
                continue;
            }
            if (remove[i]) {
                orders_.erase(it);
                ++summary.removed;
            } else {
                it->second = std::move(work[i]);
            }
        }
    }

    total_executions_ += summary.executed;
    total_errors_ += summary.errors;
    total_decrypt_failures_ += summary.decrypt_failures;
    publish_metrics(summary);

    DEBUG("Tick: monitored=" << summary.monitored << " matched=" << summary.matched
                             << " executed=" << summary.executed << " errors=" << summary.errors);
    return summary;
}

void ExecutionCoordinator::publish_metrics(const TickSummary& summary) {
    if (!initialized_.load()) {
        return;
    }
    std::unordered_map<std::string, double> metrics = {
        {"monitored_orders", static_cast<double>(summary.monitored - summary.removed)},
        {"executions", static_cast<double>(total_executions_)},
        {"errors", static_cast<double>(total_errors_)},
        {"decrypt_failures", static_cast<double>(total_decrypt_failures_)}};
    auto updated = StateManager::instance().update_metrics(config_.component_id, metrics);
    if (updated.is_error()) {
        DEBUG("Metrics update failed: " << updated.error()->what());
    }
}

}  // namespace execution
}  // namespace shroud
