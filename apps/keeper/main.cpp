#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "shroud/bundle/bundle_relay.hpp"
#include "shroud/bundle/bundle_submitter.hpp"
#include "shroud/chain/keypair.hpp"
#include "shroud/chain/rpc_client.hpp"
#include "shroud/chain/transaction_sender.hpp"
#include "shroud/config/service_config.hpp"
#include "shroud/core/clock.hpp"
#include "shroud/core/encoding.hpp"
#include "shroud/core/env_loader.hpp"
#include "shroud/core/logger.hpp"
#include "shroud/core/state_manager.hpp"
#include "shroud/crypto/ecies.hpp"
#include "shroud/crypto/secure_random.hpp"
#include "shroud/execution/execution_coordinator.hpp"
#include "shroud/monitor/hermes_price_source.hpp"
#include "shroud/net/http_client.hpp"
#include "shroud/order/order_codec.hpp"

using namespace shroud;

namespace {

std::atomic<bool> g_shutdown{false};

void handle_signal(int) {
    g_shutdown.store(true);
}

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " <config.json> [--overrides FILE] [--env FILE] [--order ADDRESS]... "
                 "[--no-discover]"
              << std::endl;
    std::cerr << "Keys are read from SHROUD_EXECUTOR_KEY (hex, 32 or 64 bytes) and "
                 "SHROUD_DECRYPTION_KEY (hex, 32 bytes)."
              << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string config_path = argv[1];
    std::string overrides_path;
    std::string env_path;
    std::vector<std::string> order_addresses;
    bool discover = true;
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--overrides" && i + 1 < argc) {
            overrides_path = argv[++i];
        } else if (arg == "--env" && i + 1 < argc) {
            env_path = argv[++i];
        } else if (arg == "--order" && i + 1 < argc) {
            order_addresses.push_back(argv[++i]);
        } else if (arg == "--no-discover") {
            discover = false;
        } else {
            std::cerr << "Invalid argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    auto config_result = config::ServiceConfigLoader::load(config_path, overrides_path);
    if (config_result.is_error()) {
        std::cerr << "Failed to load config: " << config_result.error()->to_string() << std::endl;
        return 1;
    }
    const config::ServiceConfig& service_config = config_result.value();

    auto& logger = Logger::instance();
    logger.initialize(service_config.logger);
    if (!logger.is_initialized()) {
        std::cerr << "ERROR: Logger initialization failed" << std::endl;
        return 1;
    }
    Logger::register_component("Keeper");
    config::ServiceConfigLoader::log_summary(service_config);

    if (!env_path.empty()) {
        auto loaded = EnvLoader::load(env_path);
        if (loaded.is_error()) {
            ERROR(loaded.error()->to_string());
            return 1;
        }
    }

    auto executor_hex = EnvLoader::require("SHROUD_EXECUTOR_KEY");
    auto decryption_hex = EnvLoader::require("SHROUD_DECRYPTION_KEY");
    if (executor_hex.is_error() || decryption_hex.is_error()) {
        ERROR("Executor keys missing: "
              << (executor_hex.is_error() ? executor_hex.error()->what()
                                          : decryption_hex.error()->what()));
        return 1;
    }
    auto executor = chain::Keypair::from_hex(executor_hex.value());
    if (executor.is_error()) {
        ERROR("Invalid SHROUD_EXECUTOR_KEY: " << executor.error()->what());
        return 1;
    }
    auto decryption_key = encoding::from_hex(decryption_hex.value());
    if (decryption_key.is_error()) {
        ERROR("Invalid SHROUD_DECRYPTION_KEY: " << decryption_key.error()->what());
        return 1;
    }

    // Shared infrastructure; the crypto provider is built once here
    net::HttpClientConfig http_config;
    http_config.connect_timeout_ms = service_config.rpc.connect_timeout_ms;
    http_config.request_timeout_ms = service_config.rpc.request_timeout_ms;
    auto http = std::make_shared<net::CurlHttpClient>(http_config);

    SystemClock clock;
    crypto::OpenSslRandom random;
    crypto::EciesCipher cipher;

    auto rpc = std::make_shared<chain::JsonRpcClient>(http, service_config.rpc.base_url,
                                                      service_config.rpc.commitment,
                                                      service_config.rpc.max_attempts);
    std::shared_ptr<chain::JsonRpcClient> er_rpc;
    std::shared_ptr<chain::TransactionSender> er_sender;
    if (!service_config.rpc.er_url.empty()) {
        er_rpc = std::make_shared<chain::JsonRpcClient>(http, service_config.rpc.er_url,
                                                        service_config.rpc.commitment,
                                                        service_config.rpc.max_attempts);
        er_sender = std::make_shared<chain::TransactionSender>(er_rpc);
    }

    auto relay = std::make_shared<bundle::JitoRelay>(http, service_config.bundle.block_engine_url);
    auto bundles =
        std::make_shared<bundle::BundleSubmitter>(rpc, relay, random, service_config.bundle);
    auto bundle_init = bundles->initialize();
    if (bundle_init.is_error()) {
        ERROR("Bundle submitter failed to initialize: " << bundle_init.error()->to_string());
        return 1;
    }

    auto prices = std::make_shared<monitor::HermesPriceSource>(http, service_config.price_feed);
    auto trigger_monitor =
        std::make_shared<monitor::TriggerMonitor>(prices, clock, service_config.price_feed);

    execution::CoordinatorDependencies deps;
    deps.rpc = rpc;
    deps.er_rpc = er_rpc;
    deps.monitor = trigger_monitor;
    deps.bundles = bundles;
    deps.er_sender = er_sender;
    deps.drift = std::make_shared<program::DriftAccountResolver>(rpc);
    deps.codec = std::make_shared<order::OrderCodec>(cipher, random);

    execution::ExecutionCoordinator coordinator(std::move(deps), executor.value(),
                                                decryption_key.value(),
                                                service_config.coordinator);
    coordinator.set_on_order_executed([](const chain::PublicKey& address, const std::string& sig) {
        INFO("Order " << address.to_base58() << " executed: " << sig);
    });
    coordinator.set_on_order_error([](const chain::PublicKey& address, const ShroudError& error) {
        DEBUG("Order " << address.to_base58() << " error: " << error.to_string());
    });

    auto init = coordinator.initialize();
    if (init.is_error()) {
        ERROR("Coordinator failed to initialize: " << init.error()->to_string());
        return 1;
    }

    for (const auto& text : order_addresses) {
        auto address = chain::PublicKey::from_base58(text);
        if (address.is_error()) {
            ERROR("Invalid order address " << text << ": " << address.error()->what());
            return 1;
        }
        auto added = coordinator.add_order(address.value());
        if (added.is_error()) {
            ERROR(added.error()->to_string());
            return 1;
        }
    }
    if (discover) {
        auto found = coordinator.discover_orders();
        if (found.is_error()) {
            WARN("Order discovery failed: " << found.error()->to_string());
        }
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    auto started = coordinator.start();
    if (started.is_error()) {
        ERROR("Coordinator failed to start: " << started.error()->to_string());
        return 1;
    }
    INFO("Keeper running as " << executor.value().public_key().to_base58());

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    INFO("Shutdown requested");
    auto stopped = coordinator.stop();
    if (stopped.is_error()) {
        ERROR("Coordinator stop failed: " << stopped.error()->to_string());
        return 1;
    }
    return 0;
}
