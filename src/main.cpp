#include "cache_store.hpp"
#include "config.hpp"
#include "data_service.hpp"
#include "etherscan_client.hpp"
#include "http_client.hpp"
#include "logging.hpp"
#include "rpc_client.hpp"
#include "subscription_manager.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    (void)signal;
    shutdown_requested = true;
}

void print_address(DataService& service, const std::string& address) {
    auto info = service.get_address_info(address);
    spdlog::info("Address {}", info.address);
    spdlog::info("  Balance: {} ETH", util::format_units(info.balance_wei, 18));
    spdlog::info("  Nonce: {}", info.transaction_count);
    spdlog::info("  Contract: {}", info.is_contract ? "yes" : "no");

    if (auto name = service.resolve_name(address)) {
        spdlog::info("  ENS: {}", *name);
    }

    auto txs = service.get_address_transactions(address);
    spdlog::info("  Recent transactions: {}", txs.size());
    for (size_t i = 0; i < txs.size() && i < 10; ++i) {
        const auto& tx = txs[i];
        spdlog::info("    #{} {} {} {} ETH ({})", tx.block_number, util::short_hex(tx.hash),
                     tx.method.empty() ? "transfer" : tx.method,
                     util::format_units(tx.value_wei, 18), to_string(tx.status));
    }

    for (const auto& balance : service.get_token_balances(address)) {
        spdlog::info("  Token {}: {}", balance.symbol, util::format_units(balance.balance, balance.decimals));
    }
}

void print_transaction(DataService& service, const std::string& hash) {
    auto details = service.get_transaction_details(hash);
    if (!details) {
        spdlog::warn("Transaction {} not found", hash);
        return;
    }

    const auto& tx = details->transaction;
    spdlog::info("Transaction {}", tx.hash);
    spdlog::info("  Status: {} ({} confirmations)", to_string(details->status), details->confirmations);
    spdlog::info("  From: {}", tx.from);
    spdlog::info("  To: {}", tx.to.value_or("(contract creation)"));
    spdlog::info("  Fee: {} ETH", util::format_units(details->fee_wei, 18));

    for (const auto& transfer : details->transfers) {
        if (transfer.token) {
            spdlog::info("  Transfer {} {} {} -> {}", util::format_units(transfer.value, transfer.token->decimals),
                         transfer.token->symbol, util::short_hex(transfer.from), util::short_hex(transfer.to));
        } else {
            spdlog::info("  Transfer {} ETH {} -> {}{}", util::format_units(transfer.value, 18),
                         util::short_hex(transfer.from), util::short_hex(transfer.to),
                         transfer.kind == TransferKind::Internal ? " (internal)" : "");
        }
    }
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        auto config = Config::from_env();
        setup_logging(config.log_level, config.log_file);

        spdlog::info("Starting blockscope");
        config.validate();

        auto rpc_http = std::make_shared<HttpClient>(config.timeout_seconds * 1000);
        auto rpc = std::make_shared<RpcClient>(config.rpc_url, rpc_http, config.push_subscriptions);

        std::shared_ptr<IndexedApiBackend> indexed;
        if (config.etherscan_api_key) {
            auto api_http = std::make_shared<HttpClient>(config.indexed_timeout_seconds * 1000);
            indexed = std::make_shared<EtherscanClient>(*config.etherscan_api_key, config.chain_id,
                                                        config.etherscan_base_url, api_http);
        }

        auto cache = std::make_shared<CacheStore>(config.cache);
        DataService service(config, cache, rpc, indexed);

        service.test_connection();

        if (auto latest = service.get_latest_block()) {
            spdlog::info("Latest block #{} {} ({} transactions)", latest->number,
                         util::short_hex(latest->hash), latest->transaction_hashes.size());
        }

        auto gas = service.get_gas_prices();
        spdlog::info("Gas (gwei): slow {} / standard {} / fast {}",
                     util::format_units(gas.slow, 9),
                     util::format_units(gas.standard, 9),
                     util::format_units(gas.fast, 9));

        SubscriptionOptions options;
        options.block_poll_interval = std::chrono::milliseconds(config.block_poll_interval_ms);
        options.address_poll_interval = std::chrono::milliseconds(config.address_poll_interval_ms);
        options.filter_poll_interval = std::chrono::milliseconds(config.filter_poll_interval_ms);
        SubscriptionManager subscriptions(rpc, options);

        std::string target = argc > 1 ? argv[1] : "";
        if (util::is_valid_tx_hash(target)) {
            print_transaction(service, target);
            return 0;
        }

        subscriptions.subscribe_to_blocks("blocks");
        if (util::is_valid_address(target)) {
            print_address(service, target);
            subscriptions.subscribe_to_address("watch", target);
        } else if (!target.empty()) {
            spdlog::warn("Ignoring argument '{}': not an address or transaction hash", target);
        }

        auto events = subscriptions.events();
        while (!shutdown_requested) {
            auto event = events->wait_pop(std::chrono::milliseconds(500));
            if (!event) continue;

            spdlog::info("{}", describe(*event));
            if (std::holds_alternative<SubscriptionErrorEvent>(*event)) {
                std::string id = subscription_id_of(*event);
                spdlog::warn("Restarting subscription {} in 5s", id);
                std::this_thread::sleep_for(std::chrono::seconds(5));
                if (id == "watch") {
                    subscriptions.subscribe_to_address(id, target);
                } else {
                    subscriptions.subscribe_to_blocks(id);
                }
            }
        }

        spdlog::info("Shutting down...");
        subscriptions.unsubscribe_all();

        auto stats = service.cache_stats();
        spdlog::info("Cache entries at exit: {}", stats.total);
        spdlog::info("Shutdown complete");

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }

    return 0;
}
