#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;

    std::string v = util::to_lower(val);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;

    spdlog::warn("Invalid boolean for {}, using default {}", name, default_val);
    return default_val;
}

Config Config::from_env(const Config& persisted) {
    Config cfg = persisted;

    cfg.network_name = get_env("NETWORK_NAME", persisted.network_name);
    cfg.rpc_url = get_env("RPC_URL", persisted.rpc_url);
    cfg.timeout_seconds = get_env_int("RPC_TIMEOUT_SECONDS", persisted.timeout_seconds);
    cfg.local_node = get_env_bool("LOCAL_NODE", persisted.local_node);
    cfg.push_subscriptions = get_env_bool("RPC_PUSH_ENABLED", persisted.push_subscriptions);

    std::string chain = get_env("CHAIN_ID");
    if (!chain.empty()) {
        if (auto id = util::parse_u64(chain)) {
            cfg.chain_id = *id;
        } else {
            spdlog::warn("Invalid integer for CHAIN_ID, using {}", persisted.chain_id);
        }
    }

    // An empty key in the environment does not clear a persisted one
    std::string api_key = get_env("ETHERSCAN_API_KEY");
    if (!api_key.empty()) {
        cfg.etherscan_api_key = api_key;
    }
    cfg.etherscan_base_url = get_env("ETHERSCAN_BASE_URL", persisted.etherscan_base_url);
    cfg.indexed_timeout_seconds = get_env_int("ETHERSCAN_TIMEOUT_SECONDS",
                                              persisted.indexed_timeout_seconds);

    cfg.block_poll_interval_ms = get_env_int("BLOCK_POLL_INTERVAL_MS", persisted.block_poll_interval_ms);
    cfg.address_poll_interval_ms = get_env_int("ADDRESS_POLL_INTERVAL_MS", persisted.address_poll_interval_ms);
    cfg.filter_poll_interval_ms = get_env_int("FILTER_POLL_INTERVAL_MS", persisted.filter_poll_interval_ms);

    auto& cache = cfg.cache;
    const auto& base = persisted.cache;
    cache.enabled = get_env_bool("CACHE_ENABLED", base.enabled);
    cache.max_entries = get_env_int("CACHE_MAX_ENTRIES", base.max_entries);
    cache.block_ttl = get_env_int("CACHE_BLOCK_TTL_SECONDS", base.block_ttl);
    cache.transaction_ttl = get_env_int("CACHE_TRANSACTION_TTL_SECONDS", base.transaction_ttl);
    cache.address_ttl = get_env_int("CACHE_ADDRESS_TTL_SECONDS", base.address_ttl);
    cache.contract_ttl = get_env_int("CACHE_CONTRACT_TTL_SECONDS", base.contract_ttl);
    cache.token_ttl = get_env_int("CACHE_TOKEN_TTL_SECONDS", base.token_ttl);
    cache.address_transactions_ttl = get_env_int("CACHE_ADDRESS_TRANSACTIONS_TTL_SECONDS",
                                                 base.address_transactions_ttl);
    cache.token_transfers_ttl = get_env_int("CACHE_TOKEN_TRANSFERS_TTL_SECONDS",
                                            base.token_transfers_ttl);
    cache.internal_transactions_ttl = get_env_int("CACHE_INTERNAL_TRANSACTIONS_TTL_SECONDS",
                                                  base.internal_transactions_ttl);
    cache.token_balances_ttl = get_env_int("CACHE_TOKEN_BALANCES_TTL_SECONDS",
                                           base.token_balances_ttl);
    cache.ens_ttl = get_env_int("CACHE_ENS_TTL_SECONDS", base.ens_ttl);

    cfg.log_level = get_env("LOG_LEVEL", persisted.log_level);
    cfg.log_file = get_env("LOG_FILE", persisted.log_file);

    return cfg;
}

void Config::validate() const {
    if (rpc_url.empty()) {
        throw ValidationError("RPC_URL is required");
    }
    if (chain_id == 0) {
        throw ValidationError("CHAIN_ID must be greater than 0");
    }
    if (timeout_seconds <= 0 || indexed_timeout_seconds <= 0) {
        throw ValidationError("request timeouts must be greater than 0");
    }
    if (block_poll_interval_ms <= 0 || address_poll_interval_ms <= 0 || filter_poll_interval_ms <= 0) {
        throw ValidationError("poll intervals must be greater than 0");
    }
    if (cache.max_entries <= 0) {
        throw ValidationError("CACHE_MAX_ENTRIES must be greater than 0");
    }
    for (int ttl : {cache.block_ttl, cache.transaction_ttl, cache.address_ttl,
                    cache.contract_ttl, cache.token_ttl, cache.address_transactions_ttl,
                    cache.token_transfers_ttl, cache.internal_transactions_ttl,
                    cache.token_balances_ttl, cache.ens_ttl}) {
        if (ttl <= 0) {
            throw ValidationError("cache TTLs must be greater than 0");
        }
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  Network: {} (chain {})", network_name, chain_id);
    spdlog::info("  RPC: {} (local={}, push={})", rpc_url, local_node, push_subscriptions);
    spdlog::info("  Indexed API: {}", etherscan_api_key ? etherscan_base_url : "disabled (no API key)");
    spdlog::info("  Cache: enabled={}, max_entries={}", cache.enabled, cache.max_entries);
}
