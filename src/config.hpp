#pragma once

#include <cstdint>
#include <optional>
#include <string>

struct CacheConfig {
    bool enabled = true;
    int max_entries = 1000;

    // TTLs in seconds, per entity kind
    int block_ttl = 3600;
    int transaction_ttl = 7200;
    int address_ttl = 1800;
    int contract_ttl = 86400;
    int token_ttl = 86400;
    int address_transactions_ttl = 300;
    int token_transfers_ttl = 300;
    int internal_transactions_ttl = 300;
    int token_balances_ttl = 120;
    int ens_ttl = 3600;
};

struct Config {
    // Network
    std::string network_name = "Ethereum Mainnet";
    std::string rpc_url = "http://127.0.0.1:8545";
    uint64_t chain_id = 1;
    int timeout_seconds = 30;
    bool local_node = false;
    bool push_subscriptions = true;

    // Indexed explorer API
    std::optional<std::string> etherscan_api_key;
    std::string etherscan_base_url = "https://api.etherscan.io/v2/api";
    int indexed_timeout_seconds = 10;

    // Subscriptions
    int block_poll_interval_ms = 2000;
    int address_poll_interval_ms = 3000;
    int filter_poll_interval_ms = 1000;

    CacheConfig cache;

    // Service
    std::string log_level = "info";
    std::string log_file;

    // Environment overrides the persisted values.
    static Config from_env(const Config& persisted = Config{});
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static bool get_env_bool(const char* name, bool default_val);
};
