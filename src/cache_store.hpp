#pragma once

#include "config.hpp"
#include "ttl_lru_cache.hpp"
#include "types.hpp"
#include <atomic>
#include <string>
#include <vector>

struct CacheStats {
    size_t blocks = 0;
    size_t transactions = 0;
    size_t addresses = 0;
    size_t contracts = 0;
    size_t tokens = 0;
    size_t address_transactions = 0;
    size_t token_transfers = 0;
    size_t internal_transactions = 0;
    size_t token_balances = 0;
    size_t ens_names = 0;
    size_t total = 0;
};

// One TTL+LRU collection per entity kind. Keys are lowercased by the caller.
// When disabled every get misses and every put is dropped.
class CacheStore {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    // An empty clock means std::chrono::steady_clock.
    explicit CacheStore(const CacheConfig& config, Clock clock = {});

    bool enabled() const { return enabled_; }
    void set_enabled(bool enabled);

    std::optional<Block> get_block(uint64_t number);
    void put_block(uint64_t number, const Block& block);

    std::optional<Transaction> get_transaction(const std::string& hash);
    void put_transaction(const std::string& hash, const Transaction& tx);

    std::optional<AddressInfo> get_address(const std::string& address);
    void put_address(const std::string& address, const AddressInfo& info);

    std::optional<ContractInfo> get_contract(const std::string& address);
    void put_contract(const std::string& address, const ContractInfo& info);

    std::optional<TokenInfo> get_token(const std::string& address);
    void put_token(const std::string& address, const TokenInfo& info);

    std::optional<std::vector<AddressTx>> get_address_transactions(const std::string& address);
    void put_address_transactions(const std::string& address, const std::vector<AddressTx>& txs);

    std::optional<std::vector<TokenTransfer>> get_token_transfers(const std::string& address);
    void put_token_transfers(const std::string& address, const std::vector<TokenTransfer>& transfers);

    std::optional<std::vector<InternalTransaction>> get_internal_transactions(const std::string& key);
    void put_internal_transactions(const std::string& key, const std::vector<InternalTransaction>& txs);

    std::optional<std::vector<TokenBalance>> get_token_balances(const std::string& address);
    void put_token_balances(const std::string& address, const std::vector<TokenBalance>& balances);

    // Outer optional: cached or not. Inner optional: name bound or not.
    std::optional<std::optional<std::string>> get_ens_name(const std::string& address);
    void put_ens_name(const std::string& address, const std::optional<std::string>& name);

    void clear_all();
    CacheStats stats() const;

private:
    template <typename Key, typename Value>
    std::optional<Value> lookup(TtlLruCache<Key, Value>& cache, const Key& key);

    template <typename Key, typename Value>
    void store(TtlLruCache<Key, Value>& cache, const Key& key, const Value& value);

    std::atomic<bool> enabled_;

    TtlLruCache<uint64_t, Block> blocks_;
    TtlLruCache<std::string, Transaction> transactions_;
    TtlLruCache<std::string, AddressInfo> addresses_;
    TtlLruCache<std::string, ContractInfo> contracts_;
    TtlLruCache<std::string, TokenInfo> tokens_;
    TtlLruCache<std::string, std::vector<AddressTx>> address_transactions_;
    TtlLruCache<std::string, std::vector<TokenTransfer>> token_transfers_;
    TtlLruCache<std::string, std::vector<InternalTransaction>> internal_transactions_;
    TtlLruCache<std::string, std::vector<TokenBalance>> token_balances_;
    TtlLruCache<std::string, std::optional<std::string>> ens_names_;
};
