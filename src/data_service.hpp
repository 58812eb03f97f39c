#pragma once

#include "cache_store.hpp"
#include "chain_reader.hpp"
#include "config.hpp"
#include "ens_resolver.hpp"
#include "types.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Single read facade for the front end: cache-aside over the node RPC and,
// when an API key is configured, the indexed explorer API.
class DataService {
public:
    // indexed may be null (no API key). config must outlive the service.
    DataService(const Config& config,
                std::shared_ptr<CacheStore> cache,
                std::shared_ptr<RpcBackend> rpc,
                std::shared_ptr<IndexedApiBackend> indexed);

    AddressInfo get_address_info(const std::string& address);
    uint256 get_address_balance(const std::string& address);

    // List views degrade to an empty list when the indexed API is unavailable.
    std::vector<AddressTx> get_address_transactions(const std::string& address);
    std::vector<TokenTransfer> get_token_transfers(const std::string& address);
    std::vector<InternalTransaction> get_internal_transactions(const std::string& address);
    std::vector<TokenBalance> get_token_balances(const std::string& address);

    std::optional<TransactionDetails> get_transaction_details(const std::string& hash);

    std::optional<Block> get_block_by_number(uint64_t number);
    std::optional<Block> get_latest_block();
    uint64_t get_block_number();

    uint64_t estimate_gas(const std::string& from,
                          const std::string& to,
                          const std::optional<std::string>& data = std::nullopt,
                          const std::optional<std::string>& value_wei = std::nullopt);
    GasPrices get_gas_prices();

    // ENS primary name; only mainnet has a registry.
    std::optional<std::string> resolve_name(const std::string& address);

    std::optional<ContractInfo> get_contract_info(const std::string& address);
    TokenInfo get_token_info(const std::string& contract_address);

    // Chain id reported by the node; throws when unreachable.
    uint64_t test_connection();

    CacheStats cache_stats() const;
    void clear_cache();

    bool prefers_indexed_api() const;

private:
    ChainReader& preferred_reader();

    template <typename T>
    T read_with_fallback(const std::string& what, const std::function<T(ChainReader&)>& read);

    template <typename T>
    std::vector<T> read_list(const std::string& what,
                             const std::string& key,
                             const std::function<std::optional<std::vector<T>>(const std::string&)>& cached,
                             const std::function<void(const std::string&, const std::vector<T>&)>& store,
                             const std::function<std::vector<T>(IndexedApiBackend&)>& fetch);

    std::vector<InternalTransaction> get_internal_transactions_for_hash(const std::string& hash);
    std::optional<std::string> call_data(const std::string& to, const char* selector);

    const Config& config_;
    std::shared_ptr<CacheStore> cache_;
    std::shared_ptr<RpcBackend> rpc_;
    std::shared_ptr<IndexedApiBackend> indexed_;
    EnsResolver ens_;
};
