#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

// Reads available on both the node RPC and the indexed explorer API.
// Failures are thrown as ExplorerError subclasses; "not found" is nullopt.
class ChainReader {
public:
    virtual ~ChainReader() = default;

    virtual std::string source_name() const = 0;

    virtual uint64_t chain_id() = 0;
    virtual uint64_t block_number() = 0;
    virtual uint256 get_balance(const std::string& address) = 0;
    virtual uint64_t get_transaction_count(const std::string& address) = 0;
    virtual std::string get_code(const std::string& address) = 0;
    virtual std::optional<Block> get_block(uint64_t number, bool full_transactions) = 0;
    virtual std::optional<Transaction> get_transaction(const std::string& hash) = 0;
    virtual std::optional<Receipt> get_receipt(const std::string& hash) = 0;
    virtual uint64_t gas_price() = 0;
};

// Node JSON-RPC. Filter primitives back the push channel of subscriptions.
class RpcBackend : public ChainReader {
public:
    virtual std::optional<Block> get_block_by_hash(const std::string& hash, bool full_transactions) = 0;
    virtual uint64_t estimate_gas(const CallRequest& request) = 0;
    virtual std::string call(const CallRequest& request) = 0;

    virtual bool supports_push() const = 0;
    virtual std::string new_block_filter() = 0;
    virtual std::string new_pending_transaction_filter() = 0;
    virtual std::vector<std::string> get_filter_changes(const std::string& filter_id) = 0;
    virtual void uninstall_filter(const std::string& filter_id) = 0;
};

// Indexed explorer REST API. List views exist only here.
class IndexedApiBackend : public ChainReader {
public:
    virtual std::vector<AddressTx> get_address_transactions(const std::string& address) = 0;
    virtual std::vector<TokenTransfer> get_token_transfers(const std::string& address) = 0;
    virtual std::vector<InternalTransaction> get_internal_transactions(const std::string& address) = 0;
    virtual std::vector<InternalTransaction> get_internal_transactions_by_hash(const std::string& hash) = 0;
    virtual std::vector<TokenBalance> get_token_balances(const std::string& address) = 0;
    virtual std::optional<ContractInfo> get_contract_info(const std::string& address) = 0;
};
