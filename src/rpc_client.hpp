#pragma once

#include "chain_reader.hpp"
#include "http_client.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <string>

// JSON-RPC 2.0 adapter for an Ethereum node.
class RpcClient : public RpcBackend {
public:
    RpcClient(std::string rpc_url, std::shared_ptr<HttpClient> http, bool push_enabled);

    std::string source_name() const override { return "rpc"; }

    uint64_t chain_id() override;
    uint64_t block_number() override;
    uint256 get_balance(const std::string& address) override;
    uint64_t get_transaction_count(const std::string& address) override;
    std::string get_code(const std::string& address) override;
    std::optional<Block> get_block(uint64_t number, bool full_transactions) override;
    std::optional<Transaction> get_transaction(const std::string& hash) override;
    std::optional<Receipt> get_receipt(const std::string& hash) override;
    uint64_t gas_price() override;

    std::optional<Block> get_block_by_hash(const std::string& hash, bool full_transactions) override;
    uint64_t estimate_gas(const CallRequest& request) override;
    std::string call(const CallRequest& request) override;

    bool supports_push() const override { return push_enabled_; }
    std::string new_block_filter() override;
    std::string new_pending_transaction_filter() override;
    std::vector<std::string> get_filter_changes(const std::string& filter_id) override;
    void uninstall_filter(const std::string& filter_id) override;

    // Returns the "result" member; throws on transport, RPC or shape errors.
    nlohmann::json make_request(const std::string& method, const nlohmann::json& params);

    // Unwraps a JSON-RPC response body. Exposed for tests.
    static nlohmann::json extract_result(const std::string& method, const std::string& body);

private:
    std::string rpc_url_;
    std::shared_ptr<HttpClient> http_;
    bool push_enabled_;
    std::atomic<uint64_t> next_id_{1};
};
