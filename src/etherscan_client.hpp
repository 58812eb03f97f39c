#pragma once

#include "chain_reader.hpp"
#include "http_client.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

enum class EtherscanChain {
    Ethereum,
    Goerli,
    Sepolia,
    Polygon,
    Arbitrum,
    Optimism,
    Base,
    Custom
};

EtherscanChain etherscan_chain_from_id(uint64_t chain_id);
const char* etherscan_chain_name(EtherscanChain chain);

// Etherscan V2 unified multi-chain REST API.
class EtherscanClient : public IndexedApiBackend {
public:
    EtherscanClient(std::string api_key,
                    uint64_t chain_id,
                    std::string base_url,
                    std::shared_ptr<HttpClient> http);

    std::string source_name() const override { return "etherscan"; }

    uint64_t chain_id() override { return chain_id_; }
    uint64_t block_number() override;
    uint256 get_balance(const std::string& address) override;
    uint64_t get_transaction_count(const std::string& address) override;
    std::string get_code(const std::string& address) override;
    std::optional<Block> get_block(uint64_t number, bool full_transactions) override;
    std::optional<Transaction> get_transaction(const std::string& hash) override;
    std::optional<Receipt> get_receipt(const std::string& hash) override;
    uint64_t gas_price() override;

    std::vector<AddressTx> get_address_transactions(const std::string& address) override;
    std::vector<TokenTransfer> get_token_transfers(const std::string& address) override;
    std::vector<InternalTransaction> get_internal_transactions(const std::string& address) override;
    std::vector<InternalTransaction> get_internal_transactions_by_hash(const std::string& hash) override;
    std::vector<TokenBalance> get_token_balances(const std::string& address) override;
    std::optional<ContractInfo> get_contract_info(const std::string& address) override;

    // Envelope handling and row decoding, exposed for tests.
    static nlohmann::json account_result(const nlohmann::json& response);
    static nlohmann::json proxy_result(const nlohmann::json& response);

    static std::vector<AddressTx> parse_address_transactions(const nlohmann::json& rows);
    static std::vector<TokenTransfer> parse_token_transfers(const nlohmann::json& rows);
    static std::vector<InternalTransaction> parse_internal_transactions(const nlohmann::json& rows,
                                                                        const std::string& parent_hash = "");
    static std::vector<TokenBalance> parse_token_balances(const nlohmann::json& rows);
    static std::optional<ContractInfo> parse_contract_info(const std::string& address,
                                                           const nlohmann::json& rows);
    static std::string method_name(const nlohmann::json& row);

private:
    nlohmann::json request(const std::string& module, const std::string& action, QueryParams params);
    nlohmann::json account_list(const std::string& action, const std::string& address);
    nlohmann::json proxy(const std::string& action, QueryParams params);

    std::string api_key_;
    uint64_t chain_id_;
    std::string base_url_;
    std::shared_ptr<HttpClient> http_;
};
