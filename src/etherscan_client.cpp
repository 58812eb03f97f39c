#include "etherscan_client.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "rpc_json.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace {

// Explorer replies with status "0" and one of these when a list is empty.
bool is_empty_marker(const std::string& text) {
    return text.empty()
        || text == "No transactions found"
        || text == "No transfers found"
        || text == "No internal transactions found"
        || text == "No token transfers found"
        || text == "No records found";
}

std::string text_field(const nlohmann::json& row, const char* key) {
    return RpcJson::require_string(row, key);
}

std::string text_or(const nlohmann::json& row, const char* key, const std::string& fallback) {
    auto value = RpcJson::optional_string(row, key);
    return value && !value->empty() ? *value : fallback;
}

uint64_t number_field(const nlohmann::json& row, const char* key) {
    auto value = util::parse_u64(text_field(row, key));
    if (!value) {
        throw ParseError(std::string("field '") + key + "' is not a number");
    }
    return *value;
}

uint256 amount_field(const nlohmann::json& row, const char* key) {
    return util::decimal_to_u256(text_field(row, key));
}

unsigned decimals_or(const nlohmann::json& row, const char* key, unsigned fallback) {
    auto text = RpcJson::optional_string(row, key);
    if (!text || text->empty()) return fallback;
    auto value = util::parse_u64(*text);
    return value && *value <= 255 ? static_cast<unsigned>(*value) : fallback;
}

template <typename Row, typename ParseRow>
std::vector<Row> parse_rows(const nlohmann::json& rows, const char* what, ParseRow parse_row) {
    if (!rows.is_array()) {
        throw ParseError(std::string(what) + ": result is not a list");
    }

    std::vector<Row> out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        try {
            out.push_back(parse_row(row));
        } catch (const std::exception& e) {
            spdlog::warn("Skipping malformed {} row: {}", what, e.what());
        }
    }
    return out;
}

} // namespace

EtherscanChain etherscan_chain_from_id(uint64_t chain_id) {
    switch (chain_id) {
        case 1: return EtherscanChain::Ethereum;
        case 5: return EtherscanChain::Goerli;
        case 11155111: return EtherscanChain::Sepolia;
        case 137: return EtherscanChain::Polygon;
        case 42161: return EtherscanChain::Arbitrum;
        case 10: return EtherscanChain::Optimism;
        case 8453: return EtherscanChain::Base;
        default: return EtherscanChain::Custom;
    }
}

const char* etherscan_chain_name(EtherscanChain chain) {
    switch (chain) {
        case EtherscanChain::Ethereum: return "Ethereum";
        case EtherscanChain::Goerli: return "Goerli";
        case EtherscanChain::Sepolia: return "Sepolia";
        case EtherscanChain::Polygon: return "Polygon";
        case EtherscanChain::Arbitrum: return "Arbitrum";
        case EtherscanChain::Optimism: return "Optimism";
        case EtherscanChain::Base: return "Base";
        case EtherscanChain::Custom: break;
    }
    return "Custom";
}

EtherscanClient::EtherscanClient(std::string api_key,
                                 uint64_t chain_id,
                                 std::string base_url,
                                 std::shared_ptr<HttpClient> http)
    : api_key_(std::move(api_key))
    , chain_id_(chain_id)
    , base_url_(std::move(base_url))
    , http_(std::move(http))
{
    spdlog::info("Indexed API client for {} (chain {})",
                 etherscan_chain_name(etherscan_chain_from_id(chain_id_)), chain_id_);
}

nlohmann::json EtherscanClient::request(const std::string& module,
                                        const std::string& action,
                                        QueryParams params) {
    ScopedTimer timer("etherscan " + module + "/" + action);

    params.insert(params.begin(), {
        {"chainid", std::to_string(chain_id_)},
        {"module", module},
        {"action", action}
    });
    params.emplace_back("apikey", api_key_);

    HttpResponse response = http_->get(base_url_, params);
    if (!response.ok()) {
        throw NetworkError("explorer " + action + ": HTTP " + std::to_string(response.status));
    }

    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError("explorer " + action + ": response is not JSON (" + e.what() + ")");
    }
}

nlohmann::json EtherscanClient::account_result(const nlohmann::json& response) {
    if (!response.is_object() || !response.contains("result")) {
        throw ParseError("explorer response has no result");
    }

    const auto& result = response["result"];
    std::string status = RpcJson::optional_string(response, "status").value_or("");
    if (status == "1") {
        return result;
    }

    std::string message = RpcJson::optional_string(response, "message").value_or("");
    if (result.is_array() && result.empty()) {
        return result;
    }
    if (result.is_string()) {
        std::string text = result.get<std::string>();
        if (is_empty_marker(text) || is_empty_marker(message)) {
            return nlohmann::json::array();
        }
        throw BlockchainError("explorer API: " + message + " (" + text + ")");
    }
    throw BlockchainError("explorer API: " + (message.empty() ? std::string("status ") + status : message));
}

nlohmann::json EtherscanClient::proxy_result(const nlohmann::json& response) {
    if (!response.is_object()) {
        throw ParseError("explorer proxy response is not an object");
    }

    auto error = response.find("error");
    if (error != response.end() && !error->is_null()) {
        std::string message = error->is_object() ? error->value("message", error->dump())
                                                  : error->dump();
        throw BlockchainError("explorer proxy: " + message);
    }

    // Key and rate-limit failures come back in the account envelope shape
    if (RpcJson::optional_string(response, "status").value_or("") == "0") {
        std::string detail = response.contains("result") && response["result"].is_string()
            ? response["result"].get<std::string>()
            : RpcJson::optional_string(response, "message").value_or("NOTOK");
        throw BlockchainError("explorer proxy: " + detail);
    }

    auto result = response.find("result");
    if (result == response.end()) {
        throw ParseError("explorer proxy response has no result");
    }
    return *result;
}

nlohmann::json EtherscanClient::account_list(const std::string& action, const std::string& address) {
    return account_result(request("account", action, {
        {"address", address},
        {"startblock", "0"},
        {"endblock", "99999999"},
        {"sort", "desc"}
    }));
}

nlohmann::json EtherscanClient::proxy(const std::string& action, QueryParams params) {
    return proxy_result(request("proxy", action, std::move(params)));
}

uint64_t EtherscanClient::block_number() {
    return RpcJson::quantity(proxy("eth_blockNumber", {}), "eth_blockNumber");
}

uint256 EtherscanClient::get_balance(const std::string& address) {
    auto result = account_result(request("account", "balance", {
        {"address", address},
        {"tag", "latest"}
    }));
    if (!result.is_string()) {
        throw ParseError("explorer balance is not a string");
    }
    return util::decimal_to_u256(result.get<std::string>());
}

uint64_t EtherscanClient::get_transaction_count(const std::string& address) {
    return RpcJson::quantity(proxy("eth_getTransactionCount", {{"address", address}, {"tag", "latest"}}),
                             "eth_getTransactionCount");
}

std::string EtherscanClient::get_code(const std::string& address) {
    auto result = proxy("eth_getCode", {{"address", address}, {"tag", "latest"}});
    if (!result.is_string()) {
        throw ParseError("eth_getCode: expected hex data");
    }
    return result.get<std::string>();
}

std::optional<Block> EtherscanClient::get_block(uint64_t number, bool full_transactions) {
    auto result = proxy("eth_getBlockByNumber", {
        {"tag", util::u64_to_hex(number)},
        {"boolean", full_transactions ? "true" : "false"}
    });
    if (result.is_null()) return std::nullopt;
    return RpcJson::parse_block(result);
}

std::optional<Transaction> EtherscanClient::get_transaction(const std::string& hash) {
    auto result = proxy("eth_getTransactionByHash", {{"txhash", hash}});
    if (result.is_null()) return std::nullopt;
    return RpcJson::parse_transaction(result);
}

std::optional<Receipt> EtherscanClient::get_receipt(const std::string& hash) {
    auto result = proxy("eth_getTransactionReceipt", {{"txhash", hash}});
    if (result.is_null()) return std::nullopt;
    return RpcJson::parse_receipt(result);
}

uint64_t EtherscanClient::gas_price() {
    return RpcJson::quantity(proxy("eth_gasPrice", {}), "eth_gasPrice");
}

std::vector<AddressTx> EtherscanClient::get_address_transactions(const std::string& address) {
    auto txs = parse_address_transactions(account_list("txlist", address));
    spdlog::debug("Fetched {} transactions for {}", txs.size(), util::short_hex(address));
    return txs;
}

std::vector<TokenTransfer> EtherscanClient::get_token_transfers(const std::string& address) {
    auto transfers = parse_token_transfers(account_list("tokentx", address));
    spdlog::debug("Fetched {} token transfers for {}", transfers.size(), util::short_hex(address));
    return transfers;
}

std::vector<InternalTransaction> EtherscanClient::get_internal_transactions(const std::string& address) {
    return parse_internal_transactions(account_list("txlistinternal", address));
}

std::vector<InternalTransaction> EtherscanClient::get_internal_transactions_by_hash(const std::string& hash) {
    auto rows = account_result(request("account", "txlistinternal", {{"txhash", hash}}));
    return parse_internal_transactions(rows, hash);
}

std::vector<TokenBalance> EtherscanClient::get_token_balances(const std::string& address) {
    return parse_token_balances(account_result(request("account", "tokenlist", {{"address", address}})));
}

std::optional<ContractInfo> EtherscanClient::get_contract_info(const std::string& address) {
    auto rows = account_result(request("contract", "getsourcecode", {{"address", address}}));
    return parse_contract_info(address, rows);
}

std::string EtherscanClient::method_name(const nlohmann::json& row) {
    for (const char* key : {"functionName", "methodId", "method"}) {
        auto value = RpcJson::optional_string(row, key);
        if (value && !value->empty()) return *value;
    }

    // First four bytes of calldata: "0x" + 8 hex digits
    auto input = RpcJson::optional_string(row, "input");
    if (input && input->size() >= 10 && util::is_hex_string(input->substr(0, 10))) {
        return input->substr(0, 10);
    }
    return "";
}

std::vector<AddressTx> EtherscanClient::parse_address_transactions(const nlohmann::json& rows) {
    return parse_rows<AddressTx>(rows, "txlist", [](const nlohmann::json& row) {
        AddressTx tx;
        tx.hash = util::to_lower(text_field(row, "hash"));
        tx.block_number = number_field(row, "blockNumber");
        tx.timestamp = number_field(row, "timeStamp");
        tx.from = util::to_lower(text_field(row, "from"));
        tx.to = util::to_lower(text_field(row, "to"));
        tx.value_wei = amount_field(row, "value");
        tx.fee_wei = amount_field(row, "gasUsed") * amount_field(row, "gasPrice");
        tx.status = text_field(row, "isError") == "0" ? TxStatus::Success : TxStatus::Failed;
        tx.method = method_name(row);
        return tx;
    });
}

std::vector<TokenTransfer> EtherscanClient::parse_token_transfers(const nlohmann::json& rows) {
    return parse_rows<TokenTransfer>(rows, "tokentx", [](const nlohmann::json& row) {
        TokenTransfer t;
        t.tx_hash = util::to_lower(text_field(row, "hash"));
        t.from = util::to_lower(text_field(row, "from"));
        t.to = util::to_lower(text_field(row, "to"));
        t.contract_address = util::to_lower(text_field(row, "contractAddress"));
        t.value = amount_field(row, "value");
        t.timestamp = number_field(row, "timeStamp");
        t.block_number = util::parse_u64(text_or(row, "blockNumber", "0")).value_or(0);
        t.token_name = text_or(row, "tokenName", "Unknown");
        t.token_symbol = text_field(row, "tokenSymbol");
        t.token_decimals = decimals_or(row, "tokenDecimal", 18);
        auto token_id = RpcJson::optional_string(row, "tokenID");
        if (token_id && !token_id->empty()) {
            t.token_id = *token_id;
        }
        return t;
    });
}

std::vector<InternalTransaction> EtherscanClient::parse_internal_transactions(const nlohmann::json& rows,
                                                                              const std::string& parent_hash) {
    return parse_rows<InternalTransaction>(rows, "txlistinternal", [&parent_hash](const nlohmann::json& row) {
        InternalTransaction itx;
        // Rows of a by-hash query carry no hash of their own
        itx.parent_hash = util::to_lower(parent_hash.empty() ? text_field(row, "hash")
                                                             : text_or(row, "hash", parent_hash));
        itx.block_number = number_field(row, "blockNumber");
        itx.timestamp = number_field(row, "timeStamp");
        itx.from = util::to_lower(text_field(row, "from"));
        itx.to = util::to_lower(text_or(row, "to", ""));
        itx.value_wei = amount_field(row, "value");
        itx.gas_limit = number_field(row, "gas");
        itx.gas_used = number_field(row, "gasUsed");
        itx.call_type = text_or(row, "type", "call");
        itx.is_error = text_or(row, "isError", "0") != "0";
        return itx;
    });
}

std::vector<TokenBalance> EtherscanClient::parse_token_balances(const nlohmann::json& rows) {
    return parse_rows<TokenBalance>(rows, "tokenlist", [](const nlohmann::json& row) {
        TokenBalance b;
        b.contract_address = util::to_lower(text_field(row, "contractAddress"));
        b.name = text_field(row, "name");
        b.symbol = text_field(row, "symbol");
        b.decimals = decimals_or(row, "decimals", 18);
        b.balance = amount_field(row, "balance");
        return b;
    });
}

std::optional<ContractInfo> EtherscanClient::parse_contract_info(const std::string& address,
                                                                 const nlohmann::json& rows) {
    if (!rows.is_array()) {
        throw ParseError("getsourcecode: result is not a list");
    }
    if (rows.empty() || !rows[0].is_object()) {
        return std::nullopt;
    }

    const auto& row = rows[0];
    ContractInfo info;
    info.address = util::to_lower(address);
    info.last_updated = util::current_timestamp_s();

    std::string source = text_or(row, "SourceCode", "");
    info.is_verified = !source.empty();
    if (!info.is_verified) {
        return info;
    }

    info.source_code = source;
    info.name = text_or(row, "ContractName", "");
    info.compiler_version = text_or(row, "CompilerVersion", "");
    info.abi = text_or(row, "ABI", "");
    return info;
}
