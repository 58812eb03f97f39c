#include "rpc_client.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "rpc_json.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

RpcClient::RpcClient(std::string rpc_url, std::shared_ptr<HttpClient> http, bool push_enabled)
    : rpc_url_(std::move(rpc_url))
    , http_(std::move(http))
    , push_enabled_(push_enabled)
{}

nlohmann::json RpcClient::extract_result(const std::string& method, const std::string& body) {
    nlohmann::json response;
    try {
        response = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(method + ": response is not JSON (" + e.what() + ")");
    }

    if (!response.is_object()) {
        throw ParseError(method + ": response is not a JSON object");
    }

    auto error = response.find("error");
    if (error != response.end() && !error->is_null()) {
        std::string message = error->is_object() ? error->value("message", error->dump())
                                                  : error->dump();
        throw BlockchainError(method + ": " + message);
    }

    auto result = response.find("result");
    if (result == response.end()) {
        throw ParseError(method + ": response has no result");
    }
    return *result;
}

nlohmann::json RpcClient::make_request(const std::string& method, const nlohmann::json& params) {
    ScopedTimer timer("rpc " + method);

    nlohmann::json payload = {
        {"jsonrpc", "2.0"},
        {"id", next_id_++},
        {"method", method},
        {"params", params}
    };

    HttpResponse response = http_->post_json(rpc_url_, payload.dump());
    if (!response.ok()) {
        spdlog::error("RPC request {} failed: HTTP {}", method, response.status);
        throw NetworkError(method + ": HTTP " + std::to_string(response.status));
    }

    return extract_result(method, response.body);
}

uint64_t RpcClient::chain_id() {
    return RpcJson::quantity(make_request("eth_chainId", nlohmann::json::array()), "eth_chainId");
}

uint64_t RpcClient::block_number() {
    return RpcJson::quantity(make_request("eth_blockNumber", nlohmann::json::array()), "eth_blockNumber");
}

uint256 RpcClient::get_balance(const std::string& address) {
    auto result = make_request("eth_getBalance", {address, "latest"});
    if (!result.is_string()) {
        throw ParseError("eth_getBalance: expected hex quantity");
    }
    return util::hex_to_u256(result.get<std::string>());
}

uint64_t RpcClient::get_transaction_count(const std::string& address) {
    return RpcJson::quantity(make_request("eth_getTransactionCount", {address, "latest"}),
                             "eth_getTransactionCount");
}

std::string RpcClient::get_code(const std::string& address) {
    auto result = make_request("eth_getCode", {address, "latest"});
    if (!result.is_string()) {
        throw ParseError("eth_getCode: expected hex data");
    }
    return result.get<std::string>();
}

std::optional<Block> RpcClient::get_block(uint64_t number, bool full_transactions) {
    auto result = make_request("eth_getBlockByNumber", {util::u64_to_hex(number), full_transactions});
    if (result.is_null()) return std::nullopt;
    return RpcJson::parse_block(result);
}

std::optional<Block> RpcClient::get_block_by_hash(const std::string& hash, bool full_transactions) {
    auto result = make_request("eth_getBlockByHash", {hash, full_transactions});
    if (result.is_null()) return std::nullopt;
    return RpcJson::parse_block(result);
}

std::optional<Transaction> RpcClient::get_transaction(const std::string& hash) {
    auto result = make_request("eth_getTransactionByHash", nlohmann::json::array({hash}));
    if (result.is_null()) return std::nullopt;
    return RpcJson::parse_transaction(result);
}

std::optional<Receipt> RpcClient::get_receipt(const std::string& hash) {
    auto result = make_request("eth_getTransactionReceipt", nlohmann::json::array({hash}));
    if (result.is_null()) return std::nullopt;
    return RpcJson::parse_receipt(result);
}

uint64_t RpcClient::gas_price() {
    return RpcJson::quantity(make_request("eth_gasPrice", nlohmann::json::array()), "eth_gasPrice");
}

uint64_t RpcClient::estimate_gas(const CallRequest& request) {
    return RpcJson::quantity(make_request("eth_estimateGas", nlohmann::json::array({RpcJson::call_object(request)})),
                             "eth_estimateGas");
}

std::string RpcClient::call(const CallRequest& request) {
    auto result = make_request("eth_call", {RpcJson::call_object(request), "latest"});
    if (!result.is_string()) {
        throw ParseError("eth_call: expected hex data");
    }
    return result.get<std::string>();
}

std::string RpcClient::new_block_filter() {
    auto result = make_request("eth_newBlockFilter", nlohmann::json::array());
    if (!result.is_string()) {
        throw ParseError("eth_newBlockFilter: expected filter id");
    }
    return result.get<std::string>();
}

std::string RpcClient::new_pending_transaction_filter() {
    auto result = make_request("eth_newPendingTransactionFilter", nlohmann::json::array());
    if (!result.is_string()) {
        throw ParseError("eth_newPendingTransactionFilter: expected filter id");
    }
    return result.get<std::string>();
}

std::vector<std::string> RpcClient::get_filter_changes(const std::string& filter_id) {
    auto result = make_request("eth_getFilterChanges", nlohmann::json::array({filter_id}));
    if (!result.is_array()) {
        throw ParseError("eth_getFilterChanges: expected array");
    }

    std::vector<std::string> hashes;
    for (const auto& entry : result) {
        if (entry.is_string()) {
            hashes.push_back(util::to_lower(entry.get<std::string>()));
        }
    }
    return hashes;
}

void RpcClient::uninstall_filter(const std::string& filter_id) {
    auto result = make_request("eth_uninstallFilter", nlohmann::json::array({filter_id}));
    if (result.is_boolean() && !result.get<bool>()) {
        spdlog::debug("Filter {} was already gone", filter_id);
    }
}
