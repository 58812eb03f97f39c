#include "rpc_json.hpp"
#include "errors.hpp"
#include "util.hpp"

uint64_t RpcJson::quantity(const nlohmann::json& value, const char* what) {
    if (!value.is_string()) {
        throw ParseError(std::string("expected hex quantity for ") + what);
    }
    return util::hex_to_u64(value.get<std::string>());
}

std::string RpcJson::require_string(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        throw ParseError(std::string("missing field '") + key + "'");
    }
    return it->get<std::string>();
}

std::optional<std::string> RpcJson::optional_string(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::optional<uint64_t> RpcJson::optional_quantity(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return std::nullopt;
    return quantity(*it, key);
}

Transaction RpcJson::parse_transaction(const nlohmann::json& obj) {
    if (!obj.is_object()) {
        throw ParseError("transaction is not an object");
    }

    Transaction tx;
    tx.hash = util::to_lower(require_string(obj, "hash"));
    tx.from = util::to_lower(require_string(obj, "from"));
    if (auto to = optional_string(obj, "to")) {
        tx.to = util::to_lower(*to);
    }

    tx.block_number = optional_quantity(obj, "blockNumber");
    tx.block_hash = optional_string(obj, "blockHash");
    tx.transaction_index = optional_quantity(obj, "transactionIndex");

    if (auto value = optional_string(obj, "value")) {
        tx.value_wei = util::hex_to_u256(*value);
    }
    tx.gas_limit = optional_quantity(obj, "gas").value_or(0);
    tx.gas_price = optional_quantity(obj, "gasPrice");
    tx.nonce = optional_quantity(obj, "nonce").value_or(0);
    tx.input = optional_string(obj, "input").value_or("0x");

    return tx;
}

Block RpcJson::parse_block(const nlohmann::json& obj) {
    if (!obj.is_object()) {
        throw ParseError("block is not an object");
    }

    Block block;
    auto number = optional_quantity(obj, "number");
    auto hash = optional_string(obj, "hash");
    if (!number || !hash) {
        throw ParseError("block is missing number or hash (pending block?)");
    }
    block.number = *number;
    block.hash = *hash;
    block.parent_hash = optional_string(obj, "parentHash").value_or("");
    block.timestamp = optional_quantity(obj, "timestamp").value_or(0);
    block.miner = util::to_lower(optional_string(obj, "miner").value_or(""));
    block.gas_used = optional_quantity(obj, "gasUsed").value_or(0);
    block.gas_limit = optional_quantity(obj, "gasLimit").value_or(0);
    block.base_fee_per_gas = optional_quantity(obj, "baseFeePerGas");

    auto txs = obj.find("transactions");
    if (txs != obj.end() && txs->is_array()) {
        for (const auto& entry : *txs) {
            if (entry.is_string()) {
                block.transaction_hashes.push_back(util::to_lower(entry.get<std::string>()));
            } else {
                Transaction tx = parse_transaction(entry);
                block.transaction_hashes.push_back(tx.hash);
                block.transactions.push_back(std::move(tx));
            }
        }
    }

    return block;
}

Receipt RpcJson::parse_receipt(const nlohmann::json& obj) {
    if (!obj.is_object()) {
        throw ParseError("receipt is not an object");
    }

    Receipt receipt;
    receipt.transaction_hash = util::to_lower(require_string(obj, "transactionHash"));
    receipt.block_number = optional_quantity(obj, "blockNumber");
    receipt.gas_used = quantity(obj.value("gasUsed", nlohmann::json()), "gasUsed");
    receipt.effective_gas_price = optional_quantity(obj, "effectiveGasPrice");
    if (auto status = optional_quantity(obj, "status")) {
        receipt.status = (*status == 1);
    }
    if (auto created = optional_string(obj, "contractAddress")) {
        receipt.contract_address = util::to_lower(*created);
    }

    return receipt;
}

nlohmann::json RpcJson::call_object(const CallRequest& request) {
    nlohmann::json obj = {{"to", request.to}};
    if (request.from) obj["from"] = *request.from;
    if (request.data) obj["data"] = *request.data;
    if (request.value_wei) obj["value"] = util::u256_to_hex(*request.value_wei);
    return obj;
}
