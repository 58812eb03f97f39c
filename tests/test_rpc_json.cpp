#include <catch2/catch_test_macros.hpp>
#include "../src/errors.hpp"
#include "../src/rpc_client.hpp"
#include "../src/rpc_json.hpp"

using nlohmann::json;

namespace {

json tx_object() {
    return {
        {"hash", "0xAB12"},
        {"blockNumber", "0x10"},
        {"blockHash", "0xb10c"},
        {"transactionIndex", "0x0"},
        {"from", "0xAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA"},
        {"to", "0xbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb"},
        {"value", "0xde0b6b3a7640000"},
        {"gas", "0x5208"},
        {"gasPrice", "0x4a817c800"},
        {"nonce", "0x7"},
        {"input", "0x"}
    };
}

} // namespace

TEST_CASE("JSON-RPC envelope", "[rpc]") {
    SECTION("Result is unwrapped") {
        auto result = RpcClient::extract_result("eth_blockNumber", R"({"jsonrpc":"2.0","id":1,"result":"0x10"})");
        REQUIRE(result == "0x10");
    }

    SECTION("Null result is a valid answer") {
        auto result = RpcClient::extract_result("eth_getTransactionByHash",
                                                R"({"jsonrpc":"2.0","id":1,"result":null})");
        REQUIRE(result.is_null());
    }

    SECTION("Error object is a chain error") {
        REQUIRE_THROWS_AS(RpcClient::extract_result("eth_call",
            R"({"jsonrpc":"2.0","id":1,"error":{"code":3,"message":"execution reverted"}})"),
            BlockchainError);
    }

    SECTION("Malformed bodies are parse errors") {
        REQUIRE_THROWS_AS(RpcClient::extract_result("eth_chainId", "<html>bad gateway</html>"), ParseError);
        REQUIRE_THROWS_AS(RpcClient::extract_result("eth_chainId", "[1,2]"), ParseError);
        REQUIRE_THROWS_AS(RpcClient::extract_result("eth_chainId", R"({"jsonrpc":"2.0","id":1})"), ParseError);
    }
}

TEST_CASE("Transaction objects", "[rpc]") {
    SECTION("Mined transaction") {
        auto tx = RpcJson::parse_transaction(tx_object());
        REQUIRE(tx.hash == "0xab12");
        REQUIRE(tx.from == "0xaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa");
        REQUIRE(tx.block_number == 16u);
        REQUIRE(tx.value_wei == 1000000000000000000);
        REQUIRE(tx.gas_limit == 21000);
        REQUIRE(tx.gas_price == 20000000000u);
        REQUIRE(tx.nonce == 7);
    }

    SECTION("Pending transaction has no block") {
        json obj = tx_object();
        obj["blockNumber"] = nullptr;
        obj["blockHash"] = nullptr;
        obj["transactionIndex"] = nullptr;

        auto tx = RpcJson::parse_transaction(obj);
        REQUIRE_FALSE(tx.block_number);
        REQUIRE_FALSE(tx.block_hash);
        REQUIRE_FALSE(tx.transaction_index);
    }

    SECTION("Contract creation has no recipient") {
        json obj = tx_object();
        obj["to"] = nullptr;
        REQUIRE_FALSE(RpcJson::parse_transaction(obj).to);
    }

    SECTION("Missing sender is rejected") {
        json obj = tx_object();
        obj.erase("from");
        REQUIRE_THROWS_AS(RpcJson::parse_transaction(obj), ParseError);
    }
}

TEST_CASE("Block objects", "[rpc]") {
    json block = {
        {"number", "0x10"},
        {"hash", "0xb10c"},
        {"parentHash", "0xb10b"},
        {"timestamp", "0x6431a2c0"},
        {"miner", "0xCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCCC"},
        {"gasUsed", "0x5208"},
        {"gasLimit", "0x1c9c380"},
        {"baseFeePerGas", "0x3b9aca00"}
    };

    SECTION("Hash-only body") {
        block["transactions"] = json::array({"0xAB12", "0xcd34"});
        auto parsed = RpcJson::parse_block(block);
        REQUIRE(parsed.number == 16);
        REQUIRE(parsed.timestamp == 1680974528);
        REQUIRE(parsed.base_fee_per_gas == 1000000000u);
        REQUIRE(parsed.transaction_hashes == std::vector<std::string>{"0xab12", "0xcd34"});
        REQUIRE(parsed.transactions.empty());
    }

    SECTION("Full body") {
        json txs = json::array();
        txs.push_back(tx_object());
        block["transactions"] = txs;

        auto parsed = RpcJson::parse_block(block);
        REQUIRE(parsed.transactions.size() == 1);
        REQUIRE(parsed.transaction_hashes.size() == 1);
        REQUIRE(parsed.transactions[0].to == std::string("0xbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb"));
    }

    SECTION("Pending block is rejected") {
        block["number"] = nullptr;
        REQUIRE_THROWS_AS(RpcJson::parse_block(block), ParseError);
    }
}

TEST_CASE("Receipt objects", "[rpc]") {
    json receipt = {
        {"transactionHash", "0xAB12"},
        {"blockNumber", "0x10"},
        {"gasUsed", "0x5208"},
        {"effectiveGasPrice", "0x2540be400"},
        {"status", "0x0"},
        {"contractAddress", nullptr}
    };

    auto parsed = RpcJson::parse_receipt(receipt);
    REQUIRE(parsed.transaction_hash == "0xab12");
    REQUIRE(parsed.gas_used == 21000);
    REQUIRE(parsed.effective_gas_price == 10000000000u);
    REQUIRE(parsed.status == false);
    REQUIRE_FALSE(parsed.contract_address);

    receipt.erase("status");
    REQUIRE_FALSE(RpcJson::parse_receipt(receipt).status);
}

TEST_CASE("Call objects", "[rpc]") {
    CallRequest request;
    request.to = "0xbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb";
    request.value_wei = 1000;

    auto obj = RpcJson::call_object(request);
    REQUIRE(obj["to"] == request.to);
    REQUIRE(obj["value"] == "0x3e8");
    REQUIRE_FALSE(obj.contains("from"));
    REQUIRE_FALSE(obj.contains("data"));
}
