#include <catch2/catch_test_macros.hpp>
#include "../src/errors.hpp"
#include "../src/etherscan_client.hpp"

using nlohmann::json;

namespace {

json tx_row(const std::string& hash) {
    return {
        {"hash", hash},
        {"blockNumber", "17000000"},
        {"timeStamp", "1681000000"},
        {"from", "0xAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA"},
        {"to", "0xbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb"},
        {"value", "1000000000000000000"},
        {"gasUsed", "21000"},
        {"gasPrice", "20000000000"},
        {"isError", "0"},
        {"input", "0x"}
    };
}

} // namespace

TEST_CASE("Explorer envelopes", "[etherscan]") {
    SECTION("Status 1 returns the result") {
        json response = {{"status", "1"}, {"message", "OK"}, {"result", json::array({1, 2})}};
        REQUIRE(EtherscanClient::account_result(response).size() == 2);
    }

    SECTION("Empty list markers become an empty list") {
        json response = {{"status", "0"}, {"message", "No transactions found"}, {"result", json::array()}};
        REQUIRE(EtherscanClient::account_result(response).empty());

        json marker = {{"status", "0"}, {"message", "NOTOK"}, {"result", "No records found"}};
        auto result = EtherscanClient::account_result(marker);
        REQUIRE(result.is_array());
        REQUIRE(result.empty());
    }

    SECTION("Errors are reported") {
        json bad_key = {{"status", "0"}, {"message", "NOTOK"}, {"result", "Invalid API Key"}};
        REQUIRE_THROWS_AS(EtherscanClient::account_result(bad_key), BlockchainError);

        json no_result = {{"status", "1"}, {"message", "OK"}};
        REQUIRE_THROWS_AS(EtherscanClient::account_result(no_result), ParseError);
    }

    SECTION("Proxy responses") {
        json ok = {{"jsonrpc", "2.0"}, {"id", 1}, {"result", "0x10"}};
        REQUIRE(EtherscanClient::proxy_result(ok) == "0x10");

        json error = {{"jsonrpc", "2.0"}, {"id", 1}, {"error", {{"code", -32000}, {"message", "boom"}}}};
        REQUIRE_THROWS_AS(EtherscanClient::proxy_result(error), BlockchainError);

        json rate_limited = {{"status", "0"}, {"message", "NOTOK"}, {"result", "Max rate limit reached"}};
        REQUIRE_THROWS_AS(EtherscanClient::proxy_result(rate_limited), BlockchainError);

        json null_result = {{"jsonrpc", "2.0"}, {"id", 1}, {"result", nullptr}};
        REQUIRE(EtherscanClient::proxy_result(null_result).is_null());
    }
}

TEST_CASE("Address transaction rows", "[etherscan]") {
    SECTION("Fee, status and lowercase addresses") {
        json rows = json::array({tx_row("0xABC")});
        rows[0]["isError"] = "1";

        auto txs = EtherscanClient::parse_address_transactions(rows);
        REQUIRE(txs.size() == 1);
        REQUIRE(txs[0].hash == "0xabc");
        REQUIRE(txs[0].from == "0xaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa");
        REQUIRE(txs[0].block_number == 17000000);
        REQUIRE(txs[0].fee_wei == 420000000000000);
        REQUIRE(txs[0].value_wei == 1000000000000000000);
        REQUIRE(txs[0].status == TxStatus::Failed);
    }

    SECTION("Malformed rows are dropped") {
        json broken = tx_row("0x2");
        broken.erase("blockNumber");
        json not_numeric = tx_row("0x3");
        not_numeric["value"] = "lots";

        json rows = json::array({tx_row("0x1"), broken, not_numeric, "garbage"});
        auto txs = EtherscanClient::parse_address_transactions(rows);
        REQUIRE(txs.size() == 1);
        REQUIRE(txs[0].hash == "0x1");
    }

    SECTION("Non-list result is a parse error") {
        REQUIRE_THROWS_AS(EtherscanClient::parse_address_transactions(json::object()), ParseError);
    }
}

TEST_CASE("Method name fallback order", "[etherscan]") {
    json row = tx_row("0x1");

    SECTION("Function name wins") {
        row["functionName"] = "transfer(address to, uint256 amount)";
        row["methodId"] = "0xa9059cbb";
        REQUIRE(EtherscanClient::method_name(row) == "transfer(address to, uint256 amount)");
    }

    SECTION("Empty function name falls through to method id") {
        row["functionName"] = "";
        row["methodId"] = "0xa9059cbb";
        REQUIRE(EtherscanClient::method_name(row) == "0xa9059cbb");
    }

    SECTION("Calldata prefix as last resort") {
        row["input"] = "0x095ea7b3000000000000000000000000";
        REQUIRE(EtherscanClient::method_name(row) == "0x095ea7b3");
    }

    SECTION("Plain transfers have no method") {
        REQUIRE(EtherscanClient::method_name(row).empty());
    }
}

TEST_CASE("Token transfer rows", "[etherscan]") {
    json row = {
        {"hash", "0x1"},
        {"timeStamp", "1681000000"},
        {"from", "0xaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa"},
        {"to", "0xbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb"},
        {"contractAddress", "0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48"},
        {"value", "2500000"},
        {"tokenSymbol", "USDC"},
        {"tokenDecimal", "6"}
    };

    SECTION("Defaults for missing metadata") {
        auto transfers = EtherscanClient::parse_token_transfers(json::array({row}));
        REQUIRE(transfers.size() == 1);
        REQUIRE(transfers[0].token_name == "Unknown");
        REQUIRE(transfers[0].token_decimals == 6);
        REQUIRE(transfers[0].contract_address == "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48");
        REQUIRE(transfers[0].block_number == 0);
        REQUIRE_FALSE(transfers[0].token_id);
    }

    SECTION("Missing decimals default to 18 and NFT ids are kept") {
        row.erase("tokenDecimal");
        row["tokenID"] = "42";
        auto transfers = EtherscanClient::parse_token_transfers(json::array({row}));
        REQUIRE(transfers[0].token_decimals == 18);
        REQUIRE(transfers[0].token_id == std::string("42"));
    }
}

TEST_CASE("Internal transaction rows", "[etherscan]") {
    json row = {
        {"blockNumber", "17000000"},
        {"timeStamp", "1681000000"},
        {"from", "0xaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa"},
        {"to", "0xbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb"},
        {"value", "5"},
        {"gas", "2300"},
        {"gasUsed", "0"},
        {"isError", "0"}
    };

    SECTION("By-hash rows take the queried hash") {
        auto txs = EtherscanClient::parse_internal_transactions(json::array({row}), "0xFEED");
        REQUIRE(txs.size() == 1);
        REQUIRE(txs[0].parent_hash == "0xfeed");
        REQUIRE(txs[0].call_type == "call");
        REQUIRE_FALSE(txs[0].is_error);
    }

    SECTION("By-address rows need their own hash") {
        REQUIRE(EtherscanClient::parse_internal_transactions(json::array({row})).empty());

        row["hash"] = "0xbeef";
        row["type"] = "delegatecall";
        row["isError"] = "1";
        auto txs = EtherscanClient::parse_internal_transactions(json::array({row}));
        REQUIRE(txs.size() == 1);
        REQUIRE(txs[0].parent_hash == "0xbeef");
        REQUIRE(txs[0].call_type == "delegatecall");
        REQUIRE(txs[0].is_error);
    }
}

TEST_CASE("Contract source rows", "[etherscan]") {
    std::string address = "0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48";

    SECTION("Unverified contract") {
        json row = {{"SourceCode", ""}, {"ContractName", ""}};
        json rows = json::array();
        rows.push_back(row);
        auto info = EtherscanClient::parse_contract_info(address, rows);
        REQUIRE(info);
        REQUIRE_FALSE(info->is_verified);
        REQUIRE_FALSE(info->name);
        REQUIRE(info->address == "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48");
    }

    SECTION("Verified contract") {
        json row = {
            {"SourceCode", "contract X {}"},
            {"ContractName", "FiatTokenProxy"},
            {"CompilerVersion", "v0.4.24+commit.e67f0147"},
            {"ABI", "[]"}
        };
        json rows = json::array();
        rows.push_back(row);
        auto info = EtherscanClient::parse_contract_info(address, rows);
        REQUIRE(info->is_verified);
        REQUIRE(info->name == std::string("FiatTokenProxy"));
        REQUIRE(info->abi == std::string("[]"));
    }

    SECTION("No rows") {
        REQUIRE_FALSE(EtherscanClient::parse_contract_info(address, json::array()));
    }
}

TEST_CASE("Explorer chain mapping", "[etherscan]") {
    REQUIRE(etherscan_chain_from_id(1) == EtherscanChain::Ethereum);
    REQUIRE(etherscan_chain_from_id(11155111) == EtherscanChain::Sepolia);
    REQUIRE(etherscan_chain_from_id(8453) == EtherscanChain::Base);
    REQUIRE(etherscan_chain_from_id(31337) == EtherscanChain::Custom);
    REQUIRE(std::string(etherscan_chain_name(EtherscanChain::Polygon)) == "Polygon");
}
