#include <catch2/catch_test_macros.hpp>
#include "../src/detail_assembler.hpp"

namespace {

const std::string kHash = "0x" + std::string(64, 'a');
const std::string kAlice = "0x" + std::string(40, 'a');
const std::string kBob = "0x" + std::string(40, 'b');
const std::string kToken = "0x" + std::string(40, 'c');

Transaction mined_tx() {
    Transaction tx;
    tx.hash = kHash;
    tx.block_number = 100;
    tx.from = kAlice;
    tx.to = kBob;
    tx.value_wei = 1000;
    tx.gas_price = 30;
    return tx;
}

TokenTransfer token_transfer(const std::string& hash, uint64_t value) {
    TokenTransfer t;
    t.tx_hash = hash;
    t.from = kAlice;
    t.to = kBob;
    t.contract_address = kToken;
    t.token_symbol = "TKN";
    t.token_decimals = 6;
    t.value = value;
    return t;
}

} // namespace

TEST_CASE("Confirmations and status", "[details]") {
    REQUIRE(DetailAssembler::confirmations(110, 100) == 10);
    REQUIRE(DetailAssembler::confirmations(100, 100) == 0);
    REQUIRE(DetailAssembler::confirmations(90, 100) == 0);   // lagging head
    REQUIRE(DetailAssembler::confirmations(110, std::nullopt) == 0);

    Transaction pending = mined_tx();
    pending.block_number = std::nullopt;
    REQUIRE(DetailAssembler::status(pending, std::nullopt) == TxStatus::Pending);
    REQUIRE(DetailAssembler::status(mined_tx(), std::nullopt) == TxStatus::Unknown);

    Receipt receipt;
    receipt.status = false;
    REQUIRE(DetailAssembler::status(mined_tx(), receipt) == TxStatus::Failed);
    receipt.status = true;
    REQUIRE(DetailAssembler::status(mined_tx(), receipt) == TxStatus::Success);
    receipt.status = std::nullopt;
    REQUIRE(DetailAssembler::status(mined_tx(), receipt) == TxStatus::Unknown);
}

TEST_CASE("Transfer list", "[details]") {
    SECTION("Native first, then tokens, then internal") {
        InternalTransaction itx;
        itx.parent_hash = kHash;
        itx.from = kBob;
        itx.to = kAlice;
        itx.value_wei = 5;

        auto transfers = DetailAssembler::transfers(mined_tx(), {token_transfer(kHash, 7)}, {itx});
        REQUIRE(transfers.size() == 3);
        REQUIRE(transfers[0].kind == TransferKind::Native);
        REQUIRE(transfers[0].value == 1000);
        REQUIRE(transfers[1].kind == TransferKind::Token);
        REQUIRE(transfers[1].token->symbol == "TKN");
        REQUIRE(transfers[1].token->decimals == 6);
        REQUIRE(transfers[2].kind == TransferKind::Internal);
        REQUIRE(transfers[2].value == 5);
    }

    SECTION("Zero value has no native entry") {
        Transaction tx = mined_tx();
        tx.value_wei = 0;
        REQUIRE(DetailAssembler::transfers(tx, {}, {}).empty());
    }

    SECTION("Same transfer seen from both sides is listed once") {
        auto sent = token_transfer(kHash, 7);
        auto received = sent;
        received.from = "0x" + std::string(40, 'A');   // same sender, checksummed
        std::vector<TokenTransfer> both{sent, received, token_transfer(kHash, 8)};

        auto transfers = DetailAssembler::transfers(mined_tx(), both, {});
        REQUIRE(transfers.size() == 3);   // native + two distinct token transfers
    }

    SECTION("Other transactions are ignored") {
        std::string other = "0x" + std::string(64, 'f');
        InternalTransaction itx;
        itx.parent_hash = other;
        auto transfers = DetailAssembler::transfers(mined_tx(), {token_transfer(other, 7)}, {itx});
        REQUIRE(transfers.size() == 1);
    }
}

TEST_CASE("Fee computation", "[details]") {
    Receipt receipt;
    receipt.transaction_hash = kHash;
    receipt.gas_used = 21000;
    receipt.status = true;

    SECTION("Effective price from the receipt") {
        receipt.effective_gas_price = 12;
        auto details = DetailAssembler::assemble(mined_tx(), receipt, 110, 1700000000, {}, {});
        REQUIRE(details.fee_wei == 252000);
        REQUIRE(details.effective_gas_price == 12u);
        REQUIRE(details.confirmations == 10);
        REQUIRE(details.timestamp == 1700000000u);
    }

    SECTION("Legacy receipts fall back to the transaction price") {
        auto details = DetailAssembler::assemble(mined_tx(), receipt, 110, std::nullopt, {}, {});
        REQUIRE(details.fee_wei == 630000);
    }

    SECTION("No receipt, no fee") {
        auto details = DetailAssembler::assemble(mined_tx(), std::nullopt, 110, std::nullopt, {}, {});
        REQUIRE(details.fee_wei == 0);
        REQUIRE_FALSE(details.effective_gas_price);
    }
}
