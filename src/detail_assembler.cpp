#include "detail_assembler.hpp"
#include "util.hpp"
#include <set>
#include <tuple>

const char* to_string(TxStatus status) {
    switch (status) {
        case TxStatus::Pending: return "pending";
        case TxStatus::Success: return "success";
        case TxStatus::Failed: return "failed";
        case TxStatus::Unknown: break;
    }
    return "unknown";
}

uint64_t DetailAssembler::confirmations(uint64_t current_block, std::optional<uint64_t> tx_block) {
    if (!tx_block || current_block <= *tx_block) return 0;
    return current_block - *tx_block;
}

TxStatus DetailAssembler::status(const Transaction& tx, const std::optional<Receipt>& receipt) {
    if (!receipt) {
        return tx.block_number ? TxStatus::Unknown : TxStatus::Pending;
    }
    if (!receipt->status) return TxStatus::Unknown;
    return *receipt->status ? TxStatus::Success : TxStatus::Failed;
}

std::vector<Transfer> DetailAssembler::transfers(const Transaction& tx,
                                                 const std::vector<TokenTransfer>& token_transfers,
                                                 const std::vector<InternalTransaction>& internal_txs) {
    std::vector<Transfer> out;

    if (tx.value_wei != 0) {
        Transfer native;
        native.kind = TransferKind::Native;
        native.from = tx.from;
        native.to = tx.to.value_or("");
        native.value = tx.value_wei;
        out.push_back(std::move(native));
    }

    // The sender and receiver lists overlap whenever both sides are queried
    std::set<std::tuple<std::string, std::string, std::string, std::string, std::string>> seen;
    for (const auto& t : token_transfers) {
        if (!util::equals_ignore_case(t.tx_hash, tx.hash)) continue;

        auto key = std::make_tuple(util::to_lower(t.contract_address), util::to_lower(t.from),
                                   util::to_lower(t.to), intx::to_string(t.value), t.token_id.value_or(""));
        if (!seen.insert(key).second) continue;

        Transfer transfer;
        transfer.kind = TransferKind::Token;
        transfer.from = t.from;
        transfer.to = t.to;
        transfer.value = t.value;
        transfer.token = TokenMeta{t.contract_address, t.token_name, t.token_symbol,
                                   t.token_decimals, t.token_id};
        out.push_back(std::move(transfer));
    }

    for (const auto& itx : internal_txs) {
        if (!util::equals_ignore_case(itx.parent_hash, tx.hash)) continue;

        Transfer transfer;
        transfer.kind = TransferKind::Internal;
        transfer.from = itx.from;
        transfer.to = itx.to;
        transfer.value = itx.value_wei;
        out.push_back(std::move(transfer));
    }

    return out;
}

TransactionDetails DetailAssembler::assemble(const Transaction& tx,
                                             const std::optional<Receipt>& receipt,
                                             uint64_t current_block,
                                             std::optional<uint64_t> block_timestamp,
                                             const std::vector<TokenTransfer>& token_transfers,
                                             const std::vector<InternalTransaction>& internal_txs) {
    TransactionDetails details;
    details.transaction = tx;
    details.receipt = receipt;
    details.status = status(tx, receipt);
    details.confirmations = confirmations(current_block, tx.block_number);
    details.timestamp = block_timestamp;

    if (receipt) {
        details.effective_gas_price = receipt->effective_gas_price ? receipt->effective_gas_price
                                                                   : tx.gas_price;
        if (details.effective_gas_price) {
            details.fee_wei = uint256{receipt->gas_used} * uint256{*details.effective_gas_price};
        }
    }

    details.transfers = transfers(tx, token_transfers, internal_txs);
    return details;
}
