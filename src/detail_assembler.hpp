#pragma once

#include "types.hpp"
#include <optional>
#include <vector>

// Builds the transaction detail view from independently fetched pieces.
class DetailAssembler {
public:
    static TransactionDetails assemble(const Transaction& tx,
                                       const std::optional<Receipt>& receipt,
                                       uint64_t current_block,
                                       std::optional<uint64_t> block_timestamp,
                                       const std::vector<TokenTransfer>& token_transfers,
                                       const std::vector<InternalTransaction>& internal_txs);

    // max(0, current_block - tx_block); pending transactions have none.
    static uint64_t confirmations(uint64_t current_block, std::optional<uint64_t> tx_block);

    static TxStatus status(const Transaction& tx, const std::optional<Receipt>& receipt);

    // Native value first (when non-zero), then token transfers of this hash
    // with duplicates removed, then internal transfers of this hash.
    static std::vector<Transfer> transfers(const Transaction& tx,
                                           const std::vector<TokenTransfer>& token_transfers,
                                           const std::vector<InternalTransaction>& internal_txs);
};
