#pragma once

#include <intx/intx.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Amounts denominated in wei or raw token units are 256-bit; counters, gas
// and block numbers fit in 64 bits.
using intx::uint256;

struct Transaction {
    std::string hash;
    std::optional<uint64_t> block_number;   // nullopt while pending
    std::optional<std::string> block_hash;
    std::optional<uint64_t> transaction_index;
    std::string from;
    std::optional<std::string> to;          // nullopt for contract creation
    uint256 value_wei = 0;
    uint64_t gas_limit = 0;
    std::optional<uint64_t> gas_price;
    uint64_t nonce = 0;
    std::string input = "0x";
};

struct Receipt {
    std::string transaction_hash;
    std::optional<uint64_t> block_number;
    uint64_t gas_used = 0;
    std::optional<uint64_t> effective_gas_price;
    std::optional<bool> status;             // pre-Byzantium receipts carry no status
    std::optional<std::string> contract_address;
};

struct Block {
    uint64_t number = 0;
    std::string hash;
    std::string parent_hash;
    uint64_t timestamp = 0;
    std::string miner;
    uint64_t gas_used = 0;
    uint64_t gas_limit = 0;
    std::optional<uint64_t> base_fee_per_gas;
    std::vector<std::string> transaction_hashes;
    std::vector<Transaction> transactions;  // only when fetched with full bodies
};

struct AddressInfo {
    std::string address;
    uint256 balance_wei = 0;
    uint64_t transaction_count = 0;
    bool is_contract = false;
    uint64_t last_updated = 0;
};

enum class TxStatus {
    Pending,
    Success,
    Failed,
    Unknown
};

const char* to_string(TxStatus status);

struct AddressTx {
    std::string hash;
    std::string method;
    uint64_t block_number = 0;
    uint64_t timestamp = 0;
    std::string from;
    std::string to;
    uint256 value_wei = 0;
    uint256 fee_wei = 0;
    TxStatus status = TxStatus::Unknown;
};

struct TokenTransfer {
    std::string tx_hash;
    uint64_t block_number = 0;
    uint64_t timestamp = 0;
    std::string from;
    std::string to;
    std::string contract_address;
    std::string token_name;
    std::string token_symbol;
    unsigned token_decimals = 18;
    uint256 value = 0;                      // raw units
    std::optional<std::string> token_id;    // NFTs
};

struct InternalTransaction {
    std::string parent_hash;
    uint64_t block_number = 0;
    uint64_t timestamp = 0;
    std::string from;
    std::string to;
    uint256 value_wei = 0;
    uint64_t gas_limit = 0;
    uint64_t gas_used = 0;
    std::string call_type = "call";
    bool is_error = false;
};

struct TokenBalance {
    std::string contract_address;
    std::string name;
    std::string symbol;
    unsigned decimals = 18;
    uint256 balance = 0;                    // raw units
};

struct ContractInfo {
    std::string address;
    std::optional<std::string> name;
    std::optional<std::string> compiler_version;
    std::optional<std::string> source_code;
    std::optional<std::string> abi;
    bool is_verified = false;
    uint64_t last_updated = 0;
};

struct TokenInfo {
    std::string contract_address;
    std::string name;
    std::string symbol;
    unsigned decimals = 18;
    std::optional<uint256> total_supply;
    uint64_t last_updated = 0;
};

struct GasPrices {
    uint64_t slow = 0;
    uint64_t standard = 0;
    uint64_t fast = 0;
    uint64_t timestamp = 0;
};

struct CallRequest {
    std::optional<std::string> from;
    std::string to;
    std::optional<std::string> data;        // 0x-prefixed calldata
    std::optional<uint256> value_wei;
};

enum class TransferKind {
    Native,
    Token,
    Internal
};

struct TokenMeta {
    std::string contract_address;
    std::string name;
    std::string symbol;
    unsigned decimals = 18;
    std::optional<std::string> token_id;
};

struct Transfer {
    TransferKind kind = TransferKind::Native;
    std::string from;
    std::string to;
    uint256 value = 0;
    std::optional<TokenMeta> token;
};

struct TransactionDetails {
    Transaction transaction;
    std::optional<Receipt> receipt;
    TxStatus status = TxStatus::Unknown;
    uint64_t confirmations = 0;
    uint256 fee_wei = 0;
    std::optional<uint64_t> effective_gas_price;
    std::optional<uint64_t> timestamp;
    std::vector<Transfer> transfers;
};
