#include "data_service.hpp"
#include "abi.hpp"
#include "detail_assembler.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <future>
#include <limits>

DataService::DataService(const Config& config,
                         std::shared_ptr<CacheStore> cache,
                         std::shared_ptr<RpcBackend> rpc,
                         std::shared_ptr<IndexedApiBackend> indexed)
    : config_(config)
    , cache_(std::move(cache))
    , rpc_(std::move(rpc))
    , indexed_(std::move(indexed))
    , ens_(rpc_)
{
    spdlog::info("Data service ready (primary source: {})",
                 prefers_indexed_api() ? indexed_->source_name() : rpc_->source_name());
}

bool DataService::prefers_indexed_api() const {
    return indexed_ && !config_.local_node;
}

ChainReader& DataService::preferred_reader() {
    if (prefers_indexed_api()) return *indexed_;
    return *rpc_;
}

template <typename T>
T DataService::read_with_fallback(const std::string& what, const std::function<T(ChainReader&)>& read) {
    if (!prefers_indexed_api()) {
        return read(*rpc_);
    }

    try {
        return read(*indexed_);
    } catch (const ValidationError&) {
        throw;
    } catch (const ExplorerError& e) {
        spdlog::warn("{} via {} failed, retrying via {}: {}",
                     what, indexed_->source_name(), rpc_->source_name(), e.what());
    }
    return read(*rpc_);
}

template <typename T>
std::vector<T> DataService::read_list(const std::string& what,
                                      const std::string& key,
                                      const std::function<std::optional<std::vector<T>>(const std::string&)>& cached,
                                      const std::function<void(const std::string&, const std::vector<T>&)>& store,
                                      const std::function<std::vector<T>(IndexedApiBackend&)>& fetch) {
    if (auto hit = cached(key)) {
        spdlog::debug("Cache hit: {} for {}", what, util::short_hex(key));
        return *hit;
    }

    if (!prefers_indexed_api()) {
        spdlog::debug("No indexed API available for {}", what);
        return {};
    }

    try {
        auto rows = fetch(*indexed_);
        store(key, rows);
        return rows;
    } catch (const ExplorerError& e) {
        spdlog::warn("Failed to fetch {} for {}: {}", what, util::short_hex(key), e.what());
        return {};
    }
}

AddressInfo DataService::get_address_info(const std::string& address) {
    util::require_address(address);
    std::string key = util::to_lower(address);

    if (auto cached = cache_->get_address(key)) {
        spdlog::debug("Cache hit: address info for {}", util::short_hex(key));
        return *cached;
    }

    ScopedTimer timer("address info " + util::short_hex(key));

    auto balance = std::async(std::launch::async, [this, &key] {
        return get_address_balance(key);
    });
    auto nonce = std::async(std::launch::async, [this, &key] {
        return read_with_fallback<uint64_t>("nonce", [&key](ChainReader& r) {
            return r.get_transaction_count(key);
        });
    });
    auto code = std::async(std::launch::async, [this, &key] {
        return read_with_fallback<std::string>("code", [&key](ChainReader& r) {
            return r.get_code(key);
        });
    });

    AddressInfo info;
    info.address = key;
    info.balance_wei = balance.get();
    info.transaction_count = nonce.get();
    info.is_contract = code.get().size() > 2;   // "0x" for accounts without code
    info.last_updated = util::current_timestamp_s();

    cache_->put_address(key, info);
    return info;
}

uint256 DataService::get_address_balance(const std::string& address) {
    util::require_address(address);
    std::string key = util::to_lower(address);

    return read_with_fallback<uint256>("balance", [&key](ChainReader& r) {
        return r.get_balance(key);
    });
}

std::vector<AddressTx> DataService::get_address_transactions(const std::string& address) {
    util::require_address(address);
    std::string key = util::to_lower(address);

    return read_list<AddressTx>("address transactions", key,
        [this](const std::string& k) { return cache_->get_address_transactions(k); },
        [this](const std::string& k, const std::vector<AddressTx>& v) { cache_->put_address_transactions(k, v); },
        [&key](IndexedApiBackend& api) { return api.get_address_transactions(key); });
}

std::vector<TokenTransfer> DataService::get_token_transfers(const std::string& address) {
    util::require_address(address);
    std::string key = util::to_lower(address);

    return read_list<TokenTransfer>("token transfers", key,
        [this](const std::string& k) { return cache_->get_token_transfers(k); },
        [this](const std::string& k, const std::vector<TokenTransfer>& v) { cache_->put_token_transfers(k, v); },
        [&key](IndexedApiBackend& api) { return api.get_token_transfers(key); });
}

std::vector<InternalTransaction> DataService::get_internal_transactions(const std::string& address) {
    util::require_address(address);
    std::string key = util::to_lower(address);

    return read_list<InternalTransaction>("internal transactions", key,
        [this](const std::string& k) { return cache_->get_internal_transactions(k); },
        [this](const std::string& k, const std::vector<InternalTransaction>& v) {
            cache_->put_internal_transactions(k, v);
        },
        [&key](IndexedApiBackend& api) { return api.get_internal_transactions(key); });
}

std::vector<InternalTransaction> DataService::get_internal_transactions_for_hash(const std::string& hash) {
    // Hashes and addresses differ in length, so they share one cache kind safely
    return read_list<InternalTransaction>("internal transactions", hash,
        [this](const std::string& k) { return cache_->get_internal_transactions(k); },
        [this](const std::string& k, const std::vector<InternalTransaction>& v) {
            cache_->put_internal_transactions(k, v);
        },
        [&hash](IndexedApiBackend& api) { return api.get_internal_transactions_by_hash(hash); });
}

std::vector<TokenBalance> DataService::get_token_balances(const std::string& address) {
    util::require_address(address);
    std::string key = util::to_lower(address);

    return read_list<TokenBalance>("token balances", key,
        [this](const std::string& k) { return cache_->get_token_balances(k); },
        [this](const std::string& k, const std::vector<TokenBalance>& v) { cache_->put_token_balances(k, v); },
        [&key](IndexedApiBackend& api) { return api.get_token_balances(key); });
}

std::optional<TransactionDetails> DataService::get_transaction_details(const std::string& hash) {
    util::require_tx_hash(hash);
    std::string key = util::to_lower(hash);

    ScopedTimer timer("transaction details " + util::short_hex(key));

    auto tx = cache_->get_transaction(key);
    if (!tx) {
        tx = read_with_fallback<std::optional<Transaction>>("transaction", [&key](ChainReader& r) {
            return r.get_transaction(key);
        });
        if (!tx) {
            spdlog::info("Transaction {} not found", util::short_hex(key));
            return std::nullopt;
        }
        // Pending transactions change once mined
        if (tx->block_number) {
            cache_->put_transaction(key, *tx);
        }
    }

    const Transaction& base = *tx;

    auto receipt = std::async(std::launch::async, [this, &key] {
        return read_with_fallback<std::optional<Receipt>>("receipt", [&key](ChainReader& r) {
            return r.get_receipt(key);
        });
    });
    auto head = std::async(std::launch::async, [this] {
        return read_with_fallback<uint64_t>("block number", [](ChainReader& r) {
            return r.block_number();
        });
    });
    auto timestamp = std::async(std::launch::async, [this, &base]() -> std::optional<uint64_t> {
        if (!base.block_number) return std::nullopt;
        try {
            if (auto block = get_block_by_number(*base.block_number)) {
                return block->timestamp;
            }
        } catch (const ExplorerError& e) {
            spdlog::warn("Block timestamp unavailable for {}: {}", util::short_hex(base.hash), e.what());
        }
        return std::nullopt;
    });
    auto sent = std::async(std::launch::async, [this, &base] {
        return get_token_transfers(base.from);
    });
    auto received = std::async(std::launch::async, [this, &base]() -> std::vector<TokenTransfer> {
        if (!base.to) return {};
        return get_token_transfers(*base.to);
    });
    auto internal = std::async(std::launch::async, [this, &key] {
        return get_internal_transactions_for_hash(key);
    });

    std::vector<TokenTransfer> token_transfers = sent.get();
    std::vector<TokenTransfer> incoming = received.get();
    token_transfers.insert(token_transfers.end(), incoming.begin(), incoming.end());

    return DetailAssembler::assemble(base, receipt.get(), head.get(), timestamp.get(),
                                     token_transfers, internal.get());
}

std::optional<Block> DataService::get_block_by_number(uint64_t number) {
    if (auto cached = cache_->get_block(number)) {
        spdlog::debug("Cache hit: block {}", number);
        return cached;
    }

    auto block = preferred_reader().get_block(number, false);
    if (block) {
        cache_->put_block(number, *block);
    }
    return block;
}

std::optional<Block> DataService::get_latest_block() {
    return get_block_by_number(get_block_number());
}

uint64_t DataService::get_block_number() {
    return preferred_reader().block_number();
}

uint64_t DataService::estimate_gas(const std::string& from,
                                  const std::string& to,
                                  const std::optional<std::string>& data,
                                  const std::optional<std::string>& value_wei) {
    util::require_address(from, "sender address");
    util::require_address(to, "recipient address");
    if (data && !util::is_hex_data(*data)) {
        throw ValidationError("calldata must be 0x-prefixed hex");
    }

    CallRequest request;
    request.from = util::to_lower(from);
    request.to = util::to_lower(to);
    request.data = data;
    if (value_wei) {
        try {
            request.value_wei = util::decimal_to_u256(*value_wei);
        } catch (const ParseError&) {
            throw ValidationError("value must be a decimal wei amount");
        }
    }
    return rpc_->estimate_gas(request);
}

GasPrices DataService::get_gas_prices() {
    uint64_t price = preferred_reader().gas_price();

    GasPrices prices;
    prices.standard = price;
    prices.slow = static_cast<uint64_t>(uint256{price} * 4 / 5);

    // Saturates for prices within a fifth of the 64-bit limit
    uint256 fast = uint256{price} * 6 / 5;
    prices.fast = fast > std::numeric_limits<uint64_t>::max() ? std::numeric_limits<uint64_t>::max()
                                                              : static_cast<uint64_t>(fast);
    prices.timestamp = util::current_timestamp_s();
    return prices;
}

std::optional<std::string> DataService::resolve_name(const std::string& address) {
    util::require_address(address);
    if (config_.chain_id != 1) {
        return std::nullopt;
    }

    std::string key = util::to_lower(address);
    if (auto cached = cache_->get_ens_name(key)) {
        return *cached;
    }

    auto name = ens_.lookup_address(key);
    cache_->put_ens_name(key, name);
    return name;
}

std::optional<ContractInfo> DataService::get_contract_info(const std::string& address) {
    util::require_address(address);
    std::string key = util::to_lower(address);

    if (auto cached = cache_->get_contract(key)) {
        return cached;
    }
    if (!prefers_indexed_api()) {
        return std::nullopt;
    }

    try {
        auto info = indexed_->get_contract_info(key);
        if (info) {
            cache_->put_contract(key, *info);
        }
        return info;
    } catch (const ExplorerError& e) {
        spdlog::warn("Failed to fetch contract info for {}: {}", util::short_hex(key), e.what());
        return std::nullopt;
    }
}

std::optional<std::string> DataService::call_data(const std::string& to, const char* selector) {
    CallRequest request;
    request.to = to;
    request.data = Abi::encode_call(selector);

    try {
        std::string result = rpc_->call(request);
        if (result.size() <= 2) return std::nullopt;
        return result;
    } catch (const BlockchainError& e) {
        // Optional ERC-20 getters revert on some tokens
        spdlog::debug("eth_call {} on {} reverted: {}", selector, util::short_hex(to), e.what());
        return std::nullopt;
    }
}

TokenInfo DataService::get_token_info(const std::string& contract_address) {
    util::require_address(contract_address, "token contract");
    std::string key = util::to_lower(contract_address);

    if (auto cached = cache_->get_token(key)) {
        return *cached;
    }

    TokenInfo info;
    info.contract_address = key;
    if (auto name = call_data(key, Abi::kSelectorTokenName)) {
        info.name = Abi::decode_string(*name);
    }
    if (auto symbol = call_data(key, Abi::kSelectorSymbol)) {
        info.symbol = Abi::decode_string(*symbol);
    }
    if (auto decimals = call_data(key, Abi::kSelectorDecimals)) {
        auto value = Abi::decode_uint(*decimals);
        if (value <= 255) {
            info.decimals = static_cast<unsigned>(value);
        }
    }
    if (auto supply = call_data(key, Abi::kSelectorTotalSupply)) {
        info.total_supply = Abi::decode_uint(*supply);
    }
    if (info.name.empty()) info.name = "Unknown";
    info.last_updated = util::current_timestamp_s();

    cache_->put_token(key, info);
    return info;
}

uint64_t DataService::test_connection() {
    uint64_t chain_id = rpc_->chain_id();
    if (chain_id != config_.chain_id) {
        spdlog::warn("Node reports chain {} but {} is configured", chain_id, config_.chain_id);
    }
    spdlog::info("Connected to {} (chain {})", config_.network_name, chain_id);
    return chain_id;
}

CacheStats DataService::cache_stats() const {
    return cache_->stats();
}

void DataService::clear_cache() {
    cache_->clear_all();
}
