#include "cache_store.hpp"
#include <spdlog/spdlog.h>

namespace {

std::chrono::milliseconds seconds_ttl(int seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(seconds) * 1000);
}

CacheStore::Clock resolve_clock(CacheStore::Clock clock) {
    if (clock) return clock;
    return [] { return std::chrono::steady_clock::now(); };
}

} // namespace

CacheStore::CacheStore(const CacheConfig& config, Clock clock)
    : enabled_(config.enabled)
    , blocks_(config.max_entries, seconds_ttl(config.block_ttl), resolve_clock(clock))
    , transactions_(config.max_entries, seconds_ttl(config.transaction_ttl), resolve_clock(clock))
    , addresses_(config.max_entries, seconds_ttl(config.address_ttl), resolve_clock(clock))
    , contracts_(config.max_entries, seconds_ttl(config.contract_ttl), resolve_clock(clock))
    , tokens_(config.max_entries, seconds_ttl(config.token_ttl), resolve_clock(clock))
    , address_transactions_(config.max_entries, seconds_ttl(config.address_transactions_ttl),
                            resolve_clock(clock))
    , token_transfers_(config.max_entries, seconds_ttl(config.token_transfers_ttl), resolve_clock(clock))
    , internal_transactions_(config.max_entries, seconds_ttl(config.internal_transactions_ttl),
                             resolve_clock(clock))
    , token_balances_(config.max_entries, seconds_ttl(config.token_balances_ttl), resolve_clock(clock))
    , ens_names_(config.max_entries, seconds_ttl(config.ens_ttl), resolve_clock(clock))
{
    spdlog::debug("Cache store created (enabled={}, max_entries={})", config.enabled, config.max_entries);
}

void CacheStore::set_enabled(bool enabled) {
    enabled_ = enabled;
    spdlog::info("Cache {}", enabled ? "enabled" : "disabled");
}

template <typename Key, typename Value>
std::optional<Value> CacheStore::lookup(TtlLruCache<Key, Value>& cache, const Key& key) {
    if (!enabled_) return std::nullopt;
    return cache.get(key);
}

template <typename Key, typename Value>
void CacheStore::store(TtlLruCache<Key, Value>& cache, const Key& key, const Value& value) {
    if (!enabled_) return;
    cache.put(key, value);
}

std::optional<Block> CacheStore::get_block(uint64_t number) {
    return lookup(blocks_, number);
}

void CacheStore::put_block(uint64_t number, const Block& block) {
    store(blocks_, number, block);
}

std::optional<Transaction> CacheStore::get_transaction(const std::string& hash) {
    return lookup(transactions_, hash);
}

void CacheStore::put_transaction(const std::string& hash, const Transaction& tx) {
    store(transactions_, hash, tx);
}

std::optional<AddressInfo> CacheStore::get_address(const std::string& address) {
    return lookup(addresses_, address);
}

void CacheStore::put_address(const std::string& address, const AddressInfo& info) {
    store(addresses_, address, info);
}

std::optional<ContractInfo> CacheStore::get_contract(const std::string& address) {
    return lookup(contracts_, address);
}

void CacheStore::put_contract(const std::string& address, const ContractInfo& info) {
    store(contracts_, address, info);
}

std::optional<TokenInfo> CacheStore::get_token(const std::string& address) {
    return lookup(tokens_, address);
}

void CacheStore::put_token(const std::string& address, const TokenInfo& info) {
    store(tokens_, address, info);
}

std::optional<std::vector<AddressTx>> CacheStore::get_address_transactions(const std::string& address) {
    return lookup(address_transactions_, address);
}

void CacheStore::put_address_transactions(const std::string& address, const std::vector<AddressTx>& txs) {
    store(address_transactions_, address, txs);
}

std::optional<std::vector<TokenTransfer>> CacheStore::get_token_transfers(const std::string& address) {
    return lookup(token_transfers_, address);
}

void CacheStore::put_token_transfers(const std::string& address,
                                     const std::vector<TokenTransfer>& transfers) {
    store(token_transfers_, address, transfers);
}

std::optional<std::vector<InternalTransaction>> CacheStore::get_internal_transactions(const std::string& key) {
    return lookup(internal_transactions_, key);
}

void CacheStore::put_internal_transactions(const std::string& key,
                                           const std::vector<InternalTransaction>& txs) {
    store(internal_transactions_, key, txs);
}

std::optional<std::vector<TokenBalance>> CacheStore::get_token_balances(const std::string& address) {
    return lookup(token_balances_, address);
}

void CacheStore::put_token_balances(const std::string& address, const std::vector<TokenBalance>& balances) {
    store(token_balances_, address, balances);
}

std::optional<std::optional<std::string>> CacheStore::get_ens_name(const std::string& address) {
    return lookup(ens_names_, address);
}

void CacheStore::put_ens_name(const std::string& address, const std::optional<std::string>& name) {
    store(ens_names_, address, name);
}

void CacheStore::clear_all() {
    blocks_.clear();
    transactions_.clear();
    addresses_.clear();
    contracts_.clear();
    tokens_.clear();
    address_transactions_.clear();
    token_transfers_.clear();
    internal_transactions_.clear();
    token_balances_.clear();
    ens_names_.clear();
    spdlog::info("All caches cleared");
}

CacheStats CacheStore::stats() const {
    CacheStats s;
    s.blocks = blocks_.size();
    s.transactions = transactions_.size();
    s.addresses = addresses_.size();
    s.contracts = contracts_.size();
    s.tokens = tokens_.size();
    s.address_transactions = address_transactions_.size();
    s.token_transfers = token_transfers_.size();
    s.internal_transactions = internal_transactions_.size();
    s.token_balances = token_balances_.size();
    s.ens_names = ens_names_.size();
    s.total = s.blocks + s.transactions + s.addresses + s.contracts + s.tokens
            + s.address_transactions + s.token_transfers + s.internal_transactions
            + s.token_balances + s.ens_names;
    return s;
}
