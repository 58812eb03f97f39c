#include "subscription_manager.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace {

const char* kind_name(SubscriptionKind kind) {
    switch (kind) {
        case SubscriptionKind::NewBlocks: return "blocks";
        case SubscriptionKind::AddressActivity: return "address";
        case SubscriptionKind::PendingTransactions: return "pending";
    }
    return "unknown";
}

// Uninstalls a node-side filter when the task leaves its loop.
class FilterGuard {
public:
    FilterGuard(std::shared_ptr<RpcBackend> rpc, std::string filter_id)
        : rpc_(std::move(rpc))
        , filter_id_(std::move(filter_id))
    {}

    ~FilterGuard() {
        try {
            rpc_->uninstall_filter(filter_id_);
        } catch (const std::exception& e) {
            spdlog::debug("Failed to uninstall filter {}: {}", filter_id_, e.what());
        }
    }

    FilterGuard(const FilterGuard&) = delete;
    FilterGuard& operator=(const FilterGuard&) = delete;

private:
    std::shared_ptr<RpcBackend> rpc_;
    std::string filter_id_;
};

} // namespace

void SubscriptionManager::TaskState::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        cancelled = true;
    }
    cv.notify_all();
}

bool SubscriptionManager::TaskState::sleep_for(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait_for(lock, interval, [this] { return cancelled.load(); });
    return !cancelled;
}

bool SubscriptionManager::TaskState::push_unless_cancelled(EventQueue& queue, Event event) {
    std::lock_guard<std::mutex> lock(mutex);
    if (cancelled) return false;
    queue.push(std::move(event));
    return true;
}

class SubscriptionManager::Task {
public:
    Task(std::string id,
         SubscriptionKind kind,
         std::string address,
         std::shared_ptr<RpcBackend> rpc,
         std::shared_ptr<EventQueue> events,
         std::shared_ptr<TaskState> state,
         SubscriptionOptions options)
        : id_(std::move(id))
        , kind_(kind)
        , address_(std::move(address))
        , rpc_(std::move(rpc))
        , events_(std::move(events))
        , state_(std::move(state))
        , options_(options)
    {}

    void run() {
        try {
            bool push = rpc_->supports_push();
            switch (kind_) {
                case SubscriptionKind::NewBlocks:
                    if (push) {
                        watch_blocks_push();
                    } else {
                        watch_blocks_poll();
                    }
                    break;
                case SubscriptionKind::AddressActivity:
                    if (push) {
                        watch_address_push();
                    } else {
                        watch_address_poll();
                    }
                    break;
                case SubscriptionKind::PendingTransactions:
                    watch_pending();
                    break;
            }
        } catch (const std::exception& e) {
            if (cancelled()) {
                spdlog::debug("Subscription {} interrupted: {}", id_, e.what());
            } else {
                spdlog::error("Subscription {} failed: {}", id_, e.what());
                emit(SubscriptionErrorEvent{id_, e.what()});
            }
        }
        state_->finished = true;
    }

private:
    bool cancelled() const {
        return state_->cancelled.load();
    }

    bool emit(Event event) {
        return state_->push_unless_cancelled(*events_, std::move(event));
    }

    void watch_blocks_push() {
        std::string filter = rpc_->new_block_filter();
        FilterGuard guard(rpc_, filter);
        spdlog::debug("Subscription {} using block filter {}", id_, filter);

        while (state_->sleep_for(options_.filter_poll_interval)) {
            for (const auto& hash : rpc_->get_filter_changes(filter)) {
                if (cancelled()) return;
                auto block = rpc_->get_block_by_hash(hash, false);
                if (block) {
                    emit(NewBlockEvent{id_, block->number, block->hash});
                }
            }
        }
    }

    void watch_blocks_poll() {
        uint64_t last_seen = rpc_->block_number();

        while (state_->sleep_for(options_.block_poll_interval)) {
            uint64_t head = rpc_->block_number();
            if (head <= last_seen) continue;

            // Only the newest head is reported; skipped blocks are not backfilled
            auto block = rpc_->get_block(head, false);
            if (!block) {
                // Head announced before the node serves it; retried next tick
                continue;
            }
            emit(NewBlockEvent{id_, head, block->hash});
            last_seen = head;
        }
    }

    void watch_address_push() {
        std::string filter = rpc_->new_block_filter();
        FilterGuard guard(rpc_, filter);
        spdlog::debug("Subscription {} using block filter {} for {}", id_, filter, util::short_hex(address_));

        while (state_->sleep_for(options_.filter_poll_interval)) {
            for (const auto& hash : rpc_->get_filter_changes(filter)) {
                if (cancelled()) return;
                auto block = rpc_->get_block_by_hash(hash, true);
                if (block && !emit_matching(*block)) return;
            }
        }
    }

    void watch_address_poll() {
        uint64_t last_seen = rpc_->block_number();

        while (state_->sleep_for(options_.address_poll_interval)) {
            uint64_t head = rpc_->block_number();

            for (uint64_t number = last_seen + 1; number <= head; ++number) {
                if (cancelled()) return;
                auto block = rpc_->get_block(number, true);
                if (block && !emit_matching(*block)) return;
            }
            last_seen = std::max(last_seen, head);
        }
    }

    void watch_pending() {
        if (!rpc_->supports_push()) {
            emit(SubscriptionErrorEvent{id_, "pending transactions require a push-capable connection"});
            return;
        }

        std::string filter = rpc_->new_pending_transaction_filter();
        FilterGuard guard(rpc_, filter);

        while (state_->sleep_for(options_.filter_poll_interval)) {
            for (const auto& hash : rpc_->get_filter_changes(filter)) {
                if (cancelled()) return;
                auto tx = rpc_->get_transaction(hash);
                if (tx) {
                    emit(PendingTransactionEvent{id_, *tx});
                }
            }
        }
    }

    // false once cancelled
    bool emit_matching(const Block& block) {
        for (const auto& tx : block.transactions) {
            bool matches = util::equals_ignore_case(tx.from, address_)
                        || (tx.to && util::equals_ignore_case(*tx.to, address_));
            if (matches && !emit(NewAddressTransactionEvent{id_, address_, tx, block.number})) {
                return false;
            }
        }
        return !cancelled();
    }

    std::string id_;
    SubscriptionKind kind_;
    std::string address_;
    std::shared_ptr<RpcBackend> rpc_;
    std::shared_ptr<EventQueue> events_;
    std::shared_ptr<TaskState> state_;
    SubscriptionOptions options_;
};

SubscriptionManager::SubscriptionManager(std::shared_ptr<RpcBackend> rpc, SubscriptionOptions options)
    : rpc_(std::move(rpc))
    , options_(options)
    , events_(std::make_shared<EventQueue>())
{}

SubscriptionManager::~SubscriptionManager() {
    unsubscribe_all();

    std::vector<Subscription> retired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        retired.swap(retired_);
    }
    for (auto& sub : retired) {
        if (sub.worker.joinable()) {
            sub.worker.join();
        }
    }
}

bool SubscriptionManager::has_push() const {
    return rpc_->supports_push();
}

void SubscriptionManager::subscribe_to_blocks(const std::string& id) {
    start(id, SubscriptionKind::NewBlocks, "");
}

void SubscriptionManager::subscribe_to_address(const std::string& id, const std::string& address) {
    util::require_address(address);
    start(id, SubscriptionKind::AddressActivity, util::to_lower(address));
}

void SubscriptionManager::subscribe_to_pending_transactions(const std::string& id) {
    start(id, SubscriptionKind::PendingTransactions, "");
}

void SubscriptionManager::start(const std::string& id, SubscriptionKind kind, const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    reap_finished();

    auto it = subscriptions_.find(id);
    if (it != subscriptions_.end()) {
        Subscription old = std::move(it->second);
        subscriptions_.erase(it);
        stop(id, std::move(old));
    }

    auto state = std::make_shared<TaskState>();
    auto task = std::make_shared<Task>(id, kind, address, rpc_, events_, state, options_);

    Subscription sub{kind, address, state, std::thread([task] { task->run(); })};
    subscriptions_.emplace(id, std::move(sub));

    spdlog::info("Subscription {} started ({}, {})", id, kind_name(kind),
                 rpc_->supports_push() ? "push" : "polling");
}

void SubscriptionManager::stop(const std::string& id, Subscription sub) {
    sub.state->cancel();
    if (sub.address.empty()) {
        spdlog::info("Subscription {} stopped ({})", id, kind_name(sub.kind));
    } else {
        spdlog::info("Subscription {} stopped ({} {})", id, kind_name(sub.kind), util::short_hex(sub.address));
    }
    retired_.push_back(std::move(sub));
}

void SubscriptionManager::reap_finished() {
    for (auto it = subscriptions_.begin(); it != subscriptions_.end();) {
        if (it->second.state->finished) {
            if (it->second.worker.joinable()) {
                it->second.worker.join();
            }
            spdlog::debug("Subscription {} ended", it->first);
            it = subscriptions_.erase(it);
        } else {
            ++it;
        }
    }

    auto done = std::stable_partition(retired_.begin(), retired_.end(), [](const Subscription& sub) {
        return !sub.state->finished;
    });
    for (auto it = done; it != retired_.end(); ++it) {
        if (it->worker.joinable()) {
            it->worker.join();
        }
    }
    retired_.erase(done, retired_.end());
}

void SubscriptionManager::unsubscribe(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    reap_finished();

    auto it = subscriptions_.find(id);
    if (it == subscriptions_.end()) {
        return;
    }
    Subscription sub = std::move(it->second);
    subscriptions_.erase(it);
    stop(id, std::move(sub));
}

void SubscriptionManager::unsubscribe_all() {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto& [id, sub] : subscriptions_) {
        stop(id, std::move(sub));
    }
    subscriptions_.clear();
    reap_finished();
}

bool SubscriptionManager::is_active(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    reap_finished();
    return subscriptions_.count(id) > 0;
}

std::vector<std::string> SubscriptionManager::active_subscriptions() {
    std::lock_guard<std::mutex> lock(mutex_);
    reap_finished();

    std::vector<std::string> ids;
    ids.reserve(subscriptions_.size());
    for (const auto& [id, sub] : subscriptions_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}
