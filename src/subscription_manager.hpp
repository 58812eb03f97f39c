#pragma once

#include "chain_reader.hpp"
#include "event_queue.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

struct SubscriptionOptions {
    std::chrono::milliseconds block_poll_interval{2000};
    std::chrono::milliseconds address_poll_interval{3000};
    std::chrono::milliseconds filter_poll_interval{1000};
};

enum class SubscriptionKind {
    NewBlocks,
    AddressActivity,
    PendingTransactions
};

// Runs one background task per subscription id and multiplexes their
// events onto a single queue. Uses node filters when the connection
// supports push, otherwise polls the chain head.
class SubscriptionManager {
public:
    SubscriptionManager(std::shared_ptr<RpcBackend> rpc, SubscriptionOptions options = {});
    ~SubscriptionManager();

    SubscriptionManager(const SubscriptionManager&) = delete;
    SubscriptionManager& operator=(const SubscriptionManager&) = delete;

    std::shared_ptr<EventQueue> events() const { return events_; }
    bool has_push() const;

    // Re-subscribing an id replaces its task.
    void subscribe_to_blocks(const std::string& id);
    void subscribe_to_address(const std::string& id, const std::string& address);
    void subscribe_to_pending_transactions(const std::string& id);

    // Cancels without waiting for an in-flight node call; no event for the
    // id is queued after this returns.
    void unsubscribe(const std::string& id);
    void unsubscribe_all();

    bool is_active(const std::string& id);
    std::vector<std::string> active_subscriptions();

private:
    struct TaskState {
        std::atomic<bool> cancelled{false};
        std::atomic<bool> finished{false};
        std::mutex mutex;
        std::condition_variable cv;

        void cancel();
        // false once cancelled
        bool sleep_for(std::chrono::milliseconds interval);
        // Pushes under the state lock so nothing lands after cancel() returns.
        bool push_unless_cancelled(EventQueue& queue, Event event);
    };

    struct Subscription {
        SubscriptionKind kind;
        std::string address;
        std::shared_ptr<TaskState> state;
        std::thread worker;
    };

    class Task;

    void start(const std::string& id, SubscriptionKind kind, const std::string& address);
    void stop(const std::string& id, Subscription sub);
    void reap_finished();

    std::shared_ptr<RpcBackend> rpc_;
    SubscriptionOptions options_;
    std::shared_ptr<EventQueue> events_;

    std::mutex mutex_;
    std::unordered_map<std::string, Subscription> subscriptions_;
    // Cancelled tasks still finishing a node call; joined once they exit.
    std::vector<Subscription> retired_;
};
