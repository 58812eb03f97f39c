#include "event_queue.hpp"
#include "util.hpp"
#include <type_traits>

const std::string& subscription_id_of(const Event& event) {
    return std::visit([](const auto& e) -> const std::string& { return e.subscription_id; }, event);
}

std::string describe(const Event& event) {
    return std::visit([](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, NewBlockEvent>) {
            return "[" + e.subscription_id + "] new block #" + std::to_string(e.block_number)
                 + " " + util::short_hex(e.block_hash);
        } else if constexpr (std::is_same_v<T, NewAddressTransactionEvent>) {
            return "[" + e.subscription_id + "] " + util::short_hex(e.address) + " tx "
                 + util::short_hex(e.transaction.hash) + " in block #" + std::to_string(e.block_number);
        } else if constexpr (std::is_same_v<T, PendingTransactionEvent>) {
            return "[" + e.subscription_id + "] pending tx " + util::short_hex(e.transaction.hash);
        } else {
            return "[" + e.subscription_id + "] subscription error: " + e.message;
        }
    }, event);
}

void EventQueue::push(Event event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::optional<Event> EventQueue::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) return std::nullopt;

    Event event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<Event> EventQueue::wait_pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !events_.empty(); })) {
        return std::nullopt;
    }

    Event event = std::move(events_.front());
    events_.pop_front();
    return event;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}
