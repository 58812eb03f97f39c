#pragma once

#include "events.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

// Multi-producer event stream shared by all subscription tasks.
class EventQueue {
public:
    void push(Event event);

    std::optional<Event> try_pop();
    std::optional<Event> wait_pop(std::chrono::milliseconds timeout);

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> events_;
};
