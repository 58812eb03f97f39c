#pragma once

#include "types.hpp"
#include <string>
#include <variant>

struct NewBlockEvent {
    std::string subscription_id;
    uint64_t block_number = 0;
    std::string block_hash;
};

struct NewAddressTransactionEvent {
    std::string subscription_id;
    std::string address;
    Transaction transaction;
    uint64_t block_number = 0;
};

struct PendingTransactionEvent {
    std::string subscription_id;
    Transaction transaction;
};

// Terminal: the subscription that emitted it is no longer running.
struct SubscriptionErrorEvent {
    std::string subscription_id;
    std::string message;
};

using Event = std::variant<NewBlockEvent,
                           NewAddressTransactionEvent,
                           PendingTransactionEvent,
                           SubscriptionErrorEvent>;

const std::string& subscription_id_of(const Event& event);
std::string describe(const Event& event);
