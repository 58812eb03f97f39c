#include <catch2/catch_test_macros.hpp>
#include "fakes.hpp"
#include "../src/subscription_manager.hpp"
#include <future>

namespace {

const std::string kAlice = "0x" + std::string(40, 'a');
const std::string kBob = "0x" + std::string(40, 'b');

SubscriptionOptions fast_options() {
    SubscriptionOptions options;
    options.block_poll_interval = std::chrono::milliseconds(10);
    options.address_poll_interval = std::chrono::milliseconds(10);
    options.filter_poll_interval = std::chrono::milliseconds(10);
    return options;
}

Block make_block(uint64_t number) {
    Block block;
    block.number = number;
    block.hash = "0xb" + std::to_string(number);
    return block;
}

Transaction transfer_tx(const std::string& hash, const std::string& from, const std::string& to) {
    Transaction tx;
    tx.hash = hash;
    tx.from = from;
    tx.to = to;
    tx.value_wei = 1;
    return tx;
}

std::optional<Event> next_event(SubscriptionManager& manager) {
    return manager.events()->wait_pop(std::chrono::milliseconds(2000));
}

// Waits until a polling task has read the head at least once more.
void wait_for_polls(FakeRpc& rpc, int base) {
    REQUIRE(wait_until([&] { return rpc.block_number_calls.load() >= base + 2; }));
}

} // namespace

TEST_CASE("Block subscriptions by polling", "[subscriptions]") {
    auto rpc = std::make_shared<FakeRpc>();
    rpc->set_head(100);
    SubscriptionManager manager(rpc, fast_options());
    REQUIRE_FALSE(manager.has_push());

    SECTION("New head is reported") {
        manager.subscribe_to_blocks("blocks");
        wait_for_polls(*rpc, 0);

        rpc->mine(make_block(101));
        auto event = next_event(manager);
        REQUIRE(event);
        auto* block = std::get_if<NewBlockEvent>(&*event);
        REQUIRE(block);
        REQUIRE(block->subscription_id == "blocks");
        REQUIRE(block->block_number == 101);
        REQUIRE(block->block_hash == "0xb101");
    }

    SECTION("Re-subscribing replaces the task") {
        manager.subscribe_to_blocks("blocks");
        manager.subscribe_to_blocks("blocks");
        REQUIRE(manager.active_subscriptions() == std::vector<std::string>{"blocks"});

        wait_for_polls(*rpc, rpc->block_number_calls.load());
        rpc->mine(make_block(101));

        REQUIRE(next_event(manager));
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        REQUIRE_FALSE(manager.events()->try_pop());
    }

    SECTION("Unsubscribe stops delivery") {
        manager.subscribe_to_blocks("blocks");
        wait_for_polls(*rpc, 0);

        manager.unsubscribe("blocks");
        REQUIRE_FALSE(manager.is_active("blocks"));

        rpc->mine(make_block(101));
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        REQUIRE(manager.events()->size() == 0);
    }

    SECTION("Head announced before its block is served is reported later") {
        manager.subscribe_to_blocks("blocks");
        wait_for_polls(*rpc, 0);

        rpc->set_head(101);
        wait_for_polls(*rpc, rpc->block_number_calls.load());
        REQUIRE(manager.events()->size() == 0);

        rpc->add_block(make_block(101));
        auto event = next_event(manager);
        REQUIRE(event);
        REQUIRE(std::get<NewBlockEvent>(*event).block_number == 101);
    }

    SECTION("Unsubscribe does not wait for an in-flight node call") {
        manager.subscribe_to_blocks("blocks");
        wait_for_polls(*rpc, 0);

        rpc->latency_ms = 800;
        int before = rpc->calls.load();
        REQUIRE(wait_until([&] { return rpc->calls.load() > before; }));
        rpc->mine(make_block(101));

        auto started = std::chrono::steady_clock::now();
        auto other_thread = std::async(std::launch::async, [&] { return manager.is_active("blocks"); });
        manager.unsubscribe("blocks");
        auto unsubscribed = std::chrono::steady_clock::now() - started;

        REQUIRE(other_thread.wait_for(std::chrono::milliseconds(400)) == std::future_status::ready);
        REQUIRE(unsubscribed < std::chrono::milliseconds(400));
        REQUIRE_FALSE(manager.is_active("blocks"));
        REQUIRE(manager.active_subscriptions().empty());

        // The call in flight returns the new head; its event is dropped
        int in_flight = rpc->calls.load();
        REQUIRE(wait_until([&] { return rpc->calls.load() > in_flight; }));
        std::this_thread::sleep_for(std::chrono::milliseconds(1000));
        REQUIRE(manager.events()->size() == 0);
    }

    SECTION("Unknown ids are ignored") {
        REQUIRE_NOTHROW(manager.unsubscribe("nothing"));
    }

    SECTION("Node failure ends the subscription with an error event") {
        manager.subscribe_to_blocks("blocks");
        wait_for_polls(*rpc, 0);

        rpc->failing = true;
        auto event = next_event(manager);
        REQUIRE(event);
        REQUIRE(std::holds_alternative<SubscriptionErrorEvent>(*event));
        REQUIRE(subscription_id_of(*event) == "blocks");
        REQUIRE(wait_until([&] { return !manager.is_active("blocks"); }));
    }

    SECTION("Ids are listed in order") {
        manager.subscribe_to_blocks("z");
        manager.subscribe_to_blocks("a");
        REQUIRE(manager.active_subscriptions() == std::vector<std::string>{"a", "z"});

        manager.unsubscribe_all();
        REQUIRE(manager.active_subscriptions().empty());
    }
}

TEST_CASE("Address subscriptions by polling", "[subscriptions]") {
    auto rpc = std::make_shared<FakeRpc>();
    rpc->set_head(100);
    SubscriptionManager manager(rpc, fast_options());

    SECTION("Every block in a gap is scanned") {
        manager.subscribe_to_address("watch", "0xAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA");
        wait_for_polls(*rpc, 0);

        for (uint64_t n = 101; n <= 105; ++n) {
            Block block = make_block(n);
            if (n == 104) {
                block.transactions.push_back(transfer_tx("0x104", kBob, kAlice));
            } else {
                block.transactions.push_back(transfer_tx("0x" + std::to_string(n), kBob, kBob));
            }
            rpc->add_block(block);
        }
        rpc->set_head(105);

        auto event = next_event(manager);
        REQUIRE(event);
        auto* activity = std::get_if<NewAddressTransactionEvent>(&*event);
        REQUIRE(activity);
        REQUIRE(activity->block_number == 104);
        REQUIRE(activity->address == kAlice);
        REQUIRE(activity->transaction.hash == "0x104");

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        REQUIRE_FALSE(manager.events()->try_pop());
    }

    SECTION("Invalid address is rejected up front") {
        REQUIRE_THROWS_AS(manager.subscribe_to_address("watch", "0x1234"), ValidationError);
        REQUIRE(manager.active_subscriptions().empty());
    }
}

TEST_CASE("Subscriptions over node filters", "[subscriptions]") {
    auto rpc = std::make_shared<FakeRpc>();
    rpc->push = true;
    rpc->set_head(100);
    SubscriptionManager manager(rpc, fast_options());
    REQUIRE(manager.has_push());

    // Filter installed and polled at least once
    auto wait_for_filter = [&] {
        REQUIRE(wait_until([&] { return rpc->calls.load() >= 2; }));
    };

    SECTION("Blocks from the filter") {
        manager.subscribe_to_blocks("blocks");
        wait_for_filter();

        rpc->mine(make_block(101));
        auto event = next_event(manager);
        REQUIRE(event);
        REQUIRE(std::get<NewBlockEvent>(*event).block_number == 101);

        manager.unsubscribe("blocks");
        REQUIRE(wait_until([&] { return rpc->uninstalled.load() == 1; }));
    }

    SECTION("Address activity from the filter") {
        manager.subscribe_to_address("watch", kAlice);
        wait_for_filter();

        Block block = make_block(101);
        block.transactions.push_back(transfer_tx("0x1", "0xAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA", kBob));
        rpc->mine(block);

        auto event = next_event(manager);
        REQUIRE(event);
        REQUIRE(std::get<NewAddressTransactionEvent>(*event).transaction.hash == "0x1");
    }

    SECTION("Pending transactions") {
        manager.subscribe_to_pending_transactions("mempool");
        wait_for_filter();

        rpc->add_transaction(transfer_tx("0xp1", kAlice, kBob));
        rpc->queue_filter_change("0xp1");

        auto event = next_event(manager);
        REQUIRE(event);
        auto* pending = std::get_if<PendingTransactionEvent>(&*event);
        REQUIRE(pending);
        REQUIRE(pending->transaction.hash == "0xp1");
        REQUIRE_FALSE(pending->transaction.block_number);

        manager.unsubscribe_all();
        REQUIRE(wait_until([&] { return rpc->uninstalled.load() == 1; }));
    }
}

TEST_CASE("Pending transactions need push", "[subscriptions]") {
    auto rpc = std::make_shared<FakeRpc>();
    SubscriptionManager manager(rpc, fast_options());

    manager.subscribe_to_pending_transactions("mempool");
    auto event = next_event(manager);
    REQUIRE(event);
    REQUIRE(std::holds_alternative<SubscriptionErrorEvent>(*event));
    REQUIRE(wait_until([&] { return !manager.is_active("mempool"); }));
}
