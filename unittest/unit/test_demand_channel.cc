#include <doctest/doctest.h>
#include <ringplay/demand_channel.hh>
#include <chrono>
#include <thread>

using namespace ringplay;

TEST_SUITE("DemandChannel") {

    TEST_CASE("should_start_empty") {
        demand_channel channel;
        CHECK_FALSE(channel.try_receive().has_value());
        CHECK_FALSE(channel.is_closed());
        CHECK(channel.sent() == 0);
    }

    TEST_CASE("should_deliver_a_single_demand_once") {
        demand_channel channel;
        channel.send(256);
        auto demand = channel.try_receive();
        REQUIRE(demand.has_value());
        CHECK(*demand == 256);
        CHECK_FALSE(channel.try_receive().has_value());
    }

    TEST_CASE("should_ignore_empty_demands") {
        demand_channel channel;
        channel.send(0);
        CHECK_FALSE(channel.try_receive().has_value());
        CHECK(channel.sent() == 0);
    }

    TEST_CASE("should_coalesce_to_the_latest_demand") {
        demand_channel channel;
        channel.send(128);
        channel.send(256);
        channel.send(512);

        CHECK(channel.sent() == 3);
        CHECK(channel.coalesced() == 2);
        auto demand = channel.try_receive();
        REQUIRE(demand.has_value());
        CHECK(*demand == 512);
        CHECK_FALSE(channel.try_receive().has_value());
    }

    TEST_CASE("should_time_out_without_demand") {
        demand_channel channel;
        const auto start = std::chrono::steady_clock::now();
        CHECK_FALSE(channel.wait(std::chrono::milliseconds(10)).has_value());
        CHECK(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(5));
    }

    TEST_CASE("should_wake_a_waiting_receiver") {
        demand_channel channel;
        std::thread sender([&channel] {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            channel.send(64);
        });
        auto demand = channel.wait(std::chrono::milliseconds(2000));
        sender.join();
        REQUIRE(demand.has_value());
        CHECK(*demand == 64);
    }

    TEST_CASE("should_release_waiter_on_close_and_recover_on_reopen") {
        demand_channel channel;
        std::thread closer([&channel] {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            channel.close();
        });
        CHECK_FALSE(channel.wait(std::chrono::milliseconds(2000)).has_value());
        closer.join();
        CHECK(channel.is_closed());

        channel.send(32);
        CHECK_FALSE(channel.wait(std::chrono::milliseconds(1)).has_value());

        channel.reopen();
        CHECK_FALSE(channel.is_closed());
        CHECK_FALSE(channel.try_receive().has_value());

        channel.send(16);
        auto demand = channel.wait(std::chrono::milliseconds(100));
        REQUIRE(demand.has_value());
        CHECK(*demand == 16);
    }

    TEST_CASE("should_block_when_idle_after_many_served_demands") {
        demand_channel channel;
        for (int i = 0; i < 200; ++i) {
            channel.send(256);
            auto demand = channel.wait(std::chrono::milliseconds(50));
            REQUIRE(demand.has_value());
        }
        for (int i = 0; i < 200; ++i) {
            channel.send(128);
            channel.send(256);
            REQUIRE(channel.try_receive().has_value());
        }

        // No wakeups left over: every idle wait runs to its timeout
        int early_returns = 0;
        for (int i = 0; i < 5; ++i) {
            const auto start = std::chrono::steady_clock::now();
            CHECK_FALSE(channel.wait(std::chrono::milliseconds(20)).has_value());
            if (std::chrono::steady_clock::now() - start < std::chrono::milliseconds(15)) {
                ++early_returns;
            }
        }
        CHECK(early_returns == 0);
    }
}
