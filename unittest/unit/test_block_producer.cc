#include <doctest/doctest.h>
#include <ringplay/block_producer.hh>
#include <ringplay/block_consumer.hh>
#include <ringplay/demand_channel.hh>
#include <ringplay/diagnostics.hh>
#include <ringplay/sample_ring.hh>
#include <ringplay/error.hh>
#include "../mock_components.hh"
#include <chrono>
#include <functional>
#include <thread>
#include <vector>

using namespace ringplay;
using namespace ringplay::test;

namespace {
    // capacity 1024 samples: 4 blocks of 128 frames x 2 channels
    struct producer_fixture {
        sample_ring ring{4, 128, 2};
        sequence_engine engine{2};
        demand_channel demands;
        diagnostics diag;
        block_producer producer{ring, engine, demands, diag};

        std::size_t count_errors() {
            std::size_t errors = 0;
            diag.dispatch([&errors](const diagnostic_event& ev) {
                if (ev.kind == diagnostic_kind::compute_error) {
                    ++errors;
                }
            });
            return errors;
        }
    };

    bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds limit) {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (!pred()) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return true;
    }
}

TEST_SUITE("BlockProducer") {

    TEST_CASE("should_reject_channel_mismatch") {
        sample_ring ring(4, 128, 2);
        sequence_engine engine(1);
        demand_channel demands;
        diagnostics diag;
        CHECK_THROWS_AS(block_producer(ring, engine, demands, diag), config_error);
    }

    TEST_CASE_FIXTURE(producer_fixture, "should_fill_to_target_one_block_per_call") {
        // target = 256 * 4 blocks = 1024
        auto result = producer.fill(256);
        CHECK(engine.calls.load() == 4);
        CHECK(result.blocks_produced == 4);
        CHECK_FALSE(result.failed);
        CHECK(ring.available() == 1024);
        CHECK(ring.version() == 4);
    }

    TEST_CASE_FIXTURE(producer_fixture, "should_ignore_duplicate_demands") {
        producer.fill(256);
        auto again = producer.fill(256);
        CHECK(again.blocks_produced == 0);
        CHECK(engine.calls.load() == 4);
        CHECK(ring.available() == 1024);
    }

    TEST_CASE_FIXTURE(producer_fixture, "should_clamp_target_to_capacity") {
        auto result = producer.fill(1024);
        CHECK(result.blocks_produced == 4);
        CHECK(ring.available() == ring.capacity());
    }

    TEST_CASE_FIXTURE(producer_fixture, "should_top_up_partially_filled_ring") {
        // 2 channels x 16 frames -> target 128, one block suffices
        auto result = producer.fill(32);
        CHECK(result.blocks_produced == 1);
        CHECK(ring.available() == 256);

        result = producer.fill(128);
        CHECK(result.blocks_produced == 1);
        CHECK(ring.available() == 512);
    }

    TEST_CASE_FIXTURE(producer_fixture, "should_abort_fill_on_compute_error") {
        engine.fail_on_call = 3;

        auto result = producer.fill(256);
        CHECK(result.failed);
        CHECK(result.blocks_produced == 2);
        CHECK(engine.calls.load() == 3);
        CHECK(ring.available() == 512);
        CHECK(ring.version() == 2);
        CHECK(diag.compute_errors() == 1);
        CHECK(count_errors() == 1);

        // Samples already committed stay intact and in order
        std::vector<float> out(512);
        REQUIRE(ring.try_consume(out.data(), 512) == consume_result::delivered);
        CHECK(out[0] == 0.0f);
        CHECK(out[511] == 511.0f);
    }

    TEST_CASE_FIXTURE(producer_fixture, "should_retry_on_next_demand_after_error") {
        engine.fail_on_call = 1;
        CHECK(producer.fill(256).failed);
        CHECK(ring.available() == 0);

        auto result = producer.fill(256);
        CHECK_FALSE(result.failed);
        CHECK(ring.available() == 1024);
        CHECK(diag.compute_errors() == 1);
    }

    TEST_CASE_FIXTURE(producer_fixture, "should_prime_the_whole_ring") {
        auto result = producer.prime();
        CHECK(result.blocks_produced == ring.blocks());
        CHECK(ring.free_space() == 0);
    }

    TEST_CASE_FIXTURE(producer_fixture, "should_serve_demands_from_its_thread") {
        producer.set_poll_interval(std::chrono::milliseconds(5));
        producer.start();
        CHECK(producer.is_running());
        CHECK_THROWS_AS(producer.start(), state_error);

        demands.send(256);
        CHECK(wait_until([this] { return ring.available() == 1024; }, std::chrono::milliseconds(2000)));

        producer.stop();
        CHECK_FALSE(producer.is_running());
        CHECK(demands.is_closed());

        // A stopped producer does not react to demands
        std::vector<float> out(1024);
        REQUIRE(ring.try_consume(out.data(), 1024) == consume_result::delivered);
        demands.send(256);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        CHECK(ring.available() == 0);

        // and can be restarted
        producer.start();
        demands.send(256);
        CHECK(wait_until([this] { return ring.available() == 1024; }, std::chrono::milliseconds(2000)));
        producer.stop();
    }

    TEST_CASE_FIXTURE(producer_fixture, "should_accept_poll_interval_changes_while_running") {
        producer.start();
        for (int i = 1; i <= 20; ++i) {
            producer.set_poll_interval(std::chrono::milliseconds(i % 4 + 1));
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        demands.send(256);
        CHECK(wait_until([this] { return ring.available() == 1024; }, std::chrono::milliseconds(2000)));
        producer.stop();
        CHECK_FALSE(producer.is_running());
    }

    TEST_CASE("should_report_consumer_underruns_from_the_loop") {
        sample_ring ring(4, 128, 2);
        sequence_engine engine(2);
        demand_channel demands;
        diagnostics diag;
        block_consumer consumer(ring, demands, 128);
        block_producer producer(ring, engine, demands, diag, &consumer);
        producer.set_poll_interval(std::chrono::milliseconds(5));

        producer.start();

        std::vector<float> out(256);
        consumer.process(out.data(), 128);
        REQUIRE(consumer.underruns() == 1);

        CHECK(wait_until([&diag] { return diag.underrun_events() == 1; }, std::chrono::milliseconds(2000)));
        CHECK(wait_until([&ring] { return ring.available() == 1024; }, std::chrono::milliseconds(2000)));
        producer.stop();

        std::vector<diagnostic_event> events;
        diag.dispatch([&events](const diagnostic_event& ev) { events.push_back(ev); });
        REQUIRE_FALSE(events.empty());
        CHECK(events.front().kind == diagnostic_kind::underrun);
        CHECK(events.front().needed == 256);
        CHECK(events.front().available == 0);
        CHECK(events.front().count == 1);
    }

    TEST_CASE_FIXTURE(producer_fixture, "should_abandon_fill_when_stopped") {
        producer.stop();
        auto result = producer.fill(256);
        CHECK(result.stopped);
        CHECK(result.blocks_produced == 0);
        CHECK(engine.calls.load() == 0);
    }
}
