/**
 * @file test_spsc_stress.cc
 * @brief Producer thread against a free-running consumer thread
 *
 * The engine writes a running counter, so every delivered period must
 * continue exactly where the previous delivered period ended. Silent
 * periods (underruns) are skipped by comparing the delivered frame count
 * before and after each call.
 */

#include <doctest/doctest.h>
#include <ringplay/block_consumer.hh>
#include <ringplay/block_producer.hh>
#include <ringplay/demand_channel.hh>
#include <ringplay/diagnostics.hh>
#include <ringplay/sample_ring.hh>
#include "../mock_components.hh"
#include <atomic>
#include <chrono>
#include <random>
#include <thread>
#include <vector>

using namespace ringplay;
using namespace ringplay::test;

TEST_SUITE("SPSC::Stress") {

    TEST_CASE("should_deliver_an_unbroken_sequence_under_contention") {
        // 3 blocks of 96 frames: periods below never line up with blocks or capacity
        sample_ring ring(3, 96, 2);
        sequence_engine engine(2);
        demand_channel demands;
        diagnostics diag;
        block_consumer consumer(ring, demands, 128);
        block_producer producer(ring, engine, demands, diag, &consumer);
        producer.set_poll_interval(std::chrono::milliseconds(1));
        producer.prime();
        producer.start();

        const frames_t periods[] = {17, 64, 100, 128, 3};
        std::mt19937 rng(42);
        std::uniform_int_distribution<size_t> pick(0, 4);
        std::vector<float> out(256);

        float expected = 0.0f;
        uint64_t delivered_periods = 0;
        bool in_order = true;
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);

        while (delivered_periods < 20000 && std::chrono::steady_clock::now() < deadline) {
            const frames_t frames = periods[pick(rng)];
            const auto before = consumer.delivered_frames();
            consumer.process(out.data(), frames);
            if (consumer.delivered_frames() == before) {
                std::this_thread::yield();
                continue;
            }
            ++delivered_periods;
            for (size_t i = 0; i < static_cast<size_t>(frames) * 2; ++i) {
                if (out[i] != expected) {
                    in_order = false;
                }
                expected += 1.0f;
            }
            if (!in_order) {
                break;
            }
            CHECK(ring.available() <= ring.capacity());
        }

        producer.stop();

        CHECK(in_order);
        CHECK(delivered_periods > 1000);
        CHECK(ring.available() <= ring.capacity());
        CHECK(diag.compute_errors() == 0);
        CHECK(engine.calls.load() == producer.blocks_produced());
    }

    TEST_CASE("should_balance_the_occupancy_counter_with_indices") {
        sample_ring ring(8, 32, 2);
        constant_engine engine(2, 0.5f);
        demand_channel demands;
        diagnostics diag;
        block_consumer consumer(ring, demands, 48);
        block_producer producer(ring, engine, demands, diag, &consumer);
        producer.set_poll_interval(std::chrono::milliseconds(1));
        producer.start();

        std::atomic<bool> done{false};
        std::thread rt([&] {
            std::vector<float> out(96);
            while (!done.load()) {
                consumer.process(out.data(), 48);
            }
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        done = true;
        rt.join();
        producer.stop();

        // quiescent: produced - consumed equals what is left in the ring
        const uint64_t produced = producer.blocks_produced() * ring.block_samples();
        const uint64_t consumed = consumer.delivered_frames() * ring.channels();
        CHECK(produced - consumed == ring.available());
        CHECK(ring.write_index() == produced % ring.capacity());
        CHECK(ring.read_index() == consumed % ring.capacity());
        CHECK(consumer.delivered_frames() > 0);
    }
}
