#include <doctest/doctest.h>
#include <ringplay/block_consumer.hh>
#include <ringplay/demand_channel.hh>
#include <ringplay/sample_ring.hh>
#include <ringplay/error.hh>
#include "../mock_components.hh"
#include <vector>

using namespace ringplay;
using namespace ringplay::test;

namespace {
    // capacity 1024 samples, 256-sample blocks, 2 channels, 128-frame periods
    struct consumer_fixture {
        sample_ring ring{4, 128, 2};
        demand_channel demands;
        block_consumer consumer{ring, demands, 128};
        std::vector<float> out = std::vector<float>(256, 7.0f);

        void produce(float first) {
            auto block = make_block(ring.block_samples(), first);
            ring.produce_block(block.data());
        }
    };
}

TEST_SUITE("BlockConsumer") {

    TEST_CASE("should_validate_period") {
        sample_ring ring(4, 128, 2);
        demand_channel demands;
        CHECK_THROWS_AS(block_consumer(ring, demands, 0), config_error);
        CHECK_THROWS_AS(block_consumer(ring, demands, 513), config_error);
        CHECK_NOTHROW(block_consumer(ring, demands, 512));
    }

    TEST_CASE_FIXTURE(consumer_fixture, "should_play_silence_and_request_data_on_underrun") {
        consumer.process(out.data(), 128);

        for (float s : out) {
            CHECK(s == 0.0f);
        }
        CHECK(consumer.underruns() == 1);
        auto demand = demands.try_receive();
        REQUIRE(demand.has_value());
        CHECK(*demand == 256);

        auto stats = consumer.stats();
        CHECK(stats.callbacks == 1);
        CHECK(stats.last_needed == 256);
        CHECK(stats.last_available == 0);
        CHECK(stats.delivered_frames == 0);
    }

    TEST_CASE_FIXTURE(consumer_fixture, "should_deliver_after_the_producer_fills") {
        consumer.process(out.data(), 128);
        REQUIRE(demands.try_receive().has_value());

        produce(100.0f);
        CHECK(ring.available() == 256);
        CHECK(ring.version() == 1);

        consumer.process(out.data(), 128);
        CHECK(ring.available() == 0);
        CHECK(out.front() == 100.0f);
        CHECK(out.back() == 355.0f);
        CHECK(consumer.underruns() == 1);
        CHECK(consumer.delivered_frames() == 128);
    }

    TEST_CASE_FIXTURE(consumer_fixture, "should_request_proactively_when_the_version_changes") {
        produce(0.0f);
        produce(256.0f);

        // First read sees a version different from construction time
        consumer.process(out.data(), 128);
        auto demand = demands.try_receive();
        REQUIRE(demand.has_value());
        CHECK(*demand == 256);

        // Same version again: no request
        consumer.process(out.data(), 128);
        CHECK_FALSE(demands.try_receive().has_value());
        CHECK(consumer.underruns() == 0);

        produce(512.0f);
        consumer.process(out.data(), 128);
        CHECK(demands.try_receive().has_value());
    }

    TEST_CASE_FIXTURE(consumer_fixture, "should_treat_oversized_periods_as_underruns") {
        std::vector<float> big(2048, 1.0f);
        consumer.process(big.data(), 1024);
        CHECK(consumer.underruns() == 1);
        CHECK(big[2047] == 0.0f);
        CHECK(consumer.stats().last_needed == 2048);
    }

    TEST_CASE_FIXTURE(consumer_fixture, "should_adapt_byte_callbacks") {
        SUBCASE("whole_frames") {
            produce(1.0f);
            block_consumer::audio_callback(&consumer, reinterpret_cast<uint8_t*>(out.data()),
                                           static_cast<int>(256 * sizeof(float)));
            CHECK(out[0] == 1.0f);
            CHECK(consumer.delivered_frames() == 128);
        }

        SUBCASE("partial_frame_is_silence") {
            produce(1.0f);
            block_consumer::audio_callback(&consumer, reinterpret_cast<uint8_t*>(out.data()),
                                           static_cast<int>(3 * sizeof(float)));
            CHECK(out[0] == 0.0f);
            CHECK(out[2] == 0.0f);
            CHECK(out[3] == 7.0f);
            CHECK(consumer.underruns() == 1);
            CHECK(ring.available() == 256);
        }

        SUBCASE("null_userdata_is_silence") {
            block_consumer::audio_callback(nullptr, reinterpret_cast<uint8_t*>(out.data()),
                                           static_cast<int>(out.size() * sizeof(float)));
            CHECK(out[255] == 0.0f);
        }
    }
}
