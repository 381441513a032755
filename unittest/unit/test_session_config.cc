#include <doctest/doctest.h>
#include <ringplay/session_config.hh>
#include <ringplay/error.hh>
#include <sstream>

using namespace ringplay;

TEST_SUITE("SessionConfig") {

    TEST_CASE("should_default_to_eight_blocks_of_128_stereo_frames") {
        session_config cfg;
        CHECK(cfg.blocks_per_queue == 8);
        CHECK(cfg.frames_per_block == 128);
        CHECK(cfg.channels == 2);
        CHECK(cfg.sample_rate == 48000);
        CHECK(cfg.block_samples() == 256);
        CHECK(cfg.queue_samples() == 2048);
        CHECK(cfg.effective_period_frames() == 128);
        CHECK(cfg.device_id.empty());
        CHECK_NOTHROW(cfg.validate());
    }

    TEST_CASE("should_reject_invalid_values") {
        session_config cfg;

        SUBCASE("zero_blocks") {
            cfg.blocks_per_queue = 0;
            CHECK_THROWS_AS(cfg.validate(), config_error);
        }
        SUBCASE("zero_frames") {
            cfg.frames_per_block = 0;
            CHECK_THROWS_AS(cfg.validate(), config_error);
        }
        SUBCASE("zero_channels") {
            cfg.channels = 0;
            CHECK_THROWS_AS(cfg.validate(), config_error);
        }
        SUBCASE("zero_rate") {
            cfg.sample_rate = 0;
            CHECK_THROWS_AS(cfg.validate(), config_error);
        }
        SUBCASE("period_larger_than_queue") {
            cfg.period_frames = 8 * 128 + 1;
            CHECK_THROWS_AS(cfg.validate(), config_error);
        }
        SUBCASE("queue_too_large") {
            cfg.blocks_per_queue = 1u << 20;
            cfg.frames_per_block = 4096;
            CHECK_THROWS_AS(cfg.validate(), config_error);
        }
    }

    TEST_CASE("should_accept_a_period_different_from_the_block") {
        session_config cfg;
        cfg.period_frames = 480;
        CHECK_NOTHROW(cfg.validate());
        CHECK(cfg.effective_period_frames() == 480);
    }

    TEST_CASE("should_print_readably") {
        session_config cfg;
        cfg.device_id = "null";
        std::ostringstream os;
        os << cfg;
        CHECK(os.str() == "session_config{blocks=8, frames_per_block=128, channels=2, rate=48000, period=128, device=\"null\"}");
    }
}
