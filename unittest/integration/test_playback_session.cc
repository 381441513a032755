/**
 * @file test_playback_session.cc
 * @brief End to end tests of the playback pipeline
 *
 * The mock backend runs the consumer only when a test pumps it, so ring
 * contents can be checked exactly. The null backend runs it on a timer.
 */

#include <doctest/doctest.h>
#include <ringplay/playback_session.hh>
#include <ringplay/sample_ring.hh>
#include <ringplay/engines/sine_engine.hh>
#include <ringplay/backends/null/null_backend.hh>
#include <ringplay/error.hh>
#include "../mock_backends.hh"
#include "../mock_components.hh"
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace ringplay;
using namespace ringplay::test;

namespace {
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

    struct session_fixture {
        std::shared_ptr<mock_backend> backend = std::make_shared<mock_backend>();
        std::shared_ptr<sequence_engine> engine = std::make_shared<sequence_engine>(2);
        session_config cfg;

        session_fixture() {
            backend->init();
            cfg.blocks_per_queue = 4;   // 1024 samples
        }

        std::vector<diagnostic_event> drain(playback_session& session) {
            std::vector<diagnostic_event> events;
            session.dispatch_diagnostics([&events](const diagnostic_event& ev) { events.push_back(ev); });
            return events;
        }
    };
}

TEST_SUITE("PlaybackSession") {

    TEST_CASE("should_reject_null_components") {
        auto backend = std::make_shared<mock_backend>();
        auto engine = std::make_shared<sequence_engine>(2);
        CHECK_THROWS_AS(playback_session(nullptr, engine, session_config{}), std::runtime_error);
        CHECK_THROWS_AS(playback_session(backend, nullptr, session_config{}), std::runtime_error);
    }

    TEST_CASE_FIXTURE(session_fixture, "should_prime_the_ring_and_attach_the_stream") {
        playback_session session(backend, engine, cfg);
        session.start();

        CHECK(session.is_running());
        REQUIRE(session.ring() != nullptr);
        CHECK(session.ring()->capacity() == 1024);
        CHECK(session.ring()->available() == 1024);
        CHECK(engine->prepare_calls.load() == 1);
        CHECK(engine->frames_per_block() == 128);
        CHECK(backend->open_device_calls.load() == 1);
        REQUIRE(backend->stream_count() == 1);
        CHECK(backend->stream()->is_bound());
        CHECK_FALSE(backend->stream()->is_paused());

        auto events = drain(session);
        REQUIRE_FALSE(events.empty());
        CHECK(events.back().kind == diagnostic_kind::info);
        CHECK(events.back().message.find("Playback started on Mock") == 0);
    }

    TEST_CASE_FIXTURE(session_fixture, "should_play_blocks_in_order_and_refill") {
        playback_session session(backend, engine, cfg);
        session.start();

        float expected = 0.0f;
        for (int period = 0; period < 20; ++period) {
            // wait for the producer to top the ring up again
            REQUIRE(wait_until([&session] { return session.ring()->available() == 1024; },
                               std::chrono::milliseconds(2000)));
            const auto& out = backend->stream()->pump();
            REQUIRE(out.size() == 256);
            for (float s : out) {
                REQUIRE(s == expected);
                expected += 1.0f;
            }
        }

        auto stats = session.get_consumer_stats();
        CHECK(stats.callbacks == 20);
        CHECK(stats.underruns == 0);
        CHECK(stats.delivered_frames == 20 * 128);
        CHECK(session.engine_calls() >= 4 + 19);
    }

    TEST_CASE_FIXTURE(session_fixture, "should_detach_the_stream_before_releasing_the_ring") {
        playback_session session(backend, engine, cfg);
        session.start();
        auto* stream = backend->stream();
        REQUIRE(stream != nullptr);

        session.stop();
        CHECK_FALSE(session.is_running());
        CHECK(backend->stream_count() == 0);
        CHECK(backend->close_device_calls.load() == 1);
        CHECK(session.ring() == nullptr);
        CHECK(session.engine_calls() == 0);
        CHECK(session.get_consumer_stats().callbacks == 0);

        auto events = drain(session);
        REQUIRE_FALSE(events.empty());
        CHECK(events.back().message == "Playback stopped");

        // stopping twice is harmless
        CHECK_NOTHROW(session.stop());
        CHECK(drain(session).empty());
    }

    TEST_CASE_FIXTURE(session_fixture, "should_restart_with_a_fresh_ring") {
        playback_session session(backend, engine, cfg);
        session.start();
        session.stop();
        session.start();
        CHECK(session.is_running());
        REQUIRE(session.ring() != nullptr);
        CHECK(session.ring()->available() == 1024);
        CHECK(backend->open_device_calls.load() == 2);
        CHECK(backend->stream_count() == 1);
    }

    TEST_CASE_FIXTURE(session_fixture, "should_refuse_to_start_twice") {
        playback_session session(backend, engine, cfg);
        session.start();
        CHECK_THROWS_AS(session.start(), state_error);
        CHECK(session.is_running());
    }

    TEST_CASE_FIXTURE(session_fixture, "should_validate_before_touching_the_device") {
        SUBCASE("channel_mismatch") {
            cfg.channels = 1;
        }
        SUBCASE("invalid_geometry") {
            cfg.frames_per_block = 0;
        }

        playback_session session(backend, engine, cfg);
        CHECK_THROWS_AS(session.start(), config_error);
        CHECK_FALSE(session.is_running());
        CHECK(backend->open_device_calls.load() == 0);
        CHECK(engine->prepare_calls.load() == 0);
    }

    TEST_CASE("should_require_an_initialized_backend") {
        auto backend = std::make_shared<mock_backend>();
        playback_session session(backend, std::make_shared<sequence_engine>(2), session_config{});
        CHECK_THROWS_AS(session.start(), std::runtime_error);
        CHECK_FALSE(session.is_running());
    }

    TEST_CASE_FIXTURE(session_fixture, "should_unwind_when_the_device_fails") {
        SUBCASE("open_device") {
            backend->fail_open_device = true;
        }
        SUBCASE("create_stream") {
            backend->fail_create_stream = true;
        }

        playback_session session(backend, engine, cfg);
        CHECK_THROWS_AS(session.start(), device_error);
        CHECK_FALSE(session.is_running());
        CHECK(session.ring() == nullptr);
        CHECK(backend->stream_count() == 0);

        backend->fail_open_device = false;
        backend->fail_create_stream = false;
        CHECK_NOTHROW(session.start());
        CHECK(session.is_running());
    }

    TEST_CASE_FIXTURE(session_fixture, "should_unwind_when_the_engine_cannot_prepare") {
        auto bad = std::make_shared<unpreparable_engine>(2);
        playback_session session(backend, bad, cfg);
        CHECK_THROWS_AS(session.start(), compute_error);
        CHECK_FALSE(session.is_running());
        CHECK(backend->open_device_calls.load() == 0);
    }

    TEST_CASE_FIXTURE(session_fixture, "should_keep_running_through_compute_errors") {
        engine->fail_on_call = 1;
        engine->fail_always_after = true;

        playback_session session(backend, engine, cfg);
        session.start();
        CHECK(session.ring()->available() == 0);

        const auto& out = backend->stream()->pump();
        for (float s : out) {
            CHECK(s == 0.0f);
        }
        CHECK(session.get_consumer_stats().underruns == 1);

        // the underrun demand makes the producer try again and fail again
        CHECK(wait_until([&session] { return session.get_diagnostics().compute_errors() >= 2; },
                         std::chrono::milliseconds(2000)));
        CHECK(wait_until([&session] { return session.get_diagnostics().underrun_events() >= 1; },
                         std::chrono::milliseconds(2000)));
        CHECK(session.is_running());
        CHECK(session.ring()->available() == 0);
    }

    TEST_CASE_FIXTURE(session_fixture, "should_pass_the_period_to_the_device") {
        cfg.period_frames = 64;
        playback_session session(backend, engine, cfg);
        session.start();
        CHECK(session.device_spec().period_frames == 64);
        CHECK(session.device_spec().format == audio_format::f32le);
        CHECK(backend->stream()->pump().size() == 128);
    }

    TEST_CASE("should_play_a_sine_on_the_null_backend") {
        auto backend = std::shared_ptr<audio_backend>(create_null_backend());
        backend->init();

        session_config cfg;
        cfg.device_id = "null";
        playback_session session(backend, std::make_shared<sine_engine>(2, 440.0f), cfg);
        session.start();

        CHECK(wait_until([&session] { return session.get_consumer_stats().delivered_frames >= 48000 / 10; },
                         std::chrono::milliseconds(3000)));
        CHECK(session.engine_calls() > 8);

        session.stop();
        CHECK_FALSE(session.is_running());
        backend->shutdown();
    }
}
