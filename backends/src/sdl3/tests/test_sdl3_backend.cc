#include <doctest/doctest.h>
#include <ringplay_backends/sdl3/sdl3_backend.hh>
#include <ringplay/error.hh>
#include "../../../test_common/backend_test_helpers.hh"
#include <memory>

TEST_SUITE("SDL3Backend") {
    TEST_CASE("SDL3 backend creation") {
        auto backend = ringplay::create_sdl3_backend();
        CHECK(backend != nullptr);
        CHECK_FALSE(backend->is_initialized());
        CHECK(backend->get_name() == "SDL3");
    }

    TEST_CASE("SDL3 initialization lifecycle") {
        ringplay::test::test_backend_initialization(ringplay::create_sdl3_backend());
    }

    TEST_CASE("SDL3 device enumeration") {
        ringplay::test::test_device_enumeration(ringplay::create_sdl3_backend());
    }

    TEST_CASE("SDL3 device open and close") {
        ringplay::test::test_device_open_close(ringplay::create_sdl3_backend());
    }

    TEST_CASE("SDL3 device control") {
        ringplay::test::test_device_control(ringplay::create_sdl3_backend());
    }

    TEST_CASE("SDL3 multiple devices") {
        ringplay::test::test_multiple_devices(ringplay::create_sdl3_backend());
    }

    TEST_CASE("SDL3 stream callback") {
        ringplay::test::test_stream_callback(ringplay::create_sdl3_backend());
    }

    TEST_CASE("SDL3 error conditions") {
        ringplay::test::test_error_conditions(ringplay::create_sdl3_backend());
    }

    TEST_CASE("SDL3 stream rejects non-float formats") {
        auto backend = ringplay::create_sdl3_backend();
        backend->init();

        ringplay::audio_spec spec;
        spec.format = ringplay::audio_format::s16le;
        spec.channels = 2;
        spec.freq = 48000;
        spec.period_frames = 128;
        ringplay::audio_spec obtained;
        auto handle = backend->open_device("", spec, obtained);

        auto silence = [](void*, uint8_t*, int) {};
        CHECK_THROWS_AS(backend->create_stream(handle, spec, silence, nullptr), ringplay::device_error);

        backend->close_device(handle);
        backend->shutdown();
    }
}
