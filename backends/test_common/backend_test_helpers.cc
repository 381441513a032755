#include "backend_test_helpers.hh"
#include <ringplay/error.hh>
#include <doctest/doctest.h>
#include <atomic>
#include <chrono>
#include <cstring>
#include <thread>
#include <vector>

namespace ringplay::test {

namespace {

audio_spec playback_spec() {
    audio_spec spec;
    spec.format = audio_format::f32le;
    spec.channels = 2;
    spec.freq = 48000;
    spec.period_frames = 128;
    return spec;
}

struct callback_probe {
    std::atomic<int> calls{0};
    std::atomic<int> last_len{0};
    std::atomic<bool> partial_frame{false};

    static void callback(void* userdata, uint8_t* stream, int len) {
        auto* self = static_cast<callback_probe*>(userdata);
        std::memset(stream, 0, static_cast<size_t>(len));
        if (len % static_cast<int>(2 * sizeof(float)) != 0) {
            self->partial_frame = true;
        }
        self->last_len = len;
        self->calls++;
    }
};

bool wait_for_calls(const callback_probe& probe, int count, std::chrono::milliseconds limit) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (probe.calls.load() < count) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

} // namespace

void test_backend_initialization(std::unique_ptr<audio_backend> backend) {
    REQUIRE(backend != nullptr);

    // Should not be initialized initially
    CHECK_FALSE(backend->is_initialized());

    CHECK_NOTHROW(backend->init());
    CHECK(backend->is_initialized());

    // Double init should throw
    CHECK_THROWS_AS(backend->init(), device_error);

    CHECK_NOTHROW(backend->shutdown());
    CHECK_FALSE(backend->is_initialized());

    // Double shutdown should be safe
    CHECK_NOTHROW(backend->shutdown());
}

void test_device_enumeration(std::unique_ptr<audio_backend> backend) {
    REQUIRE(backend != nullptr);

    CHECK_THROWS_AS(backend->enumerate_devices(), device_error);

    backend->init();

    // At least one device, even if it is only the default
    auto devices = backend->enumerate_devices();
    REQUIRE_FALSE(devices.empty());
    CHECK(devices.front().is_default);

    auto default_device = backend->get_default_device();
    CHECK_FALSE(default_device.name.empty());
    CHECK(default_device.is_default);

    backend->shutdown();
}

void test_device_open_close(std::unique_ptr<audio_backend> backend) {
    REQUIRE(backend != nullptr);

    backend->init();

    const audio_spec desired_spec = playback_spec();
    audio_spec obtained_spec;
    obtained_spec.period_frames = 0;
    uint32_t handle = 0;

    CHECK_NOTHROW(handle = backend->open_device("", desired_spec, obtained_spec));
    CHECK(handle != 0);

    CHECK(obtained_spec.format != audio_format::unknown);
    CHECK(obtained_spec.channels > 0);
    CHECK(obtained_spec.freq > 0);
    CHECK(obtained_spec.period_frames > 0);

    CHECK_NOTHROW(backend->close_device(handle));

    // Accessing a closed device should throw
    CHECK_THROWS_AS(backend->is_device_paused(handle), device_error);

    backend->shutdown();
}

void test_device_control(std::unique_ptr<audio_backend> backend) {
    REQUIRE(backend != nullptr);

    backend->init();

    audio_spec obtained_spec;
    uint32_t handle = backend->open_device("", playback_spec(), obtained_spec);

    CHECK(backend->pause_device(handle));
    CHECK(backend->is_device_paused(handle));

    CHECK(backend->resume_device(handle));
    CHECK_FALSE(backend->is_device_paused(handle));

    backend->close_device(handle);
    CHECK_FALSE(backend->pause_device(handle));
    CHECK_FALSE(backend->resume_device(handle));

    backend->shutdown();
}

void test_multiple_devices(std::unique_ptr<audio_backend> backend) {
    REQUIRE(backend != nullptr);

    backend->init();

    std::vector<uint32_t> handles;
    audio_spec obtained_spec;

    for (size_t i = 0; i < 3; ++i) {
        uint32_t handle = 0;
        CHECK_NOTHROW(handle = backend->open_device("", playback_spec(), obtained_spec));
        if (handle != 0) {
            handles.push_back(handle);
        }
    }

    CHECK(handles.size() == 3);

    // All handles should be unique
    for (size_t i = 0; i < handles.size(); ++i) {
        for (size_t j = i + 1; j < handles.size(); ++j) {
            CHECK(handles[i] != handles[j]);
        }
    }

    for (auto handle : handles) {
        CHECK_NOTHROW(backend->close_device(handle));
    }

    backend->shutdown();
}

void test_stream_callback(std::unique_ptr<audio_backend> backend) {
    REQUIRE(backend != nullptr);

    backend->init();

    const audio_spec desired_spec = playback_spec();
    audio_spec obtained_spec;
    uint32_t handle = backend->open_device("", desired_spec, obtained_spec);
    backend->resume_device(handle);

    callback_probe probe;
    {
        auto stream = backend->create_stream(handle, desired_spec, &callback_probe::callback, &probe);
        REQUIRE(stream != nullptr);
        CHECK_FALSE(stream->is_paused());

        CHECK(wait_for_calls(probe, 3, std::chrono::milliseconds(2000)));
        CHECK(probe.last_len.load() ==
              static_cast<int>(desired_spec.period_frames * desired_spec.channels * sizeof(float)));
        CHECK_FALSE(probe.partial_frame.load());

        CHECK(stream->pause());
        CHECK(stream->is_paused());
        CHECK(stream->resume());
        CHECK_FALSE(stream->is_paused());

        // Already bound on creation
        CHECK_FALSE(stream->bind_to_device());
        stream->unbind_from_device();
        const int calls_after_unbind = probe.calls.load();
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        CHECK(probe.calls.load() == calls_after_unbind);
    }

    backend->close_device(handle);
    backend->shutdown();
}

void test_error_conditions(std::unique_ptr<audio_backend> backend) {
    REQUIRE(backend != nullptr);

    // Operations before init
    CHECK_THROWS_AS(backend->enumerate_devices(), device_error);

    audio_spec obtained;
    CHECK_THROWS_AS(backend->open_device("", playback_spec(), obtained), device_error);

    backend->init();

    uint32_t invalid_handle = 999999;
    CHECK_THROWS_AS(backend->is_device_paused(invalid_handle), device_error);
    CHECK_THROWS_AS(backend->create_stream(invalid_handle, playback_spec(), &callback_probe::callback, nullptr),
                    device_error);
    // close_device silently ignores invalid handles to prevent cleanup crashes
    CHECK_NOTHROW(backend->close_device(invalid_handle));

    CHECK_THROWS_AS(backend->open_device("nonexistent_device_12345", playback_spec(), obtained), device_error);

    backend->shutdown();
}

std::string get_test_device_id(audio_backend* backend) {
    if (!backend->is_initialized()) {
        backend->init();
    }
    return backend->get_default_device().id;
}

} // namespace ringplay::test
