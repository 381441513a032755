#ifndef RINGPLAY_BACKEND_TEST_HELPERS_HH
#define RINGPLAY_BACKEND_TEST_HELPERS_HH

#include <ringplay/sdk/audio_backend.hh>
#include <memory>
#include <string>

namespace ringplay::test {

// Common test functions that work with any backend implementation.
// Shared between the SDL3 backend tests and the null backend unit tests.

// Test backend initialization lifecycle
void test_backend_initialization(std::unique_ptr<audio_backend> backend);

// Test device enumeration
void test_device_enumeration(std::unique_ptr<audio_backend> backend);

// Test opening and closing devices
void test_device_open_close(std::unique_ptr<audio_backend> backend);

// Test device control (pause, resume)
void test_device_control(std::unique_ptr<audio_backend> backend);

// Test multiple device handling
void test_multiple_devices(std::unique_ptr<audio_backend> backend);

// Test stream creation and that the callback receives whole periods
void test_stream_callback(std::unique_ptr<audio_backend> backend);

// Test error conditions
void test_error_conditions(std::unique_ptr<audio_backend> backend);

// Helper to get a valid device ID for testing
std::string get_test_device_id(audio_backend* backend);

} // namespace ringplay::test

#endif // RINGPLAY_BACKEND_TEST_HELPERS_HH
