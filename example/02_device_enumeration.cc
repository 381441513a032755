/**
 * @example 02_device_enumeration.cc
 * @brief List the playback devices a backend offers
 *
 * Pass one of the printed IDs to 01_sine_playback --device.
 */

#include "example_common.hh"
#include <cstring>
#include <iostream>

int main(int argc, char* argv[]) {
    const bool headless = argc > 1 && std::strcmp(argv[1], "--null") == 0;

    try {
        auto backend = ringplay::examples::create_default_backend(headless);
        backend->init();

        std::cout << "=== Available Playback Devices ===\n";
        for (const auto& info : backend->enumerate_devices()) {
            std::cout << info.id << ": " << info.name << " ("
                      << static_cast<int>(info.channels) << " channels, "
                      << info.sample_rate << " Hz";
            if (info.is_default) {
                std::cout << ", DEFAULT";
            }
            std::cout << ")\n";
        }

        backend->shutdown();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
