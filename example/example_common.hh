/**
 * @file example_common.hh
 * @brief Common utilities for ringplay examples
 *
 * This header provides backend selection based on build configuration.
 */

#ifndef RINGPLAY_EXAMPLE_COMMON_HH
#define RINGPLAY_EXAMPLE_COMMON_HH

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <ringplay/sdk/audio_backend.hh>
#include <ringplay/backends/null/null_backend.hh>

#ifdef RINGPLAY_USE_SDL3_BACKEND
#include <ringplay_backends/sdl3/sdl3_backend.hh>
#endif

namespace ringplay {
    namespace examples {
        /**
         * @brief Create the backend to play through
         * @param headless Use the null backend even if SDL3 is available
         *
         * SDL3 is used when the build enables it; otherwise audio goes to
         * the null backend, which consumes it on a timer.
         */
        inline std::shared_ptr <audio_backend> create_default_backend(bool headless = false) {
#ifdef RINGPLAY_USE_SDL3_BACKEND
            if (!headless) {
                std::cout << "Using SDL3 backend" << std::endl;
                return std::shared_ptr <audio_backend>(create_sdl3_backend());
            }
#else
            (void)headless;
#endif
            std::cout << "Using Null backend" << std::endl;
            return std::shared_ptr <audio_backend>(create_null_backend());
        }

        /**
         * @brief Parse a positive integer option, exiting with a message on garbage
         */
        inline unsigned long parse_count(const char* option, const char* value) {
            char* end = nullptr;
            const unsigned long v = std::strtoul(value, &end, 10);
            if (!end || *end != '\0' || v == 0) {
                std::cerr << option << " expects a positive integer, got '" << value << "'\n";
                std::exit(1);
            }
            return v;
        }
    } // namespace examples
} // namespace ringplay

#endif // RINGPLAY_EXAMPLE_COMMON_HH
