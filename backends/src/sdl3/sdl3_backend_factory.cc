/**
 * @file sdl3_backend_factory.cc
 * @brief SDL3 backend factory implementation
 * @ingroup sdl3_backend
 */

#include <ringplay_backends/sdl3/sdl3_backend.hh>
#include "sdl3_backend_impl.hh"

namespace ringplay {

/**
 * @brief Factory function implementation for SDL3 backend
 *
 * Keeps the SDL-dependent implementation class private to the backend
 * library.
 */
std::unique_ptr<audio_backend> create_sdl3_backend() {
    return std::make_unique<sdl3_backend>();
}

} // namespace ringplay
