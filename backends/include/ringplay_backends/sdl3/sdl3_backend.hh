/**
 * @file sdl3_backend.hh
 * @brief SDL3 audio backend factory
 * @ingroup backends
 */

#ifndef RINGPLAY_BACKENDS_SDL3_BACKEND_HH
#define RINGPLAY_BACKENDS_SDL3_BACKEND_HH

#include <memory>

// Include generated export header
#include <ringplay_backends/sdl3/export_ringplay_backend_sdl3.h>

namespace ringplay {

/**
 * @defgroup sdl3_backend SDL3 Audio Backend
 * @ingroup backends
 * @brief Playback host built on SDL3's audio streams
 *
 * The backend opens an SDL3 playback device and binds one SDL audio stream
 * per playback stream. SDL pulls data through the stream's get-callback;
 * the backend answers every pull with whole periods produced by the
 * ringplay callback into a buffer allocated when the stream was created.
 * SDL converts from the requested float format to whatever the device runs.
 *
 * ## Configuration
 *
 * SDL3 backend respects environment variables:
 * - `SDL_AUDIO_DRIVER`: Force specific driver ("dummy" for headless tests)
 * - `SDL_AUDIO_DEVICE_SAMPLE_FRAMES`: Overrides the period size hint
 *
 * @{
 */

class audio_backend;

/**
 * @brief Create an SDL3 audio backend instance
 * @return New SDL3 backend instance; call init() before use
 *
 * @code
 * #include <ringplay_backends/sdl3/sdl3_backend.hh>
 *
 * std::shared_ptr<ringplay::audio_backend> backend = ringplay::create_sdl3_backend();
 * backend->init();
 * @endcode
 *
 * @see audio_backend, create_null_backend()
 */
RINGPLAY_BACKEND_SDL3_EXPORT std::unique_ptr<audio_backend> create_sdl3_backend();

/** @} */ // end of sdl3_backend group

} // namespace ringplay

#endif // RINGPLAY_BACKENDS_SDL3_BACKEND_HH
