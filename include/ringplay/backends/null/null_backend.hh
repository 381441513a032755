#ifndef RINGPLAY_BACKENDS_NULL_BACKEND_HH
#define RINGPLAY_BACKENDS_NULL_BACKEND_HH

#include <memory>
#include <ringplay/export_ringplay.h>

// Public factory header for the Null backend

namespace ringplay {

class audio_backend;

/**
 * Create a Null audio backend instance.
 *
 * The Null backend provides:
 * - No actual audio output; rendered periods are discarded
 * - A timer thread per stream that calls the callback every period,
 *   paced by the stream's sample rate like a real device
 * - One mock playback device ("null")
 * - Useful for tests and headless environments
 *
 * @note The backend must be initialized by calling init() before use
 *
 * @code
 * auto backend = ringplay::create_null_backend();
 * backend->init();
 * @endcode
 */
RINGPLAY_EXPORT std::unique_ptr<audio_backend> create_null_backend();

} // namespace ringplay

#endif // RINGPLAY_BACKENDS_NULL_BACKEND_HH
