/**
 * @file types.hh
 * @brief Type aliases for audio geometry
 * @ingroup sdk_types
 */

#ifndef RINGPLAY_SDK_TYPES_HH
#define RINGPLAY_SDK_TYPES_HH

#include <cstdint>
#include <cstddef>

namespace ringplay {

/**
 * @defgroup sdk_types Type Definitions
 * @ingroup sdk
 * @brief Aliases that keep sample, frame and channel quantities apart
 *
 * A *sample* is one float value. A *frame* holds one sample per channel.
 * A *block* is the fixed number of frames produced by one compute-engine
 * call. Ring indices and counters are expressed in samples.
 *
 * @{
 */

/// Sample rate in Hz.
using sample_rate_t = uint32_t;

/// Channel count (1 = mono, 2 = stereo, ...).
using channels_t = uint8_t;

/// Frame count.
using frames_t = uint32_t;

/// Sample count; the unit of every ring index and counter.
using samples_t = uint32_t;

/** @} */ // end of sdk_types group

} // namespace ringplay

#endif // RINGPLAY_SDK_TYPES_HH
