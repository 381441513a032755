/**
 * @file audio_format.hh
 * @brief Audio format description shared by backends and sessions
 * @ingroup sdk_audio_format
 */

#ifndef RINGPLAY_SDK_AUDIO_FORMAT_HH
#define RINGPLAY_SDK_AUDIO_FORMAT_HH

#include <ringplay/sdk/types.hh>
#include <ringplay/export_ringplay.h>
#include <iosfwd>

namespace ringplay {

/**
 * @defgroup sdk_audio_format Audio Formats
 * @ingroup sdk
 * @{
 */

/**
 * @enum audio_format
 * @brief Sample formats a device may report
 *
 * The pipeline itself only moves 32-bit floats in native byte order.
 * The other values exist so that a backend can report what a device
 * actually opened with.
 */
enum class audio_format : uint16_t {
    unknown = 0,
    s16le = 0x8010,
    s32le = 0x8020,
    f32le = 0x8120,
    f32be = 0x9120
};

/**
 * @brief Bytes per sample of a format
 * @return 2, 4 or 0 for unknown
 */
RINGPLAY_EXPORT unsigned audio_format_byte_size(audio_format fmt);

/**
 * @struct audio_spec
 * @brief Complete description of a playback stream
 *
 * @code
 * audio_spec spec{audio_format::f32le, 2, 48000, 128};
 * @endcode
 */
struct audio_spec {
    audio_format format = audio_format::f32le;  ///< Sample format
    channels_t channels = 2;                    ///< Interleaved channel count
    sample_rate_t freq = 48000;                 ///< Sample rate in Hz
    frames_t period_frames = 128;               ///< Frames per host callback
};

RINGPLAY_EXPORT std::ostream& operator<<(std::ostream& os, audio_format fmt);
RINGPLAY_EXPORT std::ostream& operator<<(std::ostream& os, const audio_spec& spec);

/** @} */ // end of sdk_audio_format group

} // namespace ringplay

#endif // RINGPLAY_SDK_AUDIO_FORMAT_HH
