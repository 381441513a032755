/**
 * @file session_config.hh
 * @brief Geometry and device selection of a playback session
 * @ingroup pipeline
 */

#ifndef RINGPLAY_SESSION_CONFIG_HH
#define RINGPLAY_SESSION_CONFIG_HH

#include <iosfwd>
#include <string>
#include <ringplay/export_ringplay.h>
#include <ringplay/sdk/types.hh>

namespace ringplay {

    /**
     * @struct session_config
     * @brief Everything a playback_session needs to size its ring and open a device
     *
     * The defaults give a 2048-sample stereo queue of eight 128-frame blocks
     * at 48 kHz, about 21 ms of audio.
     *
     * @code
     * session_config cfg;
     * cfg.blocks_per_queue = 4;
     * cfg.frames_per_block = 256;
     * cfg.validate();
     * @endcode
     */
    struct RINGPLAY_EXPORT session_config {
        std::size_t blocks_per_queue = 8;
        frames_t frames_per_block = 128;
        channels_t channels = 2;
        sample_rate_t sample_rate = 48000;
        /// Frames per host callback; 0 means frames_per_block.
        frames_t period_frames = 0;
        /// Backend device identifier; empty selects the default device.
        std::string device_id;

        /**
         * @throws config_error on zero sizes, a period larger than the
         *         queue, or a queue that overflows the 32-bit control words
         */
        void validate() const;

        [[nodiscard]] samples_t block_samples() const noexcept;
        [[nodiscard]] samples_t queue_samples() const noexcept;
        [[nodiscard]] frames_t effective_period_frames() const noexcept;
    };

    RINGPLAY_EXPORT std::ostream& operator<<(std::ostream& os, const session_config& cfg);

} // namespace ringplay

#endif // RINGPLAY_SESSION_CONFIG_HH
