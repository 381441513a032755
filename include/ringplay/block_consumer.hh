/**
 * @file block_consumer.hh
 * @brief Real-time side of the pipeline
 * @ingroup pipeline
 */

#ifndef RINGPLAY_BLOCK_CONSUMER_HH
#define RINGPLAY_BLOCK_CONSUMER_HH

#include <atomic>
#include <cstdint>
#include <ringplay/export_ringplay.h>
#include <ringplay/sdk/types.hh>

namespace ringplay {
    class sample_ring;
    class demand_channel;

    /**
     * @brief Snapshot of the consumer counters
     */
    struct consumer_stats {
        uint64_t callbacks = 0;          ///< Invocations of process()
        uint64_t underruns = 0;          ///< Invocations that produced silence
        uint64_t delivered_frames = 0;   ///< Frames copied out of the ring
        samples_t last_needed = 0;       ///< Request size of the latest underrun
        samples_t last_available = 0;    ///< Ring occupancy seen by the latest underrun
    };

    /**
     * @class block_consumer
     * @brief Drains the sample ring into the device buffer once per period
     * @ingroup pipeline
     *
     * process() is what the playback host calls on its real-time thread.
     * Each call asks the ring for exactly frames * channels samples:
     *
     * - delivered: the samples are copied to the output.
     * - underrun: the whole output is set to silence, a demand for the
     *   missing period is sent and the underrun is counted.
     *
     * After every call the consumer compares the ring version with the one it
     * saw last time. A changed version means the producer has been active, so
     * a demand is sent right away to keep the queue topped up before it runs
     * dry.
     *
     * Nothing in here blocks, allocates, locks or throws. Underruns are only
     * counted; the diagnostics channel reports them later from a normal thread.
     */
    class RINGPLAY_EXPORT block_consumer {
        public:
            /**
             * @param ring Ring to drain; must outlive the consumer
             * @param demands Channel used to ask for more samples
             * @param period_frames Frames the host asks for per call
             * @throws config_error if a period does not fit in the ring
             */
            block_consumer(sample_ring& ring, demand_channel& demands, frames_t period_frames);

            block_consumer(const block_consumer&) = delete;
            block_consumer& operator=(const block_consumer&) = delete;

            /**
             * @brief Fill @p out with @p frames interleaved frames
             */
            void process(float* out, frames_t frames) noexcept;

            /**
             * @brief Host callback adapter
             *
             * Matches the backend callback signature; @p userdata must be the
             * block_consumer. @p len is in bytes of 32-bit float samples.
             */
            static void audio_callback(void* userdata, uint8_t* stream, int len);

            [[nodiscard]] consumer_stats stats() const noexcept;
            [[nodiscard]] uint64_t underruns() const noexcept;
            [[nodiscard]] uint64_t callbacks() const noexcept;
            [[nodiscard]] uint64_t delivered_frames() const noexcept;

            [[nodiscard]] frames_t period_frames() const noexcept { return m_period_frames; }
            [[nodiscard]] samples_t period_samples() const noexcept;

        private:
            void silence(float* out, samples_t count, samples_t available) noexcept;

            sample_ring& m_ring;
            demand_channel& m_demands;
            frames_t m_period_frames;
            uint32_t m_last_version;

            std::atomic<uint64_t> m_callbacks{0};
            std::atomic<uint64_t> m_underruns{0};
            std::atomic<uint64_t> m_delivered_frames{0};
            std::atomic<samples_t> m_last_needed{0};
            std::atomic<samples_t> m_last_available{0};
    };

} // namespace ringplay

#endif // RINGPLAY_BLOCK_CONSUMER_HH
