/**
 * @file sine_engine.hh
 * @brief Sine tone compute engine
 */

#ifndef RINGPLAY_ENGINES_SINE_ENGINE_HH
#define RINGPLAY_ENGINES_SINE_ENGINE_HH

#include <atomic>
#include <ringplay/export_ringplay.h>
#include <ringplay/sdk/compute_engine.hh>

namespace ringplay {

    /**
     * @class sine_engine
     * @brief Writes the same phase-continuous sine to every channel
     *
     * The smallest useful engine: enough to hear the pipeline work and to
     * check the output for discontinuities in tests.
     */
    class RINGPLAY_EXPORT sine_engine : public compute_engine {
        public:
            explicit sine_engine(channels_t channels, float frequency = 440.0f, float amplitude = 0.25f);

            channels_t channels() const override;
            void prepare(sample_rate_t sample_rate, frames_t frames_per_block) override;
            void process_block(float* out, frames_t frames) override;
            std::string get_name() const override;

            /// Safe to call while the producer thread runs; the next block picks it up.
            void set_frequency(float hz);
            [[nodiscard]] float frequency() const { return m_frequency.load(std::memory_order_relaxed); }
            [[nodiscard]] double phase() const { return m_phase; }

        private:
            channels_t m_channels;
            std::atomic<float> m_frequency;
            float m_amplitude;
            sample_rate_t m_sample_rate = 0;
            frames_t m_frames_per_block = 0;
            double m_phase = 0.0;
    };

} // namespace ringplay

#endif // RINGPLAY_ENGINES_SINE_ENGINE_HH
