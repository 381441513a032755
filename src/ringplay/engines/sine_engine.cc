#include <ringplay/engines/sine_engine.hh>
#include <ringplay/error.hh>
#include <cmath>
#include <string>

namespace ringplay {

    namespace {
        constexpr double two_pi = 6.283185307179586476925286766559;
    }

    sine_engine::sine_engine(channels_t channels, float frequency, float amplitude)
        : m_channels(channels),
          m_frequency(frequency),
          m_amplitude(amplitude) {
        if (channels == 0) {
            throw config_error("sine_engine: channel count must be positive");
        }
    }

    channels_t sine_engine::channels() const {
        return m_channels;
    }

    void sine_engine::prepare(sample_rate_t sample_rate, frames_t frames_per_block) {
        if (sample_rate == 0 || frames_per_block == 0) {
            throw config_error("sine_engine: sample rate and block size must be positive");
        }
        m_sample_rate = sample_rate;
        m_frames_per_block = frames_per_block;
        m_phase = 0.0;
    }

    void sine_engine::process_block(float* out, frames_t frames) {
        if (m_sample_rate == 0) {
            throw compute_error("sine_engine: process_block called before prepare");
        }
        if (frames != m_frames_per_block) {
            throw compute_error("sine_engine: expected " + std::to_string(m_frames_per_block) +
                                " frames, got " + std::to_string(frames));
        }

        const double step = two_pi * m_frequency.load(std::memory_order_relaxed) / m_sample_rate;
        for (frames_t i = 0; i < frames; ++i) {
            const auto v = static_cast<float>(m_amplitude * std::sin(m_phase));
            for (channels_t c = 0; c < m_channels; ++c) {
                *out++ = v;
            }
            m_phase += step;
            if (m_phase >= two_pi) {
                m_phase -= two_pi;
            }
        }
    }

    std::string sine_engine::get_name() const {
        return "sine(" + std::to_string(frequency()) + " Hz)";
    }

    void sine_engine::set_frequency(float hz) {
        if (!(hz > 0.0f)) {
            throw config_error("sine_engine: frequency must be positive");
        }
        m_frequency.store(hz, std::memory_order_relaxed);
    }

} // namespace ringplay
