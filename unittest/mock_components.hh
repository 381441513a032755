#ifndef RINGPLAY_MOCK_COMPONENTS_HH
#define RINGPLAY_MOCK_COMPONENTS_HH

#include <ringplay/sdk/compute_engine.hh>
#include <ringplay/sdk/types.hh>
#include <ringplay/error.hh>
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace ringplay::test {

// Engine that writes a running sample counter (0, 1, 2, ...) so tests can
// verify ordering and wraparound. Optionally throws compute_error on the
// Nth call (1-based).
class sequence_engine : public compute_engine {
public:
    explicit sequence_engine(channels_t channels = 2) : m_channels(channels) {}

    channels_t channels() const override { return m_channels; }

    void prepare(sample_rate_t sample_rate, frames_t frames_per_block) override {
        prepare_calls++;
        m_sample_rate = sample_rate;
        m_frames_per_block = frames_per_block;
    }

    void process_block(float* out, frames_t frames) override {
        const auto call = ++calls;
        if (fail_on_call != 0 && (call == fail_on_call || (fail_always_after && call > fail_on_call))) {
            throw compute_error("sequence_engine: injected failure on call " + std::to_string(call));
        }
        const auto count = static_cast<size_t>(frames) * m_channels;
        for (size_t i = 0; i < count; ++i) {
            out[i] = static_cast<float>(m_next++);
        }
    }

    std::string get_name() const override { return "sequence_engine"; }

    sample_rate_t sample_rate() const { return m_sample_rate; }
    frames_t frames_per_block() const { return m_frames_per_block; }

    // Statistics for testing
    std::atomic<uint64_t> calls{0};
    std::atomic<int> prepare_calls{0};

    // Error injection
    uint64_t fail_on_call{0};
    bool fail_always_after{false};

private:
    channels_t m_channels;
    sample_rate_t m_sample_rate = 0;
    frames_t m_frames_per_block = 0;
    uint64_t m_next = 0;
};

// Engine that fills every sample with a fixed value.
class constant_engine : public compute_engine {
public:
    constant_engine(channels_t channels, float value) : m_channels(channels), m_value(value) {}

    channels_t channels() const override { return m_channels; }
    void prepare(sample_rate_t, frames_t) override {}

    void process_block(float* out, frames_t frames) override {
        calls++;
        const auto count = static_cast<size_t>(frames) * m_channels;
        for (size_t i = 0; i < count; ++i) {
            out[i] = m_value;
        }
    }

    std::string get_name() const override { return "constant_engine"; }

    std::atomic<uint64_t> calls{0};

private:
    channels_t m_channels;
    float m_value;
};

// Engine whose prepare() rejects everything
class unpreparable_engine : public constant_engine {
public:
    explicit unpreparable_engine(channels_t channels) : constant_engine(channels, 0.0f) {}

    void prepare(sample_rate_t, frames_t) override {
        throw compute_error("unpreparable_engine: refusing to prepare");
    }
};

// Builds a block of the given size holding first, first + 1, ...
inline std::vector<float> make_block(size_t samples, float first) {
    std::vector<float> block(samples);
    for (size_t i = 0; i < samples; ++i) {
        block[i] = first + static_cast<float>(i);
    }
    return block;
}

} // namespace ringplay::test

#endif // RINGPLAY_MOCK_COMPONENTS_HH
