#ifndef RINGPLAY_BENCHMARK_HELPERS_HH
#define RINGPLAY_BENCHMARK_HELPERS_HH

#include <ringplay/sdk/compute_engine.hh>
#include <ringplay/sdk/types.hh>
#include <string>

namespace ringplay::benchmark {

// Engine with negligible cost so benchmarks measure the pipeline, not DSP
class benchmark_engine : public compute_engine {
    channels_t m_channels;
    float m_value = 0.0f;

public:
    explicit benchmark_engine(channels_t channels) : m_channels(channels) {}

    channels_t channels() const override { return m_channels; }
    void prepare(sample_rate_t /*sample_rate*/, frames_t /*frames_per_block*/) override {}

    void process_block(float* out, frames_t frames) override {
        const auto count = static_cast<size_t>(frames) * m_channels;
        for (size_t i = 0; i < count; ++i) {
            out[i] = m_value;
        }
        m_value += 0.001f;
    }

    std::string get_name() const override { return "benchmark_engine"; }
};

} // namespace ringplay::benchmark

#endif // RINGPLAY_BENCHMARK_HELPERS_HH
