/**
 * @file compute_engine.hh
 * @brief Interface of the block-producing audio engine
 * @ingroup sdk
 */

#ifndef RINGPLAY_SDK_COMPUTE_ENGINE_HH
#define RINGPLAY_SDK_COMPUTE_ENGINE_HH

#include <string>
#include <ringplay/sdk/types.hh>

namespace ringplay {

/**
 * @class compute_engine
 * @brief Source of fixed-size interleaved sample blocks
 * @ingroup sdk
 *
 * The playback pipeline treats the engine as a black box: it is asked for
 * one block at a time, from the producer thread only, and may take as long
 * as it needs. How the block is computed (a DSP graph, a synthesizer, a
 * decoder) is up to the implementation.
 *
 * ## Implementing an Engine
 *
 * @code
 * class noise_engine : public compute_engine {
 * public:
 *     channels_t channels() const override { return 2; }
 *     void prepare(sample_rate_t, frames_t) override {}
 *     void process_block(float* out, frames_t frames) override {
 *         for (frames_t i = 0; i < frames * 2; ++i) {
 *             out[i] = next_random();
 *         }
 *     }
 * };
 * @endcode
 *
 * ## Thread Safety
 *
 * Engines are not required to be thread-safe. The pipeline never calls an
 * engine from more than one thread and never from the real-time thread.
 */
class compute_engine {
public:
    virtual ~compute_engine() = default;

    /**
     * Number of interleaved channels in every block.
     */
    virtual channels_t channels() const = 0;

    /**
     * Called once before the first block.
     * @param sample_rate Playback sample rate in Hz
     * @param frames_per_block Frames every later process_block() must fill
     * @throws config_error if the engine cannot run with these parameters
     */
    virtual void prepare(sample_rate_t sample_rate, frames_t frames_per_block) = 0;

    /**
     * Compute exactly one block.
     * @param out Destination for frames * channels() interleaved samples
     * @param frames Frames per block, as passed to prepare()
     * @throws compute_error on failure; the content of @p out is then
     *         discarded by the caller
     */
    virtual void process_block(float* out, frames_t frames) = 0;

    /**
     * Human-readable name used in log messages.
     */
    virtual std::string get_name() const { return "engine"; }
};

} // namespace ringplay

#endif // RINGPLAY_SDK_COMPUTE_ENGINE_HH
