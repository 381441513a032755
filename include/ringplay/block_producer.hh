/**
 * @file block_producer.hh
 * @brief Non-real-time side of the pipeline
 * @ingroup pipeline
 */

#ifndef RINGPLAY_BLOCK_PRODUCER_HH
#define RINGPLAY_BLOCK_PRODUCER_HH

#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>
#include <ringplay/export_ringplay.h>
#include <ringplay/sdk/buffer.hh>
#include <ringplay/sdk/types.hh>

namespace ringplay {
    class sample_ring;
    class compute_engine;
    class demand_channel;
    class diagnostics;
    class block_consumer;

    /**
     * @brief Outcome of one fill cycle
     */
    struct fill_result {
        std::size_t blocks_produced = 0;  ///< Blocks committed to the ring
        bool failed = false;              ///< The engine threw; the cycle was abandoned
        bool stopped = false;             ///< The stop flag ended the cycle early
    };

    /**
     * @class block_producer
     * @brief Refills the sample ring from the compute engine on demand
     * @ingroup pipeline
     *
     * A demand for M samples sets the target occupancy to
     * M * ring.blocks(), capped at the ring capacity. The producer then calls
     * the engine one block at a time until the ring holds at least the target
     * or has no room for another block.
     *
     * The engine writes into a private scratch block. Only a block the engine
     * finished without throwing is passed to sample_ring::produce_block(), so
     * a failure never leaves a partial block in the ring. The failure is
     * reported once through diagnostics and the rest of the cycle is skipped;
     * the next demand starts a fresh one.
     *
     * start() runs the message loop on a dedicated thread: wait for a demand,
     * fill, report consumer underruns, repeat. Demands are handled one at a
     * time in the order they arrive.
     */
    class RINGPLAY_EXPORT block_producer {
        public:
            /**
             * @param consumer Optional; when given, its underruns are
             *        reported through @p diag by the message loop
             * @throws config_error if the engine's channel count differs
             *         from the ring's
             */
            block_producer(sample_ring& ring,
                           compute_engine& engine,
                           demand_channel& demands,
                           diagnostics& diag,
                           const block_consumer* consumer = nullptr);
            ~block_producer();

            block_producer(const block_producer&) = delete;
            block_producer& operator=(const block_producer&) = delete;

            /**
             * @brief Run one fill cycle for a demand of @p min_samples
             *
             * Must only be called from one thread at a time, and not while
             * the message loop is running.
             */
            fill_result fill(samples_t min_samples);

            /**
             * @brief Fill the ring completely before playback starts
             */
            fill_result prime();

            /**
             * @brief Launch the message loop thread
             * @throws state_error if it is already running
             */
            void start();

            /**
             * @brief Stop the message loop and join its thread
             *
             * An in-flight fill finishes the block it is computing and then
             * returns. Safe to call when not running.
             */
            void stop();

            [[nodiscard]] bool is_running() const noexcept;

            /// Total engine invocations, successful or not.
            [[nodiscard]] uint64_t engine_calls() const noexcept;

            /// Total blocks committed to the ring.
            [[nodiscard]] uint64_t blocks_produced() const noexcept;

            /// How long the loop waits for a demand before checking for underruns.
            /// May be changed while the loop runs; it applies from the next wait.
            void set_poll_interval(std::chrono::milliseconds interval) noexcept;

        private:
            void run();
            samples_t target_for(samples_t min_samples) const noexcept;

            sample_ring& m_ring;
            compute_engine& m_engine;
            demand_channel& m_demands;
            diagnostics& m_diag;
            const block_consumer* m_consumer;

            buffer<float> m_scratch;
            std::thread m_thread;
            std::atomic<bool> m_stop{false};
            std::atomic<bool> m_running{false};
            std::atomic<uint64_t> m_engine_calls{0};
            std::atomic<uint64_t> m_blocks_produced{0};
            std::atomic<int64_t> m_poll_interval_ms{50};
    };

} // namespace ringplay

#endif // RINGPLAY_BLOCK_PRODUCER_HH
