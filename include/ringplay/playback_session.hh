/**
 * @file playback_session.hh
 * @brief Wires engine, ring, producer, consumer and device together
 * @ingroup pipeline
 */

#ifndef RINGPLAY_PLAYBACK_SESSION_HH
#define RINGPLAY_PLAYBACK_SESSION_HH

#include <memory>
#include <ringplay/export_ringplay.h>
#include <ringplay/block_consumer.hh>
#include <ringplay/diagnostics.hh>
#include <ringplay/session_config.hh>
#include <ringplay/sdk/audio_format.hh>

namespace ringplay {
    class audio_backend;
    class compute_engine;
    class sample_ring;

    /**
     * @class playback_session
     * @brief Plays the output of a compute engine on an audio device
     * @ingroup pipeline
     *
     * ## Basic Usage
     *
     * @code
     * auto backend = std::shared_ptr<audio_backend>(create_sdl3_backend());
     * backend->init();
     *
     * auto engine = std::make_shared<sine_engine>(2, 440.0f);
     * playback_session session(backend, engine, session_config{});
     * session.start();
     *
     * // on the UI thread, from time to time
     * session.dispatch_diagnostics([](const diagnostic_event& ev) {
     *     show_in_log_panel(ev);
     * });
     *
     * session.stop();
     * @endcode
     *
     * ## Lifecycle
     *
     * start() allocates the ring, prepares the engine, fills the ring once,
     * starts the producer thread and finally attaches the consumer to the
     * device. stop() tears down in the reverse order: the device stream is
     * detached first, so the real-time thread can no longer touch the ring,
     * then the producer thread is stopped, then the ring is released.
     *
     * A stopped session can be started again; each start gets a fresh ring.
     *
     * ## Thread Safety
     *
     * start(), stop() and the accessors are meant for the owning thread.
     * dispatch_diagnostics() may be called from any one thread.
     */
    class RINGPLAY_EXPORT playback_session {
        public:
            /**
             * @param backend Initialized playback host
             * @param engine Block source; used only from the producer thread
             *        while the session runs
             * @param config Ring geometry and device selection
             */
            playback_session(std::shared_ptr<audio_backend> backend,
                             std::shared_ptr<compute_engine> engine,
                             session_config config);

            /**
             * @brief Stops the session if it is running
             */
            ~playback_session();

            playback_session(const playback_session&) = delete;
            playback_session& operator=(const playback_session&) = delete;

            /**
             * @brief Start playback
             * @throws config_error on invalid geometry or an engine whose
             *         channel count does not match
             * @throws device_error if the device or stream cannot be opened
             * @throws state_error if already running
             */
            void start();

            /**
             * @brief Stop playback; does nothing if not running
             */
            void stop();

            [[nodiscard]] bool is_running() const;

            /**
             * @brief Deliver queued diagnostics to @p handler
             * @return Number of events delivered
             */
            std::size_t dispatch_diagnostics(const diagnostics::handler_t& handler);

            [[nodiscard]] diagnostics& get_diagnostics();

            /**
             * @brief The live ring, or nullptr while stopped
             *
             * @warning The pointer is valid only while the session is running.
             * stop() and the destructor release the ring; do not keep the
             * pointer across either call.
             */
            [[nodiscard]] const sample_ring* ring() const;

            /**
             * @brief Consumer counters of the current run (zero while stopped)
             */
            [[nodiscard]] consumer_stats get_consumer_stats() const;

            /**
             * @brief Engine calls made by the producer of the current run
             */
            [[nodiscard]] uint64_t engine_calls() const;

            [[nodiscard]] const session_config& config() const;

            /**
             * @brief The device format reported by the backend at the last start()
             */
            [[nodiscard]] audio_spec device_spec() const;

        private:
            struct impl;
            std::unique_ptr<impl> m_pimpl;
    };

} // namespace ringplay

#endif // RINGPLAY_PLAYBACK_SESSION_HH
