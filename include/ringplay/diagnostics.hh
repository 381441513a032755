//
// Non-real-time reporting path for the playback pipeline.
//

#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <ringplay/export_ringplay.h>
#include <ringplay/sdk/types.hh>

namespace ringplay {
    class block_consumer;

    /**
     * @brief What a diagnostic_event reports
     */
    enum class diagnostic_kind {
        underrun,       ///< The consumer played silence
        compute_error,  ///< The compute engine failed and a fill was abandoned
        info            ///< Lifecycle messages
    };

    struct diagnostic_event {
        diagnostic_kind kind = diagnostic_kind::info;
        samples_t needed = 0;       ///< underrun: samples the consumer asked for
        samples_t available = 0;    ///< underrun: samples the ring held at that moment
        uint64_t count = 0;         ///< underrun: underruns folded into this event
        std::string message;
    };

    /**
     * diagnostics collects events on the producer thread and hands them to
     * the application on whichever thread calls dispatch(). Each recorded
     * event is logged right away as well.
     *
     * The real-time consumer never touches this class. Its underruns are
     * picked up by collect_underruns(), which turns the growth of the
     * consumer's atomic counter into one event.
     */
    class RINGPLAY_EXPORT diagnostics {
        public:
            using handler_t = std::function<void(const diagnostic_event&)>;

            diagnostics() = default;
            diagnostics(const diagnostics&) = delete;
            diagnostics& operator=(const diagnostics&) = delete;

            void record_underrun(samples_t needed, samples_t available, uint64_t count);
            void record_compute_error(const std::string& message);
            void record_info(const std::string& message);

            /**
             * Report underruns that happened since the previous call.
             * @return true if an event was recorded
             */
            bool collect_underruns(const block_consumer& consumer);

            /**
             * Deliver and remove all queued events, oldest first.
             * @return number of events delivered
             */
            std::size_t dispatch(const handler_t& handler);

            /// Drop queued events without delivering them.
            void clear();

            [[nodiscard]] std::size_t pending() const;
            [[nodiscard]] uint64_t compute_errors() const;
            [[nodiscard]] uint64_t underrun_events() const;

        private:
            void push(diagnostic_event ev);

            std::deque<diagnostic_event> m_queue;
            mutable std::mutex m_mutex;
            uint64_t m_compute_errors = 0;
            uint64_t m_underrun_events = 0;
            uint64_t m_reported_underruns = 0;
    };

} // namespace ringplay
