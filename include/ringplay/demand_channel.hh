/**
 * @file demand_channel.hh
 * @brief Real-time safe "need more samples" notification
 * @ingroup pipeline
 */

#ifndef RINGPLAY_DEMAND_CHANNEL_HH
#define RINGPLAY_DEMAND_CHANNEL_HH

#include <atomic>
#include <chrono>
#include <optional>
#include <ringplay/export_ringplay.h>
#include <ringplay/sdk/types.hh>

struct SDL_Semaphore;

namespace ringplay {

    /**
     * @class demand_channel
     * @brief One-slot mailbox from the real-time consumer to the producer loop
     * @ingroup pipeline
     *
     * send() stores the requested sample count and wakes the receiver. The
     * mailbox holds a single request: a send that arrives before the previous
     * one was received replaces it (latest wins) and does not post another
     * wakeup, so a stalled producer never accumulates a backlog.
     *
     * send() is lock-free and allocation-free. Waking uses an SDL semaphore
     * whose signal operation does not block. Receiving a request also takes
     * its wakeup token, so the semaphore count stays at most one above the
     * number of pending requests.
     *
     * The receiving side tolerates lost and duplicated requests: a request
     * that arrives when the ring is already full produces nothing.
     */
    class RINGPLAY_EXPORT demand_channel {
        public:
            /**
             * @throws ringplay_error if the semaphore cannot be created
             */
            demand_channel();
            ~demand_channel();

            demand_channel(const demand_channel&) = delete;
            demand_channel& operator=(const demand_channel&) = delete;

            /**
             * @brief Request at least @p samples more samples
             *
             * Safe to call from the real-time thread. A zero request is ignored.
             */
            void send(samples_t samples) noexcept;

            /**
             * @brief Take the pending request without waiting
             * @return The latest request, or nothing if the mailbox is empty
             */
            std::optional<samples_t> try_receive() noexcept;

            /**
             * @brief Wait up to @p timeout for a request
             * @return The latest request, or nothing on timeout or after close()
             */
            std::optional<samples_t> wait(std::chrono::milliseconds timeout);

            /// Wake any waiting receiver; later waits return immediately.
            void close() noexcept;

            /// Re-arm a closed channel and drop any stale request.
            void reopen() noexcept;

            [[nodiscard]] bool is_closed() const noexcept;

            /// Total number of accepted send() calls.
            [[nodiscard]] uint64_t sent() const noexcept;

            /// Sends that replaced a request that was still pending.
            [[nodiscard]] uint64_t coalesced() const noexcept;

        private:
            std::optional<samples_t> take_pending() noexcept;

            SDL_Semaphore* m_wakeup;
            std::atomic<samples_t> m_pending{0};
            std::atomic<bool> m_closed{false};
            std::atomic<uint64_t> m_sent{0};
            std::atomic<uint64_t> m_coalesced{0};
    };

} // namespace ringplay

#endif // RINGPLAY_DEMAND_CHANNEL_HH
