#include <ringplay/demand_channel.hh>
#include <ringplay/error.hh>
#include <SDL3/SDL_error.h>
#include <SDL3/SDL_mutex.h>
#include <string>

namespace ringplay {

    demand_channel::demand_channel()
        : m_wakeup(SDL_CreateSemaphore(0)) {
        if (!m_wakeup) {
            const char* error = SDL_GetError();
            throw ringplay_error(std::string("Failed to create demand semaphore: ") +
                                 (error ? error : "Unknown SDL error"));
        }
    }

    demand_channel::~demand_channel() {
        SDL_DestroySemaphore(m_wakeup);
    }

    void demand_channel::send(samples_t samples) noexcept {
        if (samples == 0) {
            return;
        }
        m_sent.fetch_add(1, std::memory_order_relaxed);
        // Only the transition from empty posts a wakeup; the semaphore count
        // therefore stays bounded no matter how often the consumer asks.
        if (m_pending.exchange(samples, std::memory_order_acq_rel) == 0) {
            SDL_SignalSemaphore(m_wakeup);
        } else {
            m_coalesced.fetch_add(1, std::memory_order_relaxed);
        }
    }

    std::optional<samples_t> demand_channel::take_pending() noexcept {
        const samples_t pending = m_pending.exchange(0, std::memory_order_acq_rel);
        if (pending == 0) {
            return std::nullopt;
        }
        return pending;
    }

    std::optional<samples_t> demand_channel::try_receive() noexcept {
        auto pending = take_pending();
        if (pending) {
            // Every empty to pending transition posted one token; take it with
            // the request so the count never outgrows the mailbox.
            SDL_TryWaitSemaphore(m_wakeup);
        }
        return pending;
    }

    std::optional<samples_t> demand_channel::wait(std::chrono::milliseconds timeout) {
        if (m_closed.load(std::memory_order_acquire)) {
            return std::nullopt;
        }
        if (auto pending = try_receive()) {
            return pending;
        }
        if (!SDL_WaitSemaphoreTimeout(m_wakeup, static_cast<Sint32>(timeout.count()))) {
            // timed out, but a request may have landed after the wait expired
            return try_receive();
        }
        if (m_closed.load(std::memory_order_acquire)) {
            return std::nullopt;
        }
        // The token was taken by the wait itself. An empty mailbox here means a
        // request was already drained by try_receive before its sender posted.
        return take_pending();
    }

    void demand_channel::close() noexcept {
        m_closed.store(true, std::memory_order_release);
        SDL_SignalSemaphore(m_wakeup);
    }

    void demand_channel::reopen() noexcept {
        while (SDL_TryWaitSemaphore(m_wakeup)) {
        }
        m_pending.store(0, std::memory_order_release);
        m_closed.store(false, std::memory_order_release);
    }

    bool demand_channel::is_closed() const noexcept {
        return m_closed.load(std::memory_order_acquire);
    }

    uint64_t demand_channel::sent() const noexcept {
        return m_sent.load(std::memory_order_relaxed);
    }

    uint64_t demand_channel::coalesced() const noexcept {
        return m_coalesced.load(std::memory_order_relaxed);
    }

} // namespace ringplay
