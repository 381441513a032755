#include <ringplay/block_consumer.hh>
#include <ringplay/demand_channel.hh>
#include <ringplay/sample_ring.hh>
#include <ringplay/error.hh>
#include <algorithm>
#include <cstring>
#include <string>

namespace ringplay {

    block_consumer::block_consumer(sample_ring& ring, demand_channel& demands, frames_t period_frames)
        : m_ring(ring),
          m_demands(demands),
          m_period_frames(period_frames),
          m_last_version(ring.version()) {
        if (period_frames == 0) {
            throw config_error("block_consumer: period must be at least one frame");
        }
        const auto needed = static_cast<uint64_t>(period_frames) * ring.channels();
        if (needed > ring.capacity()) {
            throw config_error("block_consumer: period of " + std::to_string(needed) +
                               " samples exceeds ring capacity " + std::to_string(ring.capacity()));
        }
    }

    samples_t block_consumer::period_samples() const noexcept {
        return m_period_frames * m_ring.channels();
    }

    void block_consumer::process(float* out, frames_t frames) noexcept {
        m_callbacks.fetch_add(1, std::memory_order_relaxed);

        const auto needed64 = static_cast<uint64_t>(frames) * m_ring.channels();
        if (needed64 > m_ring.capacity()) {
            // The host changed its period beyond what the ring can ever hold.
            silence(out, static_cast<samples_t>(needed64), m_ring.available());
            return;
        }
        const auto needed = static_cast<samples_t>(needed64);

        const uint32_t version = m_ring.version();
        if (m_ring.try_consume(out, needed) == consume_result::underrun) {
            m_last_version = version;
            silence(out, needed, m_ring.available());
            m_demands.send(needed);
            return;
        }
        m_delivered_frames.fetch_add(frames, std::memory_order_relaxed);

        if (version != m_last_version) {
            m_last_version = version;
            m_demands.send(needed);
        }
    }

    void block_consumer::silence(float* out, samples_t count, samples_t available) noexcept {
        std::fill_n(out, count, 0.0f);
        m_last_needed.store(count, std::memory_order_relaxed);
        m_last_available.store(available, std::memory_order_relaxed);
        m_underruns.fetch_add(1, std::memory_order_release);
    }

    void block_consumer::audio_callback(void* userdata, uint8_t* stream, int len) {
        if (len <= 0) {
            return;
        }
        auto* self = static_cast<block_consumer*>(userdata);
        if (!self) {
            std::memset(stream, 0, static_cast<size_t>(len));
            return;
        }

        const auto bytes = static_cast<size_t>(len);
        const size_t frame_bytes = sizeof(float) * self->m_ring.channels();
        if (bytes % frame_bytes != 0) {
            self->m_callbacks.fetch_add(1, std::memory_order_relaxed);
            std::memset(stream, 0, bytes);
            self->m_last_needed.store(static_cast<samples_t>(bytes / sizeof(float)), std::memory_order_relaxed);
            self->m_last_available.store(self->m_ring.available(), std::memory_order_relaxed);
            self->m_underruns.fetch_add(1, std::memory_order_release);
            return;
        }
        self->process(reinterpret_cast<float*>(stream), static_cast<frames_t>(bytes / frame_bytes));
    }

    consumer_stats block_consumer::stats() const noexcept {
        consumer_stats s;
        s.underruns = m_underruns.load(std::memory_order_acquire);
        s.callbacks = m_callbacks.load(std::memory_order_relaxed);
        s.delivered_frames = m_delivered_frames.load(std::memory_order_relaxed);
        s.last_needed = m_last_needed.load(std::memory_order_relaxed);
        s.last_available = m_last_available.load(std::memory_order_relaxed);
        return s;
    }

    uint64_t block_consumer::underruns() const noexcept {
        return m_underruns.load(std::memory_order_acquire);
    }

    uint64_t block_consumer::callbacks() const noexcept {
        return m_callbacks.load(std::memory_order_relaxed);
    }

    uint64_t block_consumer::delivered_frames() const noexcept {
        return m_delivered_frames.load(std::memory_order_relaxed);
    }

} // namespace ringplay
