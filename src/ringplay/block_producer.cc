#include <ringplay/block_producer.hh>
#include <ringplay/block_consumer.hh>
#include <ringplay/demand_channel.hh>
#include <ringplay/diagnostics.hh>
#include <ringplay/sample_ring.hh>
#include <ringplay/sdk/compute_engine.hh>
#include <ringplay/error.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <exception>
#include <string>

namespace ringplay {

    block_producer::block_producer(sample_ring& ring,
                                   compute_engine& engine,
                                   demand_channel& demands,
                                   diagnostics& diag,
                                   const block_consumer* consumer)
        : m_ring(ring),
          m_engine(engine),
          m_demands(demands),
          m_diag(diag),
          m_consumer(consumer),
          m_scratch(ring.block_samples()) {
        if (engine.channels() != ring.channels()) {
            throw config_error("block_producer: engine '" + engine.get_name() + "' has " +
                               std::to_string(engine.channels()) + " channels, ring has " +
                               std::to_string(ring.channels()));
        }
    }

    block_producer::~block_producer() {
        stop();
    }

    samples_t block_producer::target_for(samples_t min_samples) const noexcept {
        const auto target = static_cast<uint64_t>(min_samples) * m_ring.blocks();
        return static_cast<samples_t>(std::min<uint64_t>(target, m_ring.capacity()));
    }

    fill_result block_producer::fill(samples_t min_samples) {
        fill_result result;
        const samples_t target = target_for(min_samples);

        while (m_ring.available() < target && m_ring.free_space() >= m_ring.block_samples()) {
            if (m_stop.load(std::memory_order_acquire)) {
                result.stopped = true;
                break;
            }

            m_engine_calls.fetch_add(1, std::memory_order_relaxed);
            try {
                m_engine.process_block(m_scratch.data(), m_ring.frames_per_block());
            } catch (const std::exception& e) {
                m_diag.record_compute_error(e.what());
                result.failed = true;
                break;
            }

            m_ring.produce_block(m_scratch.data());
            m_blocks_produced.fetch_add(1, std::memory_order_relaxed);
            ++result.blocks_produced;
        }
        return result;
    }

    fill_result block_producer::prime() {
        return fill(m_ring.capacity());
    }

    void block_producer::start() {
        if (m_running.load(std::memory_order_acquire)) {
            throw state_error("block_producer: already running");
        }
        if (m_thread.joinable()) {
            // the previous loop ended on its own
            m_thread.join();
        }
        m_stop.store(false, std::memory_order_release);
        m_demands.reopen();
        m_running.store(true, std::memory_order_release);
        m_thread = std::thread([this] { run(); });
    }

    void block_producer::stop() {
        m_stop.store(true, std::memory_order_release);
        m_demands.close();
        if (m_thread.joinable()) {
            m_thread.join();
        }
        m_running.store(false, std::memory_order_release);
    }

    bool block_producer::is_running() const noexcept {
        return m_running.load(std::memory_order_acquire);
    }

    uint64_t block_producer::engine_calls() const noexcept {
        return m_engine_calls.load(std::memory_order_relaxed);
    }

    uint64_t block_producer::blocks_produced() const noexcept {
        return m_blocks_produced.load(std::memory_order_relaxed);
    }

    void block_producer::set_poll_interval(std::chrono::milliseconds interval) noexcept {
        m_poll_interval_ms.store(static_cast<int64_t>(interval.count()), std::memory_order_relaxed);
    }

    void block_producer::run() {
        LOG_INFO("block_producer", "Producer loop started for", m_engine.get_name());
        try {
            while (!m_stop.load(std::memory_order_acquire)) {
                const auto demand = m_demands.wait(
                    std::chrono::milliseconds(m_poll_interval_ms.load(std::memory_order_relaxed)));
                if (m_consumer) {
                    m_diag.collect_underruns(*m_consumer);
                }
                if (!demand) {
                    continue;
                }
                const auto result = fill(*demand);
                if (result.failed) {
                    LOG_WARN("block_producer", "Fill abandoned after", result.blocks_produced, "blocks");
                }
            }
        } catch (const std::exception& e) {
            LOG_ERROR("block_producer", "Producer loop terminated:", e.what());
            m_diag.record_compute_error(std::string("producer loop terminated: ") + e.what());
        }
        m_running.store(false, std::memory_order_release);
        LOG_INFO("block_producer", "Producer loop stopped");
    }

} // namespace ringplay
