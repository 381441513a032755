#include <ringplay/sample_ring.hh>
#include <ringplay/error.hh>
#include <algorithm>
#include <limits>
#include <string>

namespace ringplay {

    namespace {
        samples_t checked_capacity(std::size_t blocks, frames_t frames_per_block, channels_t channels) {
            if (blocks == 0) {
                throw config_error("sample_ring: blocks per queue must be positive");
            }
            if (frames_per_block == 0) {
                throw config_error("sample_ring: frames per block must be positive");
            }
            if (channels == 0) {
                throw config_error("sample_ring: channel count must be positive");
            }
            const auto block = static_cast<uint64_t>(frames_per_block) * channels;
            const auto capacity = block * blocks;
            // available is a 32-bit word; keep the largest sum representable.
            if (capacity > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
                throw config_error("sample_ring: capacity " + std::to_string(capacity) +
                                   " does not fit the control words");
            }
            return static_cast<samples_t>(capacity);
        }
    }

    sample_ring::sample_ring(std::size_t blocks, frames_t frames_per_block, channels_t channels)
        : m_samples(checked_capacity(blocks, frames_per_block, channels)),
          m_capacity(static_cast<samples_t>(m_samples.size())),
          m_block_samples(frames_per_block * channels),
          m_frames_per_block(frames_per_block),
          m_channels(channels) {
        for (auto& w : m_control) {
            w.store(0, std::memory_order_relaxed);
        }
    }

    sample_ring sample_ring::with_capacity(samples_t capacity, frames_t frames_per_block, channels_t channels) {
        const auto block = static_cast<samples_t>(frames_per_block) * channels;
        if (block == 0) {
            throw config_error("sample_ring: block size must be positive");
        }
        if (capacity == 0 || capacity % block != 0) {
            throw config_error("sample_ring: capacity " + std::to_string(capacity) +
                               " is not a multiple of the block size " + std::to_string(block));
        }
        return sample_ring(capacity / block, frames_per_block, channels);
    }

    consume_result sample_ring::try_consume(float* out, samples_t count) {
        if (count > m_capacity) {
            throw config_error("sample_ring: read of " + std::to_string(count) +
                               " samples exceeds capacity " + std::to_string(m_capacity));
        }

        // acquire pairs with the producer's release increment: every sample
        // counted here has been written.
        if (word(control_word::available).load(std::memory_order_acquire) < count) {
            return consume_result::underrun;
        }

        const samples_t read = word(control_word::read_index).load(std::memory_order_relaxed);
        const samples_t first = std::min(count, m_capacity - read);
        m_samples.copy_out(read, out, first);
        if (first < count) {
            m_samples.copy_out(0, out + first, count - first);
        }

        word(control_word::read_index).store((read + count) % m_capacity, std::memory_order_relaxed);
        // release: the slots are free for the producer only after the copy.
        word(control_word::available).fetch_sub(count, std::memory_order_acq_rel);
        return consume_result::delivered;
    }

    void sample_ring::produce_block(const float* block) {
        if (free_space() < m_block_samples) {
            throw state_error("sample_ring: no room for a block (" + std::to_string(available()) +
                              " of " + std::to_string(m_capacity) + " samples in use)");
        }

        const samples_t write = word(control_word::write_index).load(std::memory_order_relaxed);
        const samples_t first = std::min(m_block_samples, m_capacity - write);
        m_samples.copy_in(write, block, first);
        if (first < m_block_samples) {
            m_samples.copy_in(0, block + first, m_block_samples - first);
        }

        word(control_word::write_index).store((write + m_block_samples) % m_capacity, std::memory_order_relaxed);
        word(control_word::available).fetch_add(m_block_samples, std::memory_order_acq_rel);
        word(control_word::version).fetch_add(1, std::memory_order_release);
    }

    samples_t sample_ring::available() const noexcept {
        return word(control_word::available).load(std::memory_order_acquire);
    }

    samples_t sample_ring::free_space() const noexcept {
        return m_capacity - available();
    }

    uint32_t sample_ring::version() const noexcept {
        return word(control_word::version).load(std::memory_order_acquire);
    }

    samples_t sample_ring::read_index() const noexcept {
        return word(control_word::read_index).load(std::memory_order_relaxed);
    }

    samples_t sample_ring::write_index() const noexcept {
        return word(control_word::write_index).load(std::memory_order_relaxed);
    }

} // namespace ringplay
