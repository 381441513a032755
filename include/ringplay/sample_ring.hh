/**
 * @file sample_ring.hh
 * @brief Lock-free single-producer/single-consumer ring of interleaved samples
 * @ingroup pipeline
 */

#ifndef RINGPLAY_SAMPLE_RING_HH
#define RINGPLAY_SAMPLE_RING_HH

#include <array>
#include <atomic>
#include <ringplay/export_ringplay.h>
#include <ringplay/sdk/buffer.hh>
#include <ringplay/sdk/types.hh>

namespace ringplay {

    /**
     * @brief Position of each word in the shared control region
     */
    enum class control_word : std::size_t {
        write_index = 0,   ///< Next sample slot the producer writes (mod capacity)
        read_index = 1,    ///< Next sample slot the consumer reads (mod capacity)
        available = 2,     ///< Samples written but not yet read
        version = 3        ///< Incremented once per produced block
    };

    /**
     * @brief Four 32-bit control words shared by producer and consumer
     */
    using control_block = std::array<std::atomic<uint32_t>, 4>;

    /**
     * @brief Outcome of a consumer read
     */
    enum class consume_result {
        delivered,   ///< The requested samples were copied out
        underrun     ///< Not enough samples were available; nothing was touched
    };

    /**
     * @class sample_ring
     * @brief Bounded circular buffer shared between one producer and one consumer
     * @ingroup pipeline
     *
     * The ring stores channel-interleaved floats. Its capacity is always a
     * whole number of compute blocks, so a block write wraps in at most two
     * contiguous segments.
     *
     * ## Ownership of the control words
     *
     * | word          | written by | how                       |
     * |---------------|------------|---------------------------|
     * | write_index   | producer   | plain store               |
     * | read_index    | consumer   | plain store               |
     * | available     | both       | fetch_add / fetch_sub     |
     * | version       | producer   | fetch_add                 |
     *
     * @c available is never recomputed from the two indices; each side only
     * adds or subtracts what it moved.
     *
     * @warning try_consume() may only be called from the consumer context and
     *          produce_block() only from the producer context.
     */
    class RINGPLAY_EXPORT sample_ring {
        public:
            /**
             * @brief Allocate a ring of @p blocks blocks
             * @param blocks Number of blocks the ring can hold
             * @param frames_per_block Frames produced per compute call
             * @param channels Interleaved channel count
             * @throws config_error if any argument is zero or the capacity
             *         does not fit the 32-bit control words
             */
            sample_ring(std::size_t blocks, frames_t frames_per_block, channels_t channels);

            /**
             * @brief Allocate a ring from a raw sample capacity
             * @throws config_error if @p capacity is not a positive multiple
             *         of frames_per_block * channels
             */
            static sample_ring with_capacity(samples_t capacity, frames_t frames_per_block, channels_t channels);

            sample_ring(const sample_ring&) = delete;
            sample_ring& operator=(const sample_ring&) = delete;

            /**
             * @brief Consumer side: copy @p count samples out of the ring
             *
             * Reads @c available once. If it is less than @p count the call
             * returns consume_result::underrun and leaves @p out and the ring
             * untouched. Otherwise the samples starting at read_index are
             * copied (wrapping), read_index advances and @c available is
             * decremented by @p count.
             *
             * Never blocks and never allocates.
             *
             * @throws config_error if @p count exceeds capacity()
             */
            consume_result try_consume(float* out, samples_t count);

            /**
             * @brief Producer side: append exactly one block
             * @param block Pointer to block_samples() interleaved samples
             *
             * Writes at write_index (wrapping), advances write_index, then
             * adds block_samples() to @c available and 1 to @c version.
             *
             * @throws state_error if less than one block of free space remains
             */
            void produce_block(const float* block);

            /// Samples ready for the consumer.
            [[nodiscard]] samples_t available() const noexcept;

            /// capacity() - available().
            [[nodiscard]] samples_t free_space() const noexcept;

            /// Number of blocks produced so far (wraps at 2^32).
            [[nodiscard]] uint32_t version() const noexcept;

            [[nodiscard]] samples_t read_index() const noexcept;
            [[nodiscard]] samples_t write_index() const noexcept;

            [[nodiscard]] samples_t capacity() const noexcept { return m_capacity; }
            [[nodiscard]] samples_t block_samples() const noexcept { return m_block_samples; }
            [[nodiscard]] frames_t frames_per_block() const noexcept { return m_frames_per_block; }
            [[nodiscard]] channels_t channels() const noexcept { return m_channels; }
            [[nodiscard]] std::size_t blocks() const noexcept { return m_capacity / m_block_samples; }

            /**
             * @brief The shared control region
             *
             * Layout: word0 write_index, word1 read_index, word2 available,
             * word3 version.
             */
            [[nodiscard]] const control_block& control_words() const noexcept { return m_control; }

            /// Flat interleaved sample storage of capacity() floats.
            [[nodiscard]] const float* samples() const noexcept { return m_samples.data(); }

        private:
            std::atomic<uint32_t>& word(control_word w) noexcept {
                return m_control[static_cast<std::size_t>(w)];
            }

            const std::atomic<uint32_t>& word(control_word w) const noexcept {
                return m_control[static_cast<std::size_t>(w)];
            }

            buffer<float> m_samples;
            control_block m_control;
            samples_t m_capacity;
            samples_t m_block_samples;
            frames_t m_frames_per_block;
            channels_t m_channels;
    };

} // namespace ringplay

#endif // RINGPLAY_SAMPLE_RING_HH
