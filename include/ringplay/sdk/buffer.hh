/**
 * @file buffer.hh
 * @brief Fixed-size, zero-initialized sample storage
 * @ingroup sdk
 */

#pragma once

#include <algorithm>
#include <cstring>
#include <memory>
#include <type_traits>
#include <stdexcept>

namespace ringplay {
    /**
     * @class buffer
     * @brief RAII array whose size is fixed at construction
     * @tparam T Element type (must be trivially copyable)
     * @ingroup sdk
     *
     * Storage for the sample ring, the producer's scratch block and the
     * backends' period buffers. All of them are allocated once outside the
     * real-time thread and never grow, so buffer offers no resize.
     *
     * - **Zero-initialization**: silence is the initial content
     * - **Trivially copyable only**: segments are moved with memcpy
     * - **Move-only**: ownership is handed over, never shared
     */
    template<typename T>
    class buffer final {
        static_assert(std::is_trivially_copyable_v<T>, "buffer<T> requires trivially copyable T");
    public:
        buffer() noexcept
            : m_size(0) {
        }

        /**
         * @brief Construct buffer with specified size
         * @param size Number of elements
         */
        explicit buffer(std::size_t size)
            : m_data(std::make_unique<T[]>(size)), m_size(size) {
            std::fill_n(m_data.get(), m_size, T{});
        }

        buffer(buffer&&) noexcept = default;
        buffer& operator=(buffer&&) noexcept = default;
        buffer(const buffer&) = delete;
        buffer& operator=(const buffer&) = delete;

        [[nodiscard]] std::size_t size() const noexcept {
            return m_size;
        }

        [[nodiscard]] bool empty() const noexcept {
            return m_size == 0;
        }

        T* data() noexcept { return m_data.get(); }
        const T* data() const noexcept { return m_data.get(); }

        /**
         * @brief Bounds-checked element access
         * @throws std::out_of_range if pos >= size()
         */
        T& at(std::size_t pos) {
            if (pos >= m_size) throw std::out_of_range("buffer index out of range");
            return m_data[pos];
        }

        const T& at(std::size_t pos) const {
            if (pos >= m_size) throw std::out_of_range("buffer index out of range");
            return m_data[pos];
        }

        /// Overwrite every element with T{} (silence for sample types).
        void clear() noexcept {
            std::fill_n(m_data.get(), m_size, T{});
        }

        /**
         * @brief Copy @p count elements into the buffer starting at @p pos
         * @warning No bounds checking; callers split wrapping copies themselves
         */
        void copy_in(std::size_t pos, const T* src, std::size_t count) noexcept {
            std::memcpy(m_data.get() + pos, src, sizeof(T) * count);
        }

        /**
         * @brief Copy @p count elements starting at @p pos out of the buffer
         * @warning No bounds checking
         */
        void copy_out(std::size_t pos, T* dst, std::size_t count) const noexcept {
            std::memcpy(dst, m_data.get() + pos, sizeof(T) * count);
        }

        T& operator[](std::size_t pos) noexcept { return m_data[pos]; }
        const T& operator[](std::size_t pos) const noexcept { return m_data[pos]; }

        T* begin() noexcept { return data(); }
        T* end() noexcept { return data() + size(); }
        const T* begin() const noexcept { return data(); }
        const T* end() const noexcept { return data() + size(); }

    private:
        std::unique_ptr<T[]> m_data;  ///< Buffer data
        std::size_t m_size;           ///< Number of elements
    };
}
