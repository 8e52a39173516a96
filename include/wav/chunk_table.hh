/**
 * @file chunk_table.hh
 * @brief Fixed-capacity ordered chunk sequence
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <array>
#include <cstddef>

#include <wav/chunk.hh>

namespace wav {

    /**
     * @class chunk_list
     * @brief Ordered chunk sequence over caller-provided storage
     *
     * Never allocates. push_back() refuses new entries once the storage
     * is full; the scanner uses that as its stop condition.
     */
    class chunk_list {
    public:
        chunk_list(chunk* storage, std::size_t capacity) noexcept
            : m_storage(storage), m_capacity(capacity), m_count(0) {}

        chunk_list(const chunk_list&) = delete;
        chunk_list& operator=(const chunk_list&) = delete;

        /**
         * @brief Append a chunk
         * @return false if the list is full
         */
        bool push_back(const chunk& c) noexcept {
            if (full()) {
                return false;
            }
            m_storage[m_count++] = c;
            return true;
        }

        void clear() noexcept { m_count = 0; }

        [[nodiscard]] std::size_t size() const noexcept { return m_count; }
        [[nodiscard]] std::size_t capacity() const noexcept { return m_capacity; }
        [[nodiscard]] bool empty() const noexcept { return m_count == 0; }
        [[nodiscard]] bool full() const noexcept { return m_count == m_capacity; }

        const chunk& operator[](std::size_t i) const noexcept { return m_storage[i]; }

        [[nodiscard]] const chunk* begin() const noexcept { return m_storage; }
        [[nodiscard]] const chunk* end() const noexcept { return m_storage + m_count; }

        /**
         * @brief First chunk of the given kind
         * @return Pointer into the list, nullptr if absent
         */
        [[nodiscard]] const chunk* find(chunk_kind kind) const noexcept {
            for (const auto& c : *this) {
                if (c.kind == kind) {
                    return &c;
                }
            }
            return nullptr;
        }

    private:
        chunk* m_storage;
        std::size_t m_capacity;
        std::size_t m_count;
    };

    namespace detail {
        template<std::size_t N>
        struct chunk_storage {
            std::array<chunk, N> m_chunks{};
        };
    }

    /**
     * @class chunk_table
     * @brief chunk_list with inline storage for @p N chunks
     *
     * The storage base is listed first so the array exists before the
     * chunk_list view is pointed at it.
     */
    template<std::size_t N>
    class chunk_table : private detail::chunk_storage<N>, public chunk_list {
        static_assert(N > 0, "chunk_table needs room for at least one chunk");
    public:
        chunk_table() noexcept
            : detail::chunk_storage<N>()
            , chunk_list(this->m_chunks.data(), N) {}
    };

} // namespace wav
