/**
 * @file byte_order.hh
 * @brief Byte order utilities for RIFF/RIFX containers
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

#include <wav/endian.hh>

namespace wav {
    /**
     * @enum byte_order
     * @brief Byte order of multi-byte fields in a container
     */
    enum class byte_order {
        little, ///< RIFF
        big     ///< RIFX
    };

    /**
     * @brief Check if given byte order matches the native system byte order
     */
    constexpr bool byte_order_native(byte_order bo) noexcept {
        return bo == byte_order::little ? is_little_endian : is_big_endian;
    }

    /**
     * @brief Load an integer stored in the given byte order
     * @param src Pointer to at least sizeof(T) bytes
     *
     * No alignment requirement on @p src.
     */
    template<typename T>
    T load(const std::byte* src, byte_order bo) noexcept {
        T value;
        std::memcpy(&value, src, sizeof(T));
        if constexpr (sizeof(T) > 1) {
            if (!byte_order_native(bo)) {
                value = swap_byte_order(value);
            }
        }
        return value;
    }

    inline std::uint16_t load_u16(const std::byte* src, byte_order bo) noexcept {
        return load<std::uint16_t>(src, bo);
    }

    inline std::uint32_t load_u32(const std::byte* src, byte_order bo) noexcept {
        return load<std::uint32_t>(src, bo);
    }
}
