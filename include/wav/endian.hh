//
// Created by igor on 19/10/2026.
//

#pragma once

#include <cstdint>
#include <type_traits>

#include <wav/wav_config.h>

namespace wav {
    // Platform endianness detection using CMake-generated config
#if LIBWAV_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

    constexpr std::uint16_t swap16(std::uint16_t x) noexcept {
        return static_cast<std::uint16_t>((x << 8) | (x >> 8));
    }

    constexpr std::uint32_t swap32(std::uint32_t x) noexcept {
        return ((x << 24) | ((x << 8) & 0x00FF0000u) |
                ((x >> 8) & 0x0000FF00u) | (x >> 24));
    }

    template<typename T>
    struct is_byte_swappable {
        static constexpr bool value =
            std::is_integral_v<T> && (sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4);
    };

    template<typename T>
    inline constexpr bool is_byte_swappable_v = is_byte_swappable<T>::value;

    template<typename T>
    constexpr T swap_byte_order(T x) noexcept {
        static_assert(is_byte_swappable_v<T>,
                      "swap_byte_order only supports 1, 2 and 4 byte integral types");

        if constexpr (sizeof(T) == 1) {
            return x;
        } else if constexpr (sizeof(T) == 2) {
            return static_cast<T>(swap16(static_cast<std::uint16_t>(x)));
        } else {
            return static_cast<T>(swap32(static_cast<std::uint32_t>(x)));
        }
    }
}
