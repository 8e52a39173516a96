//
// Created by igor on 19/10/2026.
//
#pragma once
#include <array>
#include <cstddef>
#include <cstring>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <algorithm>
#include <ostream>
#include <iomanip>

namespace wav {
    struct fourcc {
        std::array<char, 4> b{' ', ' ', ' ', ' '};

        // Default constructor - creates "    " (four spaces)
        constexpr fourcc() = default;

        constexpr fourcc(char c0, char c1, char c2, char c3)
            : b{ c0, c1, c2, c3 } {}

        // Constructor from string_view with padding (runtime)
        explicit fourcc(std::string_view sv) : b{' ', ' ', ' ', ' '} {
            std::copy_n(sv.begin(), std::min(sv.size(), std::size_t(4)), b.begin());
        }

        fourcc(const char* str) : fourcc(std::string_view(str)) {}

        // Raw tag bytes as found in the file (no padding)
        static fourcc from_bytes(const std::byte* data) {
            fourcc result;
            std::memcpy(result.b.data(), data, 4);
            return result;
        }

        [[nodiscard]] std::string to_string() const {
            return {b.data(), 4};
        }

        [[nodiscard]] std::string_view to_string_view() const {
            return {b.data(), 4};
        }

        constexpr char operator[](std::size_t i) const { return b[i]; }

        [[nodiscard]] constexpr auto begin() const { return b.begin(); }
        [[nodiscard]] constexpr auto end() const { return b.end(); }

        bool operator==(const fourcc& o) const { return b == o.b; }
        bool operator!=(const fourcc& o) const { return !(*this == o); }
        bool operator<(const fourcc& o) const { return b < o.b; }

        // Check if contains only printable ASCII
        [[nodiscard]] bool is_printable() const {
            return std::all_of(b.begin(), b.end(), [](char c) {
                return c >= 32 && c <= 126;
            });
        }

        // Quoted, with non-printable bytes escaped
        friend std::ostream& operator<<(std::ostream& os, const fourcc& f) {
            auto flags = os.flags();
            auto fill = os.fill();
            os << '\'';
            for (char c : f.b) {
                if (c >= 32 && c <= 126) {
                    os << c;
                } else {
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(static_cast<unsigned char>(c));
                }
            }
            os << '\'';
            os.flags(flags);
            os.fill(fill);
            return os;
        }
    };

    // User-defined literal for compile-time fourcc creation
    constexpr fourcc operator""_4cc(const char* str, std::size_t len) {
        if (len > 4) {
            throw std::invalid_argument("FourCC literal must be 4 characters or less");
        }
        return {
            len > 0 ? str[0] : ' ',
            len > 1 ? str[1] : ' ',
            len > 2 ? str[2] : ' ',
            len > 3 ? str[3] : ' '
        };
    }
}
