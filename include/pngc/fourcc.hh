//
// Created by igor on 10/08/2025.
//
#pragma once
#include <array>
#include <cstring>
#include <cstdint>
#include <string>
#include <string_view>
#include <algorithm>
#include <ostream>
#include <iomanip>
#include <stdexcept>

namespace pngc {
    struct fourcc {
        std::array<char, 4> b{' ', ' ', ' ', ' '};

        // Default constructor - creates "    " (four spaces)
        constexpr fourcc() = default;

        // Constructor from 4 individual chars
        constexpr fourcc(char c0, char c1, char c2, char c3)
            : b{ c0, c1, c2, c3 } {}

        // Constructor from string_view with padding (runtime)
        explicit fourcc(std::string_view sv) : b{' ', ' ', ' ', ' '} {
            std::copy_n(sv.begin(), std::min(sv.size(), size_t(4)), b.begin());
        }

        // Constructor from C-string with padding (runtime)
        fourcc(const char* str) : fourcc(std::string_view(str)) {}

        // Constructor from std::string with padding (runtime)
        explicit fourcc(const std::string& str) : fourcc(std::string_view(str)) {}

        // Constructor from raw bytes (no padding)
        static fourcc from_bytes(const void* data) {
            fourcc result;
            std::memcpy(result.b.data(), data, 4);
            return result;
        }

        // Constructor from a chunk type id (big-endian view of the four bytes)
        static constexpr fourcc from_type_id(std::uint32_t id) {
            return {
                static_cast<char>((id >> 24) & 0xFF),
                static_cast<char>((id >> 16) & 0xFF),
                static_cast<char>((id >> 8) & 0xFF),
                static_cast<char>(id & 0xFF)
            };
        }

        // Convert to string
        [[nodiscard]] std::string to_string() const {
            return {b.data(), 4};
        }

        // Convert to string_view
        [[nodiscard]] std::string_view to_string_view() const {
            return {b.data(), 4};
        }

        // Numeric chunk type id: the four bytes read as a big-endian integer,
        // e.g. "IHDR" -> 0x49484452
        [[nodiscard]] constexpr std::uint32_t type_id() const {
            return (std::uint32_t(static_cast<unsigned char>(b[0])) << 24) |
                   (std::uint32_t(static_cast<unsigned char>(b[1])) << 16) |
                   (std::uint32_t(static_cast<unsigned char>(b[2])) << 8) |
                    std::uint32_t(static_cast<unsigned char>(b[3]));
        }

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, b.data(), 4);
        }

        // Access individual characters
        constexpr char operator[](std::size_t i) const { return b[i]; }
        constexpr char& operator[](std::size_t i) { return b[i]; }

        // Iterators
        [[nodiscard]] constexpr auto begin() const { return b.begin(); }
        [[nodiscard]] constexpr auto end() const { return b.end(); }

        // Comparison operators
        constexpr bool operator==(const fourcc& o) const { return b == o.b; }
        constexpr bool operator!=(const fourcc& o) const { return !(*this == o); }
        bool operator<(const fourcc& o) const { return b < o.b; }

        // Chunk type names are restricted to ASCII letters
        [[nodiscard]] bool is_valid_chunk_name() const {
            return std::all_of(b.begin(), b.end(), [](char c) {
                return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
            });
        }

        // Stream output
        friend std::ostream& operator<<(std::ostream& os, const fourcc& f) {
            if (os.flags() & std::ios::hex) {
                auto flags = os.flags();
                auto fill = os.fill();
                os << "0x" << std::hex << std::setfill('0') << std::setw(8)
                   << f.type_id();
                os.flags(flags);
                os.fill(fill);
            } else {
                os << '\'';
                for (char c : f.b) {
                    if (c >= 32 && c <= 126) {
                        os << c;
                    } else {
                        os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                           << static_cast<unsigned>(static_cast<unsigned char>(c))
                           << std::dec;
                    }
                }
                os << '\'';
            }
            return os;
        }
    };

    // Property bits: bit 5 (0x20) of each name byte, clear = uppercase
    constexpr bool is_property_bit_clear(char c) {
        return (static_cast<unsigned char>(c) & 0x20) == 0;
    }

    // Ancillary bit (byte 0): unknown critical chunks must stop the decoder
    constexpr bool is_critical(const fourcc& f) { return is_property_bit_clear(f[0]); }
    constexpr bool is_ancillary(const fourcc& f) { return !is_critical(f); }

    // Private bit (byte 1): public chunks are defined by the standard or registered
    constexpr bool is_public(const fourcc& f) { return is_property_bit_clear(f[1]); }
    constexpr bool is_private(const fourcc& f) { return !is_public(f); }

    // Safe-to-copy bit (byte 3): editors may copy unknown safe chunks unmodified
    constexpr bool is_unsafe_to_copy(const fourcc& f) { return is_property_bit_clear(f[3]); }
    constexpr bool is_safe_to_copy(const fourcc& f) { return !is_unsafe_to_copy(f); }

    // Hash function
    struct fourcc_hash {
        std::size_t operator()(const fourcc& f) const noexcept {
            return (static_cast<std::size_t>(f.type_id()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
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
// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngc::fourcc> {
        std::size_t operator()(const pngc::fourcc& f) const noexcept {
            return pngc::fourcc_hash{}(f);
        }
    };
}
