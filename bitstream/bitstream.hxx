#pragma once

/**
 * @file bitstream.hxx
 * @brief LSB-first bit writer/reader over a 64-symbol printable alphabet
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 *
 * Every symbol carries 6 bits. Within a symbol, bit 0 is written and read
 * first; symbols follow each other in stream order. A trailing partial
 * group is zero-padded in its high bits.
 */

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace talentcode {

namespace bitstream_detail {
inline constexpr std::string_view ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
inline constexpr unsigned int SYMBOL_BITS = 6U;
inline constexpr unsigned int MAX_FIELD_BITS = 64U;
inline constexpr int NO_SYMBOL = -1;

/// Reverse lookup table: character -> symbol value, NO_SYMBOL outside the alphabet.
inline constexpr auto make_symbol_table() -> std::array<int, 256> {
    std::array<int, 256> table{};
    table.fill(NO_SYMBOL);
    for (std::size_t i = 0; i < ALPHABET.size(); ++i) {
        table[static_cast<unsigned char>(ALPHABET[i])] = static_cast<int>(i);
    }
    return table;
}

inline constexpr std::array<int, 256> SYMBOL_TABLE = make_symbol_table();
}  // namespace bitstream_detail

/// Value of `chr` in the alphabet, or -1 when it is not a symbol.
[[nodiscard]] constexpr auto symbol_value(char chr) noexcept -> int { return bitstream_detail::SYMBOL_TABLE[static_cast<unsigned char>(chr)]; }

[[nodiscard]] constexpr auto is_symbol(char chr) noexcept -> bool { return symbol_value(chr) != bitstream_detail::NO_SYMBOL; }

// ── BitWriter ────────────────────────────────────────────────────────────────

/**
 * @brief Accumulates bits and emits one alphabet symbol per full 6-bit group.
 *
 * @code
 *   BitWriter w;
 *   w.write(8, 2);
 *   w.write(1, 1);
 *   std::string s = w.flush();
 * @endcode
 */
class BitWriter {
   public:
    /**
     * @brief Append the low `bit_count` bits of `value`, least significant first.
     * @throws std::invalid_argument if bit_count exceeds 64.
     */
    void write(unsigned int bit_count, std::uint64_t value) {
        if (bit_count > bitstream_detail::MAX_FIELD_BITS) {
            throw std::invalid_argument("BitWriter::write: at most 64 bits per call");
        }
        for (unsigned int i = 0; i < bit_count; ++i) {
            const auto bit = static_cast<unsigned int>((value >> i) & 1U);
            symbol_ |= bit << pending_;
            ++pending_;
            ++bits_written_;
            if (pending_ == bitstream_detail::SYMBOL_BITS) {
                out_ += bitstream_detail::ALPHABET[symbol_];
                symbol_ = 0;
                pending_ = 0;
            }
        }
    }

    /// Append `bit_count` zero bits (fields wider than a single write).
    void write_zeros(std::size_t bit_count) {
        while (bit_count > 0) {
            auto chunk = static_cast<unsigned int>(std::min<std::size_t>(bit_count, bitstream_detail::MAX_FIELD_BITS));
            write(chunk, 0);
            bit_count -= chunk;
        }
    }

    /// Emit the trailing partial group (if any) and return the whole string.
    auto flush() -> std::string {
        if (pending_ != 0) {
            out_ += bitstream_detail::ALPHABET[symbol_];
            symbol_ = 0;
            pending_ = 0;
        }
        return out_;
    }

    [[nodiscard]] auto bits_written() const noexcept -> std::size_t { return bits_written_; }

   private:
    std::string out_;
    unsigned int symbol_ = 0;
    unsigned int pending_ = 0;
    std::size_t bits_written_ = 0;
};

// ── BitReader ────────────────────────────────────────────────────────────────

/**
 * @brief Yields bits from an alphabet string on demand.
 *
 * Reading past the end produces zero bits, matching the writer's padding.
 * The reader keeps a view of the input: the string must outlive it.
 */
class BitReader {
   public:
    /// @throws std::invalid_argument if `stream` contains a non-alphabet character.
    explicit BitReader(std::string_view stream) : stream_(stream) {
        for (char chr : stream_) {
            if (!is_symbol(chr)) {
                throw std::invalid_argument(std::string("BitReader: invalid symbol '") + chr + "'");
            }
        }
    }

    /**
     * @brief Next `bit_count` bits as an unsigned integer, first bit in bit 0.
     * @throws std::invalid_argument if bit_count exceeds 64.
     */
    auto read(unsigned int bit_count) -> std::uint64_t {
        if (bit_count > bitstream_detail::MAX_FIELD_BITS) {
            throw std::invalid_argument("BitReader::read: at most 64 bits per call");
        }
        std::uint64_t value = 0;
        for (unsigned int i = 0; i < bit_count; ++i) {
            value |= static_cast<std::uint64_t>(next_bit()) << i;
        }
        return value;
    }

    /// Skip `bit_count` bits (fields wider than a single read).
    void skip(std::size_t bit_count) noexcept { head_ += bit_count; }

    [[nodiscard]] auto bits_total() const noexcept -> std::size_t { return stream_.size() * bitstream_detail::SYMBOL_BITS; }

    [[nodiscard]] auto bits_consumed() const noexcept -> std::size_t { return head_; }

    /// Stream length in bits minus bits consumed, never below zero.
    [[nodiscard]] auto bits_remaining() const noexcept -> std::size_t { return head_ >= bits_total() ? 0 : bits_total() - head_; }

   private:
    auto next_bit() noexcept -> unsigned int {
        const std::size_t index = head_ / bitstream_detail::SYMBOL_BITS;
        const auto offset = static_cast<unsigned int>(head_ % bitstream_detail::SYMBOL_BITS);
        ++head_;
        if (index >= stream_.size()) {
            return 0;
        }
        return (static_cast<unsigned int>(symbol_value(stream_[index])) >> offset) & 1U;
    }

    std::string_view stream_;
    std::size_t head_ = 0;
};

}  // namespace talentcode
