/**
 * @file test.cpp
 * @brief Tests for the bit stream writer and reader
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <cstdint>
#include <stdexcept>
#include <string>

#include "../bitstream/bitstream.hxx"
#include "../testing/test_main.hpp"

using namespace talentcode;

// ─────────────────────────────────────────────────────────────────────────────
// Alphabet
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("alphabet")

TEST_CASE("symbol values follow alphabet order") {
    expect(symbol_value('A')).to_equal(0);
    expect(symbol_value('Z')).to_equal(25);
    expect(symbol_value('a')).to_equal(26);
    expect(symbol_value('0')).to_equal(52);
    expect(symbol_value('+')).to_equal(62);
    expect(symbol_value('/')).to_equal(63);
}

TEST_CASE("characters outside the alphabet are not symbols") {
    expect(is_symbol('=')).to_be_false();
    expect(is_symbol('-')).to_be_false();
    expect(is_symbol('_')).to_be_false();
    expect(is_symbol(' ')).to_be_false();
    expect(is_symbol('\0')).to_be_false();
}

// ─────────────────────────────────────────────────────────────────────────────
// BitWriter
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("writer")

TEST_CASE("empty writer flushes to an empty string") {
    BitWriter writer;
    expect(writer.flush()).to_equal(std::string{});
    expect(writer.bits_written()).to_equal(0u);
}

TEST_CASE("six bits make exactly one symbol") {
    BitWriter writer;
    writer.write(6, 63);
    expect(writer.flush()).to_equal(std::string("/"));
}

TEST_CASE("bits are packed least significant first") {
    BitWriter writer;
    writer.write(1, 1);  // bit 0
    writer.write(1, 0);  // bit 1
    writer.write(1, 1);  // bit 2
    expect(writer.flush()).to_equal(std::string("F"));  // 0b101 = 5
}

TEST_CASE("a partial group is zero padded on flush") {
    BitWriter writer;
    writer.write(8, 2);
    expect(writer.bits_written()).to_equal(8u);
    expect(writer.flush()).to_equal(std::string("CA"));
}

TEST_CASE("only the low bits of the value are written") {
    BitWriter writer;
    writer.write(2, 0xFF);
    expect(writer.flush()).to_equal(std::string("D"));
}

TEST_CASE("write_zeros handles fields wider than 64 bits") {
    BitWriter writer;
    writer.write_zeros(128);
    expect(writer.bits_written()).to_equal(128u);
    expect(writer.flush()).to_equal(std::string(22, 'A'));
}

TEST_CASE("more than 64 bits in a single write throws") {
    BitWriter writer;
    expect_throws(std::invalid_argument, writer.write(65, 0));
}

// ─────────────────────────────────────────────────────────────────────────────
// BitReader
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("reader")

TEST_CASE("reads back what the writer wrote") {
    BitWriter writer;
    writer.write(8, 2);
    writer.write(16, 581);
    writer.write(1, 1);
    writer.write(6, 17);
    writer.write(2, 3);
    const std::string text = writer.flush();

    BitReader reader(text);
    expect(reader.read(8)).to_equal(std::uint64_t{2});
    expect(reader.read(16)).to_equal(std::uint64_t{581});
    expect(reader.read(1)).to_equal(std::uint64_t{1});
    expect(reader.read(6)).to_equal(std::uint64_t{17});
    expect(reader.read(2)).to_equal(std::uint64_t{3});
}

TEST_CASE("bits_remaining counts down and clamps at zero") {
    BitReader reader("CA");
    expect(reader.bits_total()).to_equal(12u);
    expect(reader.bits_remaining()).to_equal(12u);
    reader.read(8);
    expect(reader.bits_consumed()).to_equal(8u);
    expect(reader.bits_remaining()).to_equal(4u);
    reader.read(8);
    expect(reader.bits_remaining()).to_equal(0u);
}

TEST_CASE("reading past the end yields zero bits") {
    BitReader reader("/");
    expect(reader.read(6)).to_equal(std::uint64_t{63});
    expect(reader.read(32)).to_equal(std::uint64_t{0});
}

TEST_CASE("skip advances the cursor without reading") {
    BitWriter writer;
    writer.write_zeros(128);
    writer.write(3, 5);
    const std::string text = writer.flush();

    BitReader reader(text);
    reader.skip(128);
    expect(reader.read(3)).to_equal(std::uint64_t{5});
}

TEST_CASE("64-bit fields survive a round trip") {
    const std::uint64_t value = 0xDEADBEEFCAFEF00DULL;
    BitWriter writer;
    writer.write(64, value);
    const std::string text = writer.flush();

    BitReader reader(text);
    expect(reader.read(64)).to_equal(value);
}

TEST_CASE("constructing over a non-alphabet character throws") { expect_throws(std::invalid_argument, BitReader("AB=C")); }

TEST_CASE("more than 64 bits in a single read throws") {
    BitReader reader("AAAA");
    expect_throws(std::invalid_argument, reader.read(65));
}
