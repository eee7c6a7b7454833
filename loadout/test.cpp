/**
 * @file test.cpp
 * @brief Tests for loadout string encoding and decoding
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "../bitstream/bitstream.hxx"
#include "../loadout/loadout.hxx"
#include "../testing/test_main.hpp"

using namespace talentcode;

namespace {

// A(1): 3 ranks. B(2): choice x/y, gated. C(5): granted.
auto small_catalog() -> Catalog {
    return Catalog({
        Node{.id = 1, .name = "A", .max_rank = 3},
        Node{.id = 2, .name = "B", .kind = kind::Choice{.entries = {{"x"}, {"y"}}}, .req_points = 2},
        Node{.id = 5, .name = "C", .granted = true},
    });
}

// Twelve nodes mixing every kind, used for round trips.
auto mixed_catalog() -> Catalog {
    std::vector<Node> nodes;
    for (NodeId id = 10; id < 20; ++id) {
        nodes.push_back(Node{.id = id, .name = "N" + std::to_string(id), .max_rank = static_cast<int>(id % 3) + 1});
    }
    nodes.push_back(Node{.id = 20, .name = "Pick", .kind = kind::Choice{.entries = {{"p0"}, {"p1"}, {"p2"}}}});
    nodes.push_back(Node{.id = 21, .kind = kind::SubtreeSelector{.entries = {{"Left"}, {"Right"}}}, .section = Section::SubTree});
    nodes.push_back(Node{.id = 22, .name = "L1", .max_rank = 2, .section = Section::SubTree, .sub_tree = "Left"});
    nodes.push_back(Node{.id = 23, .name = "R1", .section = Section::SubTree, .sub_tree = "Right"});
    return Catalog(std::move(nodes));
}

auto header_only(std::uint32_t version, std::uint32_t tree_identity) -> std::string {
    BitWriter writer;
    writer.write(format::VERSION_BITS, version);
    writer.write(format::TREE_IDENTITY_BITS, tree_identity);
    writer.write_zeros(format::TREE_HASH_BITS);
    return writer.flush();
}

auto strip_trailing_zero_symbols(std::string text) -> std::string {
    while (!text.empty() && text.back() == 'A') {
        text.pop_back();
    }
    return text;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Round trip
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("round trip")

TEST_CASE("three-node catalog decodes to exactly what was encoded") {
    const Catalog catalog = small_catalog();
    const Selection selection{{1, Pick{.rank = 2}}, {2, Pick{.rank = 1, .choice_index = 1}}};

    const Loadout decoded = decode(encode(581, catalog, selection), catalog);

    expect(decoded.tree_identity).to_equal(581u);
    expect(decoded.selections).to_equal(selection);
    expect(decoded.selections.contains(5)).to_be_false();
}

TEST_CASE("every kind of node survives a round trip") {
    const Catalog catalog = mixed_catalog();
    const Selection selection{
        {10, Pick{.rank = 1}},
        {11, Pick{.rank = 1}},
        {14, Pick{.rank = 2}},
        {17, Pick{.rank = 3}},
        {20, Pick{.rank = 1, .choice_index = 2}},
        {21, Pick{.rank = 1, .choice_index = 0}},
        {22, Pick{.rank = 2}},
    };
    const Loadout decoded = decode(encode(1480, catalog, selection), catalog);
    expect(decoded.selections).to_equal(selection);
    expect(decoded.tree_identity).to_equal(1480u);
}

TEST_CASE("Loadout overload matches the three-argument form") {
    const Catalog catalog = small_catalog();
    const Loadout loadout{.tree_identity = 7, .selections = {{1, Pick{.rank = 3}}}};
    expect(encode(loadout, catalog)).to_equal(encode(7, catalog, loadout.selections));
    expect(decode(encode(loadout, catalog), catalog)).to_equal(loadout);
}

TEST_CASE("empty selection round trips") {
    const Catalog catalog = mixed_catalog();
    const Loadout decoded = decode(encode(0, catalog, {}), catalog);
    expect(decoded.selections).to_be_empty();
    expect(decoded.tree_identity).to_equal(0u);
}

TEST_CASE("largest tree identity round trips") {
    const Catalog catalog = small_catalog();
    expect(decode(encode(format::MAX_TREE_IDENTITY, catalog, {}), catalog).tree_identity).to_equal(format::MAX_TREE_IDENTITY);
}

// ─────────────────────────────────────────────────────────────────────────────
// Encoder
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("encode")

TEST_CASE("encoding is deterministic") {
    const Catalog catalog = mixed_catalog();
    const Selection selection{{12, Pick{.rank = 1}}, {20, Pick{.rank = 1, .choice_index = 1}}};
    expect(encode(581, catalog, selection)).to_equal(encode(581, catalog, selection));
}

TEST_CASE("header carries version 2 and the tree identity") {
    const Catalog catalog = small_catalog();
    const std::string text = encode(581, catalog, {});

    BitReader reader(text);
    expect(reader.read(format::VERSION_BITS)).to_equal(std::uint64_t{2});
    expect(reader.read(format::TREE_IDENTITY_BITS)).to_equal(std::uint64_t{581});
    expect(reader.read(64)).to_equal(std::uint64_t{0});
    expect(reader.read(64)).to_equal(std::uint64_t{0});
}

TEST_CASE("unselected nodes cost one bit each and are never trimmed") {
    const Catalog catalog = small_catalog();
    // 152 header bits + 3 zero bits = 155 bits -> 26 symbols
    expect(encode(1, catalog, {})).to_have_size(26);
}

TEST_CASE("record layout of a partially ranked node") {
    const Catalog catalog({Node{.id = 1, .max_rank = 3}});
    const std::string text = encode(0, catalog, {{1, Pick{.rank = 2}}});

    BitReader reader(text);
    reader.skip(format::HEADER_BITS);
    expect(reader.read(1)).to_equal(std::uint64_t{1});  // selected
    expect(reader.read(1)).to_equal(std::uint64_t{1});  // purchased
    expect(reader.read(1)).to_equal(std::uint64_t{1});  // partial
    expect(reader.read(format::RANK_BITS)).to_equal(std::uint64_t{2});
    expect(reader.read(1)).to_equal(std::uint64_t{0});  // no choice
}

TEST_CASE("record layout of a fully ranked choice node") {
    const Catalog catalog({Node{.id = 1, .kind = kind::Choice{.entries = {{"x"}, {"y"}, {"z"}}}}});
    const std::string text = encode(0, catalog, {{1, Pick{.rank = 1, .choice_index = 2}}});

    BitReader reader(text);
    reader.skip(format::HEADER_BITS);
    expect(reader.read(1)).to_equal(std::uint64_t{1});  // selected
    expect(reader.read(1)).to_equal(std::uint64_t{1});  // purchased
    expect(reader.read(1)).to_equal(std::uint64_t{0});  // fully ranked
    expect(reader.read(1)).to_equal(std::uint64_t{1});  // has choice
    expect(reader.read(format::CHOICE_BITS)).to_equal(std::uint64_t{2});
}

TEST_CASE("missing choice index on a choice node is written as 0") {
    const Catalog catalog = small_catalog();
    const Loadout decoded = decode(encode(0, catalog, {{2, Pick{.rank = 1}}}), catalog);
    expect(decoded.selections.at(2)).to_equal(Pick{.rank = 1, .choice_index = 0});
}

TEST_CASE("node outside the catalog is rejected") {
    auto err = expect_throws(encode_error, encode(0, small_catalog(), {{3, Pick{}}}));
    expect(std::string(err.what())).to_contain("node 3");
}

TEST_CASE("rank above max rank is rejected") { expect_throws(encode_error, encode(0, small_catalog(), {{1, Pick{.rank = 4}}})); }

TEST_CASE("rank 0 is rejected") { expect_throws(encode_error, encode(0, small_catalog(), {{1, Pick{.rank = 0}}})); }

TEST_CASE("rank wider than its field is rejected") {
    const Catalog catalog({Node{.id = 1, .max_rank = 80}});
    expect_throws(encode_error, encode(0, catalog, {{1, Pick{.rank = 64}}}));
    expect_no_throw(encode(0, catalog, {{1, Pick{.rank = 63}}}));
}

TEST_CASE("choice index on a normal node is rejected") {
    expect_throws(encode_error, encode(0, small_catalog(), {{1, Pick{.rank = 1, .choice_index = 0}}}));
}

TEST_CASE("choice index outside the entries is rejected") {
    expect_throws(encode_error, encode(0, small_catalog(), {{2, Pick{.rank = 1, .choice_index = 2}}}));
}

TEST_CASE("tree identity above 16 bits is rejected") { expect_throws(encode_error, encode(0x10000, small_catalog(), {})); }

// ─────────────────────────────────────────────────────────────────────────────
// Granted nodes
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("granted")

TEST_CASE("granted node at baseline decodes to rank 1") {
    const Catalog catalog = small_catalog();
    const Loadout decoded = decode(encode(0, catalog, {{5, Pick{.rank = 1}}}), catalog);
    expect(decoded.selections.at(5)).to_equal(Pick{.rank = 1});
}

TEST_CASE("granted node at baseline writes no purchased record") {
    const Catalog catalog = small_catalog();
    const std::string text = encode(0, catalog, {{5, Pick{.rank = 1}}});

    BitReader reader(text);
    reader.skip(format::HEADER_BITS);
    expect(reader.read(1)).to_equal(std::uint64_t{0});  // node 1
    expect(reader.read(1)).to_equal(std::uint64_t{0});  // node 2
    expect(reader.read(1)).to_equal(std::uint64_t{1});  // node 5 selected
    expect(reader.read(1)).to_equal(std::uint64_t{0});  // not purchased
}

TEST_CASE("unselected granted node decodes as absent") {
    const Catalog catalog = small_catalog();
    const Loadout decoded = decode(encode(0, catalog, {{1, Pick{.rank = 1}}}), catalog);
    expect(decoded.selections.contains(5)).to_be_false();
}

TEST_CASE("granted-for-tree node is at baseline only for that tree") {
    const Catalog catalog({Node{.id = 1, .max_rank = 2, .granted_for = {581}}});
    const Selection selection{{1, Pick{.rank = 1}}};

    // For tree 581 rank 1 is the baseline; for any other tree it is a purchase
    expect(decode(encode(581, catalog, selection), catalog).selections).to_equal(selection);
    expect(decode(encode(577, catalog, selection), catalog).selections).to_equal(selection);
    expect(encode(581, catalog, selection)).not_to_equal(encode(581, catalog, {{1, Pick{.rank = 2}}}));
}

TEST_CASE("choice index on a granted choice node at baseline is rejected") {
    const Catalog catalog({Node{.id = 7, .name = "Boon", .max_rank = 2, .kind = kind::Choice{.entries = {{"b0"}, {"b1"}}}, .granted_for = {581}}});

    auto err = expect_throws(encode_error, encode(581, catalog, {{7, Pick{.rank = 1, .choice_index = 1}}}));
    expect(std::string(err.what())).to_contain(std::string("granted baseline"));

    // Without the choice, or above the baseline, the pick is carried exactly
    const Selection baseline{{7, Pick{.rank = 1}}};
    expect(decode(encode(581, catalog, baseline), catalog).selections).to_equal(baseline);
    const Selection purchased{{7, Pick{.rank = 2, .choice_index = 1}}};
    expect(decode(encode(581, catalog, purchased), catalog).selections).to_equal(purchased);
    const Selection other_tree{{7, Pick{.rank = 1, .choice_index = 1}}};
    expect(decode(encode(577, catalog, other_tree), catalog).selections).to_equal(other_tree);
}

// ─────────────────────────────────────────────────────────────────────────────
// Early termination
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("early termination")

TEST_CASE("string cut after the last selected node still decodes") {
    const Catalog catalog = mixed_catalog();
    const Selection selection{{10, Pick{.rank = 2}}, {11, Pick{.rank = 3}}};
    const std::string full = encode(581, catalog, selection);
    const std::string cut = strip_trailing_zero_symbols(full);

    expect(cut.size()).to_be_less_than(full.size());
    const Loadout decoded = decode(cut, catalog);
    expect(decoded.selections).to_equal(selection);
    expect(decoded.tree_identity).to_equal(581u);
}

TEST_CASE("header-only string decodes to an empty selection") {
    const Catalog catalog = mixed_catalog();
    const Loadout decoded = decode(header_only(2, 42), catalog);
    expect(decoded.tree_identity).to_equal(42u);
    expect(decoded.selections).to_be_empty();
}

// ─────────────────────────────────────────────────────────────────────────────
// Malformed input
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("malformed input")

TEST_CASE("one character outside the alphabet fails decode") {
    const Catalog catalog = small_catalog();
    std::string text = encode(581, catalog, {{1, Pick{.rank = 2}}});
    text[text.size() / 2] = '-';

    auto err = expect_throws(decode_error, decode(text, catalog));
    expect(err.code() == decode_errc::invalid_character).to_be_true();
    expect(std::string(err.what())).to_contain("invalid character '-'");
}

TEST_CASE("padding characters are not in the alphabet") {
    const Catalog catalog = small_catalog();
    auto err = expect_throws(decode_error, decode(encode(1, catalog, {}) + "==", catalog));
    expect(err.code() == decode_errc::invalid_character).to_be_true();
}

TEST_CASE("string shorter than the header fails decode") {
    auto err = expect_throws(decode_error, decode("CAAAAAAAAAAAAAAAAAAAAAAAA", small_catalog()));
    expect(err.code() == decode_errc::too_short).to_be_true();
    expect(std::string(decode_errc_name(err.code()))).to_equal(std::string("TooShort"));
}

TEST_CASE("empty string fails decode as too short") {
    auto err = expect_throws(decode_error, decode("", small_catalog()));
    expect(err.code() == decode_errc::too_short).to_be_true();
}

TEST_CASE("other versions are rejected") {
    for (std::uint32_t version : {0U, 1U, 3U, 255U}) {
        auto err = expect_throws(decode_error, decode(header_only(version, 581), small_catalog()));
        expect(err.code() == decode_errc::unsupported_version).to_be_true();
        expect(std::string(err.what())).to_contain("version " + std::to_string(version));
    }
}
