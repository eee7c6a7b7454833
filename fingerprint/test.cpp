/**
 * @file test.cpp
 * @brief Tests for selection fingerprints and readable names
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <string>
#include <vector>

#include "../fingerprint/fingerprint.hxx"
#include "../testing/test_main.hpp"

using namespace talentcode;

namespace {

auto demo_catalog() -> Catalog {
    return Catalog({
        Node{.id = 1, .name = "Felblade"},
        Node{.id = 2, .name = "Chaos Fragments / Illidari Knowledge", .kind = kind::Choice{.entries = {{"Chaos Fragments"}, {"Illidari Knowledge"}}}},
        Node{.id = 10, .name = "Spirit Bomb", .section = Section::Specialization},
        Node{.id = 11, .name = "Fiery Brand", .max_rank = 2, .section = Section::Specialization},
        Node{.id = 12, .name = "Soul Carver / Fiery Demise", .section = Section::Specialization},
        Node{.id = 20, .kind = kind::SubtreeSelector{.entries = {{"Aldrachi Reaver"}}}, .section = Section::SubTree},
        Node{.id = 21, .name = "Art of the Glaive", .section = Section::SubTree, .sub_tree = "Aldrachi Reaver"},
        Node{.id = 22,
             .name = "Reaver's Mark",
             .kind = kind::Choice{.entries = {{"Keen Engagement"}, {"Preemptive Strike"}}},
             .section = Section::SubTree,
             .sub_tree = "Aldrachi Reaver"},
    });
}

auto demo_build() -> Selection {
    return {
        {1, Pick{.rank = 1}},
        {2, Pick{.rank = 1, .choice_index = 1}},
        {10, Pick{.rank = 1}},
        {11, Pick{.rank = 2}},
        {20, Pick{.rank = 1, .choice_index = 0}},
        {21, Pick{.rank = 1}},
        {22, Pick{.rank = 1, .choice_index = 1}},
    };
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// fingerprint
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("fingerprint")

TEST_CASE("key lists specialization and sub-tree picks in id order") {
    expect(fingerprint(demo_build(), demo_catalog())).to_equal(std::string("spec[10:1,11:2]sub[21:1,22:1:c1]"));
}

TEST_CASE("primary picks do not change the key") {
    Selection other = demo_build();
    other.erase(1);
    other[2].choice_index = 0;
    expect(fingerprint(other, demo_catalog())).to_equal(fingerprint(demo_build(), demo_catalog()));
}

TEST_CASE("a different specialization pick changes the key") {
    Selection other = demo_build();
    other.erase(10);
    other[12] = Pick{.rank = 1};
    expect(fingerprint(other, demo_catalog())).not_to_equal(fingerprint(demo_build(), demo_catalog()));
}

TEST_CASE("empty selection gives empty sections") { expect(fingerprint({}, demo_catalog())).to_equal(std::string("spec[]sub[]")); }

TEST_CASE("unknown ids are ignored") {
    Selection other = demo_build();
    other[99] = Pick{.rank = 1};
    expect(fingerprint(other, demo_catalog())).to_equal(fingerprint(demo_build(), demo_catalog()));
}

// ─────────────────────────────────────────────────────────────────────────────
// selected_names
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("selected names")

TEST_CASE("choice nodes are named by their chosen entry") {
    const std::vector<std::string> expected{"Felblade", "Illidari Knowledge"};
    expect(selected_names(demo_build(), demo_catalog(), Section::Primary)).to_equal(expected);
}

TEST_CASE("tiered names are cut to their first segment") {
    Selection build = demo_build();
    build[12] = Pick{.rank = 1};
    const std::vector<std::string> expected{"Spirit Bomb", "Fiery Brand", "Soul Carver"};
    expect(selected_names(build, demo_catalog(), Section::Specialization)).to_equal(expected);
}

TEST_CASE("sub-tree names include the selector's chosen group") {
    const std::vector<std::string> expected{"Aldrachi Reaver", "Art of the Glaive", "Preemptive Strike"};
    expect(selected_names(demo_build(), demo_catalog(), Section::SubTree)).to_equal(expected);
}
