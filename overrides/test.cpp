/**
 * @file test.cpp
 * @brief Tests for name-keyed overrides, directives and loadout modification
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <string>
#include <vector>

#include "../loadout/loadout.hxx"
#include "../overrides/modify.hxx"
#include "../overrides/overrides.hxx"
#include "../testing/test_main.hpp"

using namespace talentcode;

namespace {

auto demo_catalog() -> Catalog {
    return Catalog({
        Node{.id = 1, .name = "Vengeful Retreat"},
        Node{.id = 2, .name = "Felblade"},
        Node{.id = 3, .name = "Chaos Fragments / Illidari Knowledge", .kind = kind::Choice{.entries = {{"Chaos Fragments"}, {"Illidari Knowledge"}}}},
        Node{.id = 4, .name = "Imprison", .max_rank = 2},
        Node{.id = 10, .name = "Spirit Bomb", .section = Section::Specialization},
        Node{.id = 11, .name = "Fiery Brand", .max_rank = 2, .section = Section::Specialization},
        Node{.id = 12, .name = "Soul Carver / Fiery Demise", .section = Section::Specialization},
        Node{.id = 20, .kind = kind::SubtreeSelector{.entries = {{"Aldrachi Reaver"}, {"Fel-Scarred"}}}, .section = Section::SubTree},
        Node{.id = 21, .name = "Art of the Glaive", .section = Section::SubTree, .sub_tree = "Aldrachi Reaver"},
        Node{.id = 22,
             .name = "Reaver's Mark",
             .kind = kind::Choice{.entries = {{"Keen Engagement"}, {"Preemptive Strike"}}},
             .section = Section::SubTree,
             .sub_tree = "Aldrachi Reaver"},
        Node{.id = 23, .name = "Demonsurge", .section = Section::SubTree, .sub_tree = "Fel-Scarred"},
        Node{.id = 24, .name = "Wave of Debilitation", .max_rank = 2, .section = Section::SubTree, .sub_tree = "Aldrachi Reaver"},
    });
}

const ValidationOptions DEMO_BUDGETS{.budgets = {.primary = 4, .specialization = 3, .sub_tree = 4}};

// Legal under DEMO_BUDGETS
auto base_build() -> Selection {
    return {
        {1, Pick{.rank = 1}},  {2, Pick{.rank = 1}},  {3, Pick{.rank = 1, .choice_index = 1}}, {4, Pick{.rank = 1}},
        {10, Pick{.rank = 1}}, {11, Pick{.rank = 2}}, {20, Pick{.rank = 1, .choice_index = 0}}, {21, Pick{.rank = 1}},
        {22, Pick{.rank = 1, .choice_index = 0}},      {24, Pick{.rank = 2}},
    };
}

auto parse_all(const std::vector<std::string>& texts) -> std::vector<Directive> {
    std::vector<Directive> directives;
    for (const auto& text : texts) {
        directives.push_back(parse_directive(text));
    }
    return directives;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Names
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("names")

TEST_CASE("normalize_name lowercases and keeps only [a-z0-9_]") {
    expect(normalize_name("Fiery Brand")).to_equal(std::string("fiery_brand"));
    expect(normalize_name("Reaver's Mark")).to_equal(std::string("reaver_s_mark"));
    expect(normalize_name("Fel-Scarred")).to_equal(std::string("felscarred"));
    expect(normalize_name("FIERY BRAND")).to_equal(normalize_name("fiery_brand"));
    expect(normalize_name("Fiery-Brand")).to_equal(std::string("fierybrand"));
    expect(normalize_name("already_normal_2")).to_equal(std::string("already_normal_2"));
    expect(normalize_name("")).to_equal(std::string{});
}

TEST_CASE("primary_segment keeps the part before the first separator") {
    expect(std::string(primary_segment("Soul Carver / Fiery Demise"))).to_equal(std::string("Soul Carver"));
    expect(std::string(primary_segment("Felblade"))).to_equal(std::string("Felblade"));
}

TEST_CASE("index resolves node names in any spelling") {
    const Catalog catalog = demo_catalog();
    const NameIndex index(catalog);
    expect(index.find("fiery_brand")->node->id).to_equal(11u);
    expect(index.find("FIERY BRAND")->node->id).to_equal(11u);
    expect(index.find("Soul Carver")->node->id).to_equal(12u);
    expect(index.find("Metamorphosis").has_value()).to_be_false();
}

TEST_CASE("index resolves entry names to their node and entry") {
    const Catalog catalog = demo_catalog();
    const NameIndex index(catalog);
    auto match = index.find("Illidari Knowledge");
    expect(match.has_value()).to_be_true();
    expect(match->node->id).to_equal(3u);
    expect(match->entry.value_or(-1)).to_equal(1);
}

TEST_CASE("first segment of a choice node resolves to the entry") {
    const Catalog catalog = demo_catalog();
    const NameIndex index(catalog);
    expect(index.find("Chaos Fragments")->entry.value_or(-1)).to_equal(0);
}

TEST_CASE("node names are not shadowed by another node's entry") {
    const Catalog catalog({Node{.id = 1, .kind = kind::Choice{.entries = {{"Felblade"}, {"Other"}}}}, Node{.id = 2, .name = "Felblade"}});
    const NameIndex index(catalog);
    auto match = index.find("Felblade");
    expect(match->node->id).to_equal(2u);
    expect(match->entry.has_value()).to_be_false();
}

TEST_CASE("at names the context of an unknown reference") {
    const Catalog catalog = demo_catalog();
    const NameIndex index(catalog);
    auto err = expect_throws(unknown_reference, (void)index.at("Metamorphosis", "primary overrides"));
    expect(std::string(err.what())).to_equal(std::string("unknown talent \"Metamorphosis\" in primary overrides"));
}

// ─────────────────────────────────────────────────────────────────────────────
// Override strings
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("overrides")

TEST_CASE("override strings resolve to a full selection") {
    const Overrides overrides{.primary = "vengeful_retreat/felblade/illidari_knowledge/imprison:2",
                              .specialization = "spirit_bomb/fiery_brand:2",
                              .sub_tree = "Aldrachi Reaver"};
    const Selection expected{
        {1, Pick{.rank = 1}},  {2, Pick{.rank = 1}},  {3, Pick{.rank = 1, .choice_index = 1}}, {4, Pick{.rank = 2}},
        {10, Pick{.rank = 1}}, {11, Pick{.rank = 2}}, {20, Pick{.rank = 1, .choice_index = 0}}, {21, Pick{.rank = 1}},
        {22, Pick{.rank = 1, .choice_index = 0}},      {24, Pick{.rank = 2}},
    };
    expect(overrides_to_selection(overrides, demo_catalog())).to_equal(expected);
}

TEST_CASE("tiered names resolve by first segment and bare choice nodes take entry 0") {
    const Selection selection = overrides_to_selection(Overrides{.specialization = "soul_carver"}, demo_catalog());
    expect(selection.at(12)).to_equal(Pick{.rank = 1});

    const Selection choice = overrides_to_selection(Overrides{.primary = "reaver's_mark"}, demo_catalog());
    expect(choice.at(22)).to_equal(Pick{.rank = 1, .choice_index = 0});
}

TEST_CASE("sub-tree group is matched in any spelling and sets the selector") {
    const Selection selection = overrides_to_selection(Overrides{.sub_tree = "fel-scarred"}, demo_catalog());
    const Selection expected{{20, Pick{.rank = 1, .choice_index = 1}}, {23, Pick{.rank = 1}}};
    expect(selection).to_equal(expected);
}

TEST_CASE("choice locks pick the entry of sub-tree choice nodes") {
    const Selection selection = overrides_to_selection(Overrides{.sub_tree = "aldrachi_reaver"}, demo_catalog(), ChoiceLocks{{22, 1}});
    expect(selection.at(22)).to_equal(Pick{.rank = 1, .choice_index = 1});
}

TEST_CASE("empty overrides give an empty selection") { expect(overrides_to_selection(Overrides{}, demo_catalog())).to_be_empty(); }

TEST_CASE("unknown talent is a named lookup failure") {
    auto err = expect_throws(unknown_reference, overrides_to_selection(Overrides{.primary = "felblade/metamorphosis"}, demo_catalog()));
    expect(std::string(err.what())).to_contain("\"metamorphosis\" in primary overrides");
}

TEST_CASE("unknown sub-tree group is a named lookup failure") {
    auto err = expect_throws(unknown_reference, overrides_to_selection(Overrides{.sub_tree = "Annihilator"}, demo_catalog()));
    expect(std::string(err.what())).to_contain("unknown sub-tree group \"Annihilator\"");
}

TEST_CASE("malformed ranks are rejected") {
    expect_throws(directive_error, overrides_to_selection(Overrides{.primary = "imprison:x"}, demo_catalog()));
    expect_throws(directive_error, overrides_to_selection(Overrides{.primary = "imprison:0"}, demo_catalog()));
    expect_throws(directive_error, overrides_to_selection(Overrides{.specialization = "fiery_brand:2x"}, demo_catalog()));
}

TEST_CASE("resolved overrides encode and decode unchanged") {
    const Catalog catalog = demo_catalog();
    const Selection selection = overrides_to_selection(Overrides{.primary = "felblade/imprison", .sub_tree = "Aldrachi Reaver"}, catalog);
    expect(decode(encode(581, catalog, selection), catalog).selections).to_equal(selection);
}

// ─────────────────────────────────────────────────────────────────────────────
// Directives
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("directives")

TEST_CASE("add directive with rank") {
    const Directive directive = parse_directive("+Fiery_Brand:1");
    expect(directive.op == Directive::Op::Add).to_be_true();
    expect(directive.name).to_equal(std::string("Fiery Brand"));
    expect(directive.rank.value_or(0)).to_equal(1);
}

TEST_CASE("remove directive") {
    const Directive directive = parse_directive("-Spirit_Bomb");
    expect(directive.op == Directive::Op::Remove).to_be_true();
    expect(directive.name).to_equal(std::string("Spirit Bomb"));
    expect(directive.rank.has_value()).to_be_false();
}

TEST_CASE("malformed directives are rejected") {
    expect_throws(directive_error, parse_directive("Felblade"));
    expect_throws(directive_error, parse_directive("+"));
    expect_throws(directive_error, parse_directive("+:2"));
    expect_throws(directive_error, parse_directive("-Felblade:1"));
    expect_throws(directive_error, parse_directive("+Felblade:abc"));
}

TEST_CASE("to_string prints the normalized directive") { expect(to_string(parse_directive("+Fiery_Brand:2"))).to_equal(std::string("+Fiery Brand:2")); }

TEST_CASE("directives apply in order and describe each change") {
    const auto applied = apply_directives(base_build(), parse_all({"-Spirit_Bomb", "+Soul_Carver", "+Fiery_Brand:1"}), demo_catalog());

    expect(applied.selection.contains(10)).to_be_false();
    expect(applied.selection.at(12)).to_equal(Pick{.rank = 1});
    expect(applied.selection.at(11)).to_equal(Pick{.rank = 1});
    expect(applied.changes).to_have_size(3);
    expect(applied.changes[0]).to_equal(std::string("Removed: Spirit Bomb (node 10)"));
    expect(applied.changes[1]).to_equal(std::string("Set: Soul Carver / Fiery Demise (node 12) to rank 1/1"));
    expect(applied.changes[2]).to_equal(std::string("Set: Fiery Brand (node 11) to rank 1/2"));
}

TEST_CASE("add without rank uses the max rank") {
    const auto applied = apply_directives({}, parse_all({"+Imprison"}), demo_catalog());
    expect(applied.selection.at(4)).to_equal(Pick{.rank = 2});
}

TEST_CASE("adding an entry name selects that entry") {
    const auto applied = apply_directives(base_build(), parse_all({"+Chaos_Fragments"}), demo_catalog());
    expect(applied.selection.at(3)).to_equal(Pick{.rank = 1, .choice_index = 0});
}

TEST_CASE("re-adding a choice node by its node name keeps the prior entry") {
    Selection base = base_build();
    base[22] = Pick{.rank = 1, .choice_index = 1};
    const auto applied = apply_directives(base, parse_all({"+Reaver's_Mark"}), demo_catalog());
    expect(applied.selection.at(22)).to_equal(Pick{.rank = 1, .choice_index = 1});
}

TEST_CASE("removing an unselected node is harmless") {
    const auto applied = apply_directives({}, parse_all({"-Felblade"}), demo_catalog());
    expect(applied.selection).to_be_empty();
    expect(applied.changes).to_have_size(1);
}

TEST_CASE("unknown directive name throws") {
    expect_throws(unknown_reference, apply_directives(base_build(), parse_all({"+Metamorphosis"}), demo_catalog()));
}

TEST_CASE("the base selection is left untouched") {
    const Selection base = base_build();
    (void)apply_directives(base, parse_all({"-Felblade"}), demo_catalog());
    expect(base.contains(2)).to_be_true();
}

// ─────────────────────────────────────────────────────────────────────────────
// Modify
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("modify")

TEST_CASE("legal result is re-encoded with the same tree identity") {
    const Catalog catalog = demo_catalog();
    const std::string base = encode(581, catalog, base_build());

    const ModifyResult result = modify(base, parse_all({"-Spirit_Bomb", "+Soul_Carver"}), catalog, DEMO_BUDGETS);

    expect(result.base.selections).to_equal(base_build());
    expect(result.report.valid).to_be_true();
    expect(result.loadout.has_value()).to_be_true();

    const Loadout reencoded = decode(*result.loadout, catalog);
    expect(reencoded.tree_identity).to_equal(581u);
    expect(reencoded.selections).to_equal(result.selection);
    expect(result.changes).to_have_size(2);
}

TEST_CASE("illegal result reports errors and produces no string") {
    const Catalog catalog = demo_catalog();
    const std::string base = encode(581, catalog, base_build());

    const ModifyResult result = modify(base, parse_all({"-Spirit_Bomb"}), catalog, DEMO_BUDGETS);

    expect(result.report.valid).to_be_false();
    expect(result.loadout.has_value()).to_be_false();
    expect(result.report.errors).to_have_line_containing("Specialization section: 2 points spent, expected 3");
}

TEST_CASE("no directives re-encodes the same string") {
    const Catalog catalog = demo_catalog();
    const std::string base = encode(581, catalog, base_build());
    const ModifyResult result = modify(base, {}, catalog, DEMO_BUDGETS);
    expect(result.loadout.value_or("")).to_equal(base);
}

TEST_CASE("malformed base string throws decode_error") {
    auto err = expect_throws(decode_error, modify("not a loadout!", parse_all({"-Felblade"}), demo_catalog(), DEMO_BUDGETS));
    expect(err.code() == decode_errc::invalid_character).to_be_true();
}

TEST_CASE("unknown directive name throws before validation") {
    const Catalog catalog = demo_catalog();
    const std::string base = encode(581, catalog, base_build());
    expect_throws(unknown_reference, modify(base, parse_all({"-Metamorphosis"}), catalog, DEMO_BUDGETS));
}
