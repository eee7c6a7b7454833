/**
 * @file test.cpp
 * @brief Tests for the node catalog and its JSON loader
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "../catalog/catalog.hxx"
#include "../catalog/catalog_json.hxx"
#include "../testing/test_main.hpp"

using namespace talentcode;

namespace {

auto hero_node(NodeId id, std::string name, std::string group) -> Node {
    return Node{.id = id, .name = std::move(name), .section = Section::SubTree, .sub_tree = std::move(group)};
}

auto selector_node(NodeId id, std::vector<std::string> groups) -> Node {
    std::vector<Entry> entries;
    for (auto& group : groups) {
        entries.push_back(Entry{.name = std::move(group)});
    }
    return Node{.id = id, .kind = kind::SubtreeSelector{.entries = std::move(entries)}, .section = Section::SubTree};
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("construction")

TEST_CASE("nodes are kept in ascending id order") {
    Catalog catalog({Node{.id = 30}, Node{.id = 4}, Node{.id = 17}});
    expect(catalog.size()).to_equal(3u);
    expect(catalog.nodes()[0].id).to_equal(4u);
    expect(catalog.nodes()[1].id).to_equal(17u);
    expect(catalog.nodes()[2].id).to_equal(30u);
}

TEST_CASE("default catalog is empty and has no identity") {
    Catalog catalog;
    expect(catalog.empty()).to_be_true();
    expect(catalog.tree_identity().has_value()).to_be_false();
}

TEST_CASE("tree identity is kept") {
    Catalog catalog({Node{.id = 1}}, 581U);
    expect(catalog.tree_identity().value_or(0)).to_equal(581u);
}

TEST_CASE("duplicate ids are rejected") {
    auto err = expect_throws(catalog_error, Catalog({Node{.id = 7}, Node{.id = 7}}));
    expect(std::string(err.what())).to_contain("duplicate node id 7");
}

TEST_CASE("max rank below 1 is rejected") { expect_throws(catalog_error, Catalog({Node{.id = 1, .max_rank = 0}})); }

TEST_CASE("choice node without entries is rejected") { expect_throws(catalog_error, Catalog({Node{.id = 1, .kind = kind::Choice{}}})); }

TEST_CASE("sub-tree node without a group is rejected") {
    expect_throws(catalog_error, Catalog({Node{.id = 1, .section = Section::SubTree}}));
}

// ─────────────────────────────────────────────────────────────────────────────
// Lookup
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("lookup")

TEST_CASE("find returns nullptr for unknown ids") {
    Catalog catalog({Node{.id = 1, .name = "Alpha"}});
    expect(catalog.find(1) != nullptr).to_be_true();
    expect(catalog.find(1)->name).to_equal(std::string("Alpha"));
    expect(catalog.find(2) == nullptr).to_be_true();
}

TEST_CASE("at throws for unknown ids") {
    Catalog catalog({Node{.id = 1}});
    expect(catalog.at(1).id).to_equal(1u);
    expect_throws(catalog_error, (void)catalog.at(99));
}

TEST_CASE("nodes_in partitions by section") {
    Catalog catalog({Node{.id = 1}, Node{.id = 2, .section = Section::Specialization}, Node{.id = 3}, hero_node(4, "Hero", "G")});
    expect(catalog.nodes_in(Section::Primary)).to_have_size(2);
    expect(catalog.nodes_in(Section::Specialization)).to_have_size(1);
    expect(catalog.nodes_in(Section::SubTree)).to_have_size(1);
}

TEST_CASE("sub-tree groups are listed in order of first appearance") {
    Catalog catalog({hero_node(10, "B1", "Beta"), hero_node(5, "A1", "Alpha"), hero_node(12, "B2", "Beta"), hero_node(20, "A2", "Alpha")});
    const std::vector<std::string> expected{"Alpha", "Beta"};
    expect(catalog.sub_tree_groups()).to_equal(expected);
    expect(catalog.nodes_in_group("Beta")).to_have_size(2);
    expect(catalog.has_group("Gamma")).to_be_false();
}

TEST_CASE("group_of is set only for sub-tree nodes") {
    Catalog catalog({Node{.id = 1}, hero_node(2, "Hero", "Alpha")});
    expect(catalog.group_of(2).value_or("")).to_equal(std::string("Alpha"));
    expect(catalog.group_of(1).has_value()).to_be_false();
    expect(catalog.group_of(3).has_value()).to_be_false();
}

TEST_CASE("selectors belong to no group even when they carry a group name") {
    Catalog catalog({hero_node(1, "L1", "Left"),
                     Node{.id = 2, .kind = kind::SubtreeSelector{.entries = {{"Left"}}}, .section = Section::SubTree, .sub_tree = "Hero"}});
    expect(catalog.group_of(2).has_value()).to_be_false();
    const std::vector<std::string> expected{"Left"};
    expect(catalog.sub_tree_groups()).to_equal(expected);
    expect(catalog.find_selector() == catalog.find(2)).to_be_true();
}

// ─────────────────────────────────────────────────────────────────────────────
// Nodes
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("node")

TEST_CASE("has_choice covers choice and selector nodes") {
    Node normal{.id = 1};
    Node choice{.id = 2, .kind = kind::Choice{.entries = {{"x"}, {"y"}}}};
    Node selector = selector_node(3, {"Alpha"});
    expect(normal.has_choice()).to_be_false();
    expect(choice.has_choice()).to_be_true();
    expect(choice.is_choice()).to_be_true();
    expect(selector.has_choice()).to_be_true();
    expect(selector.is_selector()).to_be_true();
    expect(choice.entries()).to_have_size(2);
    expect(normal.entries()).to_be_empty();
}

TEST_CASE("granted nodes have a baseline of 1") {
    Node always{.id = 1, .granted = true};
    Node per_tree{.id = 2, .granted_for = {581}};
    Node never{.id = 3};
    expect(always.baseline_rank(std::nullopt)).to_equal(1);
    expect(per_tree.baseline_rank(581U)).to_equal(1);
    expect(per_tree.baseline_rank(577U)).to_equal(0);
    expect(per_tree.baseline_rank(std::nullopt)).to_equal(0);
    expect(never.baseline_rank(581U)).to_equal(0);
}

TEST_CASE("display name falls back to the first entry") {
    Node named{.id = 1, .name = "Felblade"};
    Node unnamed{.id = 2, .kind = kind::Choice{.entries = {{"Chaos Fragments"}, {"Illidari Knowledge"}}}};
    Node bare{.id = 3};
    expect(named.display_name()).to_equal(std::string("Felblade"));
    expect(unnamed.display_name()).to_equal(std::string("Chaos Fragments"));
    expect(bare.display_name()).to_equal(std::string("node 3"));
}

// ─────────────────────────────────────────────────────────────────────────────
// Selector discovery
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("selector")

TEST_CASE("selector is found by its entries, not by its id") {
    Catalog catalog({selector_node(50, {"Fel-Scarred", "Annihilator"}), selector_node(90, {"Aldrachi Reaver", "Annihilator"}),
                     hero_node(100, "Art of the Glaive", "Aldrachi Reaver"), hero_node(200, "Voidfall", "Annihilator")});
    const Node* selector = catalog.find_selector();
    expect(selector != nullptr).to_be_true();
    expect(selector->id).to_equal(90u);
}

TEST_CASE("no selector when none names only local groups") {
    Catalog catalog({selector_node(50, {"Fel-Scarred"}), hero_node(100, "Art of the Glaive", "Aldrachi Reaver")});
    expect(catalog.find_selector() == nullptr).to_be_true();
}

TEST_CASE("selectors do not create sub-tree groups") {
    Catalog catalog({selector_node(50, {"Alpha"}), hero_node(100, "A1", "Alpha")});
    expect(catalog.sub_tree_groups()).to_have_size(1);
}

// ─────────────────────────────────────────────────────────────────────────────
// JSON
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("json")

TEST_CASE("object form with tree identity") {
    auto doc = nlohmann::json::parse(R"({
        "treeIdentity": 581,
        "nodes": [
            { "id": 3, "name": "Felblade", "type": "single", "reqPoints": 0, "section": "class" },
            { "id": 1, "name": "Fiery Brand", "type": "tiered", "maxRanks": 2, "section": "spec", "reqPoints": 8 },
            { "id": 9, "type": "choice", "section": "class",
              "entries": [ { "name": "Chaos Fragments" }, { "name": "Illidari Knowledge" } ] },
            { "id": 12, "name": "Art of the Glaive", "section": "hero", "subTree": "Aldrachi Reaver", "freeNode": true },
            { "id": 20, "type": "subtree", "section": "hero", "entries": [ { "name": "Aldrachi Reaver" } ] },
            { "id": 30, "name": "Vengeful Bonds", "grantedFor": [581, 577] }
        ]
    })");
    Catalog catalog = catalog_from_json(doc);

    expect(catalog.size()).to_equal(6u);
    expect(catalog.tree_identity().value_or(0)).to_equal(581u);

    const Node& brand = catalog.at(1);
    expect(brand.max_rank).to_equal(2);
    expect(brand.req_points).to_equal(8);
    expect(brand.section == Section::Specialization).to_be_true();

    expect(catalog.at(9).is_choice()).to_be_true();
    expect(catalog.at(9).display_name()).to_equal(std::string("Chaos Fragments"));
    expect(catalog.at(12).granted).to_be_true();
    expect(catalog.group_of(12).value_or("")).to_equal(std::string("Aldrachi Reaver"));
    expect(catalog.find_selector() == &catalog.at(20)).to_be_true();
    expect(catalog.at(30).is_granted_for(577U)).to_be_true();
}

TEST_CASE("bare array form") {
    Catalog catalog = catalog_from_json(nlohmann::json::parse(R"([ { "id": 2 }, { "id": 1, "section": "primary" } ])"));
    expect(catalog.size()).to_equal(2u);
    expect(catalog.nodes()[0].id).to_equal(1u);
    expect(catalog.nodes()[0].max_rank).to_equal(1);
    expect(catalog.tree_identity().has_value()).to_be_false();
}

TEST_CASE("object without nodes is rejected") { expect_throws(catalog_error, catalog_from_json(nlohmann::json::parse(R"({ "treeIdentity": 1 })"))); }

TEST_CASE("unknown section is rejected") {
    auto err = expect_throws(catalog_error, catalog_from_json(nlohmann::json::parse(R"([ { "id": 4, "section": "pvp" } ])")));
    expect(std::string(err.what())).to_contain("unknown section");
}

TEST_CASE("unknown node type is rejected") {
    expect_throws(catalog_error, catalog_from_json(nlohmann::json::parse(R"([ { "id": 4, "type": "passive" } ])")));
}

TEST_CASE("wrongly typed fields become catalog errors") {
    auto err = expect_throws(catalog_error, catalog_from_json(nlohmann::json::parse(R"([ { "id": "four" } ])")));
    expect(std::string(err.what())).to_contain("malformed catalog field");
}

TEST_CASE("node without id is rejected") { expect_throws(catalog_error, catalog_from_json(nlohmann::json::parse(R"([ { "name": "x" } ])"))); }

TEST_CASE("missing catalog file is reported") {
    auto err = expect_throws(catalog_error, load_catalog("/nonexistent/talentcode/catalog.json"));
    expect(std::string(err.what())).to_contain("cannot open catalog file");
}
