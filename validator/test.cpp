/**
 * @file test.cpp
 * @brief Tests for the budget, gate and selector validator
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <string>
#include <utility>
#include <vector>

#include "../testing/test_main.hpp"
#include "../validator/validator.hxx"

using namespace talentcode;

namespace {

const ValidationOptions SMALL{.budgets = {.primary = 5, .specialization = 3, .sub_tree = 2}};

/*
 * Primary:         1 Alpha (3)   2 Beta (2)   3 Gamma (2, gate 3)   4 Granted (free)
 * Specialization: 10 Delta (3)  11 Echo choice (gate 2)
 * Sub-tree:       20 selector Left|Right   21 L1, 22 L2 (Left)   23 R1 (Right, 2)
 */
auto small_catalog() -> Catalog {
    return Catalog({
        Node{.id = 1, .name = "Alpha", .max_rank = 3},
        Node{.id = 2, .name = "Beta", .max_rank = 2},
        Node{.id = 3, .name = "Gamma", .max_rank = 2, .req_points = 3},
        Node{.id = 4, .name = "Granted", .granted = true},
        Node{.id = 10, .name = "Delta", .max_rank = 3, .section = Section::Specialization},
        Node{.id = 11, .kind = kind::Choice{.entries = {{"Echo Left"}, {"Echo Right"}}}, .req_points = 2, .section = Section::Specialization},
        Node{.id = 20, .kind = kind::SubtreeSelector{.entries = {{"Left"}, {"Right"}}}, .section = Section::SubTree},
        Node{.id = 21, .name = "L1", .section = Section::SubTree, .sub_tree = "Left"},
        Node{.id = 22, .name = "L2", .section = Section::SubTree, .sub_tree = "Left"},
        Node{.id = 23, .name = "R1", .max_rank = 2, .section = Section::SubTree, .sub_tree = "Right"},
    });
}

auto legal_build() -> Selection {
    return {
        {1, Pick{.rank = 3}},
        {2, Pick{.rank = 2}},
        {4, Pick{.rank = 1}},
        {10, Pick{.rank = 2}},
        {11, Pick{.rank = 1, .choice_index = 1}},
        {20, Pick{.rank = 1, .choice_index = 0}},
        {21, Pick{.rank = 1}},
        {22, Pick{.rank = 1}},
    };
}

/*
 * One 34-point section with gates at 8 and 20:
 *   ids 1-3   ungated  (4, 3, 4)
 *   ids 4-7   gate 8   (4 each)
 *   ids 8-11  gate 20  (4, 4, 3, 3)
 */
auto gated_catalog() -> Catalog {
    std::vector<Node> nodes{Node{.id = 1, .max_rank = 4}, Node{.id = 2, .max_rank = 3}, Node{.id = 3, .max_rank = 4}};
    for (NodeId id = 4; id <= 7; ++id) {
        nodes.push_back(Node{.id = id, .max_rank = 4, .req_points = 8});
    }
    nodes.push_back(Node{.id = 8, .max_rank = 4, .req_points = 20});
    nodes.push_back(Node{.id = 9, .max_rank = 4, .req_points = 20});
    nodes.push_back(Node{.id = 10, .max_rank = 3, .req_points = 20});
    nodes.push_back(Node{.id = 11, .max_rank = 3, .req_points = 20});
    return Catalog(std::move(nodes));
}

const ValidationOptions PRIMARY_ONLY{.budgets = {.primary = 34, .specialization = 0, .sub_tree = 0}};

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Budgets
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("budgets")

TEST_CASE("legal build passes with no errors") {
    const auto report = validate(legal_build(), small_catalog(), SMALL);
    expect(report.errors).to_be_empty();
    expect(report.valid).to_be_true();
}

TEST_CASE("granted nodes and selectors cost no points") {
    const auto report = validate(legal_build(), small_catalog(), SMALL);
    expect(report.details.spent_in(Section::Primary)).to_equal(5);
    expect(report.details.spent_in(Section::Specialization)).to_equal(3);
    expect(report.details.spent_in(Section::SubTree)).to_equal(2);
}

TEST_CASE("underspent section is reported with expected and actual totals") {
    Selection build = legal_build();
    build.erase(2);
    const auto report = validate(build, small_catalog(), SMALL);
    expect(report.valid).to_be_false();
    expect(report.errors).to_have_size(1);
    expect(report.errors.front()).to_equal(std::string("Primary section: 3 points spent, expected 5"));
}

TEST_CASE("overspent section is reported") {
    Selection build = legal_build();
    build[3] = Pick{.rank = 1};
    const auto report = validate(build, small_catalog(), SMALL);
    expect(report.errors).to_have_line_containing("Primary section: 6 points spent, expected 5");
}

TEST_CASE("default budgets are 34, 34 and 13") {
    const auto report = validate(legal_build(), small_catalog());
    expect(report.errors).to_have_line_containing("Primary section: 5 points spent, expected 34");
    expect(report.errors).to_have_line_containing("Specialization section: 3 points spent, expected 34");
    expect(report.errors).to_have_line_containing("Sub-tree section: 2 points spent, expected 13");
}

TEST_CASE("nodes granted for the build's tree identity cost nothing") {
    const Catalog catalog({Node{.id = 1, .max_rank = 2}, Node{.id = 2, .granted_for = {581}}});
    const Selection build{{1, Pick{.rank = 2}}, {2, Pick{.rank = 1}}};
    ValidationOptions options{.budgets = {.primary = 2, .specialization = 0, .sub_tree = 0}, .tree_identity = 581};
    expect(validate(build, catalog, options).valid).to_be_true();

    options.tree_identity = 577;
    expect(validate(build, catalog, options).errors).to_have_line_containing("3 points spent, expected 2");
}

// ─────────────────────────────────────────────────────────────────────────────
// Gates
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("gates")

TEST_CASE("on-budget build that skips the first gate fails") {
    // 7 before gate 8, 13 more before gate 20, 14 after: exactly 34
    const Selection build{
        {1, Pick{.rank = 4}}, {2, Pick{.rank = 3}},                                                //
        {4, Pick{.rank = 4}}, {5, Pick{.rank = 4}}, {6, Pick{.rank = 4}}, {7, Pick{.rank = 1}},    //
        {8, Pick{.rank = 4}}, {9, Pick{.rank = 4}}, {10, Pick{.rank = 3}}, {11, Pick{.rank = 3}},  //
    };
    const auto report = validate(build, gated_catalog(), PRIMARY_ONLY);

    expect(report.details.spent_in(Section::Primary)).to_equal(34);
    expect(report.valid).to_be_false();
    expect(report.errors).to_have_size(1);
    expect(report.errors.front()).to_equal(std::string("Primary gate 8: requires 8 points in earlier rows, only 7 spent (short by 1)"));
}

TEST_CASE("every short gate is reported on its own") {
    const Selection build{{1, Pick{.rank = 4}}};
    const auto report = validate(build, gated_catalog(), PRIMARY_ONLY);
    expect(report.errors).to_have_line_containing("gate 8: requires 8 points in earlier rows, only 4 spent (short by 4)");
    expect(report.errors).to_have_line_containing("gate 20: requires 20 points in earlier rows, only 4 spent (short by 16)");
}

TEST_CASE("gates count only nodes below the threshold") {
    const Selection build{
        {1, Pick{.rank = 4}}, {2, Pick{.rank = 3}}, {3, Pick{.rank = 1}},                          //
        {4, Pick{.rank = 4}}, {5, Pick{.rank = 4}}, {6, Pick{.rank = 4}},                          //
        {8, Pick{.rank = 4}}, {9, Pick{.rank = 4}}, {10, Pick{.rank = 3}}, {11, Pick{.rank = 3}},  //
    };
    const auto report = validate(build, gated_catalog(), PRIMARY_ONLY);
    expect(report.errors).to_be_empty();
}

TEST_CASE("granted nodes do not count toward gates") {
    const Catalog catalog({Node{.id = 1, .max_rank = 2}, Node{.id = 2, .granted = true}, Node{.id = 3, .req_points = 3}});
    const Selection build{{1, Pick{.rank = 2}}, {2, Pick{.rank = 1}}, {3, Pick{.rank = 1}}};
    const auto report = validate(build, catalog, ValidationOptions{.budgets = {.primary = 3, .specialization = 0, .sub_tree = 0}});
    expect(report.errors).to_have_line_containing("Primary gate 3: requires 3 points in earlier rows, only 2 spent (short by 1)");
}

// ─────────────────────────────────────────────────────────────────────────────
// Sub-tree selector
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("selector")

TEST_CASE("selector without a choice is reported") {
    Selection build = legal_build();
    build[20] = Pick{.rank = 1};
    const auto report = validate(build, small_catalog(), SMALL);
    expect(report.errors).to_have_line_containing("Sub-tree selector node 20 (Left) is selected without a choice");
}

TEST_CASE("selector naming a group without selected nodes is reported") {
    Selection build = legal_build();
    build[20] = Pick{.rank = 1, .choice_index = 1};
    const auto report = validate(build, small_catalog(), SMALL);
    expect(report.errors).to_have_size(1);
    expect(report.errors.front()).to_contain("selects \"Right\" but none of its nodes are selected");
}

TEST_CASE("selector choice outside its entries is reported") {
    Selection build = legal_build();
    build[20] = Pick{.rank = 1, .choice_index = 3};
    const auto report = validate(build, small_catalog(), SMALL);
    expect(report.errors).to_have_line_containing("choice 3 does not name an entry");
}

TEST_CASE("selector carrying a group name of its own is not counted as a group") {
    const Catalog catalog({
        Node{.id = 1, .name = "L1", .section = Section::SubTree, .sub_tree = "Left"},
        Node{.id = 2, .kind = kind::SubtreeSelector{.entries = {{"Left"}}}, .section = Section::SubTree, .sub_tree = "Hero"},
    });
    const ValidationOptions options{.budgets = {.primary = 0, .specialization = 0, .sub_tree = 1}};

    const auto report = validate({{1, Pick{.rank = 1}}, {2, Pick{.rank = 1, .choice_index = 0}}}, catalog, options);
    expect(report.errors).to_be_empty();
    expect(report.details.sub_tree.value_or("")).to_equal(std::string("Left"));
}

TEST_CASE("build without a selector is not a selector error") {
    Selection build = legal_build();
    build.erase(20);
    expect(validate(build, small_catalog(), SMALL).valid).to_be_true();
}

TEST_CASE("picks from two sub-tree groups are reported") {
    Selection build = legal_build();
    build.erase(22);
    build[23] = Pick{.rank = 1};
    const auto report = validate(build, small_catalog(), SMALL);
    expect(report.errors).to_have_size(1);
    expect(report.errors.front()).to_equal(std::string("Selected nodes span 2 sub-tree groups: Left, Right"));
}

// ─────────────────────────────────────────────────────────────────────────────
// Shape
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("shape")

TEST_CASE("unknown node id is reported") {
    Selection build = legal_build();
    build[99] = Pick{.rank = 1};
    expect(validate(build, small_catalog(), SMALL).errors).to_have_line_containing("Selected node 99 is not in the catalog");
}

TEST_CASE("rank outside the node's range is reported") {
    Selection build = legal_build();
    build[1] = Pick{.rank = 4};
    expect(validate(build, small_catalog(), SMALL).errors).to_have_line_containing("Rank 4 of node 1 (Alpha) is outside 1..3");
}

TEST_CASE("choice on a node without choices is reported") {
    Selection build = legal_build();
    build[1] = Pick{.rank = 3, .choice_index = 0};
    expect(validate(build, small_catalog(), SMALL).errors).to_have_line_containing("Choice index given for node 1 (Alpha), which has no choices");
}

TEST_CASE("choice index past the entries is reported") {
    Selection build = legal_build();
    build[11] = Pick{.rank = 1, .choice_index = 2};
    expect(validate(build, small_catalog(), SMALL).errors).to_have_line_containing("Choice index 2 of node 11 (Echo Left) is outside its 2 entries");
}

TEST_CASE("choice on a granted choice node at baseline is reported") {
    const Catalog catalog({Node{.id = 7, .name = "Boon", .max_rank = 2, .kind = kind::Choice{.entries = {{"b0"}, {"b1"}}}, .granted_for = {581}}});
    const ValidationOptions options{.budgets = {.primary = 0, .specialization = 0, .sub_tree = 0}, .tree_identity = 581};

    const auto report = validate({{7, Pick{.rank = 1, .choice_index = 1}}}, catalog, options);
    expect(report.errors).to_have_size(1);
    expect(report.errors.front()).to_equal(std::string("Choice index given for node 7 (Boon) at its granted baseline"));
    expect(validate({{7, Pick{.rank = 1}}}, catalog, options).valid).to_be_true();
}

// ─────────────────────────────────────────────────────────────────────────────
// Report
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("report")

TEST_CASE("all violations are collected in one pass") {
    Selection build = legal_build();
    build.erase(1);             // primary underspent, gate 3 short
    build[20].choice_index = 1;  // selector names the empty group
    const auto report = validate(build, small_catalog(), SMALL);
    expect(report.errors).to_have_size(3);
    expect(report.errors).to_have_line_containing("Primary section: 2 points spent, expected 5");
    expect(report.errors).to_have_line_containing("Primary gate 3");
    expect(report.errors).to_have_line_containing("selects \"Right\"");
}

TEST_CASE("details name the sub-tree group in use") {
    const auto report = validate(legal_build(), small_catalog(), SMALL);
    expect(report.details.sub_tree.value_or("")).to_equal(std::string("Left"));
}

TEST_CASE("details leave the sub-tree empty when none is picked") {
    const auto report = validate({{1, Pick{.rank = 3}}}, small_catalog(), SMALL);
    expect(report.details.sub_tree.has_value()).to_be_false();
}

TEST_CASE("the validator does not mutate its inputs") {
    const Selection build = legal_build();
    const Catalog catalog = small_catalog();
    const Selection before = build;
    (void)validate(build, catalog, SMALL);
    expect(build).to_equal(before);
    expect(catalog.size()).to_equal(10u);
}
