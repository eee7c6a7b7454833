#pragma once

/**
 * @file validator.hxx
 * @brief Point-budget, gate and selector consistency checks for a selection
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 *
 * validate() never throws for a rule violation: every problem becomes one
 * line in ValidationReport::errors, so a caller can show all of them at
 * once. Checks are independent of each other and all of them always run.
 *
 *   1. budgets   per section, ranks of non-granted, non-selector nodes must
 *                sum to exactly the section budget
 *   2. gates     per section and per distinct reqPoints threshold g, points
 *                spent on nodes with reqPoints < g must reach g
 *   3. selector  a selected sub-tree selector must pick a group that has
 *                selected nodes
 *   4. shape     ids, ranks and choice indices must fit the catalog; picks
 *                may come from one sub-tree group only
 */

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../catalog/catalog.hxx"
#include "../catalog/selection.hxx"

namespace talentcode {

// ── Options ──────────────────────────────────────────────────────────────────

struct Budgets {
    int primary = 34;
    int specialization = 34;
    int sub_tree = 13;

    [[nodiscard]] auto for_section(Section section) const noexcept -> int {
        switch (section) {
            case Section::Primary:
                return primary;
            case Section::Specialization:
                return specialization;
            case Section::SubTree:
                return sub_tree;
        }
        return 0;
    }
};

struct ValidationOptions {
    Budgets budgets;
    std::optional<std::uint32_t> tree_identity;  // resolves per-tree granted nodes
};

// ── Report ───────────────────────────────────────────────────────────────────

struct ValidationDetails {
    std::array<int, SECTION_COUNT> spent{};
    std::optional<std::string> sub_tree;  // group with the most selected nodes

    [[nodiscard]] auto spent_in(Section section) const noexcept -> int { return spent[static_cast<std::size_t>(section)]; }
};

struct ValidationReport {
    bool valid = true;
    std::vector<std::string> errors;
    ValidationDetails details;
};

// ── Checks ───────────────────────────────────────────────────────────────────

namespace validator_detail {

/// Granted nodes and selectors cost nothing.
inline auto costs_points(const Node& node, const ValidationOptions& options) -> bool {
    return !node.is_granted_for(options.tree_identity) && !node.is_selector();
}

inline auto node_tag(const Node& node) -> std::string { return "node " + std::to_string(node.id) + " (" + node.display_name() + ")"; }

inline void check_shape(const Selection& selections, const Catalog& catalog, const ValidationOptions& options, std::vector<std::string>& errors) {
    for (const auto& [id, pick] : selections) {
        const Node* node = catalog.find(id);
        if (node == nullptr) {
            errors.push_back("Selected node " + std::to_string(id) + " is not in the catalog");
            continue;
        }
        if (pick.rank < 1 || pick.rank > node->max_rank) {
            errors.push_back("Rank " + std::to_string(pick.rank) + " of " + node_tag(*node) + " is outside 1.." + std::to_string(node->max_rank));
        }
        if (!pick.choice_index) {
            continue;
        }
        if (!node->has_choice()) {
            errors.push_back("Choice index given for " + node_tag(*node) + ", which has no choices");
            continue;
        }
        const auto count = static_cast<int>(node->entries().size());
        if (*pick.choice_index < 0 || *pick.choice_index >= count) {
            errors.push_back("Choice index " + std::to_string(*pick.choice_index) + " of " + node_tag(*node) + " is outside its " + std::to_string(count) +
                             " entries");
        } else if (pick.rank <= node->baseline_rank(options.tree_identity)) {
            // The loadout record of a node at its granted baseline has no choice bits
            errors.push_back("Choice index given for " + node_tag(*node) + " at its granted baseline");
        }
    }
}

inline auto count_spent(const Selection& selections, const Catalog& catalog, const ValidationOptions& options) -> std::array<int, SECTION_COUNT> {
    std::array<int, SECTION_COUNT> spent{};
    for (const auto& [id, pick] : selections) {
        const Node* node = catalog.find(id);
        if (node == nullptr || !costs_points(*node, options)) {
            continue;
        }
        spent[static_cast<std::size_t>(node->section)] += pick.rank;
    }
    return spent;
}

inline void check_budgets(const std::array<int, SECTION_COUNT>& spent, const Budgets& budgets, std::vector<std::string>& errors) {
    for (Section section : ALL_SECTIONS) {
        const int actual = spent[static_cast<std::size_t>(section)];
        const int expected = budgets.for_section(section);
        if (actual != expected) {
            errors.push_back(std::string(section_label(section)) + " section: " + std::to_string(actual) + " points spent, expected " +
                             std::to_string(expected));
        }
    }
}

inline void check_gates(const Selection& selections, const Catalog& catalog, const ValidationOptions& options, std::vector<std::string>& errors) {
    for (Section section : ALL_SECTIONS) {
        const auto nodes = catalog.nodes_in(section);

        std::vector<int> gates;
        for (const Node* node : nodes) {
            if (node->req_points > 0) {
                gates.push_back(node->req_points);
            }
        }
        std::ranges::sort(gates);
        gates.erase(std::unique(gates.begin(), gates.end()), gates.end());

        for (int gate : gates) {
            int spent_below = 0;
            for (const Node* node : nodes) {
                if (node->req_points >= gate || !costs_points(*node, options)) {
                    continue;
                }
                auto it = selections.find(node->id);
                if (it != selections.end()) {
                    spent_below += it->second.rank;
                }
            }
            if (spent_below < gate) {
                errors.push_back(std::string(section_label(section)) + " gate " + std::to_string(gate) + ": requires " + std::to_string(gate) +
                                 " points in earlier rows, only " + std::to_string(spent_below) + " spent (short by " +
                                 std::to_string(gate - spent_below) + ")");
            }
        }
    }
}

/// Selected node count per sub-tree group, in catalog group order.
inline auto group_counts(const Selection& selections, const Catalog& catalog) -> std::vector<std::size_t> {
    const auto& groups = catalog.sub_tree_groups();
    std::vector<std::size_t> counts(groups.size(), 0);
    for (const auto& [id, pick] : selections) {
        auto group = catalog.group_of(id);
        if (!group) {
            continue;
        }
        auto pos = std::ranges::find(groups, *group);
        if (pos != groups.end()) {
            ++counts[static_cast<std::size_t>(pos - groups.begin())];
        }
    }
    return counts;
}

inline void check_sub_trees(const Selection& selections, const Catalog& catalog, const std::vector<std::size_t>& counts,
                            std::vector<std::string>& errors) {
    const auto& groups = catalog.sub_tree_groups();

    for (const auto& [id, pick] : selections) {
        const Node* node = catalog.find(id);
        if (node == nullptr || !node->is_selector()) {
            continue;
        }
        if (!pick.choice_index) {
            errors.push_back("Sub-tree selector " + node_tag(*node) + " is selected without a choice");
            continue;
        }
        const auto& opts = node->entries();
        const int choice = *pick.choice_index;
        if (choice < 0 || static_cast<std::size_t>(choice) >= opts.size()) {
            errors.push_back("Sub-tree selector " + node_tag(*node) + " choice " + std::to_string(choice) + " does not name an entry");
            continue;
        }
        const std::string& chosen = opts[static_cast<std::size_t>(choice)].name;
        auto pos = std::ranges::find(groups, chosen);
        if (pos == groups.end()) {
            errors.push_back("Sub-tree selector " + node_tag(*node) + " selects unknown group \"" + chosen + "\"");
        } else if (counts[static_cast<std::size_t>(pos - groups.begin())] == 0) {
            errors.push_back("Sub-tree selector " + node_tag(*node) + " selects \"" + chosen + "\" but none of its nodes are selected");
        }
    }

    std::vector<std::string> used;
    for (std::size_t i = 0; i < groups.size(); ++i) {
        if (counts[i] > 0) {
            used.push_back(groups[i]);
        }
    }
    if (used.size() > 1) {
        std::string names;
        for (const auto& name : used) {
            names += (names.empty() ? "" : ", ") + name;
        }
        errors.push_back("Selected nodes span " + std::to_string(used.size()) + " sub-tree groups: " + names);
    }
}

inline auto dominant_group(const Catalog& catalog, const std::vector<std::size_t>& counts) -> std::optional<std::string> {
    std::optional<std::string> best;
    std::size_t best_count = 0;
    for (std::size_t i = 0; i < counts.size(); ++i) {
        if (counts[i] > best_count) {
            best_count = counts[i];
            best = catalog.sub_tree_groups()[i];
        }
    }
    return best;
}

}  // namespace validator_detail

/**
 * @brief Check a selection for structural legality against `catalog`.
 *
 * Pure: the selection and the catalog are only read.
 */
inline auto validate(const Selection& selections, const Catalog& catalog, const ValidationOptions& options = {}) -> ValidationReport {
    using namespace validator_detail;

    ValidationReport report;
    check_shape(selections, catalog, options, report.errors);

    report.details.spent = count_spent(selections, catalog, options);
    check_budgets(report.details.spent, options.budgets, report.errors);
    check_gates(selections, catalog, options, report.errors);

    const auto counts = group_counts(selections, catalog);
    check_sub_trees(selections, catalog, counts, report.errors);
    report.details.sub_tree = dominant_group(catalog, counts);

    report.valid = report.errors.empty();
    return report;
}

}  // namespace talentcode
