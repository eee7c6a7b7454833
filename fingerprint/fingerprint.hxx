#pragma once

/**
 * @file fingerprint.hxx
 * @brief Canonical keys and readable names for a selection
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <string>
#include <vector>

#include "../catalog/catalog.hxx"
#include "../catalog/selection.hxx"
#include "../overrides/overrides.hxx"

namespace talentcode {

namespace fingerprint_detail {

inline auto section_key(const Selection& selection, const Catalog& catalog, Section section) -> std::string {
    std::string out;
    for (const auto& [id, pick] : selection) {
        const Node* node = catalog.find(id);
        if (node == nullptr || node->section != section || node->is_selector()) {
            continue;
        }
        if (!out.empty()) {
            out += ',';
        }
        out += std::to_string(id) + ":" + std::to_string(pick.rank);
        if (pick.choice_index) {
            out += ":c" + std::to_string(*pick.choice_index);
        }
    }
    return out;
}

}  // namespace fingerprint_detail

/**
 * @brief Key over specialization and sub-tree picks, e.g. "spec[12:1,15:2:c1]sub[40:1]".
 *
 * Primary-section picks and selector nodes are left out: two builds with the
 * same fingerprint differ only in their primary section. Ids come in
 * ascending order, so equal selections always give equal keys.
 */
inline auto fingerprint(const Selection& selection, const Catalog& catalog) -> std::string {
    return "spec[" + fingerprint_detail::section_key(selection, catalog, Section::Specialization) + "]sub[" +
           fingerprint_detail::section_key(selection, catalog, Section::SubTree) + "]";
}

/// Display names of the picks in `section`, using the chosen entry for choice nodes.
inline auto selected_names(const Selection& selection, const Catalog& catalog, Section section) -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto& [id, pick] : selection) {
        const Node* node = catalog.find(id);
        if (node == nullptr || node->section != section) {
            continue;
        }
        const auto& opts = node->entries();
        if (pick.choice_index && *pick.choice_index >= 0 && static_cast<std::size_t>(*pick.choice_index) < opts.size()) {
            names.push_back(opts[static_cast<std::size_t>(*pick.choice_index)].name);
        } else {
            names.emplace_back(primary_segment(node->display_name()));
        }
    }
    return names;
}

}  // namespace talentcode
