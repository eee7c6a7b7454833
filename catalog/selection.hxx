#pragma once

/**
 * @file selection.hxx
 * @brief Sparse node-id -> rank/choice mapping shared by codec, validator and adapters
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <cstdint>
#include <map>
#include <optional>
#include <ostream>

namespace talentcode {

using NodeId = std::uint32_t;

/// Rank (>= 1) and, for choice-like nodes, the chosen entry index.
struct Pick {
    int rank = 1;
    std::optional<int> choice_index;

    auto operator==(const Pick&) const -> bool = default;
};

/// Absent id means rank 0. Ordered by id so iteration matches catalog order.
using Selection = std::map<NodeId, Pick>;

inline auto operator<<(std::ostream& out, const Pick& pick) -> std::ostream& {
    out << "rank " << pick.rank;
    if (pick.choice_index) {
        out << " choice " << *pick.choice_index;
    }
    return out;
}

inline auto operator<<(std::ostream& out, const Selection& selection) -> std::ostream& {
    out << '{';
    bool first = true;
    for (const auto& [id, pick] : selection) {
        out << (first ? "" : ", ") << id << ": " << pick;
        first = false;
    }
    return out << '}';
}

}  // namespace talentcode
