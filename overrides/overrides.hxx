#pragma once

/**
 * @file overrides.hxx
 * @brief Name-keyed build descriptions (override strings, add/remove directives) -> Selection
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 *
 * Override strings
 * ----------------
 *   primary        = "vengeful_retreat:1/felblade/imprison:1"
 *   specialization = "spirit_bomb/fiery_brand:2"
 *   sub_tree       = "Aldrachi Reaver"
 *
 * Each entry is `name[:rank]`, rank defaulting to 1. Names are matched after
 * normalize_name(), so "Fiery Brand", "fiery_brand" and "FIERY BRAND" are
 * the same key. Other punctuation is dropped: "Fiery-Brand" is "fierybrand".
 *
 * Directives
 * ----------
 *   +Name[:rank]   add the node, or change its rank (default: max rank)
 *   -Name          remove the node
 */

#include <cctype>
#include <charconv>
#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../catalog/catalog.hxx"
#include "../catalog/selection.hxx"

namespace talentcode {

/// A name in an override or directive that matches nothing in the catalog.
struct unknown_reference : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// Override or directive text that cannot be parsed.
struct directive_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// ── Names ────────────────────────────────────────────────────────────────────

/// Lowercase; spaces and apostrophes become '_'; anything outside [a-z0-9_] is dropped.
inline auto normalize_name(std::string_view name) -> std::string {
    std::string out;
    out.reserve(name.size());
    for (char chr : name) {
        const auto uchr = static_cast<unsigned char>(chr);
        if (chr == ' ' || chr == '\'') {
            out += '_';
        } else if (std::isalnum(uchr) != 0) {
            out += static_cast<char>(std::tolower(uchr));
        } else if (chr == '_') {
            out += chr;
        }
    }
    return out;
}

/// First segment of a tiered name ("Alpha / Beta" -> "Alpha").
inline auto primary_segment(std::string_view name) -> std::string_view {
    auto pos = name.find(" / ");
    return pos == std::string_view::npos ? name : name.substr(0, pos);
}

/**
 * @brief Normalized name -> node (and entry, for choice-like nodes).
 *
 * Keys are registered in three passes (full node names, entry names, first
 * segments of tiered names) and the first registration of a key wins. A
 * full node name is never shadowed by an entry, and "Alpha" in a choice node
 * named "Alpha / Beta" resolves to the entry rather than the bare node.
 */
class NameIndex {
   public:
    struct Match {
        const Node* node = nullptr;
        std::optional<int> entry;  // set when the name matched one entry
    };

    explicit NameIndex(const Catalog& catalog) {
        for (const auto& node : catalog.nodes()) {
            add(node.name, Match{.node = &node});
        }
        for (const auto& node : catalog.nodes()) {
            const auto& opts = node.entries();
            for (std::size_t i = 0; i < opts.size(); ++i) {
                add(opts[i].name, Match{.node = &node, .entry = static_cast<int>(i)});
            }
        }
        for (const auto& node : catalog.nodes()) {
            add(primary_segment(node.name), Match{.node = &node});
        }
    }

    [[nodiscard]] auto find(std::string_view name) const -> std::optional<Match> {
        auto it = by_name_.find(normalize_name(name));
        if (it == by_name_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /// @throws unknown_reference naming `context` when `name` is unknown.
    [[nodiscard]] auto at(std::string_view name, std::string_view context) const -> Match {
        auto match = find(name);
        if (!match) {
            throw unknown_reference("unknown talent \"" + std::string(name) + "\" in " + std::string(context));
        }
        return *match;
    }

   private:
    void add(std::string_view name, Match match) {
        std::string key = normalize_name(name);
        if (!key.empty()) {
            by_name_.emplace(std::move(key), match);
        }
    }

    std::unordered_map<std::string, Match> by_name_;
};

// ── Override strings ─────────────────────────────────────────────────────────

namespace overrides_detail {

inline auto parse_rank(std::string_view text, std::string_view context) -> int {
    int rank = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, rank);
    if (ec != std::errc{} || ptr != last || rank < 1) {
        throw directive_error("invalid rank \"" + std::string(text) + "\" in " + std::string(context));
    }
    return rank;
}

/// Split `name[:rank]`.
inline auto split_rank(std::string_view text, std::string_view context) -> std::pair<std::string_view, std::optional<int>> {
    auto colon = text.find(':');
    if (colon == std::string_view::npos) {
        return {text, std::nullopt};
    }
    return {text.substr(0, colon), parse_rank(text.substr(colon + 1), context)};
}

inline auto split_entries(std::string_view list) -> std::vector<std::string_view> {
    std::vector<std::string_view> out;
    while (!list.empty()) {
        auto slash = list.find('/');
        auto item = list.substr(0, slash);
        if (!item.empty()) {
            out.push_back(item);
        }
        if (slash == std::string_view::npos) {
            break;
        }
        list.remove_prefix(slash + 1);
    }
    return out;
}

}  // namespace overrides_detail

struct Overrides {
    std::string primary;
    std::string specialization;
    std::string sub_tree;  // group name; selects the whole group
};

/// Preferred entry per choice node of a sub-tree group (node id -> entry index).
using ChoiceLocks = std::map<NodeId, int>;

/**
 * @brief Resolve name-keyed override strings against `catalog`.
 *
 * @throws unknown_reference for a talent or sub-tree group not in the catalog.
 * @throws directive_error for a malformed rank.
 */
inline auto overrides_to_selection(const Overrides& overrides, const Catalog& catalog, const ChoiceLocks& locks = {}) -> Selection {
    using namespace overrides_detail;

    const NameIndex index(catalog);
    Selection selection;

    const std::pair<std::string_view, std::string_view> lists[] = {{overrides.primary, "primary overrides"},
                                                                   {overrides.specialization, "specialization overrides"}};
    for (const auto& [list, context] : lists) {
        for (auto item : split_entries(list)) {
            auto [name, rank] = split_rank(item, context);
            auto match = index.at(name, context);
            Pick pick{.rank = rank.value_or(1)};
            if (match.node->is_choice()) {
                pick.choice_index = match.entry.value_or(0);
            }
            selection[match.node->id] = pick;
        }
    }

    if (overrides.sub_tree.empty()) {
        return selection;
    }

    const std::string wanted = normalize_name(overrides.sub_tree);
    std::optional<std::string> group;
    for (const auto& name : catalog.sub_tree_groups()) {
        if (normalize_name(name) == wanted) {
            group = name;
            break;
        }
    }
    if (!group) {
        throw unknown_reference("unknown sub-tree group \"" + overrides.sub_tree + "\"");
    }

    for (const Node* node : catalog.nodes_in_group(*group)) {
        Pick pick{.rank = node->max_rank};
        if (node->is_choice()) {
            auto lock = locks.find(node->id);
            pick.choice_index = lock == locks.end() ? 0 : lock->second;
        }
        selection[node->id] = pick;
    }

    if (const Node* selector = catalog.find_selector()) {
        const auto& opts = selector->entries();
        for (std::size_t i = 0; i < opts.size(); ++i) {
            if (normalize_name(opts[i].name) == wanted) {
                selection[selector->id] = Pick{.rank = 1, .choice_index = static_cast<int>(i)};
                break;
            }
        }
    }
    return selection;
}

// ── Directives ───────────────────────────────────────────────────────────────

struct Directive {
    enum class Op { Add, Remove };

    Op op = Op::Add;
    std::string name;
    std::optional<int> rank;  // Add only; default max rank
};

/**
 * @brief Parse "+Name[:rank]" or "-Name". Underscores in the name read as spaces.
 * @throws directive_error on a missing sigil, empty name, bad rank, or a rank on a removal.
 */
inline auto parse_directive(std::string_view text) -> Directive {
    if (text.size() < 2 || (text.front() != '+' && text.front() != '-')) {
        throw directive_error("invalid directive \"" + std::string(text) + "\": must start with + or - followed by a name");
    }
    Directive directive;
    directive.op = text.front() == '+' ? Directive::Op::Add : Directive::Op::Remove;

    auto [name, rank] = overrides_detail::split_rank(text.substr(1), "directive \"" + std::string(text) + "\"");
    if (name.empty()) {
        throw directive_error("invalid directive \"" + std::string(text) + "\": empty name");
    }
    if (rank && directive.op == Directive::Op::Remove) {
        throw directive_error("invalid directive \"" + std::string(text) + "\": a removal takes no rank");
    }
    directive.name = std::string(name);
    for (char& chr : directive.name) {
        if (chr == '_') {
            chr = ' ';
        }
    }
    directive.rank = rank;
    return directive;
}

inline auto to_string(const Directive& directive) -> std::string {
    std::string out = (directive.op == Directive::Op::Add ? "+" : "-") + directive.name;
    if (directive.rank) {
        out += ":" + std::to_string(*directive.rank);
    }
    return out;
}

struct AppliedDirectives {
    Selection selection;
    std::vector<std::string> changes;  // one human-readable line per directive
};

/**
 * @brief Apply directives in order to a copy of `base`.
 *
 * An add keeps the node's previous choice unless the name matched a specific
 * entry; a fresh choice node defaults to its first entry.
 *
 * @throws unknown_reference if a directive names no catalog node.
 */
inline auto apply_directives(const Selection& base, const std::vector<Directive>& directives, const Catalog& catalog) -> AppliedDirectives {
    const NameIndex index(catalog);
    AppliedDirectives out{.selection = base};

    for (const auto& directive : directives) {
        auto match = index.at(directive.name, "directive \"" + to_string(directive) + "\"");
        const Node& node = *match.node;
        const std::string tag = node.display_name() + " (node " + std::to_string(node.id) + ")";

        if (directive.op == Directive::Op::Remove) {
            out.selection.erase(node.id);
            out.changes.push_back("Removed: " + tag);
            continue;
        }

        Pick pick{.rank = directive.rank.value_or(node.max_rank)};
        if (node.has_choice()) {
            auto prior = out.selection.find(node.id);
            if (match.entry) {
                pick.choice_index = match.entry;
            } else if (prior != out.selection.end() && prior->second.choice_index) {
                pick.choice_index = prior->second.choice_index;
            } else {
                pick.choice_index = 0;
            }
        }
        out.selection[node.id] = pick;
        out.changes.push_back("Set: " + tag + " to rank " + std::to_string(pick.rank) + "/" + std::to_string(node.max_rank));
    }
    return out;
}

}  // namespace talentcode
