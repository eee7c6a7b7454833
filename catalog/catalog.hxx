#pragma once

/**
 * @file catalog.hxx
 * @brief Ordered node catalog of a selection tree, with partitioning and selector discovery
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 *
 * The catalog is produced elsewhere and only read here. Its ascending-id
 * order is the alignment contract between encoder and decoder, so the
 * constructor sorts and rejects duplicate ids instead of trusting input.
 */

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "selection.hxx"

namespace talentcode {

struct catalog_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// ── Sections ─────────────────────────────────────────────────────────────────

enum class Section : int { Primary = 0, Specialization = 1, SubTree = 2 };

inline constexpr std::size_t SECTION_COUNT = 3;
inline constexpr Section ALL_SECTIONS[SECTION_COUNT] = {Section::Primary, Section::Specialization, Section::SubTree};

inline auto section_name(Section section) noexcept -> const char* {
    switch (section) {
        case Section::Primary:
            return "primary";
        case Section::Specialization:
            return "specialization";
        case Section::SubTree:
            return "sub-tree";
    }
    return "unknown";
}

/// Capitalized form used at the start of report lines.
inline auto section_label(Section section) noexcept -> const char* {
    switch (section) {
        case Section::Primary:
            return "Primary";
        case Section::Specialization:
            return "Specialization";
        case Section::SubTree:
            return "Sub-tree";
    }
    return "Unknown";
}

// ── Node kinds ───────────────────────────────────────────────────────────────

struct Entry {
    std::string name;
};

namespace kind {
struct Normal {};
struct Choice {
    std::vector<Entry> entries;
};
struct SubtreeSelector {
    std::vector<Entry> entries;
};
}  // namespace kind

using NodeKind = std::variant<kind::Normal, kind::Choice, kind::SubtreeSelector>;

/// Visitor helper: `std::visit(overloaded{[](kind::Normal) {...}, ...}, node.kind)`.
template <typename... Fs>
struct overloaded : Fs... {
    using Fs::operator()...;
};

// ── Node ─────────────────────────────────────────────────────────────────────

struct Node {
    NodeId id = 0;
    std::string name;
    int max_rank = 1;
    NodeKind kind = kind::Normal{};
    bool granted = false;                     // active at rank 1 for every tree
    std::vector<std::uint32_t> granted_for;  // tree identities that grant it
    int req_points = 0;
    Section section = Section::Primary;
    std::string sub_tree;  // group name, sub-tree section only

    /// Options of a choice-like node; empty for Normal.
    [[nodiscard]] auto entries() const -> const std::vector<Entry>& {
        static const std::vector<Entry> none;
        return std::visit(overloaded{[](const kind::Normal&) -> const std::vector<Entry>& { return none; },
                                     [](const kind::Choice& choice) -> const std::vector<Entry>& { return choice.entries; },
                                     [](const kind::SubtreeSelector& selector) -> const std::vector<Entry>& { return selector.entries; }},
                          kind);
    }

    /// True for Choice and SubtreeSelector: the encoded record carries an entry index.
    [[nodiscard]] auto has_choice() const noexcept -> bool { return !std::holds_alternative<kind::Normal>(kind); }

    [[nodiscard]] auto is_choice() const noexcept -> bool { return std::holds_alternative<kind::Choice>(kind); }

    [[nodiscard]] auto is_selector() const noexcept -> bool { return std::holds_alternative<kind::SubtreeSelector>(kind); }

    /// Granted outright, or granted for the given tree identity.
    [[nodiscard]] auto is_granted_for(std::optional<std::uint32_t> tree_identity) const -> bool {
        if (granted) {
            return true;
        }
        return tree_identity.has_value() && std::ranges::find(granted_for, *tree_identity) != granted_for.end();
    }

    /// Rank a granted node has without spending a point.
    [[nodiscard]] auto baseline_rank(std::optional<std::uint32_t> tree_identity) const -> int { return is_granted_for(tree_identity) ? 1 : 0; }

    /// Node name, falling back to the first entry's name for unnamed choice nodes.
    [[nodiscard]] auto display_name() const -> std::string {
        if (!name.empty()) {
            return name;
        }
        const auto& opts = entries();
        return opts.empty() ? "node " + std::to_string(id) : opts.front().name;
    }
};

// ── Catalog ──────────────────────────────────────────────────────────────────

class Catalog {
   public:
    Catalog() = default;

    /**
     * @brief Take ownership of `nodes`, sorted ascending by id.
     *
     * @param tree_identity  Identity the catalog was exported for, if known.
     * @throws catalog_error on duplicate ids, max rank below 1, a sub-tree node
     *         without a group, or a choice-like node without entries.
     */
    explicit Catalog(std::vector<Node> nodes, std::optional<std::uint32_t> tree_identity = std::nullopt)
        : nodes_(std::move(nodes)), tree_identity_(tree_identity) {
        std::ranges::sort(nodes_, [](const Node& lhs, const Node& rhs) { return lhs.id < rhs.id; });

        for (std::size_t i = 0; i < nodes_.size(); ++i) {
            const Node& node = nodes_[i];
            if (!index_.emplace(node.id, i).second) {
                throw catalog_error("duplicate node id " + std::to_string(node.id));
            }
            if (node.max_rank < 1) {
                throw catalog_error("node " + std::to_string(node.id) + " has max rank " + std::to_string(node.max_rank));
            }
            if (node.has_choice() && node.entries().empty()) {
                throw catalog_error("choice node " + std::to_string(node.id) + " has no entries");
            }
            if (node.section == Section::SubTree && !node.is_selector()) {
                if (node.sub_tree.empty()) {
                    throw catalog_error("sub-tree node " + std::to_string(node.id) + " has no group name");
                }
                if (std::ranges::find(groups_, node.sub_tree) == groups_.end()) {
                    groups_.push_back(node.sub_tree);
                }
            }
        }
    }

    [[nodiscard]] auto nodes() const noexcept -> const std::vector<Node>& { return nodes_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return nodes_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return nodes_.empty(); }
    [[nodiscard]] auto tree_identity() const noexcept -> std::optional<std::uint32_t> { return tree_identity_; }

    /// Node with `id`, or nullptr.
    [[nodiscard]] auto find(NodeId id) const -> const Node* {
        auto it = index_.find(id);
        return it == index_.end() ? nullptr : &nodes_[it->second];
    }

    /// @throws catalog_error if `id` is unknown.
    [[nodiscard]] auto at(NodeId id) const -> const Node& {
        const Node* node = find(id);
        if (node == nullptr) {
            throw catalog_error("unknown node id " + std::to_string(id));
        }
        return *node;
    }

    [[nodiscard]] auto nodes_in(Section section) const -> std::vector<const Node*> {
        std::vector<const Node*> out;
        for (const auto& node : nodes_) {
            if (node.section == section) {
                out.push_back(&node);
            }
        }
        return out;
    }

    /// Sub-tree group names in order of first appearance (ascending id).
    [[nodiscard]] auto sub_tree_groups() const noexcept -> const std::vector<std::string>& { return groups_; }

    [[nodiscard]] auto has_group(std::string_view group) const -> bool { return std::ranges::find(groups_, group) != groups_.end(); }

    [[nodiscard]] auto nodes_in_group(std::string_view group) const -> std::vector<const Node*> {
        std::vector<const Node*> out;
        for (const auto& node : nodes_) {
            if (node.section == Section::SubTree && node.sub_tree == group) {
                out.push_back(&node);
            }
        }
        return out;
    }

    /// Group of a sub-tree node, or nullopt for any other node. Selectors belong to no group.
    [[nodiscard]] auto group_of(NodeId id) const -> std::optional<std::string> {
        const Node* node = find(id);
        if (node == nullptr || node->section != Section::SubTree || node->is_selector() || node->sub_tree.empty()) {
            return std::nullopt;
        }
        return node->sub_tree;
    }

    /**
     * @brief Discover the sub-tree selector by shape rather than by id.
     *
     * A full class catalog holds one selector per specialization; the one
     * that belongs to this catalog is the selector whose entries all name
     * sub-tree groups present here.
     */
    [[nodiscard]] auto find_selector() const -> const Node* {
        for (const auto& node : nodes_) {
            if (!node.is_selector()) {
                continue;
            }
            const auto& opts = node.entries();
            if (!opts.empty() && std::ranges::all_of(opts, [this](const Entry& entry) { return has_group(entry.name); })) {
                return &node;
            }
        }
        return nullptr;
    }

   private:
    std::vector<Node> nodes_;
    std::unordered_map<NodeId, std::size_t> index_;
    std::vector<std::string> groups_;
    std::optional<std::uint32_t> tree_identity_;
};

}  // namespace talentcode
