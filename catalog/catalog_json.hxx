#pragma once

/**
 * @file catalog_json.hxx
 * @brief Read a node catalog exported as JSON
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 *
 * Accepted documents
 * ------------------
 * Either a bare array of nodes, or an object carrying the identity the
 * catalog was exported for:
 *
 *   {
 *     "treeIdentity": 581,
 *     "nodes": [
 *       { "id": 90912, "name": "Vengeful Bonds", "type": "single", "maxRanks": 1,
 *         "reqPoints": 0, "section": "class" },
 *       { "id": 99823, "type": "subtree", "section": "hero",
 *         "entries": [ { "name": "Aldrachi Reaver" }, { "name": "Annihilator" } ] }
 *     ]
 *   }
 *
 * Node fields
 *   id          unsigned, required
 *   name        string
 *   type        "single" | "tiered" | "choice" | "subtree"   (default "single")
 *   maxRanks    int >= 1                                      (default 1)
 *   freeNode    bool
 *   grantedFor  [int]   tree identities granting the node
 *   reqPoints   int
 *   section     "primary"|"class", "specialization"|"spec", "sub-tree"|"hero"
 *   subTree     string  group name for sub-tree nodes
 *   entries     [{ "name": string }]
 */

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "catalog.hxx"

namespace talentcode {

namespace catalog_json_detail {

using json = nlohmann::json;

inline auto parse_section(const std::string& text, NodeId id) -> Section {
    if (text == "primary" || text == "class") {
        return Section::Primary;
    }
    if (text == "specialization" || text == "spec") {
        return Section::Specialization;
    }
    if (text == "sub-tree" || text == "subtree" || text == "hero") {
        return Section::SubTree;
    }
    throw catalog_error("node " + std::to_string(id) + ": unknown section \"" + text + "\"");
}

inline auto parse_entries(const json& node_doc, NodeId id) -> std::vector<Entry> {
    std::vector<Entry> entries;
    if (!node_doc.contains("entries")) {
        return entries;
    }
    const json& list = node_doc.at("entries");
    if (!list.is_array()) {
        throw catalog_error("node " + std::to_string(id) + ": \"entries\" must be an array");
    }
    for (const auto& entry : list) {
        entries.push_back(Entry{.name = entry.value("name", std::string{})});
    }
    return entries;
}

inline auto parse_node(const json& node_doc) -> Node {
    if (!node_doc.is_object() || !node_doc.contains("id")) {
        throw catalog_error("catalog node without an \"id\"");
    }

    Node node;
    node.id = node_doc.at("id").get<NodeId>();
    node.name = node_doc.value("name", std::string{});
    node.max_rank = node_doc.value("maxRanks", 1);
    node.granted = node_doc.value("freeNode", false);
    node.req_points = node_doc.value("reqPoints", 0);
    node.section = parse_section(node_doc.value("section", std::string("primary")), node.id);
    node.sub_tree = node_doc.value("subTree", std::string{});
    if (node_doc.contains("grantedFor")) {
        node.granted_for = node_doc.at("grantedFor").get<std::vector<std::uint32_t>>();
    }

    const std::string type = node_doc.value("type", std::string("single"));
    if (type == "single" || type == "tiered") {
        node.kind = kind::Normal{};
    } else if (type == "choice") {
        node.kind = kind::Choice{.entries = parse_entries(node_doc, node.id)};
    } else if (type == "subtree") {
        node.kind = kind::SubtreeSelector{.entries = parse_entries(node_doc, node.id)};
    } else {
        throw catalog_error("node " + std::to_string(node.id) + ": unknown type \"" + type + "\"");
    }
    return node;
}

}  // namespace catalog_json_detail

/**
 * @brief Build a Catalog from an already parsed JSON document.
 * @throws catalog_error on structural problems in the document.
 */
inline auto catalog_from_json(const nlohmann::json& doc) -> Catalog {
    using catalog_json_detail::json;

    const json* nodes_doc = &doc;
    std::optional<std::uint32_t> tree_identity;
    std::vector<Node> nodes;
    try {
        if (doc.is_object()) {
            if (!doc.contains("nodes")) {
                throw catalog_error("catalog object has no \"nodes\" array");
            }
            nodes_doc = &doc.at("nodes");
            if (doc.contains("treeIdentity")) {
                tree_identity = doc.at("treeIdentity").get<std::uint32_t>();
            }
        }
        if (!nodes_doc->is_array()) {
            throw catalog_error("catalog nodes must be a JSON array");
        }

        nodes.reserve(nodes_doc->size());
        for (const auto& node_doc : *nodes_doc) {
            nodes.push_back(catalog_json_detail::parse_node(node_doc));
        }
    } catch (const nlohmann::json::exception& e) {
        throw catalog_error(std::string("malformed catalog field: ") + e.what());
    }
    return Catalog(std::move(nodes), tree_identity);
}

/**
 * @brief Read and parse a catalog file.
 * @throws catalog_error if the file cannot be opened or is not valid JSON.
 */
inline auto load_catalog(const std::filesystem::path& path) -> Catalog {
    std::ifstream file(path);
    if (!file) {
        throw catalog_error("cannot open catalog file: " + path.string());
    }
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw catalog_error("catalog file " + path.string() + " is not valid JSON: " + e.what());
    }
    return catalog_from_json(doc);
}

}  // namespace talentcode
