#pragma once

/**
 * @file modify.hxx
 * @brief Edit an existing loadout string by name: decode, apply directives, validate, re-encode
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../catalog/catalog.hxx"
#include "../loadout/loadout.hxx"
#include "../validator/validator.hxx"
#include "overrides.hxx"

namespace talentcode {

struct ModifyResult {
    Loadout base;                       // decoded input
    Selection selection;                // after the directives
    std::vector<std::string> changes;   // one line per directive
    ValidationReport report;            // of `selection`
    std::optional<std::string> loadout; // set only when report.valid
};

/**
 * @brief Apply add/remove directives to `base` and re-encode if the result is legal.
 *
 * The new string keeps the tree identity of `base`. When validation fails
 * nothing is encoded and the report lists every violation.
 *
 * @throws decode_error if `base` is malformed.
 * @throws unknown_reference if a directive names no catalog node.
 * @throws encode_error if the validated selection still cannot be encoded.
 */
inline auto modify(std::string_view base, const std::vector<Directive>& directives, const Catalog& catalog, ValidationOptions options = {})
    -> ModifyResult {
    ModifyResult result;
    result.base = decode(base, catalog);

    auto applied = apply_directives(result.base.selections, directives, catalog);
    result.selection = std::move(applied.selection);
    result.changes = std::move(applied.changes);

    if (!options.tree_identity) {
        options.tree_identity = result.base.tree_identity;
    }
    result.report = validate(result.selection, catalog, options);
    if (result.report.valid) {
        result.loadout = encode(result.base.tree_identity, catalog, result.selection);
    }
    return result;
}

}  // namespace talentcode
