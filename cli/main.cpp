/**
 * @file main.cpp
 * @brief talentcode command-line tool: decode, encode, validate, modify and fingerprint loadout strings
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 *
 * Results go to stdout, one item per line, so they can be piped; every
 * diagnostic goes through the logger (stderr or --log-file).
 *
 *   talentcode decode      --catalog tree.json --loadout <string>
 *   talentcode encode      --catalog tree.json --primary "felblade/imprison:2" --sub-tree "Aldrachi Reaver"
 *   talentcode validate    --catalog tree.json --loadout <string>
 *   talentcode modify      --catalog tree.json --loadout <string> --op -Spirit_Bomb --op +Soul_Carver
 *   talentcode fingerprint --catalog tree.json --loadout <string>
 *
 * Exit status is 0 on success and 1 on any error or illegal build.
 */

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../argparser/argparser.hxx"
#include "../catalog/catalog.hxx"
#include "../catalog/catalog_json.hxx"
#include "../fingerprint/fingerprint.hxx"
#include "../loadout/loadout.hxx"
#include "../logger/logger.hxx"
#include "../overrides/modify.hxx"
#include "../overrides/overrides.hxx"
#include "../validator/validator.hxx"

using namespace talentcode;
namespace fs = std::filesystem;

namespace {

constexpr int MAX_BUDGET = 1000;

auto make_parser() -> cli::ArgParser {
    cli::ArgParser parser("talentcode", "Encode, decode and check selection-tree loadout strings");
    parser.add_command("decode", "Print the nodes selected by a loadout string")
        .add_command("encode", "Build a loadout string from name-keyed overrides")
        .add_command("validate", "Check a loadout string (or overrides) against budgets and gates")
        .add_command("modify", "Apply +Name[:rank] / -Name directives to a loadout string")
        .add_command("fingerprint", "Print the canonical key of a loadout string");

    parser.add<fs::path>("catalog").shorthand('c').description("Node catalog (JSON)").require();
    parser.add<std::string>("loadout").shorthand('l').description("Loadout string");
    parser.add<std::string>("primary").description("Primary overrides, e.g. felblade/imprison:2");
    parser.add<std::string>("specialization").description("Specialization overrides");
    parser.add<std::string>("sub-tree").description("Sub-tree group name");
    parser.add<int>("tree").shorthand('t').description("Tree identity for encode").min(0).max(static_cast<int>(format::MAX_TREE_IDENTITY));
    parser.add<cli::StringList>("op").shorthand('o').description("Directive for modify");
    parser.add<int>("primary-budget").description("Points in the primary section").default_val(Budgets{}.primary).min(0).max(MAX_BUDGET);
    parser.add<int>("specialization-budget").description("Points in the specialization section").default_val(Budgets{}.specialization).min(0).max(MAX_BUDGET);
    parser.add<int>("sub-tree-budget").description("Points in the sub-tree section").default_val(Budgets{}.sub_tree).min(0).max(MAX_BUDGET);
    parser.add<std::string>("log-level").description("Minimum log level").default_val("info").allow({"debug", "info", "success", "warning", "error"});
    parser.add<fs::path>("log-file").description("Write log lines to this file instead of stderr");
    parser.add<bool>("no-color").description("Disable colored log output").default_val(false);
    return parser;
}

void init_logger(const cli::ArgParser& parser) {
    const auto level = Logger::parse_level(parser.get<std::string>("log-level")).value_or(Logger::level::INFO);
    const auto log_file = parser.get_optional<fs::path>("log-file");
    Logger::get_instance().initialize(log_file ? log_file->string() : "", !parser.get<bool>("no-color"), level);
}

auto validation_options(const cli::ArgParser& parser, std::optional<std::uint32_t> tree_identity) -> ValidationOptions {
    return ValidationOptions{.budgets = {.primary = parser.get<int>("primary-budget"),
                                         .specialization = parser.get<int>("specialization-budget"),
                                         .sub_tree = parser.get<int>("sub-tree-budget")},
                             .tree_identity = tree_identity};
}

auto require_loadout(const cli::ArgParser& parser) -> std::string {
    auto loadout = parser.get_optional<std::string>("loadout");
    if (!loadout) {
        throw cli::ParseError("--loadout is required for " + parser.command());
    }
    return *loadout;
}

auto has_overrides(const cli::ArgParser& parser) -> bool { return parser.has("primary") || parser.has("specialization") || parser.has("sub-tree"); }

auto overrides_from(const cli::ArgParser& parser) -> Overrides {
    return Overrides{.primary = parser.get_optional<std::string>("primary").value_or(""),
                     .specialization = parser.get_optional<std::string>("specialization").value_or(""),
                     .sub_tree = parser.get_optional<std::string>("sub-tree").value_or("")};
}

auto tree_identity_for_encode(const cli::ArgParser& parser, const Catalog& catalog) -> std::uint32_t {
    if (auto tree = parser.get_optional<int>("tree")) {
        return static_cast<std::uint32_t>(*tree);
    }
    if (auto tree = catalog.tree_identity()) {
        return *tree;
    }
    throw cli::ParseError("--tree is required: the catalog does not name its tree identity");
}

void print_report(const ValidationReport& report) {
    if (report.valid) {
        std::cout << "valid\n";
        return;
    }
    for (const auto& error : report.errors) {
        std::cout << error << '\n';
    }
}

void log_spent(const ValidationReport& report) {
    for (Section section : ALL_SECTIONS) {
        TC_LOG_DEBUG << section_label(section) << " spent: " << report.details.spent_in(section);
    }
    if (report.details.sub_tree) {
        TC_LOG_DEBUG << "Sub-tree group: " << *report.details.sub_tree;
    }
}

// ── Commands ─────────────────────────────────────────────────────────────────

auto run_decode(const cli::ArgParser& parser, const Catalog& catalog) -> int {
    const Loadout loadout = decode(require_loadout(parser), catalog);
    TC_LOG_INFO << "Decoded " << loadout.selections.size() << " selected nodes for tree " << loadout.tree_identity;

    std::cout << "tree " << loadout.tree_identity << '\n';
    for (Section section : ALL_SECTIONS) {
        for (const auto& [id, pick] : loadout.selections) {
            const Node* node = catalog.find(id);
            if (node == nullptr || node->section != section) {
                continue;
            }
            std::cout << section_name(section) << '\t' << id << '\t' << node->display_name() << '\t' << pick.rank << '/' << node->max_rank;
            if (pick.choice_index && static_cast<std::size_t>(*pick.choice_index) < node->entries().size()) {
                std::cout << '\t' << node->entries()[static_cast<std::size_t>(*pick.choice_index)].name;
            }
            std::cout << '\n';
        }
    }
    return EXIT_SUCCESS;
}

auto run_encode(const cli::ArgParser& parser, const Catalog& catalog) -> int {
    const std::uint32_t tree = tree_identity_for_encode(parser, catalog);
    const Selection selection = overrides_to_selection(overrides_from(parser), catalog);

    const ValidationReport report = validate(selection, catalog, validation_options(parser, tree));
    for (const auto& error : report.errors) {
        TC_LOG_WARN << error;
    }

    std::cout << encode(tree, catalog, selection) << '\n';
    TC_LOG_SUCCESS << "Encoded " << selection.size() << " selected nodes for tree " << tree;
    return EXIT_SUCCESS;
}

auto run_validate(const cli::ArgParser& parser, const Catalog& catalog) -> int {
    Selection selection;
    std::optional<std::uint32_t> tree;
    if (parser.has("loadout")) {
        Loadout loadout = decode(parser.get<std::string>("loadout"), catalog);
        selection = std::move(loadout.selections);
        tree = loadout.tree_identity;
    } else if (has_overrides(parser)) {
        selection = overrides_to_selection(overrides_from(parser), catalog);
        tree = parser.has("tree") ? std::optional<std::uint32_t>(static_cast<std::uint32_t>(parser.get<int>("tree"))) : catalog.tree_identity();
    } else {
        throw cli::ParseError("validate needs --loadout or at least one of --primary, --specialization, --sub-tree");
    }

    const ValidationReport report = validate(selection, catalog, validation_options(parser, tree));
    log_spent(report);
    print_report(report);
    if (!report.valid) {
        TC_LOG_ERROR << "Build is not legal: " << report.errors.size() << " problem(s)";
        return EXIT_FAILURE;
    }
    TC_LOG_SUCCESS << "Build is legal";
    return EXIT_SUCCESS;
}

auto run_modify(const cli::ArgParser& parser, const Catalog& catalog) -> int {
    const std::string base = require_loadout(parser);
    const auto ops = parser.get_optional<cli::StringList>("op").value_or(cli::StringList{});
    if (ops.empty()) {
        TC_LOG_WARN << "No --op given; the loadout is only re-validated";
    }

    std::vector<Directive> directives;
    directives.reserve(ops.size());
    for (const auto& text : ops) {
        directives.push_back(parse_directive(text));
    }

    const ModifyResult result = modify(base, directives, catalog, validation_options(parser, std::nullopt));
    for (const auto& change : result.changes) {
        TC_LOG_INFO << change;
    }
    log_spent(result.report);

    if (!result.loadout) {
        print_report(result.report);
        TC_LOG_ERROR << "Modified build is not legal; no loadout string produced";
        return EXIT_FAILURE;
    }
    std::cout << *result.loadout << '\n';
    TC_LOG_SUCCESS << "Applied " << directives.size() << " directive(s)";
    return EXIT_SUCCESS;
}

auto run_fingerprint(const cli::ArgParser& parser, const Catalog& catalog) -> int {
    const Loadout loadout = decode(require_loadout(parser), catalog);
    std::cout << fingerprint(loadout.selections, catalog) << '\n';
    return EXIT_SUCCESS;
}

auto dispatch(const cli::ArgParser& parser, const Catalog& catalog) -> int {
    const std::string& command = parser.command();
    if (command == "decode") {
        return run_decode(parser, catalog);
    }
    if (command == "encode") {
        return run_encode(parser, catalog);
    }
    if (command == "validate") {
        return run_validate(parser, catalog);
    }
    if (command == "modify") {
        return run_modify(parser, catalog);
    }
    return run_fingerprint(parser, catalog);
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
    cli::ArgParser parser = make_parser();
    if (!argparser_parse(parser, argc, argv)) {
        return EXIT_FAILURE;
    }
    if (parser.help_requested()) {
        parser.print_help();
        return EXIT_SUCCESS;
    }

    try {
        init_logger(parser);
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    try {
        const fs::path catalog_path = parser.get<fs::path>("catalog");
        const Catalog catalog = load_catalog(catalog_path);
        TC_LOG_DEBUG << "Loaded " << catalog.size() << " nodes from " << catalog_path.string();
        return dispatch(parser, catalog);
    } catch (const cli::ParseError& e) {
        TC_LOG_ERROR << e.what();
    } catch (const catalog_error& e) {
        TC_LOG_ERROR << "Catalog: " << e.what();
    } catch (const decode_error& e) {
        TC_LOG_ERROR << "Decode failed (" << decode_errc_name(e.code()) << "): " << e.what();
    } catch (const encode_error& e) {
        TC_LOG_ERROR << "Encode failed: " << e.what();
    } catch (const unknown_reference& e) {
        TC_LOG_ERROR << "Unknown reference: " << e.what();
    } catch (const directive_error& e) {
        TC_LOG_ERROR << "Bad directive: " << e.what();
    } catch (const std::exception& e) {
        TC_LOG_ERROR << "Unexpected error: " << e.what();
    }
    Logger::get_instance().flush();
    return EXIT_FAILURE;
}
