/**
 * @file test.cpp
 * @brief Tests for the command-line parser and its TOML config layer
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "../argparser/argparser.hxx"
#include "../testing/test_main.hpp"

using namespace talentcode::cli;

namespace {

auto make_parser() -> ArgParser {
    ArgParser parser("talentcode", "test parser");
    parser.add_command("decode", "Decode a loadout").add_command("modify", "Edit a loadout");
    parser.add<fs::path>("catalog").shorthand('c').description("Catalog file").require();
    parser.add<std::string>("loadout").shorthand('l').description("Loadout string");
    parser.add<StringList>("op").description("Directive");
    parser.add<int>("primary-budget").description("Budget").default_val(34).min(0).max(63);
    parser.add<std::string>("log-level").description("Level").default_val("info").allow({"debug", "info", "warning", "error"});
    parser.add<bool>("no-color").description("Plain output").default_val(false);
    return parser;
}

// Writes `content` to a fresh file in the temp directory and returns its path.
auto write_config(const std::string& name, const std::string& content) -> std::string {
    const fs::path path = fs::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Command line
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("command line")

TEST_CASE("command and options are parsed") {
    ArgParser parser = make_parser();
    parser.parse(std::vector<std::string>{"decode", "--catalog", "tree.json", "-l", "CAAAA"});
    expect(parser.command()).to_equal(std::string("decode"));
    expect(parser.get<fs::path>("catalog")).to_equal(fs::path("tree.json"));
    expect(parser.get<std::string>("loadout")).to_equal(std::string("CAAAA"));
}

TEST_CASE("defaults apply when an option is absent") {
    ArgParser parser = make_parser();
    parser.parse(std::vector<std::string>{"decode", "--catalog", "tree.json"});
    expect(parser.get<int>("primary-budget")).to_equal(34);
    expect(parser.get<std::string>("log-level")).to_equal(std::string("info"));
    expect(parser.get<bool>("no-color")).to_be_false();
    expect(parser.has("loadout")).to_be_false();
    expect(parser.get_optional<std::string>("loadout").has_value()).to_be_false();
}

TEST_CASE("repeatable options collect every value, dashes included") {
    ArgParser parser = make_parser();
    parser.parse(std::vector<std::string>{"modify", "-c", "tree.json", "--op", "+Felblade", "--op", "-Spirit_Bomb"});
    const StringList expected{"+Felblade", "-Spirit_Bomb"};
    expect(parser.get<StringList>("op")).to_equal(expected);
}

TEST_CASE("bool flags need no value") {
    ArgParser parser = make_parser();
    parser.parse(std::vector<std::string>{"decode", "--no-color", "--catalog", "tree.json"});
    expect(parser.get<bool>("no-color")).to_be_true();
}

TEST_CASE("help is reported without checking required options") {
    ArgParser parser = make_parser();
    parser.parse(std::vector<std::string>{"--help"});
    expect(parser.help_requested()).to_be_true();
}

TEST_CASE("invalid command lines are rejected") {
    expect_throws(ParseError, make_parser().parse(std::vector<std::string>{"--catalog", "tree.json"}));
    expect_throws(ParseError, make_parser().parse(std::vector<std::string>{"explode", "--catalog", "tree.json"}));
    expect_throws(ParseError, make_parser().parse(std::vector<std::string>{"decode"}));
    expect_throws(ParseError, make_parser().parse(std::vector<std::string>{"decode", "--catalog", "a", "--catalog", "b"}));
    expect_throws(ParseError, make_parser().parse(std::vector<std::string>{"decode", "--catalog", "a", "--verbose"}));
    expect_throws(ParseError, make_parser().parse(std::vector<std::string>{"decode", "--catalog"}));
    expect_throws(ParseError, make_parser().parse(std::vector<std::string>{"decode", "decode", "--catalog", "a"}));
}

TEST_CASE("range and choice constraints are enforced") {
    expect_throws(ParseError, make_parser().parse(std::vector<std::string>{"decode", "-c", "a", "--primary-budget", "64"}));
    expect_throws(ParseError, make_parser().parse(std::vector<std::string>{"decode", "-c", "a", "--primary-budget", "3x"}));
    expect_throws(ParseError, make_parser().parse(std::vector<std::string>{"decode", "-c", "a", "--log-level", "loud"}));
}

TEST_CASE("get with the wrong type throws") {
    ArgParser parser = make_parser();
    parser.parse(std::vector<std::string>{"decode", "--catalog", "tree.json"});
    expect_throws(ParseError, (void)parser.get<std::string>("primary-budget"));
}

TEST_CASE("registering an option twice throws") {
    ArgParser parser = make_parser();
    expect_throws(ParseError, parser.add<int>("op"));
}

// ─────────────────────────────────────────────────────────────────────────────
// TOML config
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("toml config")

TEST_CASE("config values override defaults") {
    const std::string path = write_config("talentcode_test_values.toml",
                                          "[talentcode]\n"
                                          "catalog = \"data/vengeance.json\"   # exported tree\n"
                                          "primary-budget = 31\n"
                                          "no-color = true\n"
                                          "op = [\"+Felblade\", \"-Imprison\"]\n");
    ArgParser parser = make_parser();
    parser.parse(std::vector<std::string>{"modify", "--config", path});

    expect(parser.get<fs::path>("catalog")).to_equal(fs::path("data/vengeance.json"));
    expect(parser.get<int>("primary-budget")).to_equal(31);
    expect(parser.get<bool>("no-color")).to_be_true();
    const StringList expected{"+Felblade", "-Imprison"};
    expect(parser.get<StringList>("op")).to_equal(expected);
}

TEST_CASE("command line overrides the config file") {
    const std::string path = write_config("talentcode_test_precedence.toml",
                                          "catalog = 'from_config.json'\n"
                                          "primary-budget = 31\n"
                                          "op = [\"+Felblade\"]\n");
    ArgParser parser = make_parser();
    parser.parse(std::vector<std::string>{"modify", "-C", path, "--primary-budget", "30", "--op", "-Spirit_Bomb"});

    expect(parser.get<fs::path>("catalog")).to_equal(fs::path("from_config.json"));
    expect(parser.get<int>("primary-budget")).to_equal(30);
    const StringList expected{"-Spirit_Bomb"};
    expect(parser.get<StringList>("op")).to_equal(expected);
}

TEST_CASE("bad config files are rejected") {
    const std::string unknown = write_config("talentcode_test_unknown.toml", "colour = true\n");
    expect_throws(ParseError, make_parser().parse(std::vector<std::string>{"decode", "-c", "a", "--config", unknown}));

    const std::string duplicate = write_config("talentcode_test_duplicate.toml", "primary-budget = 1\nprimary-budget = 2\n");
    expect_throws(ParseError, make_parser().parse(std::vector<std::string>{"decode", "-c", "a", "--config", duplicate}));

    const std::string no_equals = write_config("talentcode_test_noeq.toml", "primary-budget 34\n");
    expect_throws(ParseError, make_parser().parse(std::vector<std::string>{"decode", "-c", "a", "--config", no_equals}));

    const std::string bad_list = write_config("talentcode_test_badlist.toml", "op = \"+Felblade\"\n");
    expect_throws(ParseError, make_parser().parse(std::vector<std::string>{"decode", "-c", "a", "--config", bad_list}));

    expect_throws(ParseError, make_parser().parse(std::vector<std::string>{"decode", "-c", "a", "--config", "/nonexistent/talentcode.toml"}));
}
