/**
 * @file test.cpp
 * @brief Tests for the logger: level parsing, file sink and level filtering
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../logger/logger.hxx"
#include "../testing/test_main.hpp"

using namespace talentcode;
namespace fs = std::filesystem;

namespace {

// The logger is a process-wide singleton: initialize it once, writing to a fresh file.
auto log_path() -> const fs::path& {
    static const fs::path path = [] {
        fs::path file = fs::temp_directory_path() / "talentcode_logger_test.log";
        fs::remove(file);
        Logger::get_instance().initialize(file.string(), false, Logger::level::INFO);
        return file;
    }();
    return path;
}

auto read_lines() -> std::vector<std::string> {
    Logger::get_instance().flush();
    std::ifstream in(log_path());
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Level names
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("levels")

TEST_CASE("level names parse, warn is accepted as warning") {
    expect(Logger::parse_level("debug") == Logger::level::DEBUG).to_be_true();
    expect(Logger::parse_level("success") == Logger::level::SUCCESS).to_be_true();
    expect(Logger::parse_level("warn") == Logger::level::WARNING).to_be_true();
    expect(Logger::parse_level("warning") == Logger::level::WARNING).to_be_true();
    expect(Logger::parse_level("error") == Logger::level::ERROR).to_be_true();
    expect(Logger::parse_level("loud").has_value()).to_be_false();
    expect(Logger::parse_level("INFO").has_value()).to_be_false();
}

// ─────────────────────────────────────────────────────────────────────────────
// File sink
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("file sink")

TEST_CASE("lines carry a level tag and the streamed message") {
    log_path();
    TC_LOG_INFO << "Loaded " << 24 << " nodes";
    TC_LOG_WARN << "Selector node not found";

    const auto lines = read_lines();
    expect(lines).to_have_line_containing("[  INFO ] Loaded 24 nodes");
    expect(lines).to_have_line_containing("[WARNING] Selector node not found");
}

TEST_CASE("messages below the minimum level are dropped") {
    log_path();
    TC_LOG_DEBUG << "hidden debug line";
    expect(read_lines()).not_to_have_line_containing("hidden debug line");

    Logger::get_instance().set_min_level(Logger::level::DEBUG);
    TC_LOG_DEBUG << "visible debug line";
    Logger::get_instance().set_min_level(Logger::level::INFO);
    expect(read_lines()).to_have_line_containing("[ DEBUG ] visible debug line");
}

TEST_CASE("empty messages are not written") {
    log_path();
    const auto before = read_lines().size();
    TC_LOG_ERROR;
    expect(read_lines()).to_have_size(before);
}

TEST_CASE("initializing twice throws") {
    log_path();
    expect(Logger::get_instance().is_initialized()).to_be_true();
    expect_throws(std::runtime_error, Logger::get_instance().initialize());
}
