#pragma once

/**
 * @file logger.hxx
 * @brief Logger class and macros
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 *
 * Log lines never go to stdout: the command-line tool prints its results
 * (loadout strings, decoded listings) there, and they must stay pipeable.
 */

#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace talentcode {

// ── Internal clock ────────────────────────────────────────────────────────────

namespace logger_detail {
/// Returns seconds elapsed since the first call (program-relative wall time).
inline auto elapsed_seconds() noexcept -> double {
    using clock = std::chrono::steady_clock;
    using dseconds = std::chrono::duration<double>;
    static const auto start = clock::now();
    return std::chrono::duration_cast<dseconds>(clock::now() - start).count();
}
}  // namespace logger_detail

// ── ANSI color constants ──────────────────────────────────────────────────────

struct Colors {
    static constexpr const char* reset = "\033[0m";
    static constexpr const char* white = "\033[37m";
    static constexpr const char* blue = "\033[34m";
    static constexpr const char* cyan = "\033[36m";
    static constexpr const char* bright_red = "\033[91m";
    static constexpr const char* bright_green = "\033[92m";
    static constexpr const char* bright_yellow = "\033[93m";
    static constexpr const char* bright_blue = "\033[94m";
};

// ── Logger ───────────────────────────────────────────────────────────────────

/**
 * @brief Singleton, thread-safe Logger.
 *
 * Supports:
 *  - Runtime-configurable minimum log level.
 *  - stderr output, or a plain-text log file instead.
 *  - ANSI color codes on the console.
 *  - Stream-style log_stream objects (RAII flush on destruction).
 */
class Logger {
   public:
    /// Severity levels, ordered from least to most severe.
    enum class level : int { DEBUG = 0, INFO = 1, SUCCESS = 2, WARNING = 3, ERROR = 4 };

    /// "debug" | "info" | "success" | "warning" | "error" -> level.
    static auto parse_level(std::string_view name) -> std::optional<level> {
        if (name == "debug") {
            return level::DEBUG;
        }
        if (name == "info") {
            return level::INFO;
        }
        if (name == "success") {
            return level::SUCCESS;
        }
        if (name == "warning" || name == "warn") {
            return level::WARNING;
        }
        if (name == "error") {
            return level::ERROR;
        }
        return std::nullopt;
    }

    // ── log_stream ────────────────────────────────────────────────────────────

    /**
     * @brief RAII stream wrapper: accumulates tokens via `operator<<` and
     *        flushes the full message to the Logger on destruction.
     *
     * @code
     *   TC_LOG_INFO << "Loaded " << catalog.size() << " nodes";
     * @endcode
     */
    class log_stream {
       public:
        log_stream(Logger& logger_obj, level lvl) : lg_(logger_obj), level_(lvl) {}

        log_stream(log_stream&& logstr) noexcept : lg_(logstr.lg_), level_(logstr.level_), buf_(std::move(logstr.buf_)) { logstr.moved_ = true; }

        log_stream(const log_stream&) = delete;
        auto operator=(const log_stream&) -> log_stream& = delete;
        auto operator=(log_stream&&) -> log_stream& = delete;

        template <typename T>
        auto operator<<(const T& val) -> log_stream& {
            buf_ << val;
            return *this;
        }

        ~log_stream() {
            if (moved_) {
                return;
            }
            std::string msg = buf_.str();
            if (!msg.empty()) {
                lg_.emit(msg, level_);
            }
        }

       private:
        Logger& lg_;
        level level_;
        std::ostringstream buf_;
        bool moved_ = false;
    };

    // ── Singleton access ──────────────────────────────────────────────────────

    static auto get_instance() -> Logger& {
        static Logger instance;
        return instance;
    }

    Logger(const Logger&) = delete;
    auto operator=(const Logger&) -> Logger& = delete;

    // ── Initialization ────────────────────────────────────────────────────────

    /**
     * @brief Initialize the Logger. Call once, before the first log line.
     *
     * @param file_path   Write plain-text lines to this file instead of stderr
     *                    (empty = stderr).
     * @param use_colors  Emit ANSI escape codes on console output.
     * @param min_level   Discard messages below this severity.
     *
     * @throws std::runtime_error if called more than once, or if the file
     *         cannot be opened.
     */
    void initialize(const std::string& file_path = "", bool use_colors = true, level min_level = level::INFO) {
        std::lock_guard lock(mutex_);
        if (initialized_) {
            throw std::runtime_error("Logger already initialized!");
        }

        use_colors_ = use_colors;
        min_level_ = min_level;

        if (!file_path.empty()) {
            file_.open(file_path, std::ios::app);
            if (!file_.is_open()) {
                throw std::runtime_error("Failed to open log file: " + file_path);
            }
        }

        initialized_ = true;
    }

    [[nodiscard]] auto is_initialized() const -> bool {
        std::lock_guard lock(mutex_);
        return initialized_;
    }

    // ── Runtime controls ─────────────────────────────────────────────────────

    void set_colors(bool flag) {
        std::lock_guard lock(mutex_);
        use_colors_ = flag;
    }

    void set_min_level(level lvl) {
        std::lock_guard lock(mutex_);
        min_level_ = lvl;
    }

    void flush() {
        std::lock_guard lock(mutex_);
        std::cerr.flush();
        if (file_.is_open()) {
            file_.flush();
        }
    }

    // ── Stream-style factory methods ─────────────────────────────────────────

    log_stream debug() { return {*this, level::DEBUG}; }
    log_stream info() { return {*this, level::INFO}; }
    log_stream success() { return {*this, level::SUCCESS}; }
    log_stream warning() { return {*this, level::WARNING}; }
    log_stream error() { return {*this, level::ERROR}; }

    ~Logger() {
        std::lock_guard lock(mutex_);
        if (file_.is_open()) {
            file_.close();
        }
    }

    friend class log_stream;

   private:
    Logger() = default;

    struct level_meta {
        const char* label;  // fixed-width, 7 chars
        const char* color;
    };

    static auto meta_of(level lvl) noexcept -> level_meta {
        switch (lvl) {
            case level::DEBUG:
                return {.label = " DEBUG ", .color = Colors::blue};
            case level::INFO:
                return {.label = "  INFO ", .color = Colors::bright_blue};
            case level::SUCCESS:
                return {.label = "SUCCESS", .color = Colors::bright_green};
            case level::WARNING:
                return {.label = "WARNING", .color = Colors::bright_yellow};
            case level::ERROR:
                return {.label = " ERROR ", .color = Colors::bright_red};
        }
        return {.label = "       ", .color = Colors::white};
    }

    static auto format_time(double elapsed) -> std::string {
        constexpr int MS_PER_SECOND = 1000;
        constexpr int MS_PER_MINUTE = 60000;
        constexpr int MS_PER_HOUR = 3600000;
        constexpr int TIME_BUFFER_SIZE = 32;

        int total_ms = static_cast<int>(elapsed * MS_PER_SECOND);
        int hours = total_ms / MS_PER_HOUR;
        int minutes = (total_ms % MS_PER_HOUR) / MS_PER_MINUTE;
        int seconds = (total_ms % MS_PER_MINUTE) / MS_PER_SECOND;
        int millis = total_ms % MS_PER_SECOND;

        char buf[TIME_BUFFER_SIZE];
        std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d", hours, minutes, seconds, millis);
        return buf;
    }

    // Called with mutex held
    void write_line(const std::string& message, level lvl) {
        const auto [label, color] = meta_of(lvl);
        std::string time_tag = "[" + format_time(logger_detail::elapsed_seconds()) + "] ";
        std::string level_tag = std::string("[") + label + "] ";

        if (file_.is_open()) {
            file_ << time_tag << level_tag << message << '\n';
            file_.flush();
        } else if (use_colors_) {
            std::cerr << Colors::cyan << time_tag << Colors::reset << color << level_tag << Colors::reset << message << '\n';
        } else {
            std::cerr << time_tag << level_tag << message << '\n';
        }
    }

    // Before initialize() lines still reach stderr, uncolored, at INFO and up
    void emit(const std::string& message, level lvl) noexcept {
        std::lock_guard lock(mutex_);
        if (!initialized_) {
            use_colors_ = false;
        }
        if (lvl < min_level_) {
            return;
        }
        write_line(message, lvl);
    }

    mutable std::mutex mutex_;
    bool initialized_ = false;
    bool use_colors_ = true;
    level min_level_ = level::INFO;
    std::ofstream file_;
};

}  // namespace talentcode

// ── Convenience macros ────────────────────────────────────────────────────────

#define TC_LOG_DEBUG ::talentcode::Logger::get_instance().debug()
#define TC_LOG_INFO ::talentcode::Logger::get_instance().info()
#define TC_LOG_SUCCESS ::talentcode::Logger::get_instance().success()
#define TC_LOG_WARN ::talentcode::Logger::get_instance().warning()
#define TC_LOG_ERROR ::talentcode::Logger::get_instance().error()
