/**
 * memtrust logger.
 *
 * What gets logged:
 *   DEBUG  every check, store loads and persists
 *   INFO   escalations and the decision that ended each one, memorized certs
 *   WARN   a store that couldn't be loaded or persisted (trust decisions still hold)
 *   ERROR  a decision surface that failed (the escalation is aborted)
 *
 * Checks run on the embedder's validating threads so each statement carries
 * a short tag of the thread that logged it. The default logger writes to
 * stderr at MEMTRUST_LOG_LEVEL (trace, debug, info, warn, error, fatal;
 * default info). To send memtrust's statements somewhere else implement
 * memtrust::Logger and install it with global_logger.
 */

#pragma once

#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <source_location>
#include <thread>

#include <memtrust/format.hpp>

namespace {
    /// Compile-time evalute basename from full file path
    consteval const char* log_basename_(const char* path) {
        const char* last = nullptr;
        for (const char* current = path; *current != '\0'; ++current)
            if (*current == '/' || *current == '\\') last = current;
        return last ? last + 1 : path;
    }
}

namespace memtrust
{
    enum class log_level_t { L_TRACE, L_DEBUG, L_INFO, L_WARN, L_ERROR, L_FATAL };
    static const char* log_level_str[] = { "TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL" }; // needs same order
    using enum log_level_t;

    /// level named 's' (any case), nullopt if there's no such level
    inline std::optional<log_level_t> log_level_from(std::string_view s) {
        for (size_t i = 0; i < std::size(log_level_str); ++i) {
            std::string_view n{log_level_str[i]};
            if (n.size() != s.size()) continue;
            bool same = true;
            for (size_t j = 0; j < n.size() && same; ++j) same = n[j] == std::toupper(static_cast<unsigned char>(s[j]));
            if (same) return static_cast<log_level_t>(i);
        }
        return std::nullopt;
    }

    /// Logger implementation interface
    class Logger {
    public:
        virtual void log(
            log_level_t level,
            const std::source_location src,
            const char* basename,
            std::string statement
        ) = 0;

    public:
        Logger() = default;
        Logger(const Logger&) = delete;
        Logger(Logger&&) = delete;
        Logger& operator=(const Logger&) = delete;
        Logger& operator=(Logger&&) = delete;
        virtual ~Logger() = default;
    };

    /// Writes to stderr, one fmt::print per statement so concurrent checks don't interleave.
    class DefaultLogger : public Logger {
    public:
        log_level_t min_level = L_INFO;

        DefaultLogger() {
            if (auto ep = std::getenv("MEMTRUST_LOG_LEVEL"); ep && *ep) {
                if (auto l = log_level_from(ep); l) min_level = *l;
                else fmt::print(stderr, "memtrust: unknown MEMTRUST_LOG_LEVEL '{}', using INFO\n", ep);
            }
        }

        inline void log(
            log_level_t level,
            const std::source_location src,
            const char* basename,
            std::string statement
        ) override {
            if (level < min_level) return;
            auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id()) & 0xffff;
            fmt::print(stderr, "{} [{}] t{:04x} {} (memtrust:{}:{})\n",
                std::chrono::system_clock::now(),
                log_level_str[static_cast<size_t>(level)],
                tid,
                statement,
                basename,
                src.line());
        }
    };

    /// Get or set the global memtrust logger
    inline Logger* global_logger(std::unique_ptr<Logger> set_to = nullptr) {
        static std::unique_ptr<Logger> logger = std::make_unique<DefaultLogger>(); // singleton
        if (set_to) logger = std::move(set_to);
        return logger.get();
    }

    /// Set the minimum level of the default logger (no-op if a custom logger is installed)
    inline void log_min_level(log_level_t level) {
        if (auto dl = dynamic_cast<DefaultLogger*>(global_logger()); dl) dl->min_level = level;
    }

    consteval auto log(log_level_t level, const std::source_location src = std::source_location::current()) {
        const char* basename = log_basename_(src.file_name());
        return [=]<typename... T>(fmt::format_string<T...> fmt, T&&... args) constexpr -> void {
            memtrust::global_logger()->log(level, src, basename, fmt::format(fmt, std::forward<T>(args)...));
        };
    }
} // namespace memtrust
