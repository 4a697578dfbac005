#pragma once


// =============================
// PvRecorder - Logger.hpp (C++23, minimal but solid)
// =============================
// Goals
//  - Always-safe to include (no heavy deps, header-only)
//  - C++23 std::print/std::println backend (no third-party)
//  - Zero/low overhead when disabled (compile-time switches)
//  - Simple runtime min-level filter and optional category filter
//  - Runtime configuration from PVR_LOG_LEVEL / PVR_LOG_CATEGORY
//  - Thread-safe emission (coarse-grained mutex around a single print)
//
// Non-goals (for now)
//  - Async logging, ring buffers, files, colors, sinks fan-out
//
// Notes
//  - Categories are plain string literals (const char*): "Loader", "Recorder",
//    "Devices", "Platform", "Contract".
//  - Native recorder failures are logged where they are converted into a
//    RecorderError, so a caller that drops the error still leaves a trace.

#include <cstdint>
#include <atomic>
#include <exception>
#include <mutex>
#include <string_view>
#include <print>        // C++23 std::print / std::println
#include <format>       // std::format_string
#include <cstdio>       // std::FILE, stdout/stderr
#include <cstdlib>      // std::abort, std::getenv

#ifndef PVR_ENABLE_LOGGING
#  define PVR_ENABLE_LOGGING 1
#endif
#ifndef PVR_ENABLE_LOG_ASSERT
#  define PVR_ENABLE_LOG_ASSERT 1
#endif

namespace pvr::core {

    enum class LogLevel : std::uint8_t {
        Disabled = 0,
        Fatal = 1,
        Error = 2,
        Warn = 3,
        Info = 4,
        Verbose = 5,
        // NOTE: higher number == more chatty
        // MinLevel policy: a message is emitted if (level <= MinLevel).
    };

    struct LoggerConfig {
        std::atomic<LogLevel> MinLevel{ LogLevel::Warn };
        // If non-null, only messages whose category equals this filter are printed.
        // Must stay a stable C-string (literal or process environment storage).
        std::atomic<const char*> CategoryEqualsFilter{ nullptr };
    };

    // Accepts "disabled", "fatal", "error", "warn", "info", "verbose" (lower case).
    [[nodiscard]] constexpr bool ParseLogLevel(std::string_view text, LogLevel& outLevel) noexcept {
        struct Entry { std::string_view name; LogLevel level; };
        constexpr Entry kEntries[] = {
            { "disabled", LogLevel::Disabled },
            { "fatal",    LogLevel::Fatal },
            { "error",    LogLevel::Error },
            { "warn",     LogLevel::Warn },
            { "info",     LogLevel::Info },
            { "verbose",  LogLevel::Verbose },
        };
        for (const Entry& e : kEntries) {
            if (e.name == text) {
                outLevel = e.level;
                return true;
            }
        }
        return false;
    }

    class Logger final {
    public:
        static Logger& Get() noexcept {
            static Logger g;
            return g;
        }

        static void SetMinLevel(LogLevel lvl) noexcept { Get().mCfg.MinLevel.store(lvl, std::memory_order_relaxed); }
        static LogLevel GetMinLevel() noexcept { return Get().mCfg.MinLevel.load(std::memory_order_relaxed); }
        static void SetCategoryEqualsFilter(const char* cat) noexcept {
            Get().mCfg.CategoryEqualsFilter.store(cat, std::memory_order_relaxed);
        }

        // Applies PVR_LOG_LEVEL / PVR_LOG_CATEGORY when present. Unknown level
        // names leave the current level untouched and log a warning on each call.
        static void ConfigureFromEnvironment() noexcept {
            if (const char* level = std::getenv("PVR_LOG_LEVEL")) {
                LogLevel parsed = LogLevel::Warn;
                if (ParseLogLevel(level, parsed)) {
                    SetMinLevel(parsed);
                }
                else {
                    Warn("Logger", "ignoring unknown PVR_LOG_LEVEL value");
                }
            }
            if (const char* category = std::getenv("PVR_LOG_CATEGORY")) {
                SetCategoryEqualsFilter(category[0] != '\0' ? category : nullptr);
            }
        }

        // Public check to short-circuit expensive logging
        static bool IsEnabled(LogLevel lvl, const char* category) noexcept {
            return ShouldEmit(lvl, category);
        }

        // ----------------------
        // Level-specific helpers
        // ----------------------
        template <class... Args>
        static void Info(const char* category, std::format_string<Args...> fmt, Args&&... args) noexcept {
            Print(LogLevel::Info, category, stdout, fmt, static_cast<Args&&>(args)...);
        }
        template <class... Args>
        static void Warn(const char* category, std::format_string<Args...> fmt, Args&&... args) noexcept {
            Print(LogLevel::Warn, category, stderr, fmt, static_cast<Args&&>(args)...);
        }
        template <class... Args>
        static void Error(const char* category, std::format_string<Args...> fmt, Args&&... args) noexcept {
            Print(LogLevel::Error, category, stderr, fmt, static_cast<Args&&>(args)...);
        }
        template <class... Args>
        [[noreturn]] static void Fatal(const char* category, std::format_string<Args...> fmt, Args&&... args) noexcept {
            Print(LogLevel::Fatal, category, stderr, fmt, static_cast<Args&&>(args)...);
            std::fflush(stderr);
            std::abort();
        }
        template <class... Args>
        static void Verbose(const char* category, std::format_string<Args...> fmt, Args&&... args) noexcept {
            Print(LogLevel::Verbose, category, stdout, fmt, static_cast<Args&&>(args)...);
        }

        // Raw message overloads (no fmt)
        static void Info(const char* category, std::string_view msg) noexcept { PrintRaw(LogLevel::Info, category, stdout, msg); }
        static void Warn(const char* category, std::string_view msg) noexcept { PrintRaw(LogLevel::Warn, category, stderr, msg); }
        static void Error(const char* category, std::string_view msg) noexcept { PrintRaw(LogLevel::Error, category, stderr, msg); }
        [[noreturn]] static void Fatal(const char* category, std::string_view msg) noexcept {
            PrintRaw(LogLevel::Fatal, category, stderr, msg);
            std::fflush(stderr);
            std::abort();
        }
        static void Verbose(const char* category, std::string_view msg) noexcept { PrintRaw(LogLevel::Verbose, category, stdout, msg); }

    private:
        Logger() = default;

        static bool ShouldEmit(LogLevel lvl, const char* category) noexcept {
            Logger& self = Get();
            if (lvl == LogLevel::Disabled) return false;
            // Fatal lines precede an abort and are never filtered out.
            if (lvl == LogLevel::Fatal) return true;
            if (lvl > self.mCfg.MinLevel.load(std::memory_order_relaxed)) return false;
            const char* filter = self.mCfg.CategoryEqualsFilter.load(std::memory_order_relaxed);
            if (filter) {
                if (!category) return false; // filter active => category is required
                if (std::string_view(filter) != category) return false;
            }
            return true;
        }

        // Formatting or stream failures degrade to a fixed marker line.
        static void EmitFailureMarker(std::FILE* stream, const char* lvlStr) noexcept {
            std::fputs("[", stream);
            std::fputs(lvlStr, stream);
            std::fputs("][Logger] <log formatting failed>\n", stream);
        }

        template <class... Args>
        static void Print(LogLevel lvl, const char* category, std::FILE* stream, std::format_string<Args...> fmt, Args&&... args) noexcept {
            if (!ShouldEmit(lvl, category)) return;
            Logger& self = Get();
            const char* lvlStr = ToShortLevel(lvl);
            std::scoped_lock lock(self.mMutex);
            try {
                if (category) {
                    std::print(stream, "[{}][{}] ", lvlStr, category);
                }
                else {
                    std::print(stream, "[{}] ", lvlStr);
                }
                std::println(stream, fmt, static_cast<Args&&>(args)...);
            }
            catch (const std::exception&) {
                EmitFailureMarker(stream, lvlStr);
            }
        }

        static void PrintRaw(LogLevel lvl, const char* category, std::FILE* stream, std::string_view msg) noexcept {
            if (!ShouldEmit(lvl, category)) return;
            Logger& self = Get();
            const char* lvlStr = ToShortLevel(lvl);
            std::scoped_lock lock(self.mMutex);
            try {
                if (category) {
                    std::println(stream, "[{}][{}] {}", lvlStr, category, msg);
                }
                else {
                    std::println(stream, "[{}] {}", lvlStr, msg);
                }
            }
            catch (const std::exception&) {
                EmitFailureMarker(stream, lvlStr);
            }
        }

        static const char* ToShortLevel(LogLevel lvl) noexcept {
            switch (lvl) {
            case LogLevel::Fatal:   return "F";
            case LogLevel::Error:   return "E";
            case LogLevel::Warn:    return "W";
            case LogLevel::Info:    return "I";
            case LogLevel::Verbose: return "V";
            default:                return "-";
            }
        }

    private:
        std::mutex mMutex{};
        LoggerConfig mCfg{};
    };

} // namespace pvr::core

// ----------------------
// Public log macros (single evaluation of Category)
// ----------------------
#if PVR_ENABLE_LOGGING
#define PVR_LOG_VERBOSE(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::pvr::core::Logger::IsEnabled(::pvr::core::LogLevel::Verbose, _cat)) { \
            ::pvr::core::Logger::Verbose(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define PVR_LOG_INFO(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::pvr::core::Logger::IsEnabled(::pvr::core::LogLevel::Info, _cat)) { \
            ::pvr::core::Logger::Info(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define PVR_LOG_WARNING(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::pvr::core::Logger::IsEnabled(::pvr::core::LogLevel::Warn, _cat)) { \
            ::pvr::core::Logger::Warn(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define PVR_LOG_ERROR(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        if (::pvr::core::Logger::IsEnabled(::pvr::core::LogLevel::Error, _cat)) { \
            ::pvr::core::Logger::Error(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#define PVR_LOG_FATAL(Category, Fmt, ...) do { \
        const char* _cat = (Category); \
        ::pvr::core::Logger::Fatal(_cat, (Fmt) __VA_OPT__(,) __VA_ARGS__); \
    } while (0)
#else
#define PVR_LOG_VERBOSE(Category, Fmt, ...)  ((void)0)
#define PVR_LOG_INFO(Category, Fmt, ...)     ((void)0)
#define PVR_LOG_WARNING(Category, Fmt, ...)  ((void)0)
#define PVR_LOG_ERROR(Category, Fmt, ...)    ((void)0)
#define PVR_LOG_FATAL(Category, Fmt, ...)    std::abort()
#endif
