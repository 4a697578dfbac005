#pragma once
//
// PvRecorder - Core/Diagnostics/Check.hpp
// Centralized lightweight diagnostics macros.
//
// Provided:
//   - PVR_ASSERT(cond[, msg]): Debug-only, logs through Logger on failure.
//   - PVR_CONTRACT(cond, fmt, ...): caller contract; active in every build.
//     On failure logs a Fatal line with the source location and aborts.
//     Reserved for programming errors (undersized read buffers, use of an
//     empty recorder), never for runtime conditions reported by the native
//     layer, which travel as RecorderError values.
//

#include "Core/Logger.hpp"
#include "Core/Platform/PlatformMacros.hpp"

#include <source_location>
#include <string>

// ----------------------------------------------------------------------------
// Debug detection (respects user-defined PVR_DEBUG; falls back to !NDEBUG)
// ----------------------------------------------------------------------------
#ifndef PVR_DEBUG
#  ifndef NDEBUG
#    define PVR_DEBUG 1
#  else
#    define PVR_DEBUG 0
#  endif
#endif

// ----------------------------------------------------------------------------
// PVR_ASSERT: Debug-only, non-fatal, logged
// ----------------------------------------------------------------------------
#if PVR_ENABLE_LOG_ASSERT && PVR_DEBUG
#define PVR_EXPAND(x) x
#define PVR_GET_MACRO(_1,_2,NAME,...) NAME

#define PVR_ASSERT_1(Expr) do { \
            if (!(Expr)) { \
                const auto loc = std::source_location::current(); \
                ::pvr::core::Logger::Error("Assert", "{} ({}:{}): assertion failed: {}", \
                    loc.function_name(), loc.file_name(), loc.line(), #Expr); \
            } \
        } while(0)

#define PVR_ASSERT_2(Expr, Msg) do { \
            if (!(Expr)) { \
                const auto loc = std::source_location::current(); \
                ::pvr::core::Logger::Error("Assert", "{} ({}:{}): {}", \
                    loc.function_name(), loc.file_name(), loc.line(), Msg); \
            } \
        } while(0)

#define PVR_ASSERT(...) \
            PVR_EXPAND(PVR_GET_MACRO(__VA_ARGS__, PVR_ASSERT_2, PVR_ASSERT_1)(__VA_ARGS__))
#else
#define PVR_ASSERT(...) ((void)0)
#endif

// ----------------------------------------------------------------------------
// PVR_CONTRACT: fail-fast caller contract (all builds)
// ----------------------------------------------------------------------------
namespace pvr::core::detail
{
    template <class... Args>
    [[noreturn]] void ContractViolation(const std::source_location& loc,
                                        const char* expr,
                                        std::format_string<Args...> fmt,
                                        Args&&... args) noexcept
    {
        try {
            const std::string detail = std::format(fmt, static_cast<Args&&>(args)...);
            Logger::Fatal("Contract", "{} ({}:{}): contract violated: {}: {}",
                loc.function_name(), loc.file_name(), loc.line(), expr, detail);
        }
        catch (const std::exception&) {
            Logger::Fatal("Contract", "{} ({}:{}): contract violated: {}",
                loc.function_name(), loc.file_name(), loc.line(), expr);
        }
    }
} // namespace pvr::core::detail

#define PVR_CONTRACT(Expr, Fmt, ...) do { \
            if (PVR_UNLIKELY(!(Expr))) { \
                ::pvr::core::detail::ContractViolation(std::source_location::current(), #Expr, \
                    (Fmt) __VA_OPT__(,) __VA_ARGS__); \
            } \
        } while(0)

