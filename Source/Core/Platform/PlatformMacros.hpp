// =============================
// PlatformMacros.hpp
// =============================
#pragma once

// General-purpose lightweight macros safe across platforms.
// Includes: branch prediction, scope-exit cleanup.

// -----------------------------
// Branch prediction hint
// -----------------------------
#if defined(__GNUC__) || defined(__clang__)
#define PVR_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define PVR_UNLIKELY(x) (!!(x))
#endif

// -----------------------------
// Defer helper (scope-exit cleanup)
// -----------------------------
// Usage: PVR_DEFER([&]{ /* cleanup */; });
// Runs on every exit path of the enclosing scope, early returns included.
// Native resources handed out by the recorder library (device lists) are
// released through this so no return path can skip the paired free call.
#include <utility>

namespace pvr::detail
{
    template <typename F>
    struct ScopeExit
    {
        F fn;
        explicit ScopeExit(F&& f) noexcept : fn(std::forward<F>(f)) {}
        ScopeExit(const ScopeExit&) = delete;
        ScopeExit& operator=(const ScopeExit&) = delete;
        ~ScopeExit() noexcept { fn(); }
    };
} // namespace pvr::detail

#define PVR_CONCAT_IMPL(a, b) a##b
#define PVR_CONCAT(a, b) PVR_CONCAT_IMPL(a, b)
#define PVR_DEFER(lambda_expr) ::pvr::detail::ScopeExit PVR_CONCAT(_pvr_defer_, __LINE__) { lambda_expr }
