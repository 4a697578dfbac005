#pragma once

#include <cstdint>  // int32_t, uint32_t...
#include <cstddef>  // size_t, ptrdiff_t

// =============================
// Types.hpp
// =============================
// Fixed-size aliases used across PvRecorder. Native-facing code keeps the
// exact C types from Core/Abi/PvRecorderAbi.h; everything above the ABI
// boundary uses these aliases instead of raw 'int' or 'long'.
// =============================

namespace pvr
{
// ---- Integer types ----
using int8 = std::int8_t;
using int16 = std::int16_t;
using int32 = std::int32_t;
using int64 = std::int64_t;

using uint8 = std::uint8_t;
using uint16 = std::uint16_t;
using uint32 = std::uint32_t;
using uint64 = std::uint64_t;

// ---- Short aliases (i*/u* pattern) ----
using i8  = int8;
using i16 = int16;
using i32 = int32;
using i64 = int64;

using u8  = uint8;
using u16 = uint16;
using u32 = uint32;
using u64 = uint64;

// ---- Size and pointer-related ----
using usize = std::size_t;
using isize = std::ptrdiff_t;

// ---- Audio sample ----
using Sample = i16; // One signed 16-bit PCM sample.

enum class ThreadSafetyMode : u8
{
    Unknown = 0,
    ExternalSync,
    ThreadSafe
};
} // namespace pvr
