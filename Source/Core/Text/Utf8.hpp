// ============================================================================
// PvRecorder - Source/Core/Text/Utf8.hpp
// ----------------------------------------------------------------------------
// Purpose : Strict UTF-8 validation for strings handed over by the native
//           layer (device names, version string).
// Contract: Header-only, constexpr, no allocations. Rejects overlong forms,
//           surrogate code points (U+D800..U+DFFF), values above U+10FFFF and
//           truncated sequences, matching the Unicode definition of UTF-8.
// ============================================================================

#pragma once

#include "Core/Types.hpp"

#include <string_view>

namespace pvr::text
{
    [[nodiscard]] constexpr bool IsValidUtf8(std::string_view bytes) noexcept
    {
        const usize size = bytes.size();
        usize i = 0;
        while (i < size)
        {
            const u8 lead = static_cast<u8>(bytes[i]);
            if (lead < 0x80u)
            {
                ++i;
                continue;
            }

            usize length = 0;
            u32 codePoint = 0;
            u32 minimum = 0;
            if ((lead & 0xE0u) == 0xC0u)
            {
                length = 2;
                codePoint = lead & 0x1Fu;
                minimum = 0x80u;
            }
            else if ((lead & 0xF0u) == 0xE0u)
            {
                length = 3;
                codePoint = lead & 0x0Fu;
                minimum = 0x800u;
            }
            else if ((lead & 0xF8u) == 0xF0u)
            {
                length = 4;
                codePoint = lead & 0x07u;
                minimum = 0x10000u;
            }
            else
            {
                return false; // Stray continuation byte or 0xF8..0xFF.
            }

            if (size - i < length)
            {
                return false;
            }

            for (usize k = 1; k < length; ++k)
            {
                const u8 next = static_cast<u8>(bytes[i + k]);
                if ((next & 0xC0u) != 0x80u)
                {
                    return false;
                }
                codePoint = (codePoint << 6u) | (next & 0x3Fu);
            }

            if (codePoint < minimum || codePoint > 0x10FFFFu ||
                (codePoint >= 0xD800u && codePoint <= 0xDFFFu))
            {
                return false;
            }

            i += length;
        }
        return true;
    }

    static_assert(IsValidUtf8("plain ascii"));
    static_assert(IsValidUtf8("\xC3\xA9"));          // U+00E9
    static_assert(!IsValidUtf8("\xC0\xAF"));         // Overlong '/'.
    static_assert(!IsValidUtf8("\xED\xA0\x80"));     // Surrogate.
    static_assert(!IsValidUtf8("\xE2\x82"));         // Truncated.

} // namespace pvr::text
