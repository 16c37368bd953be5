#pragma once
#include <cstddef>
#include <string_view>
#include "LibMgoLog/Core/Config.h"

namespace libmgolog {

    // A call is skipped when threshold > level.
    inline constexpr bool ShouldEmit(Severity level, Severity threshold) noexcept {
        return !(static_cast<int>(threshold) > static_cast<int>(level));
    }

    // Number of UTF-8 code points; each invalid byte counts as one.
    inline constexpr std::size_t Utf8Length(std::string_view s) noexcept {
        std::size_t n = 0;
        for (std::size_t i = 0; i < s.size();) {
            const auto b = static_cast<unsigned char>(s[i]);
            std::size_t len = 1;
            if (b >= 0xF0 && b <= 0xF4) len = 4;
            else if (b >= 0xE0) len = (b < 0xF0) ? 3 : 1;
            else if (b >= 0xC2) len = 2;
            if (len > 1) {
                if (i + len > s.size()) {
                    len = 1;
                } else {
                    for (std::size_t k = 1; k < len; ++k) {
                        if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) { len = 1; break; }
                    }
                }
            }
            i += len;
            ++n;
        }
        return n;
    }

    // Level check that runs before any rendering work.
    // Error and above are never filtered.
    inline bool PassesLevel(const LogConfig& cfg, Severity level) noexcept {
        if (level >= Severity::Error) return true;
        if (level == Severity::Debug && !cfg.debug_enabled) return false;
        return ShouldEmit(level, cfg.threshold);
    }

    // Second debug gate, applied to the rendered content.
    inline bool PassesDebugCap(std::string_view content) noexcept {
        return Utf8Length(content) <= kMaxDebugOutput;
    }

} // namespace libmgolog
