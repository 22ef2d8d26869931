#ifndef VERITAS_UTILS_TERMINAL_HPP
#define VERITAS_UTILS_TERMINAL_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace Veritas::Utils::Terminal {
    namespace Colors {
        inline constexpr std::string_view kReset         = "\033[0m";

        inline constexpr std::string_view kBrightBlack   = "\033[90m";
        inline constexpr std::string_view kBrightYellow  = "\033[93m";
        inline constexpr std::string_view kBrightBlue    = "\033[94m";

        inline constexpr std::string_view kOrange        = "\033[38;5;208m";
    }

    namespace Symbols {
        inline constexpr std::string_view kWarn  = "⚠";
        inline constexpr std::string_view kBoxHorizontal = "━";
    }

    inline std::string Repeat(std::string_view glyph, std::size_t count) {
        std::string s; s.reserve(glyph.size() * count);
        for (std::size_t i = 0; i < count; ++i) s.append(glyph);
        return s;
    }

    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }

    // Horizontal rule used between epochs: ━━━━…
    inline std::string Rule(std::size_t width, std::string_view color) {
        return ApplyColor(Repeat(Symbols::kBoxHorizontal, width), color);
    }

    // Strips CSI sequences ("\033[...m") so colored records can go to plain files.
    inline std::string StripEscapes(std::string_view s) {
        std::string out; out.reserve(s.size());
        for (std::size_t i = 0; i < s.size(); ++i) {
            if (s[i] == '\033' && i + 1 < s.size() && s[i + 1] == '[') {
                i += 2;
                while (i < s.size() && !((s[i] >= '@' && s[i] <= '~'))) ++i;
                continue;
            }
            out.push_back(s[i]);
        }
        return out;
    }
}

#endif // VERITAS_UTILS_TERMINAL_HPP
