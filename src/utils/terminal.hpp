#ifndef ARBOR_UTILS_TERMINAL_HPP
#define ARBOR_UTILS_TERMINAL_HPP

#include <string>
#include <string_view>

namespace Arbor::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";

        inline constexpr std::string_view kBrightBlack   = "\033[90m";
        inline constexpr std::string_view kBrightRed     = "\033[91m";
        inline constexpr std::string_view kBrightGreen   = "\033[92m";
        inline constexpr std::string_view kBrightYellow  = "\033[93m";
        inline constexpr std::string_view kBrightBlue    = "\033[94m";

        inline constexpr std::string_view kTurquoise    = "\033[38;5;49m";
        inline constexpr std::string_view kOrange       = "\033[38;5;208m";
    }

    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }
}

#endif // ARBOR_UTILS_TERMINAL_HPP
