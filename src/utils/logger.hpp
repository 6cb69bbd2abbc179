#ifndef ARBOR_UTILS_LOGGER_HPP
#define ARBOR_UTILS_LOGGER_HPP

#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include "../common/config.hpp"
#include "terminal.hpp"

namespace Arbor::Utils {
    enum class LogLevel {
        Debug,
        Info,
        Warning,
        Error,
    };

    // Explicit, copyable sink. Components receive one at construction; nothing
    // in the library writes to a process-wide logger.
    class Logger {
    public:
        Logger() = default;

        explicit Logger(std::ostream* stream, LogLevel threshold = LogLevel::Info, bool color = true)
            : stream_(stream), threshold_(threshold), color_(color) {}

        [[nodiscard]] static Logger from_config(const Common::Config& config, std::ostream* stream = &std::cout)
        {
            const auto section = std::string(Common::Config::kDefaultSection);
            const bool verbose = config.get_boolean(section, "verbose", false);
            const bool color = config.get_boolean(section, "color", true);
            return Logger(stream, verbose ? LogLevel::Debug : LogLevel::Info, color);
        }

        void debug(std::string_view message) const { write(LogLevel::Debug, Terminal::Colors::kBrightBlack, message); }
        void info(std::string_view message) const { write(LogLevel::Info, {}, message); }
        void success(std::string_view message) const { write(LogLevel::Info, Terminal::Colors::kBrightGreen, message); }
        void warning(std::string_view message) const { write(LogLevel::Warning, Terminal::Colors::kOrange, message); }
        void error(std::string_view message) const { write(LogLevel::Error, Terminal::Colors::kBrightRed, message); }

        // Writes pre-rendered text as-is when the threshold admits `level`.
        void raw(LogLevel level, std::string_view text) const
        {
            if (stream_ == nullptr || level < threshold_) {
                return;
            }
            (*stream_) << text << std::flush;
        }

        [[nodiscard]] bool color() const noexcept { return color_; }
        [[nodiscard]] bool enabled(LogLevel level) const noexcept { return stream_ != nullptr && level >= threshold_; }
        [[nodiscard]] std::ostream* stream() const noexcept { return stream_; }

        [[nodiscard]] std::string paint(std::string_view text, std::string_view color) const
        {
            if (!color_ || color.empty()) {
                return std::string(text);
            }
            return Terminal::ApplyColor(text, color);
        }

    private:
        void write(LogLevel level, std::string_view color, std::string_view message) const
        {
            if (!enabled(level)) {
                return;
            }
            (*stream_) << paint("[Arbor] ", Terminal::Colors::kTurquoise) << paint(message, color) << std::endl;
        }

        std::ostream* stream_{&std::cout};
        LogLevel threshold_{LogLevel::Info};
        bool color_{true};
    };
}

#endif // ARBOR_UTILS_LOGGER_HPP
