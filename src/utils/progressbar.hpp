#ifndef ARBOR_PROGRESSBAR_HPP
#define ARBOR_PROGRESSBAR_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

namespace Arbor::Utils {
    // Single-line bar redrawn in place with eighth-cell resolution. A null
    // stream makes every call a no-op.
    class ProgressBar {
    public:
        ProgressBar(std::ostream* stream, std::int64_t total, std::string label, std::size_t width = 30)
            : stream_(stream),
              total_(std::max<std::int64_t>(total, 0)),
              label_(std::move(label)),
              width_(std::max<std::size_t>(width, 1)) {}

        ~ProgressBar() { finish(); }

        ProgressBar(const ProgressBar&) = delete;
        ProgressBar& operator=(const ProgressBar&) = delete;

        void update(std::int64_t current) {
            if (stream_ == nullptr || finished_ || total_ <= 0) {
                return;
            }
            current = std::clamp<std::int64_t>(current, 0, total_);

            const double ratio = static_cast<double>(current) / static_cast<double>(total_);
            const std::int64_t max_units = static_cast<std::int64_t>(width_) * 8;
            const auto units = std::min<std::int64_t>(static_cast<std::int64_t>(std::round(ratio * static_cast<double>(max_units))), max_units);
            if (units == last_units_ && current != total_) {
                return;
            }
            last_units_ = units;

            const auto full_cells = static_cast<std::size_t>(units / 8);
            const auto partial = static_cast<std::size_t>(units % 8);
            const bool has_partial = partial > 0 && full_cells < width_;

            std::ostringstream line;
            line << '\r' << label_ << " [";
            for (std::size_t cell = 0; cell < full_cells; ++cell) {
                line << "\xE2\x96\x88";
            }
            if (has_partial) {
                line << PartialBlock(partial);
            }
            const std::size_t printed = full_cells + (has_partial ? 1 : 0);
            if (printed < width_) {
                line << std::string(width_ - printed, ' ');
            }
            line << "] " << std::setw(3) << static_cast<int>(std::round(ratio * 100.0)) << "% "
                 << '(' << current << '/' << total_ << ')';
            (*stream_) << line.str() << std::flush;

            if (current == total_) {
                finish();
            }
        }

        void advance(std::int64_t amount = 1) { update(position_ += amount); }

        [[nodiscard]] std::int64_t total() const noexcept { return total_; }

    private:
        static const char* PartialBlock(std::size_t index) { // smooth pBar
            static constexpr const char* blocks[] = {
                "",
                "\xE2\x96\x8F",
                "\xE2\x96\x8E",
                "\xE2\x96\x8D",
                "\xE2\x96\x8C",
                "\xE2\x96\x8B",
                "\xE2\x96\x8A",
                "\xE2\x96\x89"
            };
            return blocks[std::min<std::size_t>(index, 7)];
        }

        void finish() {
            if (finished_ || stream_ == nullptr || last_units_ < 0) {
                finished_ = true;
                return;
            }
            finished_ = true;
            (*stream_) << std::endl;
        }

        std::ostream* stream_;
        std::int64_t total_;
        std::string label_;
        std::size_t width_;
        std::int64_t position_{0};
        std::int64_t last_units_{-1};
        bool finished_{false};
    };
}

#endif // ARBOR_PROGRESSBAR_HPP
