#ifndef ARBOR_OPTIMIZER_SCHEDULE_HPP
#define ARBOR_OPTIMIZER_SCHEDULE_HPP

#include <cstdint>
#include <string_view>

namespace Arbor::Optimizer::Details {
    enum class Kind {
        Adam,
        AMSGrad,
    };

    [[nodiscard]] constexpr std::string_view to_string(Kind kind)
    {
        return kind == Kind::Adam ? "Adam" : "AMSGrad";
    }

    // Starts on Adam and moves to AMSGrad at most once, the first time an
    // evaluation tick sees more than a tenth of the patience budget spent
    // without improvement.
    class Schedule {
    public:
        static constexpr double kSwitchFraction = 0.1;

        Schedule(bool enabled, std::int64_t patience) noexcept : enabled_(enabled), patience_(patience) {}

        // Returns true on the tick that performs the switch.
        bool update(std::int64_t steps_since_improvement) noexcept
        {
            if (!enabled_ || current_ == Kind::AMSGrad) {
                return false;
            }
            if (static_cast<double>(steps_since_improvement) > kSwitchFraction * static_cast<double>(patience_)) {
                current_ = Kind::AMSGrad;
                return true;
            }
            return false;
        }

        [[nodiscard]] Kind current() const noexcept { return current_; }
        [[nodiscard]] bool enabled() const noexcept { return enabled_; }
        [[nodiscard]] bool switched() const noexcept { return current_ == Kind::AMSGrad; }

    private:
        bool enabled_;
        std::int64_t patience_;
        Kind current_{Kind::Adam};
    };
}

#endif // ARBOR_OPTIMIZER_SCHEDULE_HPP
