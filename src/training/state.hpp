#ifndef ARBOR_TRAINING_STATE_HPP
#define ARBOR_TRAINING_STATE_HPP

#include <cstdint>
#include <string>

#include "../common/config.hpp"
#include "../common/errors.hpp"
#include "../evaluation/evaluation.hpp"
#include "../optimizer/optimizer.hpp"

namespace Arbor::Training {
    inline constexpr double kSmoothingDecay = 0.75;

    [[nodiscard]] constexpr double smooth(double previous, double accuracy) noexcept
    {
        return kSmoothingDecay * previous + (1.0 - kSmoothingDecay) * accuracy;
    }

    // Mutated by Loop only.
    struct State {
        std::int64_t step{0};
        std::int64_t epoch{0};
        Optimizer::Kind optimizer{Optimizer::Kind::Adam};
        double current_accuracy{0.0};
        double best_accuracy{0.0};
        std::int64_t steps_since_improvement{0};
        std::int64_t evaluations{0};
        Evaluation::History history{};
    };

    struct Budget {
        std::int64_t print_every{100};
        std::int64_t max_steps{50000};
        std::int64_t max_steps_without_improvement{5000};
        bool switch_optimizers{false};
        bool save_model{true};
        bool parse_datasets{false};

        void validate() const
        {
            if (print_every <= 0) {
                throw ConfigurationError("print_every must be positive, got " + std::to_string(print_every) + ".");
            }
            if (max_steps < 0) {
                throw ConfigurationError("max_steps must not be negative, got " + std::to_string(max_steps) + ".");
            }
            if (max_steps_without_improvement < 0) {
                throw ConfigurationError("max_steps_without_improvement must not be negative, got "
                                         + std::to_string(max_steps_without_improvement) + ".");
            }
        }

        [[nodiscard]] static Budget from_config(const Common::Config& config, const std::string& section)
        {
            const Budget defaults{};
            Budget budget;
            budget.print_every = config.get_int(section, "print_every", defaults.print_every);
            budget.max_steps = config.get_int(section, "max_steps", defaults.max_steps);
            budget.max_steps_without_improvement =
                config.get_int(section, "max_steps_without_improvement", defaults.max_steps_without_improvement);
            budget.switch_optimizers = config.get_boolean(section, "switch_optimizers", defaults.switch_optimizers);
            budget.save_model = config.get_boolean(section, "save_model", defaults.save_model);
            budget.parse_datasets = config.get_boolean(section, "parse_datasets", defaults.parse_datasets);
            budget.validate();
            return budget;
        }
    };
}

#endif // ARBOR_TRAINING_STATE_HPP
