#ifndef ARBOR_TRAINING_PROGRESS_HPP
#define ARBOR_TRAINING_PROGRESS_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../evaluation/evaluation.hpp"
#include "../optimizer/optimizer.hpp"
#include "../utils/logger.hpp"
#include "../utils/terminal.hpp"
#include "state.hpp"

namespace Arbor::Training {
    enum class StopReason {
        StepBudget,
        Patience,
        Interrupted,
    };

    [[nodiscard]] constexpr std::string_view to_string(StopReason reason)
    {
        switch (reason) {
            case StopReason::StepBudget: return "step budget reached";
            case StopReason::Patience: return "no improvement within patience";
            case StopReason::Interrupted: return "interrupted";
        }
        return "unknown";
    }

    // Everything a renderer may show about one evaluation tick.
    struct ProgressEvent {
        std::int64_t step{0};
        std::int64_t epoch{0};
        Optimizer::Kind optimizer{Optimizer::Kind::Adam};
        double accuracy{0.0};
        double smoothed_accuracy{0.0};
        double best_accuracy{0.0};
        std::int64_t steps_since_improvement{0};
        bool improved{false};
        bool switched{false};
        Evaluation::Accuracies training{};
        Evaluation::Accuracies development{};
        double loss{0.0};
        double seconds{0.0};
    };

    class Observer {
    public:
        virtual ~Observer() = default;
        virtual void on_progress(const ProgressEvent& event) = 0;
        virtual void on_stop(const State&, StopReason) {}
    };

    namespace Details {
        inline std::string format_accuracies(const Evaluation::Accuracies& accuracies)
        {
            std::ostringstream stream;
            stream << std::fixed << std::setprecision(2);
            bool first = true;
            for (const auto& [field, value] : accuracies) {
                if (!first) {
                    stream << ' ';
                }
                first = false;
                stream << field << '=' << value * 100.0;
            }
            return first ? std::string("-") : stream.str();
        }
    }

    // Plain, colourless line; the unit of scores.txt.
    [[nodiscard]] inline std::string format(const ProgressEvent& event)
    {
        std::ostringstream line;
        line << std::fixed << std::setprecision(4);
        line << "step=" << event.step
             << "\tepoch=" << event.epoch
             << "\toptimizer=" << Optimizer::to_string(event.optimizer)
             << "\taccuracy=" << event.accuracy
             << "\tsmoothed=" << event.smoothed_accuracy
             << "\tbest=" << event.best_accuracy
             << "\tsince_improvement=" << event.steps_since_improvement
             << "\timproved=" << (event.improved ? 1 : 0)
             << "\tloss=" << event.loss
             << "\ttrain=[" << Details::format_accuracies(event.training) << ']'
             << "\tdev=[" << Details::format_accuracies(event.development) << ']'
             << "\tseconds=" << std::setprecision(2) << event.seconds;
        return line.str();
    }

    class TextLog : public Observer {
    public:
        explicit TextLog(Utils::Logger logger) : logger_(std::move(logger)) {}

        void on_progress(const ProgressEvent& event) override
        {
            using Utils::Terminal::Colors::kBrightBlack;
            using Utils::Terminal::Colors::kBrightBlue;
            using Utils::Terminal::Colors::kBrightGreen;
            using Utils::Terminal::Colors::kBrightYellow;

            std::ostringstream line;
            line << "Step [" << event.step << "] Epoch " << event.epoch << " | "
                 << Optimizer::to_string(event.optimizer) << " | ";
            line << logger_.paint("Train", kBrightYellow) << ": " << Details::format_accuracies(event.training) << " | ";
            line << logger_.paint("Dev", kBrightBlue) << ": " << Details::format_accuracies(event.development) << " | ";
            line << std::fixed << std::setprecision(2)
                 << "acc " << event.accuracy * 100.0
                 << " smoothed " << event.smoothed_accuracy * 100.0
                 << " best " << event.best_accuracy * 100.0;

            const std::string nabla_symbol{"∇"};
            if (event.improved) {
                line << " (" << logger_.paint(nabla_symbol, kBrightGreen) << ")";
            } else {
                line << " (" << nabla_symbol << ' ' << event.steps_since_improvement << ")";
            }

            std::ostringstream duration_stream;
            duration_stream << std::fixed << std::setprecision(2) << event.seconds << "sec";
            line << " | " << logger_.paint("duration: " + duration_stream.str(), kBrightBlack);
            logger_.info(line.str());

            if (event.switched) {
                logger_.warning("Switching to AMSGrad.");
            }
        }

        void on_stop(const State& state, StopReason reason) override
        {
            std::ostringstream line;
            line << "Training stopped after " << state.step << " steps (" << to_string(reason) << "), best "
                 << std::fixed << std::setprecision(2) << state.best_accuracy * 100.0 << ".";
            if (reason == StopReason::Interrupted) {
                logger_.warning(line.str());
            } else {
                logger_.success(line.str());
            }
        }

    private:
        Utils::Logger logger_;
    };

    // Records every tick and the final outcome; write() produces scores.txt.
    class Transcript : public Observer {
    public:
        void on_progress(const ProgressEvent& event) override { lines_.push_back(format(event)); }

        void on_stop(const State& state, StopReason reason) override
        {
            std::ostringstream line;
            line << std::fixed << std::setprecision(4)
                 << "stopped=" << to_string(reason)
                 << "\tstep=" << state.step
                 << "\tepoch=" << state.epoch
                 << "\tbest=" << state.best_accuracy;
            lines_.push_back(line.str());
        }

        void write(const std::filesystem::path& path) const
        {
            if (path.has_parent_path()) {
                std::filesystem::create_directories(path.parent_path());
            }
            std::ofstream stream(path, std::ios::trunc);
            if (!stream) {
                throw std::runtime_error("Unable to write transcript '" + path.string() + "'.");
            }
            for (const auto& line : lines_) {
                stream << line << '\n';
            }
        }

        void clear() noexcept { lines_.clear(); }

        [[nodiscard]] const std::vector<std::string>& lines() const noexcept { return lines_; }

    private:
        std::vector<std::string> lines_{};
    };
}

#endif // ARBOR_TRAINING_PROGRESS_HPP
