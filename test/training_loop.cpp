#include <algorithm>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../src/training/training.hpp"
#include "common.hpp"

using Arbor::Test::expect;
using Arbor::Test::expect_near;
namespace Training = Arbor::Training;
namespace Optimizer = Arbor::Optimizer;

namespace {
    // Replays a fixed list of development accuracies; the last one repeats.
    class ScriptedRunner : public Training::Runner {
    public:
        ScriptedRunner(std::vector<double> script, std::size_t batches_per_epoch)
            : script_(std::move(script)), batches_per_epoch_(batches_per_epoch) {}

        std::vector<Arbor::Data::Indices> shuffled_batches() override
        {
            ++shuffles;
            std::vector<Arbor::Data::Indices> batches;
            for (std::size_t index = 0; index < batches_per_epoch_; ++index) {
                batches.push_back({index});
            }
            return batches;
        }

        Arbor::Evaluation::Accuracies train_step(const Arbor::Data::Indices&, Optimizer::Kind optimizer) override
        {
            ++steps;
            kinds.push_back(optimizer);
            if (interrupt_at > 0 && steps == interrupt_at) {
                std::raise(SIGINT);
            }
            return {{"upos", 0.5}};
        }

        Training::Sweep evaluate() override
        {
            const auto index = std::min(evaluations, script_.size() - 1);
            ++evaluations;
            return Training::Sweep{{{"upos", script_[index]}}, script_[index], 1.0, 0.0};
        }

        void save_checkpoint(const Training::State& state) override { checkpoints.push_back(state.step); }

        void parse_datasets() override { ++parses; }

        std::int64_t steps{0};
        std::int64_t interrupt_at{0};
        std::size_t evaluations{0};
        std::size_t shuffles{0};
        std::size_t parses{0};
        std::vector<std::int64_t> checkpoints{};
        std::vector<Optimizer::Kind> kinds{};

    private:
        std::vector<double> script_;
        std::size_t batches_per_epoch_;
    };

    class Recorder : public Training::Observer {
    public:
        void on_progress(const Training::ProgressEvent& event) override { events.push_back(event); }
        void on_stop(const Training::State&, Training::StopReason reason) override { stops.push_back(reason); }

        std::vector<Training::ProgressEvent> events{};
        std::vector<Training::StopReason> stops{};
    };
}

int main() {
    expect_near(Training::smooth(0.0, 0.8), 0.2, "first smoothed value is a quarter of the accuracy");
    expect_near(Training::smooth(0.2, 0.9), 0.375, "exponential smoothing");

    {
        Training::Budget budget;
        budget.print_every = 0;
        Arbor::Test::expect_throws<Arbor::ConfigurationError>([&] { budget.validate(); }, "print_every must be positive");
        const auto parsed = Training::Budget::from_config(
            Arbor::Common::Config::from_string("[Net]\nprint_every = 5\nswitch_optimizers = true\n"), "Net");
        expect(parsed.print_every == 5 && parsed.switch_optimizers && parsed.max_steps == 50000, "budget from config");
    }

    // Patience scenario: two improving ticks, then stagnation.
    {
        Arbor::Test::TempDir dir("loop-patience");
        Training::Budget budget;
        budget.print_every = 5;
        budget.max_steps = 100;
        budget.max_steps_without_improvement = 20;
        budget.switch_optimizers = true;
        budget.parse_datasets = true;

        ScriptedRunner runner({0.8, 0.9, 0.1, 0.1}, 3);
        auto recorder = std::make_shared<Recorder>();
        Training::Loop loop(budget, dir.path());
        loop.add_observer(recorder);
        const auto reason = loop.run(runner);

        expect(recorder->events.size() >= 4, "at least four ticks");
        if (recorder->events.size() >= 4) {
            expect_near(recorder->events[0].smoothed_accuracy, 0.2, "tick 1 smoothed");
            expect_near(recorder->events[1].smoothed_accuracy, 0.375, "tick 2 smoothed");
            expect_near(recorder->events[2].smoothed_accuracy, 0.30625, "tick 3 smoothed");
            expect_near(recorder->events[3].smoothed_accuracy, 0.2546875, "tick 4 smoothed");
            expect(recorder->events[0].improved && recorder->events[1].improved, "first two ticks improve");
            expect(!recorder->events[2].improved && !recorder->events[3].improved, "last two do not");
            expect(recorder->events[3].steps_since_improvement == 10, "two stagnant ticks cost 2 * print_every");
            expect_near(recorder->events[3].best_accuracy, 0.375, "best is kept");
            expect(recorder->events[2].switched && recorder->events[2].optimizer == Optimizer::Kind::AMSGrad,
                   "switch on the first tick past a tenth of patience");
            expect(!recorder->events[1].switched && !recorder->events[3].switched, "exactly one switch");
        }
        expect(runner.checkpoints == std::vector<std::int64_t>{5, 10}, "checkpoints only on improving ticks");
        expect(runner.parses == 2, "datasets parsed on improving ticks");
        expect(reason == Training::StopReason::Patience, "stopped by patience");
        expect(loop.state().step == 30, "patience exhausted after six ticks");
        expect(loop.state().steps_since_improvement == 20, "patience fully spent");
        expect(loop.state().step <= budget.max_steps, "never beyond the step budget");
        expect(runner.kinds.size() == 30 && runner.kinds[14] == Optimizer::Kind::Adam
                   && runner.kinds[15] == Optimizer::Kind::AMSGrad,
               "steps after the switch use AMSGrad");
        expect(loop.state().epoch == 10, "epochs count completed passes independently of ticks");
        expect(runner.shuffles == 10, "a new permutation for every pass that is started");
        expect(recorder->stops.size() == 1 && recorder->stops[0] == Training::StopReason::Patience, "observers told");

        expect(std::filesystem::exists(dir.path() / Training::Loop::kSuccessFile), "SUCCESS written");
        expect(loop.transcript().lines().size() == 7, "one line per tick plus the outcome");
        expect(Arbor::Test::slurp(dir.path() / Training::Loop::kScoresFile).find("stopped=") != std::string::npos,
               "scores.txt carries the outcome");
    }

    // Step budget with switching disabled; the ticks at 5 and 10 only.
    {
        Arbor::Test::TempDir dir("loop-budget");
        Training::Budget budget;
        budget.print_every = 5;
        budget.max_steps = 12;
        budget.max_steps_without_improvement = 1000;
        budget.save_model = false;

        ScriptedRunner runner({0.1, 0.05}, 4);
        Training::Loop loop(budget, dir.path());
        const auto reason = loop.run(runner);
        expect(reason == Training::StopReason::StepBudget, "stopped by the step budget");
        expect(loop.state().step == 12 && runner.evaluations == 2, "ticks only on multiples of print_every");
        expect(runner.checkpoints.empty(), "save_model = false writes nothing");
        for (const auto kind : runner.kinds) {
            expect(kind == Optimizer::Kind::Adam, "no switch when disabled");
        }
        expect(loop.state().epoch == 3, "three full passes of four batches");
        expect(loop.transcript().lines().size() == 3, "two ticks and the stop line");

        // Running the same loop again starts a fresh transcript.
        ScriptedRunner again({0.2}, 4);
        expect(loop.run(again) == Training::StopReason::StepBudget, "second run also ends on the budget");
        expect(loop.transcript().lines().size() == 3, "earlier ticks are not carried over");
        const auto scores = Arbor::Test::slurp(dir.path() / "scores.txt");
        expect(std::count(scores.begin(), scores.end(), '\n') == 3, "scores.txt holds the second run only");
    }

    // An interrupt ends the run cleanly and still marks success.
    {
        Arbor::Test::TempDir dir("loop-interrupt");
        Training::Budget budget;
        budget.print_every = 5;
        budget.max_steps = 100;

        ScriptedRunner runner({0.5}, 2);
        runner.interrupt_at = 7;
        Training::Loop loop(budget, dir.path());
        const auto reason = loop.run(runner);
        expect(reason == Training::StopReason::Interrupted, "interrupted");
        expect(loop.state().step == 7, "stopped right after the interrupting step");
        expect(std::filesystem::exists(dir.path() / Training::Loop::kSuccessFile), "SUCCESS written on interrupt");
        expect(!Training::InterruptGuard::requested(), "flag cleared after the run");
    }

    {
        Arbor::Test::TempDir dir("loop-empty");
        ScriptedRunner runner({0.5}, 0);
        Training::Loop loop(Training::Budget{}, dir.path());
        Arbor::Test::expect_throws<std::runtime_error>([&] { (void)loop.run(runner); }, "empty training set");
        Arbor::Test::expect_throws<std::invalid_argument>([&] { loop.add_observer(nullptr); }, "null observer");
    }

    return Arbor::Test::report("training_loop");
}
