#ifndef ARBOR_TRAINING_LOOP_HPP
#define ARBOR_TRAINING_LOOP_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../common/errors.hpp"
#include "../data/dataset.hpp"
#include "../evaluation/evaluation.hpp"
#include "../optimizer/optimizer.hpp"
#include "../utils/logger.hpp"
#include "interrupt.hpp"
#include "progress.hpp"
#include "state.hpp"

namespace Arbor::Training {
    // Result of one full development pass.
    struct Sweep {
        Evaluation::Accuracies accuracies{};
        double accuracy{0.0};
        double loss{0.0};
        double seconds{0.0};
    };

    // What the loop drives. The network supplies a real implementation; tests
    // supply scripted ones.
    class Runner {
    public:
        virtual ~Runner() = default;

        [[nodiscard]] virtual std::vector<Data::Indices> shuffled_batches() = 0;
        // One update with the given strategy; returns the batch's per-field accuracy.
        virtual Evaluation::Accuracies train_step(const Data::Indices& batch, Optimizer::Kind optimizer) = 0;
        virtual Sweep evaluate() = 0;
        virtual void save_checkpoint(const State& state) = 0;
        virtual void parse_datasets() = 0;
    };

    class Loop {
    public:
        static constexpr const char* kSuccessFile = "SUCCESS";
        static constexpr const char* kScoresFile = "scores.txt";

        Loop(Budget budget, std::filesystem::path save_dir, Utils::Logger logger = Utils::Logger{nullptr})
            : budget_(budget), save_dir_(std::move(save_dir)), logger_(std::move(logger)),
              transcript_(std::make_shared<Transcript>())
        {
            budget_.validate();
            observers_.push_back(transcript_);
        }

        void add_observer(std::shared_ptr<Observer> observer)
        {
            if (!observer) {
                throw std::invalid_argument("Loop::add_observer received a null observer.");
            }
            observers_.push_back(std::move(observer));
        }

        StopReason run(Runner& runner)
        {
            state_ = State{};
            transcript_->clear();
            Optimizer::Schedule schedule(budget_.switch_optimizers, budget_.max_steps_without_improvement);
            StopReason reason = StopReason::StepBudget;

            InterruptGuard guard;
            try {
                auto batches = runner.shuffled_batches();
                if (batches.empty()) {
                    throw std::runtime_error("Training set is empty.");
                }
                std::size_t cursor = 0;
                while (true) {
                    if (const auto stop = exhausted()) {
                        reason = *stop;
                        break;
                    }
                    InterruptGuard::poll();
                    if (cursor == batches.size()) {
                        batches = runner.shuffled_batches();
                        cursor = 0;
                    }

                    state_.history.push(runner.train_step(batches[cursor], state_.optimizer));
                    ++cursor;
                    ++state_.step;
                    if (cursor == batches.size()) {
                        ++state_.epoch;
                    }

                    if (state_.step % budget_.print_every == 0) {
                        tick(runner, schedule);
                    }
                }
            } catch (const InterruptedRun&) {
                reason = StopReason::Interrupted;
            }

            finish(reason);
            return reason;
        }

        [[nodiscard]] const State& state() const noexcept { return state_; }
        [[nodiscard]] const Budget& budget() const noexcept { return budget_; }
        [[nodiscard]] const Transcript& transcript() const noexcept { return *transcript_; }

    private:
        [[nodiscard]] std::optional<StopReason> exhausted() const noexcept
        {
            if (state_.step >= budget_.max_steps) {
                return StopReason::StepBudget;
            }
            if (state_.steps_since_improvement >= budget_.max_steps_without_improvement) {
                return StopReason::Patience;
            }
            return std::nullopt;
        }

        void tick(Runner& runner, Optimizer::Schedule& schedule)
        {
            const auto sweep = runner.evaluate();
            ++state_.evaluations;
            state_.current_accuracy = smooth(state_.current_accuracy, sweep.accuracy);

            const bool improved = state_.current_accuracy >= state_.best_accuracy;
            if (improved) {
                state_.steps_since_improvement = 0;
                state_.best_accuracy = state_.current_accuracy;
                if (budget_.save_model) {
                    runner.save_checkpoint(state_);
                }
                if (budget_.parse_datasets) {
                    runner.parse_datasets();
                }
            } else {
                state_.steps_since_improvement += budget_.print_every;
            }

            const bool switched = schedule.update(state_.steps_since_improvement);
            state_.optimizer = schedule.current();

            ProgressEvent event;
            event.step = state_.step;
            event.epoch = state_.epoch;
            event.optimizer = state_.optimizer;
            event.accuracy = sweep.accuracy;
            event.smoothed_accuracy = state_.current_accuracy;
            event.best_accuracy = state_.best_accuracy;
            event.steps_since_improvement = state_.steps_since_improvement;
            event.improved = improved;
            event.switched = switched;
            event.training = state_.history.means();
            event.development = sweep.accuracies;
            event.loss = sweep.loss;
            event.seconds = sweep.seconds;
            for (const auto& observer : observers_) {
                observer->on_progress(event);
            }
        }

        void finish(StopReason reason)
        {
            for (const auto& observer : observers_) {
                observer->on_stop(state_, reason);
            }
            std::filesystem::create_directories(save_dir_);
            const auto success = save_dir_ / kSuccessFile;
            std::ofstream marker(success, std::ios::trunc);
            if (!marker) {
                throw std::runtime_error("Unable to write '" + success.string() + "'.");
            }
            transcript_->write(save_dir_ / kScoresFile);
            logger_.debug("Wrote " + success.string() + " and " + (save_dir_ / kScoresFile).string() + ".");
        }

        Budget budget_;
        std::filesystem::path save_dir_;
        Utils::Logger logger_;
        std::shared_ptr<Transcript> transcript_;
        std::vector<std::shared_ptr<Observer>> observers_{};
        State state_{};
    };
}

#endif // ARBOR_TRAINING_LOOP_HPP
