#ifndef ARBOR_EVALUATION_ACCURACY_HPP
#define ARBOR_EVALUATION_ACCURACY_HPP

#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <utility>

namespace Arbor::Evaluation::Details {
    struct Count {
        std::int64_t correct{0};
        std::int64_t total{0};

        Count& operator+=(const Count& other) noexcept
        {
            correct += other.correct;
            total += other.total;
            return *this;
        }

        [[nodiscard]] double accuracy() const noexcept
        {
            return total > 0 ? static_cast<double>(correct) / static_cast<double>(total) : 0.0;
        }
    };

    using Counts = std::map<std::string, Count>;
    using Accuracies = std::map<std::string, double>;

    [[nodiscard]] inline Accuracies accuracies(const Counts& counts)
    {
        Accuracies result;
        for (const auto& [field, count] : counts) {
            result.emplace(field, count.accuracy());
        }
        return result;
    }

    // Collapses per-field accuracies into one score. A single zero field
    // drives the mean to zero.
    [[nodiscard]] inline double geometric_mean(const Accuracies& values)
    {
        if (values.empty()) {
            return 0.0;
        }
        double log_sum = 0.0;
        for (const auto& [field, value] : values) {
            if (value <= 0.0) {
                return 0.0;
            }
            log_sum += std::log(value);
        }
        return std::exp(log_sum / static_cast<double>(values.size()));
    }

    // One development sweep: counts and loss summed over batches.
    class Accumulator {
    public:
        Accumulator() : start_(std::chrono::steady_clock::now()) {}

        void add(const Counts& counts, double loss)
        {
            for (const auto& [field, count] : counts) {
                counts_[field] += count;
            }
            loss_ += loss;
            ++batches_;
        }

        [[nodiscard]] Accuracies accuracies() const { return Details::accuracies(counts_); }
        [[nodiscard]] double accuracy() const { return geometric_mean(accuracies()); }
        [[nodiscard]] double loss() const noexcept { return batches_ > 0 ? loss_ / static_cast<double>(batches_) : 0.0; }
        [[nodiscard]] std::size_t batches() const noexcept { return batches_; }
        [[nodiscard]] const Counts& counts() const noexcept { return counts_; }

        [[nodiscard]] double seconds() const
        {
            return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
        }

    private:
        Counts counts_{};
        double loss_{0.0};
        std::size_t batches_{0};
        std::chrono::steady_clock::time_point start_;
    };

    // Rolling window of recent per-step training accuracies.
    class History {
    public:
        explicit History(std::size_t capacity = 100) : capacity_(capacity == 0 ? 1 : capacity) {}

        void push(Accuracies values)
        {
            window_.push_back(std::move(values));
            while (window_.size() > capacity_) {
                window_.pop_front();
            }
        }

        [[nodiscard]] Accuracies means() const
        {
            Accuracies sums;
            std::map<std::string, std::size_t> seen;
            for (const auto& entry : window_) {
                for (const auto& [field, value] : entry) {
                    sums[field] += value;
                    ++seen[field];
                }
            }
            for (auto& [field, value] : sums) {
                value /= static_cast<double>(seen[field]);
            }
            return sums;
        }

        [[nodiscard]] std::size_t size() const noexcept { return window_.size(); }
        [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
        void clear() noexcept { window_.clear(); }

    private:
        std::size_t capacity_;
        std::deque<Accuracies> window_{};
    };
}

#endif // ARBOR_EVALUATION_ACCURACY_HPP
