#ifndef ARBOR_INFERENCE_CACHE_HPP
#define ARBOR_INFERENCE_CACHE_HPP

#include <cstddef>
#include <map>
#include <ostream>
#include <utility>

#include "../data/conllu.hpp"

namespace Arbor::Inference {
    // Predicted sentences of the file currently being parsed, keyed by row.
    // Batches may complete in any order; dump() always emits row order.
    class PredictionCache {
    public:
        void store(std::size_t row, Data::CoNLLU::Sentence sentence)
        {
            entries_.insert_or_assign(row, std::move(sentence));
        }

        void clear() noexcept { entries_.clear(); }

        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
        [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
        [[nodiscard]] bool contains(std::size_t row) const { return entries_.contains(row); }

        void dump(std::ostream& stream) const
        {
            for (const auto& [row, sentence] : entries_) {
                Data::CoNLLU::write(stream, sentence);
            }
        }

    private:
        std::map<std::size_t, Data::CoNLLU::Sentence> entries_{};
    };
}

#endif // ARBOR_INFERENCE_CACHE_HPP
