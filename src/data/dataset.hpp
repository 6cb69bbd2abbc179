#ifndef ARBOR_DATA_DATASET_HPP
#define ARBOR_DATA_DATASET_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../vocab/vocab.hpp"
#include "conllu.hpp"

namespace Arbor::Data {
    using Indices = std::vector<std::size_t>;

    // Materialised input tensors for one batch of sentences. Every field is a
    // [B, T+1] index tensor whose position 0 is the ROOT token.
    struct Batch {
        std::unordered_map<std::string, torch::Tensor> fields{};
        torch::Tensor mask{};
        torch::Tensor lengths{};

        [[nodiscard]] std::int64_t size() const { return lengths.defined() ? lengths.size(0) : 0; }

        [[nodiscard]] bool has(const std::string& name) const { return fields.contains(name); }

        [[nodiscard]] const torch::Tensor& field(const std::string& name) const
        {
            const auto it = fields.find(name);
            if (it == fields.end()) {
                throw std::runtime_error("Batch carries no tensor for field '" + name + "'.");
            }
            return it->second;
        }

        // Lengths stay on the CPU, packing requires it.
        [[nodiscard]] Batch to(const torch::Device& device) const
        {
            Batch moved;
            for (const auto& [name, tensor] : fields) {
                moved.fields.emplace(name, tensor.to(device));
            }
            moved.mask = mask.to(device);
            moved.lengths = lengths;
            return moved;
        }
    };

    class Source {
    public:
        virtual ~Source() = default;

        [[nodiscard]] virtual const std::vector<std::filesystem::path>& filenames() const = 0;
        [[nodiscard]] virtual std::size_t size() const = 0;
        // A fresh permutation of every row, chunked into batches.
        [[nodiscard]] virtual std::vector<Indices> shuffled_batches() = 0;
        // Rows of one file in their original order, chunked into batches.
        [[nodiscard]] virtual std::vector<Indices> file_batches(std::size_t file_index) const = 0;
        [[nodiscard]] virtual Batch tensors(const Indices& indices) const = 0;
        [[nodiscard]] virtual std::vector<CoNLLU::Sentence> tokens(const Indices& indices) const = 0;
    };

    [[nodiscard]] inline std::vector<Indices> sequential_batches(const Source& source)
    {
        std::vector<Indices> batches;
        for (std::size_t file = 0; file < source.filenames().size(); ++file) {
            auto file_batches = source.file_batches(file);
            batches.insert(batches.end(),
                           std::make_move_iterator(file_batches.begin()),
                           std::make_move_iterator(file_batches.end()));
        }
        return batches;
    }

    struct Options {
        std::size_t batch_size{32};
        std::uint64_t seed{0};
    };

    class Dataset : public Source {
    public:
        Dataset(std::vector<std::filesystem::path> filenames,
                std::vector<Vocab::VocabPtr> vocabs,
                Options options = {})
            : filenames_(std::move(filenames)),
              vocabs_(std::move(vocabs)),
              options_(options),
              generator_(options.seed)
        {
            if (options_.batch_size == 0) {
                throw std::invalid_argument("Dataset requires a positive batch size.");
            }
            file_rows_.resize(filenames_.size());
            for (std::size_t file = 0; file < filenames_.size(); ++file) {
                for (auto& sentence : CoNLLU::read(filenames_[file])) {
                    file_rows_[file].push_back(rows_.size());
                    rows_.push_back(std::move(sentence));
                }
            }
        }

        [[nodiscard]] const std::vector<std::filesystem::path>& filenames() const override { return filenames_; }
        [[nodiscard]] std::size_t size() const override { return rows_.size(); }
        [[nodiscard]] const Options& options() const noexcept { return options_; }

        [[nodiscard]] std::vector<Indices> shuffled_batches() override
        {
            Indices order(rows_.size());
            std::iota(order.begin(), order.end(), std::size_t{0});
            std::shuffle(order.begin(), order.end(), generator_);
            return chunk(order);
        }

        [[nodiscard]] std::vector<Indices> file_batches(std::size_t file_index) const override
        {
            if (file_index >= file_rows_.size()) {
                throw std::out_of_range("Dataset has no file with index " + std::to_string(file_index) + ".");
            }
            return chunk(file_rows_[file_index]);
        }

        [[nodiscard]] Batch tensors(const Indices& indices) const override
        {
            const auto rows = static_cast<std::int64_t>(indices.size());
            std::int64_t width = 1;
            for (const auto index : indices) {
                width = std::max<std::int64_t>(width, static_cast<std::int64_t>(row(index).tokens.size()) + 1);
            }

            Batch batch;
            batch.mask = torch::zeros({rows, width}, torch::kBool);
            batch.lengths = torch::empty({rows}, torch::kLong);
            auto mask = batch.mask.accessor<bool, 2>();
            auto lengths = batch.lengths.accessor<std::int64_t, 1>();
            for (std::int64_t b = 0; b < rows; ++b) {
                const auto& sentence = row(indices[static_cast<std::size_t>(b)]);
                lengths[b] = static_cast<std::int64_t>(sentence.tokens.size()) + 1;
                for (std::size_t t = 0; t < sentence.tokens.size(); ++t) {
                    mask[b][static_cast<std::int64_t>(t) + 1] = true;
                }
            }

            for (const auto& vocab : vocabs_) {
                auto tensor = torch::full({rows, width}, vocab->pad_index(), torch::kLong);
                auto values = tensor.accessor<std::int64_t, 2>();
                for (std::int64_t b = 0; b < rows; ++b) {
                    const auto& sentence = row(indices[static_cast<std::size_t>(b)]);
                    values[b][0] = vocab->root_index();
                    for (std::size_t t = 0; t < sentence.tokens.size(); ++t) {
                        values[b][static_cast<std::int64_t>(t) + 1] = vocab->index(sentence.tokens[t][vocab->column()]);
                    }
                }
                batch.fields.emplace(vocab->field(), std::move(tensor));
            }
            return batch;
        }

        [[nodiscard]] std::vector<CoNLLU::Sentence> tokens(const Indices& indices) const override
        {
            std::vector<CoNLLU::Sentence> sentences;
            sentences.reserve(indices.size());
            for (const auto index : indices) {
                sentences.push_back(row(index));
            }
            return sentences;
        }

    private:
        [[nodiscard]] const CoNLLU::Sentence& row(std::size_t index) const
        {
            if (index >= rows_.size()) {
                throw std::out_of_range("Dataset has no row with index " + std::to_string(index) + ".");
            }
            return rows_[index];
        }

        [[nodiscard]] std::vector<Indices> chunk(const Indices& order) const
        {
            std::vector<Indices> batches;
            for (std::size_t start = 0; start < order.size(); start += options_.batch_size) {
                const auto stop = std::min(order.size(), start + options_.batch_size);
                batches.emplace_back(order.begin() + static_cast<std::ptrdiff_t>(start),
                                     order.begin() + static_cast<std::ptrdiff_t>(stop));
            }
            return batches;
        }

        std::vector<std::filesystem::path> filenames_;
        std::vector<Vocab::VocabPtr> vocabs_;
        Options options_;
        std::mt19937_64 generator_;
        std::vector<CoNLLU::Sentence> rows_{};
        std::vector<Indices> file_rows_{};
    };
}

#endif // ARBOR_DATA_DATASET_HPP
