#ifndef ARBOR_MODEL_HPP
#define ARBOR_MODEL_HPP

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../activation/activation.hpp"
#include "../activation/apply.hpp"
#include "../common/config.hpp"
#include "../common/errors.hpp"
#include "../data/dataset.hpp"
#include "../layer/layer.hpp"
#include "../vocab/vocab.hpp"

namespace Arbor::Model {

    struct Options {
        std::int64_t input_size{100};
        std::int64_t recur_size{200};
        std::int64_t n_layers{2};
        bool bidirectional{true};
        Layer::Cell recur_cell{Layer::Cell::LSTM};
        Activation::Descriptor input_func{Activation::Identity};
        Activation::Descriptor hidden_func{Activation::ReLU};
        std::int64_t output_size{200};
        double input_keep_prob{0.67};
        double recur_keep_prob{0.67};
        double output_keep_prob{0.67};
        std::int64_t arc_size{100};
    };

    namespace Details {
        inline std::int64_t positive(const Common::Config& config, const std::string& section,
                                     const std::string& key, std::int64_t fallback)
        {
            const auto value = config.get_int(section, key, fallback);
            if (value <= 0) {
                throw ConfigurationError("Option '" + key + "' in [" + section + "] must be positive, got "
                                         + std::to_string(value) + ".");
            }
            return value;
        }

        inline double probability(const Common::Config& config, const std::string& section,
                                  const std::string& key, double fallback)
        {
            const auto value = config.get_float(section, key, fallback);
            if (!(value > 0.0 && value <= 1.0)) {
                throw ConfigurationError("Option '" + key + "' in [" + section + "] must lie in (0, 1], got "
                                         + std::to_string(value) + ".");
            }
            return value;
        }
    }

    // Names are resolved here so that a typo fails before any tensor is allocated.
    [[nodiscard]] inline Options options_from_config(const Common::Config& config, const std::string& section)
    {
        const Options defaults{};
        Options options;
        options.input_size = Details::positive(config, section, "input_size", defaults.input_size);
        options.recur_size = Details::positive(config, section, "recur_size", defaults.recur_size);
        options.n_layers = Details::positive(config, section, "n_layers", defaults.n_layers);
        options.bidirectional = config.get_boolean(section, "bidirectional", defaults.bidirectional);
        options.recur_cell = Layer::Details::cell_from_string(config.get_string(section, "recur_cell", "lstm"));
        options.input_func = Activation::from_string(config.get_string(section, "input_func", "identity"));
        options.hidden_func = Activation::from_string(config.get_string(section, "hidden_func", "relu"));
        options.output_size = Details::positive(config, section, "output_size", defaults.output_size);
        options.input_keep_prob = Details::probability(config, section, "input_keep_prob", defaults.input_keep_prob);
        options.recur_keep_prob = Details::probability(config, section, "recur_keep_prob", defaults.recur_keep_prob);
        options.output_keep_prob = Details::probability(config, section, "output_keep_prob", defaults.output_keep_prob);
        options.arc_size = Details::positive(config, section, "arc_size", defaults.arc_size);
        return options;
    }

    // Embeddings -> recurrent encoder -> hidden layer, plus one classifier per
    // output vocabulary. Sub-network features arrive already computed and are
    // concatenated to the summed embeddings.
    class ModelImpl : public torch::nn::Module {
    public:
        ModelImpl(Options options,
                  std::vector<Vocab::VocabPtr> inputs,
                  std::vector<Vocab::VocabPtr> outputs,
                  std::int64_t feature_size = 0)
            : options_(std::move(options)), outputs_(std::move(outputs)), feature_size_(feature_size)
        {
            for (const auto& vocab : inputs) {
                if (Vocab::is_index(vocab->type())) {
                    throw ConfigurationError("Index vocabulary " + std::string(vocab->classname())
                                             + " cannot be used as an embedded input.");
                }
                auto embedding = register_module(
                    "embedding_" + vocab->field(),
                    torch::nn::Embedding(torch::nn::EmbeddingOptions(vocab->size(), options_.input_size)
                                             .padding_idx(vocab->pad_index())));
                embeddings_.emplace_back(vocab->field(), std::move(embedding));
            }
            if (embeddings_.empty() && feature_size_ <= 0) {
                throw ConfigurationError("Model has neither embedded inputs nor sub-network features.");
            }

            const auto encoder_input = (embeddings_.empty() ? 0 : options_.input_size) + feature_size_;
            input_dropout_ = register_module("input_dropout", torch::nn::Dropout(1.0 - options_.input_keep_prob));
            recurrent_ = register_module("recurrent", Layer::Recurrent(Layer::RecurrentOptions{
                .input_size = encoder_input,
                .hidden_size = options_.recur_size,
                .num_layers = options_.n_layers,
                .dropout = 1.0 - options_.recur_keep_prob,
                .bidirectional = options_.bidirectional,
                .cell = options_.recur_cell,
            }));
            hidden_ = register_module("hidden", torch::nn::Linear(recurrent_->output_size(), options_.output_size));
            output_dropout_ = register_module("output_dropout", torch::nn::Dropout(1.0 - options_.output_keep_prob));

            const bool has_arcs = std::any_of(outputs_.begin(), outputs_.end(), [](const Vocab::VocabPtr& vocab) {
                return vocab->type() == Vocab::Type::DepheadIndex;
            });
            for (const auto& vocab : outputs_) {
                if (vocab->type() == Vocab::Type::DepheadIndex) {
                    arcs_ = register_module("arcs", Layer::Biaffine(Layer::BiaffineOptions{
                        .input_size = options_.output_size,
                        .arc_size = options_.arc_size,
                    }));
                    continue;
                }
                if (Vocab::is_index(vocab->type())) {
                    throw ConfigurationError("Index vocabulary " + std::string(vocab->classname())
                                             + " cannot be predicted.");
                }
                const bool conditioned = vocab->type() == Vocab::Type::DeprelToken && !vocab->factorized();
                if (conditioned && !has_arcs) {
                    throw ConfigurationError("Unfactorized " + std::string(vocab->classname())
                                             + " requires DepheadIndexVocab among the output vocabularies.");
                }
                const auto width = conditioned ? 2 * options_.output_size : options_.output_size;
                auto tagger = register_module("tagger_" + vocab->field(), torch::nn::Linear(width, vocab->size()));
                taggers_.push_back(Tagger{vocab->field(), conditioned, std::move(tagger)});
            }
        }

        // [B, T+1, output_size]
        torch::Tensor encode(const Data::Batch& batch, const std::vector<torch::Tensor>& features)
        {
            std::vector<torch::Tensor> parts;
            parts.reserve(1 + features.size());
            if (!embeddings_.empty()) {
                torch::Tensor summed;
                for (auto& [field, embedding] : embeddings_) {
                    auto embedded = embedding->forward(batch.field(field));
                    summed = summed.defined() ? summed + embedded : embedded;
                }
                parts.push_back(Activation::Details::apply(options_.input_func.type, std::move(summed)));
            }
            for (const auto& feature : features) {
                parts.push_back(feature);
            }
            auto input = parts.size() == 1 ? parts.front() : torch::cat(parts, /*dim=*/-1);
            input = input_dropout_->forward(input);

            auto encoded = recurrent_->forward(input, batch.lengths);
            auto hidden = Activation::Details::apply(options_.hidden_func.type, hidden_->forward(encoded));
            return output_dropout_->forward(hidden);
        }

        [[nodiscard]] bool has_arcs() const noexcept { return !arcs_.is_empty(); }

        torch::Tensor arc_scores(const torch::Tensor& hidden)
        {
            if (arcs_.is_empty()) {
                throw std::logic_error("Model has no arc scorer.");
            }
            return arcs_->forward(hidden);
        }

        [[nodiscard]] bool conditioned(const std::string& field) const
        {
            return tagger(field).conditioned;
        }

        // `heads` is only read for head-conditioned labels.
        torch::Tensor label_scores(const std::string& field, const torch::Tensor& hidden, const torch::Tensor& heads)
        {
            auto& entry = tagger(field);
            if (!entry.conditioned) {
                return entry.linear->forward(hidden);
            }
            if (!heads.defined()) {
                throw std::invalid_argument("Head-conditioned labels for '" + field + "' need head indices.");
            }
            const auto length = hidden.size(1);
            auto index = heads.clamp(0, length - 1).unsqueeze(-1).expand({hidden.size(0), length, hidden.size(2)});
            auto head_states = hidden.gather(/*dim=*/1, index);
            return entry.linear->forward(torch::cat({hidden, head_states}, /*dim=*/-1));
        }

        [[nodiscard]] const Options& options() const noexcept { return options_; }
        [[nodiscard]] const std::vector<Vocab::VocabPtr>& outputs() const noexcept { return outputs_; }
        [[nodiscard]] std::int64_t output_size() const noexcept { return options_.output_size; }

    private:
        struct Tagger {
            std::string field;
            bool conditioned{false};
            torch::nn::Linear linear{nullptr};
        };

        [[nodiscard]] const Tagger& tagger(const std::string& field) const
        {
            const auto it = std::find_if(taggers_.begin(), taggers_.end(), [&field](const Tagger& entry) {
                return entry.field == field;
            });
            if (it == taggers_.end()) {
                throw std::out_of_range("Model has no classifier for field '" + field + "'.");
            }
            return *it;
        }

        [[nodiscard]] Tagger& tagger(const std::string& field)
        {
            return const_cast<Tagger&>(static_cast<const ModelImpl&>(*this).tagger(field));
        }

        Options options_;
        std::vector<Vocab::VocabPtr> outputs_;
        std::int64_t feature_size_{0};
        std::vector<std::pair<std::string, torch::nn::Embedding>> embeddings_{};
        torch::nn::Dropout input_dropout_{nullptr};
        Layer::Recurrent recurrent_{nullptr};
        torch::nn::Linear hidden_{nullptr};
        torch::nn::Dropout output_dropout_{nullptr};
        Layer::Biaffine arcs_{nullptr};
        std::vector<Tagger> taggers_{};
    };

    TORCH_MODULE(Model);
}

#endif // ARBOR_MODEL_HPP
