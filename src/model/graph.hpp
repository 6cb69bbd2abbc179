#ifndef ARBOR_MODEL_GRAPH_HPP
#define ARBOR_MODEL_GRAPH_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../data/dataset.hpp"
#include "../evaluation/evaluation.hpp"
#include "../regularization/regularization.hpp"
#include "../vocab/vocab.hpp"
#include "model.hpp"

namespace Arbor::Model {
    enum class Mode {
        Train,
        Dev,
        Inference,
    };

    [[nodiscard]] constexpr std::string_view to_string(Mode mode)
    {
        switch (mode) {
            case Mode::Train: return "train";
            case Mode::Dev: return "dev";
            case Mode::Inference: return "inference";
        }
        return "unknown";
    }

    // A frozen, previously trained network seen from a dependent model.
    class FeatureSource {
    public:
        virtual ~FeatureSource() = default;

        [[nodiscard]] virtual const std::string& classname() const = 0;
        [[nodiscard]] virtual std::int64_t feature_size() const = 0;
        // [B, T+1, feature_size]; no gradient, dropout disabled.
        [[nodiscard]] virtual torch::Tensor features(const Data::Batch& batch) = 0;
    };

    using FeatureSourcePtr = std::shared_ptr<FeatureSource>;

    struct Outputs {
        torch::Tensor loss{};
        std::unordered_map<std::string, torch::Tensor> probabilities{};
        std::unordered_map<std::string, torch::Tensor> predictions{};
        Evaluation::Counts counts{};
    };

    namespace Details {
        inline constexpr double kMaskedScore = -1e9;

        [[nodiscard]] inline Evaluation::Count count(const torch::Tensor& correct, const torch::Tensor& mask)
        {
            return Evaluation::Count{
                correct.sum().item<std::int64_t>(),
                mask.sum().item<std::int64_t>(),
            };
        }

        [[nodiscard]] inline torch::Tensor masked_cross_entropy(const torch::Tensor& logits,
                                                                const torch::Tensor& gold,
                                                                const torch::Tensor& mask)
        {
            return torch::nn::functional::cross_entropy(logits.index({mask}), gold.index({mask}));
        }
    }

    // One execution context over a shared parameter store. Train runs with
    // dropout and gradients; Dev and Inference run under NoGradGuard in eval
    // mode. Only Train and Dev read gold columns.
    class Graph {
    public:
        Graph(Mode mode, Model model, std::vector<FeatureSourcePtr> inputs, double l2_reg = 0.0)
            : mode_(mode), model_(std::move(model)), inputs_(std::move(inputs)),
              l2_(Regularization::L2({.coefficient = l2_reg})) {}

        Outputs run(const Data::Batch& batch)
        {
            if (mode_ == Mode::Train) {
                model_->train();
                return forward(batch);
            }
            torch::NoGradGuard no_grad;
            model_->eval();
            return forward(batch);
        }

        [[nodiscard]] Mode mode() const noexcept { return mode_; }
        [[nodiscard]] Model& model() noexcept { return model_; }
        [[nodiscard]] const std::vector<FeatureSourcePtr>& inputs() const noexcept { return inputs_; }

    private:
        Outputs forward(const Data::Batch& batch)
        {
            std::vector<torch::Tensor> features;
            features.reserve(inputs_.size());
            for (const auto& input : inputs_) {
                features.push_back(input->features(batch));
            }
            const auto hidden = model_->encode(batch, features);

            const bool supervised = mode_ != Mode::Inference;
            const bool has_tokens = batch.mask.any().item<bool>();
            const auto& mask = batch.mask;
            Outputs outputs;
            auto loss = torch::zeros({}, hidden.options());

            torch::Tensor head_predictions;
            torch::Tensor head_correct;
            if (model_->has_arcs()) {
                auto candidates = mask.clone();
                candidates.select(/*dim=*/1, /*index=*/0).fill_(true);
                const auto scores = model_->arc_scores(hidden).masked_fill(
                    candidates.logical_not().unsqueeze(1), Details::kMaskedScore);
                head_predictions = scores.argmax(/*dim=*/-1);
                outputs.probabilities.emplace("head", torch::softmax(scores, /*dim=*/-1));
                outputs.predictions.emplace("head", head_predictions);
                if (supervised) {
                    const auto& gold = batch.field("head");
                    if (has_tokens) {
                        loss = loss + Details::masked_cross_entropy(scores, gold, mask);
                    }
                    head_correct = head_predictions.eq(gold).logical_and(mask);
                    outputs.counts.emplace("head", Details::count(head_correct, mask));
                }
            }

            for (const auto& vocab : model_->outputs()) {
                if (vocab->type() == Vocab::Type::DepheadIndex) {
                    continue;
                }
                const auto field = vocab->field();
                const bool conditioned = model_->conditioned(field);
                torch::Tensor heads;
                if (conditioned) {
                    heads = supervised ? batch.field("head") : head_predictions;
                }
                const auto logits = model_->label_scores(field, hidden, heads);

                const auto specials = torch::tensor({Vocab::TokenVocab::kPad, Vocab::TokenVocab::kRoot},
                                                    torch::TensorOptions().dtype(torch::kLong).device(logits.device()));
                const auto predictions = logits.index_fill(/*dim=*/-1, specials, Details::kMaskedScore).argmax(/*dim=*/-1);
                outputs.probabilities.emplace(field, torch::softmax(logits, /*dim=*/-1));
                outputs.predictions.emplace(field, predictions);

                if (supervised) {
                    const auto& gold = batch.field(field);
                    if (has_tokens) {
                        loss = loss + Details::masked_cross_entropy(logits, gold, mask);
                    }
                    auto correct = predictions.eq(gold).logical_and(mask);
                    if (conditioned) {
                        correct = correct.logical_and(head_correct);
                    }
                    outputs.counts.emplace(field, Details::count(correct, mask));
                }
            }

            if (mode_ == Mode::Train && l2_.options.coefficient != 0.0) {
                loss = loss + Regularization::penalty(l2_, model_->parameters()).to(loss.device());
            }
            outputs.loss = loss;
            return outputs;
        }

        Mode mode_;
        Model model_;
        std::vector<FeatureSourcePtr> inputs_;
        Regularization::L2Descriptor l2_;
    };

    [[nodiscard]] inline Graph build(Mode mode, Model model, std::vector<FeatureSourcePtr> inputs, double l2_reg = 0.0)
    {
        return Graph(mode, std::move(model), std::move(inputs), l2_reg);
    }
}

#endif // ARBOR_MODEL_GRAPH_HPP
