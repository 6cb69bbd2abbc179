#ifndef ARBOR_BIAFFINE_HPP
#define ARBOR_BIAFFINE_HPP

#include <cstdint>
#include <stdexcept>

#include <torch/torch.h>

namespace Arbor::Layer::Details {

    struct BiaffineOptions {
        std::int64_t input_size{};
        std::int64_t arc_size{};
    };

    // Scores every (dependent, head) pair of a sentence:
    // s[b, i, j] = dep_i^T W head_j + u^T head_j
    class BiaffineImpl : public torch::nn::Module {
    public:
        explicit BiaffineImpl(const BiaffineOptions& options) : options_(options)
        {
            if (options_.input_size <= 0 || options_.arc_size <= 0) {
                throw std::invalid_argument("Biaffine scorer requires positive input_size and arc_size.");
            }
            dependent_ = register_module("dependent", torch::nn::Linear(options_.input_size, options_.arc_size));
            head_ = register_module("head", torch::nn::Linear(options_.input_size, options_.arc_size));
            weight_ = register_parameter("weight", torch::empty({options_.arc_size, options_.arc_size}));
            head_bias_ = register_parameter("head_bias", torch::zeros({options_.arc_size}));
            torch::nn::init::xavier_uniform_(weight_);
        }

        // [B, T, D] -> [B, T (dependent), T (head)]
        torch::Tensor forward(const torch::Tensor& hidden)
        {
            if (hidden.dim() != 3) {
                throw std::invalid_argument("Biaffine scorer expects a 3D tensor [B,T,D].");
            }
            const auto dependents = torch::relu(dependent_->forward(hidden));
            const auto heads = torch::relu(head_->forward(hidden));
            auto scores = torch::matmul(torch::matmul(dependents, weight_), heads.transpose(1, 2));
            return scores + torch::matmul(heads, head_bias_).unsqueeze(1);
        }

    private:
        BiaffineOptions options_;
        torch::nn::Linear dependent_{nullptr};
        torch::nn::Linear head_{nullptr};
        torch::Tensor weight_{};
        torch::Tensor head_bias_{};
    };

    TORCH_MODULE(Biaffine);
}

#endif // ARBOR_BIAFFINE_HPP
