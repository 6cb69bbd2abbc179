#ifndef ARBOR_ACTIVATION_APPLY_HPP
#define ARBOR_ACTIVATION_APPLY_HPP

#include <torch/torch.h>

#include <utility>

#include "activation.hpp"

namespace Arbor::Activation::Details {
    inline torch::Tensor apply(::Arbor::Activation::Type type, torch::Tensor input) {
        switch (type) {
            case ::Arbor::Activation::Type::ReLU:
                return torch::relu(std::move(input));
            case ::Arbor::Activation::Type::LeakyReLU:
                return torch::leaky_relu(std::move(input), 0.1);
            case ::Arbor::Activation::Type::Tanh:
                return torch::tanh(std::move(input));
            case ::Arbor::Activation::Type::Sigmoid:
                return torch::sigmoid(std::move(input));
            case ::Arbor::Activation::Type::GeLU:
                return torch::gelu(std::move(input));
            case ::Arbor::Activation::Type::SiLU:
                return torch::silu(std::move(input));
            case ::Arbor::Activation::Type::Softplus:
                return torch::softplus(std::move(input));
            case ::Arbor::Activation::Type::Identity:
                return input;
            default:
                return input;
        }
    }
}

#endif // ARBOR_ACTIVATION_APPLY_HPP
