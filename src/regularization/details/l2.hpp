#ifndef ARBOR_L2_HPP
#define ARBOR_L2_HPP

#include <cstdint>
#include <vector>

#include <torch/torch.h>

namespace Arbor::Regularization::Details {

    struct L2Options {
        double coefficient{0.0};
        // Parameters with fewer dimensions (biases, gains) are skipped.
        std::int64_t min_dim{2};
    };

    struct L2Descriptor {
        L2Options options{};
    };

    [[nodiscard]] inline bool penalized(const L2Descriptor& descriptor, const torch::Tensor& param) {
        return param.defined() && param.dim() >= descriptor.options.min_dim;
    }

    // coefficient * sum(w^2) over every penalized parameter.
    [[nodiscard]] inline torch::Tensor penalty(const L2Descriptor& descriptor, const std::vector<torch::Tensor>& params) {
        torch::Tensor squares;
        for (const auto& param : params) {
            if (!penalized(descriptor, param)) {
                continue;
            }
            auto term = param.square().sum();
            squares = squares.defined() ? squares + term : term;
        }
        if (!squares.defined() || descriptor.options.coefficient == 0.0) {
            return torch::zeros({});
        }
        return squares * descriptor.options.coefficient;
    }

}

#endif //ARBOR_L2_HPP
