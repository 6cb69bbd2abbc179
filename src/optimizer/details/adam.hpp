#ifndef ARBOR_ADAM_HPP
#define ARBOR_ADAM_HPP
// Adam and its AMSGrad variant, configured from the [Optimizer] section.

#include <memory>
#include <string>
#include <tuple>
#include <vector>

#include <torch/torch.h>

#include "../../common/config.hpp"
#include "../../common/errors.hpp"

namespace Arbor::Optimizer::Details {
    inline constexpr const char* kSection = "Optimizer";

    struct AdamOptions {
        double learning_rate{2e-3};
        double beta1{0.9};
        double beta2{0.9};
        double eps{1e-12};
        double weight_decay{0.0};
        bool amsgrad{false};
    };

    inline torch::optim::AdamOptions to_torch_options(const AdamOptions& options) {
        torch::optim::AdamOptions torch_options(options.learning_rate);
        torch_options = torch_options.betas(std::make_tuple(options.beta1, options.beta2));
        torch_options = torch_options.eps(options.eps);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.amsgrad(options.amsgrad);
        return torch_options;
    }

    [[nodiscard]] inline AdamOptions options_from_config(const Common::Config& config) {
        const AdamOptions defaults{};
        AdamOptions options;
        options.learning_rate = config.get_float(kSection, "learning_rate", defaults.learning_rate);
        options.beta1 = config.get_float(kSection, "mu", defaults.beta1);
        options.beta2 = config.get_float(kSection, "nu", defaults.beta2);
        options.eps = config.get_float(kSection, "epsilon", defaults.eps);
        if (options.learning_rate <= 0.0) {
            throw ConfigurationError("Option 'learning_rate' in [Optimizer] must be positive.");
        }
        if (options.beta1 < 0.0 || options.beta1 >= 1.0 || options.beta2 < 0.0 || options.beta2 >= 1.0) {
            throw ConfigurationError("Options 'mu' and 'nu' in [Optimizer] must lie in [0, 1).");
        }
        if (options.eps <= 0.0) {
            throw ConfigurationError("Option 'epsilon' in [Optimizer] must be positive.");
        }
        return options;
    }

    // Seeds `to` with the moment estimates and step counts accumulated by
    // `from`. The running maximum starts at the current second moment.
    inline void transfer_state(torch::optim::Adam& from, torch::optim::Adam& to) {
        torch::NoGradGuard no_grad{};
        auto& source = from.state();
        auto& target = to.state();
        for (const auto& group : to.param_groups()) {
            for (const auto& param : group.params()) {
                auto* key = param.unsafeGetTensorImpl();
                const auto it = source.find(key);
                if (it == source.end()) {
                    continue;
                }
                const auto& previous = static_cast<const torch::optim::AdamParamState&>(*it->second);
                auto state = std::make_unique<torch::optim::AdamParamState>();
                state->step(previous.step());
                state->exp_avg(previous.exp_avg().clone());
                state->exp_avg_sq(previous.exp_avg_sq().clone());
                state->max_exp_avg_sq(previous.exp_avg_sq().clone());
                target[key] = std::move(state);
            }
        }
    }
}

#endif // ARBOR_ADAM_HPP
