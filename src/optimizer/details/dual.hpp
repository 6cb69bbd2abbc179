#ifndef ARBOR_OPTIMIZER_DUAL_HPP
#define ARBOR_OPTIMIZER_DUAL_HPP

#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "adam.hpp"
#include "schedule.hpp"

namespace Arbor::Optimizer::Details {
    struct DualOptions {
        AdamOptions adam{};
        // Global gradient-norm clip; 0 disables.
        double clip{5.0};
    };

    // Two Adam instances over one parameter set. Only the requested strategy
    // steps; moving to AMSGrad carries the accumulated moments over.
    class Dual {
    public:
        Dual(std::vector<torch::Tensor> params, DualOptions options)
            : params_(std::move(params)), options_(options)
        {
            if (params_.empty()) {
                throw std::invalid_argument("Dual optimizer requires at least one trainable parameter.");
            }
            auto primary = options_.adam;
            primary.amsgrad = false;
            auto variant = options_.adam;
            variant.amsgrad = true;
            primary_ = std::make_unique<torch::optim::Adam>(params_, to_torch_options(primary));
            variant_ = std::make_unique<torch::optim::Adam>(params_, to_torch_options(variant));
        }

        void step(const torch::Tensor& loss, Kind kind)
        {
            if (kind == Kind::AMSGrad && active_ == Kind::Adam) {
                transfer_state(*primary_, *variant_);
                active_ = Kind::AMSGrad;
            }
            auto& optimizer = active_ == Kind::Adam ? *primary_ : *variant_;
            optimizer.zero_grad();
            loss.backward();
            if (options_.clip > 0.0) {
                torch::nn::utils::clip_grad_norm_(params_, options_.clip);
            }
            optimizer.step();
        }

        [[nodiscard]] Kind active() const noexcept { return active_; }
        [[nodiscard]] torch::optim::Adam& primary() noexcept { return *primary_; }
        [[nodiscard]] torch::optim::Adam& variant() noexcept { return *variant_; }
        [[nodiscard]] const DualOptions& options() const noexcept { return options_; }

    private:
        std::vector<torch::Tensor> params_;
        DualOptions options_;
        std::unique_ptr<torch::optim::Adam> primary_{};
        std::unique_ptr<torch::optim::Adam> variant_{};
        Kind active_{Kind::Adam};
    };

    [[nodiscard]] inline DualOptions dual_options_from_config(const Common::Config& config)
    {
        DualOptions options;
        options.adam = options_from_config(config);
        options.clip = config.get_float(kSection, "clip", options.clip);
        if (options.clip < 0.0) {
            throw ConfigurationError("Option 'clip' in [Optimizer] must not be negative.");
        }
        return options;
    }
}

#endif // ARBOR_OPTIMIZER_DUAL_HPP
