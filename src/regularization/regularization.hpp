#ifndef ARBOR_REGULARIZATION_HPP
#define ARBOR_REGULARIZATION_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/l2.hpp"

namespace Arbor::Regularization {
    using L2Options = Details::L2Options;
    using L2Descriptor = Details::L2Descriptor;

    [[nodiscard]] inline auto L2(const L2Options& options = {}) noexcept -> L2Descriptor {
        return L2Descriptor{.options = options};
    }

    using Details::penalty;
}

#endif //ARBOR_REGULARIZATION_HPP
