#ifndef ARBOR_OPTIMIZER_HPP
#define ARBOR_OPTIMIZER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/adam.hpp"
#include "details/dual.hpp"
#include "details/schedule.hpp"

namespace Arbor::Optimizer {
    using AdamOptions = Details::AdamOptions;

    using Kind = Details::Kind;
    using Schedule = Details::Schedule;
    using DualOptions = Details::DualOptions;
    using Dual = Details::Dual;

    using Details::to_string;
    using Details::options_from_config;
    using Details::dual_options_from_config;
}

#endif //ARBOR_OPTIMIZER_HPP
