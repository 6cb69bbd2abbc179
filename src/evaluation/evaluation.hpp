#ifndef ARBOR_EVALUATION_HPP
#define ARBOR_EVALUATION_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/accuracy.hpp"

namespace Arbor::Evaluation {
    using Count = Details::Count;
    using Counts = Details::Counts;
    using Accuracies = Details::Accuracies;
    using Accumulator = Details::Accumulator;
    using History = Details::History;

    using Details::accuracies;
    using Details::geometric_mean;
}

#endif // ARBOR_EVALUATION_HPP
