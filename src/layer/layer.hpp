#ifndef ARBOR_LAYER_HPP
#define ARBOR_LAYER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/biaffine.hpp"
#include "details/recurrent.hpp"

namespace Arbor::Layer {
    using Cell = Details::Cell;

    using RecurrentOptions = Details::RecurrentOptions;
    using Recurrent = Details::Recurrent;

    using BiaffineOptions = Details::BiaffineOptions;
    using Biaffine = Details::Biaffine;
}

#endif // ARBOR_LAYER_HPP
