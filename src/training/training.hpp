#ifndef ARBOR_TRAINING_HPP
#define ARBOR_TRAINING_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into the sibling headers

#include "interrupt.hpp"
#include "loop.hpp"
#include "progress.hpp"
#include "state.hpp"

#endif // ARBOR_TRAINING_HPP
