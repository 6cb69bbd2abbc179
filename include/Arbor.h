#ifndef ARBOR_LIBRARY_H
#define ARBOR_LIBRARY_H

#include "../src/core.hpp"
#include "../src/checkpoint/checkpoint.hpp"
#include "../src/common/config.hpp"
#include "../src/common/errors.hpp"
#include "../src/data/conllu.hpp"
#include "../src/data/dataset.hpp"
#include "../src/inference/pipeline.hpp"
#include "../src/model/graph.hpp"
#include "../src/optimizer/optimizer.hpp"
#include "../src/training/training.hpp"
#include "../src/utils/logger.hpp"
#include "../src/vocab/vocab.hpp"

// Public umbrella header.
// -----------------------------------------------------------------------------
// Everything is header-only under src/; this is the single include a
// downstream program (or the arbor CLI) needs.

#endif // ARBOR_LIBRARY_H
