#ifndef ARBOR_VOCAB_HPP
#define ARBOR_VOCAB_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/base.hpp"
#include "details/index.hpp"
#include "details/token.hpp"
#include "details/types.hpp"
#include "registry.hpp"

namespace Arbor::Vocab {
    using TokenOptions = Details::TokenOptions;
    using TokenVocab = Details::TokenVocab;
    using IndexVocab = Details::IndexVocab;
}

#endif // ARBOR_VOCAB_HPP
