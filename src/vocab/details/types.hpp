#ifndef ARBOR_VOCAB_TYPES_HPP
#define ARBOR_VOCAB_TYPES_HPP

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

#include "../../common/errors.hpp"
#include "../../data/conllu.hpp"

namespace Arbor::Vocab {
    enum class Type {
        IDIndex,
        FormToken,
        LemmaToken,
        UPOSToken,
        XPOSToken,
        UFeatsToken,
        DepheadIndex,
        DeprelToken,
    };

    namespace Details {
        struct Traits {
            Type type;
            std::string_view classname;
            std::string_view field;
            Data::CoNLLU::Column column;
            bool index;
        };

        inline constexpr std::array<Traits, 8> kTraits{{
            {Type::IDIndex,      "IDIndexVocab",      "id",     Data::CoNLLU::ID,     true},
            {Type::FormToken,    "FormTokenVocab",    "form",   Data::CoNLLU::FORM,   false},
            {Type::LemmaToken,   "LemmaTokenVocab",   "lemma",  Data::CoNLLU::LEMMA,  false},
            {Type::UPOSToken,    "UPOSTokenVocab",    "upos",   Data::CoNLLU::UPOS,   false},
            {Type::XPOSToken,    "XPOSTokenVocab",    "xpos",   Data::CoNLLU::XPOS,   false},
            {Type::UFeatsToken,  "UFeatsTokenVocab",  "ufeats", Data::CoNLLU::FEATS,  false},
            {Type::DepheadIndex, "DepheadIndexVocab", "head",   Data::CoNLLU::HEAD,   true},
            {Type::DeprelToken,  "DeprelTokenVocab",  "deprel", Data::CoNLLU::DEPREL, false},
        }};

        [[nodiscard]] constexpr const Traits& traits(Type type)
        {
            return kTraits[static_cast<std::size_t>(type)];
        }
    }

    [[nodiscard]] constexpr std::string_view to_string(Type type) { return Details::traits(type).classname; }
    [[nodiscard]] constexpr std::string_view field_of(Type type) { return Details::traits(type).field; }
    [[nodiscard]] constexpr Data::CoNLLU::Column column_of(Type type) { return Details::traits(type).column; }
    [[nodiscard]] constexpr bool is_index(Type type) { return Details::traits(type).index; }

    [[nodiscard]] inline Type from_string(std::string_view classname)
    {
        for (const auto& entry : Details::kTraits) {
            if (entry.classname == classname) {
                return entry.type;
            }
        }
        throw ConfigurationError("Unknown vocabulary class '" + std::string(classname) + "'.");
    }
}

#endif // ARBOR_VOCAB_TYPES_HPP
