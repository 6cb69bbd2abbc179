#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "../src/common/config.hpp"
#include "../src/vocab/vocab.hpp"
#include "common.hpp"

using Arbor::Test::expect;
namespace Vocab = Arbor::Vocab;

namespace {
    Arbor::Common::Config make_config(const std::filesystem::path& root)
    {
        return Arbor::Common::Config::from_string(
            "[DEFAULT]\n"
            "save_dir = " + root.string() + "/vocabs\n"
            "\n"
            "[FormTokenVocab]\n"
            "min_occur_count = 1\n");
    }
}

int main() {
    Arbor::Test::TempDir dir("vocab");
    const auto treebank = dir.write("train.conllu", Arbor::Test::kTinyTreebank);
    const auto config = make_config(dir.path());

    int corpus_calls = 0;
    Vocab::Corpus corpus = [&]() {
        ++corpus_calls;
        return std::vector<std::filesystem::path>{treebank};
    };

    {
        const auto types = Vocab::parse_types({"UPOSTokenVocab", "FormTokenVocab", "UPOSTokenVocab"});
        expect(types.size() == 2 && types[0] == Vocab::Type::UPOSToken, "duplicate classes collapse in order");
        Arbor::Test::expect_throws<Arbor::ConfigurationError>([] { (void)Vocab::parse_types({"SemrelTokenVocab"}); },
                                                              "unknown vocabulary class");
    }

    Vocab::Declaration declaration;
    declaration.input = {Vocab::Type::FormToken, Vocab::Type::UPOSToken};
    declaration.output = {Vocab::Type::DepheadIndex, Vocab::Type::DeprelToken};
    declaration.throughput = {Vocab::Type::LemmaToken};

    const auto first = Vocab::resolve(declaration, {}, config, corpus);
    expect(corpus_calls == 1, "corpus is read once for all counted vocabularies");
    expect(first.id && first.id->type() == Vocab::Type::IDIndex, "ID index is always resolved");
    expect(first.input.size() == 2 && first.output.size() == 2 && first.throughput.size() == 1, "role lists");
    expect(first.all.size() == 6, "every distinct vocabulary appears once in all");

    const auto& upos = static_cast<const Vocab::TokenVocab&>(*first.input[1]);
    expect(upos.state() == Vocab::Vocabulary::State::Counted, "counted when nothing is persisted");
    expect(upos.index("NOUN") == 3 && upos.index("VERB") == 4, "most frequent first, ties by name");
    expect(upos.index("ADJ") == Vocab::TokenVocab::kUnk, "unseen tag maps to UNK");
    expect(upos.token(Vocab::TokenVocab::kPad) == "<PAD>", "specials lead the table");
    expect(upos.frequency("NOUN") == 2, "frequencies are kept");
    expect(std::filesystem::exists(upos.filename()), "counted vocabulary is written to disk");

    const auto& form = static_cast<const Vocab::TokenVocab&>(*first.input[0]);
    expect(form.index("THE") == form.index("the") && form.index("the") > Vocab::TokenVocab::kUnk,
           "forms are uncased by default");
    expect(upos.index("noun") == Vocab::TokenVocab::kUnk, "tags stay cased by default");

    const auto& head = *first.output[0];
    expect(head.index("3") == 3 && head.index("_") == 0, "index vocab parses integers");
    expect(head.size() == 0, "index vocab has no closed size");

    // A second resolution loads from disk and never touches the corpus.
    const auto second = Vocab::resolve(declaration, {}, config, corpus);
    expect(corpus_calls == 1, "persisted vocabularies are loaded, not recounted");
    expect(second.input[1]->state() == Vocab::Vocabulary::State::Loaded, "state reports a load");
    expect(second.input[1]->index("VERB") == upos.index("VERB"), "reloaded indices are stable");
    expect(second.input[1].get() != first.input[1].get(), "independent resolutions build separate instances");

    // Sub-network vocabularies are adopted by identity.
    Vocab::Declaration dependent;
    dependent.input = {Vocab::Type::UPOSToken};
    dependent.output = {Vocab::Type::DepheadIndex};
    const auto shared = Vocab::resolve(dependent, {first.all}, config, corpus);
    expect(shared.input[0].get() == first.input[1].get(), "input vocabulary is shared with the sub-network");
    expect(shared.output[0].get() == first.output[0].get(), "output vocabulary is shared with the sub-network");

    Arbor::Test::expect_throws<Arbor::ConsistencyError>(
        [&] { (void)Vocab::resolve(dependent, {first.all, second.all}, config, corpus); },
        "two sub-networks with different instances of one class");

    // Sibling sub-networks resolved through one registry share every class.
    {
        Vocab::Registry registry(config);
        Vocab::Declaration upos_tagger;
        upos_tagger.input = {Vocab::Type::FormToken};
        upos_tagger.output = {Vocab::Type::UPOSToken};
        Vocab::Declaration xpos_tagger;
        xpos_tagger.input = {Vocab::Type::FormToken};
        xpos_tagger.output = {Vocab::Type::XPOSToken};
        const auto left = Vocab::resolve(upos_tagger, {}, registry, corpus);
        const auto right = Vocab::resolve(xpos_tagger, {}, registry, corpus);
        expect(left.id.get() == right.id.get(), "siblings share the ID index");
        expect(left.input[0].get() == right.input[0].get(), "siblings share the form vocabulary");
        expect(left.all.size() == 3 && right.all.size() == 3, "all lists only what each network uses");

        Vocab::Declaration joint;
        joint.input = {Vocab::Type::UPOSToken, Vocab::Type::XPOSToken};
        joint.output = {Vocab::Type::DepheadIndex};
        const auto parent = Vocab::resolve(joint, {left.all, right.all}, registry, corpus);
        expect(parent.input[0].get() == left.output[0].get(), "parent reuses the first sibling's output");
        expect(parent.input[1].get() == right.output[0].get(), "parent reuses the second sibling's output");
        expect(parent.id.get() == left.id.get(), "parent shares the ID index");
        expect(parent.all.size() == 5, "parent sees both siblings' vocabularies");
        expect(registry.contains(Vocab::Type::DepheadIndex), "registry keeps what the parent added");

        Arbor::Test::expect_throws<std::invalid_argument>([&] { registry.adopt(nullptr); }, "null vocabulary");
    }

    return Arbor::Test::report("vocab_registry");
}
