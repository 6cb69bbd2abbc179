#include <filesystem>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../include/Arbor.h"
#include "common.hpp"

using Arbor::Test::expect;

namespace {
    Arbor::Common::Config make_config(const std::filesystem::path& root, const std::filesystem::path& treebank)
    {
        return Arbor::Common::Config::from_string(
            "[DEFAULT]\n"
            "save_dir = " + root.string() + "/vocab\n"
            "train_conllus = " + treebank.string() + "\n"
            "dev_conllus = " + treebank.string() + "\n"
            "input_size = 8\n"
            "recur_size = 6\n"
            "n_layers = 1\n"
            "output_size = 8\n"
            "arc_size = 4\n"
            "batch_size = 2\n"
            "print_every = 2\n"
            "max_steps = 4\n"
            "seed = 11\n"
            "\n"
            "[FormTokenVocab]\n"
            "min_occur_count = 1\n"
            "\n"
            "[Tagger]\n"
            "save_dir = " + root.string() + "/tagger\n"
            "input_vocab_classes = FormTokenVocab\n"
            "output_vocab_classes = UPOSTokenVocab\n"
            "throughput_vocab_classes = LemmaTokenVocab\n"
            "\n"
            "[Parser]\n"
            "save_dir = " + root.string() + "/parser\n"
            "input_network_classes = Tagger\n"
            "input_vocab_classes = FormTokenVocab:UPOSTokenVocab\n"
            "output_vocab_classes = DepheadIndexVocab:DeprelTokenVocab\n"
            "\n"
            "[XTagger]\n"
            "save_dir = " + root.string() + "/xtagger\n"
            "input_vocab_classes = FormTokenVocab\n"
            "output_vocab_classes = XPOSTokenVocab\n"
            "\n"
            "[Joint]\n"
            "save_dir = " + root.string() + "/joint\n"
            "input_network_classes = Tagger:XTagger\n"
            "input_vocab_classes = FormTokenVocab:UPOSTokenVocab:XPOSTokenVocab\n"
            "output_vocab_classes = DepheadIndexVocab:DeprelTokenVocab\n"
            "\n"
            "[Loop]\n"
            "input_network_classes = Loop\n");
    }
}

int main() {
    Arbor::Test::TempDir dir("network");
    const auto treebank = dir.write("tiny.conllu", Arbor::Test::kTinyTreebank);
    const auto config = make_config(dir.path(), treebank);
    const Arbor::Utils::Logger quiet{nullptr};

    // Composition and vocabulary sharing.
    auto parser = Arbor::Network::assemble("Parser", config, quiet);
    expect(parser->input_networks().size() == 1, "parser has one input network");
    auto tagger = parser->input_networks().front();
    expect(tagger->classname() == "Tagger", "input network built from its section");
    expect(parser->vocabs().input[0].get() == tagger->vocabs().input[0].get(), "form vocabulary is shared");
    expect(parser->vocabs().input[1].get() == tagger->vocabs().output[0].get(),
           "the tagger's output vocabulary is the parser's input");
    expect(parser->vocabs().id.get() == tagger->vocabs().id.get(), "ID index shared too");
    expect(parser->feature_size() == 8 && tagger->feature_size() == 8, "features are output_size wide");

    // Two sibling input networks resolve through the same registry.
    {
        auto joint = Arbor::Network::assemble("Joint", config, quiet);
        expect(joint->input_networks().size() == 2, "joint has two input networks");
        const auto& upos = joint->input_networks()[0];
        const auto& xpos = joint->input_networks()[1];
        expect(upos->classname() == "Tagger" && xpos->classname() == "XTagger", "inputs in declared order");
        expect(upos->vocabs().id.get() == xpos->vocabs().id.get()
                   && joint->vocabs().id.get() == upos->vocabs().id.get(),
               "one ID index across the composition");
        expect(upos->vocabs().input[0].get() == xpos->vocabs().input[0].get()
                   && joint->vocabs().input[0].get() == upos->vocabs().input[0].get(),
               "one form vocabulary across the composition");
        expect(joint->vocabs().input[1].get() == upos->vocabs().output[0].get(), "UPOS taken from the tagger");
        expect(joint->vocabs().input[2].get() == xpos->vocabs().output[0].get(), "XPOS taken from the other tagger");
        expect(joint->feature_size() == 8, "joint builds like any other network");

        // Networks handed in directly from separate compositions still conflict.
        auto stray = Arbor::Network::assemble("XTagger", config, quiet);
        Arbor::Test::expect_throws<Arbor::ConsistencyError>(
            [&] { (void)Arbor::Network("Joint", {upos, stray}, config, quiet); },
            "input networks from different registries");
    }

    // Declared and supplied input networks must agree.
    Arbor::Test::expect_throws<Arbor::ConfigurationError>(
        [&] { (void)Arbor::Network("Parser", {}, config, quiet); }, "missing input network");
    Arbor::Test::expect_throws<Arbor::ConfigurationError>(
        [&] { (void)Arbor::Network("Tagger", {tagger}, config, quiet); }, "undeclared input network");
    Arbor::Test::expect_throws<Arbor::ConfigurationError>(
        [&] { (void)Arbor::Network::assemble("Loop", config, quiet); }, "cyclic composition");

    {
        auto broken = config;
        broken.apply_override("Tagger:hidden_func=swishy");
        Arbor::Test::expect_throws<Arbor::ConfigurationError>(
            [&] { (void)Arbor::Network("Tagger", {}, broken, quiet); }, "unknown hidden function");
        auto bad_cell = config;
        bad_cell.apply_override("Tagger:recur_cell=transformer");
        Arbor::Test::expect_throws<Arbor::ConfigurationError>(
            [&] { (void)Arbor::Network("Tagger", {}, bad_cell, quiet); }, "unknown recurrent cell");
    }

    // Filename restriction is checked before any restore.
    Arbor::Test::expect_throws<Arbor::UsageError>(
        [&] { (void)parser->parse({treebank, treebank}, dir.path() / "parsed", std::string("out.conllu")); },
        "output filename with two inputs");

    // Train the tagger, then the parser on top of it.
    const auto tagger_reason = tagger->train();
    expect(tagger_reason == Arbor::Training::StopReason::StepBudget, "tagger stops on the step budget");
    expect(std::filesystem::exists(tagger->save_dir() / "SUCCESS"), "tagger SUCCESS");
    expect(std::filesystem::exists(tagger->save_dir() / "scores.txt"), "tagger scores");
    expect(Arbor::Checkpoint::Manager(tagger->save_dir()).latest().has_value(), "tagger checkpoint");

    const auto parser_reason = parser->train();
    expect(parser_reason == Arbor::Training::StopReason::StepBudget, "parser stops on the step budget");
    expect(std::filesystem::exists(parser->save_dir() / "SUCCESS"), "parser SUCCESS");
    for (const auto& parameter : tagger->model()->parameters()) {
        expect(!parameter.requires_grad(), "input network is frozen");
    }

    // A fresh composition restores both networks from disk and parses.
    auto reloaded = Arbor::Network::assemble("Parser", config, quiet);
    const auto out = dir.path() / "parsed";
    const auto reports = reloaded->parse({treebank}, out, std::string("tiny.parsed.conllu"));
    expect(reports.size() == 1 && reports[0].sentences == 2, "one report with both sentences");

    const auto parsed = Arbor::Data::CoNLLU::read(out / "tiny.parsed.conllu");
    expect(parsed.size() == 2, "both sentences written");
    if (parsed.size() == 2) {
        expect(parsed[0].comments.size() == 2, "comments survive parsing");
        for (const auto& sentence : parsed) {
            for (const auto& token : sentence.tokens) {
                const auto head = std::stoll(token[Arbor::Data::CoNLLU::HEAD]);
                expect(head >= 0 && head <= static_cast<long long>(sentence.tokens.size()), "head within sentence");
                const auto& label = token[Arbor::Data::CoNLLU::DEPREL];
                expect(label != "<PAD>" && label != "<ROOT>", "special labels are never predicted");
            }
        }
        expect(parsed[0].tokens[0][Arbor::Data::CoNLLU::FORM] == "The", "input columns kept");
    }

    // Default output location mirrors the input under save_dir/parsed.
    const auto mirrored = reloaded->parse({treebank});
    expect(mirrored.size() == 1 && std::filesystem::exists(mirrored[0].output), "default output path written");
    expect(mirrored[0].output.filename() == "tiny.conllu", "input name kept");

    Arbor::Test::expect_throws<Arbor::RestoreError>(
        [&] {
            auto elsewhere = config;
            elsewhere.apply_override("Tagger:save_dir=" + (dir.path() / "nothing").string());
            auto lonely = Arbor::Network::assemble("Tagger", elsewhere, quiet);
            (void)lonely->parse({treebank});
        },
        "parsing without a checkpoint");

    return Arbor::Test::report("network");
}
