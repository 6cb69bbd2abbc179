#include <algorithm>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <torch/torch.h>

#include "../src/data/dataset.hpp"
#include "../src/inference/pipeline.hpp"
#include "../src/vocab/vocab.hpp"
#include "common.hpp"

using Arbor::Test::expect;
namespace Inference = Arbor::Inference;
namespace CoNLLU = Arbor::Data::CoNLLU;

namespace {
    CoNLLU::Sentence sentence(const std::string& id, std::size_t length)
    {
        CoNLLU::Sentence result;
        result.comments.push_back("# sent_id = " + id);
        for (std::size_t position = 1; position <= length; ++position) {
            CoNLLU::Token token;
            token.fill("_");
            token[CoNLLU::ID] = std::to_string(position);
            token[CoNLLU::FORM] = id + std::to_string(position);
            result.tokens.push_back(token);
        }
        return result;
    }

    // One sentence per row; batches of a file are handed out last row first.
    class ReversedSource : public Arbor::Data::Source {
    public:
        void add_file(const std::filesystem::path& name, std::vector<CoNLLU::Sentence> sentences)
        {
            filenames_.push_back(name);
            std::vector<std::size_t> rows;
            for (auto& entry : sentences) {
                rows.push_back(rows_.size());
                rows_.push_back(std::move(entry));
            }
            files_.push_back(std::move(rows));
        }

        [[nodiscard]] const std::vector<std::filesystem::path>& filenames() const override { return filenames_; }
        [[nodiscard]] std::size_t size() const override { return rows_.size(); }
        [[nodiscard]] std::vector<Arbor::Data::Indices> shuffled_batches() override { return {}; }

        [[nodiscard]] std::vector<Arbor::Data::Indices> file_batches(std::size_t file) const override
        {
            std::vector<Arbor::Data::Indices> batches;
            for (auto it = files_[file].rbegin(); it != files_[file].rend(); ++it) {
                batches.push_back({*it});
            }
            return batches;
        }

        [[nodiscard]] Arbor::Data::Batch tensors(const Arbor::Data::Indices&) const override { return {}; }

        [[nodiscard]] std::vector<CoNLLU::Sentence> tokens(const Arbor::Data::Indices& indices) const override
        {
            std::vector<CoNLLU::Sentence> result;
            for (const auto index : indices) {
                result.push_back(rows_[index]);
            }
            return result;
        }

    private:
        std::vector<std::filesystem::path> filenames_{};
        std::vector<CoNLLU::Sentence> rows_{};
        std::vector<std::vector<std::size_t>> files_{};
    };

    // Tags every token with a fixed label and attaches it to its predecessor.
    class ChainPredictor : public Inference::Predictor {
    public:
        explicit ChainPredictor(std::int64_t label) : label_(label) {}

        std::unordered_map<std::string, torch::Tensor> predict(const Arbor::Data::Indices& batch) override
        {
            ++calls;
            const auto rows = static_cast<std::int64_t>(batch.size());
            const std::int64_t width = 8;
            std::unordered_map<std::string, torch::Tensor> predictions;
            predictions.emplace("upos", torch::full({rows, width}, label_, torch::kLong));
            predictions.emplace("head", torch::arange(-1, width - 1, torch::kLong).clamp_min(0).repeat({rows, 1}));
            return predictions;
        }

        int calls{0};

    private:
        std::int64_t label_;
    };
}

int main() {
    Arbor::Test::TempDir dir("pipeline");
    const auto treebank = dir.write("train.conllu", Arbor::Test::kTinyTreebank);

    auto upos = std::make_shared<Arbor::Vocab::TokenVocab>(
        Arbor::Vocab::Type::UPOSToken, Arbor::Vocab::TokenOptions{.save_dir = dir.path() / "vocab"});
    upos->count({treebank});
    auto head = std::make_shared<Arbor::Vocab::IndexVocab>(Arbor::Vocab::Type::DepheadIndex);
    const std::vector<Arbor::Vocab::VocabPtr> outputs{upos, head};

    const auto save_dir = dir.path() / "save";
    Inference::Pipeline pipeline(outputs, save_dir);

    // Output path rules.
    {
        const Inference::Request none{};
        expect(pipeline.output_path("data/dev.conllu", none) == save_dir / "parsed" / "data" / "dev.conllu",
               "relative input mirrors under parsed/");
        expect(pipeline.output_path("/corpora/ud/dev.conllu", none) == save_dir / "parsed" / "corpora" / "ud" / "dev.conllu",
               "absolute input maps under parsed/");
        const Inference::Request renamed{std::nullopt, std::string("out.conllu")};
        expect(pipeline.output_path("data/dev.conllu", renamed) == save_dir / "parsed" / "data" / "out.conllu",
               "explicit name without a directory");
        const Inference::Request redirected{dir.path() / "elsewhere", std::nullopt};
        expect(pipeline.output_path("data/dev.conllu", redirected) == dir.path() / "elsewhere" / "dev.conllu",
               "explicit directory keeps the input name");
    }

    // An explicit filename with several inputs fails before anything runs.
    {
        ReversedSource source;
        source.add_file(dir.path() / "in" / "a.conllu", {sentence("a", 2)});
        source.add_file(dir.path() / "in" / "b.conllu", {sentence("b", 2)});
        ChainPredictor predictor(upos->index("NOUN"));
        const Inference::Request request{dir.path() / "never", std::string("x.conllu")};
        Arbor::Test::expect_throws<Arbor::UsageError>([&] { (void)pipeline.run(source, predictor, request); },
                                                      "filename with two inputs");
        expect(predictor.calls == 0, "no prediction before the usage check");
        expect(!std::filesystem::exists(dir.path() / "never"), "no directory created");
        Arbor::Test::expect_throws<Arbor::UsageError>([] { Inference::Pipeline::validate(3, {std::nullopt, "x"}); },
                                                      "static validation");
        Inference::Pipeline::validate(1, {std::nullopt, std::string("x")});
    }

    // Batches complete out of order; the file is still written in row order.
    {
        ReversedSource source;
        source.add_file(dir.path() / "in" / "first.conllu", {sentence("s1", 3), sentence("s2", 1), sentence("s3", 2)});
        source.add_file(dir.path() / "in" / "second.conllu", {sentence("t1", 1)});
        ChainPredictor predictor(upos->index("VERB"));
        const auto out = dir.path() / "out";
        const auto reports = pipeline.run(source, predictor, Inference::Request{out, std::nullopt});

        expect(reports.size() == 2, "one report per file");
        expect(predictor.calls == 4, "one call per batch");
        if (reports.size() == 2) {
            expect(reports[0].sentences == 3 && reports[1].sentences == 1, "sentence counts per file");
            expect(reports[0].output == out / "first.conllu", "report names the output");
        }

        const auto parsed = CoNLLU::read(out / "first.conllu");
        expect(parsed.size() == 3, "all sentences written");
        if (parsed.size() == 3) {
            expect(parsed[0].comments[0] == "# sent_id = s1" && parsed[2].comments[0] == "# sent_id = s3",
                   "row order restored");
            expect(parsed[0].tokens[1][CoNLLU::UPOS] == "VERB", "predicted label written as a string");
            expect(parsed[0].tokens[0][CoNLLU::HEAD] == "0" && parsed[0].tokens[2][CoNLLU::HEAD] == "2",
                   "predicted heads written as positions");
            expect(parsed[1].tokens[0][CoNLLU::FORM] == "s21", "untouched columns survive");
        }
        const auto second = CoNLLU::read(out / "second.conllu");
        expect(second.size() == 1 && second[0].comments[0] == "# sent_id = t1", "files never mix");
        expect(pipeline.cache().empty(), "cache is released after each file");
    }

    {
        Inference::PredictionCache cache;
        cache.store(4, sentence("late", 1));
        cache.store(1, sentence("early", 1));
        std::ostringstream stream;
        cache.dump(stream);
        const auto text = stream.str();
        expect(cache.size() == 2 && cache.contains(4) && !cache.contains(2), "cache bookkeeping");
        expect(text.find("early") < text.find("late"), "dump is ordered by row");
    }

    return Arbor::Test::report("inference_pipeline");
}
