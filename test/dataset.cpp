#include <algorithm>
#include <filesystem>
#include <set>
#include <vector>

#include <torch/torch.h>

#include "../src/data/dataset.hpp"
#include "../src/vocab/vocab.hpp"
#include "common.hpp"

using Arbor::Test::expect;

int main() {
    Arbor::Test::TempDir dir("dataset");
    const auto first = dir.write("a.conllu", Arbor::Test::kTinyTreebank);
    const auto second = dir.write("b.conllu",
        "1\tBirds\tbird\tNOUN\tNNS\t_\t2\tnsubj\t_\t_\n"
        "2\tsing\tsing\tVERB\tVBP\t_\t0\troot\t_\t_\n"
        "\n");
    const auto config = Arbor::Common::Config::from_string("[DEFAULT]\nsave_dir = " + dir.path().string() + "/v\n");

    Arbor::Vocab::Declaration declaration;
    declaration.input = {Arbor::Vocab::Type::UPOSToken};
    declaration.output = {Arbor::Vocab::Type::DepheadIndex};
    const auto vocabs = Arbor::Vocab::resolve(declaration, {}, config, [&] {
        return std::vector<std::filesystem::path>{first};
    });

    Arbor::Data::Dataset dataset({first, second}, vocabs.all, {.batch_size = 2, .seed = 7});
    expect(dataset.size() == 3, "rows from every file");

    const auto batches = dataset.shuffled_batches();
    expect(batches.size() == 2, "three rows in batches of two");
    std::set<std::size_t> seen;
    for (const auto& batch : batches) {
        seen.insert(batch.begin(), batch.end());
    }
    expect(seen.size() == 3, "a shuffle covers every row exactly once");

    const auto per_file = dataset.file_batches(0);
    expect(per_file.size() == 1 && per_file[0] == Arbor::Data::Indices{0, 1}, "file batches keep file order");
    expect(dataset.file_batches(1).front() == Arbor::Data::Indices{2}, "rows are numbered across files");
    expect(Arbor::Data::sequential_batches(dataset).size() == 2, "sequential batches never mix files");
    Arbor::Test::expect_throws<std::out_of_range>([&] { (void)dataset.file_batches(2); }, "file index out of range");

    const auto batch = dataset.tensors({0, 1});
    expect(batch.size() == 2, "batch size");
    expect(batch.mask.size(0) == 2 && batch.mask.size(1) == 5, "mask is [B, T+1]");
    expect(batch.lengths[0].item<std::int64_t>() == 5 && batch.lengths[1].item<std::int64_t>() == 3,
           "lengths count the root");
    expect(!batch.mask[0][0].item<bool>() && batch.mask[0][4].item<bool>(), "root is not a scored token");
    expect(!batch.mask[1][3].item<bool>(), "padding is masked");

    const auto& upos = batch.field("upos");
    expect(upos[0][0].item<std::int64_t>() == Arbor::Vocab::TokenVocab::kRoot, "root slot carries ROOT");
    expect(upos[1][4].item<std::int64_t>() == Arbor::Vocab::TokenVocab::kPad, "padding carries PAD");
    const auto& heads = batch.field("head");
    expect(heads[0][1].item<std::int64_t>() == 2 && heads[0][3].item<std::int64_t>() == 0, "heads are positions");
    expect(batch.has("id") && !batch.has("deprel"), "only resolved vocabularies become fields");
    Arbor::Test::expect_throws<std::runtime_error>([&] { (void)batch.field("deprel"); }, "absent field");

    const auto sentences = dataset.tokens({2});
    expect(sentences.size() == 1 && sentences[0].tokens[0][Arbor::Data::CoNLLU::FORM] == "Birds", "tokens by row");

    Arbor::Test::expect_throws<std::invalid_argument>(
        [&] { (void)Arbor::Data::Dataset({first}, vocabs.all, {.batch_size = 0}); }, "zero batch size");

    return Arbor::Test::report("dataset");
}
