#ifndef ARBOR_VOCAB_REGISTRY_HPP
#define ARBOR_VOCAB_REGISTRY_HPP

#include <algorithm>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../common/config.hpp"
#include "../common/errors.hpp"
#include "details/base.hpp"
#include "details/index.hpp"
#include "details/token.hpp"
#include "details/types.hpp"

namespace Arbor::Vocab {
    using VocabPtr = std::shared_ptr<Vocabulary>;
    using Corpus = std::function<std::vector<std::filesystem::path>()>;

    struct Declaration {
        std::vector<Type> input{};
        std::vector<Type> output{};
        std::vector<Type> throughput{};
    };

    struct Resolution {
        VocabPtr id{};
        std::vector<VocabPtr> input{};
        std::vector<VocabPtr> output{};
        std::vector<VocabPtr> throughput{};
        std::vector<VocabPtr> all{};
    };

    [[nodiscard]] inline VocabPtr make_vocabulary(Type type, const Common::Config& config)
    {
        if (is_index(type)) {
            return std::make_shared<Details::IndexVocab>(type);
        }

        const auto section = std::string(to_string(type));
        const bool open_class = type == Type::FormToken || type == Type::LemmaToken;
        Details::TokenOptions options;
        options.save_dir = config.get_string(section, "save_dir");
        options.min_occur_count = config.get_int(section, "min_occur_count", open_class ? 2 : 1);
        options.cased = config.get_boolean(section, "cased", !open_class);
        options.factorized = config.get_boolean(section, "factorized", false);
        return std::make_shared<Details::TokenVocab>(type, std::move(options));
    }

    [[nodiscard]] inline std::vector<Type> parse_types(const std::vector<std::string>& classnames)
    {
        std::vector<Type> types;
        types.reserve(classnames.size());
        for (const auto& classname : classnames) {
            const auto type = from_string(classname);
            if (std::find(types.begin(), types.end(), type) == types.end()) {
                types.push_back(type);
            }
        }
        return types;
    }

    // One instance per vocabulary kind for a whole run. Instances handed over
    // by sub-networks are adopted verbatim; anything else is created here and
    // populated from disk, or counted from the corpus when nothing is
    // persisted yet.
    class Registry {
    public:
        explicit Registry(Common::Config config) : config_(std::move(config)) {}

        void adopt(const VocabPtr& vocab)
        {
            if (!vocab) {
                throw std::invalid_argument("Registry::adopt received a null vocabulary.");
            }
            const auto it = entries_.find(vocab->type());
            if (it == entries_.end()) {
                entries_.emplace(vocab->type(), vocab);
                return;
            }
            if (it->second.get() != vocab.get()) {
                throw ConsistencyError("Two input networks have different instances of "
                                       + std::string(vocab->classname()) + ".");
            }
        }

        // `corpus` is only invoked when the vocabulary has to be counted.
        [[nodiscard]] VocabPtr acquire(Type type, const Corpus& corpus = {})
        {
            if (const auto it = entries_.find(type); it != entries_.end()) {
                return it->second;
            }
            auto vocab = make_vocabulary(type, config_);
            if (!vocab->load()) {
                vocab->count(corpus ? corpus() : std::vector<std::filesystem::path>{});
            }
            entries_.emplace(type, vocab);
            return vocab;
        }

        [[nodiscard]] bool contains(Type type) const { return entries_.contains(type); }

        [[nodiscard]] std::vector<VocabPtr> all() const
        {
            std::vector<VocabPtr> vocabs;
            vocabs.reserve(entries_.size());
            for (const auto& [type, vocab] : entries_) {
                vocabs.push_back(vocab);
            }
            return vocabs;
        }

    private:
        Common::Config config_;
        std::map<Type, VocabPtr> entries_{};
    };

    // Resolves one network's vocabularies against a registry shared by the
    // run. `all` holds only what this network and its sub-networks use.
    [[nodiscard]] inline Resolution resolve(const Declaration& declaration,
                                            const std::vector<std::vector<VocabPtr>>& sub_model_vocabs,
                                            Registry& registry,
                                            Corpus corpus)
    {
        std::map<Type, VocabPtr> used;
        for (const auto& vocabs : sub_model_vocabs) {
            for (const auto& vocab : vocabs) {
                registry.adopt(vocab);
                used.emplace(vocab->type(), vocab);
            }
        }

        std::optional<std::vector<std::filesystem::path>> files;
        Corpus cached = [&files, &corpus]() {
            if (!files) {
                files = corpus ? corpus() : std::vector<std::filesystem::path>{};
            }
            return *files;
        };

        Resolution resolution;
        resolution.id = registry.acquire(Type::IDIndex, cached);
        used.emplace(Type::IDIndex, resolution.id);
        auto collect = [&registry, &cached, &used](const std::vector<Type>& types) {
            std::vector<VocabPtr> vocabs;
            vocabs.reserve(types.size());
            for (const auto type : types) {
                auto vocab = registry.acquire(type, cached);
                used.emplace(type, vocab);
                if (std::find(vocabs.begin(), vocabs.end(), vocab) == vocabs.end()) {
                    vocabs.push_back(std::move(vocab));
                }
            }
            return vocabs;
        };
        resolution.input = collect(declaration.input);
        resolution.output = collect(declaration.output);
        resolution.throughput = collect(declaration.throughput);
        for (const auto& [type, vocab] : used) {
            resolution.all.push_back(vocab);
        }
        return resolution;
    }

    // Standalone resolution with a registry of its own.
    [[nodiscard]] inline Resolution resolve(const Declaration& declaration,
                                            const std::vector<std::vector<VocabPtr>>& sub_model_vocabs,
                                            const Common::Config& config,
                                            Corpus corpus)
    {
        Registry registry(config);
        return resolve(declaration, sub_model_vocabs, registry, std::move(corpus));
    }
}

#endif // ARBOR_VOCAB_REGISTRY_HPP
