#ifndef ARBOR_VOCAB_TOKEN_HPP
#define ARBOR_VOCAB_TOKEN_HPP

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../../data/conllu.hpp"
#include "base.hpp"

namespace Arbor::Vocab::Details {
    struct TokenOptions {
        std::filesystem::path save_dir{};
        std::int64_t min_occur_count{1};
        bool cased{true};
        bool factorized{false};
    };

    // Closed label set counted from the training corpora and cached on disk as
    // `<save_dir>/<field>-tokens.lst` (one `token<TAB>count` per line).
    class TokenVocab : public Vocabulary {
    public:
        static constexpr std::int64_t kPad = 0;
        static constexpr std::int64_t kRoot = 1;
        static constexpr std::int64_t kUnk = 2;
        static constexpr std::array<std::string_view, 3> kSpecials{"<PAD>", "<ROOT>", "<UNK>"};

        TokenVocab(Type type, TokenOptions options)
            : Vocabulary(type, options.factorized), options_(std::move(options))
        {
            reset();
        }

        [[nodiscard]] std::filesystem::path filename() const
        {
            return options_.save_dir / (field() + "-tokens.lst");
        }

        bool load() override
        {
            const auto path = filename();
            if (!std::filesystem::exists(path)) {
                return false;
            }
            std::ifstream stream(path);
            if (!stream) {
                throw std::runtime_error("Unable to read vocabulary file '" + path.string() + "'.");
            }

            std::vector<std::pair<std::string, std::int64_t>> counts;
            std::string line;
            std::size_t line_number = 0;
            while (std::getline(stream, line)) {
                ++line_number;
                if (line.empty()) {
                    continue;
                }
                const auto tab = line.rfind('\t');
                if (tab == std::string::npos) {
                    throw std::runtime_error("Malformed vocabulary line " + std::to_string(line_number)
                                             + " in '" + path.string() + "'.");
                }
                try {
                    counts.emplace_back(line.substr(0, tab), std::stoll(line.substr(tab + 1)));
                } catch (const std::logic_error&) {
                    throw std::runtime_error("Malformed count on vocabulary line " + std::to_string(line_number)
                                             + " in '" + path.string() + "'.");
                }
            }
            build(std::move(counts));
            set_state(State::Loaded);
            return true;
        }

        void count(const std::vector<std::filesystem::path>& files) override
        {
            std::unordered_map<std::string, std::int64_t> frequencies;
            for (const auto& file : files) {
                for (const auto& sentence : Data::CoNLLU::read(file)) {
                    for (const auto& token : sentence.tokens) {
                        const auto value = normalize(token[column()]);
                        if (!value.empty() && value != "_") {
                            ++frequencies[value];
                        }
                    }
                }
            }
            std::vector<std::pair<std::string, std::int64_t>> counts(frequencies.begin(), frequencies.end());
            build(std::move(counts));
            dump();
            set_state(State::Counted);
        }

        [[nodiscard]] std::int64_t index(const std::string& token) const override
        {
            const auto it = indices_.find(normalize(token));
            return it == indices_.end() ? kUnk : it->second;
        }

        [[nodiscard]] std::string token(std::int64_t index) const override
        {
            if (index < 0 || index >= static_cast<std::int64_t>(strings_.size())) {
                return std::string(kSpecials[kUnk]);
            }
            return strings_[static_cast<std::size_t>(index)];
        }

        [[nodiscard]] std::int64_t size() const noexcept override { return static_cast<std::int64_t>(strings_.size()); }
        [[nodiscard]] std::int64_t root_index() const noexcept override { return kRoot; }
        [[nodiscard]] std::int64_t pad_index() const noexcept override { return kPad; }

        [[nodiscard]] std::int64_t frequency(const std::string& token) const
        {
            const auto it = counts_.find(normalize(token));
            return it == counts_.end() ? 0 : it->second;
        }

        [[nodiscard]] const TokenOptions& options() const noexcept { return options_; }

    private:
        [[nodiscard]] std::string normalize(const std::string& token) const
        {
            if (options_.cased) {
                return token;
            }
            std::string lowered = token;
            std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char character) {
                return static_cast<char>(std::tolower(character));
            });
            return lowered;
        }

        void reset()
        {
            strings_.clear();
            indices_.clear();
            counts_.clear();
            for (std::size_t special = 0; special < kSpecials.size(); ++special) {
                strings_.emplace_back(kSpecials[special]);
                indices_.emplace(std::string(kSpecials[special]), static_cast<std::int64_t>(special));
            }
        }

        void build(std::vector<std::pair<std::string, std::int64_t>> counts)
        {
            std::sort(counts.begin(), counts.end(), [](const auto& lhs, const auto& rhs) {
                if (lhs.second != rhs.second) {
                    return lhs.second > rhs.second;
                }
                return lhs.first < rhs.first;
            });

            reset();
            for (auto& [token, occurrences] : counts) {
                counts_[token] = occurrences;
                if (occurrences < options_.min_occur_count || indices_.contains(token)) {
                    continue;
                }
                indices_.emplace(token, static_cast<std::int64_t>(strings_.size()));
                strings_.push_back(std::move(token));
            }
        }

        void dump() const
        {
            std::filesystem::create_directories(options_.save_dir);
            const auto path = filename();
            std::ofstream stream(path);
            if (!stream) {
                throw std::runtime_error("Unable to write vocabulary file '" + path.string() + "'.");
            }

            std::vector<std::pair<std::string, std::int64_t>> ordered(counts_.begin(), counts_.end());
            std::sort(ordered.begin(), ordered.end(), [](const auto& lhs, const auto& rhs) {
                if (lhs.second != rhs.second) {
                    return lhs.second > rhs.second;
                }
                return lhs.first < rhs.first;
            });
            for (const auto& [token, occurrences] : ordered) {
                stream << token << '\t' << occurrences << '\n';
            }
        }

        TokenOptions options_;
        std::vector<std::string> strings_{};
        std::unordered_map<std::string, std::int64_t> indices_{};
        std::unordered_map<std::string, std::int64_t> counts_{};
    };
}

#endif // ARBOR_VOCAB_TOKEN_HPP
