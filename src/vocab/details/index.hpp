#ifndef ARBOR_VOCAB_INDEX_HPP
#define ARBOR_VOCAB_INDEX_HPP

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "base.hpp"

namespace Arbor::Vocab::Details {
    // Integer-valued columns (token positions, head attachments). Nothing to
    // persist or count: the value space is the sentence itself.
    class IndexVocab : public Vocabulary {
    public:
        explicit IndexVocab(Type type) : Vocabulary(type, false) {}

        bool load() override
        {
            set_state(State::Loaded);
            return true;
        }

        void count(const std::vector<std::filesystem::path>&) override { set_state(State::Counted); }

        [[nodiscard]] std::int64_t index(const std::string& token) const override
        {
            std::int64_t value = 0;
            const auto* begin = token.data();
            const auto* end = token.data() + token.size();
            const auto [ptr, error] = std::from_chars(begin, end, value);
            if (error != std::errc{} || ptr != end || value < 0) {
                return 0;
            }
            return value;
        }

        [[nodiscard]] std::string token(std::int64_t index) const override { return std::to_string(index); }

        [[nodiscard]] std::int64_t size() const noexcept override { return 0; }
        [[nodiscard]] std::int64_t root_index() const noexcept override { return 0; }
    };
}

#endif // ARBOR_VOCAB_INDEX_HPP
