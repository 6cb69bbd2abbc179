#ifndef ARBOR_VOCAB_BASE_HPP
#define ARBOR_VOCAB_BASE_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace Arbor::Vocab {
    // A categorical feature space bound to one CoNLL-U column. Instances are
    // shared by reference between every network of a composition; they are
    // populated once (load or count) and read-only afterwards.
    class Vocabulary {
    public:
        enum class State {
            Empty,
            Loaded,
            Counted,
        };

        explicit Vocabulary(Type type, bool factorized = false) : type_(type), factorized_(factorized) {}
        virtual ~Vocabulary() = default;

        Vocabulary(const Vocabulary&) = delete;
        Vocabulary& operator=(const Vocabulary&) = delete;

        [[nodiscard]] Type type() const noexcept { return type_; }
        [[nodiscard]] std::string_view classname() const noexcept { return to_string(type_); }
        [[nodiscard]] std::string field() const { return std::string(field_of(type_)); }
        [[nodiscard]] Data::CoNLLU::Column column() const noexcept { return column_of(type_); }
        [[nodiscard]] bool factorized() const noexcept { return factorized_; }
        [[nodiscard]] State state() const noexcept { return state_; }
        [[nodiscard]] bool ready() const noexcept { return state_ != State::Empty; }

        // Returns false when nothing is persisted yet.
        virtual bool load() = 0;
        virtual void count(const std::vector<std::filesystem::path>& files) = 0;

        [[nodiscard]] virtual std::int64_t index(const std::string& token) const = 0;
        [[nodiscard]] virtual std::string token(std::int64_t index) const = 0;
        // Number of classes; 0 for open index spaces (positions, heads).
        [[nodiscard]] virtual std::int64_t size() const noexcept = 0;
        [[nodiscard]] virtual std::int64_t root_index() const noexcept = 0;
        [[nodiscard]] virtual std::int64_t pad_index() const noexcept { return 0; }

    protected:
        void set_state(State state) noexcept { state_ = state; }

    private:
        Type type_;
        bool factorized_;
        State state_{State::Empty};
    };
}

#endif // ARBOR_VOCAB_BASE_HPP
