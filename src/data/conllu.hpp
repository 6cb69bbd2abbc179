#ifndef ARBOR_DATA_CONLLU_HPP
#define ARBOR_DATA_CONLLU_HPP

#include <array>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Arbor::Data::CoNLLU {
    inline constexpr std::size_t kColumns = 10;

    enum Column : std::size_t {
        ID = 0,
        FORM,
        LEMMA,
        UPOS,
        XPOS,
        FEATS,
        HEAD,
        DEPREL,
        DEPS,
        MISC,
    };

    using Token = std::array<std::string, kColumns>;

    struct Sentence {
        std::vector<std::string> comments{};
        std::vector<Token> tokens{};
    };

    namespace Details {
        inline std::vector<std::string> split_tabs(const std::string& line)
        {
            std::vector<std::string> fields;
            fields.reserve(kColumns);
            std::size_t start = 0;
            while (true) {
                const auto tab = line.find('\t', start);
                if (tab == std::string::npos) {
                    fields.push_back(line.substr(start));
                    break;
                }
                fields.push_back(line.substr(start, tab - start));
                start = tab + 1;
            }
            return fields;
        }

        // Multi-word ranges ("3-4") and empty nodes ("5.1") carry no tree position.
        inline bool is_word_id(const std::string& id)
        {
            return !id.empty() && id.find_first_of("-.") == std::string::npos;
        }
    }

    // Reads every sentence of a file. Multi-word token lines and empty nodes are
    // dropped; comments are kept verbatim.
    inline std::vector<Sentence> read(const std::filesystem::path& path)
    {
        std::ifstream stream(path);
        if (!stream) {
            throw std::runtime_error("Unable to open CoNLL-U file '" + path.string() + "'.");
        }

        std::vector<Sentence> sentences;
        Sentence current;
        std::string line;
        std::size_t line_number = 0;
        while (std::getline(stream, line)) {
            ++line_number;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty()) {
                if (!current.tokens.empty()) {
                    sentences.push_back(std::move(current));
                }
                current = Sentence{};
                continue;
            }
            if (line.front() == '#') {
                current.comments.push_back(line);
                continue;
            }

            auto fields = Details::split_tabs(line);
            if (fields.size() != kColumns) {
                throw std::runtime_error("Malformed CoNLL-U line " + std::to_string(line_number) + " in '"
                                         + path.string() + "': expected " + std::to_string(kColumns)
                                         + " tab-separated columns, found " + std::to_string(fields.size()) + ".");
            }
            if (!Details::is_word_id(fields[ID])) {
                continue;
            }
            Token token;
            for (std::size_t column = 0; column < kColumns; ++column) {
                token[column] = std::move(fields[column]);
            }
            current.tokens.push_back(std::move(token));
        }
        if (!current.tokens.empty()) {
            sentences.push_back(std::move(current));
        }
        return sentences;
    }

    inline void write(std::ostream& stream, const Sentence& sentence)
    {
        for (const auto& comment : sentence.comments) {
            stream << comment << '\n';
        }
        for (const auto& token : sentence.tokens) {
            for (std::size_t column = 0; column < kColumns; ++column) {
                if (column > 0) {
                    stream << '\t';
                }
                stream << token[column];
            }
            stream << '\n';
        }
        stream << '\n';
    }
}

#endif // ARBOR_DATA_CONLLU_HPP
