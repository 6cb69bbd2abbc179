#ifndef ARBOR_COMMON_CONFIG_HPP
#define ARBOR_COMMON_CONFIG_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <glob.h>

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "errors.hpp"

namespace Arbor::Common {
    using PropertyTree = boost::property_tree::ptree;

    namespace Detail {
        inline std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char character) {
                return static_cast<char>(std::tolower(character));
            });
            return value;
        }

        inline std::string trim_copy(const std::string& value)
        {
            const auto not_space = [](unsigned char character) { return !std::isspace(character); };
            auto first = std::find_if(value.begin(), value.end(), not_space);
            auto last = std::find_if(value.rbegin(), value.rend(), not_space).base();
            if (first >= last) {
                return {};
            }
            return std::string(first, last);
        }

        inline std::vector<std::string> split_list(const std::string& value)
        {
            std::vector<std::string> items;
            std::string current;
            for (const char character : value) {
                if (character == ':' || character == ',' || std::isspace(static_cast<unsigned char>(character))) {
                    if (!current.empty()) {
                        items.push_back(std::move(current));
                        current.clear();
                    }
                    continue;
                }
                current.push_back(character);
            }
            if (!current.empty()) {
                items.push_back(std::move(current));
            }
            return items;
        }

        inline bool has_wildcard(const std::string& pattern)
        {
            return pattern.find_first_of("*?[") != std::string::npos;
        }

        inline std::vector<std::filesystem::path> expand_glob(const std::string& pattern)
        {
            std::vector<std::filesystem::path> matches;
            glob_t result{};
            const int status = ::glob(pattern.c_str(), 0, nullptr, &result);
            if (status == 0) {
                for (std::size_t index = 0; index < result.gl_pathc; ++index) {
                    matches.emplace_back(result.gl_pathv[index]);
                }
            }
            ::globfree(&result);
            if (status != 0 && status != GLOB_NOMATCH) {
                throw ConfigurationError("Unable to expand '" + pattern + "'.");
            }
            std::sort(matches.begin(), matches.end());
            return matches;
        }
    }

    // INI-backed key lookup. Sections are named after the requesting class
    // (`ParserNetwork`, `DeprelTokenVocab`, `Optimizer`, ...); a key missing from
    // its section falls back to [DEFAULT]. Values may reference other values via
    // `${key}` or `${Section:key}`.
    class Config {
    public:
        static constexpr const char* kDefaultSection = "DEFAULT";
        static constexpr int kMaxInterpolationDepth = 10;

        Config() = default;

        explicit Config(PropertyTree tree) : tree_(std::move(tree)) {}

        [[nodiscard]] static Config from_file(const std::filesystem::path& path)
        {
            std::ifstream stream(path);
            if (!stream) {
                throw ConfigurationError("Unable to open configuration file '" + path.string() + "'.");
            }
            return from_stream(stream, path.string());
        }

        [[nodiscard]] static Config from_string(const std::string& text)
        {
            std::istringstream stream(text);
            return from_stream(stream, "<string>");
        }

        void set(const std::string& section, const std::string& key, const std::string& value)
        {
            auto section_it = tree_.find(section);
            if (section_it == tree_.not_found()) {
                tree_.push_back({section, PropertyTree{}});
                section_it = tree_.find(section);
            }
            auto& child = section_it->second;
            auto key_it = child.find(key);
            if (key_it != child.not_found()) {
                key_it->second.data() = value;
            } else {
                child.push_back({key, PropertyTree{value}});
            }
        }

        // Parses `Section:key=value`.
        void apply_override(const std::string& assignment)
        {
            const auto colon = assignment.find(':');
            const auto equals = assignment.find('=');
            if (colon == std::string::npos || equals == std::string::npos || colon > equals) {
                throw UsageError("Override '" + assignment + "' must have the form Section:key=value.");
            }
            set(assignment.substr(0, colon),
                assignment.substr(colon + 1, equals - colon - 1),
                assignment.substr(equals + 1));
        }

        [[nodiscard]] bool has(const std::string& section, const std::string& key) const
        {
            return raw(section, key).has_value();
        }

        [[nodiscard]] std::string get_string(const std::string& section, const std::string& key) const
        {
            auto value = raw(section, key);
            if (!value) {
                throw ConfigurationError("Missing option '" + key + "' in section [" + section + "].");
            }
            return interpolate(*value, section, 0);
        }

        [[nodiscard]] std::string get_string(const std::string& section, const std::string& key, std::string fallback) const
        {
            return has(section, key) ? get_string(section, key) : std::move(fallback);
        }

        [[nodiscard]] std::int64_t get_int(const std::string& section, const std::string& key) const
        {
            const auto value = get_string(section, key);
            try {
                std::size_t consumed = 0;
                const auto parsed = std::stoll(value, &consumed);
                if (consumed != value.size()) {
                    throw std::invalid_argument(value);
                }
                return static_cast<std::int64_t>(parsed);
            } catch (const std::logic_error&) {
                throw ConfigurationError("Option '" + key + "' in section [" + section + "] is not an integer: '" + value + "'.");
            }
        }

        [[nodiscard]] std::int64_t get_int(const std::string& section, const std::string& key, std::int64_t fallback) const
        {
            return has(section, key) ? get_int(section, key) : fallback;
        }

        [[nodiscard]] double get_float(const std::string& section, const std::string& key) const
        {
            const auto value = get_string(section, key);
            try {
                std::size_t consumed = 0;
                const auto parsed = std::stod(value, &consumed);
                if (consumed != value.size()) {
                    throw std::invalid_argument(value);
                }
                return parsed;
            } catch (const std::logic_error&) {
                throw ConfigurationError("Option '" + key + "' in section [" + section + "] is not a number: '" + value + "'.");
            }
        }

        [[nodiscard]] double get_float(const std::string& section, const std::string& key, double fallback) const
        {
            return has(section, key) ? get_float(section, key) : fallback;
        }

        [[nodiscard]] bool get_boolean(const std::string& section, const std::string& key) const
        {
            const auto value = Detail::to_lower(get_string(section, key));
            if (value == "true" || value == "yes" || value == "on" || value == "1") return true;
            if (value == "false" || value == "no" || value == "off" || value == "0") return false;
            throw ConfigurationError("Option '" + key + "' in section [" + section + "] is not a boolean: '" + value + "'.");
        }

        [[nodiscard]] bool get_boolean(const std::string& section, const std::string& key, bool fallback) const
        {
            return has(section, key) ? get_boolean(section, key) : fallback;
        }

        [[nodiscard]] std::vector<std::string> get_list(const std::string& section, const std::string& key) const
        {
            return Detail::split_list(get_string(section, key));
        }

        [[nodiscard]] std::vector<std::string> get_list(const std::string& section, const std::string& key,
                                                        std::vector<std::string> fallback) const
        {
            return has(section, key) ? get_list(section, key) : std::move(fallback);
        }

        [[nodiscard]] std::vector<std::filesystem::path> get_files(const std::string& section, const std::string& key) const
        {
            std::vector<std::filesystem::path> files;
            for (const auto& entry : get_list(section, key)) {
                if (Detail::has_wildcard(entry)) {
                    auto matches = Detail::expand_glob(entry);
                    if (matches.empty()) {
                        throw ConfigurationError("Pattern '" + entry + "' for " + section + ":" + key
                                                 + " matches no files.");
                    }
                    files.insert(files.end(), matches.begin(), matches.end());
                } else {
                    files.emplace_back(entry);
                }
            }
            return files;
        }

        [[nodiscard]] std::vector<std::filesystem::path> get_files(const std::string& section, const std::string& key,
                                                                   std::vector<std::filesystem::path> fallback) const
        {
            return has(section, key) ? get_files(section, key) : std::move(fallback);
        }

        [[nodiscard]] const PropertyTree& tree() const noexcept { return tree_; }

    private:
        [[nodiscard]] static Config from_stream(std::istream& stream, const std::string& origin)
        {
            PropertyTree tree;
            try {
                boost::property_tree::ini_parser::read_ini(stream, tree);
            } catch (const boost::property_tree::ini_parser_error& error) {
                throw ConfigurationError("Failed to parse configuration '" + origin + "': " + error.what());
            }
            return Config(std::move(tree));
        }

        [[nodiscard]] std::optional<std::string> lookup(const std::string& section, const std::string& key) const
        {
            const auto section_it = tree_.find(section);
            if (section_it == tree_.not_found()) {
                return std::nullopt;
            }
            const auto key_it = section_it->second.find(key);
            if (key_it == section_it->second.not_found()) {
                return std::nullopt;
            }
            return key_it->second.data();
        }

        [[nodiscard]] std::optional<std::string> raw(const std::string& section, const std::string& key) const
        {
            if (auto value = lookup(section, key)) {
                return value;
            }
            return lookup(kDefaultSection, key);
        }

        [[nodiscard]] std::string interpolate(const std::string& value, const std::string& section, int depth) const
        {
            if (value.find("${") == std::string::npos) {
                return value;
            }
            if (depth >= kMaxInterpolationDepth) {
                throw ConfigurationError("Interpolation depth exceeded while expanding '" + value + "' in section [" + section + "].");
            }

            std::string expanded;
            std::size_t cursor = 0;
            while (cursor < value.size()) {
                const auto open = value.find("${", cursor);
                if (open == std::string::npos) {
                    expanded.append(value, cursor, std::string::npos);
                    break;
                }
                const auto close = value.find('}', open);
                if (close == std::string::npos) {
                    throw ConfigurationError("Unterminated interpolation in '" + value + "' in section [" + section + "].");
                }
                expanded.append(value, cursor, open - cursor);

                const auto reference = value.substr(open + 2, close - open - 2);
                std::string target_section = section;
                std::string target_key = reference;
                if (const auto colon = reference.find(':'); colon != std::string::npos) {
                    target_section = reference.substr(0, colon);
                    target_key = reference.substr(colon + 1);
                }
                auto replacement = raw(target_section, target_key);
                if (!replacement) {
                    throw ConfigurationError("Interpolation references missing option '" + reference + "' from section [" + section + "].");
                }
                expanded += interpolate(*replacement, target_section, depth + 1);
                cursor = close + 1;
            }
            return expanded;
        }

        PropertyTree tree_{};
    };
}

#endif // ARBOR_COMMON_CONFIG_HPP
