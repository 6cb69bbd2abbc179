#ifndef ARBOR_CHECKPOINT_HPP
#define ARBOR_CHECKPOINT_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/errors.hpp"

namespace Arbor::Checkpoint {
    using NameSet = std::set<std::string>;

    namespace Details {
        inline std::string format_tensor_shape(const torch::Tensor& tensor) {
            std::ostringstream stream;
            stream << '(';
            const auto sizes = tensor.sizes();
            for (std::size_t index = 0; index < sizes.size(); ++index) {
                if (index > 0) {
                    stream << ", ";
                }
                stream << sizes[index];
            }
            stream << ')';
            return stream.str();
        }

        // Write-then-rename so a reader never observes a partial file.
        inline void write_atomically(const std::filesystem::path& path, const std::string& contents)
        {
            auto temporary = path;
            temporary += ".tmp";
            {
                std::ofstream stream(temporary, std::ios::trunc);
                if (!stream) {
                    throw std::runtime_error("Unable to write '" + temporary.string() + "'.");
                }
                stream << contents;
            }
            std::filesystem::rename(temporary, path);
        }
    }

    // Keeps the most recent parameter snapshot of one module under
    // `<directory>/<prefix>-<step>.pt`, indexed by `<directory>/checkpoint`.
    class Manager {
    public:
        static constexpr const char* kIndexFile = "checkpoint";

        explicit Manager(std::filesystem::path directory, std::string prefix = "ckpt")
            : directory_(std::move(directory)), prefix_(std::move(prefix)) {}

        [[nodiscard]] std::filesystem::path filename(std::int64_t step) const
        {
            return directory_ / (prefix_ + "-" + std::to_string(step) + ".pt");
        }

        std::filesystem::path save(const torch::nn::Module& module, std::int64_t step, const NameSet& non_persistent = {})
        {
            namespace fs = std::filesystem;
            fs::create_directories(directory_);

            torch::serialize::OutputArchive archive;
            for (const auto& item : module.named_parameters(/*recurse=*/true)) {
                if (!non_persistent.contains(item.key())) {
                    archive.write(item.key(), item.value());
                }
            }
            for (const auto& item : module.named_buffers(/*recurse=*/true)) {
                if (item.value().defined() && !non_persistent.contains(item.key())) {
                    archive.write(item.key(), item.value(), /*is_buffer=*/true);
                }
            }

            const auto target = filename(step);
            auto temporary = target;
            temporary += ".tmp";
            try {
                archive.save_to(temporary.string());
            } catch (const c10::Error& error) {
                throw std::runtime_error("Failed to write checkpoint '" + temporary.string() + "': " + error.what());
            }
            fs::rename(temporary, target);
            Details::write_atomically(directory_ / kIndexFile, target.filename().string() + "\n");
            prune(target);
            return target;
        }

        // Index file first, then the highest step found on disk.
        [[nodiscard]] std::optional<std::filesystem::path> latest() const
        {
            namespace fs = std::filesystem;
            if (!fs::is_directory(directory_)) {
                return std::nullopt;
            }
            const auto index = directory_ / kIndexFile;
            if (fs::exists(index)) {
                std::ifstream stream(index);
                std::string name;
                if (stream && std::getline(stream, name) && !name.empty()) {
                    const auto path = directory_ / name;
                    if (fs::exists(path)) {
                        return path;
                    }
                }
            }

            std::optional<std::filesystem::path> best;
            std::int64_t best_step = -1;
            for (const auto& entry : fs::directory_iterator(directory_)) {
                const auto step = step_of(entry.path());
                if (step && *step > best_step) {
                    best_step = *step;
                    best = entry.path();
                }
            }
            return best;
        }

        std::filesystem::path restore(torch::nn::Module& module, const NameSet& non_persistent = {}) const
        {
            const auto path = latest();
            if (!path) {
                throw RestoreError("No checkpoint found in '" + directory_.string() + "'.");
            }

            torch::serialize::InputArchive archive;
            try {
                archive.load_from(path->string());
            } catch (const c10::Error& error) {
                throw RestoreError("Failed to open checkpoint '" + path->string() + "': " + error.what());
            }

            torch::NoGradGuard no_grad;
            for (auto& item : module.named_parameters(/*recurse=*/true)) {
                if (!non_persistent.contains(item.key())) {
                    copy(archive, item.key(), item.value(), /*is_buffer=*/false);
                }
            }
            for (auto& item : module.named_buffers(/*recurse=*/true)) {
                if (item.value().defined() && !non_persistent.contains(item.key())) {
                    copy(archive, item.key(), item.value(), /*is_buffer=*/true);
                }
            }
            return *path;
        }

        [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

    private:
        [[nodiscard]] std::optional<std::int64_t> step_of(const std::filesystem::path& path) const
        {
            const std::regex pattern(prefix_ + R"(-(\d+)\.pt)");
            std::smatch match;
            const auto name = path.filename().string();
            if (!std::regex_match(name, match, pattern)) {
                return std::nullopt;
            }
            try {
                return std::stoll(match[1].str());
            } catch (const std::out_of_range&) {
                return std::nullopt;
            }
        }

        void prune(const std::filesystem::path& keep) const
        {
            namespace fs = std::filesystem;
            std::vector<fs::path> stale;
            for (const auto& entry : fs::directory_iterator(directory_)) {
                if (entry.path() != keep && step_of(entry.path())) {
                    stale.push_back(entry.path());
                }
            }
            for (const auto& path : stale) {
                std::error_code error;
                fs::remove(path, error);
                if (error) {
                    throw std::runtime_error("Unable to remove stale checkpoint '" + path.string()
                                             + "': " + error.message());
                }
            }
        }

        static void copy(torch::serialize::InputArchive& archive, const std::string& key,
                         torch::Tensor& target, bool is_buffer)
        {
            const auto kind = std::string(is_buffer ? "buffer" : "parameter");
            torch::Tensor stored;
            try {
                archive.read(key, stored, is_buffer);
            } catch (const c10::Error& error) {
                throw RestoreError("Checkpoint is missing " + kind + " '" + key + "': " + error.what());
            }
            if (!stored.defined()) {
                throw RestoreError("Checkpoint " + kind + " '" + key + "' is undefined.");
            }
            if (stored.sizes() != target.sizes()) {
                throw RestoreError("Checkpoint " + kind + " '" + key + "' shape mismatch: expected "
                                   + Details::format_tensor_shape(target) + " but found "
                                   + Details::format_tensor_shape(stored) + ".");
            }
            target.copy_(stored.to(target.device(), target.scalar_type()));
        }

        std::filesystem::path directory_;
        std::string prefix_;
    };
}

#endif // ARBOR_CHECKPOINT_HPP
