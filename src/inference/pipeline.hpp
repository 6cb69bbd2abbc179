#ifndef ARBOR_INFERENCE_PIPELINE_HPP
#define ARBOR_INFERENCE_PIPELINE_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/errors.hpp"
#include "../data/dataset.hpp"
#include "../utils/logger.hpp"
#include "../utils/progressbar.hpp"
#include "../vocab/vocab.hpp"
#include "cache.hpp"

namespace Arbor::Inference {
    class Predictor {
    public:
        virtual ~Predictor() = default;
        // field -> [B, T+1] predicted indices, position 0 being ROOT.
        [[nodiscard]] virtual std::unordered_map<std::string, torch::Tensor> predict(const Data::Indices& batch) = 0;
    };

    struct Request {
        std::optional<std::filesystem::path> output_dir{};
        std::optional<std::string> output_filename{};
    };

    struct FileReport {
        std::filesystem::path input{};
        std::filesystem::path output{};
        std::size_t sentences{0};
        double seconds{0.0};
    };

    class Pipeline {
    public:
        Pipeline(std::vector<Vocab::VocabPtr> outputs, std::filesystem::path save_dir, Utils::Logger logger = Utils::Logger{nullptr})
            : outputs_(std::move(outputs)), save_dir_(std::move(save_dir)), logger_(std::move(logger)) {}

        // Must run before any file is touched.
        static void validate(std::size_t file_count, const Request& request)
        {
            if (request.output_filename && file_count > 1) {
                throw UsageError("An output filename can only be given for a single input file, got "
                                 + std::to_string(file_count) + " files.");
            }
        }

        [[nodiscard]] std::filesystem::path output_path(const std::filesystem::path& input, const Request& request) const
        {
            const auto name = request.output_filename ? std::filesystem::path(*request.output_filename) : input.filename();
            if (request.output_dir) {
                return *request.output_dir / name;
            }
            auto directory = input.parent_path();
            if (directory.is_absolute()) {
                directory = directory.relative_path();
            }
            return save_dir_ / "parsed" / directory / name;
        }

        std::vector<FileReport> run(Data::Source& source, Predictor& predictor, const Request& request)
        {
            const auto& filenames = source.filenames();
            validate(filenames.size(), request);

            std::vector<FileReport> reports;
            reports.reserve(filenames.size());
            for (std::size_t file = 0; file < filenames.size(); ++file) {
                const auto start = std::chrono::steady_clock::now();
                cache_.clear();

                const auto batches = source.file_batches(file);
                Utils::ProgressBar bar(logger_.enabled(Utils::LogLevel::Debug) ? logger_.stream() : nullptr,
                                       static_cast<std::int64_t>(batches.size()), filenames[file].filename().string());
                for (const auto& batch : batches) {
                    annotate(source, predictor, batch);
                    bar.advance();
                }

                FileReport report;
                report.input = filenames[file];
                report.output = output_path(filenames[file], request);
                report.sentences = cache_.size();
                write(report.output);
                cache_.clear();
                report.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

                std::ostringstream message;
                message << "Parsed " << report.input.string() << " -> " << report.output.string() << " ("
                        << report.sentences << " sentences, " << std::fixed << std::setprecision(2)
                        << report.seconds << "sec)";
                logger_.info(message.str());
                reports.push_back(std::move(report));
            }
            return reports;
        }

        [[nodiscard]] const PredictionCache& cache() const noexcept { return cache_; }

    private:
        void annotate(Data::Source& source, Predictor& predictor, const Data::Indices& batch)
        {
            auto predictions = predictor.predict(batch);
            auto sentences = source.tokens(batch);
            for (const auto& vocab : outputs_) {
                const auto it = predictions.find(vocab->field());
                if (it == predictions.end()) {
                    throw std::runtime_error("Predictor returned nothing for field '" + vocab->field() + "'.");
                }
                const auto values = it->second.to(torch::kCPU, torch::kLong).contiguous();
                auto accessor = values.accessor<std::int64_t, 2>();
                for (std::size_t row = 0; row < sentences.size(); ++row) {
                    auto& tokens = sentences[row].tokens;
                    for (std::size_t position = 0; position < tokens.size(); ++position) {
                        tokens[position][vocab->column()] = vocab->token(
                            accessor[static_cast<std::int64_t>(row)][static_cast<std::int64_t>(position) + 1]);
                    }
                }
            }
            for (std::size_t row = 0; row < sentences.size(); ++row) {
                cache_.store(batch[row], std::move(sentences[row]));
            }
        }

        void write(const std::filesystem::path& path) const
        {
            if (path.has_parent_path()) {
                std::filesystem::create_directories(path.parent_path());
            }
            std::ofstream stream(path, std::ios::trunc);
            if (!stream) {
                throw std::runtime_error("Unable to write parsed output '" + path.string() + "'.");
            }
            cache_.dump(stream);
        }

        std::vector<Vocab::VocabPtr> outputs_;
        std::filesystem::path save_dir_;
        Utils::Logger logger_;
        PredictionCache cache_{};
    };
}

#endif // ARBOR_INFERENCE_PIPELINE_HPP
