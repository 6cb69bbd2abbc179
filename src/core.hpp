#ifndef ARBOR_CORE_HPP
#define ARBOR_CORE_HPP
/*
 * Core orchestrator of the parser.
 * ---------------------------------------------------------------------------
 * Responsibilities:
 *  - Validate the input networks a configured network class declares against
 *    the ones it is handed, then resolve its vocabularies through the registry
 *    so that every network of a composition shares one instance per class.
 *  - Own the LibTorch model of the network and expose its encoder output as a
 *    frozen feature source for dependent networks.
 *  - Wire the Train/Dev/Inference graphs, the dual optimizer, the checkpoint
 *    manager and the inference pipeline into the training loop (train) or the
 *    batched file parser (parse).
 *  - Build whole compositions from the configuration (assemble).
 */

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "checkpoint/checkpoint.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "data/dataset.hpp"
#include "evaluation/evaluation.hpp"
#include "inference/pipeline.hpp"
#include "model/graph.hpp"
#include "model/model.hpp"
#include "optimizer/optimizer.hpp"
#include "training/training.hpp"
#include "utils/logger.hpp"
#include "vocab/vocab.hpp"

namespace Arbor {
    namespace Core {
        // `cpu`, `cuda` or `auto`; read from the network section with DEFAULT fallback.
        [[nodiscard]] inline torch::Device select_device(const Common::Config& config, const std::string& section)
        {
            const auto name = Common::Detail::to_lower(config.get_string(section, "device", "cpu"));
            if (name == "cpu") {
                return torch::Device(torch::kCPU);
            }
            if (name == "cuda") {
                if (!torch::cuda::is_available()) {
                    throw ConfigurationError("CUDA device requested in [" + section + "] but is unavailable.");
                }
                return torch::Device(torch::kCUDA);
            }
            if (name == "auto") {
                return torch::cuda::is_available() ? torch::Device(torch::kCUDA) : torch::Device(torch::kCPU);
            }
            throw ConfigurationError("Unknown device '" + name + "' in [" + section + "].");
        }

        namespace Details {
            inline std::string join(const std::vector<std::string>& values)
            {
                std::ostringstream stream;
                stream << '[';
                for (std::size_t index = 0; index < values.size(); ++index) {
                    if (index > 0) {
                        stream << ", ";
                    }
                    stream << values[index];
                }
                stream << ']';
                return stream.str();
            }

            // Runs a graph over rows of a source for the inference pipeline.
            class GraphPredictor : public Inference::Predictor {
            public:
                GraphPredictor(Model::Graph& graph, const Data::Source& source, torch::Device device)
                    : graph_(graph), source_(source), device_(device) {}

                [[nodiscard]] std::unordered_map<std::string, torch::Tensor> predict(const Data::Indices& batch) override
                {
                    auto outputs = graph_.run(source_.tensors(batch).to(device_));
                    return std::move(outputs.predictions);
                }

            private:
                Model::Graph& graph_;
                const Data::Source& source_;
                torch::Device device_;
            };

            // Training::Runner over real datasets and graphs.
            class Session : public Training::Runner {
            public:
                struct Parts {
                    Data::Dataset* train{nullptr};
                    Data::Dataset* dev{nullptr};
                    std::vector<Data::Dataset*> parse_targets{};
                    Model::Graph* train_graph{nullptr};
                    Model::Graph* dev_graph{nullptr};
                    Model::Graph* inference_graph{nullptr};
                    Optimizer::Dual* optimizer{nullptr};
                    Checkpoint::Manager* checkpoints{nullptr};
                    Inference::Pipeline* pipeline{nullptr};
                    torch::Device device{torch::kCPU};
                };

                Session(Parts parts, Utils::Logger logger) : parts_(std::move(parts)), logger_(std::move(logger)) {}

                [[nodiscard]] std::vector<Data::Indices> shuffled_batches() override
                {
                    return parts_.train->shuffled_batches();
                }

                Evaluation::Accuracies train_step(const Data::Indices& batch, Optimizer::Kind optimizer) override
                {
                    auto outputs = parts_.train_graph->run(parts_.train->tensors(batch).to(parts_.device));
                    parts_.optimizer->step(outputs.loss, optimizer);
                    return Evaluation::accuracies(outputs.counts);
                }

                Training::Sweep evaluate() override
                {
                    Evaluation::Accumulator accumulator;
                    for (const auto& batch : Data::sequential_batches(*parts_.dev)) {
                        Training::InterruptGuard::poll();
                        auto outputs = parts_.dev_graph->run(parts_.dev->tensors(batch).to(parts_.device));
                        accumulator.add(outputs.counts, outputs.loss.item<double>());
                    }
                    return Training::Sweep{
                        accumulator.accuracies(),
                        accumulator.accuracy(),
                        accumulator.loss(),
                        accumulator.seconds(),
                    };
                }

                void save_checkpoint(const Training::State& state) override
                {
                    const auto path = parts_.checkpoints->save(*parts_.train_graph->model(), state.step);
                    logger_.debug("Saved checkpoint " + path.string());
                }

                void parse_datasets() override
                {
                    for (auto* dataset : parts_.parse_targets) {
                        GraphPredictor predictor(*parts_.inference_graph, *dataset, parts_.device);
                        parts_.pipeline->run(*dataset, predictor, Inference::Request{});
                    }
                }

            private:
                Parts parts_;
                Utils::Logger logger_;
            };
        }
    }

    // One configured network class. Its configuration section carries the
    // class name; input networks are other, previously trained, classes.
    class Network : public Model::FeatureSource {
    public:
        using Ptr = std::shared_ptr<Network>;

        // Without a registry the network resolves against one of its own; the
        // input networks it is handed must then agree on every shared class.
        Network(std::string classname, std::vector<Ptr> input_networks, Common::Config config, Utils::Logger logger = {},
                std::shared_ptr<Vocab::Registry> registry = nullptr)
            : classname_(std::move(classname)),
              input_networks_(std::move(input_networks)),
              config_(std::move(config)),
              logger_(std::move(logger))
        {
            validate_input_networks();
            if (!registry) {
                registry = std::make_shared<Vocab::Registry>(config_);
            }

            Vocab::Declaration declaration;
            declaration.input = Vocab::parse_types(config_.get_list(classname_, "input_vocab_classes", {}));
            declaration.output = Vocab::parse_types(config_.get_list(classname_, "output_vocab_classes", {}));
            declaration.throughput = Vocab::parse_types(config_.get_list(classname_, "throughput_vocab_classes", {}));

            std::vector<std::vector<Vocab::VocabPtr>> sub_model_vocabs;
            sub_model_vocabs.reserve(input_networks_.size());
            for (const auto& network : input_networks_) {
                sub_model_vocabs.push_back(network->vocabs().all);
            }
            auto corpus = [config = config_, section = classname_]() {
                return config.get_files(section, "train_conllus");
            };
            vocabs_ = Vocab::resolve(declaration, sub_model_vocabs, *registry, std::move(corpus));

            options_ = Model::options_from_config(config_, classname_);
            save_dir_ = config_.get_string(classname_, "save_dir");
            device_ = Core::select_device(config_, classname_);
            data_options_.batch_size = static_cast<std::size_t>(positive("batch_size", 32));
            data_options_.seed = static_cast<std::uint64_t>(config_.get_int(classname_, "seed", 0));
            logger_.debug(classname_ + ": " + std::to_string(vocabs_.all.size()) + " vocabularies resolved.");
        }

        [[nodiscard]] const std::string& classname() const override { return classname_; }
        [[nodiscard]] std::int64_t feature_size() const override { return options_.output_size; }

        [[nodiscard]] torch::Tensor features(const Data::Batch& batch) override
        {
            ensure_model();
            torch::NoGradGuard no_grad;
            model_->eval();
            std::vector<torch::Tensor> inputs;
            inputs.reserve(input_networks_.size());
            for (const auto& network : input_networks_) {
                inputs.push_back(network->features(batch));
            }
            return model_->encode(batch, inputs);
        }

        Training::StopReason train()
        {
            logger_.info("Training " + classname_ + " into " + save_dir_.string());
            torch::manual_seed(data_options_.seed);
            restore_input_networks();
            ensure_model();

            const auto budget = Training::Budget::from_config(config_, classname_);
            Data::Dataset train_set(config_.get_files(classname_, "train_conllus"), vocabs_.all, data_options_);
            Data::Dataset dev_set(config_.get_files(classname_, "dev_conllus"), vocabs_.all, data_options_);
            std::optional<Data::Dataset> test_set;
            if (const auto test_files = config_.get_files(classname_, "test_conllus", {}); !test_files.empty()) {
                test_set.emplace(test_files, vocabs_.all, data_options_);
            }
            logger_.info(std::to_string(train_set.size()) + " training and " + std::to_string(dev_set.size())
                         + " development sentences.");

            const auto l2_reg = config_.get_float(classname_, "l2_reg", 0.0);
            auto train_graph = Model::build(Model::Mode::Train, model_, feature_sources(), l2_reg);
            auto dev_graph = Model::build(Model::Mode::Dev, model_, feature_sources());
            auto inference_graph = Model::build(Model::Mode::Inference, model_, feature_sources());
            Optimizer::Dual optimizer(model_->parameters(), Optimizer::dual_options_from_config(config_));
            Checkpoint::Manager checkpoints(save_dir_);
            Inference::Pipeline pipeline(vocabs_.output, save_dir_, logger_);

            Core::Details::Session::Parts parts;
            parts.train = &train_set;
            parts.dev = &dev_set;
            parts.parse_targets.push_back(&dev_set);
            if (test_set) {
                parts.parse_targets.push_back(&*test_set);
            }
            parts.train_graph = &train_graph;
            parts.dev_graph = &dev_graph;
            parts.inference_graph = &inference_graph;
            parts.optimizer = &optimizer;
            parts.checkpoints = &checkpoints;
            parts.pipeline = &pipeline;
            parts.device = device_;
            Core::Details::Session session(std::move(parts), logger_);

            Training::Loop loop(budget, save_dir_, logger_);
            loop.add_observer(std::make_shared<Training::TextLog>(logger_));
            return loop.run(session);
        }

        std::vector<Inference::FileReport> parse(const std::vector<std::filesystem::path>& files,
                                                 std::optional<std::filesystem::path> output_dir = std::nullopt,
                                                 std::optional<std::string> output_filename = std::nullopt)
        {
            Inference::Request request{std::move(output_dir), std::move(output_filename)};
            Inference::Pipeline::validate(files.size(), request);

            restore(save_dir_);
            Data::Dataset source(files, vocabs_.all, data_options_);
            auto graph = Model::build(Model::Mode::Inference, model_, feature_sources());
            Core::Details::GraphPredictor predictor(graph, source, device_);
            Inference::Pipeline pipeline(vocabs_.output, save_dir_, logger_);
            return pipeline.run(source, predictor, request);
        }

        // Input networks first, each from `<classname>:<Input>_dir` or its own save_dir.
        void restore(const std::filesystem::path& directory)
        {
            restore_input_networks();
            ensure_model();
            const auto path = Checkpoint::Manager(directory).restore(*model_);
            logger_.debug(classname_ + " restored from " + path.string());
        }

        [[nodiscard]] const Vocab::Resolution& vocabs() const noexcept { return vocabs_; }
        [[nodiscard]] const std::vector<Ptr>& input_networks() const noexcept { return input_networks_; }
        [[nodiscard]] const std::filesystem::path& save_dir() const noexcept { return save_dir_; }
        [[nodiscard]] const Model::Options& options() const noexcept { return options_; }
        [[nodiscard]] const Common::Config& config() const noexcept { return config_; }
        [[nodiscard]] torch::Device device() const noexcept { return device_; }

        [[nodiscard]] Model::Model& model()
        {
            ensure_model();
            return model_;
        }

        // Builds `classname` and, recursively, every input network it declares.
        // A class shared by several dependents is constructed once, and every
        // network of the composition resolves through one vocabulary registry.
        [[nodiscard]] static Ptr assemble(const std::string& classname, const Common::Config& config, Utils::Logger logger = {})
        {
            std::map<std::string, Ptr> built;
            std::vector<std::string> path;
            const auto registry = std::make_shared<Vocab::Registry>(config);
            return assemble(classname, config, logger, registry, built, path);
        }

    private:
        static Ptr assemble(const std::string& classname, const Common::Config& config, const Utils::Logger& logger,
                            const std::shared_ptr<Vocab::Registry>& registry, std::map<std::string, Ptr>& built,
                            std::vector<std::string>& path)
        {
            if (const auto it = built.find(classname); it != built.end()) {
                return it->second;
            }
            if (std::find(path.begin(), path.end(), classname) != path.end()) {
                throw ConfigurationError("Input networks of " + classname + " form a cycle.");
            }
            path.push_back(classname);
            std::vector<Ptr> inputs;
            for (const auto& input : config.get_list(classname, "input_network_classes", {})) {
                inputs.push_back(assemble(input, config, logger, registry, built, path));
            }
            path.pop_back();

            auto network = std::make_shared<Network>(classname, std::move(inputs), config, logger, registry);
            built.emplace(classname, network);
            return network;
        }

        void validate_input_networks() const
        {
            auto declared = config_.get_list(classname_, "input_network_classes", {});
            std::vector<std::string> supplied;
            supplied.reserve(input_networks_.size());
            for (const auto& network : input_networks_) {
                if (!network) {
                    throw std::invalid_argument(classname_ + " received a null input network.");
                }
                supplied.push_back(network->classname());
            }
            auto declared_sorted = declared;
            auto supplied_sorted = supplied;
            std::sort(declared_sorted.begin(), declared_sorted.end());
            std::sort(supplied_sorted.begin(), supplied_sorted.end());
            if (declared_sorted != supplied_sorted) {
                throw ConfigurationError(classname_ + " declares input networks " + Core::Details::join(declared)
                                         + " but was given " + Core::Details::join(supplied) + ".");
            }
        }

        [[nodiscard]] std::int64_t positive(const std::string& key, std::int64_t fallback) const
        {
            const auto value = config_.get_int(classname_, key, fallback);
            if (value <= 0) {
                throw ConfigurationError("Option '" + key + "' in [" + classname_ + "] must be positive.");
            }
            return value;
        }

        void ensure_model()
        {
            if (!model_.is_empty()) {
                return;
            }
            std::int64_t feature_size = 0;
            for (const auto& network : input_networks_) {
                feature_size += network->feature_size();
            }
            model_ = Model::Model(options_, vocabs_.input, vocabs_.output, feature_size);
            model_->to(device_);
        }

        void restore_input_networks()
        {
            for (const auto& network : input_networks_) {
                if (network->frozen_) {
                    continue;
                }
                const auto key = network->classname() + "_dir";
                const auto directory = config_.has(classname_, key)
                    ? std::filesystem::path(config_.get_string(classname_, key))
                    : network->save_dir();
                network->restore(directory);
                network->freeze();
            }
        }

        void freeze()
        {
            ensure_model();
            for (auto& parameter : model_->parameters()) {
                parameter.set_requires_grad(false);
            }
            model_->eval();
            frozen_ = true;
        }

        [[nodiscard]] std::vector<Model::FeatureSourcePtr> feature_sources() const
        {
            return std::vector<Model::FeatureSourcePtr>(input_networks_.begin(), input_networks_.end());
        }

        std::string classname_;
        std::vector<Ptr> input_networks_;
        Common::Config config_;
        Utils::Logger logger_;
        Vocab::Resolution vocabs_{};
        Model::Options options_{};
        std::filesystem::path save_dir_{};
        torch::Device device_{torch::kCPU};
        Data::Options data_options_{};
        Model::Model model_{nullptr};
        bool frozen_{false};
    };
}

#endif // ARBOR_CORE_HPP
