// Command-line front end: `arbor train` and `arbor parse`.
#include <cstring>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "../include/Arbor.h"

namespace {
    void print_usage(const char* program) {
        std::cerr << "Usage: " << program << " train --config FILE --network CLASS [--set Section:key=value]...\n";
        std::cerr << "       " << program << " parse --config FILE --network CLASS [--output-dir DIR]\n";
        std::cerr << "             [--output-file NAME] [--set Section:key=value]... FILE...\n";
        std::cerr << "\n";
        std::cerr << "Options:\n";
        std::cerr << "  --config FILE         INI configuration file\n";
        std::cerr << "  --network CLASS       Network class (configuration section) to run\n";
        std::cerr << "  --set S:k=v           Override option k of section S\n";
        std::cerr << "  --output-dir DIR      Write parsed files into DIR (parse only)\n";
        std::cerr << "  --output-file NAME    Name of the parsed file, single input only (parse only)\n";
        std::cerr << "  --help                Print this help message\n";
    }

    struct Arguments {
        std::string command{};
        std::string config{};
        std::string network{};
        std::vector<std::string> overrides{};
        std::optional<std::filesystem::path> output_dir{};
        std::optional<std::string> output_file{};
        std::vector<std::filesystem::path> files{};
    };
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }
    if (std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0) {
        print_usage(argv[0]);
        return 0;
    }

    Arguments arguments;
    arguments.command = argv[1];
    if (arguments.command != "train" && arguments.command != "parse") {
        std::cerr << "Error: unknown command '" << arguments.command << "'\n\n";
        print_usage(argv[0]);
        return 1;
    }
    const bool parsing = arguments.command == "parse";

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            arguments.config = argv[++i];
        } else if (arg == "--network" && i + 1 < argc) {
            arguments.network = argv[++i];
        } else if (arg == "--set" && i + 1 < argc) {
            arguments.overrides.emplace_back(argv[++i]);
        } else if (parsing && arg == "--output-dir" && i + 1 < argc) {
            arguments.output_dir = argv[++i];
        } else if (parsing && arg == "--output-file" && i + 1 < argc) {
            arguments.output_file = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (parsing && !arg.empty() && arg.front() != '-') {
            arguments.files.emplace_back(arg);
        } else {
            std::cerr << "Error: unknown option '" << arg << "'\n\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (arguments.config.empty() || arguments.network.empty()) {
        std::cerr << "Error: --config and --network are required\n\n";
        print_usage(argv[0]);
        return 1;
    }
    if (parsing && arguments.files.empty()) {
        std::cerr << "Error: parse expects at least one input file\n\n";
        print_usage(argv[0]);
        return 1;
    }

    const Arbor::Utils::Logger errors(&std::cerr);
    try {
        auto config = Arbor::Common::Config::from_file(arguments.config);
        for (const auto& assignment : arguments.overrides) {
            config.apply_override(assignment);
        }
        const auto logger = Arbor::Utils::Logger::from_config(config, &std::cout);
        auto network = Arbor::Network::assemble(arguments.network, config, logger);

        if (parsing) {
            const auto reports = network->parse(arguments.files, arguments.output_dir, arguments.output_file);
            logger.success("Parsed " + std::to_string(reports.size()) + " file(s).");
        } else {
            const auto reason = network->train();
            logger.success(std::string("Training stopped: ") + std::string(Arbor::Training::to_string(reason)) + ".");
        }
    } catch (const Arbor::UsageError& error) {
        errors.error(error.what());
        print_usage(argv[0]);
        return 1;
    } catch (const std::exception& error) {
        errors.error(error.what());
        return 1;
    }
    return 0;
}
