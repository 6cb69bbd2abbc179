#ifndef ARBOR_COMMON_ERRORS_HPP
#define ARBOR_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Arbor {
    // Declared and supplied components disagree, or a configured name does not resolve.
    class ConfigurationError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Two composed sub-networks hold distinct instances of a vocabulary that must be shared.
    class ConsistencyError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class UsageError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    class RestoreError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Never escapes Training::Loop::run.
    class InterruptedRun : public std::runtime_error {
    public:
        InterruptedRun() : std::runtime_error("Training interrupted.") {}
    };
}

#endif // ARBOR_COMMON_ERRORS_HPP
