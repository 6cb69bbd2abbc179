#ifndef ARBOR_ACTIVATION_HPP
#define ARBOR_ACTIVATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "apply.hpp"

#include <array>
#include <string>
#include <string_view>
#include <utility>

#include "../common/errors.hpp"

namespace Arbor::Activation {
    enum class Type {
        Identity,
        ReLU,
        LeakyReLU,
        Tanh,
        Sigmoid,
        GeLU,
        SiLU,
        Softplus,
    };

    struct Descriptor {
        Type type{Type::Identity};
    };

    inline constexpr Descriptor Identity{Type::Identity};
    inline constexpr Descriptor ReLU{Type::ReLU};
    inline constexpr Descriptor LeakyReLU{Type::LeakyReLU};
    inline constexpr Descriptor Tanh{Type::Tanh};
    inline constexpr Descriptor Sigmoid{Type::Sigmoid};
    inline constexpr Descriptor GeLU{Type::GeLU};
    inline constexpr Descriptor SiLU{Type::SiLU};
    inline constexpr Descriptor Softplus{Type::Softplus};

    inline constexpr std::array<std::pair<std::string_view, Type>, 8> kNames{{
        {"identity", Type::Identity},
        {"relu", Type::ReLU},
        {"leaky_relu", Type::LeakyReLU},
        {"tanh", Type::Tanh},
        {"sigmoid", Type::Sigmoid},
        {"gelu", Type::GeLU},
        {"silu", Type::SiLU},
        {"softplus", Type::Softplus},
    }};

    [[nodiscard]] inline Descriptor from_string(std::string_view name)
    {
        for (const auto& [key, type] : kNames) {
            if (key == name) {
                return Descriptor{type};
            }
        }
        throw ConfigurationError("Unknown nonlinearity '" + std::string(name) + "'.");
    }

    [[nodiscard]] constexpr std::string_view to_string(Type type)
    {
        for (const auto& [key, value] : kNames) {
            if (value == type) {
                return key;
            }
        }
        return "identity";
    }
}

#endif // ARBOR_ACTIVATION_HPP
