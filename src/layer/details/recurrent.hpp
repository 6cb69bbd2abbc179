#ifndef ARBOR_RECURRENT_HPP
#define ARBOR_RECURRENT_HPP

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

#include <torch/torch.h>

#include "../../common/errors.hpp"


namespace Arbor::Layer::Details {

    enum class Cell {
        RNN,
        GRU,
        LSTM,
    };

    inline constexpr std::array<std::pair<std::string_view, Cell>, 3> kCellNames{{
        {"rnn", Cell::RNN},
        {"gru", Cell::GRU},
        {"lstm", Cell::LSTM},
    }};

    [[nodiscard]] inline Cell cell_from_string(std::string_view name)
    {
        for (const auto& [key, cell] : kCellNames) {
            if (key == name) {
                return cell;
            }
        }
        throw ConfigurationError("Unknown recurrent cell '" + std::string(name) + "'.");
    }

    // -------- Options --------
    struct RecurrentOptions {
        std::int64_t input_size{};
        std::int64_t hidden_size{};
        std::int64_t num_layers{1};
        double dropout{0.0};
        bool bidirectional{false};
        Cell cell{Cell::LSTM};
    };

    // -------- Internal detail helpers --------
    namespace Detail {
        inline torch::nn::RNNOptions to_torch_rnn_options(const RecurrentOptions& o)
        {
            auto options = torch::nn::RNNOptions(o.input_size, o.hidden_size);
            options = options.num_layers(o.num_layers);
            options = options.dropout(o.num_layers > 1 ? o.dropout : 0.0);
            options = options.batch_first(true);
            options = options.bidirectional(o.bidirectional);
            options = options.nonlinearity(torch::kTanh);
            return options;
        }

        inline torch::nn::GRUOptions to_torch_gru_options(const RecurrentOptions& o)
        {
            auto options = torch::nn::GRUOptions(o.input_size, o.hidden_size);
            options = options.num_layers(o.num_layers);
            options = options.dropout(o.num_layers > 1 ? o.dropout : 0.0);
            options = options.batch_first(true);
            options = options.bidirectional(o.bidirectional);
            return options;
        }

        inline torch::nn::LSTMOptions to_torch_lstm_options(const RecurrentOptions& o) {
            torch::nn::LSTMOptions opt(o.input_size, o.hidden_size);
            opt = opt.num_layers(o.num_layers);
            opt = opt.dropout(o.num_layers > 1 ? o.dropout : 0.0);
            opt = opt.batch_first(true);
            opt = opt.bidirectional(o.bidirectional);
            return opt;
        }
    } // namespace Detail

    // Multi-layer recurrent encoder over padded [B, T, F] input. Sequences are
    // packed by their true lengths so padding never leaks into the states.
    class RecurrentImpl : public torch::nn::Module {
    public:
        explicit RecurrentImpl(const RecurrentOptions& options) : options_(options)
        {
            if (options_.input_size <= 0 || options_.hidden_size <= 0 || options_.num_layers <= 0) {
                throw std::invalid_argument("Recurrent layer requires positive input_size, hidden_size and num_layers.");
            }
            switch (options_.cell) {
                case Cell::RNN:
                    rnn_ = register_module("cell", torch::nn::RNN(Detail::to_torch_rnn_options(options_)));
                    break;
                case Cell::GRU:
                    gru_ = register_module("cell", torch::nn::GRU(Detail::to_torch_gru_options(options_)));
                    break;
                case Cell::LSTM:
                    lstm_ = register_module("cell", torch::nn::LSTM(Detail::to_torch_lstm_options(options_)));
                    break;
            }
        }

        torch::Tensor forward(const torch::Tensor& input, const torch::Tensor& lengths)
        {
            if (input.dim() != 3) {
                throw std::invalid_argument("Recurrent layer expects a 3D tensor [B,T,F].");
            }
            const auto total_length = input.size(1);
            auto packed = torch::nn::utils::rnn::pack_padded_sequence(
                input, lengths.to(torch::kCPU, torch::kLong), /*batch_first=*/true, /*enforce_sorted=*/false);

            torch::nn::utils::rnn::PackedSequence encoded;
            switch (options_.cell) {
                case Cell::RNN:
                    encoded = std::get<0>(rnn_->forward_with_packed_input(packed));
                    break;
                case Cell::GRU:
                    encoded = std::get<0>(gru_->forward_with_packed_input(packed));
                    break;
                case Cell::LSTM:
                    encoded = std::get<0>(lstm_->forward_with_packed_input(packed));
                    break;
            }
            auto [output, unused_lengths] = torch::nn::utils::rnn::pad_packed_sequence(
                encoded, /*batch_first=*/true, /*padding_value=*/0.0, total_length);
            return output;
        }

        [[nodiscard]] std::int64_t output_size() const noexcept
        {
            return options_.hidden_size * (options_.bidirectional ? 2 : 1);
        }

        [[nodiscard]] const RecurrentOptions& options() const noexcept { return options_; }

    private:
        RecurrentOptions options_;
        torch::nn::RNN rnn_{nullptr};
        torch::nn::GRU gru_{nullptr};
        torch::nn::LSTM lstm_{nullptr};
    };

    TORCH_MODULE(Recurrent);
}

#endif // ARBOR_RECURRENT_HPP
