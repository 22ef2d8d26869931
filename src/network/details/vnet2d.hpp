#ifndef VERITAS_NETWORK_VNET2D_HPP
#define VERITAS_NETWORK_VNET2D_HPP

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "interface.hpp"

namespace Veritas::Network::Details {
    inline torch::nn::Sequential make_conv_block(std::int64_t in_channels, std::int64_t out_channels) {
        return torch::nn::Sequential(
            torch::nn::Conv2d(torch::nn::Conv2dOptions(in_channels, out_channels, 3).padding(1)),
            torch::nn::BatchNorm2d(out_channels),
            torch::nn::ReLU(torch::nn::ReLUOptions(true)),
            torch::nn::Conv2d(torch::nn::Conv2dOptions(out_channels, out_channels, 3).padding(1)),
            torch::nn::BatchNorm2d(out_channels),
            torch::nn::ReLU(torch::nn::ReLUOptions(true)));
    }

    // Resizes a decoder feature map onto the spatial size of its skip connection
    // when odd input sizes made the down/up path lose a row or column.
    inline torch::Tensor match_spatial(const torch::Tensor& input, const torch::Tensor& reference) {
        if (input.size(2) == reference.size(2) && input.size(3) == reference.size(3)) {
            return input;
        }
        namespace F = torch::nn::functional;
        return F::interpolate(input,
                              F::InterpolateFuncOptions()
                                  .size(std::vector<std::int64_t>{reference.size(2), reference.size(3)})
                                  .mode(torch::kBilinear)
                                  .align_corners(false));
    }

    /*
     * Two-level encoder/decoder with strided-convolution down sampling,
     * transposed-convolution up sampling and concatenated skip connections.
     */
    class VNet2dImpl : public PlainNetwork {
    public:
        VNet2dImpl(std::int64_t in_channels, std::int64_t out_channels, std::int64_t base_channels = 16)
            : in_channels_(in_channels), out_channels_(out_channels)
        {
            if (in_channels <= 0 || out_channels <= 0 || base_channels <= 0) {
                std::ostringstream message;
                message << "VNet2d requires positive channel counts, got in=" << in_channels
                        << ", out=" << out_channels << ", base=" << base_channels << ".";
                throw std::invalid_argument(message.str());
            }
            const auto b = base_channels;
            encoder1_ = register_module("encoder1", make_conv_block(in_channels, b));
            down1_ = register_module("down1", torch::nn::Conv2d(torch::nn::Conv2dOptions(b, 2 * b, 2).stride(2)));
            encoder2_ = register_module("encoder2", make_conv_block(2 * b, 2 * b));
            down2_ = register_module("down2", torch::nn::Conv2d(torch::nn::Conv2dOptions(2 * b, 4 * b, 2).stride(2)));
            bottom_ = register_module("bottom", make_conv_block(4 * b, 4 * b));
            up2_ = register_module("up2", torch::nn::ConvTranspose2d(torch::nn::ConvTranspose2dOptions(4 * b, 2 * b, 2).stride(2)));
            decoder2_ = register_module("decoder2", make_conv_block(4 * b, 2 * b));
            up1_ = register_module("up1", torch::nn::ConvTranspose2d(torch::nn::ConvTranspose2dOptions(2 * b, b, 2).stride(2)));
            decoder1_ = register_module("decoder1", make_conv_block(2 * b, b));
            head_ = register_module("head", torch::nn::Conv2d(torch::nn::Conv2dOptions(b, out_channels, 1)));
        }

        torch::Tensor forward(const torch::Tensor& images) override {
            if (images.dim() != 4 || images.size(1) != in_channels_) {
                std::ostringstream message;
                message << "VNet2d expects images [B, " << in_channels_ << ", H, W], got " << images.sizes() << ".";
                throw std::invalid_argument(message.str());
            }
            auto level1 = encoder1_->forward(images);
            auto level2 = encoder2_->forward(down1_->forward(level1));
            auto deepest = bottom_->forward(down2_->forward(level2));

            auto up = match_spatial(up2_->forward(deepest), level2);
            auto decoded = decoder2_->forward(torch::cat({up, level2}, 1));
            up = match_spatial(up1_->forward(decoded), level1);
            decoded = decoder1_->forward(torch::cat({up, level1}, 1));
            return head_->forward(decoded);
        }

        [[nodiscard]] std::string kind() const override { return "VNet2d"; }
        [[nodiscard]] std::int64_t in_channels() const { return in_channels_; }
        [[nodiscard]] std::int64_t out_channels() const { return out_channels_; }

    private:
        std::int64_t in_channels_{};
        std::int64_t out_channels_{};
        torch::nn::Sequential encoder1_{nullptr};
        torch::nn::Conv2d down1_{nullptr};
        torch::nn::Sequential encoder2_{nullptr};
        torch::nn::Conv2d down2_{nullptr};
        torch::nn::Sequential bottom_{nullptr};
        torch::nn::ConvTranspose2d up2_{nullptr};
        torch::nn::Sequential decoder2_{nullptr};
        torch::nn::ConvTranspose2d up1_{nullptr};
        torch::nn::Sequential decoder1_{nullptr};
        torch::nn::Conv2d head_{nullptr};
    };
}

#endif // VERITAS_NETWORK_VNET2D_HPP
