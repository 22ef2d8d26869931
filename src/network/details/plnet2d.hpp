#ifndef VERITAS_NETWORK_PLNET2D_HPP
#define VERITAS_NETWORK_PLNET2D_HPP

#include <cstdint>
#include <memory>
#include <string>

#include <torch/torch.h>

#include "interface.hpp"
#include "vnet2d.hpp"

namespace Veritas::Network::Details {
    /*
     * Pick-and-learn: a VNet2d segmentation branch plus a quality branch that
     * scores each (image, label) pair. Scores are turned into per-sample
     * weights with a softmax over the batch.
     */
    class PLNet2dImpl : public LabelGuidedNetwork {
    public:
        PLNet2dImpl(std::int64_t in_channels, std::int64_t out_channels, std::int64_t base_channels = 16)
            : out_channels_(out_channels)
        {
            segmentation_ = register_module("segmentation",
                                            std::make_shared<VNet2dImpl>(in_channels, out_channels, base_channels));
            const auto b = base_channels;
            quality_ = register_module("quality", torch::nn::Sequential(
                torch::nn::Conv2d(torch::nn::Conv2dOptions(in_channels + out_channels, b, 3).stride(2).padding(1)),
                torch::nn::ReLU(torch::nn::ReLUOptions(true)),
                torch::nn::Conv2d(torch::nn::Conv2dOptions(b, 2 * b, 3).stride(2).padding(1)),
                torch::nn::ReLU(torch::nn::ReLUOptions(true)),
                torch::nn::AdaptiveAvgPool2d(torch::nn::AdaptiveAvgPool2dOptions(1)),
                torch::nn::Flatten(),
                torch::nn::Linear(2 * b, 1)));
        }

        WeightedLogits forward(const torch::Tensor& images, const torch::Tensor& labels) override {
            auto logits = segmentation_->forward(images);
            auto one_hot = torch::nn::functional::one_hot(labels.to(images.device(), torch::kLong), out_channels_)
                               .permute({0, 3, 1, 2})
                               .to(images.scalar_type());
            auto scores = quality_->forward(torch::cat({images, one_hot}, 1)).reshape({-1});
            return {logits, torch::softmax(scores, 0)};
        }

        torch::Tensor segment(const torch::Tensor& images) override {
            return segmentation_->forward(images);
        }

        [[nodiscard]] std::string kind() const override { return "PLNet2d"; }

    private:
        std::int64_t out_channels_{};
        std::shared_ptr<VNet2dImpl> segmentation_{};
        torch::nn::Sequential quality_{nullptr};
    };
}

#endif // VERITAS_NETWORK_PLNET2D_HPP
