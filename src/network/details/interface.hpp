#ifndef VERITAS_NETWORK_INTERFACE_HPP
#define VERITAS_NETWORK_INTERFACE_HPP

#include <string>

#include <torch/torch.h>

namespace Veritas::Network::Details {
    // images [B, C, H, W] -> logits [B, K, H, W]
    class PlainNetwork : public torch::nn::Module {
    public:
        virtual torch::Tensor forward(const torch::Tensor& images) = 0;
        [[nodiscard]] virtual std::string kind() const = 0;
    };

    struct WeightedLogits {
        torch::Tensor logits{};  // [B, K, H, W]
        torch::Tensor weights{}; // [B], sums to 1 over the batch
    };

    // images [B, C, H, W], labels [B, H, W] -> logits plus per-sample weights
    class LabelGuidedNetwork : public torch::nn::Module {
    public:
        virtual WeightedLogits forward(const torch::Tensor& images, const torch::Tensor& labels) = 0;
        // Segmentation branch alone, used when no labels are available.
        virtual torch::Tensor segment(const torch::Tensor& images) = 0;
        [[nodiscard]] virtual std::string kind() const = 0;
    };
}

#endif // VERITAS_NETWORK_INTERFACE_HPP
