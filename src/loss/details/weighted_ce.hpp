#ifndef VERITAS_LOSS_WEIGHTED_CE_HPP
#define VERITAS_LOSS_WEIGHTED_CE_HPP
#include <sstream>
#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "reduction.hpp"

namespace Veritas::Loss::Details {
    struct WeightedCrossEntropyOptions {
        Reduction reduction{Reduction::Mean};
    };

    struct WeightedCrossEntropyDescriptor {
        WeightedCrossEntropyOptions options{};
    };

    // Per-sample mean cross entropy, weighted by the network's per-sample weights [B].
    inline torch::Tensor compute(const WeightedCrossEntropyDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target,
                                 const torch::Tensor& sample_weights) {
        if (!sample_weights.defined() || sample_weights.numel() != prediction.size(0)) {
            std::ostringstream message;
            message << "Weighted cross entropy needs one weight per sample (batch of " << prediction.size(0) << ").";
            throw DataShapeError(message.str());
        }
        auto opts = torch::nn::functional::CrossEntropyFuncOptions{}.reduction(torch::kNone);
        auto per_pixel = torch::nn::functional::cross_entropy(prediction, target.to(prediction.device(), torch::kLong), opts);
        auto per_sample = per_pixel.flatten(1).mean(1);
        return apply_reduction_weighted(per_sample, sample_weights.reshape({-1}), descriptor.options.reduction);
    }
}
#endif // VERITAS_LOSS_WEIGHTED_CE_HPP
