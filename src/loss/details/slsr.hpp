#ifndef VERITAS_LOSS_SLSR_HPP
#define VERITAS_LOSS_SLSR_HPP
#include <sstream>
#include <stdexcept>
#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "reduction.hpp"

namespace Veritas::Loss::Details {
    struct SLSROptions {
        Reduction reduction{Reduction::Mean};
        double epsilon{0.25};
    };

    struct SLSRDescriptor {
        SLSROptions options{};
    };

    /*
     * Spatial label smoothing. Pixels flagged in the confidence map keep
     * 1 - epsilon on their observed class and spread epsilon over the other
     * K - 1 classes; unflagged pixels use the plain one-hot target. Without a
     * confidence map (validation batches) every pixel is unflagged.
     * prediction: logits [B, K, H, W], target: [B, H, W], confidence_map: [B, H, W]
     */
    inline torch::Tensor compute(const SLSRDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target,
                                 const torch::Tensor& confidence_map) {
        const auto epsilon = descriptor.options.epsilon;
        if (epsilon < 0.0 || epsilon > 1.0) {
            std::ostringstream message;
            message << "SLSR epsilon must lie within [0, 1], got " << epsilon << ".";
            throw std::invalid_argument(message.str());
        }
        if (confidence_map.defined() && confidence_map.sizes() != target.sizes()) {
            std::ostringstream message;
            message << "Confidence map shape " << confidence_map.sizes() << " differs from label shape " << target.sizes() << ".";
            throw DataShapeError(message.str());
        }

        const auto K = prediction.size(1);
        auto labels = target.to(prediction.device(), torch::kLong);
        auto one_hot = torch::nn::functional::one_hot(labels, K).permute({0, 3, 1, 2}).to(prediction.scalar_type());

        const double off_value = K > 1 ? epsilon / static_cast<double>(K - 1) : 0.0;
        auto soft_target = one_hot;
        if (confidence_map.defined()) {
            auto smoothed = one_hot * (1.0 - epsilon) + (1.0 - one_hot) * off_value;
            auto flagged = confidence_map.to(prediction.device()).gt(0).unsqueeze(1);
            soft_target = torch::where(flagged, smoothed, one_hot);
        }

        auto per_pixel = -(soft_target * torch::log_softmax(prediction, 1)).sum(1);
        return apply_reduction(per_pixel, descriptor.options.reduction);
    }
}
#endif // VERITAS_LOSS_SLSR_HPP
