#ifndef VERITAS_NOISE_CONFIDENT_JOINT_HPP
#define VERITAS_NOISE_CONFIDENT_JOINT_HPP

#include <cstdint>
#include <limits>
#include <optional>

#include <torch/torch.h>

#include "calibration.hpp"
#include "threshold.hpp"

namespace Veritas::Noise::Details {
    // Qij: candidate label restricted to classes meeting their own threshold.
    // Cij: candidate label is the plain arg-max, every pixel participates.
    enum class JointKind { Qij, Cij };

    // Slack on `probs >= t` so that a pixel sitting exactly on the class mean is
    // not lost to rounding in the mean itself.
    inline constexpr double kThresholdTolerance = 1e-6;

    struct JointEstimate {
        JointKind kind{JointKind::Qij};
        torch::Tensor joint{};        // calibrated, int64 [K, K]
        torch::Tensor raw_joint{};    // uncalibrated counts, int64 [K, K]
        torch::Tensor thresholds{};   // float64 [K], +inf for absent classes
        torch::Tensor label_counts{}; // int64 [K]
        std::int64_t assigned{0};     // pixels that contributed to raw_joint

        [[nodiscard]] std::int64_t classes() const { return joint.size(0); }
    };

    struct CandidateLabels {
        torch::Tensor label{};     // int64 [N]
        torch::Tensor confident{}; // bool [N]
    };

    inline CandidateLabels candidate_labels(const PixelPopulation& population, const torch::Tensor& thresholds, JointKind kind) {
        if (kind == JointKind::Cij) {
            return {population.probs.argmax(1), torch::ones({population.size()}, torch::kBool)};
        }
        auto meets = population.probs >= (thresholds - kThresholdTolerance).unsqueeze(0);
        auto masked = population.probs.masked_fill(meets.logical_not(), -std::numeric_limits<double>::infinity());
        // argmax returns the first maximal index, which makes ties deterministic.
        return {masked.argmax(1), meets.any(1)};
    }

    inline torch::Tensor count_joint(const PixelPopulation& population, const CandidateLabels& candidates) {
        const auto K = population.classes();
        auto observed = population.labels.masked_select(candidates.confident);
        auto latent = candidates.label.masked_select(candidates.confident);
        if (observed.numel() == 0) {
            return torch::zeros({K, K}, torch::kLong);
        }
        return torch::bincount(observed * K + latent, /*weights=*/{}, K * K).view({K, K});
    }

    inline JointEstimate estimate_confident_joint(const PixelPopulation& population, JointKind kind) {
        JointEstimate estimate{};
        estimate.kind = kind;
        estimate.thresholds = per_class_thresholds(population);
        estimate.label_counts = label_counts(population);

        const auto candidates = candidate_labels(population, estimate.thresholds, kind);
        estimate.raw_joint = count_joint(population, candidates);
        estimate.assigned = candidates.confident.sum().item<std::int64_t>();
        estimate.joint = calibrate_confident_joint(estimate.raw_joint, estimate.label_counts);
        return estimate;
    }
}

#endif // VERITAS_NOISE_CONFIDENT_JOINT_HPP
