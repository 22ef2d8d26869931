#ifndef VERITAS_NOISE_THRESHOLD_HPP
#define VERITAS_NOISE_THRESHOLD_HPP

#include <cstdint>
#include <limits>
#include <optional>
#include <sstream>
#include <utility>

#include <torch/torch.h>

#include "../../common/errors.hpp"

namespace Veritas::Noise::Details {
    // Labels and probabilities as the estimator consumes them: CPU, contiguous,
    // int64 `[N]` and float64 `[N, K]`.
    struct PixelPopulation {
        torch::Tensor labels{};
        torch::Tensor probs{};

        [[nodiscard]] std::int64_t size() const { return labels.size(0); }
        [[nodiscard]] std::int64_t classes() const { return probs.size(1); }
    };

    inline PixelPopulation prepare_population(const torch::Tensor& labels,
                                              const torch::Tensor& probs,
                                              std::optional<std::int64_t> expected_classes = std::nullopt)
    {
        if (!labels.defined() || !probs.defined()) {
            throw DataShapeError("Noise estimation requires defined label and probability tensors.");
        }
        if (labels.dim() != 1) {
            std::ostringstream message;
            message << "Noisy labels must be a flat [N] tensor, got " << labels.dim() << " dimensions.";
            throw DataShapeError(message.str());
        }
        if (probs.dim() != 2) {
            std::ostringstream message;
            message << "Probabilities must be a [N, K] tensor, got " << probs.dim() << " dimensions.";
            throw DataShapeError(message.str());
        }
        if (labels.size(0) != probs.size(0)) {
            std::ostringstream message;
            message << "Label count (" << labels.size(0) << ") differs from probability row count ("
                    << probs.size(0) << ").";
            throw DataShapeError(message.str());
        }
        if (labels.size(0) == 0) {
            throw DataShapeError("Noise estimation requires at least one pixel.");
        }
        if (probs.size(1) < 1) {
            throw DataShapeError("Probability vectors must have at least one class.");
        }
        if (expected_classes && probs.size(1) != *expected_classes) {
            std::ostringstream message;
            message << "Probability vectors have width " << probs.size(1) << " but " << *expected_classes
                    << " classes are configured.";
            throw DataShapeError(message.str());
        }

        PixelPopulation population{
            labels.to(torch::kCPU, torch::kLong).contiguous(),
            probs.to(torch::kCPU, torch::kDouble).contiguous()
        };

        const auto minimum = population.labels.min().item<std::int64_t>();
        const auto maximum = population.labels.max().item<std::int64_t>();
        if (minimum < 0 || maximum >= population.classes()) {
            std::ostringstream message;
            message << "Noisy labels must lie in [0, " << population.classes() << "), found range ["
                    << minimum << ", " << maximum << "].";
            throw DataShapeError(message.str());
        }
        return population;
    }

    // Number of pixels carrying each noisy label, int64 [K].
    inline torch::Tensor label_counts(const PixelPopulation& population) {
        return torch::bincount(population.labels, /*weights=*/{}, population.classes());
    }

    // t[k] = mean of probs[p][k] over pixels labelled k; +inf when k never occurs,
    // which keeps the class out of reach of confident assignment.
    inline torch::Tensor per_class_thresholds(const PixelPopulation& population) {
        const auto K = population.classes();
        auto self_confidence = population.probs.gather(1, population.labels.unsqueeze(1)).squeeze(1);
        auto sums = torch::bincount(population.labels, self_confidence, K).to(torch::kDouble);
        auto counts = label_counts(population).to(torch::kDouble);
        auto inf = torch::full({K}, std::numeric_limits<double>::infinity(), torch::kDouble);
        return torch::where(counts > 0, sums / counts.clamp_min(1.0), inf);
    }
}

#endif // VERITAS_NOISE_THRESHOLD_HPP
