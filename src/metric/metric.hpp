#ifndef VERITAS_METRIC_HPP
#define VERITAS_METRIC_HPP

#include <cstdint>
#include <sstream>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/errors.hpp"

namespace Veritas::Metric {
    namespace Details {
        inline double safe_div(double num, double den) {
            constexpr double kEps = 1e-12;
            return den > kEps ? num / den : 0.0;
        }
    }

    /*
     * Per-class Dice overlap of arg-max predictions against reference labels,
     * pooled over the whole batch. A class absent from both prediction and
     * reference scores 1.
     */
    class Overlap {
    public:
        explicit Overlap(std::int64_t num_classes) : num_classes_(num_classes) {
            if (num_classes_ < 1) {
                throw ConfigurationError("Overlap metric requires at least one class.");
            }
        }

        [[nodiscard]] std::int64_t classes() const { return num_classes_; }

        // logits: [B, K, H, W], labels: [B, H, W]. Returns (predictions [B, H, W] on CPU, dice[K]).
        [[nodiscard]] std::pair<torch::Tensor, std::vector<double>> score_batch(const torch::Tensor& logits,
                                                                              const torch::Tensor& labels) const {
            if (logits.dim() != 4 || logits.size(1) != num_classes_) {
                std::ostringstream message;
                message << "Overlap metric expects logits [B, " << num_classes_ << ", H, W], got " << logits.sizes() << ".";
                throw DataShapeError(message.str());
            }
            torch::NoGradGuard no_grad;
            auto predictions = logits.detach().argmax(1).to(torch::kCPU, torch::kLong);
            auto reference = labels.to(torch::kCPU, torch::kLong);
            if (predictions.sizes() != reference.sizes()) {
                std::ostringstream message;
                message << "Prediction shape " << predictions.sizes() << " differs from label shape " << reference.sizes() << ".";
                throw DataShapeError(message.str());
            }
            return {predictions, dice(predictions, reference)};
        }

        [[nodiscard]] std::vector<double> dice(const torch::Tensor& predictions, const torch::Tensor& reference) const {
            std::vector<double> scores(static_cast<std::size_t>(num_classes_), 1.0);
            for (std::int64_t k = 0; k < num_classes_; ++k) {
                auto predicted = predictions.eq(k);
                auto expected = reference.eq(k);
                const auto intersection = predicted.logical_and(expected).sum().item<std::int64_t>();
                const auto cardinality = predicted.sum().item<std::int64_t>() + expected.sum().item<std::int64_t>();
                if (cardinality == 0) {
                    continue;
                }
                scores[static_cast<std::size_t>(k)] = Details::safe_div(2.0 * static_cast<double>(intersection),
                                                                        static_cast<double>(cardinality));
            }
            return scores;
        }

    private:
        std::int64_t num_classes_;
    };
}

#endif // VERITAS_METRIC_HPP
