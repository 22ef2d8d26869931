#ifndef VERITAS_NOISE_PRUNE_HPP
#define VERITAS_NOISE_PRUNE_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <sstream>
#include <vector>

#include <ATen/Parallel.h>
#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "calibration.hpp"
#include "threshold.hpp"

namespace Veritas::Noise::Details {
    enum class PruneRule { ByClass, ByNoiseRate, Both };

    struct PruneOptions {
        // Observed classes with at most this many pixels are never pruned, and
        // pruning leaves at least this many pixels per observed class.
        std::int64_t min_examples_per_class{5};
        // Fraction of the estimated off-diagonal mass that is actually pruned.
        double frac_noise{1.0};
        // When set, probability rows must have exactly this width.
        std::optional<std::int64_t> num_classes{};
    };

    using Buckets = std::vector<std::vector<std::int64_t>>;

    // Pixel indices grouped by noisy label, each group in input order.
    inline Buckets bucket_by_label(const PixelPopulation& population) {
        Buckets buckets(static_cast<std::size_t>(population.classes()));
        auto labels = population.labels.accessor<std::int64_t, 1>();
        for (std::int64_t p = 0; p < population.size(); ++p) {
            buckets[static_cast<std::size_t>(labels[p])].push_back(p);
        }
        return buckets;
    }

    // Top `count` pixels of `candidates` under the strict order `before`.
    template <class Before>
    inline std::vector<std::int64_t> take_first(std::vector<std::int64_t> candidates, std::int64_t count, Before before) {
        const auto limit = static_cast<std::size_t>(std::clamp<std::int64_t>(count, 0, static_cast<std::int64_t>(candidates.size())));
        if (limit == 0) {
            return {};
        }
        std::partial_sort(candidates.begin(), candidates.begin() + static_cast<std::ptrdiff_t>(limit), candidates.end(), before);
        candidates.resize(limit);
        return candidates;
    }

    /*
     * For every off-diagonal cell (i, j) of the prune counts, the C[i][j] pixels
     * observed as i that most look like j are flagged. Order: margin
     * probs[j] - probs[i] descending, then probs[j] descending, then index.
     */
    inline std::vector<std::int64_t> prune_row_by_class(const PixelPopulation& population,
                                                        const torch::Tensor& prune_counts,
                                                        const std::vector<std::int64_t>& bucket,
                                                        std::int64_t i)
    {
        const auto K = population.classes();
        auto probs = population.probs.accessor<double, 2>();
        auto counts = prune_counts.accessor<std::int64_t, 2>();

        std::vector<std::int64_t> flagged;
        for (std::int64_t j = 0; j < K; ++j) {
            if (j == i || counts[i][j] <= 0) {
                continue;
            }
            auto chosen = take_first(bucket, counts[i][j], [&](std::int64_t a, std::int64_t b) {
                const double margin_a = probs[a][j] - probs[a][i];
                const double margin_b = probs[b][j] - probs[b][i];
                if (margin_a != margin_b) return margin_a > margin_b;
                if (probs[a][j] != probs[b][j]) return probs[a][j] > probs[b][j];
                return a < b;
            });
            flagged.insert(flagged.end(), chosen.begin(), chosen.end());
        }
        return flagged;
    }

    /*
     * Row i is pruned in proportion to its estimated noise rate
     * 1 - C[i][i] / sum(C[i]); the least self-confident pixels go first.
     */
    inline std::vector<std::int64_t> prune_row_by_noise_rate(const PixelPopulation& population,
                                                             const torch::Tensor& prune_counts,
                                                             const std::vector<std::int64_t>& bucket,
                                                             std::int64_t i)
    {
        auto probs = population.probs.accessor<double, 2>();
        auto counts = prune_counts.accessor<std::int64_t, 2>();

        std::int64_t row_total = 0;
        for (std::int64_t j = 0; j < prune_counts.size(1); ++j) {
            row_total += counts[i][j];
        }
        if (row_total <= 0) {
            return {};
        }
        const double noise_rate = 1.0 - static_cast<double>(counts[i][i]) / static_cast<double>(row_total);
        const auto observed = static_cast<std::int64_t>(bucket.size());
        const auto to_prune = std::clamp<std::int64_t>(std::llround(static_cast<double>(observed) * noise_rate), 0, observed);

        return take_first(bucket, to_prune, [&](std::int64_t a, std::int64_t b) {
            if (probs[a][i] != probs[b][i]) return probs[a][i] < probs[b][i];
            return a < b;
        });
    }

    inline torch::Tensor prune_population(const PixelPopulation& population,
                                          const torch::Tensor& joint,
                                          PruneRule rule,
                                          const PruneOptions& options)
    {
        const auto K = population.classes();
        if (joint.dim() != 2 || joint.size(0) != K || joint.size(1) != K) {
            std::ostringstream message;
            message << "Confident joint must be [" << K << ", " << K << "] to match the probability width.";
            throw DataShapeError(message.str());
        }

        const auto prune_counts = keep_at_least_n_per_class(joint, options.min_examples_per_class, options.frac_noise);
        const auto buckets = bucket_by_label(population);

        // Each class writes only its own slot; the union below stays sequential so
        // the result does not depend on scheduling.
        std::vector<std::vector<std::int64_t>> flagged(static_cast<std::size_t>(K));
        at::parallel_for(0, K, 1, [&](std::int64_t begin, std::int64_t end) {
            for (std::int64_t i = begin; i < end; ++i) {
                const auto& bucket = buckets[static_cast<std::size_t>(i)];
                if (static_cast<std::int64_t>(bucket.size()) <= options.min_examples_per_class) {
                    continue;
                }
                auto& slot = flagged[static_cast<std::size_t>(i)];
                if (rule == PruneRule::ByClass || rule == PruneRule::Both) {
                    auto by_class = prune_row_by_class(population, prune_counts, bucket, i);
                    slot.insert(slot.end(), by_class.begin(), by_class.end());
                }
                if (rule == PruneRule::ByNoiseRate || rule == PruneRule::Both) {
                    auto by_rate = prune_row_by_noise_rate(population, prune_counts, bucket, i);
                    slot.insert(slot.end(), by_rate.begin(), by_rate.end());
                }
            }
        });

        auto mask = torch::zeros({population.size()}, torch::kBool);
        auto out = mask.accessor<bool, 1>();
        for (const auto& slot : flagged) {
            for (const auto index : slot) {
                out[index] = true;
            }
        }
        return mask;
    }
}

#endif // VERITAS_NOISE_PRUNE_HPP
