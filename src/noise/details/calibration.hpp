#ifndef VERITAS_NOISE_CALIBRATION_HPP
#define VERITAS_NOISE_CALIBRATION_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <numeric>
#include <stdexcept>
#include <vector>

#include <torch/torch.h>

namespace Veritas::Noise::Details {
    // Rounds every row of a non-negative float64 [K, K] matrix to integers whose
    // sum equals the rounded row total. Units go to the largest fractional parts,
    // ties to the lower column index.
    inline torch::Tensor round_preserving_row_totals(const torch::Tensor& matrix) {
        auto source = matrix.to(torch::kCPU, torch::kDouble).contiguous();
        const auto rows = source.size(0);
        const auto cols = source.size(1);
        auto result = torch::zeros({rows, cols}, torch::kLong);

        auto in = source.accessor<double, 2>();
        auto out = result.accessor<std::int64_t, 2>();

        std::vector<double> remainders(static_cast<std::size_t>(cols));
        std::vector<std::int64_t> order(static_cast<std::size_t>(cols));

        for (std::int64_t i = 0; i < rows; ++i) {
            double total = 0.0;
            std::int64_t floored_total = 0;
            for (std::int64_t j = 0; j < cols; ++j) {
                const double value = std::max(in[i][j], 0.0);
                const double floored = std::floor(value);
                total += value;
                out[i][j] = static_cast<std::int64_t>(floored);
                floored_total += out[i][j];
                remainders[static_cast<std::size_t>(j)] = value - floored;
            }

            auto missing = std::llround(total) - floored_total;
            if (missing <= 0) {
                continue;
            }
            std::iota(order.begin(), order.end(), std::int64_t{0});
            std::stable_sort(order.begin(), order.end(), [&](std::int64_t a, std::int64_t b) {
                return remainders[static_cast<std::size_t>(a)] > remainders[static_cast<std::size_t>(b)];
            });
            for (std::size_t k = 0; k < order.size() && missing > 0; ++k, --missing) {
                out[i][order[k]] += 1;
            }
        }
        return result;
    }

    /*
     * Calibrates a raw confident joint against the observed label counts.
     *  1. Each row holding confident mass is rescaled so it sums to the number of
     *     pixels observed with that label; rows without mass stay zero.
     *  2. The matrix is renormalized to the pixel count of the populated rows,
     *     which absorbs floating drift without inflating any row.
     *  3. Rows are rounded back to integers preserving their totals.
     * Row sums therefore equal the observed counts for populated rows and are
     * zero otherwise; column sums become the implied latent-label counts.
     */
    inline torch::Tensor calibrate_confident_joint(const torch::Tensor& raw_joint, const torch::Tensor& counts) {
        auto joint = raw_joint.to(torch::kCPU, torch::kDouble);
        auto observed = counts.to(torch::kCPU, torch::kDouble);
        if (joint.dim() != 2 || joint.size(0) != joint.size(1) || observed.numel() != joint.size(0)) {
            throw std::invalid_argument("Confident joint calibration requires a square [K, K] matrix and K label counts.");
        }

        auto row_sums = joint.sum(1);
        auto populated = row_sums > 0;
        auto scale = torch::where(populated, observed / row_sums.clamp_min(1.0), torch::zeros_like(observed));
        auto calibrated = joint * scale.unsqueeze(1);

        const double target_total = torch::where(populated, observed, torch::zeros_like(observed)).sum().item<double>();
        const double current_total = calibrated.sum().item<double>();
        if (current_total > 0.0) {
            calibrated = calibrated * (target_total / current_total);
        }
        return round_preserving_row_totals(calibrated);
    }

    /*
     * Prune counts derived from a calibrated joint (rows = observed label).
     *  - The diagonal is raised to at least `min_per_class`; the increase is
     *    removed evenly from the row's non-zero off-diagonal cells (clamped at 0).
     *  - Off-diagonal cells are multiplied by `frac_noise`; the removed mass
     *    moves to the diagonal.
     *  - Rows are rounded preserving their totals.
     */
    inline torch::Tensor keep_at_least_n_per_class(const torch::Tensor& joint, std::int64_t min_per_class, double frac_noise) {
        if (frac_noise < 0.0 || frac_noise > 1.0) {
            throw std::invalid_argument("frac_noise must lie within [0, 1].");
        }
        auto matrix = joint.to(torch::kCPU, torch::kDouble).contiguous().clone();
        const auto K = matrix.size(0);
        auto m = matrix.accessor<double, 2>();

        for (std::int64_t i = 0; i < K; ++i) {
            const double diagonal = m[i][i];
            const double raised = std::max(diagonal, static_cast<double>(min_per_class));
            const double increase = raised - diagonal;

            std::int64_t non_zero_off_diagonal = 0;
            for (std::int64_t j = 0; j < K; ++j) {
                if (j != i && m[i][j] != 0.0) {
                    ++non_zero_off_diagonal;
                }
            }
            const double share = increase / static_cast<double>(std::max<std::int64_t>(non_zero_off_diagonal, 1));

            double moved = 0.0;
            for (std::int64_t j = 0; j < K; ++j) {
                if (j == i) {
                    continue;
                }
                double value = m[i][j] != 0.0 ? std::max(m[i][j] - share, 0.0) : 0.0;
                const double kept = value * frac_noise;
                moved += value - kept;
                m[i][j] = kept;
            }
            m[i][i] = raised + moved;
        }
        return round_preserving_row_totals(matrix);
    }
}

#endif // VERITAS_NOISE_CALIBRATION_HPP
