#include <cstdint>
#include <initializer_list>
#include <vector>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "../../src/noise/noise.hpp"
#include "population.hpp"

using namespace Veritas;

namespace {
    torch::Tensor Matrix(std::initializer_list<double> values, std::int64_t rows, std::int64_t cols) {
        return torch::tensor(std::vector<double>(values), torch::kDouble).view({rows, cols});
    }

    torch::Tensor Counts(std::initializer_list<std::int64_t> values, std::int64_t rows, std::int64_t cols) {
        return torch::tensor(std::vector<std::int64_t>(values), torch::kLong).view({rows, cols});
    }
}

TEST(NoiseCalibration, RoundingKeepsRowTotalsAndPrefersLowerColumn) {
    const auto rounded = Noise::Details::round_preserving_row_totals(Matrix({0.5, 0.5, 1.0, 0.25, 0.75, 1.0}, 2, 3));
    EXPECT_TRUE(torch::equal(rounded, Counts({1, 0, 1, 0, 1, 1}, 2, 3)));
}

TEST(NoiseCalibration, PopulatedRowsMatchObservedCounts) {
    const auto raw = Counts({2, 2, 0, 0}, 2, 2);
    const auto counts = torch::tensor({8, 3}, torch::kLong);
    const auto joint = Noise::Details::calibrate_confident_joint(raw, counts);
    EXPECT_TRUE(torch::equal(joint, Counts({4, 4, 0, 0}, 2, 2)));
}

TEST(NoiseCalibration, MarginalConsistencyOnRandomPopulations) {
    for (std::uint64_t seed : {1U, 7U, 42U}) {
        const auto population = Veritas::Test::RandomPopulation(600, 4, seed);
        for (auto kind : {Noise::JointKind::Qij, Noise::JointKind::Cij}) {
            const auto estimate = Noise::Estimate(population.labels, population.probs, kind);
            const auto rows = estimate.joint.sum(1);
            const auto raw_rows = estimate.raw_joint.sum(1);
            for (std::int64_t i = 0; i < 4; ++i) {
                const auto observed = estimate.label_counts[i].item<std::int64_t>();
                EXPECT_LE(rows[i].item<std::int64_t>(), observed);
                if (raw_rows[i].item<std::int64_t>() > 0) {
                    EXPECT_EQ(rows[i].item<std::int64_t>(), observed) << "seed " << seed << " row " << i;
                } else {
                    EXPECT_EQ(rows[i].item<std::int64_t>(), 0);
                }
            }
            EXPECT_GE(estimate.joint.min().item<std::int64_t>(), 0);
        }
    }
}

TEST(NoiseCalibration, KeepAtLeastRaisesDiagonal) {
    const auto pruned = Noise::Details::keep_at_least_n_per_class(Counts({2, 6, 1, 9}, 2, 2), 5, 1.0);
    EXPECT_TRUE(torch::equal(pruned, Counts({5, 3, 1, 9}, 2, 2)));
}

TEST(NoiseCalibration, FracNoiseMovesMassToDiagonal) {
    const auto pruned = Noise::Details::keep_at_least_n_per_class(Counts({10, 4, 2, 8}, 2, 2), 0, 0.5);
    EXPECT_TRUE(torch::equal(pruned, Counts({12, 2, 1, 9}, 2, 2)));
    EXPECT_THROW(Noise::Details::keep_at_least_n_per_class(Counts({1, 0, 0, 1}, 2, 2), 0, 1.5), std::invalid_argument);
}
