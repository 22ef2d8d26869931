#include <cmath>
#include <limits>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "../../src/noise/noise.hpp"
#include "population.hpp"

using namespace Veritas;

TEST(NoiseThreshold, MeanSelfConfidencePerClass) {
    const auto population = Veritas::Test::TwoClassPopulation();
    const auto prepared = Noise::Details::prepare_population(population.labels, population.probs);
    const auto thresholds = Noise::Details::per_class_thresholds(prepared);

    EXPECT_NEAR(thresholds[0].item<double>(), (16 * 0.9 + 4 * 0.2) / 20.0, 1e-6);
    EXPECT_NEAR(thresholds[1].item<double>(), (17 * 0.9 + 3 * 0.15) / 20.0, 1e-6);
}

TEST(NoiseThreshold, AbsentClassIsInfiniteAndNeverCandidate) {
    // Class 2 never appears as a label but wins the arg-max for half the pixels.
    auto labels = torch::tensor({0, 0, 1, 1, 0, 1}, torch::kLong);
    auto probs = torch::tensor({0.6F, 0.1F, 0.3F,
                                0.1F, 0.1F, 0.8F,
                                0.1F, 0.7F, 0.2F,
                                0.1F, 0.1F, 0.8F,
                                0.7F, 0.2F, 0.1F,
                                0.2F, 0.2F, 0.6F}).view({6, 3});

    const auto estimate = Noise::Estimate(labels, probs, Noise::JointKind::Qij);
    EXPECT_TRUE(std::isinf(estimate.thresholds[2].item<double>()));
    EXPECT_EQ(estimate.raw_joint.select(1, 2).sum().item<std::int64_t>(), 0);
    EXPECT_EQ(estimate.joint.select(0, 2).sum().item<std::int64_t>(), 0);
    EXPECT_EQ(estimate.label_counts[2].item<std::int64_t>(), 0);
}

TEST(NoiseThreshold, PixelsWithoutConfidentClassAreLeftOut) {
    auto labels = torch::tensor({0, 0, 1, 1}, torch::kLong);
    // t = [0.6, 0.6]; the last pixel reaches neither threshold.
    auto probs = torch::tensor({0.9F, 0.1F,
                                0.3F, 0.4F,
                                0.1F, 0.9F,
                                0.45F, 0.3F}).view({4, 2});

    const auto estimate = Noise::Estimate(labels, probs, Noise::JointKind::Qij);
    EXPECT_EQ(estimate.assigned, 2);
    EXPECT_EQ(estimate.raw_joint.sum().item<std::int64_t>(), 2);

    const auto hard = Noise::Estimate(labels, probs, Noise::JointKind::Cij);
    EXPECT_EQ(hard.assigned, 4);
    EXPECT_EQ(hard.raw_joint.sum().item<std::int64_t>(), 4);
}

TEST(NoiseThreshold, RejectsMalformedInput) {
    auto labels = torch::tensor({0, 1, 1}, torch::kLong);
    auto probs = torch::full({3, 2}, 0.5F);

    EXPECT_THROW((void)Noise::Estimate(labels.slice(0, 0, 2), probs), DataShapeError);
    EXPECT_THROW((void)Noise::Estimate(labels, probs.view({-1})), DataShapeError);
    EXPECT_THROW((void)Noise::Estimate(torch::tensor({0, 2, 1}, torch::kLong), probs), DataShapeError);
    EXPECT_THROW((void)Noise::Estimate(labels, probs, Noise::JointKind::Qij, 3), DataShapeError);
    EXPECT_THROW((void)Noise::Estimate(torch::empty({0}, torch::kLong), torch::empty({0, 2})), DataShapeError);
}
