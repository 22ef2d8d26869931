#include <set>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "../../src/noise/noise.hpp"
#include "population.hpp"

using namespace Veritas;

TEST(NoisePrune, PlantedJointIsRecovered) {
    const auto population = Veritas::Test::TwoClassPopulation();
    const auto estimate = Noise::Estimate(population.labels, population.probs, Noise::JointKind::Qij);
    const auto expected = torch::tensor({16, 4, 3, 17}, torch::kLong).view({2, 2});
    EXPECT_TRUE(torch::equal(estimate.raw_joint, expected));
    EXPECT_TRUE(torch::equal(estimate.joint, expected));
}

TEST(NoisePrune, EachRuleFlagsThePlantedPixels) {
    const auto population = Veritas::Test::TwoClassPopulation();
    const auto joint = Noise::Estimate(population.labels, population.probs).joint;
    for (auto rule : {Noise::PruneRule::ByClass, Noise::PruneRule::ByNoiseRate, Noise::PruneRule::Both}) {
        const auto mask = Noise::Prune(population.labels, population.probs, joint, rule);
        ASSERT_EQ(mask.size(0), 40);
        EXPECT_EQ(Veritas::Test::Flagged(mask), population.planted);
    }
}

TEST(NoisePrune, ByClassFollowsMarginOrder) {
    // Row 0 carries one off-diagonal count; pixel 2 has the largest margin towards class 1.
    auto labels = torch::tensor({0, 0, 0, 0, 1, 1}, torch::kLong);
    auto probs = torch::tensor({0.9F, 0.1F,
                                0.6F, 0.4F,
                                0.3F, 0.7F,
                                0.8F, 0.2F,
                                0.1F, 0.9F,
                                0.2F, 0.8F}).view({6, 2});
    const auto joint = torch::tensor({3, 1, 0, 2}, torch::kLong).view({2, 2});
    const Noise::Options options{.min_examples_per_class = 0};

    const auto mask = Noise::Prune(labels, probs, joint, Noise::PruneRule::ByClass, options);
    EXPECT_EQ(Veritas::Test::Flagged(mask), (std::set<std::int64_t>{2}));
}

TEST(NoisePrune, ByNoiseRateTakesLowestSelfConfidence) {
    auto labels = torch::tensor({0, 0, 0, 0, 1, 1}, torch::kLong);
    auto probs = torch::tensor({0.9F, 0.1F,
                                0.55F, 0.45F,
                                0.7F, 0.3F,
                                0.5F, 0.5F,
                                0.1F, 0.9F,
                                0.2F, 0.8F}).view({6, 2});
    // Noise rate of row 0 is 1/2, so two of its four pixels go.
    const auto joint = torch::tensor({2, 2, 0, 2}, torch::kLong).view({2, 2});
    const Noise::Options options{.min_examples_per_class = 0};

    const auto mask = Noise::Prune(labels, probs, joint, Noise::PruneRule::ByNoiseRate, options);
    EXPECT_EQ(Veritas::Test::Flagged(mask), (std::set<std::int64_t>{1, 3}));
}

TEST(NoisePrune, SmallClassesAreNeverPruned) {
    auto labels = torch::tensor({0, 0, 0, 1, 1, 1, 1, 1, 1, 1}, torch::kLong);
    auto probs = torch::tensor({0.1F, 0.9F,
                                0.1F, 0.9F,
                                0.9F, 0.1F,
                                0.1F, 0.9F,
                                0.1F, 0.9F,
                                0.1F, 0.9F,
                                0.1F, 0.9F,
                                0.1F, 0.9F,
                                0.1F, 0.9F,
                                0.1F, 0.9F}).view({10, 2});
    const auto mask = Noise::Detect(labels, probs, Noise::Both(), {.min_examples_per_class = 5});
    EXPECT_EQ(mask.slice(0, 0, 3).sum().item<std::int64_t>(), 0);
}

TEST(NoisePrune, ZeroJointFlagsNothing) {
    const auto population = Veritas::Test::TwoClassPopulation();
    const auto joint = torch::zeros({2, 2}, torch::kLong);
    const auto mask = Noise::Prune(population.labels, population.probs, joint, Noise::PruneRule::Both);
    EXPECT_EQ(mask.sum().item<std::int64_t>(), 0);
}

TEST(NoisePrune, JointMustMatchProbabilityWidth) {
    const auto population = Veritas::Test::TwoClassPopulation();
    EXPECT_THROW(Noise::Prune(population.labels, population.probs, torch::zeros({3, 3}, torch::kLong)), DataShapeError);
}
