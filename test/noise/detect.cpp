#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "../../src/noise/noise.hpp"
#include "population.hpp"

using namespace Veritas;

namespace {
    bool IsSubset(const torch::Tensor& inner, const torch::Tensor& outer) {
        return inner.logical_and(outer.logical_not()).sum().item<std::int64_t>() == 0;
    }
}

TEST(NoiseDetect, MethodNamesRoundTrip) {
    for (const std::string name : {"both", "prune_by_class", "prune_by_noise_rate", "Cij", "Qij", "intersection", "union"}) {
        EXPECT_EQ(Noise::MethodName(Noise::ParseMethod(name)), name);
    }
    EXPECT_THROW((void)Noise::ParseMethod("majority_vote"), ConfigurationError);
    EXPECT_THROW((void)Noise::ParseMethod("Both"), ConfigurationError);
}

TEST(NoiseDetect, SetRelationsBetweenMethods) {
    for (std::uint64_t seed : {3U, 11U}) {
        const auto population = Veritas::Test::RandomPopulation(800, 3, seed);
        const auto qij = Noise::Detect(population.labels, population.probs, Noise::Qij());
        const auto cij = Noise::Detect(population.labels, population.probs, Noise::Cij());
        const auto both = Noise::Detect(population.labels, population.probs, Noise::Both());
        const auto intersection = Noise::Detect(population.labels, population.probs, Noise::Intersection());
        const auto united = Noise::Detect(population.labels, population.probs, Noise::Union());

        EXPECT_TRUE(torch::equal(both, qij));
        EXPECT_TRUE(IsSubset(qij, united));
        EXPECT_TRUE(IsSubset(cij, united));
        EXPECT_TRUE(IsSubset(intersection, qij));
        EXPECT_TRUE(IsSubset(intersection, cij));
        EXPECT_TRUE(IsSubset(intersection, united));
    }
}

TEST(NoiseDetect, BothIsUnionOfTheTwoRules) {
    const auto population = Veritas::Test::RandomPopulation(500, 3, 5);
    const auto by_class = Noise::Detect(population.labels, population.probs, Noise::PruneByClass());
    const auto by_rate = Noise::Detect(population.labels, population.probs, Noise::PruneByNoiseRate());
    const auto both = Noise::Detect(population.labels, population.probs, Noise::Both());
    EXPECT_TRUE(torch::equal(both, by_class.logical_or(by_rate)));
}

TEST(NoiseDetect, OutputIsAlignedAndDeterministic) {
    const auto population = Veritas::Test::RandomPopulation(700, 4, 19);
    for (const std::string name : {"both", "Cij", "intersection", "union"}) {
        const auto first = Noise::Detect(population.labels, population.probs, name);
        const auto second = Noise::Detect(population.labels.clone(), population.probs.clone(), name);
        ASSERT_EQ(first.size(0), 700);
        EXPECT_EQ(first.scalar_type(), torch::kBool);
        EXPECT_TRUE(torch::equal(first, second)) << name;
    }
}

TEST(NoiseDetect, PlantedPixelsFoundByEveryMethod) {
    const auto population = Veritas::Test::TwoClassPopulation();
    for (const std::string name : {"both", "Cij", "Qij", "intersection", "union"}) {
        const auto mask = Noise::Detect(population.labels, population.probs, name);
        EXPECT_EQ(Veritas::Test::Flagged(mask), population.planted) << name;
    }
}

TEST(NoiseDetect, RejectsUnknownMethodAndWrongWidth) {
    const auto population = Veritas::Test::TwoClassPopulation();
    EXPECT_THROW((void)Noise::Detect(population.labels, population.probs, "median"), ConfigurationError);
    EXPECT_THROW((void)Noise::Detect(population.labels, population.probs, Noise::Both(), {.num_classes = 3}), DataShapeError);
    EXPECT_THROW((void)Noise::Detect(population.labels.slice(0, 0, 10), population.probs), DataShapeError);
}
