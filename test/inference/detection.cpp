#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "../../src/confidence/confidence.hpp"
#include "../../src/inference/accumulate.hpp"
#include "../../src/inference/detection.hpp"
#include "../../src/training/checkpoint.hpp"
#include "../support/dataset_fixture.hpp"
#include "../support/temporary_directory.hpp"

using namespace Veritas;

TEST(Accumulate, FlattensChannelLastInIterationOrder) {
    torch::manual_seed(2);
    auto network = Network::VNet2d(1, 3);
    Data::Batch first{torch::rand({2, 1, 8, 8}), torch::randint(0, 3, {2, 8, 8}, torch::kLong), {}, {"a.png", "b.png"}};
    Data::Batch second{torch::rand({1, 1, 8, 8}), torch::randint(0, 3, {1, 8, 8}, torch::kLong), {}, {"c.png"}};

    const auto accumulation = Inference::Accumulate(network, {first, second}, {.progress = nullptr});
    ASSERT_EQ(accumulation.pixels(), 3 * 64);
    EXPECT_EQ(accumulation.probs.sizes().vec(), (std::vector<std::int64_t>{3 * 64, 3}));
    EXPECT_TRUE(torch::allclose(accumulation.probs.sum(1), torch::ones({3 * 64}), 1e-4, 1e-5));
    EXPECT_EQ(accumulation.filenames, (std::vector<std::string>{"a.png", "b.png", "c.png"}));
    EXPECT_TRUE(torch::equal(accumulation.labels.slice(0, 0, 64), first.labels[0].reshape({-1})));

    // Pixel (row 1, col 2) of the second image.
    torch::NoGradGuard no_grad;
    const auto expected = torch::softmax(network->forward(first.images), 1)[1].select(1, 1).select(1, 2);
    EXPECT_TRUE(torch::allclose(accumulation.probs[64 + 8 + 2], expected, 1e-4, 1e-5));
    EXPECT_THROW((void)Inference::Accumulate(network, {}, {.progress = nullptr}), DataShapeError);
}

TEST(NoiseDetectionRun, SubModelTwoDirectoryIsDerived) {
    Inference::DetectionOptions options{};
    options.model_sub_1_saving_dir = "/runs/lung_sub_1_v3";
    EXPECT_EQ(Inference::SubModelTwoDirectory(options).string(), "/runs/lung_sub_2_v3");

    options.model_sub_2_saving_dir = std::filesystem::path("/elsewhere/model");
    EXPECT_EQ(Inference::SubModelTwoDirectory(options).string(), "/elsewhere/model");

    options.model_sub_2_saving_dir.reset();
    options.model_sub_1_saving_dir = "/runs/lung_first";
    EXPECT_THROW((void)Inference::SubModelTwoDirectory(options), ConfigurationError);
}

TEST(NoiseDetectionRun, WritesMapsForEveryMethod) {
    Veritas::Test::TemporaryDirectory scratch("detection");
    const auto data_root = scratch.path() / "lung";
    Veritas::Test::WriteSubset(data_root / "sub-1", "training", "lung", {"a.png", "b.png"}, 8, 8);
    Veritas::Test::WriteSubset(data_root / "sub-2", "training", "lung", {"c.png", "d.png", "e.png"}, 8, 8);

    torch::manual_seed(8);
    for (const char* model : {"model_sub_1", "model_sub_2"}) {
        auto network = Network::VNet2d(1, 2);
        const Checkpoint::Store store(scratch.path() / model / "ckpt");
        store.save_best(*network, 3, 0.5);
    }

    Inference::DetectionOptions options{};
    options.data_root_dir = data_root;
    options.model_sub_1_saving_dir = scratch.path() / "model_sub_1";
    options.class_name = "lung";
    options.methods = {"both", "union"};
    options.cropping_size = {8, 8};
    options.batch_size = 2;
    options.progress = nullptr;
    options.noise.min_examples_per_class = 0;

    std::ostringstream console;
    auto logger = Common::Logger::Console(&console);
    const auto flagged = Inference::RunNoiseDetection(options, logger);
    ASSERT_EQ(flagged.size(), 2U);
    EXPECT_GE(flagged[1], flagged[0]);

    const auto both_dir = data_root / "all" / "training" / "lung-confident-maps";
    const auto union_dir = data_root / "all" / "training" / "lung-confident-maps-union";
    for (const char* name : {"a.png", "b.png", "c.png", "d.png", "e.png"}) {
        ASSERT_TRUE(std::filesystem::exists(both_dir / name)) << name;
        ASSERT_TRUE(std::filesystem::exists(union_dir / name)) << name;
        const auto map = Confidence::Read(both_dir / name);
        EXPECT_EQ(map.rows, 8);
        EXPECT_EQ(map.cols, 8);
    }
    EXPECT_NE(console.str().find("sub model 2"), std::string::npos);
}

TEST(NoiseDetectionRun, RejectsUnknownMethodBeforeLoading) {
    Inference::DetectionOptions options{};
    options.model_sub_1_saving_dir = "/nonexistent/sub_1";
    options.methods = {"both", "vote"};
    auto logger = Common::Logger::Console(nullptr);
    EXPECT_THROW((void)Inference::RunNoiseDetection(options, logger), ConfigurationError);
}
