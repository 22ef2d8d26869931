#include <filesystem>
#include <fstream>
#include <vector>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "../../src/training/checkpoint.hpp"
#include "../../src/training/history.hpp"
#include "../support/temporary_directory.hpp"

using namespace Veritas;

namespace {
    std::size_t CountFiles(const std::filesystem::path& directory) {
        std::size_t count = 0;
        for (const auto& entry : std::filesystem::directory_iterator(directory)) {
            if (entry.is_regular_file()) {
                ++count;
            }
        }
        return count;
    }
}

TEST(CheckpointPolicy, PeriodicIncludesEpochZero) {
    const Checkpoint::Policy policy(3);
    Training::ValidationHistory history;
    std::vector<std::int64_t> periodic;
    for (std::int64_t epoch = 0; epoch < 7; ++epoch) {
        history.append(0.1);
        if (policy.decide(epoch, history).periodic) {
            periodic.push_back(epoch);
        }
    }
    EXPECT_EQ(periodic, (std::vector<std::int64_t>{0, 3, 6}));
    EXPECT_THROW(Checkpoint::Policy(0), ConfigurationError);
}

TEST(CheckpointPolicy, PeriodicAndBestCanFireTogether) {
    const Checkpoint::Policy policy(1);
    Training::ValidationHistory history;
    history.append(0.4);
    const auto decision = policy.decide(0, history);
    EXPECT_TRUE(decision.periodic);
    EXPECT_TRUE(decision.best);
}

TEST(CheckpointStore, BestFileIsReplacedNotAccumulated) {
    Veritas::Test::TemporaryDirectory scratch("ckpt");
    const Checkpoint::Store store(scratch.path() / "ckpt");
    torch::nn::Linear linear(3, 2);

    store.save_best(*linear, 1, 0.4);
    torch::NoGradGuard no_grad;
    linear->weight.fill_(0.5);
    store.save_best(*linear, 4, 0.7);

    EXPECT_EQ(CountFiles(store.directory()), 2U); // snapshot and record
    ASSERT_TRUE(std::filesystem::exists(store.best_path()));
    const auto record = store.best_record();
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->epoch, 4);
    EXPECT_DOUBLE_EQ(record->score, 0.7);

    torch::nn::Linear restored(3, 2);
    store.load(*restored, store.resolve(Checkpoint::Selector::Best));
    EXPECT_TRUE(torch::allclose(restored->weight, torch::full({2, 3}, 0.5F)));
}

TEST(CheckpointStore, ApplyWritesWhatTheDecisionAsks) {
    Veritas::Test::TemporaryDirectory scratch("ckpt");
    const Checkpoint::Store store(scratch.path());
    torch::nn::Linear linear(2, 2);
    Training::ValidationHistory history;
    history.append(0.3);

    store.apply({.periodic = true, .best = false}, *linear, 0, history);
    EXPECT_TRUE(std::filesystem::exists(store.periodic_path(0)));
    EXPECT_FALSE(std::filesystem::exists(store.best_path()));

    store.apply({.periodic = false, .best = true}, *linear, 1, history);
    EXPECT_FALSE(std::filesystem::exists(store.periodic_path(1)));
    EXPECT_TRUE(std::filesystem::exists(store.best_path()));
}

TEST(CheckpointStore, EpochsAreSortedAndLatestIsHighest) {
    Veritas::Test::TemporaryDirectory scratch("ckpt");
    const Checkpoint::Store store(scratch.path());
    torch::nn::Linear linear(2, 2);
    for (std::int64_t epoch : {10, 2, 0}) {
        store.save_periodic(*linear, epoch);
    }
    store.save_best(*linear, 2, 0.9);

    EXPECT_EQ(store.epochs(), (std::vector<std::int64_t>{0, 2, 10}));
    EXPECT_EQ(store.latest().value_or(-1), 10);
    EXPECT_EQ(store.resolve(Checkpoint::Selector::Latest).string(), store.periodic_path(10).string());
    EXPECT_EQ(store.resolve(std::int64_t{-1}).string(), store.best_path().string());
    EXPECT_EQ(store.resolve(std::int64_t{2}).string(), store.periodic_path(2).string());
    EXPECT_THROW((void)store.resolve(std::int64_t{3}), CheckpointError);
}

TEST(CheckpointStore, EmptyDirectoryHasNoLatest) {
    Veritas::Test::TemporaryDirectory scratch("ckpt");
    const Checkpoint::Store store(scratch.path());
    EXPECT_FALSE(store.latest().has_value());
    EXPECT_THROW((void)store.resolve(Checkpoint::Selector::Best), CheckpointError);
    EXPECT_THROW((void)store.resolve(Checkpoint::Selector::Latest), CheckpointError);
}

TEST(CheckpointStore, UnparsableNamesAndMissingDirectoryFail) {
    Veritas::Test::TemporaryDirectory scratch("ckpt");
    const Checkpoint::Store store(scratch.path());
    std::ofstream(scratch.path() / "net_epoch_final.pt") << "x";
    EXPECT_THROW((void)store.epochs(), CheckpointError);

    const Checkpoint::Store missing(scratch.path() / "absent");
    EXPECT_THROW((void)missing.latest(), CheckpointError);

    torch::nn::Linear linear(2, 2);
    EXPECT_THROW(store.load(*linear, scratch.path() / "net_epoch_7.pt"), CheckpointError);
}
