#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "../../src/core.hpp"
#include "../support/dataset_fixture.hpp"
#include "../support/temporary_directory.hpp"

using namespace Veritas;

namespace {
    std::string ConfigJson(const std::filesystem::path& data_root, const std::filesystem::path& saving_dir, int num_epochs) {
        std::ostringstream json;
        json << R"({
            "general": {"data_root_dir": ")" << data_root.string() << R"(", "saving_dir": ")" << saving_dir.string()
             << R"(", "device": "cpu"},
            "dataset": {"class_name": "lung", "image_channels": 1, "cropping_size": [8, 8],
                        "load_confident_map": false, "seed": 3},
            "net": {"name": "vnet2d", "in_channels": 1, "out_channels": 2},
            "loss": {"name": "CrossEntropyLoss"},
            "train": {"num_epochs": )" << num_epochs << R"(, "batch_size": 2, "save_epochs": 1},
            "lr_scheduler": {"lr": 0.01, "step_size": 1, "gamma": 0.5}
        })";
        return json.str();
    }

    std::filesystem::path WriteConfig(const std::filesystem::path& path, const std::string& content) {
        std::ofstream(path) << content;
        return path;
    }

    std::string ReadText(const std::filesystem::path& path) {
        std::ifstream stream(path);
        return {std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};
    }

    class TrainerRun : public ::testing::Test {
    protected:
        void SetUp() override {
            data_root_ = scratch_.path() / "data";
            saving_dir_ = scratch_.path() / "run";
            Veritas::Test::WriteSubset(data_root_, "training", "lung", {"a.png", "b.png", "c.png"}, 8, 8);
            Veritas::Test::WriteSubset(data_root_, "validation", "lung", {"d.png"}, 8, 8);
        }

        double Train(const std::string& config_name, int num_epochs) {
            const auto path = WriteConfig(scratch_.path() / config_name, ConfigJson(data_root_, saving_dir_, num_epochs));
            Trainer trainer(Common::LoadTrainingConfig(path), {.console = nullptr});
            return trainer.run();
        }

        Veritas::Test::TemporaryDirectory scratch_{"trainer"};
        std::filesystem::path data_root_;
        std::filesystem::path saving_dir_;
    };
}

TEST_F(TrainerRun, FreshRunWritesCheckpointsHistoryAndConfigCopy) {
    const double best = Train("lung.json", 2);

    const Checkpoint::Store store(saving_dir_ / "ckpt");
    EXPECT_EQ(store.epochs(), (std::vector<std::int64_t>{0, 1}));
    EXPECT_TRUE(std::filesystem::exists(store.best_path()));
    EXPECT_TRUE(std::filesystem::exists(saving_dir_ / "ckpt" / Checkpoint::kBestRecordFilename));

    const auto history = Training::ValidationHistory::load(saving_dir_ / kHistoryFilename);
    ASSERT_EQ(history.size(), 2U);
    EXPECT_DOUBLE_EQ(best, *history.best());

    const auto record = store.best_record();
    ASSERT_TRUE(record.has_value());
    EXPECT_DOUBLE_EQ(record->score, best);
    EXPECT_DOUBLE_EQ(history.values()[static_cast<std::size_t>(record->epoch)], best);

    EXPECT_EQ(ReadText(saving_dir_ / kConfigCopyFilename), ReadText(scratch_.path() / "lung.json"));
    const auto log = ReadText(saving_dir_ / "training_log.txt");
    EXPECT_NE(log.find("Training from scratch..."), std::string::npos);
    EXPECT_NE(log.find("epoch 1 learning rate: 0.005"), std::string::npos);
}

TEST_F(TrainerRun, ResumeContinuesFromTheNewestCheckpoint) {
    Train("lung.json", 2);
    const auto first = Training::ValidationHistory::load(saving_dir_ / kHistoryFilename);
    ASSERT_EQ(first.size(), 2U);

    // An entry past the newest checkpoint must be dropped on resume.
    auto stale = first;
    stale.append(2.0);
    stale.save(saving_dir_ / kHistoryFilename);

    Train("lung_longer.json", 4);

    const Checkpoint::Store store(saving_dir_ / "ckpt");
    EXPECT_EQ(store.epochs(), (std::vector<std::int64_t>{0, 1, 2, 3}));

    const auto resumed = Training::ValidationHistory::load(saving_dir_ / kHistoryFilename);
    ASSERT_EQ(resumed.size(), 4U);
    EXPECT_DOUBLE_EQ(resumed.values()[0], first.values()[0]);
    EXPECT_DOUBLE_EQ(resumed.values()[1], first.values()[1]);
    EXPECT_LE(*resumed.best(), 1.0);

    const auto log = ReadText(saving_dir_ / "training_log.txt");
    EXPECT_NE(log.find("Load ckpt: net_epoch_1.pt"), std::string::npos);
    EXPECT_NE(log.find("epoch 2 learning rate: 0.0025"), std::string::npos);
    EXPECT_NE(log.find("epoch 3 learning rate: 0.00125"), std::string::npos);

    // The copy is taken on the fresh run only.
    EXPECT_EQ(Common::LoadTrainingConfig(saving_dir_ / kConfigCopyFilename).train.num_epochs, 2);
}
