#include <gtest/gtest.h>
#include <torch/torch.h>

#include "../../src/lrscheduler/lrscheduler.hpp"
#include "../../src/optimizer/optimizer.hpp"

using namespace Veritas;

namespace {
    double LearningRate(torch::optim::Optimizer& optimizer) {
        return optimizer.param_groups().front().options().get_lr();
    }
}

TEST(StepScheduler, DecaysEveryStepSizeEpochs) {
    torch::nn::Linear linear(2, 1);
    auto optimizer = Optimizer::Build(*linear, Optimizer::Adam({.learning_rate = 1.0}));
    auto scheduler = LrScheduler::Build(*optimizer, LrScheduler::Step({.step_size = 2, .gamma = 0.5}));

    EXPECT_DOUBLE_EQ(LearningRate(*optimizer), 1.0);
    scheduler->step();
    EXPECT_DOUBLE_EQ(LearningRate(*optimizer), 1.0);
    scheduler->step();
    EXPECT_DOUBLE_EQ(LearningRate(*optimizer), 0.5);
    scheduler->step();
    scheduler->step();
    EXPECT_DOUBLE_EQ(LearningRate(*optimizer), 0.25);
}

TEST(StepScheduler, RejectsInvalidOptions) {
    torch::nn::Linear linear(2, 1);
    auto optimizer = Optimizer::Build(*linear, Optimizer::Adam());
    EXPECT_THROW((void)LrScheduler::Build(*optimizer, LrScheduler::Step({.step_size = 0})), std::invalid_argument);
    EXPECT_THROW((void)LrScheduler::Build(*optimizer, LrScheduler::Step({.step_size = 1, .gamma = 0.0})), std::invalid_argument);
}
