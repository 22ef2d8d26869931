#ifndef VERITAS_LRSCHEDULER_STEP_HPP
#define VERITAS_LRSCHEDULER_STEP_HPP
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "common.hpp"

namespace Veritas::LrScheduler::Details {
    struct StepOptions {
        std::size_t step_size{1};
        double gamma{0.1};
    };

    struct StepDescriptor {
        StepOptions options{};
    };

    // lr = base_lr * gamma ^ floor(steps / step_size), one step per epoch.
    class StepScheduler final : public Scheduler {
    public:
        StepScheduler(torch::optim::Optimizer& optimizer, StepOptions options)
            : optimizer_(optimizer),
              options_(std::move(options)),
              base_lrs_(capture_base_lrs(optimizer)),
              step_count_(0) {
            if (options_.step_size == 0) {
                throw std::invalid_argument("StepScheduler requires step_size to be greater than zero.");
            }
            if (options_.gamma <= 0.0) {
                throw std::invalid_argument("StepScheduler requires a positive gamma.");
            }

            apply(step_count_);
        }

        void step() override {
            if (step_count_ < std::numeric_limits<std::size_t>::max()) {
                ++step_count_;
            }
            apply(step_count_);
        }

        [[nodiscard]] std::size_t steps() const { return step_count_; }

    private:
        void apply(std::size_t step) {
            auto& param_groups = optimizer_.param_groups();
            if (base_lrs_.size() != param_groups.size()) {
                throw std::runtime_error("Optimizer param group count changed after scheduler creation.");
            }

            const auto decays = static_cast<double>(step / options_.step_size);
            for (std::size_t index = 0; index < param_groups.size(); ++index) {
                param_groups[index].options().set_lr(base_lrs_[index] * std::pow(options_.gamma, decays));
            }
        }

        static std::vector<double> capture_base_lrs(torch::optim::Optimizer& optimizer) {
            std::vector<double> base_lrs;
            base_lrs.reserve(optimizer.param_groups().size());
            for (auto& group : optimizer.param_groups()) {
                base_lrs.push_back(group.options().get_lr());
            }
            return base_lrs;
        }

        torch::optim::Optimizer& optimizer_;
        StepOptions options_{};
        std::vector<double> base_lrs_{};
        std::size_t step_count_{};
    };
}

#endif // VERITAS_LRSCHEDULER_STEP_HPP
