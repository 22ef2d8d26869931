#ifndef VERITAS_LRSCHEDULER_REGISTRY_HPP
#define VERITAS_LRSCHEDULER_REGISTRY_HPP

#include <memory>

#include <torch/torch.h>

#include "details/step.hpp"

namespace Veritas::LrScheduler::Details {
    template <class Descriptor>
    std::unique_ptr<Scheduler> build_scheduler(torch::optim::Optimizer&, const Descriptor&) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported scheduler descriptor provided to build_scheduler.");
        return nullptr;
    }

    inline std::unique_ptr<Scheduler> build_scheduler(torch::optim::Optimizer& optimizer, const StepDescriptor& descriptor) {
        return std::make_unique<StepScheduler>(optimizer, descriptor.options);
    }
}

#endif // VERITAS_LRSCHEDULER_REGISTRY_HPP
