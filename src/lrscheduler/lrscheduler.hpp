#ifndef VERITAS_LRSCHEDULER_HPP
#define VERITAS_LRSCHEDULER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <memory>
#include <variant>

#include "details/common.hpp"
#include "details/step.hpp"
#include "registry.hpp"

namespace Veritas::LrScheduler {
    using Scheduler = Details::Scheduler;
    using StepOptions = Details::StepOptions;
    using StepDescriptor = Details::StepDescriptor;

    using Descriptor = std::variant<StepDescriptor>;

    [[nodiscard]] constexpr auto Step(const StepOptions& options = {}) noexcept -> StepDescriptor {
        return {options};
    }

    [[nodiscard]] inline std::unique_ptr<Scheduler> Build(torch::optim::Optimizer& optimizer, const Descriptor& descriptor) {
        return std::visit([&](const auto& concrete) { return Details::build_scheduler(optimizer, concrete); }, descriptor);
    }
}

#endif // VERITAS_LRSCHEDULER_HPP
