#ifndef VERITAS_OPTIMIZER_REGISTRY_HPP
#define VERITAS_OPTIMIZER_REGISTRY_HPP

#include <memory>

#include <torch/torch.h>

#include "details/adam.hpp"

namespace Veritas::Optimizer::Details {
    template <class Owner, class Descriptor>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner&, const Descriptor&) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported optimizer descriptor provided to build_optimizer.");
        return nullptr;
    }

    template <class Owner>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(Owner& owner, const AdamDescriptor& descriptor) {
        const auto options = to_torch_options(descriptor.options);
        return std::make_unique<torch::optim::Adam>(owner.parameters(), options);
    }
}

#endif // VERITAS_OPTIMIZER_REGISTRY_HPP
