#ifndef VERITAS_OPTIMIZER_HPP
#define VERITAS_OPTIMIZER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <memory>
#include <variant>

#include "details/adam.hpp"
#include "registry.hpp"

namespace Veritas::Optimizer {
    using AdamOptions = Details::AdamOptions;
    using AdamDescriptor = Details::AdamDescriptor;

    using Descriptor = std::variant<AdamDescriptor>;

    [[nodiscard]] inline constexpr auto Adam(const AdamOptions& options = {}) noexcept -> AdamDescriptor {
        return AdamDescriptor{.options = options};
    }

    template <class Owner>
    [[nodiscard]] std::unique_ptr<torch::optim::Optimizer> Build(Owner& owner, const Descriptor& descriptor) {
        return std::visit([&](const auto& concrete) { return Details::build_optimizer(owner, concrete); }, descriptor);
    }
}

#endif // VERITAS_OPTIMIZER_HPP
