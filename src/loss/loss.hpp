#ifndef VERITAS_LOSS_HPP
#define VERITAS_LOSS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <sstream>
#include <string>
#include <string_view>
#include <variant>

#include "../common/errors.hpp"
#include "details/reduction.hpp"
#include "details/ce.hpp"
#include "details/slsr.hpp"
#include "details/weighted_ce.hpp"

namespace Veritas::Loss {
    using Reduction = Details::Reduction;

    using Descriptor = std::variant<
        Details::CrossEntropyDescriptor,
        Details::SLSRDescriptor,
        Details::WeightedCrossEntropyDescriptor>;

    [[nodiscard]] constexpr auto CrossEntropy(const Details::CrossEntropyOptions& options = {}) noexcept -> Details::CrossEntropyDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto SLSR(const Details::SLSROptions& options = {}) noexcept -> Details::SLSRDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto WeightedCrossEntropy(const Details::WeightedCrossEntropyOptions& options = {}) noexcept -> Details::WeightedCrossEntropyDescriptor {
        return {options};
    }

    // Configuration names: CrossEntropyLoss, SLSRLoss, WeightedCrossEntropyLoss.
    [[nodiscard]] inline Descriptor Parse(std::string_view name, double slsr_epsilon = Details::SLSROptions{}.epsilon) {
        if (name == "CrossEntropyLoss") return CrossEntropy();
        if (name == "SLSRLoss") return SLSR({.epsilon = slsr_epsilon});
        if (name == "WeightedCrossEntropyLoss") return WeightedCrossEntropy();
        std::ostringstream message;
        message << "Unknown loss '" << name << "' (expected CrossEntropyLoss, SLSRLoss or WeightedCrossEntropyLoss).";
        throw ConfigurationError(message.str());
    }

    [[nodiscard]] inline std::string Name(const Descriptor& descriptor) {
        struct {
            std::string operator()(const Details::CrossEntropyDescriptor&) const { return "CrossEntropyLoss"; }
            std::string operator()(const Details::SLSRDescriptor&) const { return "SLSRLoss"; }
            std::string operator()(const Details::WeightedCrossEntropyDescriptor&) const { return "WeightedCrossEntropyLoss"; }
        } visitor;
        return std::visit(visitor, descriptor);
    }
}

#endif // VERITAS_LOSS_HPP
