#ifndef VERITAS_NOISE_HPP
#define VERITAS_NOISE_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>

#include <torch/torch.h>

#include "../common/errors.hpp"
#include "details/calibration.hpp"
#include "details/confident_joint.hpp"
#include "details/prune.hpp"
#include "details/threshold.hpp"

namespace Veritas::Noise {
    using JointKind = Details::JointKind;
    using JointEstimate = Details::JointEstimate;
    using PruneRule = Details::PruneRule;
    using Options = Details::PruneOptions;

    struct PruneByClassDescriptor { };
    struct PruneByNoiseRateDescriptor { };
    struct BothDescriptor { };
    struct CijDescriptor { };
    struct QijDescriptor { };
    struct IntersectionDescriptor { };
    struct UnionDescriptor { };

    using Method = std::variant<
        BothDescriptor,
        PruneByClassDescriptor,
        PruneByNoiseRateDescriptor,
        CijDescriptor,
        QijDescriptor,
        IntersectionDescriptor,
        UnionDescriptor>;

    [[nodiscard]] constexpr auto PruneByClass() noexcept -> PruneByClassDescriptor { return {}; }
    [[nodiscard]] constexpr auto PruneByNoiseRate() noexcept -> PruneByNoiseRateDescriptor { return {}; }
    [[nodiscard]] constexpr auto Both() noexcept -> BothDescriptor { return {}; }
    [[nodiscard]] constexpr auto Cij() noexcept -> CijDescriptor { return {}; }
    [[nodiscard]] constexpr auto Qij() noexcept -> QijDescriptor { return {}; }
    [[nodiscard]] constexpr auto Intersection() noexcept -> IntersectionDescriptor { return {}; }
    [[nodiscard]] constexpr auto Union() noexcept -> UnionDescriptor { return {}; }

    [[nodiscard]] inline Method ParseMethod(std::string_view name) {
        if (name == "both") return Both();
        if (name == "prune_by_class") return PruneByClass();
        if (name == "prune_by_noise_rate") return PruneByNoiseRate();
        if (name == "Cij") return Cij();
        if (name == "Qij") return Qij();
        if (name == "intersection") return Intersection();
        if (name == "union") return Union();
        std::ostringstream message;
        message << "Unknown noise pruning method '" << name
                << "' (expected both, prune_by_class, prune_by_noise_rate, Cij, Qij, intersection or union).";
        throw ConfigurationError(message.str());
    }

    [[nodiscard]] inline std::string MethodName(const Method& method) {
        struct {
            std::string operator()(const BothDescriptor&) const { return "both"; }
            std::string operator()(const PruneByClassDescriptor&) const { return "prune_by_class"; }
            std::string operator()(const PruneByNoiseRateDescriptor&) const { return "prune_by_noise_rate"; }
            std::string operator()(const CijDescriptor&) const { return "Cij"; }
            std::string operator()(const QijDescriptor&) const { return "Qij"; }
            std::string operator()(const IntersectionDescriptor&) const { return "intersection"; }
            std::string operator()(const UnionDescriptor&) const { return "union"; }
        } visitor;
        return std::visit(visitor, method);
    }

    // K x K confident joint of (noisy label, latent label) for one pixel population.
    [[nodiscard]] inline JointEstimate Estimate(const torch::Tensor& labels,
                                                const torch::Tensor& probs,
                                                JointKind kind = JointKind::Qij,
                                                std::optional<std::int64_t> num_classes = std::nullopt) {
        const auto population = Details::prepare_population(labels, probs, num_classes);
        return Details::estimate_confident_joint(population, kind);
    }

    // Noise mask for a given joint and pruning rule, bool [N].
    [[nodiscard]] inline torch::Tensor Prune(const torch::Tensor& labels,
                                             const torch::Tensor& probs,
                                             const torch::Tensor& joint,
                                             PruneRule rule = PruneRule::Both,
                                             const Options& options = {}) {
        const auto population = Details::prepare_population(labels, probs, options.num_classes);
        return Details::prune_population(population, joint, rule, options);
    }

    // Estimates the joint(s) a method needs and prunes with it, bool [N].
    [[nodiscard]] inline torch::Tensor Detect(const torch::Tensor& labels,
                                              const torch::Tensor& probs,
                                              const Method& method = Both(),
                                              const Options& options = {}) {
        const auto population = Details::prepare_population(labels, probs, options.num_classes);
        auto run = [&](JointKind kind, PruneRule rule) {
            const auto estimate = Details::estimate_confident_joint(population, kind);
            return Details::prune_population(population, estimate.joint, rule, options);
        };

        struct {
            decltype(run)& prune;
            torch::Tensor operator()(const BothDescriptor&) const { return prune(JointKind::Qij, PruneRule::Both); }
            torch::Tensor operator()(const QijDescriptor&) const { return prune(JointKind::Qij, PruneRule::Both); }
            torch::Tensor operator()(const CijDescriptor&) const { return prune(JointKind::Cij, PruneRule::Both); }
            torch::Tensor operator()(const PruneByClassDescriptor&) const { return prune(JointKind::Qij, PruneRule::ByClass); }
            torch::Tensor operator()(const PruneByNoiseRateDescriptor&) const { return prune(JointKind::Qij, PruneRule::ByNoiseRate); }
            torch::Tensor operator()(const IntersectionDescriptor&) const {
                return prune(JointKind::Qij, PruneRule::Both).logical_and(prune(JointKind::Cij, PruneRule::Both));
            }
            torch::Tensor operator()(const UnionDescriptor&) const {
                return prune(JointKind::Qij, PruneRule::Both).logical_or(prune(JointKind::Cij, PruneRule::Both));
            }
        } visitor{run};
        return std::visit(visitor, method);
    }

    [[nodiscard]] inline torch::Tensor Detect(const torch::Tensor& labels,
                                              const torch::Tensor& probs,
                                              std::string_view method,
                                              const Options& options = {}) {
        return Detect(labels, probs, ParseMethod(method), options);
    }
}

#endif // VERITAS_NOISE_HPP
