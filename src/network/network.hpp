#ifndef VERITAS_NETWORK_HPP
#define VERITAS_NETWORK_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>

#include <torch/torch.h>

#include "../common/errors.hpp"
#include "../loss/loss.hpp"
#include "details/initialization.hpp"
#include "details/interface.hpp"
#include "details/plnet2d.hpp"
#include "details/vnet2d.hpp"

namespace Veritas::Network {
    using PlainNetwork = Details::PlainNetwork;
    using LabelGuidedNetwork = Details::LabelGuidedNetwork;
    using WeightedLogits = Details::WeightedLogits;

    using Plain = std::shared_ptr<PlainNetwork>;
    using LabelGuided = std::shared_ptr<LabelGuidedNetwork>;
    using Handle = std::variant<Plain, LabelGuided>;

    [[nodiscard]] inline Plain VNet2d(std::int64_t in_channels, std::int64_t out_channels) {
        return std::make_shared<Details::VNet2dImpl>(in_channels, out_channels);
    }

    [[nodiscard]] inline LabelGuided PLNet2d(std::int64_t in_channels, std::int64_t out_channels) {
        return std::make_shared<Details::PLNet2dImpl>(in_channels, out_channels);
    }

    // Configuration names: vnet2d (alias vnet2d_v3) and pick_and_learn.
    [[nodiscard]] inline Handle Make(std::string_view name, std::int64_t in_channels, std::int64_t out_channels) {
        if (name == "vnet2d" || name == "vnet2d_v3") return VNet2d(in_channels, out_channels);
        if (name == "pick_and_learn") return PLNet2d(in_channels, out_channels);
        std::ostringstream message;
        message << "Unknown network '" << name << "' (expected vnet2d, vnet2d_v3 or pick_and_learn).";
        throw ConfigurationError(message.str());
    }

    [[nodiscard]] inline torch::nn::Module& Module(const Handle& handle) {
        return std::visit([](const auto& network) -> torch::nn::Module& {
            if (!network) {
                throw std::invalid_argument("Network handle is empty.");
            }
            return *network;
        }, handle);
    }

    [[nodiscard]] inline std::string Name(const Handle& handle) {
        return std::visit([](const auto& network) { return network ? network->kind() : std::string{"<empty>"}; }, handle);
    }

    // Segmentation logits without label guidance, for prediction passes.
    [[nodiscard]] inline torch::Tensor Segment(const Handle& handle, const torch::Tensor& images) {
        struct {
            const torch::Tensor& images;
            torch::Tensor operator()(const Plain& network) const { return network->forward(images); }
            torch::Tensor operator()(const LabelGuided& network) const { return network->segment(images); }
        } visitor{images};
        return std::visit(visitor, handle);
    }

    inline void ApplyKaimingInit(const Handle& handle) {
        Details::apply_kaiming_initialization(Module(handle));
    }

    // Weighted cross entropy consumes per-sample weights, which only label-guided networks produce.
    inline void CheckCompatibility(const Handle& handle, const Loss::Descriptor& loss) {
        if (std::holds_alternative<Loss::Details::WeightedCrossEntropyDescriptor>(loss)
            && !std::holds_alternative<LabelGuided>(handle)) {
            std::ostringstream message;
            message << "Loss " << Loss::Name(loss) << " requires a label-guided network (pick_and_learn), got "
                    << Name(handle) << ".";
            throw ConfigurationError(message.str());
        }
    }
}

#endif // VERITAS_NETWORK_HPP
