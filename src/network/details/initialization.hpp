#ifndef VERITAS_NETWORK_INITIALIZATION_HPP
#define VERITAS_NETWORK_INITIALIZATION_HPP
#include <torch/torch.h>

namespace Veritas::Network::Details {
    namespace detail {
        template <class Module>
        inline void zero_bias_if_present(Module* module) {
            if constexpr (requires { module->bias; }) {
                if (module->bias.defined()) {
                    torch::nn::init::zeros_(module->bias);
                }
            }
        }

        template <class Module>
        inline bool kaiming_normal_if(torch::nn::Module& candidate) {
            auto* module = candidate.as<Module>();
            if (module == nullptr) {
                return false;
            }
            torch::nn::init::kaiming_normal_(module->weight,
                                             /*a=*/0.0,
                                             torch::kFanIn,
                                             torch::kReLU);
            zero_bias_if_present(module);
            return true;
        }
    }  // namespace detail

    // Kaiming-normal weights and zero biases for every convolution and linear layer.
    inline void apply_kaiming_initialization(torch::nn::Module& network) {
        torch::NoGradGuard no_grad;
        for (const auto& child : network.modules(/*include_self=*/false)) {
            if (detail::kaiming_normal_if<torch::nn::Conv2dImpl>(*child)) continue;
            if (detail::kaiming_normal_if<torch::nn::ConvTranspose2dImpl>(*child)) continue;
            detail::kaiming_normal_if<torch::nn::LinearImpl>(*child);
        }
    }
}
#endif // VERITAS_NETWORK_INITIALIZATION_HPP
