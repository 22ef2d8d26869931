#ifndef VERITAS_LOSS_REDUCTION_HPP
#define VERITAS_LOSS_REDUCTION_HPP

#include <torch/torch.h>
#include <type_traits>

namespace Veritas::Loss::Details {

    enum class Reduction { Mean, Sum, None };

    // Use: to_torch_reduction<torch::nn::functional::CrossEntropyFuncOptions>(Reduction::Mean)
    template <typename Options>
    inline typename Options::reduction_t to_torch_reduction(Reduction r) {
        using RT = typename Options::reduction_t;
        static_assert(!std::is_void_v<RT>, "Options must define nested type 'reduction_t'");

        switch (r) {
            case Reduction::Sum:  return RT{torch::kSum};
            case Reduction::None: return RT{torch::kNone};
            case Reduction::Mean:
            default:              return RT{torch::kMean};
        }
    }

    inline torch::Tensor apply_reduction(torch::Tensor loss, Reduction reduction) {
        switch (reduction) {
            case Reduction::None:
                return loss;
            case Reduction::Sum:
                return loss.sum();
            case Reduction::Mean:
            default:
                return loss.mean();
        }
    }

    // Weighted mean normalizes by the weight mass, not by the element count.
    inline torch::Tensor apply_reduction_weighted(torch::Tensor loss, const torch::Tensor& weight, Reduction reduction) {
        auto w = weight.to(loss.options()).expand_as(loss);

        switch (reduction) {
            case Reduction::None:
                return loss * w;
            case Reduction::Sum:
                return (loss * w).sum();
            case Reduction::Mean:
            default: {
                auto num = (loss * w).sum();
                auto den = w.sum().clamp_min(1e-12);
                return num / den;
            }
        }
    }
}

#endif // VERITAS_LOSS_REDUCTION_HPP
