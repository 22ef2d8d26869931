#ifndef VERITAS_INFERENCE_ACCUMULATE_HPP
#define VERITAS_INFERENCE_ACCUMULATE_HPP

#include <cstdint>
#include <iostream>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../common/errors.hpp"
#include "../confidence/confidence.hpp"
#include "../data/data.hpp"
#include "../network/network.hpp"
#include "../utils/progressbar.hpp"

namespace Veritas::Inference {
    // One evaluation pass, flattened in iteration order (images concatenated, pixels row-major).
    struct Accumulation {
        torch::Tensor labels{}; // int64 [N]
        torch::Tensor probs{};  // float32 [N, K], channel-last softmax
        std::vector<std::string> filenames{};
        std::vector<Confidence::ImageShape> shapes{};

        [[nodiscard]] std::int64_t pixels() const { return labels.defined() ? labels.size(0) : 0; }
    };

    struct AccumulateOptions {
        torch::Device device{torch::kCPU};
        std::ostream* progress{&std::cout}; // null disables the progress bar
    };

    inline Accumulation Accumulate(const Network::Handle& network,
                                   const std::vector<Data::Batch>& batches,
                                   const AccumulateOptions& options = {})
    {
        auto& module = Network::Module(network);
        module.eval();
        torch::NoGradGuard no_grad;

        Utils::ProgressBar progress(static_cast<std::int64_t>(batches.size()), "predict", options.progress);
        std::vector<torch::Tensor> labels;
        std::vector<torch::Tensor> probs;
        Accumulation accumulation{};

        for (std::size_t index = 0; index < batches.size(); ++index) {
            const auto& batch = batches[index];
            auto logits = Network::Segment(network, batch.images.to(options.device));
            if (logits.dim() != 4 || logits.size(0) != batch.labels.size(0)
                || logits.size(2) != batch.labels.size(1) || logits.size(3) != batch.labels.size(2)) {
                std::ostringstream message;
                message << "Network output " << logits.sizes() << " does not match labels " << batch.labels.sizes() << ".";
                throw DataShapeError(message.str());
            }
            const auto K = logits.size(1);
            probs.push_back(torch::softmax(logits, 1).permute({0, 2, 3, 1}).reshape({-1, K}).to(torch::kCPU, torch::kFloat32));
            labels.push_back(batch.labels.reshape({-1}).to(torch::kCPU, torch::kLong));
            for (const auto& filename : batch.filenames) {
                accumulation.filenames.push_back(filename);
                accumulation.shapes.push_back({batch.labels.size(1), batch.labels.size(2)});
            }
            progress.update(static_cast<std::int64_t>(index + 1));
        }

        if (labels.empty()) {
            throw DataShapeError("Prediction pass requires at least one batch.");
        }
        accumulation.labels = torch::cat(labels);
        accumulation.probs = torch::cat(probs);
        return accumulation;
    }
}

#endif // VERITAS_INFERENCE_ACCUMULATE_HPP
