#ifndef VERITAS_PLOT_SINK_HPP
#define VERITAS_PLOT_SINK_HPP

#include <string>

#include <torch/torch.h>

#include "status.hpp"

namespace Veritas::Plot::Details {
    class Sink {
    public:
        virtual ~Sink() = default;
        // Appends the point (x, y) to `series` inside the curve window `window`.
        virtual Status line(const std::string& window, const std::string& series, double x, double y) = 0;
        // Replaces the image grid of `window` with `images` ([B, C, H, W] or [B, H, W]).
        virtual Status images(const std::string& window, const torch::Tensor& images) = 0;
    };

    class NullSink final : public Sink {
    public:
        Status line(const std::string&, const std::string&, double, double) override { return Status::Ok(); }
        Status images(const std::string&, const torch::Tensor&) override { return Status::Ok(); }
    };
}

#endif // VERITAS_PLOT_SINK_HPP
