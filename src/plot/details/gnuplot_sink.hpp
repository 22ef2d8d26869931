#ifndef VERITAS_PLOT_GNUPLOT_SINK_HPP
#define VERITAS_PLOT_GNUPLOT_SINK_HPP

#include <csignal>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <torch/torch.h>

#include "../../utils/gnuplot.hpp"
#include "sink.hpp"

namespace Veritas::Plot::Details {
    struct GnuplotOptions {
        std::string command{"gnuplot"};
        std::string terminal{"png size 900,600"};
    };

    /*
     * Renders curve windows through a gnuplot pipe into <directory>/<window>.png
     * and image windows with OpenCV into <directory>/<window>.png.
     */
    class GnuplotSink final : public Sink {
    public:
        explicit GnuplotSink(std::filesystem::path directory, GnuplotOptions options = {})
            : directory_(std::move(directory)), options_(std::move(options))
        {
#ifndef _WIN32
            // A missing gnuplot binary must surface as a failed write, not a SIGPIPE.
            std::signal(SIGPIPE, SIG_IGN);
#endif
        }

        Status line(const std::string& window, const std::string& series, double x, double y) override {
            auto& curves = windows_[window];
            auto& curve = curves[series];
            curve.name = series;
            curve.x.push_back(x);
            curve.y.push_back(y);
            try {
                render_curves(window, curves);
            } catch (const std::exception& error) {
                plotter_.reset();
                return Status::Failure("plot window '" + window + "': " + error.what());
            }
            return Status::Ok();
        }

        Status images(const std::string& window, const torch::Tensor& images) override {
            try {
                std::filesystem::create_directories(directory_);
                const auto path = directory_ / (window + ".png");
                if (!cv::imwrite(path.string(), to_grid(images))) {
                    return Status::Failure("failed to write image window " + path.string());
                }
            } catch (const std::exception& error) {
                return Status::Failure("image window '" + window + "': " + error.what());
            }
            return Status::Ok();
        }

    private:
        using Curves = std::map<std::string, Utils::Gnuplot::Series>;

        void render_curves(const std::string& window, const Curves& curves) {
            std::filesystem::create_directories(directory_);
            if (!plotter_) {
                plotter_ = std::make_unique<Utils::Gnuplot>(options_.command, options_.terminal);
            }
            Utils::Gnuplot::Figure figure{.title = window};
            for (const auto& [name, curve] : curves) {
                figure.series.push_back(curve);
            }
            plotter_->render((directory_ / (window + ".png")).string(), figure);
        }

        // Stacks the batch vertically (one sample per row), min-max scaled to bytes.
        static cv::Mat to_grid(const torch::Tensor& images) {
            auto grid = images.detach().to(torch::kCPU, torch::kFloat32);
            if (grid.dim() == 4) {
                grid = grid.select(1, 0);
            }
            if (grid.dim() != 3) {
                throw std::invalid_argument("image windows expect [B, C, H, W] or [B, H, W] tensors");
            }
            grid = grid.reshape({grid.size(0) * grid.size(1), grid.size(2)});
            const auto low = grid.min().item<float>();
            const auto high = grid.max().item<float>();
            grid = high > low ? (grid - low) / (high - low) : torch::zeros_like(grid);
            auto bytes = grid.mul(255.0).round().to(torch::kUInt8).contiguous();
            cv::Mat image(static_cast<int>(bytes.size(0)), static_cast<int>(bytes.size(1)), CV_8UC1, bytes.data_ptr<std::uint8_t>());
            return image.clone();
        }

        std::filesystem::path directory_;
        GnuplotOptions options_{};
        std::map<std::string, Curves> windows_{};
        std::unique_ptr<Utils::Gnuplot> plotter_{};
    };
}

#endif // VERITAS_PLOT_GNUPLOT_SINK_HPP
