#ifndef VERITAS_TRAINING_EPOCH_HPP
#define VERITAS_TRAINING_EPOCH_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <numeric>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "../common/logger.hpp"
#include "../data/data.hpp"
#include "../loss/loss.hpp"
#include "../metric/metric.hpp"
#include "../network/network.hpp"
#include "../plot/plot.hpp"
#include "../utils/terminal.hpp"
#include "history.hpp"

namespace Veritas::Training {
    struct EpochSummary {
        std::int64_t epoch_index{0};
        bool training{false};
        double loss{0.0};                   // mean of batch losses
        std::vector<double> class_overlap{}; // element-wise mean of batch Dice vectors
        double total_overlap{0.0};          // mean over classes
        double duration_seconds{0.0};
        std::size_t batches{0};
    };

    struct OrchestratorOptions {
        std::int64_t update_batches{10};  // image windows refresh every n-th batch
        std::int64_t total_epochs{0};     // only used for the epoch header
        torch::Device device{torch::kCPU};
    };

    namespace Details {
        inline std::vector<double> mean_rows(const std::vector<std::vector<double>>& rows) {
            std::vector<double> mean(rows.front().size(), 0.0);
            for (const auto& row : rows) {
                for (std::size_t k = 0; k < mean.size(); ++k) {
                    mean[k] += row[k];
                }
            }
            for (auto& value : mean) {
                value /= static_cast<double>(rows.size());
            }
            return mean;
        }

        inline std::string log_epoch(const EpochSummary& summary, std::int64_t total_epochs) {
            using Utils::Terminal::ApplyColor;
            using Utils::Terminal::Colors::kBrightBlack;
            using Utils::Terminal::Colors::kBrightBlue;
            using Utils::Terminal::Colors::kBrightYellow;

            std::ostringstream line;
            line << "Epoch [" << summary.epoch_index << "/" << total_epochs << "] | ";
            line << (summary.training ? ApplyColor("Train", kBrightYellow) : ApplyColor("Eval", kBrightBlue)) << " loss: "
                 << std::fixed << std::setprecision(4) << summary.loss << " | dice: ";
            for (std::size_t k = 0; k < summary.class_overlap.size(); ++k) {
                line << (k == 0 ? "[" : ", ") << std::setprecision(4) << summary.class_overlap[k];
            }
            line << "] | total dice: " << std::setprecision(4) << summary.total_overlap;

            std::ostringstream duration_stream;
            duration_stream << std::fixed << std::setprecision(2) << summary.duration_seconds << "sec";
            line << " | " << ApplyColor("duration: " + duration_stream.str(), kBrightBlack);
            return line.str();
        }
    }

    /*
     * Runs one train or evaluation pass over a list of batches.
     * Training: forward, loss, zero_grad, backward, one optimizer step per batch.
     * Evaluation: eval mode under NoGradGuard, the optimizer is never touched and
     * the total overlap is appended to the validation history.
     * Forward/loss failures propagate; plot failures are logged as warnings.
     */
    class Orchestrator {
    public:
        Orchestrator(Network::Handle network,
                     Loss::Descriptor loss,
                     Metric::Overlap metric,
                     Common::Logger& logger,
                     Plot::Sink& sink,
                     OrchestratorOptions options = {})
            : network_(std::move(network)),
              loss_(std::move(loss)),
              metric_(std::move(metric)),
              logger_(&logger),
              sink_(&sink),
              options_(std::move(options))
        {
            Network::CheckCompatibility(network_, loss_);
            if (options_.update_batches <= 0) {
                throw std::invalid_argument("update_batches must be positive.");
            }
        }

        EpochSummary run_epoch(bool training,
                               std::int64_t epoch_index,
                               const std::vector<Data::Batch>& batches,
                               torch::optim::Optimizer* optimizer,
                               ValidationHistory& history)
        {
            if (epoch_index < 0) {
                throw std::invalid_argument("Epoch index must be non-negative.");
            }
            if (training && optimizer == nullptr) {
                throw std::invalid_argument("A training epoch requires an optimizer.");
            }
            if (batches.empty()) {
                throw std::invalid_argument("An epoch requires at least one batch.");
            }

            auto& module = Network::Module(network_);
            module.train(training);
            std::optional<torch::NoGradGuard> no_grad;
            if (!training) {
                no_grad.emplace();
            }

            const std::string phase = training ? "training" : "evaluating";
            logger_->rule();
            logger_->write("start " + phase + " epoch: " + std::to_string(epoch_index));

            const auto epoch_start = std::chrono::steady_clock::now();
            std::vector<double> batch_losses;
            std::vector<std::vector<double>> batch_overlaps;
            batch_losses.reserve(batches.size());
            batch_overlaps.reserve(batches.size());

            for (std::size_t batch_index = 0; batch_index < batches.size(); ++batch_index) {
                const auto batch_start = std::chrono::steady_clock::now();
                const auto& batch = batches[batch_index];
                auto images = batch.images.to(options_.device);
                auto labels = batch.labels.to(options_.device, torch::kLong);

                auto prediction = forward(images, labels);
                auto loss = compute_loss(prediction, labels, batch);
                const double loss_value = loss.item<double>();
                batch_losses.push_back(loss_value);

                if (training) {
                    optimizer->zero_grad();
                    loss.backward();
                    optimizer->step();
                }

                auto [predicted, overlap] = metric_.score_batch(prediction.logits, labels);
                batch_overlaps.push_back(std::move(overlap));

                const auto batch_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - batch_start).count();
                std::ostringstream record;
                record << "epoch: " << epoch_index << ", batch: " << batch_index << ", loss: " << std::fixed
                       << std::setprecision(4) << loss_value << ", consuming time: " << batch_seconds << "s";
                logger_->write(record.str());

                if (static_cast<std::int64_t>(batch_index) % options_.update_batches == 0) {
                    const std::string suffix = training ? "T" : "V";
                    report(sink_->images("I" + suffix, batch.images));
                    report(sink_->images("O" + suffix, predicted.to(torch::kFloat32)));
                    report(sink_->images("L" + suffix, batch.labels.to(torch::kFloat32)));
                }
            }

            EpochSummary summary{};
            summary.epoch_index = epoch_index;
            summary.training = training;
            summary.batches = batches.size();
            summary.loss = std::accumulate(batch_losses.begin(), batch_losses.end(), 0.0) / static_cast<double>(batch_losses.size());
            summary.class_overlap = Details::mean_rows(batch_overlaps);
            summary.total_overlap = std::accumulate(summary.class_overlap.begin(), summary.class_overlap.end(), 0.0)
                                    / static_cast<double>(summary.class_overlap.size());
            summary.duration_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - epoch_start).count();

            if (!training) {
                history.append(summary.total_overlap);
            }

            logger_->write(phase + " of epoch " + std::to_string(epoch_index) + " finished");
            logger_->write_and_print(Details::log_epoch(summary, options_.total_epochs));
            logger_->rule();

            const auto x = static_cast<double>(epoch_index);
            const std::string series = training ? "training" : "validation";
            report(sink_->line("loss", series + "_loss", x, summary.loss));
            report(sink_->line("metrics_total_dice", series, x, summary.total_overlap));
            for (std::size_t k = 0; k < summary.class_overlap.size(); ++k) {
                report(sink_->line("metrics_dice_class_" + std::to_string(k), series, x, summary.class_overlap[k]));
            }
            return summary;
        }

        [[nodiscard]] const Network::Handle& network() const noexcept { return network_; }
        [[nodiscard]] const Loss::Descriptor& loss() const noexcept { return loss_; }

    private:
        Network::WeightedLogits forward(const torch::Tensor& images, const torch::Tensor& labels) {
            struct {
                const torch::Tensor& images;
                const torch::Tensor& labels;
                Network::WeightedLogits operator()(const Network::Plain& network) const {
                    return {network->forward(images), {}};
                }
                Network::WeightedLogits operator()(const Network::LabelGuided& network) const {
                    return network->forward(images, labels);
                }
            } visitor{images, labels};
            return std::visit(visitor, network_);
        }

        torch::Tensor compute_loss(const Network::WeightedLogits& prediction, const torch::Tensor& labels, const Data::Batch& batch) {
            const auto device = options_.device;
            struct {
                const Network::WeightedLogits& prediction;
                const torch::Tensor& labels;
                const Data::Batch& batch;
                torch::Device device;
                torch::Tensor operator()(const Loss::Details::CrossEntropyDescriptor& descriptor) const {
                    return Loss::Details::compute(descriptor, prediction.logits, labels);
                }
                torch::Tensor operator()(const Loss::Details::SLSRDescriptor& descriptor) const {
                    auto maps = batch.confidence_maps.defined() ? batch.confidence_maps.to(device) : torch::Tensor{};
                    return Loss::Details::compute(descriptor, prediction.logits, labels, maps);
                }
                torch::Tensor operator()(const Loss::Details::WeightedCrossEntropyDescriptor& descriptor) const {
                    return Loss::Details::compute(descriptor, prediction.logits, labels, prediction.weights);
                }
            } visitor{prediction, labels, batch, device};
            return std::visit(visitor, loss_);
        }

        void report(const Plot::Status& status) {
            if (!status) {
                logger_->warn("visualization failed: " + status.message);
            }
        }

        Network::Handle network_;
        Loss::Descriptor loss_;
        Metric::Overlap metric_;
        Common::Logger* logger_;
        Plot::Sink* sink_;
        OrchestratorOptions options_{};
    };
}

#endif // VERITAS_TRAINING_EPOCH_HPP
