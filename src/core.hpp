#ifndef VERITAS_CORE_HPP
#define VERITAS_CORE_HPP

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <variant>

#include <torch/torch.h>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "data/data.hpp"
#include "loss/loss.hpp"
#include "lrscheduler/lrscheduler.hpp"
#include "metric/metric.hpp"
#include "network/network.hpp"
#include "optimizer/optimizer.hpp"
#include "plot/plot.hpp"
#include "training/checkpoint.hpp"
#include "training/epoch.hpp"
#include "training/history.hpp"

namespace Veritas {
    inline constexpr const char* kConfigCopyFilename = "training_config.json";
    inline constexpr const char* kHistoryFilename = "validation_history.json";

    // "cpu", "cuda" or "cuda:<index>"; CUDA falls back to CPU when unavailable.
    inline torch::Device ResolveDevice(const std::string& name, Common::Logger* logger = nullptr) {
        std::optional<torch::Device> device;
        try {
            device.emplace(name);
        } catch (const c10::Error& error) {
            throw ConfigurationError("Unknown device '" + name + "': " + error.what_without_backtrace());
        }
        if (device->is_cuda() && !torch::cuda::is_available()) {
            if (logger != nullptr) {
                logger->warn("CUDA requested but not available, running on CPU.");
            }
            return torch::Device(torch::kCPU);
        }
        return *device;
    }

    /*
     * Full training run driven by a TrainingConfig:
     * fresh start or resume from the newest periodic checkpoint, then
     * (train, eval, lr step, checkpoint) for every remaining epoch.
     */
    class Trainer {
    public:
        struct Options {
            std::ostream* console{&std::cout};
        };

        explicit Trainer(Common::TrainingConfig config) : Trainer(std::move(config), Options{}) {}

        Trainer(Common::TrainingConfig config, Options options)
            : config_(std::move(config)), options_(options)
        {
            if (config_.general.saving_dir.empty()) {
                throw ConfigurationError("general.saving_dir must not be empty.");
            }
        }

        // Returns the best validation total overlap of the run.
        double run() {
            namespace fs = std::filesystem;
            const auto saving_dir = config_.general.saving_dir;
            const auto ckpt_dir = saving_dir / "ckpt";
            const bool fresh = !fs::exists(ckpt_dir) || fs::is_empty(ckpt_dir);
            fs::create_directories(ckpt_dir);
            if (fresh && !config_.source.empty()) {
                fs::copy_file(config_.source, saving_dir / kConfigCopyFilename, fs::copy_options::overwrite_existing);
            }

            Common::Logger logger(saving_dir, {.console = options_.console});
            const auto device = ResolveDevice(config_.general.device, &logger);

            auto network = Network::Make(config_.net.name, config_.net.in_channels, config_.net.out_channels);
            auto loss = Loss::Parse(config_.loss.name, config_.loss.slsr_epsilon);
            Network::CheckCompatibility(network, loss);
            if (std::holds_alternative<Loss::Details::SLSRDescriptor>(loss) && !config_.dataset.load_confident_map) {
                throw ConfigurationError("SLSRLoss requires dataset.load_confident_map to be true.");
            }
            auto& module = Network::Module(network);

            Checkpoint::Store store(ckpt_dir);
            Training::ValidationHistory history;
            std::int64_t start_epoch = 0;
            if (const auto latest = store.latest()) {
                store.load(module, store.periodic_path(*latest), device);
                start_epoch = *latest + 1;
                const auto history_path = saving_dir / kHistoryFilename;
                if (fs::exists(history_path)) {
                    history = Training::ValidationHistory::load(history_path);
                    history.truncate(static_cast<std::size_t>(start_epoch));
                } else {
                    logger.warn("No validation history found, the best score restarts from the resumed epoch.");
                }
                logger.write("Load ckpt: " + store.periodic_path(*latest).filename().string() + "...");
            } else {
                Network::ApplyKaimingInit(network);
                logger.write("Training from scratch...");
            }
            module.to(device);

            Data::LoadOptions training_data{
                .class_name = config_.dataset.class_name,
                .image_channels = config_.dataset.image_channels,
                .cropping_size = config_.dataset.cropping_size,
                .num_classes = config_.net.out_channels,
                .load_confidence_map = config_.dataset.load_confident_map,
                .confidence_map_method = config_.dataset.confident_map_method,
            };
            auto validation_data = training_data;
            validation_data.load_confidence_map = false;
            const auto training_set = Data::Load(config_.general.data_root_dir, "training", training_data);
            const auto validation_set = Data::Load(config_.general.data_root_dir, "validation", validation_data);
            logger.write("training images: " + std::to_string(training_set.size())
                         + ", validation images: " + std::to_string(validation_set.size()));

            Data::Loader training_loader(training_set, {.batch_size = config_.train.batch_size,
                                                        .shuffle = config_.dataset.shuffle,
                                                        .seed = config_.dataset.seed});
            Data::Loader validation_loader(validation_set, {.batch_size = config_.train.batch_size, .shuffle = false});

            auto optimizer = Optimizer::Build(module, Optimizer::Adam({.learning_rate = config_.lr_scheduler.lr}));
            auto scheduler = LrScheduler::Build(*optimizer, LrScheduler::Step({
                .step_size = static_cast<std::size_t>(config_.lr_scheduler.step_size),
                .gamma = config_.lr_scheduler.gamma}));
            for (std::int64_t epoch = 0; epoch < start_epoch; ++epoch) {
                scheduler->step();
            }

            auto sink = Plot::Make(config_.plot.enabled, saving_dir / "plots", {.command = config_.plot.gnuplot});
            Training::Orchestrator orchestrator(network, loss, Metric::Overlap(config_.net.out_channels), logger, *sink,
                                                {.update_batches = config_.plot.update_batches,
                                                 .total_epochs = config_.train.num_epochs,
                                                 .device = device});
            const Checkpoint::Policy policy(config_.train.save_epochs);

            for (std::int64_t epoch = start_epoch; epoch < config_.train.num_epochs; ++epoch) {
                std::ostringstream rate;
                rate << "epoch " << epoch << " learning rate: " << optimizer->param_groups().front().options().get_lr();
                logger.write(rate.str());
                orchestrator.run_epoch(true, epoch, training_loader.epoch(epoch), optimizer.get(), history);
                orchestrator.run_epoch(false, epoch, validation_loader.epoch(epoch), nullptr, history);
                scheduler->step();
                logger.flush();

                history.save(saving_dir / kHistoryFilename);
                const auto decision = store.apply(policy.decide(epoch, history), module, epoch, history);
                if (decision.periodic) {
                    logger.write("saved " + store.periodic_path(epoch).filename().string());
                }
                if (decision.best) {
                    std::ostringstream message;
                    message << "new best on validation set at epoch " << epoch << ": " << std::fixed
                            << std::setprecision(4) << history.latest().value_or(0.0);
                    logger.write(message.str());
                }
            }

            const double best = history.best().value_or(0.0);
            std::ostringstream summary;
            summary << "The best dice on validation set is " << best << ".";
            logger.write_and_print(summary.str());
            logger.flush();
            return best;
        }

        [[nodiscard]] const Common::TrainingConfig& config() const noexcept { return config_; }

    private:
        Common::TrainingConfig config_;
        Options options_{};
    };
}

#endif // VERITAS_CORE_HPP
