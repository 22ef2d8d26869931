#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <cxxopts.hpp>

#include "../../include/Veritas.h"

namespace {
    // Network, dataset and device settings are taken from the run that produced sub-model 1.
    void apply_training_config(const Veritas::Common::TrainingConfig& config,
                               Veritas::Inference::DetectionOptions& detection,
                               Veritas::Common::Logger& logger) {
        detection.net_name = config.net.name;
        detection.in_channels = config.net.in_channels;
        detection.out_channels = config.net.out_channels;
        detection.image_channels = config.dataset.image_channels;
        detection.cropping_size = config.dataset.cropping_size;
        detection.device = Veritas::ResolveDevice(config.general.device, &logger);
    }
}

int main(int argc, char** argv) {
    namespace fs = std::filesystem;
    cxxopts::Options options("veritas_detect_noise",
                             "Cross-evaluate two sub-models and write confidence maps of suspected label noise");
    options.add_options()
        ("data-root-dir", "Dataset root holding sub-1, sub-2 and all", cxxopts::value<std::string>())
        ("model-sub-1-saving-dir", "Saving directory of the model trained on sub-1", cxxopts::value<std::string>())
        ("model-sub-2-saving-dir", "Saving directory of the model trained on sub-2 (derived from sub-1 when absent)", cxxopts::value<std::string>())
        ("label-class-name", "Label class to evaluate", cxxopts::value<std::string>())
        ("methods", "Comma separated pruning methods", cxxopts::value<std::vector<std::string>>()->default_value("both"))
        ("dataset-type", "Subset to evaluate: training or validation", cxxopts::value<std::string>()->default_value("training"))
        ("batch-size", "Inference batch size", cxxopts::value<std::int64_t>()->default_value("4"))
        ("epoch-idx", "Checkpoint epoch to load, negative selects the best one", cxxopts::value<std::int64_t>()->default_value("-1"))
        ("config", "Training configuration (defaults to <model-sub-1-saving-dir>/training_config.json)", cxxopts::value<std::string>())
        ("h,help", "Print usage");

    try {
        const auto result = options.parse(argc, argv);
        if (result.count("help") > 0) {
            std::cout << options.help() << std::endl;
            return 0;
        }
        for (const char* required : {"data-root-dir", "model-sub-1-saving-dir", "label-class-name"}) {
            if (result.count(required) == 0) {
                std::cerr << "Missing required option --" << required << std::endl << options.help() << std::endl;
                return 1;
            }
        }

        Veritas::Inference::DetectionOptions detection{};
        detection.data_root_dir = result["data-root-dir"].as<std::string>();
        detection.model_sub_1_saving_dir = result["model-sub-1-saving-dir"].as<std::string>();
        if (result.count("model-sub-2-saving-dir") > 0) {
            detection.model_sub_2_saving_dir = fs::path(result["model-sub-2-saving-dir"].as<std::string>());
        }
        detection.class_name = result["label-class-name"].as<std::string>();
        detection.methods = result["methods"].as<std::vector<std::string>>();
        detection.dataset_type = result["dataset-type"].as<std::string>();
        detection.batch_size = result["batch-size"].as<std::int64_t>();
        detection.epoch_index = result["epoch-idx"].as<std::int64_t>();
        if (detection.batch_size <= 0) {
            throw Veritas::ConfigurationError("--batch-size must be positive.");
        }

        auto logger = Veritas::Common::Logger(detection.model_sub_1_saving_dir, {.filename = "noise_detection_log.txt"});

        const fs::path config_path = result.count("config") > 0
                                         ? fs::path(result["config"].as<std::string>())
                                         : detection.model_sub_1_saving_dir / Veritas::kConfigCopyFilename;
        if (fs::exists(config_path)) {
            apply_training_config(Veritas::Common::LoadTrainingConfig(config_path), detection, logger);
            logger.write("network settings from " + config_path.string());
        } else if (result.count("config") > 0) {
            throw Veritas::ConfigurationError("Configuration file not found: " + config_path.string());
        } else {
            logger.warn("No training configuration found at " + config_path.string() + ", using default network settings.");
        }

        const auto flagged = Veritas::Inference::RunNoiseDetection(detection, logger);
        std::int64_t total = 0;
        for (const auto count : flagged) {
            total += count;
        }
        logger.write_and_print("Noise detection finished, " + std::to_string(total) + " flags over "
                               + std::to_string(flagged.size()) + " method(s).");
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
