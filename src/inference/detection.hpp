#ifndef VERITAS_INFERENCE_DETECTION_HPP
#define VERITAS_INFERENCE_DETECTION_HPP

#include <array>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../confidence/confidence.hpp"
#include "../data/data.hpp"
#include "../network/network.hpp"
#include "../noise/noise.hpp"
#include "../training/checkpoint.hpp"
#include "accumulate.hpp"

namespace Veritas::Inference {
    struct DetectionOptions {
        std::filesystem::path data_root_dir{};
        std::filesystem::path model_sub_1_saving_dir{};
        std::optional<std::filesystem::path> model_sub_2_saving_dir{};
        std::string class_name{};
        std::vector<std::string> methods{"both"};
        std::string dataset_type{"training"};
        std::int64_t batch_size{4};
        std::int64_t epoch_index{-1}; // negative selects the best checkpoint
        std::string net_name{"vnet2d"};
        std::int64_t in_channels{1};
        std::int64_t out_channels{2};
        std::int64_t image_channels{1};
        std::array<std::int64_t, 2> cropping_size{256, 256};
        torch::Device device{torch::kCPU};
        Noise::Options noise{};
        std::ostream* progress{&std::cout};
    };

    // Sub-model 2 lives next to sub-model 1 with "sub_1" replaced by "sub_2" unless given explicitly.
    inline std::filesystem::path SubModelTwoDirectory(const DetectionOptions& options) {
        if (options.model_sub_2_saving_dir) {
            return *options.model_sub_2_saving_dir;
        }
        auto path = options.model_sub_1_saving_dir.string();
        const auto position = path.rfind("sub_1");
        if (position == std::string::npos) {
            throw ConfigurationError("Cannot derive the sub_2 model directory from '" + path
                                     + "'; pass --model-sub-2-saving-dir.");
        }
        path.replace(position, 5, "sub_2");
        return path;
    }

    /*
     * Cross evaluation: model 1 (trained on sub-1) predicts sub-2 and model 2
     * predicts sub-1. Every requested method writes its confidence maps to
     * <root>/all/<subset>/<class>-confident-maps[-method].
     * Returns the number of pixels flagged per method, summed over both models.
     */
    inline std::vector<std::int64_t> RunNoiseDetection(const DetectionOptions& options, Common::Logger& logger) {
        std::vector<Noise::Method> methods;
        for (const auto& name : options.methods) {
            methods.push_back(Noise::ParseMethod(name));
        }
        if (methods.empty()) {
            throw ConfigurationError("At least one noise detection method is required.");
        }
        Data::Details::validate_subset(options.dataset_type);

        auto noise_options = options.noise;
        noise_options.num_classes = options.out_channels;
        std::vector<std::int64_t> flagged(methods.size(), 0);

        const std::array<std::filesystem::path, 2> model_dirs{options.model_sub_1_saving_dir, SubModelTwoDirectory(options)};
        const std::array<const char*, 2> source_halves{"sub-2", "sub-1"};

        for (std::size_t model = 0; model < model_dirs.size(); ++model) {
            auto network = Network::Make(options.net_name, options.in_channels, options.out_channels);
            const Checkpoint::Store store(model_dirs[model] / "ckpt");
            const auto checkpoint = store.resolve(options.epoch_index);
            store.load(Network::Module(network), checkpoint, options.device);
            Network::Module(network).to(options.device);
            logger.write_and_print("sub model " + std::to_string(model + 1) + ": loaded " + checkpoint.string());

            const auto source = options.data_root_dir / source_halves[model];
            const auto dataset = Data::Load(source, options.dataset_type, {
                .class_name = options.class_name,
                .image_channels = options.image_channels,
                .cropping_size = options.cropping_size,
                .num_classes = options.out_channels,
                .load_confidence_map = false,
            });
            const Data::Loader loader(dataset, {.batch_size = options.batch_size, .shuffle = false});
            const auto accumulation = Accumulate(network, loader.epoch(0), {.device = options.device, .progress = options.progress});

            for (std::size_t index = 0; index < methods.size(); ++index) {
                const auto name = Noise::MethodName(methods[index]);
                const auto mask = Noise::Detect(accumulation.labels, accumulation.probs, methods[index], noise_options);
                const auto maps = Confidence::Assemble(mask, accumulation.shapes, accumulation.filenames);
                const auto directory = Confidence::OutputDirectory(options.data_root_dir, options.dataset_type, options.class_name, name);
                Confidence::Write(maps, directory);

                const auto count = mask.sum().item<std::int64_t>();
                flagged[index] += count;
                std::ostringstream message;
                message << "sub model " << (model + 1) << " | " << name << ": " << count << " / " << accumulation.pixels()
                        << " pixels flagged (" << std::fixed << std::setprecision(2)
                        << (100.0 * static_cast<double>(count) / static_cast<double>(accumulation.pixels())) << "%) -> "
                        << directory.string();
                logger.write_and_print(message.str());
            }
        }
        logger.flush();
        return flagged;
    }
}

#endif // VERITAS_INFERENCE_DETECTION_HPP
