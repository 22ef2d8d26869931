#ifndef VERITAS_COMMON_CONFIG_HPP
#define VERITAS_COMMON_CONFIG_HPP

#include <array>
#include <cstdint>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include "errors.hpp"
#include "save_load.hpp"
#include "../noise/noise.hpp"

namespace Veritas::Common {
    struct GeneralConfig {
        std::filesystem::path data_root_dir{};
        std::filesystem::path saving_dir{};
        std::string device{"cpu"};
    };

    struct DatasetConfig {
        std::string class_name{};
        std::int64_t image_channels{1};
        std::array<std::int64_t, 2> cropping_size{256, 256};
        bool load_confident_map{false};
        std::string confident_map_method{"both"};
        bool shuffle{true};
        std::uint64_t seed{0};
    };

    struct NetConfig {
        std::string name{"vnet2d"};
        std::int64_t in_channels{1};
        std::int64_t out_channels{2};
    };

    struct LossConfig {
        std::string name{"CrossEntropyLoss"};
        double slsr_epsilon{0.25};
    };

    struct TrainConfig {
        std::int64_t num_epochs{1};
        std::int64_t batch_size{4};
        std::int64_t save_epochs{1};
    };

    struct LrSchedulerConfig {
        double lr{1e-3};
        std::int64_t step_size{50};
        double gamma{0.1};
    };

    struct PlotConfig {
        bool enabled{false};
        std::int64_t update_batches{10};
        std::string gnuplot{"gnuplot"};
    };

    struct TrainingConfig {
        GeneralConfig general{};
        DatasetConfig dataset{};
        NetConfig net{};
        LossConfig loss{};
        TrainConfig train{};
        LrSchedulerConfig lr_scheduler{};
        PlotConfig plot{};
        std::filesystem::path source{}; // file the configuration was read from
    };

    namespace Detail {
        using SaveLoad::PropertyTree;
        using SaveLoad::Detail::get_boolean;
        using SaveLoad::Detail::get_numeric;
        using SaveLoad::Detail::get_string;

        inline const PropertyTree& section(const PropertyTree& tree, const std::string& key) {
            const auto child = tree.get_child_optional(key);
            if (!child) {
                throw ConfigurationError("Missing configuration section '" + key + "'");
            }
            return *child;
        }

        inline void require_positive(std::int64_t value, const std::string& key) {
            if (value <= 0) {
                std::ostringstream message;
                message << "Configuration field '" << key << "' must be positive, got " << value;
                throw ConfigurationError(message.str());
            }
        }
    }

    /*
     * Reads a JSON training configuration. Sections: general, dataset, net,
     * loss, train, lr_scheduler and the optional plot. Missing or mistyped
     * fields raise ConfigurationError naming the key.
     */
    inline TrainingConfig ParseTrainingConfig(const SaveLoad::PropertyTree& tree) {
        using namespace Detail;
        TrainingConfig config{};

        const auto& general = section(tree, "general");
        config.general.data_root_dir = get_string(general, "data_root_dir", "general");
        config.general.saving_dir = get_string(general, "saving_dir", "general");
        config.general.device = general.get<std::string>("device", config.general.device);

        const auto& dataset = section(tree, "dataset");
        config.dataset.class_name = get_string(dataset, "class_name", "dataset");
        config.dataset.image_channels = get_numeric<std::int64_t>(dataset, "image_channels", "dataset");
        const auto cropping = SaveLoad::Detail::read_array<std::int64_t>(section(dataset, "cropping_size"), "dataset.cropping_size");
        if (cropping.size() != 2) {
            throw ConfigurationError("Field 'cropping_size' in dataset must hold [height, width]");
        }
        config.dataset.cropping_size = {cropping[0], cropping[1]};
        require_positive(cropping[0], "dataset.cropping_size");
        require_positive(cropping[1], "dataset.cropping_size");
        config.dataset.load_confident_map = get_boolean(dataset, "load_confident_map", "dataset");
        if (dataset.get_child_optional("confident_map_method")) {
            config.dataset.confident_map_method = get_string(dataset, "confident_map_method", "dataset");
            (void)Noise::ParseMethod(config.dataset.confident_map_method);
        }
        if (dataset.get_child_optional("shuffle")) {
            config.dataset.shuffle = get_boolean(dataset, "shuffle", "dataset");
        }
        if (dataset.get_child_optional("seed")) {
            config.dataset.seed = get_numeric<std::uint64_t>(dataset, "seed", "dataset");
        }

        const auto& net = section(tree, "net");
        config.net.name = get_string(net, "name", "net");
        config.net.in_channels = get_numeric<std::int64_t>(net, "in_channels", "net");
        config.net.out_channels = get_numeric<std::int64_t>(net, "out_channels", "net");
        require_positive(config.net.in_channels, "net.in_channels");
        require_positive(config.net.out_channels, "net.out_channels");

        const auto& loss = section(tree, "loss");
        config.loss.name = get_string(loss, "name", "loss");
        if (loss.get_child_optional("slsr_epsilon")) {
            config.loss.slsr_epsilon = get_numeric<double>(loss, "slsr_epsilon", "loss");
        }

        const auto& train = section(tree, "train");
        config.train.num_epochs = get_numeric<std::int64_t>(train, "num_epochs", "train");
        config.train.batch_size = get_numeric<std::int64_t>(train, "batch_size", "train");
        config.train.save_epochs = get_numeric<std::int64_t>(train, "save_epochs", "train");
        require_positive(config.train.num_epochs, "train.num_epochs");
        require_positive(config.train.batch_size, "train.batch_size");
        require_positive(config.train.save_epochs, "train.save_epochs");

        const auto& scheduler = section(tree, "lr_scheduler");
        config.lr_scheduler.lr = get_numeric<double>(scheduler, "lr", "lr_scheduler");
        config.lr_scheduler.step_size = get_numeric<std::int64_t>(scheduler, "step_size", "lr_scheduler");
        config.lr_scheduler.gamma = get_numeric<double>(scheduler, "gamma", "lr_scheduler");
        require_positive(config.lr_scheduler.step_size, "lr_scheduler.step_size");

        if (const auto plot = tree.get_child_optional("plot")) {
            config.plot.enabled = get_boolean(*plot, "enabled", "plot");
            if (plot->get_child_optional("update_batches")) {
                config.plot.update_batches = get_numeric<std::int64_t>(*plot, "update_batches", "plot");
                require_positive(config.plot.update_batches, "plot.update_batches");
            }
            if (plot->get_child_optional("gnuplot")) {
                config.plot.gnuplot = get_string(*plot, "gnuplot", "plot");
            }
        }
        return config;
    }

    inline TrainingConfig LoadTrainingConfig(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path)) {
            throw ConfigurationError("Configuration file not found: " + path.string());
        }
        auto config = ParseTrainingConfig(SaveLoad::read_json_file(path));
        config.source = path;
        return config;
    }
}

#endif // VERITAS_COMMON_CONFIG_HPP
