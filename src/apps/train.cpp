#include <exception>
#include <iostream>
#include <string>

#include <cxxopts.hpp>

#include "../../include/Veritas.h"

int main(int argc, char** argv) {
    cxxopts::Options options("veritas_train", "Train a segmentation network on one half of a noisy-label dataset");
    options.add_options()
        ("c,config", "Path to the JSON training configuration", cxxopts::value<std::string>())
        ("h,help", "Print usage");

    try {
        const auto result = options.parse(argc, argv);
        if (result.count("help") > 0) {
            std::cout << options.help() << std::endl;
            return 0;
        }
        if (result.count("config") == 0) {
            std::cerr << "Missing required option --config" << std::endl << options.help() << std::endl;
            return 1;
        }

        Veritas::Trainer trainer(Veritas::Common::LoadTrainingConfig(result["config"].as<std::string>()));
        trainer.run();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
