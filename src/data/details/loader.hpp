#ifndef VERITAS_DATA_LOADER_HPP
#define VERITAS_DATA_LOADER_HPP

#include <algorithm>
#include <cstdint>
#include <numeric>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "dataset.hpp"

namespace Veritas::Data::Details {
    struct Batch {
        torch::Tensor images{};          // [B, C, H, W]
        torch::Tensor labels{};          // [B, H, W]
        torch::Tensor confidence_maps{}; // [B, H, W] or undefined
        std::vector<std::string> filenames{};
    };

    struct LoaderOptions {
        std::int64_t batch_size{4};
        bool shuffle{false};
        std::optional<std::uint64_t> seed{};
    };

    class Loader {
    public:
        Loader(const Dataset& dataset, LoaderOptions options)
            : dataset_(&dataset), options_(options)
        {
            if (options_.batch_size <= 0) {
                throw std::invalid_argument("Loader batch size must be positive.");
            }
        }

        // Batches of one epoch; with shuffling, the order depends on the seed and the epoch index only.
        [[nodiscard]] std::vector<Batch> epoch(std::int64_t epoch_index) const {
            std::vector<std::int64_t> order(static_cast<std::size_t>(dataset_->size()));
            std::iota(order.begin(), order.end(), std::int64_t{0});
            if (options_.shuffle) {
                auto rng = options_.seed ? std::mt19937_64(*options_.seed + static_cast<std::uint64_t>(epoch_index))
                                         : std::mt19937_64(std::random_device{}());
                std::shuffle(order.begin(), order.end(), rng);
            }

            std::vector<Batch> batches;
            for (std::size_t begin = 0; begin < order.size(); begin += static_cast<std::size_t>(options_.batch_size)) {
                const auto end = std::min(order.size(), begin + static_cast<std::size_t>(options_.batch_size));
                std::vector<std::int64_t> slice(order.begin() + static_cast<std::ptrdiff_t>(begin),
                                                order.begin() + static_cast<std::ptrdiff_t>(end));
                auto index = torch::tensor(slice, torch::kLong);

                Batch batch{};
                batch.images = dataset_->images.index_select(0, index);
                batch.labels = dataset_->labels.index_select(0, index);
                if (dataset_->has_confidence_maps()) {
                    batch.confidence_maps = dataset_->confidence_maps.index_select(0, index);
                }
                for (const auto position : slice) {
                    batch.filenames.push_back(dataset_->filenames[static_cast<std::size_t>(position)]);
                }
                batches.push_back(std::move(batch));
            }
            return batches;
        }

        [[nodiscard]] std::int64_t batches_per_epoch() const {
            return (dataset_->size() + options_.batch_size - 1) / options_.batch_size;
        }

    private:
        const Dataset* dataset_;
        LoaderOptions options_{};
    };
}

#endif // VERITAS_DATA_LOADER_HPP
