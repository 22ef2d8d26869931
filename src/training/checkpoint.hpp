#ifndef VERITAS_TRAINING_CHECKPOINT_HPP
#define VERITAS_TRAINING_CHECKPOINT_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/errors.hpp"
#include "../common/save_load.hpp"
#include "history.hpp"

namespace Veritas::Checkpoint {
    inline constexpr const char* kPeriodicPrefix = "net_epoch_";
    inline constexpr const char* kExtension = ".pt";
    inline constexpr const char* kBestFilename = "net_best_on_validation_set.pt";
    inline constexpr const char* kBestRecordFilename = "best_on_validation_set.json";
    inline constexpr const char* kTemporarySuffix = ".tmp";

    struct Decision {
        bool periodic{false};
        bool best{false};
    };

    /*
     * periodic: epoch_index % save_epochs == 0 (epoch 0 included).
     * best: the latest validation score equals the best score seen so far.
     */
    class Policy {
    public:
        explicit Policy(std::int64_t save_epochs) : save_epochs_(save_epochs) {
            if (save_epochs_ <= 0) {
                std::ostringstream message;
                message << "save_epochs must be positive, got " << save_epochs_ << ".";
                throw ConfigurationError(message.str());
            }
        }

        [[nodiscard]] Decision decide(std::int64_t epoch_index, const Training::ValidationHistory& history) const {
            return {epoch_index % save_epochs_ == 0, history.latest_is_best()};
        }

        [[nodiscard]] std::int64_t save_epochs() const noexcept { return save_epochs_; }

    private:
        std::int64_t save_epochs_;
    };

    struct BestRecord {
        std::int64_t epoch{0};
        double score{0.0};
    };

    enum class Selector { Latest, Best };

    /*
     * Checkpoint directory layout:
     *   net_epoch_<n>.pt                  periodic snapshots
     *   net_best_on_validation_set.pt     single best snapshot, replaced atomically
     *   best_on_validation_set.json       epoch and score of the best snapshot
     */
    class Store {
    public:
        explicit Store(std::filesystem::path directory) : directory_(std::move(directory)) {}

        [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

        [[nodiscard]] std::filesystem::path periodic_path(std::int64_t epoch) const {
            return directory_ / (std::string(kPeriodicPrefix) + std::to_string(epoch) + kExtension);
        }

        [[nodiscard]] std::filesystem::path best_path() const { return directory_ / kBestFilename; }

        void save_periodic(const torch::nn::Module& module, std::int64_t epoch) const {
            std::filesystem::create_directories(directory_);
            Common::SaveLoad::save_module(module, periodic_path(epoch));
        }

        void save_best(const torch::nn::Module& module, std::int64_t epoch, double score) const {
            std::filesystem::create_directories(directory_);
            const auto target = best_path();
            const auto staging = std::filesystem::path(target.string() + kTemporarySuffix);
            Common::SaveLoad::save_module(module, staging);
            replace(staging, target);

            Common::SaveLoad::PropertyTree record;
            record.put("epoch", epoch);
            record.put("score", score);
            const auto record_path = directory_ / kBestRecordFilename;
            const auto record_staging = std::filesystem::path(record_path.string() + kTemporarySuffix);
            Common::SaveLoad::write_json_file(record_staging, record);
            replace(record_staging, record_path);
        }

        // Applies a policy decision; returns the decision for logging.
        Decision apply(const Decision& decision, const torch::nn::Module& module, std::int64_t epoch,
                       const Training::ValidationHistory& history) const {
            if (decision.periodic) {
                save_periodic(module, epoch);
            }
            if (decision.best) {
                save_best(module, epoch, history.latest().value_or(0.0));
            }
            return decision;
        }

        // Sorted epochs of the periodic snapshots.
        [[nodiscard]] std::vector<std::int64_t> epochs() const {
            namespace fs = std::filesystem;
            if (!fs::exists(directory_) || !fs::is_directory(directory_)) {
                throw CheckpointError("Checkpoint directory not found: " + directory_.string());
            }
            std::vector<std::int64_t> found;
            for (const auto& entry : fs::directory_iterator(directory_)) {
                const auto name = entry.path().filename().string();
                if (name == kBestFilename || name == kBestRecordFilename || ends_with(name, kTemporarySuffix)) {
                    continue;
                }
                found.push_back(parse_epoch(name));
            }
            std::sort(found.begin(), found.end());
            return found;
        }

        [[nodiscard]] std::optional<std::int64_t> latest() const {
            const auto found = epochs();
            if (found.empty()) {
                return std::nullopt;
            }
            return found.back();
        }

        [[nodiscard]] std::optional<BestRecord> best_record() const {
            const auto path = directory_ / kBestRecordFilename;
            if (!std::filesystem::exists(path)) {
                return std::nullopt;
            }
            const auto tree = Common::SaveLoad::read_json_file(path);
            return BestRecord{Common::SaveLoad::Detail::get_numeric<std::int64_t>(tree, "epoch", path.string()),
                              Common::SaveLoad::Detail::get_numeric<double>(tree, "score", path.string())};
        }

        [[nodiscard]] std::filesystem::path resolve(Selector selector) const {
            if (selector == Selector::Best) {
                if (!std::filesystem::exists(best_path())) {
                    throw CheckpointError("No best checkpoint in " + directory_.string());
                }
                return best_path();
            }
            const auto epoch = latest();
            if (!epoch) {
                throw CheckpointError("No periodic checkpoint in " + directory_.string());
            }
            return periodic_path(*epoch);
        }

        // Negative epoch index selects the best snapshot.
        [[nodiscard]] std::filesystem::path resolve(std::int64_t epoch_index) const {
            if (epoch_index < 0) {
                return resolve(Selector::Best);
            }
            const auto path = periodic_path(epoch_index);
            if (!std::filesystem::exists(path)) {
                throw CheckpointError("Checkpoint not found: " + path.string());
            }
            return path;
        }

        void load(torch::nn::Module& module, const std::filesystem::path& path, const torch::Device& device = torch::kCPU) const {
            Common::SaveLoad::load_module(module, path, device);
        }

    private:
        static bool ends_with(const std::string& value, const std::string& suffix) {
            return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        std::int64_t parse_epoch(const std::string& name) const {
            const std::string prefix = kPeriodicPrefix;
            const std::string extension = kExtension;
            const auto fail = [&]() {
                return CheckpointError("Unrecognized file '" + name + "' in checkpoint directory " + directory_.string());
            };
            if (name.size() <= prefix.size() + extension.size() || name.compare(0, prefix.size(), prefix) != 0
                || !ends_with(name, extension)) {
                throw fail();
            }
            const auto digits = name.substr(prefix.size(), name.size() - prefix.size() - extension.size());
            if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
                throw fail();
            }
            try {
                return std::stoll(digits);
            } catch (const std::out_of_range&) {
                throw fail();
            }
        }

        static void replace(const std::filesystem::path& staging, const std::filesystem::path& target) {
            std::error_code error;
            std::filesystem::rename(staging, target, error);
            if (error) {
                throw CheckpointError("Failed to move '" + staging.string() + "' to '" + target.string() + "': " + error.message());
            }
        }

        std::filesystem::path directory_;
    };
}

#endif // VERITAS_TRAINING_CHECKPOINT_HPP
