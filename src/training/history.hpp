#ifndef VERITAS_TRAINING_HISTORY_HPP
#define VERITAS_TRAINING_HISTORY_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <filesystem>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "../common/save_load.hpp"

namespace Veritas::Training {
    /*
     * Total overlap of every evaluation epoch, in order, with the running
     * maximum. Owned by the trainer; the orchestrator is its only writer.
     */
    class ValidationHistory {
    public:
        void append(double total_overlap) {
            if (!std::isfinite(total_overlap)) {
                std::ostringstream message;
                message << "Validation score must be finite, got " << total_overlap << ".";
                throw std::invalid_argument(message.str());
            }
            values_.push_back(total_overlap);
            best_ = best_ ? std::max(*best_, total_overlap) : total_overlap;
        }

        [[nodiscard]] std::optional<double> best() const { return best_; }
        [[nodiscard]] std::optional<double> latest() const {
            return values_.empty() ? std::nullopt : std::optional<double>(values_.back());
        }
        [[nodiscard]] const std::vector<double>& values() const noexcept { return values_; }
        [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }
        [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

        // True when the latest entry equals the best score seen so far.
        [[nodiscard]] bool latest_is_best() const {
            return !values_.empty() && values_.back() >= *best_;
        }

        // Keeps the first `count` entries, used when a resumed run restarts after them.
        void truncate(std::size_t count) {
            if (count >= values_.size()) {
                return;
            }
            values_.resize(count);
            best_ = values_.empty() ? std::nullopt : std::optional<double>(*std::max_element(values_.begin(), values_.end()));
        }

        void save(const std::filesystem::path& path) const {
            Common::SaveLoad::PropertyTree tree;
            tree.add_child("values", Common::SaveLoad::Detail::write_array(values_));
            if (best_) {
                tree.put("best", *best_);
            }
            Common::SaveLoad::write_json_file(path, tree);
        }

        [[nodiscard]] static ValidationHistory load(const std::filesystem::path& path) {
            const auto tree = Common::SaveLoad::read_json_file(path);
            ValidationHistory history;
            if (const auto values = tree.get_child_optional("values")) {
                for (const auto value : Common::SaveLoad::Detail::read_array<double>(*values, path.string())) {
                    history.append(value);
                }
            }
            return history;
        }

    private:
        std::vector<double> values_{};
        std::optional<double> best_{};
    };
}

#endif // VERITAS_TRAINING_HISTORY_HPP
