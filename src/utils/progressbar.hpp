#ifndef VERITAS_UTILS_PROGRESSBAR_HPP
#define VERITAS_UTILS_PROGRESSBAR_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

namespace Veritas::Utils {
    // Single-line progress bar for full-dataset passes. A null stream silences it.
    class ProgressBar {
    public:
        ProgressBar(std::int64_t total, std::string label, std::ostream* stream = &std::cout, std::size_t width = 30)
            : total_(std::max<std::int64_t>(total, 0)),
              label_(std::move(label)),
              stream_(stream),
              width_(std::max<std::size_t>(width, static_cast<std::size_t>(1))) {}

        void update(std::int64_t current, const std::string& suffix = {}) {
            if (finished_ || total_ <= 0 || stream_ == nullptr) {
                return;
            }
            current = std::clamp<std::int64_t>(current, 0, total_);

            const double ratio = static_cast<double>(current) / static_cast<double>(total_);
            const auto max_units = static_cast<std::int64_t>(width_) * 8;
            const auto units = std::min<std::int64_t>(static_cast<std::int64_t>(std::round(ratio * static_cast<double>(max_units))), max_units);

            const std::size_t full_cells = static_cast<std::size_t>(units / 8);
            const std::size_t partial_index = static_cast<std::size_t>(units % 8);

            std::ostringstream line;
            line << '\r' << label_ << " [";
            for (std::size_t i = 0; i < full_cells; ++i) {
                line << "\xE2\x96\x88";
            }
            const bool has_partial_cell = partial_index > 0 && full_cells < width_;
            if (has_partial_cell) {
                line << PartialBlock(partial_index);
            }
            const std::size_t printed_cells = full_cells + (has_partial_cell ? 1 : 0);
            if (printed_cells < width_) {
                line << std::string(width_ - printed_cells, ' ');
            }
            line << "] " << std::setw(3) << static_cast<int>(std::round(ratio * 100.0)) << "% "
                 << '(' << current << '/' << total_ << ')';
            if (!suffix.empty()) {
                line << ' ' << suffix;
            }

            *stream_ << line.str() << std::flush;

            if (current == total_) {
                finished_ = true;
                *stream_ << std::endl;
            }
        }

        [[nodiscard]] std::int64_t total() const { return total_; }

    private:
        static const char* PartialBlock(std::size_t index) {
            static constexpr const char* blocks[] = {
                "",
                "\xE2\x96\x8F",
                "\xE2\x96\x8E",
                "\xE2\x96\x8D",
                "\xE2\x96\x8C",
                "\xE2\x96\x8B",
                "\xE2\x96\x8A",
                "\xE2\x96\x89"
            };
            return blocks[std::min<std::size_t>(index, 7)];
        }

        std::int64_t total_;
        std::string label_;
        std::ostream* stream_;
        std::size_t width_;
        bool finished_{false};
    };
}

#endif // VERITAS_UTILS_PROGRESSBAR_HPP
