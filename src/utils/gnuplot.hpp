#ifndef VERITAS_GNUPLOT_HPP
#define VERITAS_GNUPLOT_HPP

#include <algorithm>
#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Veritas::Utils {
    /*
     * Pipe to a gnuplot process that renders per-epoch curves into image files.
     * One process serves every window; each render() redirects the output,
     * draws all series of one figure inline ('-' data blocks) and closes the file.
     */
    class Gnuplot {
    public:
        struct Series {
            std::string name{};
            std::vector<double> x{};
            std::vector<double> y{};
        };

        struct Figure {
            std::string title{};
            std::string x_label{"epoch"};
            std::string y_label{};
            std::vector<Series> series{};
        };

        explicit Gnuplot(std::string command = "gnuplot", std::string terminal = "png size 900,600")
            : command_(std::move(command)), pipe_(popen(command_.c_str(), "w"))
        {
            if (pipe_ == nullptr) {
                throw std::runtime_error("Failed to start '" + command_ + "'");
            }
            try {
                send("set terminal " + terminal);
                send("set grid");
                send("set key top right");
            } catch (...) {
                close();
                throw;
            }
        }

        ~Gnuplot() {
            close();
        }

        Gnuplot(const Gnuplot&) = delete;
        Gnuplot& operator=(const Gnuplot&) = delete;

        void render(const std::string& output, const Figure& figure) {
            if (figure.series.empty()) {
                throw std::invalid_argument("Figure '" + figure.title + "' has no series");
            }
            send("set output '" + Quote(output) + "'");
            send("set title '" + Quote(figure.title) + "'");
            send("set xlabel '" + Quote(figure.x_label) + "'");
            send("set ylabel '" + Quote(figure.y_label) + "'");

            std::ostringstream plot;
            plot << "plot ";
            for (std::size_t index = 0; index < figure.series.size(); ++index) {
                plot << (index == 0 ? "" : ", ") << "'-' title '" << Quote(figure.series[index].name) << "' with linespoints";
            }
            send(plot.str());
            for (const auto& series : figure.series) {
                const auto points = std::min(series.x.size(), series.y.size());
                for (std::size_t point = 0; point < points; ++point) {
                    if (std::fprintf(pipe_, "%.*g %.*g\n", 15, series.x[point], 15, series.y[point]) < 0) {
                        throw std::runtime_error("Failed to write curve data to gnuplot");
                    }
                }
                send("e");
            }
            send("unset output");
        }

        // Single quotes inside gnuplot strings are escaped with a backslash.
        static std::string Quote(const std::string& text) {
            std::string quoted;
            quoted.reserve(text.size());
            for (char ch : text) {
                if (ch == '\'') {
                    quoted += '\\';
                }
                quoted += ch;
            }
            return quoted;
        }

    private:
        void close() noexcept {
            if (pipe_ != nullptr) {
                pclose(pipe_);
                pipe_ = nullptr;
            }
        }

        void send(const std::string& line) {
            if (std::fputs((line + '\n').c_str(), pipe_) < 0 || std::fflush(pipe_) != 0) {
                throw std::runtime_error("Lost connection to '" + command_ + "'");
            }
        }

        std::string command_;
        std::FILE* pipe_;
    };
}

#endif // VERITAS_GNUPLOT_HPP
