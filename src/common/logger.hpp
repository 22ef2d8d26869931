#ifndef VERITAS_COMMON_LOGGER_HPP
#define VERITAS_COMMON_LOGGER_HPP

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../utils/terminal.hpp"

namespace Veritas::Common {
    /*
     * Run logger.
     *  - Every record is timestamped and appended to `<directory>/training_log.txt`
     *    with color sequences stripped.
     *  - Records are mirrored to the console stream when `echo` is set; a null
     *    console stream disables mirroring altogether.
     *  - Warnings are kept in memory so callers (and tests) can inspect them.
     */
    class Logger {
    public:
        struct Options {
            std::ostream* console{&std::cout};
            bool echo{true};
            std::string filename{"training_log.txt"};
        };

        Logger() = default;

        explicit Logger(const std::filesystem::path& directory)
            : Logger(directory, Options{}) {}

        Logger(const std::filesystem::path& directory, Options options)
            : options_(std::move(options))
        {
            std::filesystem::create_directories(directory);
            path_ = directory / options_.filename;
            file_.open(path_, std::ios::out | std::ios::app);
            if (!file_) {
                throw std::runtime_error("Failed to open log file '" + path_.string() + "' for writing.");
            }
        }

        // Console-only logger.
        static Logger Console(std::ostream* console = &std::cout) {
            Logger logger;
            logger.options_.console = console;
            return logger;
        }

        Logger(Logger&&) noexcept = default;
        Logger& operator=(Logger&&) noexcept = default;
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        void write(std::string_view message) {
            emit(message, options_.echo);
        }

        void write_and_print(std::string_view message) {
            emit(message, true);
        }

        void warn(std::string_view message) {
            using Utils::Terminal::ApplyColor;
            warnings_.emplace_back(message);
            std::string line = ApplyColor(std::string(Utils::Terminal::Symbols::kWarn) + " ", Utils::Terminal::Colors::kOrange);
            line.append(message);
            emit(line, true);
        }

        void rule() {
            emit(Utils::Terminal::Rule(92, Utils::Terminal::Colors::kBrightBlack), options_.echo);
        }

        void flush() {
            if (file_.is_open()) {
                file_.flush();
            }
            if (options_.console != nullptr) {
                options_.console->flush();
            }
        }

        [[nodiscard]] const std::vector<std::string>& warnings() const noexcept { return warnings_; }
        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    private:
        static std::string timestamp() {
            const auto now = std::chrono::system_clock::now();
            const auto seconds = std::chrono::system_clock::to_time_t(now);
            std::tm local{};
            localtime_r(&seconds, &local);
            std::ostringstream stream;
            stream << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
            return stream.str();
        }

        void emit(std::string_view message, bool to_console) {
            if (file_.is_open()) {
                file_ << '[' << timestamp() << "] " << Utils::Terminal::StripEscapes(message) << '\n';
            }
            if (to_console && options_.console != nullptr) {
                *options_.console << message << '\n';
            }
        }

        Options options_{};
        std::filesystem::path path_{};
        std::ofstream file_{};
        std::vector<std::string> warnings_{};
    };
}

#endif // VERITAS_COMMON_LOGGER_HPP
