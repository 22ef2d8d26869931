#ifndef VERITAS_CONFIDENCE_HPP
#define VERITAS_CONFIDENCE_HPP

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <torch/torch.h>

#include "../common/errors.hpp"

namespace Veritas::Confidence {
    inline constexpr std::uint8_t kNoisy = 255;
    inline constexpr std::uint8_t kClean = 0;

    struct ImageShape {
        std::int64_t height{0};
        std::int64_t width{0};

        [[nodiscard]] std::int64_t pixels() const { return height * width; }
    };

    // One single-channel byte image per source image, 255 where the label is suspect.
    struct Map {
        std::string filename{};
        cv::Mat image{}; // CV_8UC1
    };

    /*
     * Slices the flat noise mask in accumulation order (images concatenated,
     * row-major inside each image) into one map per source image.
     */
    inline std::vector<Map> Assemble(const torch::Tensor& mask,
                                     const std::vector<ImageShape>& shapes,
                                     const std::vector<std::string>& filenames) {
        if (shapes.size() != filenames.size()) {
            std::ostringstream message;
            message << "Confidence map assembly got " << shapes.size() << " image shapes but "
                    << filenames.size() << " filenames.";
            throw DataShapeError(message.str());
        }
        if (!mask.defined() || mask.dim() != 1) {
            throw DataShapeError("Confidence map assembly expects a flat [N] noise mask.");
        }
        std::int64_t expected = 0;
        for (const auto& shape : shapes) {
            if (shape.height <= 0 || shape.width <= 0) {
                throw DataShapeError("Confidence map shapes must have positive height and width.");
            }
            expected += shape.pixels();
        }
        if (mask.size(0) != expected) {
            std::ostringstream message;
            message << "Noise mask has " << mask.size(0) << " entries but the images hold " << expected << " pixels.";
            throw DataShapeError(message.str());
        }

        auto bytes = mask.to(torch::kCPU, torch::kBool).to(torch::kUInt8).mul(kNoisy).contiguous();
        std::vector<Map> maps;
        maps.reserve(shapes.size());
        std::int64_t offset = 0;
        for (std::size_t index = 0; index < shapes.size(); ++index) {
            const auto& shape = shapes[index];
            cv::Mat image(static_cast<int>(shape.height), static_cast<int>(shape.width), CV_8UC1);
            std::memcpy(image.data, bytes.data_ptr<std::uint8_t>() + offset, static_cast<std::size_t>(shape.pixels()));
            offset += shape.pixels();
            maps.push_back({filenames[index], std::move(image)});
        }
        return maps;
    }

    // Maps are always stored as PNG so the 0/255 values survive; "case.jpg" becomes "case.png".
    inline std::string FileName(const std::string& source) {
        return std::filesystem::path(source).replace_extension(".png").string();
    }

    // Writes one file per map into `directory`, creating it when absent and overwriting existing files.
    inline void Write(const std::vector<Map>& maps, const std::filesystem::path& directory) {
        std::filesystem::create_directories(directory);
        for (const auto& map : maps) {
            if (map.filename.empty()) {
                throw std::invalid_argument("Confidence map requires a non-empty filename.");
            }
            const auto path = directory / FileName(map.filename);
            if (!cv::imwrite(path.string(), map.image)) {
                throw std::runtime_error("Failed to write confidence map: " + path.string());
            }
        }
    }

    inline cv::Mat Read(const std::filesystem::path& path) {
        cv::Mat image = cv::imread(path.string(), cv::IMREAD_GRAYSCALE);
        if (image.empty()) {
            throw std::runtime_error("Failed to decode confidence map: " + path.string());
        }
        return image;
    }

    // <class>-confident-maps for "both", <class>-confident-maps-<method with '_' as '-'> otherwise.
    inline std::string DirectoryName(std::string_view class_name, std::string_view method) {
        std::string name = std::string(class_name) + "-confident-maps";
        if (method != "both") {
            std::string suffix(method);
            for (auto& character : suffix) {
                if (character == '_') {
                    character = '-';
                }
            }
            name += "-" + suffix;
        }
        return name;
    }

    // Output location of the detection run: <root>/all/<subset>/<DirectoryName>.
    inline std::filesystem::path OutputDirectory(const std::filesystem::path& data_root,
                                                 std::string_view subset,
                                                 std::string_view class_name,
                                                 std::string_view method) {
        return data_root / "all" / std::string(subset) / DirectoryName(class_name, method);
    }
}

#endif // VERITAS_CONFIDENCE_HPP
