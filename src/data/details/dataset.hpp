#ifndef VERITAS_DATA_DATASET_HPP
#define VERITAS_DATA_DATASET_HPP

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "../../confidence/confidence.hpp"

namespace Veritas::Data::Details {
    inline constexpr std::array<const char*, 2> kSubsets = {"training", "validation"};
    inline constexpr std::array<const char*, 6> kImageExtensions = {".png", ".jpg", ".jpeg", ".bmp", ".tif", ".tiff"};

    struct LoadOptions {
        std::string class_name{};
        std::int64_t image_channels{1};
        std::array<std::int64_t, 2> cropping_size{256, 256}; // height, width
        std::int64_t num_classes{2};
        bool load_confidence_map{false};
        std::string confidence_map_method{"both"};
    };

    // Center-cropped images with their labels, all at `cropping_size`.
    struct Dataset {
        torch::Tensor images{};          // float32 [N, C, H, W] in [0, 1]
        torch::Tensor labels{};          // int64 [N, H, W]
        torch::Tensor confidence_maps{}; // uint8 [N, H, W], 1 = suspect label; undefined unless loaded
        std::vector<std::string> filenames{};

        [[nodiscard]] std::int64_t size() const { return static_cast<std::int64_t>(filenames.size()); }
        [[nodiscard]] bool has_confidence_maps() const { return confidence_maps.defined(); }
    };

    inline void validate_subset(std::string_view subset) {
        if (std::none_of(kSubsets.begin(), kSubsets.end(), [&](const char* candidate) { return subset == candidate; })) {
            std::ostringstream message;
            message << "Unknown dataset subset '" << subset << "' (expected training or validation).";
            throw ConfigurationError(message.str());
        }
    }

    inline bool has_image_extension(const std::filesystem::path& path) {
        auto ext = path.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return std::any_of(kImageExtensions.begin(), kImageExtensions.end(), [&](const char* candidate) {
            return ext == candidate;
        });
    }

    inline std::vector<std::filesystem::path> collect_image_files(const std::filesystem::path& directory) {
        namespace fs = std::filesystem;
        if (!fs::exists(directory) || !fs::is_directory(directory)) {
            throw std::runtime_error("Image folder not found: " + directory.string());
        }
        std::vector<fs::path> files;
        for (const auto& entry : fs::directory_iterator(directory)) {
            if (entry.is_regular_file() && has_image_extension(entry.path())) {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    inline cv::Mat read_image(const std::filesystem::path& path, int flag) {
        cv::Mat image = cv::imread(path.string(), flag);
        if (image.empty()) {
            throw std::runtime_error("Failed to decode image: " + path.string());
        }
        return image;
    }

    inline cv::Mat center_crop(const cv::Mat& image, const std::array<std::int64_t, 2>& size, const std::filesystem::path& source) {
        const auto height = static_cast<int>(size[0]);
        const auto width = static_cast<int>(size[1]);
        if (image.rows < height || image.cols < width) {
            std::ostringstream message;
            message << "Image " << source.string() << " (" << image.rows << "x" << image.cols
                    << ") is smaller than the crop " << height << "x" << width << ".";
            throw DataShapeError(message.str());
        }
        const int top = (image.rows - height) / 2;
        const int left = (image.cols - width) / 2;
        return image(cv::Rect(left, top, width, height)).clone();
    }

    // [C, H, W] float32 in [0, 1], channels in RGB order for colour images.
    inline torch::Tensor image_to_tensor(const cv::Mat& image, std::int64_t channels) {
        cv::Mat converted;
        if (channels == 3) {
            cv::cvtColor(image, converted, cv::COLOR_BGR2RGB);
        } else {
            converted = image;
        }
        cv::Mat image_float;
        converted.convertTo(image_float, CV_32F, 1.0 / 255.0);
        auto tensor = torch::from_blob(image_float.data,
                                       {image_float.rows, image_float.cols, static_cast<std::int64_t>(image_float.channels())},
                                       torch::TensorOptions().dtype(torch::kFloat32)).clone();
        return tensor.permute({2, 0, 1}).contiguous();
    }

    inline torch::Tensor mask_to_tensor(const cv::Mat& mask) {
        return torch::from_blob(mask.data, {mask.rows, mask.cols}, torch::TensorOptions().dtype(torch::kUInt8)).clone();
    }

    /*
     * Loads <root>/<subset>/images/* with labels from <class>-masks/ and,
     * when requested, confidence maps from the method-qualified directory.
     * Binary problems map every non-zero mask value to class 1.
     */
    inline Dataset load_dataset(const std::filesystem::path& root, std::string_view subset, const LoadOptions& options) {
        validate_subset(subset);
        if (options.class_name.empty()) {
            throw ConfigurationError("Dataset loading requires a class name.");
        }
        if (options.image_channels != 1 && options.image_channels != 3) {
            std::ostringstream message;
            message << "image_channels must be 1 or 3, got " << options.image_channels << ".";
            throw ConfigurationError(message.str());
        }
        if (options.cropping_size[0] <= 0 || options.cropping_size[1] <= 0) {
            throw ConfigurationError("cropping_size must hold two positive values.");
        }
        if (options.num_classes < 2) {
            throw ConfigurationError("Segmentation requires at least two classes.");
        }

        const auto subset_dir = root / std::string(subset);
        const auto mask_dir = subset_dir / (options.class_name + "-masks");
        const auto map_dir = subset_dir / Confidence::DirectoryName(options.class_name, options.confidence_map_method);
        const auto files = collect_image_files(subset_dir / "images");
        if (files.empty()) {
            throw std::runtime_error("No images found under " + (subset_dir / "images").string());
        }

        const int image_flag = options.image_channels == 3 ? cv::IMREAD_COLOR : cv::IMREAD_GRAYSCALE;
        std::vector<torch::Tensor> images;
        std::vector<torch::Tensor> labels;
        std::vector<torch::Tensor> maps;
        Dataset dataset{};
        images.reserve(files.size());
        labels.reserve(files.size());

        for (const auto& file : files) {
            const auto filename = file.filename().string();
            auto image = center_crop(read_image(file, image_flag), options.cropping_size, file);
            auto mask = center_crop(read_image(mask_dir / filename, cv::IMREAD_GRAYSCALE), options.cropping_size, mask_dir / filename);

            auto label = mask_to_tensor(mask).to(torch::kLong);
            if (options.num_classes == 2) {
                label = label.gt(0).to(torch::kLong);
            } else if (label.max().item<std::int64_t>() >= options.num_classes) {
                std::ostringstream message;
                message << "Mask " << (mask_dir / filename).string() << " holds label "
                        << label.max().item<std::int64_t>() << " outside [0, " << options.num_classes << ").";
                throw DataShapeError(message.str());
            }

            images.push_back(image_to_tensor(image, options.image_channels));
            labels.push_back(label);
            if (options.load_confidence_map) {
                const auto map_path = map_dir / Confidence::FileName(filename);
                auto map = center_crop(read_image(map_path, cv::IMREAD_GRAYSCALE), options.cropping_size, map_path);
                maps.push_back(mask_to_tensor(map).gt(0).to(torch::kUInt8));
            }
            dataset.filenames.push_back(filename);
        }

        dataset.images = torch::stack(images);
        dataset.labels = torch::stack(labels);
        if (options.load_confidence_map) {
            dataset.confidence_maps = torch::stack(maps);
        }
        return dataset;
    }
}

#endif // VERITAS_DATA_DATASET_HPP
