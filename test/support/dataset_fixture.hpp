#ifndef VERITAS_TEST_DATASET_FIXTURE_HPP
#define VERITAS_TEST_DATASET_FIXTURE_HPP

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace Veritas::Test {
    inline void WritePng(const std::filesystem::path& path, const cv::Mat& image) {
        std::filesystem::create_directories(path.parent_path());
        if (!cv::imwrite(path.string(), image)) {
            throw std::runtime_error("could not write " + path.string());
        }
    }

    /*
     * <root>/<subset>/images/<name> and <root>/<subset>/<class>-masks/<name>,
     * rows x cols grayscale; the mask marks the left half with value 200.
     */
    inline void WriteSubset(const std::filesystem::path& root,
                            const std::string& subset,
                            const std::string& class_name,
                            const std::vector<std::string>& names,
                            int rows,
                            int cols) {
        int seed = 0;
        for (const auto& name : names) {
            cv::Mat image(rows, cols, CV_8UC1);
            cv::randu(image, cv::Scalar(seed), cv::Scalar(255));
            cv::Mat mask = cv::Mat::zeros(rows, cols, CV_8UC1);
            mask(cv::Rect(0, 0, cols / 2, rows)).setTo(200);
            WritePng(root / subset / "images" / name, image);
            WritePng(root / subset / (class_name + "-masks") / name, mask);
            seed += 10;
        }
    }
}

#endif // VERITAS_TEST_DATASET_FIXTURE_HPP
