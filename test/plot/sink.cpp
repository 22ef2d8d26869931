#include <csignal>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <torch/torch.h>

#include "../../src/plot/plot.hpp"
#include "../../src/utils/gnuplot.hpp"
#include "../support/temporary_directory.hpp"

using namespace Veritas;

namespace {
    std::size_t OpenDescriptors() {
        return static_cast<std::size_t>(std::distance(std::filesystem::directory_iterator("/proc/self/fd"),
                                                       std::filesystem::directory_iterator{}));
    }
}

TEST(PlotSink, DisabledPlottingDiscardsEverything) {
    Veritas::Test::TemporaryDirectory scratch("plot");
    auto sink = Plot::Make(false, scratch.path() / "plots");
    EXPECT_TRUE(static_cast<bool>(sink->line("loss", "training_loss", 0.0, 0.7)));
    EXPECT_TRUE(static_cast<bool>(sink->images("IT", torch::zeros({2, 1, 4, 4}))));
    EXPECT_FALSE(std::filesystem::exists(scratch.path() / "plots"));
}

TEST(PlotSink, ImageWindowsStackTheBatch) {
    Veritas::Test::TemporaryDirectory scratch("plot");
    Plot::GnuplotSink sink(scratch.path());
    auto batch = torch::zeros({3, 1, 4, 5});
    batch[1].fill_(1.0);

    ASSERT_TRUE(static_cast<bool>(sink.images("OT", batch)));
    const auto grid = cv::imread((scratch.path() / "OT.png").string(), cv::IMREAD_GRAYSCALE);
    ASSERT_EQ(grid.rows, 12);
    ASSERT_EQ(grid.cols, 5);
    EXPECT_EQ(grid.at<std::uint8_t>(0, 0), 0);
    EXPECT_EQ(grid.at<std::uint8_t>(5, 2), 255);
}

TEST(PlotSink, MalformedImageIsAFailureNotAnException) {
    Veritas::Test::TemporaryDirectory scratch("plot");
    Plot::GnuplotSink sink(scratch.path());
    const auto status = sink.images("LT", torch::zeros({4}));
    EXPECT_FALSE(static_cast<bool>(status));
    EXPECT_FALSE(status.message.empty());
}

TEST(Gnuplot, QuoteEscapesSingleQuotes) {
    EXPECT_EQ(Utils::Gnuplot::Quote("dice 'class 1'"), "dice \\'class 1\\'");
}

TEST(Gnuplot, FailedSetupReleasesThePipe) {
    std::signal(SIGPIPE, SIG_IGN);
    // The child exits without reading, so the oversized terminal line cannot be delivered.
    const std::string terminal(200000, 'x');
    const auto before = OpenDescriptors();
    for (int attempt = 0; attempt < 10; ++attempt) {
        EXPECT_THROW(Utils::Gnuplot("exit 0", terminal), std::runtime_error);
    }
    EXPECT_EQ(OpenDescriptors(), before);
}
