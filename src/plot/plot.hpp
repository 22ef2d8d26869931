#ifndef VERITAS_PLOT_HPP
#define VERITAS_PLOT_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <filesystem>
#include <memory>

#include "details/gnuplot_sink.hpp"
#include "details/sink.hpp"
#include "details/status.hpp"

namespace Veritas::Plot {
    using Status = Details::Status;
    using Sink = Details::Sink;
    using NullSink = Details::NullSink;
    using GnuplotSink = Details::GnuplotSink;
    using GnuplotOptions = Details::GnuplotOptions;

    [[nodiscard]] inline std::unique_ptr<Sink> Make(bool enabled, const std::filesystem::path& directory, const GnuplotOptions& options = {}) {
        if (!enabled) {
            return std::make_unique<NullSink>();
        }
        return std::make_unique<GnuplotSink>(directory, options);
    }
}

#endif // VERITAS_PLOT_HPP
