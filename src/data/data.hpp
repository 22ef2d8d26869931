#ifndef VERITAS_DATA_HPP
#define VERITAS_DATA_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <filesystem>
#include <string_view>

#include "details/dataset.hpp"
#include "details/loader.hpp"

namespace Veritas::Data {
    using Dataset = Details::Dataset;
    using LoadOptions = Details::LoadOptions;
    using Batch = Details::Batch;
    using Loader = Details::Loader;
    using LoaderOptions = Details::LoaderOptions;

    [[nodiscard]] inline Dataset Load(const std::filesystem::path& root, std::string_view subset, const LoadOptions& options) {
        return Details::load_dataset(root, subset, options);
    }
}

#endif // VERITAS_DATA_HPP
