#ifndef VERITAS_COMMON_ERRORS_HPP
#define VERITAS_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Veritas {
    // Unknown loss/network/method/subset names or an invalid configuration file.
    class ConfigurationError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    // Tensor lengths or widths that do not agree with each other or with K.
    class DataShapeError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    class CheckpointError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };
}

#endif // VERITAS_COMMON_ERRORS_HPP
