#ifndef VERITAS_PLOT_STATUS_HPP
#define VERITAS_PLOT_STATUS_HPP

#include <string>
#include <utility>

namespace Veritas::Plot::Details {
    // Outcome of a visualization call; failures are reported, never thrown.
    struct Status {
        bool ok{true};
        std::string message{};

        [[nodiscard]] static Status Ok() { return {}; }
        [[nodiscard]] static Status Failure(std::string message) { return {false, std::move(message)}; }

        explicit operator bool() const { return ok; }
    };
}

#endif // VERITAS_PLOT_STATUS_HPP
