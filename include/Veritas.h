#ifndef VERITAS_LIBRARY_H
#define VERITAS_LIBRARY_H

#include "../src/core.hpp"
#include "../src/common/config.hpp"
#include "../src/common/logger.hpp"
#include "../src/confidence/confidence.hpp"
#include "../src/data/data.hpp"
#include "../src/inference/accumulate.hpp"
#include "../src/inference/detection.hpp"
#include "../src/loss/loss.hpp"
#include "../src/metric/metric.hpp"
#include "../src/network/network.hpp"
#include "../src/noise/noise.hpp"
#include "../src/training/checkpoint.hpp"
#include "../src/training/epoch.hpp"
#include "../src/training/history.hpp"

// Public umbrella header.
// Everything lives in header-only modules under src/; the two executables in
// src/apps/ are the only translation units of the library itself.

#endif // VERITAS_LIBRARY_H
