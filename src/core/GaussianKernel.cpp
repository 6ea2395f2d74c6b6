/**
 * @file GaussianKernel.cpp
 * @brief Gaussian kernel construction
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "GaussianKernel.hpp"
#include "Logger.hpp"
#include <cmath>
#include <limits>
#include <sstream>

namespace shake {

int GaussianKernel::radius(double spread, double truncate) {
    if (!std::isfinite(spread) || spread <= 0.0) {
        throw InvalidInputError("Gaussian spread must be positive, got " + std::to_string(spread));
    }
    if (!std::isfinite(truncate) || truncate < 0.0) {
        throw InvalidInputError("Gaussian truncate must be non-negative, got " + std::to_string(truncate));
    }

    // 2 * radius + 1 must stay representable as int
    const double r = std::floor(truncate * spread + 0.5);
    if (r > static_cast<double>(std::numeric_limits<int>::max() / 2)) {
        std::ostringstream msg;
        msg << "Gaussian kernel radius " << r << " (sigma=" << spread
            << ", truncate=" << truncate << ") is too large";
        throw InvalidInputError(msg.str());
    }
    return static_cast<int>(r);
}

Kernel GaussianKernel::build(double spread, double truncate) {
    Logger logger("GaussianKernel");

    const int r = radius(spread, truncate);
    const int side = 2 * r + 1;
    const double variance = spread * spread;

    Kernel kernel(side, side);
    for (int row = 0; row < side; ++row) {
        const double x = static_cast<double>(row - r);
        for (int col = 0; col < side; ++col) {
            const double y = static_cast<double>(col - r);
            kernel(row, col) = 2.0 * std::exp(-0.5 * (x * x + y * y) / variance);
        }
    }

    kernel /= kernel.sum();

    if (std::abs(kernel.sum() - 1.0) > WEIGHT_SUM_TOLERANCE) {
        std::ostringstream msg;
        msg.precision(17);
        msg << "Gaussian kernel sums to " << kernel.sum() << " after normalization";
        throw InternalConsistencyError(msg.str());
    }

    if (logger.shouldOutput(LogLevel::DEBUG)) {
        std::ostringstream msg;
        msg << "Built " << side << "x" << side << " kernel (sigma=" << spread
            << ", truncate=" << truncate << ", radius=" << r
            << ", centre weight=" << kernel(r, r) << ")";
        logger.debug(msg.str());
    }

    return kernel;
}

} // namespace shake
