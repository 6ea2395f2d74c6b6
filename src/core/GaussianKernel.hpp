#pragma once

/**
 * @file GaussianKernel.hpp
 * @brief Truncated, normalized 2-D Gaussian weights
 */

#include "shake_contour.hpp"

namespace shake {

class GaussianKernel {
public:
    static constexpr double DEFAULT_TRUNCATE = 4.0;
    static constexpr double WEIGHT_SUM_TOLERANCE = 1e-12;

    /**
     * @brief Build a square kernel of side 2*radius+1
     *
     * Weight at integer offset (x, y) is 2*exp(-0.5*(x^2+y^2)/spread^2)
     * before every weight is divided by the total, so the result sums to 1.
     *
     * @param spread Standard deviation in pixels, must be > 0
     * @param truncate Radius in standard deviations, must be >= 0
     * @throws InvalidInputError on a non-positive spread, negative truncate
     *         or a radius above INT_MAX / 2
     * @throws InternalConsistencyError if the normalized weights do not sum to 1
     */
    static Kernel build(double spread, double truncate = DEFAULT_TRUNCATE);

    /**
     * @brief floor(truncate * spread + 0.5)
     * @throws InvalidInputError on invalid parameters or a radius above INT_MAX / 2
     */
    static int radius(double spread, double truncate = DEFAULT_TRUNCATE);
};

} // namespace shake
