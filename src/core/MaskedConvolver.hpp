#pragma once

/**
 * @file MaskedConvolver.hpp
 * @brief 2-D convolution with reflective borders and mask-aware weight redistribution
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "shake_contour.hpp"
#include "ExecutionPolicies.hpp"
#include "Logger.hpp"
#include <cstddef>

namespace shake {

/**
 * @brief Slides a kernel over a grid and returns a grid of the same shape
 *
 * Borders are synthesized by mirror reflection (BorderReflector), padding
 * only kernel/2 cells per side. Masked cells are copied through unchanged;
 * for unmasked cells whose window touches masked cells the kernel mass on
 * those cells is spread evenly over the remaining non-zero weights.
 */
class MaskedConvolver {
public:
    static constexpr double WEIGHT_SUM_TOLERANCE = 1e-12;
    static constexpr size_t MEMORY_WARNING_MB = 2048;

    MaskedConvolver();
    ~MaskedConvolver();

    /**
     * @brief Sequential convolution
     *
     * @param grid Input field, not modified
     * @param kernel Odd-sized weights, each side smaller than grid side + 1
     * @param mask Optional exclusion mask of the grid's shape (nullptr = none)
     * @param mode WINDOWED, or REFERENCE for the unmasked per-weight oracle
     * @return Newly allocated grid of the input's shape
     * @throws InvalidInputError if a precondition fails
     * @throws InternalConsistencyError if a redistributed kernel loses mass
     */
    Grid convolve(const Grid& grid,
                  const Kernel& kernel,
                  const Mask* mask = nullptr,
                  ConvolutionMode mode = ConvolutionMode::WINDOWED) const;

    /**
     * @brief Convolution under an execution policy
     *
     * Instantiated for SequentialPolicy and ParallelPolicy. Rows never
     * share output cells, so the parallel variant needs no locking.
     */
    template<typename ExecutionPolicy>
    Grid convolve_parallel(const ExecutionPolicy& policy,
                           const Grid& grid,
                           const Kernel& kernel,
                           const Mask* mask = nullptr,
                           ConvolutionMode mode = ConvolutionMode::WINDOWED) const;

    /**
     * @brief Working kernel for one window
     *
     * Zeroes the weights under masked cells and adds
     * (masked mass / unmasked cell count) to every remaining non-zero
     * weight. The result sums to kernel.sum().
     *
     * @throws InvalidInputError if the shapes differ
     * @throws InternalConsistencyError if no cell is unmasked or mass is lost
     */
    static Kernel redistribute_weights(const Kernel& kernel, const Mask& window_mask);

    /**
     * @brief Check every precondition without computing anything
     * @throws InvalidInputError describing the first violation
     */
    static void validate_inputs(const Grid& grid,
                                const Kernel& kernel,
                                const Mask* mask,
                                ConvolutionMode mode);

    /**
     * @brief Bytes held by the padded grid, padded mask and output
     */
    static size_t estimate_working_bytes(Eigen::Index rows, Eigen::Index cols,
                                         Eigen::Index kernel_rows, Eigen::Index kernel_cols,
                                         bool masked);

    const Logger& get_logger() const { return logger_; }

private:
    Logger logger_;

    struct Workspace;

    Workspace prepare(const Grid& grid,
                      const Kernel& kernel,
                      const Mask* mask,
                      ConvolutionMode mode) const;

    template<typename WindowStrategy>
    static void convolve_rows(Eigen::Index row_begin,
                              Eigen::Index row_end,
                              const Workspace& workspace,
                              Grid& output);

    static void run_rows(Eigen::Index row_begin,
                         Eigen::Index row_end,
                         const Workspace& workspace,
                         Grid& output);
};

} // namespace shake
