/**
 * @file MaskedConvolver.cpp
 * @brief Masked 2-D convolution with windowed and reference strategies
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "MaskedConvolver.hpp"
#include "BorderReflector.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <memory>
#include <optional>
#include <sstream>
#include <type_traits>

#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>

namespace shake {

namespace {

/**
 * @brief Weighted sum over a kernel-sized block of the padded grid
 */
struct WindowedStrategy {
    static double weighted_sum(const Grid& padded, Eigen::Index top, Eigen::Index left,
                               const Kernel& kernel) {
        return (padded.block(top, left, kernel.rows(), kernel.cols()) * kernel).sum();
    }
};

/**
 * @brief Same sum, one weight at a time
 */
struct ReferenceStrategy {
    static double weighted_sum(const Grid& padded, Eigen::Index top, Eigen::Index left,
                               const Kernel& kernel) {
        double average = 0.0;
        for (Eigen::Index k = 0; k < kernel.rows(); ++k) {
            for (Eigen::Index l = 0; l < kernel.cols(); ++l) {
                average += padded(top + k, left + l) * kernel(k, l);
            }
        }
        return average;
    }
};

std::string shape_string(Eigen::Index rows, Eigen::Index cols) {
    return "(" + std::to_string(rows) + ", " + std::to_string(cols) + ")";
}

} // namespace

struct MaskedConvolver::Workspace {
    const Grid* grid = nullptr;
    const Kernel* kernel = nullptr;
    const Mask* mask = nullptr;
    Grid padded_grid;
    std::optional<Mask> padded_mask;
    ConvolutionMode mode = ConvolutionMode::WINDOWED;
};

MaskedConvolver::MaskedConvolver() : logger_("MaskedConvolver") {}

MaskedConvolver::~MaskedConvolver() {
    logger_.flush();
}

void MaskedConvolver::validate_inputs(const Grid& grid,
                                      const Kernel& kernel,
                                      const Mask* mask,
                                      ConvolutionMode mode) {
    if (grid.size() == 0) {
        throw InvalidInputError("Grid is empty");
    }
    if (kernel.size() == 0) {
        throw InvalidInputError("Kernel is empty");
    }

    // Only one reflection is done on each side so the kernel cannot be
    // bigger than the grid
    if (kernel.rows() >= grid.rows() + 1 || kernel.cols() >= grid.cols() + 1) {
        throw InvalidInputError("Kernel shape " + shape_string(kernel.rows(), kernel.cols()) +
                                " is too large for grid shape " +
                                shape_string(grid.rows(), grid.cols()));
    }
    if (kernel.rows() % 2 == 0 || kernel.cols() % 2 == 0) {
        throw InvalidInputError("Kernel shape " + shape_string(kernel.rows(), kernel.cols()) +
                                " must be odd in both dimensions");
    }

    if (mask != nullptr) {
        if (mode == ConvolutionMode::REFERENCE) {
            throw InvalidInputError("Masking is not supported by the reference convolution");
        }
        if (mask->rows() != grid.rows() || mask->cols() != grid.cols()) {
            throw InvalidInputError("Mask shape " + shape_string(mask->rows(), mask->cols()) +
                                    " does not match grid shape " +
                                    shape_string(grid.rows(), grid.cols()));
        }
    }
}

size_t MaskedConvolver::estimate_working_bytes(Eigen::Index rows, Eigen::Index cols,
                                               Eigen::Index kernel_rows, Eigen::Index kernel_cols,
                                               bool masked) {
    const size_t padded_cells = static_cast<size_t>(rows + 2 * (kernel_rows / 2)) *
                                static_cast<size_t>(cols + 2 * (kernel_cols / 2));
    const size_t output_cells = static_cast<size_t>(rows) * static_cast<size_t>(cols);

    size_t bytes = padded_cells * sizeof(double) + output_cells * sizeof(double);
    if (masked) {
        bytes += padded_cells * sizeof(bool);
    }
    return bytes;
}

Kernel MaskedConvolver::redistribute_weights(const Kernel& kernel, const Mask& window_mask) {
    if (kernel.rows() != window_mask.rows() || kernel.cols() != window_mask.cols()) {
        throw InvalidInputError("Window mask shape " +
                                shape_string(window_mask.rows(), window_mask.cols()) +
                                " does not match kernel shape " +
                                shape_string(kernel.rows(), kernel.cols()));
    }

    const Eigen::Index remaining = (!window_mask).count();
    // The centre cell is never masked when this is reached
    if (remaining == 0) {
        throw InternalConsistencyError("Convolution window has no unmasked cells");
    }

    const double clobbered = window_mask.select(kernel, 0.0).sum();
    const double correction = clobbered / static_cast<double>(remaining);

    Kernel working = window_mask.select(0.0, kernel);
    working = (working != 0.0).select(working + correction, working);

    const double expected = kernel.sum();
    const double tolerance = WEIGHT_SUM_TOLERANCE * std::max(1.0, std::abs(expected));
    if (std::abs(working.sum() - expected) > tolerance) {
        std::ostringstream msg;
        msg.precision(17);
        msg << "Redistributed kernel sums to " << working.sum()
            << " instead of " << expected;
        throw InternalConsistencyError(msg.str());
    }

    return working;
}

MaskedConvolver::Workspace MaskedConvolver::prepare(const Grid& grid,
                                                    const Kernel& kernel,
                                                    const Mask* mask,
                                                    ConvolutionMode mode) const {
    validate_inputs(grid, kernel, mask, mode);

    const Eigen::Index half_rows = kernel.rows() / 2;
    const Eigen::Index half_cols = kernel.cols() / 2;

    const size_t bytes = estimate_working_bytes(grid.rows(), grid.cols(),
                                                kernel.rows(), kernel.cols(), mask != nullptr);
    const size_t megabytes = bytes / (1024 * 1024);
    if (megabytes > MEMORY_WARNING_MB) {
        logger_.warning("Convolution of a " + std::to_string(grid.rows()) + "x" +
                        std::to_string(grid.cols()) + " grid needs about " +
                        std::to_string(megabytes) + " MB of working memory");
    }

    if (logger_.shouldOutput(LogLevel::DEBUG)) {
        std::ostringstream msg;
        msg << "Convolving grid " << grid.rows() << "x" << grid.cols()
            << " with kernel " << kernel.rows() << "x" << kernel.cols()
            << " (" << (mode == ConvolutionMode::WINDOWED ? "windowed" : "reference")
            << ", " << (mask ? "masked" : "unmasked") << ", ~" << megabytes << " MB)";
        logger_.debug(msg.str());
    }

    Workspace workspace;
    workspace.grid = &grid;
    workspace.kernel = &kernel;
    workspace.mask = mask;
    workspace.mode = mode;
    workspace.padded_grid = BorderReflector::reflect_pad<double>(grid, half_rows, half_cols);
    if (mask != nullptr) {
        workspace.padded_mask = BorderReflector::reflect_pad<bool>(*mask, half_rows, half_cols);
        logger_.detailed("Masked cells: " + std::to_string(mask->count()) + " of " +
                         std::to_string(mask->size()));
    }

    return workspace;
}

template<typename WindowStrategy>
void MaskedConvolver::convolve_rows(Eigen::Index row_begin,
                                    Eigen::Index row_end,
                                    const Workspace& workspace,
                                    Grid& output) {
    const Grid& grid = *workspace.grid;
    const Kernel& kernel = *workspace.kernel;
    const Eigen::Index kernel_rows = kernel.rows();
    const Eigen::Index kernel_cols = kernel.cols();

    // Cell (io, jo) sits at (io + kernel_rows/2, jo + kernel_cols/2) in the
    // padded grid, so its window starts at (io, jo)
    for (Eigen::Index io = row_begin; io < row_end; ++io) {
        for (Eigen::Index jo = 0; jo < grid.cols(); ++jo) {
            if (workspace.mask != nullptr && (*workspace.mask)(io, jo)) {
                output(io, jo) = grid(io, jo);
                continue;
            }

            if (workspace.padded_mask) {
                const Mask window_mask = workspace.padded_mask->block(io, jo, kernel_rows, kernel_cols);
                if (window_mask.any()) {
                    const Kernel working = redistribute_weights(kernel, window_mask);
                    // Masked values may be NaN nodata, keep them out of the product
                    const Grid window = window_mask.select(
                        0.0, workspace.padded_grid.block(io, jo, kernel_rows, kernel_cols));
                    output(io, jo) = (window * working).sum();
                    continue;
                }
            }

            output(io, jo) = WindowStrategy::weighted_sum(workspace.padded_grid, io, jo, kernel);
        }
    }
}

void MaskedConvolver::run_rows(Eigen::Index row_begin,
                               Eigen::Index row_end,
                               const Workspace& workspace,
                               Grid& output) {
    switch (workspace.mode) {
        case ConvolutionMode::WINDOWED:
            convolve_rows<WindowedStrategy>(row_begin, row_end, workspace, output);
            break;
        case ConvolutionMode::REFERENCE:
            convolve_rows<ReferenceStrategy>(row_begin, row_end, workspace, output);
            break;
    }
}

template<typename ExecutionPolicy>
Grid MaskedConvolver::convolve_parallel([[maybe_unused]] const ExecutionPolicy& policy,
                                        const Grid& grid,
                                        const Kernel& kernel,
                                        const Mask* mask,
                                        ConvolutionMode mode) const {
    auto start = std::chrono::steady_clock::now();

    const Workspace workspace = prepare(grid, kernel, mask, mode);
    Grid output(grid.rows(), grid.cols());

    if constexpr (std::is_same_v<ExecutionPolicy, ParallelPolicy>) {
        std::unique_ptr<tbb::global_control> thread_limit;
        if (policy.max_threads > 0) {
            thread_limit = std::make_unique<tbb::global_control>(
                tbb::global_control::max_allowed_parallelism,
                static_cast<size_t>(policy.max_threads));
        }

        tbb::parallel_for(tbb::blocked_range<Eigen::Index>(0, grid.rows()),
            [&workspace, &output](const tbb::blocked_range<Eigen::Index>& range) {
                run_rows(range.begin(), range.end(), workspace, output);
            });
    } else {
        run_rows(0, grid.rows(), workspace, output);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    logger_.detailed("Convolution finished in " + std::to_string(elapsed.count()) + "ms");

    return output;
}

template Grid MaskedConvolver::convolve_parallel<SequentialPolicy>(
    const SequentialPolicy&, const Grid&, const Kernel&, const Mask*, ConvolutionMode) const;
template Grid MaskedConvolver::convolve_parallel<ParallelPolicy>(
    const ParallelPolicy&, const Grid&, const Kernel&, const Mask*, ConvolutionMode) const;

Grid MaskedConvolver::convolve(const Grid& grid,
                               const Kernel& kernel,
                               const Mask* mask,
                               ConvolutionMode mode) const {
    return convolve_parallel(SequentialPolicy{}, grid, kernel, mask, mode);
}

} // namespace shake
