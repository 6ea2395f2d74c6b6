/**
 * @file SmoothingPipeline.cpp
 * @brief Smoothing method selection and Gaussian smoothing
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "SmoothingPipeline.hpp"
#include "GaussianKernel.hpp"
#include "MaskedConvolver.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace shake {

std::string smoothing_method_name(SmoothingMethod method) {
    switch (method) {
        case SmoothingMethod::NONE: return "none";
        case SmoothingMethod::GAUSSIAN: return "gaussian";
    }
    return "unknown";
}

SmoothingMethod parse_smoothing_method(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "none") return SmoothingMethod::NONE;
    if (lowered == "gaussian" || lowered == "numpy") return SmoothingMethod::GAUSSIAN;

    throw InvalidInputError("Unknown smoothing method '" + name + "' (expected none or gaussian)");
}

SmoothingPipeline::SmoothingPipeline(const SmoothingConfig& config)
    : config_(config), logger_("SmoothingPipeline") {}

SmoothingPipeline::~SmoothingPipeline() {
    logger_.flush();
}

Grid SmoothingPipeline::smooth(const Grid& grid, const Mask* mask) const {
    if (config_.method == SmoothingMethod::NONE) {
        logger_.info("Smoothing disabled, using raw grid");
        return grid;
    }

    std::ostringstream msg;
    msg << "Gaussian smoothing: sigma=" << config_.sigma
        << ", truncate=" << config_.truncate
        << ", grid " << grid.rows() << "x" << grid.cols();
    logger_.info(msg.str());

    // Reject oversized kernels before allocating them
    const Eigen::Index side = 2 * static_cast<Eigen::Index>(
        GaussianKernel::radius(config_.sigma, config_.truncate)) + 1;
    if (side > grid.rows() || side > grid.cols()) {
        std::ostringstream error;
        error << "Gaussian kernel " << side << "x" << side << " (sigma=" << config_.sigma
              << ", truncate=" << config_.truncate << ") does not fit grid "
              << grid.rows() << "x" << grid.cols();
        throw InvalidInputError(error.str());
    }

    const Kernel kernel = GaussianKernel::build(config_.sigma, config_.truncate);

    const Mask* effective_mask = nullptr;
    if (mask != nullptr) {
        if (config_.mask_nodata) {
            effective_mask = mask;
        } else {
            logger_.detailed("Nodata mask available but masking is disabled");
        }
    }

    MaskedConvolver convolver;
    if (config_.parallel_processing) {
        ParallelPolicy policy;
        policy.max_threads = config_.num_threads;
        logger_.detailed("Using row-parallel convolution");
        return convolver.convolve_parallel(policy, grid, kernel, effective_mask,
                                           ConvolutionMode::WINDOWED);
    }

    return convolver.convolve(grid, kernel, effective_mask, ConvolutionMode::WINDOWED);
}

} // namespace shake
