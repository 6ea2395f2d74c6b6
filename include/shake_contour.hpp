#pragma once

/**
 * @file shake_contour.hpp
 * @brief Main header for the ShakeContour smoothing and contouring tool
 *
 * Shared grid types, configuration structures and the exception hierarchy
 * used by the smoothing core, the GDAL adapters and the command line.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <array>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

// Linear algebra
#include <Eigen/Dense>

namespace shake {

// ============================================================================
// Grid Types
// ============================================================================

/**
 * @brief 2-D scalar field, row-major (row = raster line, col = pixel)
 */
using Grid = Eigen::Array<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/**
 * @brief Exclusion mask, true marks a cell that must not contribute
 */
using Mask = Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/**
 * @brief Convolution weights; odd dimensions, centre at (rows/2, cols/2)
 */
using Kernel = Grid;

// ============================================================================
// Exceptions
// ============================================================================

/**
 * @brief Base class for all errors raised by ShakeContour
 */
class ShakeContourError : public std::runtime_error {
public:
    explicit ShakeContourError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Caller supplied arguments that violate a precondition
 *
 * Shape mismatches, oversized or even kernels, non-positive spread,
 * masking requested together with the reference algorithm.
 */
class InvalidInputError : public ShakeContourError {
public:
    explicit InvalidInputError(const std::string& message)
        : ShakeContourError("Invalid input: " + message) {}
};

/**
 * @brief An internal invariant did not hold (implementation bug)
 */
class InternalConsistencyError : public ShakeContourError {
public:
    explicit InternalConsistencyError(const std::string& message)
        : ShakeContourError("Internal consistency violated: " + message) {}
};

/**
 * @brief Raster source could not be opened or read
 */
class RasterReadError : public ShakeContourError {
public:
    explicit RasterReadError(const std::string& message)
        : ShakeContourError("Raster read failed: " + message) {}
};

/**
 * @brief Vector output or contour generation failed
 */
class ContourCreationError : public ShakeContourError {
public:
    explicit ContourCreationError(const std::string& message)
        : ShakeContourError("Contour creation failed: " + message) {}
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Smoothing applied between raster read and contour generation
 */
enum class SmoothingMethod {
    NONE,       // Pass the raster through unchanged
    GAUSSIAN    // Truncated Gaussian convolution with reflective borders
};

/**
 * @brief Convolution window strategy
 */
enum class ConvolutionMode {
    WINDOWED,   // Block multiply-and-reduce per cell, supports masking
    REFERENCE   // Explicit per-weight iteration, unmasked correctness oracle
};

struct SmoothingConfig {
    SmoothingMethod method = SmoothingMethod::GAUSSIAN;
    double sigma = 0.9;                 ///< Gaussian spread in pixels
    double truncate = 4.0;              ///< Kernel radius in standard deviations
    bool mask_nodata = false;           ///< Exclude nodata cells from the convolution
    bool parallel_processing = false;   ///< Shard output rows across TBB workers
    int num_threads = 0;                ///< 0 = let TBB decide
};

struct ContourConfig {
    double interval = 0.5;              ///< MMI spacing between contour lines
    double base = 0.0;                  ///< Level the interval is offset from
    std::string layer_name = "contour";
    std::optional<std::string> style_file;  ///< QGIS .qml copied beside the output
};

/**
 * @brief Complete run configuration assembled from defaults, JSON and CLI
 */
struct ShakeContourConfig {
    std::string input_path;
    int band = 1;                       ///< 1-based raster band index
    std::string output_path;            ///< Empty = <input dir>/<input base>-contour.shp

    SmoothingConfig smoothing;
    ContourConfig contour;

    std::optional<std::string> config_file;
    std::string log_level = "3";        ///< Level or facility spec, e.g. "3,MaskedConvolver=6"
    std::optional<std::string> log_file;
};

/**
 * @brief Timings and counts collected during one run
 */
struct PerformanceMetrics {
    std::chrono::milliseconds read_time{0};
    std::chrono::milliseconds smoothing_time{0};
    std::chrono::milliseconds contour_time{0};
    std::chrono::milliseconds total_time{0};
    size_t grid_rows = 0;
    size_t grid_cols = 0;
    size_t masked_cells = 0;
    size_t features_written = 0;
};

// ============================================================================
// Helpers
// ============================================================================

std::string smoothing_method_name(SmoothingMethod method);

/**
 * @brief Parse "none" or "gaussian" (also accepts "numpy" for the latter)
 * @throws InvalidInputError for any other name
 */
SmoothingMethod parse_smoothing_method(const std::string& name);

// ============================================================================
// Main Generator
// ============================================================================

struct RasterData;

/**
 * @brief Read, smooth and contour one shakemap raster
 *
 * Stages may be run individually in order; generate() runs all three.
 * Every stage throws a ShakeContourError subclass on failure.
 */
class ShakeContourGenerator {
public:
    explicit ShakeContourGenerator(const ShakeContourConfig& config);
    ~ShakeContourGenerator();

    /**
     * @brief Run the full pipeline
     * @return Path of the written vector file
     */
    std::string generate();

    // Individual pipeline stages
    void load_raster();
    void smooth_raster();
    size_t export_contours();

    // Accessors
    const RasterData& get_raster() const;
    const Grid& get_smoothed_grid() const;
    const PerformanceMetrics& get_metrics() const;

    /**
     * @brief Configured output path, or the default derived from the input
     */
    std::string resolved_output_path() const;

    void update_config(const ShakeContourConfig& config);
    const ShakeContourConfig& get_config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace shake
