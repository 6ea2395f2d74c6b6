/**
 * @file ShakeContourGenerator.cpp
 * @brief Read, smooth and contour pipeline with stage timings
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "shake_contour.hpp"
#include "Logger.hpp"
#include "RasterReader.hpp"
#include "SmoothingPipeline.hpp"
#include "../export/ContourExporter.hpp"
#include <chrono>
#include <sstream>

namespace shake {

// ============================================================================
// ShakeContourGenerator::Impl
// ============================================================================

class ShakeContourGenerator::Impl {
public:
    explicit Impl(const ShakeContourConfig& config)
        : config_(config), logger_("ShakeContourGenerator") {}

    ~Impl() {
        logger_.flush();
    }

    std::string generate() {
        auto start_time = std::chrono::steady_clock::now();
        metrics_ = {};
        raster_loaded_ = false;
        smoothed_ = false;

        logger_.info("Starting contour generation for " + config_.input_path);

        load_raster();
        smooth_raster();
        export_contours();

        auto end_time = std::chrono::steady_clock::now();
        metrics_.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);

        log_summary();
        return resolved_output_path();
    }

    void load_raster() {
        auto start_time = std::chrono::steady_clock::now();

        RasterReader reader;
        raster_ = reader.read(config_.input_path, config_.band);
        raster_loaded_ = true;
        smoothed_ = false;

        metrics_.grid_rows = static_cast<size_t>(raster_.values.rows());
        metrics_.grid_cols = static_cast<size_t>(raster_.values.cols());
        metrics_.masked_cells = static_cast<size_t>(raster_.masked_count());

        auto end_time = std::chrono::steady_clock::now();
        metrics_.read_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);
    }

    void smooth_raster() {
        require_raster("smoothing");
        auto start_time = std::chrono::steady_clock::now();

        SmoothingPipeline pipeline(config_.smoothing);
        const Mask* mask = raster_.masked_count() > 0 ? &raster_.nodata_mask : nullptr;
        smoothed_grid_ = pipeline.smooth(raster_.values, mask);
        smoothed_ = true;

        auto end_time = std::chrono::steady_clock::now();
        metrics_.smoothing_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);
    }

    size_t export_contours() {
        require_raster("contouring");
        if (!smoothed_) {
            throw InvalidInputError("Raster must be smoothed before contouring");
        }
        auto start_time = std::chrono::steady_clock::now();

        ContourExporter exporter(config_.contour);
        metrics_.features_written = exporter.export_contours(smoothed_grid_, raster_,
                                                             resolved_output_path());

        auto end_time = std::chrono::steady_clock::now();
        metrics_.contour_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);
        return metrics_.features_written;
    }

    std::string resolved_output_path() const {
        if (!config_.output_path.empty()) {
            return config_.output_path;
        }
        return ContourExporter::default_output_path(config_.input_path);
    }

    const RasterData& get_raster() const {
        require_raster("reading the raster");
        return raster_;
    }

    const Grid& get_smoothed_grid() const {
        if (!smoothed_) {
            throw InvalidInputError("No smoothed grid available, run smooth_raster() first");
        }
        return smoothed_grid_;
    }

    const PerformanceMetrics& get_metrics() const { return metrics_; }

    void update_config(const ShakeContourConfig& config) {
        config_ = config;
        raster_loaded_ = false;
        smoothed_ = false;
    }

    const ShakeContourConfig& get_config() const { return config_; }

private:
    ShakeContourConfig config_;
    Logger logger_;
    RasterData raster_;
    Grid smoothed_grid_;
    bool raster_loaded_ = false;
    bool smoothed_ = false;
    PerformanceMetrics metrics_;

    void require_raster(const std::string& stage) const {
        if (!raster_loaded_) {
            throw InvalidInputError("No raster loaded before " + stage);
        }
    }

    void log_summary() const {
        std::ostringstream summary;
        summary << "Grid " << metrics_.grid_rows << "x" << metrics_.grid_cols
                << " (" << metrics_.masked_cells << " masked), "
                << metrics_.features_written << " contour feature(s)";
        logger_.info(summary.str());

        logger_.detailed("Read time: " + std::to_string(metrics_.read_time.count()) + "ms");
        logger_.detailed("Smoothing time: " + std::to_string(metrics_.smoothing_time.count()) + "ms");
        logger_.detailed("Contour time: " + std::to_string(metrics_.contour_time.count()) + "ms");
        logger_.info("Contour generation completed in " +
                     std::to_string(metrics_.total_time.count()) + "ms");
    }
};

// ============================================================================
// ShakeContourGenerator
// ============================================================================

ShakeContourGenerator::ShakeContourGenerator(const ShakeContourConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

ShakeContourGenerator::~ShakeContourGenerator() = default;

std::string ShakeContourGenerator::generate() {
    return impl_->generate();
}

void ShakeContourGenerator::load_raster() {
    impl_->load_raster();
}

void ShakeContourGenerator::smooth_raster() {
    impl_->smooth_raster();
}

size_t ShakeContourGenerator::export_contours() {
    return impl_->export_contours();
}

const RasterData& ShakeContourGenerator::get_raster() const {
    return impl_->get_raster();
}

const Grid& ShakeContourGenerator::get_smoothed_grid() const {
    return impl_->get_smoothed_grid();
}

const PerformanceMetrics& ShakeContourGenerator::get_metrics() const {
    return impl_->get_metrics();
}

std::string ShakeContourGenerator::resolved_output_path() const {
    return impl_->resolved_output_path();
}

void ShakeContourGenerator::update_config(const ShakeContourConfig& config) {
    impl_->update_config(config);
}

const ShakeContourConfig& ShakeContourGenerator::get_config() const {
    return impl_->get_config();
}

} // namespace shake
