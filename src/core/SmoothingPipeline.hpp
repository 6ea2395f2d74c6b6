#pragma once

/**
 * @file SmoothingPipeline.hpp
 * @brief Applies the configured smoothing between raster read and contouring
 */

#include "shake_contour.hpp"
#include "Logger.hpp"

namespace shake {

class SmoothingPipeline {
public:
    explicit SmoothingPipeline(const SmoothingConfig& config = SmoothingConfig{});
    ~SmoothingPipeline();

    /**
     * @brief Smooth a grid according to the configuration
     *
     * GAUSSIAN builds a kernel from sigma/truncate and runs the windowed
     * convolution; the mask is honoured only when mask_nodata is set.
     * NONE returns a copy of the input.
     *
     * @param grid Raw field
     * @param mask Optional nodata mask of the grid's shape
     * @throws InvalidInputError if the configuration or shapes are invalid
     */
    Grid smooth(const Grid& grid, const Mask* mask = nullptr) const;

    const SmoothingConfig& get_config() const { return config_; }
    void set_config(const SmoothingConfig& config) { config_ = config; }

private:
    SmoothingConfig config_;
    Logger logger_;
};

} // namespace shake
