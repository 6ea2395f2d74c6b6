#pragma once

/**
 * @file RasterReader.hpp
 * @brief Reads one band of a GDAL raster into a Grid with its nodata mask
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "shake_contour.hpp"
#include "Logger.hpp"
#include <array>
#include <memory>
#include <optional>
#include <string>

class GDALDataset;

namespace shake {

// RAII wrapper for GDAL dataset
struct GDALDatasetDeleter {
    void operator()(GDALDataset* dataset) const;
};

using GDALDatasetPtr = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;

/**
 * @brief Most recent CPL error message, or a generic text when GDAL set none
 */
std::string last_gdal_error();

/**
 * @brief A raster band in memory plus the georeferencing needed to write it back
 */
struct RasterData {
    Grid values;
    Mask nodata_mask;                       ///< true where the cell is nodata or non-finite
    std::optional<double> nodata_value;
    std::array<double, 6> geotransform{0.0, 1.0, 0.0, 0.0, 0.0, 1.0};
    std::string projection_wkt;             ///< empty when the raster carries none
    std::string source_path;
    int band = 1;

    Eigen::Index masked_count() const { return nodata_mask.count(); }
};

class RasterReader {
public:
    RasterReader();
    ~RasterReader();

    /**
     * @brief Read a band as Float64
     * @param path Any GDAL-readable raster
     * @param band 1-based band index
     * @throws RasterReadError if the file cannot be opened, the band does
     *         not exist or the read fails
     */
    RasterData read(const std::string& path, int band = 1) const;

private:
    Logger logger_;
};

} // namespace shake
