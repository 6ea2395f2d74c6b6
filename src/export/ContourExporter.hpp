#pragma once

/**
 * @file ContourExporter.hpp
 * @brief MMI contour line generation and vector export through GDAL/OGR
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "shake_contour.hpp"
#include "../core/Logger.hpp"
#include "../core/RasterReader.hpp"
#include <string>

class OGRLayer;

namespace shake {

class ContourExporter {
public:
    /// Value written to cells that must not take part in contouring
    static constexpr double CONTOUR_NODATA = -9999.0;

    explicit ContourExporter(const ContourConfig& config = ContourConfig{});
    ~ContourExporter();

    /**
     * @brief Contour a grid and write the labelled lines to a vector file
     *
     * The grid takes the georeferencing of @p raster. Cells in the raster's
     * nodata mask and non-finite cells are excluded. An existing output is
     * replaced.
     *
     * @param grid Field to contour, same shape as raster.values
     * @param raster Source raster supplying geotransform, projection and mask
     * @param output_path Target file; the driver follows its extension
     * @return Number of contour features written
     * @throws ContourCreationError if any GDAL/OGR step fails
     */
    size_t export_contours(const Grid& grid,
                           const RasterData& raster,
                           const std::string& output_path) const;

    /**
     * @brief OGR driver name for .shp, .geojson/.json or .gpkg
     * @throws ContourCreationError for any other extension
     */
    static std::string driver_for_path(const std::string& output_path);

    /**
     * @brief <input dir>/<input base>-contour.shp
     */
    static std::string default_output_path(const std::string& input_path);

    const ContourConfig& get_config() const { return config_; }

private:
    ContourConfig config_;
    Logger logger_;

    GDALDatasetPtr create_memory_raster(const Grid& grid, const RasterData& raster,
                                        bool& has_excluded_cells) const;
    GDALDatasetPtr create_output_dataset(const std::string& output_path) const;
    OGRLayer* create_contour_layer(GDALDataset& dataset, const RasterData& raster) const;

    /**
     * @brief Fill X, Y, RGB, ROMAN, ALIGN, VALIGN and LEN on every feature
     * @return Feature count
     */
    size_t label_features(OGRLayer& layer) const;

    void copy_style_file(const std::string& output_path) const;
};

} // namespace shake
