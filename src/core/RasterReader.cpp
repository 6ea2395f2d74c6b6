/**
 * @file RasterReader.cpp
 * @brief GDAL band reading into Eigen grids
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "RasterReader.hpp"
#include <gdal_priv.h>
#include <cmath>
#include <limits>
#include <memory>
#include <sstream>

namespace shake {

void GDALDatasetDeleter::operator()(GDALDataset* dataset) const {
    if (dataset) {
        GDALClose(dataset);
    }
}

std::string last_gdal_error() {
    const char* message = CPLGetLastErrorMsg();
    return (message && *message) ? std::string(message) : std::string("unknown GDAL error");
}

RasterReader::RasterReader() : logger_("RasterReader") {
    GDALAllRegister();
}

RasterReader::~RasterReader() {
    logger_.flush();
}

RasterData RasterReader::read(const std::string& path, int band) const {
    logger_.info("Reading raster: " + path + " (band " + std::to_string(band) + ")");

    GDALDatasetPtr dataset(static_cast<GDALDataset*>(GDALOpen(path.c_str(), GA_ReadOnly)));
    if (!dataset) {
        throw RasterReadError("Could not open raster " + path + ": " + last_gdal_error());
    }

    const int band_count = dataset->GetRasterCount();
    if (band < 1 || band > band_count) {
        throw RasterReadError("Band " + std::to_string(band) + " requested but " + path +
                              " has " + std::to_string(band_count) + " band(s)");
    }

    const int width = dataset->GetRasterXSize();
    const int height = dataset->GetRasterYSize();
    if (width <= 0 || height <= 0) {
        throw RasterReadError("Raster " + path + " has no cells");
    }

    GDALRasterBand* raster_band = dataset->GetRasterBand(band);
    if (!raster_band) {
        throw RasterReadError("Failed to get raster band " + std::to_string(band));
    }

    RasterData data;
    data.source_path = path;
    data.band = band;
    data.values.resize(height, width);

    // Grid is row-major so a single RasterIO fills it in GDAL's scanline order
    CPLErr err = raster_band->RasterIO(GF_Read, 0, 0, width, height,
                                       data.values.data(), width, height, GDT_Float64, 0, 0);
    if (err != CE_None) {
        throw RasterReadError("Failed to read band " + std::to_string(band) + " of " + path +
                              ": " + last_gdal_error());
    }

    int has_nodata = 0;
    const double nodata = raster_band->GetNoDataValue(&has_nodata);
    if (has_nodata) {
        data.nodata_value = nodata;
    }

    data.nodata_mask = !data.values.isFinite();
    if (data.nodata_value && std::isfinite(*data.nodata_value)) {
        data.nodata_mask = data.nodata_mask || (data.values == *data.nodata_value);
    }

    if (dataset->GetGeoTransform(data.geotransform.data()) != CE_None) {
        logger_.warning("Raster has no geotransform, using pixel coordinates");
        data.geotransform = {0.0, 1.0, 0.0, 0.0, 0.0, 1.0};
    }

    const char* projection = dataset->GetProjectionRef();
    if (projection && *projection) {
        data.projection_wkt = projection;
    } else {
        logger_.detailed("Raster has no spatial reference");
    }

    std::ostringstream msg;
    msg << "Read " << height << "x" << width << " grid";
    if (data.nodata_value) {
        msg << ", nodata=" << *data.nodata_value;
    }
    msg << ", " << data.masked_count() << " masked cell(s)";
    logger_.info(msg.str());

    if (logger_.shouldOutput(LogLevel::DEBUG) && data.masked_count() < data.values.size()) {
        const Grid valid = data.nodata_mask.select(0.0, data.values);
        const double lowest = data.nodata_mask.select(
            std::numeric_limits<double>::infinity(), data.values).minCoeff();
        const double highest = data.nodata_mask.select(
            -std::numeric_limits<double>::infinity(), data.values).maxCoeff();
        std::ostringstream range;
        range << "Value range: " << lowest << " to " << highest
              << ", mean " << valid.sum() / static_cast<double>(data.values.size() - data.masked_count());
        logger_.debug(range.str());
    }

    return data;
}

} // namespace shake
