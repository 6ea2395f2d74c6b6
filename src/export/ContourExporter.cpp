/**
 * @file ContourExporter.cpp
 * @brief Contour generation with GDALContourGenerate and OGR attribute filling
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ContourExporter.hpp"
#include "MMIStyle.hpp"
#include <gdal_priv.h>
#include <gdal_alg.h>
#include <ogrsf_frmts.h>
#include <ogr_geometry.h>
#include <ogr_spatialref.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <memory>
#include <sstream>
#include <utility>
#include <vector>

namespace shake {

namespace {

// Attribute schema, in creation order. ID and MMI are filled by GDAL.
constexpr const char* FIELD_ID = "ID";
constexpr const char* FIELD_MMI = "MMI";
constexpr const char* FIELD_X = "X";
constexpr const char* FIELD_Y = "Y";
constexpr const char* FIELD_RGB = "RGB";
constexpr const char* FIELD_ROMAN = "ROMAN";
constexpr const char* FIELD_ALIGN = "ALIGN";
constexpr const char* FIELD_VALIGN = "VALIGN";
constexpr const char* FIELD_LEN = "LEN";

std::string lowercase_extension(const std::string& path) {
    std::string extension = std::filesystem::path(path).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension;
}

double curve_length(const OGRGeometry* geometry) {
    if (!geometry) {
        return 0.0;
    }
    const OGRwkbGeometryType type = wkbFlatten(geometry->getGeometryType());
    if (OGR_GT_IsCurve(type)) {
        return geometry->toCurve()->get_Length();
    }
    if (OGR_GT_IsSubClassOf(type, wkbGeometryCollection)) {
        const OGRGeometryCollection* collection = geometry->toGeometryCollection();
        double total = 0.0;
        for (int i = 0; i < collection->getNumGeometries(); ++i) {
            total += curve_length(collection->getGeometryRef(i));
        }
        return total;
    }
    return 0.0;
}

} // namespace

ContourExporter::ContourExporter(const ContourConfig& config)
    : config_(config), logger_("ContourExporter") {
    GDALAllRegister();
}

ContourExporter::~ContourExporter() {
    logger_.flush();
}

std::string ContourExporter::driver_for_path(const std::string& output_path) {
    const std::string extension = lowercase_extension(output_path);
    if (extension == ".shp") return "ESRI Shapefile";
    if (extension == ".geojson" || extension == ".json") return "GeoJSON";
    if (extension == ".gpkg") return "GPKG";

    throw ContourCreationError("Unsupported output extension '" + extension +
                               "' for " + output_path + " (use .shp, .geojson or .gpkg)");
}

std::string ContourExporter::default_output_path(const std::string& input_path) {
    const std::filesystem::path input(input_path);
    return (input.parent_path() / (input.stem().string() + "-contour.shp")).string();
}

GDALDatasetPtr ContourExporter::create_memory_raster(const Grid& grid,
                                                     const RasterData& raster,
                                                     bool& has_excluded_cells) const {
    GDALDriver* memory_driver = GetGDALDriverManager()->GetDriverByName("MEM");
    if (!memory_driver) {
        throw ContourCreationError("Could not get GDAL MEM driver");
    }

    GDALDatasetPtr dataset(memory_driver->Create("", static_cast<int>(grid.cols()),
                                                 static_cast<int>(grid.rows()), 1,
                                                 GDT_Float64, nullptr));
    if (!dataset) {
        throw ContourCreationError("Could not create GDAL memory dataset: " + last_gdal_error());
    }

    std::array<double, 6> geotransform = raster.geotransform;
    if (dataset->SetGeoTransform(geotransform.data()) != CE_None) {
        throw ContourCreationError("Failed to set geotransform: " + last_gdal_error());
    }
    if (!raster.projection_wkt.empty() &&
        dataset->SetProjection(raster.projection_wkt.c_str()) != CE_None) {
        logger_.warning("Failed to set projection on memory raster: " + last_gdal_error());
    }

    Mask excluded = !grid.isFinite();
    if (raster.nodata_mask.rows() == grid.rows() && raster.nodata_mask.cols() == grid.cols()) {
        excluded = excluded || raster.nodata_mask;
    }
    has_excluded_cells = excluded.any();

    Grid values = excluded.select(CONTOUR_NODATA, grid);

    GDALRasterBand* band = dataset->GetRasterBand(1);
    if (!band) {
        throw ContourCreationError("Failed to get raster band from memory dataset");
    }
    if (has_excluded_cells) {
        if (band->SetNoDataValue(CONTOUR_NODATA) != CE_None) {
            throw ContourCreationError("Failed to set nodata on memory dataset: " + last_gdal_error());
        }
        logger_.detailed("Excluding " + std::to_string(excluded.count()) + " cell(s) from contouring");
    }

    CPLErr err = band->RasterIO(GF_Write, 0, 0, static_cast<int>(grid.cols()),
                                static_cast<int>(grid.rows()), values.data(),
                                static_cast<int>(grid.cols()), static_cast<int>(grid.rows()),
                                GDT_Float64, 0, 0);
    if (err != CE_None) {
        throw ContourCreationError("Failed to write grid to memory dataset: " + last_gdal_error());
    }

    return dataset;
}

GDALDatasetPtr ContourExporter::create_output_dataset(const std::string& output_path) const {
    const std::string driver_name = driver_for_path(output_path);
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName(driver_name.c_str());
    if (!driver) {
        throw ContourCreationError(driver_name + " driver not available");
    }

    if (std::filesystem::exists(output_path)) {
        logger_.detailed("Replacing existing output: " + output_path);
        if (driver->Delete(output_path.c_str()) != CE_None) {
            std::error_code ec;
            std::filesystem::remove(output_path, ec);
            if (ec) {
                throw ContourCreationError("Could not replace existing output " + output_path +
                                           ": " + ec.message());
            }
        }
    }

    const std::filesystem::path parent = std::filesystem::path(output_path).parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw ContourCreationError("Could not create output directory " + parent.string() +
                                       ": " + ec.message());
        }
    }

    GDALDatasetPtr dataset(driver->Create(output_path.c_str(), 0, 0, 0, GDT_Unknown, nullptr));
    if (!dataset) {
        throw ContourCreationError("Could not create datasource for " + output_path +
                                   ". Check file system permissions: " + last_gdal_error());
    }
    return dataset;
}

OGRLayer* ContourExporter::create_contour_layer(GDALDataset& dataset,
                                                const RasterData& raster) const {
    OGRSpatialReference srs;
    if (raster.projection_wkt.empty() ||
        srs.importFromWkt(raster.projection_wkt.c_str()) != OGRERR_NONE) {
        if (!raster.projection_wkt.empty()) {
            logger_.warning("Source projection not understood, writing WGS84");
        }
        srs.SetWellKnownGeogCS("WGS84");
    }
    srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

    OGRLayer* layer = dataset.CreateLayer(config_.layer_name.c_str(), &srs, wkbLineString, nullptr);
    if (!layer) {
        throw ContourCreationError("Failed to create layer '" + config_.layer_name + "': " +
                                   last_gdal_error());
    }

    const std::vector<std::pair<const char*, OGRFieldType>> schema = {
        {FIELD_ID, OFTInteger},
        {FIELD_MMI, OFTReal},
        {FIELD_X, OFTReal},
        {FIELD_Y, OFTReal},
        {FIELD_RGB, OFTString},
        {FIELD_ROMAN, OFTString},
        {FIELD_ALIGN, OFTString},
        {FIELD_VALIGN, OFTString},
        {FIELD_LEN, OFTReal}
    };

    for (const auto& [name, type] : schema) {
        OGRFieldDefn field(name, type);
        if (type == OFTString) {
            field.SetWidth(10);
        }
        if (layer->CreateField(&field) != OGRERR_NONE) {
            throw ContourCreationError(std::string("Failed to create field ") + name);
        }
    }

    return layer;
}

size_t ContourExporter::label_features(OGRLayer& layer) const {
    const OGRFeatureDefn* definition = layer.GetLayerDefn();
    const int x_index = definition->GetFieldIndex(FIELD_X);
    const int y_index = definition->GetFieldIndex(FIELD_Y);
    const int rgb_index = definition->GetFieldIndex(FIELD_RGB);
    const int roman_index = definition->GetFieldIndex(FIELD_ROMAN);
    const int align_index = definition->GetFieldIndex(FIELD_ALIGN);
    const int valign_index = definition->GetFieldIndex(FIELD_VALIGN);
    const int len_index = definition->GetFieldIndex(FIELD_LEN);
    const int mmi_index = definition->GetFieldIndex(FIELD_MMI);

    // Collect first, some drivers do not allow updates while a read is open
    std::vector<OGRFeatureUniquePtr> features;
    layer.ResetReading();
    for (OGRFeatureUniquePtr feature(layer.GetNextFeature()); feature;
         feature.reset(layer.GetNextFeature())) {
        features.push_back(std::move(feature));
    }

    size_t centroid_fallbacks = 0;
    for (auto& feature : features) {
        const double mmi = feature->GetFieldAsDouble(mmi_index);
        const OGRGeometry* geometry = feature->GetGeometryRef();

        double x = 0.0;
        double y = 0.0;
        double length = 0.0;
        if (geometry && !geometry->IsEmpty()) {
            OGREnvelope envelope;
            geometry->getEnvelope(&envelope);
            y = envelope.MinY;

            OGRPoint centroid;
            if (geometry->Centroid(&centroid) == OGRERR_NONE && !centroid.IsEmpty()) {
                x = centroid.getX();
            } else {
                x = 0.5 * (envelope.MinX + envelope.MaxX);
                ++centroid_fallbacks;
            }
            length = curve_length(geometry);
        }

        feature->SetField(x_index, x);
        feature->SetField(y_index, y);
        feature->SetField(rgb_index, MMIStyle::colour_for(mmi).c_str());
        feature->SetField(roman_index, MMIStyle::roman_numeral(MMIStyle::mmi_class(mmi)).c_str());
        feature->SetField(align_index, "Center");
        feature->SetField(valign_index, "HALF");
        feature->SetField(len_index, length);

        if (layer.SetFeature(feature.get()) != OGRERR_NONE) {
            throw ContourCreationError("Failed to update attributes of feature " +
                                       std::to_string(feature->GetFID()));
        }
    }

    if (centroid_fallbacks > 0) {
        logger_.debug("Centroid unavailable for " + std::to_string(centroid_fallbacks) +
                      " feature(s), used envelope centre for X");
    }

    return features.size();
}

void ContourExporter::copy_style_file(const std::string& output_path) const {
    if (!config_.style_file) {
        return;
    }

    const std::filesystem::path output(output_path);
    const std::filesystem::path target = output.parent_path() / (output.stem().string() + ".qml");

    std::error_code ec;
    std::filesystem::copy_file(*config_.style_file, target,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        throw ContourCreationError("Could not copy style file " + *config_.style_file +
                                   " to " + target.string() + ": " + ec.message());
    }
    logger_.detailed("Style written: " + target.string());
}

size_t ContourExporter::export_contours(const Grid& grid,
                                        const RasterData& raster,
                                        const std::string& output_path) const {
    if (grid.size() == 0) {
        throw ContourCreationError("Cannot contour an empty grid");
    }
    if (grid.rows() != raster.values.rows() || grid.cols() != raster.values.cols()) {
        throw ContourCreationError("Grid shape does not match the source raster");
    }

    std::ostringstream msg;
    msg << "Generating contours: interval=" << config_.interval << ", base=" << config_.base
        << ", output=" << output_path;
    logger_.info(msg.str());

    bool has_excluded_cells = false;
    GDALDatasetPtr memory_raster = create_memory_raster(grid, raster, has_excluded_cells);
    GDALDatasetPtr output = create_output_dataset(output_path);
    OGRLayer* layer = create_contour_layer(*output, raster);

    const OGRFeatureDefn* definition = layer->GetLayerDefn();
    const int id_index = definition->GetFieldIndex(FIELD_ID);
    const int mmi_index = definition->GetFieldIndex(FIELD_MMI);

    CPLErr err = GDALContourGenerate(GDALRasterBand::ToHandle(memory_raster->GetRasterBand(1)),
                                     config_.interval, config_.base,
                                     0, nullptr,
                                     has_excluded_cells ? TRUE : FALSE, CONTOUR_NODATA,
                                     OGRLayer::ToHandle(layer), id_index, mmi_index,
                                     nullptr, nullptr);
    if (err != CE_None) {
        throw ContourCreationError("GDALContourGenerate failed: " + last_gdal_error());
    }

    const size_t feature_count = label_features(*layer);

    // Closing the dataset writes it out, sidecars included
    output.reset();

    copy_style_file(output_path);

    logger_.info("Wrote " + std::to_string(feature_count) + " contour feature(s) to " + output_path);
    return feature_count;
}

} // namespace shake
