/**
 * @file test_raster_reader.cpp
 * @brief Unit tests for RasterReader against GeoTIFFs written through GDAL
 */

#include "core/RasterReader.hpp"

#include <gtest/gtest.h>
#include <gdal_priv.h>
#include <ogr_spatialref.h>
#include <cpl_conv.h>

#include <cmath>
#include <filesystem>
#include <limits>

using namespace shake;

namespace fs = std::filesystem;

class RasterReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        GDALAllRegister();
        work_dir_ = fs::temp_directory_path() / "shake_contour_reader_test";
        fs::remove_all(work_dir_);
        fs::create_directories(work_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(work_dir_, ec);
    }

    // 4 rows x 5 cols, value = row * 10 + col, optional nodata
    fs::path WriteGeoTiff(const std::string& name,
                          std::optional<double> nodata = std::nullopt,
                          bool georeferenced = true) {
        const fs::path path = work_dir_ / name;
        GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
        if (!driver) {
            ADD_FAILURE() << "GTiff driver unavailable";
            return path;
        }

        GDALDatasetPtr dataset(driver->Create(path.string().c_str(), 5, 4, 1, GDT_Float64, nullptr));
        if (!dataset) {
            ADD_FAILURE() << "Could not create " << path;
            return path;
        }

        Grid values(4, 5);
        for (Eigen::Index i = 0; i < 4; ++i) {
            for (Eigen::Index j = 0; j < 5; ++j) {
                values(i, j) = static_cast<double>(i * 10 + j);
            }
        }
        values(3, 4) = std::numeric_limits<double>::quiet_NaN();
        if (nodata) {
            values(0, 1) = *nodata;
            values(2, 2) = *nodata;
        }

        if (georeferenced) {
            double geotransform[6] = {-118.5, 0.25, 0.0, 34.5, 0.0, -0.25};
            EXPECT_EQ(dataset->SetGeoTransform(geotransform), CE_None);

            OGRSpatialReference srs;
            srs.SetWellKnownGeogCS("WGS84");
            char* wkt = nullptr;
            srs.exportToWkt(&wkt);
            EXPECT_EQ(dataset->SetProjection(wkt), CE_None);
            CPLFree(wkt);
        }

        GDALRasterBand* band = dataset->GetRasterBand(1);
        if (nodata) {
            EXPECT_EQ(band->SetNoDataValue(*nodata), CE_None);
        }
        EXPECT_EQ(band->RasterIO(GF_Write, 0, 0, 5, 4, values.data(), 5, 4, GDT_Float64, 0, 0),
                  CE_None);
        return path;
    }

    fs::path work_dir_;
    RasterReader reader_;
};

TEST_F(RasterReaderTest, ReadsValuesInRowMajorOrder) {
    const fs::path path = WriteGeoTiff("plain.tif");
    RasterData data = reader_.read(path.string());

    ASSERT_EQ(data.values.rows(), 4);
    ASSERT_EQ(data.values.cols(), 5);
    EXPECT_DOUBLE_EQ(data.values(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(data.values(0, 4), 4.0);
    EXPECT_DOUBLE_EQ(data.values(2, 1), 21.0);
    EXPECT_EQ(data.band, 1);
    EXPECT_EQ(data.source_path, path.string());
}

TEST_F(RasterReaderTest, NonFiniteCellsAreMasked) {
    RasterData data = reader_.read(WriteGeoTiff("nan.tif").string());

    EXPECT_FALSE(data.nodata_value.has_value());
    EXPECT_EQ(data.masked_count(), 1);
    EXPECT_TRUE(data.nodata_mask(3, 4));
}

TEST_F(RasterReaderTest, NoDataValueIsMasked) {
    RasterData data = reader_.read(WriteGeoTiff("nodata.tif", -9999.0).string());

    ASSERT_TRUE(data.nodata_value.has_value());
    EXPECT_DOUBLE_EQ(*data.nodata_value, -9999.0);
    EXPECT_EQ(data.masked_count(), 3);
    EXPECT_TRUE(data.nodata_mask(0, 1));
    EXPECT_TRUE(data.nodata_mask(2, 2));
    EXPECT_FALSE(data.nodata_mask(0, 0));
}

TEST_F(RasterReaderTest, CarriesGeoreferencing) {
    RasterData data = reader_.read(WriteGeoTiff("georef.tif").string());

    EXPECT_DOUBLE_EQ(data.geotransform[0], -118.5);
    EXPECT_DOUBLE_EQ(data.geotransform[1], 0.25);
    EXPECT_DOUBLE_EQ(data.geotransform[3], 34.5);
    EXPECT_DOUBLE_EQ(data.geotransform[5], -0.25);
    EXPECT_NE(data.projection_wkt.find("WGS"), std::string::npos);
}

TEST_F(RasterReaderTest, MissingGeotransformFallsBackToPixels) {
    RasterData data = reader_.read(WriteGeoTiff("bare.tif", std::nullopt, false).string());

    EXPECT_DOUBLE_EQ(data.geotransform[0], 0.0);
    EXPECT_DOUBLE_EQ(data.geotransform[1], 1.0);
    EXPECT_DOUBLE_EQ(data.geotransform[5], 1.0);
    EXPECT_TRUE(data.projection_wkt.empty());
}

TEST_F(RasterReaderTest, MissingFileThrows) {
    EXPECT_THROW(reader_.read((work_dir_ / "absent.tif").string()), RasterReadError);
}

TEST_F(RasterReaderTest, BadBandThrows) {
    const fs::path path = WriteGeoTiff("band.tif");
    EXPECT_THROW(reader_.read(path.string(), 2), RasterReadError);
    EXPECT_THROW(reader_.read(path.string(), 0), RasterReadError);
}
