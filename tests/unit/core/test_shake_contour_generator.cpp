/**
 * @file test_shake_contour_generator.cpp
 * @brief End-to-end tests for the read, smooth and contour stages
 */

#include "shake_contour.hpp"
#include "core/RasterReader.hpp"

#include <gtest/gtest.h>
#include <gdal_priv.h>

#include <cmath>
#include <filesystem>

using namespace shake;

namespace fs = std::filesystem;

class ShakeContourGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        GDALAllRegister();
        work_dir_ = fs::temp_directory_path() / "shake_contour_generator_test";
        fs::remove_all(work_dir_);
        fs::create_directories(work_dir_);
        input_ = WriteShakemap(work_dir_ / "mmi_mean.tif");

        config_.input_path = input_.string();
        config_.contour.interval = 1.0;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(work_dir_, ec);
    }

    // 30x30 intensity cone with a nodata corner
    static fs::path WriteShakemap(const fs::path& path) {
        GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
        if (!driver) {
            ADD_FAILURE() << "GTiff driver unavailable";
            return path;
        }
        GDALDatasetPtr dataset(driver->Create(path.string().c_str(), 30, 30, 1, GDT_Float64, nullptr));
        if (!dataset) {
            ADD_FAILURE() << "Could not create " << path;
            return path;
        }

        double geotransform[6] = {-117.0, 0.1, 0.0, 35.0, 0.0, -0.1};
        EXPECT_EQ(dataset->SetGeoTransform(geotransform), CE_None);

        Grid values(30, 30);
        for (Eigen::Index i = 0; i < 30; ++i) {
            for (Eigen::Index j = 0; j < 30; ++j) {
                values(i, j) = 7.8 - 0.25 * std::hypot(i - 14.7, j - 15.2);
            }
        }
        values.block(0, 0, 3, 3).setConstant(-1.0);

        GDALRasterBand* band = dataset->GetRasterBand(1);
        EXPECT_EQ(band->SetNoDataValue(-1.0), CE_None);
        EXPECT_EQ(band->RasterIO(GF_Write, 0, 0, 30, 30, values.data(), 30, 30, GDT_Float64, 0, 0),
                  CE_None);
        return path;
    }

    fs::path work_dir_;
    fs::path input_;
    ShakeContourConfig config_;
};

TEST_F(ShakeContourGeneratorTest, GenerateWritesDefaultOutput) {
    ShakeContourGenerator generator(config_);
    const std::string output = generator.generate();

    EXPECT_EQ(output, (work_dir_ / "mmi_mean-contour.shp").string());
    EXPECT_TRUE(fs::exists(output));

    const PerformanceMetrics& metrics = generator.get_metrics();
    EXPECT_EQ(metrics.grid_rows, 30u);
    EXPECT_EQ(metrics.grid_cols, 30u);
    EXPECT_EQ(metrics.masked_cells, 9u);
    EXPECT_GT(metrics.features_written, 0u);
}

TEST_F(ShakeContourGeneratorTest, MaskedSmoothingKeepsNoData) {
    config_.smoothing.mask_nodata = true;
    config_.output_path = (work_dir_ / "masked.geojson").string();

    ShakeContourGenerator generator(config_);
    generator.load_raster();
    generator.smooth_raster();

    const Grid& smoothed = generator.get_smoothed_grid();
    EXPECT_DOUBLE_EQ(smoothed(0, 0), -1.0);
    EXPECT_DOUBLE_EQ(smoothed(2, 2), -1.0);
    EXPECT_GT(smoothed(3, 3), 0.0);

    EXPECT_GT(generator.export_contours(), 0u);
    EXPECT_TRUE(fs::exists(config_.output_path));
}

TEST_F(ShakeContourGeneratorTest, NoSmoothingKeepsRawGrid) {
    config_.smoothing.method = SmoothingMethod::NONE;

    ShakeContourGenerator generator(config_);
    generator.load_raster();
    generator.smooth_raster();

    EXPECT_TRUE((generator.get_smoothed_grid() == generator.get_raster().values).all());
}

TEST_F(ShakeContourGeneratorTest, StagesMustRunInOrder) {
    ShakeContourGenerator generator(config_);

    EXPECT_THROW(generator.smooth_raster(), InvalidInputError);
    EXPECT_THROW(generator.export_contours(), InvalidInputError);
    EXPECT_THROW(generator.get_smoothed_grid(), InvalidInputError);

    generator.load_raster();
    EXPECT_THROW(generator.export_contours(), InvalidInputError);
}

TEST_F(ShakeContourGeneratorTest, UnreadableInputThrows) {
    config_.input_path = (work_dir_ / "missing.tif").string();
    ShakeContourGenerator generator(config_);

    EXPECT_THROW(generator.generate(), RasterReadError);
}

TEST_F(ShakeContourGeneratorTest, UpdateConfigResetsStages) {
    ShakeContourGenerator generator(config_);
    generator.load_raster();
    generator.smooth_raster();

    ShakeContourConfig updated = config_;
    updated.output_path = (work_dir_ / "updated.gpkg").string();
    generator.update_config(updated);

    EXPECT_EQ(generator.resolved_output_path(), updated.output_path);
    EXPECT_THROW(generator.get_smoothed_grid(), InvalidInputError);
}
