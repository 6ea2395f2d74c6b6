/**
 * @file main.cpp
 * @brief Main entry point for shake-contour
 *
 * Smooths an earthquake shakemap raster and writes labelled MMI contours.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "shake_contour.hpp"
#include "core/Logger.hpp"
#include "cli/CommandLineInterface.hpp"
#include <iostream>

using namespace shake;

/**
 * @brief Print performance summary
 */
void print_performance_summary(const PerformanceMetrics& metrics) {
    std::cout << "\n=== Performance Summary ===\n";
    std::cout << "Raster read: " << metrics.read_time.count() << "ms\n";
    std::cout << "Smoothing: " << metrics.smoothing_time.count() << "ms\n";
    std::cout << "Contouring: " << metrics.contour_time.count() << "ms\n";
    std::cout << "Total time: " << metrics.total_time.count() << "ms\n";
    std::cout << "Grid: " << metrics.grid_rows << "x" << metrics.grid_cols
              << " (" << metrics.masked_cells << " nodata cells)\n";
    std::cout << "Features written: " << metrics.features_written << "\n";
    std::cout << "===========================\n";
}

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    Logger logger("main");

    try {
        CommandLineInterface cli;
        switch (cli.parse_arguments(argc, argv)) {
            case CommandLineInterface::ParseResult::EXIT_OK:
                return 0;
            case CommandLineInterface::ParseResult::EXIT_ERROR:
                return 1;
            case CommandLineInterface::ParseResult::RUN:
                break;
        }

        const ShakeContourConfig& config = cli.get_config();
        logger.setLogFile(config.log_file);

        if (logger.shouldOutput(LogLevel::DETAILED)) {
            cli.print_config();
        }

        if (cli.is_dry_run()) {
            logger.info("Dry run mode - configuration validated successfully");
            return 0;
        }

        ShakeContourGenerator generator(config);
        const std::string output_path = generator.generate();

        if (logger.shouldOutput(LogLevel::DETAILED)) {
            print_performance_summary(generator.get_metrics());
        }

        logger.info("Contours written to " + output_path);
        return 0;

    } catch (const std::exception& e) {
        logger.error(std::string("Fatal error: ") + e.what());
        return 1;
    }
}
