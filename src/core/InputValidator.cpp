/**
 * @file InputValidator.cpp
 * @brief Implementation of input validation
 */

#include "InputValidator.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <sstream>

namespace shake {

namespace {

std::string format_number(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

} // namespace

std::string ValidationResult::format_error_message() const {
    if (conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << (is_valid ? "\nWARNING: Questionable parameters detected:\n\n"
                     : "\nERROR: Invalid parameters detected:\n\n");

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << (conflict.is_warning ? "Warning " : "Conflict ") << (i + 1)
            << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }

    if (!is_valid) {
        oss << "\nProgram terminated due to invalid inputs.\n";
    }
    return oss.str();
}

ValidationResult InputValidator::validate(const ShakeContourConfig& config) const {
    ValidationResult result;

    auto record = [&result](const std::optional<ParameterConflict>& conflict) {
        if (!conflict) return;
        result.conflicts.push_back(*conflict);
        if (!conflict->is_warning) {
            result.is_valid = false;
        }
    };

    record(check_input_source(config));
    record(check_smoothing_parameters(config.smoothing));
    record(check_contour_parameters(config.contour));
    record(check_smoothing_method_options(config.smoothing));
    record(check_output_format(config));

    return result;
}

std::optional<ParameterConflict> InputValidator::check_input_source(
    const ShakeContourConfig& config) const {

    if (config.input_path.empty()) {
        ParameterConflict conflict;
        conflict.description = "No input raster given";
        conflict.involved_params = {"--input (not provided)"};
        conflict.suggestions = {
            "Use --input path/to/shakemap.tif",
            "Set \"input\" in a --config JSON file"
        };
        return conflict;
    }

    if (config.band < 1) {
        ParameterConflict conflict;
        conflict.description = "Raster band index must be 1 or greater";
        conflict.involved_params = {"--band " + std::to_string(config.band)};
        conflict.suggestions = {"Use --band 1 for single-band shakemaps"};
        return conflict;
    }

    return std::nullopt;
}

std::optional<ParameterConflict> InputValidator::check_smoothing_parameters(
    const SmoothingConfig& config) const {

    ParameterConflict conflict;
    conflict.description = "Smoothing parameters out of range";

    if (!std::isfinite(config.sigma) || config.sigma <= 0.0) {
        conflict.involved_params.push_back("--sigma " + format_number(config.sigma) + " (must be > 0)");
        conflict.suggestions.push_back("Use --sigma 0.9 (default) or another positive spread in pixels");
    }
    if (!std::isfinite(config.truncate) || config.truncate < 0.0) {
        conflict.involved_params.push_back("--truncate " + format_number(config.truncate) + " (must be >= 0)");
        conflict.suggestions.push_back("Use --truncate 4.0 (default)");
    }
    if (config.num_threads < 0) {
        conflict.involved_params.push_back("--threads " + std::to_string(config.num_threads) + " (must be >= 0)");
        conflict.suggestions.push_back("Use --threads 0 to let TBB choose");
    }

    if (conflict.involved_params.empty()) {
        return std::nullopt;
    }
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_contour_parameters(
    const ContourConfig& config) const {

    if (!std::isfinite(config.interval) || config.interval <= 0.0) {
        ParameterConflict conflict;
        conflict.description = "Contour interval must be positive";
        conflict.involved_params = {"--interval " + format_number(config.interval)};
        conflict.suggestions = {"Use --interval 0.5 (half MMI steps, default)",
                                "Use --interval 1.0 for whole MMI classes"};
        return conflict;
    }

    if (!std::isfinite(config.base)) {
        ParameterConflict conflict;
        conflict.description = "Contour base level must be finite";
        conflict.involved_params = {"--base " + format_number(config.base)};
        conflict.suggestions = {"Use --base 0 (default)"};
        return conflict;
    }

    if (config.style_file.has_value() && !std::filesystem::exists(config.style_file.value())) {
        ParameterConflict conflict;
        conflict.description = "Style file does not exist";
        conflict.involved_params = {"--style " + config.style_file.value()};
        conflict.suggestions = {"Check the path or omit --style"};
        return conflict;
    }

    return std::nullopt;
}

std::optional<ParameterConflict> InputValidator::check_smoothing_method_options(
    const SmoothingConfig& config) const {

    if (config.method != SmoothingMethod::NONE) {
        return std::nullopt;
    }

    std::vector<std::string> ignored;
    if (config.mask_nodata) ignored.push_back("--mask-nodata");
    if (config.parallel_processing) ignored.push_back("--parallel");

    if (ignored.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.is_warning = true;
    conflict.description = "Gaussian-only options have no effect with --smoothing none";
    conflict.involved_params = {"--smoothing none"};
    conflict.involved_params.insert(conflict.involved_params.end(), ignored.begin(), ignored.end());
    conflict.suggestions = {"Use --smoothing gaussian", "Remove the ignored options"};
    return conflict;
}

std::optional<ParameterConflict> InputValidator::check_output_format(
    const ShakeContourConfig& config) const {

    if (config.output_path.empty()) {
        return std::nullopt;
    }

    std::string extension = std::filesystem::path(config.output_path).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (extension == ".shp" || extension == ".geojson" || extension == ".json" || extension == ".gpkg") {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Output format cannot be derived from the file extension";
    conflict.involved_params = {"--output " + config.output_path};
    conflict.suggestions = {
        "Use a .shp extension for ESRI Shapefile",
        "Use a .geojson extension for GeoJSON",
        "Use a .gpkg extension for GeoPackage"
    };
    return conflict;
}

} // namespace shake
