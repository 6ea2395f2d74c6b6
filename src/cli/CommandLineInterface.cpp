/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 */

#include "CommandLineInterface.hpp"
#include "SimpleCommandLineParser.hpp"
#include "../core/InputValidator.hpp"
#include "../core/Logger.hpp"
#include "version.h"
#include <fstream>
#include <iostream>
#include <type_traits>

using json = nlohmann::json;

namespace shake {

CommandLineInterface::ParseResult CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("shake-contour",
        "Reads one band of a shakemap raster, optionally smooths it with a truncated\n"
        "Gaussian kernel and writes MMI contour lines with label and colour attributes.");

    // Input / output
    parser.add_option("input", "i", "Shakemap raster");
    parser.add_option("band", "b", "1-based raster band");
    parser.add_option("output", "o", "Output vector file");
    parser.add_option("style", "", "QGIS style file");

    // Smoothing
    parser.add_option("smoothing", "s", "Smoothing method: none or gaussian");
    parser.add_option("sigma", "", "Gaussian spread in pixels");
    parser.add_option("truncate", "", "Kernel radius in standard deviations");
    parser.add_flag("mask-nodata", "", "Exclude nodata cells from the convolution");
    parser.add_flag("parallel", "p", "Row-parallel convolution");
    parser.add_option("threads", "j", "Maximum worker threads");

    // Contours
    parser.add_option("interval", "", "Contour interval");
    parser.add_option("base", "", "Contour base level");

    // Configuration and logging
    parser.add_option("config", "c", "Path to JSON configuration file");
    parser.add_option("create-config", "", "Write default JSON configuration");
    parser.add_option("log-level", "l", "Log level specification");
    parser.add_option("log-file", "", "Log file path");
    parser.add_flag("dry-run", "", "Validate without processing");
    parser.add_flag("version", "", "Show version information");

    if (!parser.parse(argc, argv)) {
        return parser.help_requested() ? ParseResult::EXIT_OK : ParseResult::EXIT_ERROR;
    }

    if (parser.get_flag("version")) {
        std::cout << "shake-contour v" << SHAKE_VERSION_STRING << std::endl;
        std::cout << "Gaussian shakemap smoothing and MMI contouring" << std::endl;
        std::cout << "Built with Eigen, TBB, GDAL/OGR, nlohmann/json" << std::endl;
        std::cout << "Copyright (c) 2025 Matthew Block" << std::endl;
        return ParseResult::EXIT_OK;
    }

    if (auto config_path = parser.get("create-config")) {
        if (!create_default_config_file(config_path.value())) {
            std::cerr << "Could not write configuration file: " << config_path.value() << std::endl;
            return ParseResult::EXIT_ERROR;
        }
        std::cout << "Created default configuration file: " << config_path.value() << std::endl;
        return ParseResult::EXIT_OK;
    }

    if (auto config_file = parser.get("config")) {
        if (!load_config_file(config_file.value())) {
            std::cerr << "Failed to load configuration file: " << config_file.value() << std::endl;
            return ParseResult::EXIT_ERROR;
        }
        config_.config_file = config_file.value();
    }

    if (!parser.get_positional().empty()) {
        std::cerr << "Unexpected argument: " << parser.get_positional().front() << std::endl;
        return ParseResult::EXIT_ERROR;
    }

    if (!parse_all_options(parser)) {
        return ParseResult::EXIT_ERROR;
    }

    configure_logging();

    InputValidator validator;
    ValidationResult validation = validator.validate(config_);
    if (!validation.conflicts.empty()) {
        std::cerr << validation.format_error_message() << std::endl;
    }
    if (validation.has_errors()) {
        return ParseResult::EXIT_ERROR;
    }

    dry_run_ = parser.get_flag("dry-run");
    return ParseResult::RUN;
}

bool CommandLineInterface::parse_all_options(const SimpleCommandLineParser& parser) {
    // Numeric options must parse completely; anything else is reported and rejected
    auto numeric = [&parser](const std::string& name, auto& target) {
        using T = std::decay_t<decltype(target)>;
        if (!parser.get(name)) {
            return true;
        }
        if (auto value = parser.get_as<T>(name)) {
            target = value.value();
            return true;
        }
        std::cerr << "Invalid value for --" << name << ": " << parser.get(name).value() << std::endl;
        return false;
    };

    if (auto value = parser.get("input")) config_.input_path = value.value();
    if (auto value = parser.get("output")) config_.output_path = value.value();
    if (auto value = parser.get("style")) config_.contour.style_file = value.value();
    if (auto value = parser.get("log-level")) config_.log_level = value.value();
    if (auto value = parser.get("log-file")) config_.log_file = value.value();

    if (auto value = parser.get("smoothing")) {
        try {
            config_.smoothing.method = parse_smoothing_method(value.value());
        } catch (const InvalidInputError& e) {
            std::cerr << e.what() << std::endl;
            return false;
        }
    }

    bool ok = numeric("band", config_.band);
    ok = numeric("sigma", config_.smoothing.sigma) && ok;
    ok = numeric("truncate", config_.smoothing.truncate) && ok;
    ok = numeric("threads", config_.smoothing.num_threads) && ok;
    ok = numeric("interval", config_.contour.interval) && ok;
    ok = numeric("base", config_.contour.base) && ok;

    if (parser.get_flag("mask-nodata")) config_.smoothing.mask_nodata = true;
    if (parser.get_flag("parallel")) config_.smoothing.parallel_processing = true;

    return ok;
}

void CommandLineInterface::configure_logging() const {
    if (!Logger::parseLogConfig(config_.log_level)) {
        std::cerr << "Warning: could not fully parse log level '" << config_.log_level
                  << "', using " << Logger::levelName(Logger::getDefaultLevel())
                  << " for unmatched components" << std::endl;
    }
    setDefaultLogFile(config_.log_file);
}

json CommandLineInterface::config_to_json(const ShakeContourConfig& config) {
    json document;
    document["input"] = config.input_path;
    document["band"] = config.band;
    document["output"] = config.output_path;

    document["smoothing"] = {
        {"method", smoothing_method_name(config.smoothing.method)},
        {"sigma", config.smoothing.sigma},
        {"truncate", config.smoothing.truncate},
        {"mask_nodata", config.smoothing.mask_nodata},
        {"parallel", config.smoothing.parallel_processing},
        {"threads", config.smoothing.num_threads}
    };

    document["contour"] = {
        {"interval", config.contour.interval},
        {"base", config.contour.base},
        {"layer_name", config.contour.layer_name},
        {"style", config.contour.style_file ? json(*config.contour.style_file) : json(nullptr)}
    };

    document["log_level"] = config.log_level;
    document["log_file"] = config.log_file ? json(*config.log_file) : json(nullptr);
    return document;
}

void CommandLineInterface::apply_json(const json& document, ShakeContourConfig& config) {
    if (!document.is_object()) {
        throw InvalidInputError("Configuration root must be a JSON object");
    }

    if (document.contains("input")) config.input_path = document["input"].get<std::string>();
    if (document.contains("band")) config.band = document["band"].get<int>();
    if (document.contains("output")) config.output_path = document["output"].get<std::string>();

    if (document.contains("smoothing")) {
        const json& smoothing = document["smoothing"];
        if (smoothing.contains("method"))
            config.smoothing.method = parse_smoothing_method(smoothing["method"].get<std::string>());
        if (smoothing.contains("sigma")) config.smoothing.sigma = smoothing["sigma"].get<double>();
        if (smoothing.contains("truncate")) config.smoothing.truncate = smoothing["truncate"].get<double>();
        if (smoothing.contains("mask_nodata")) config.smoothing.mask_nodata = smoothing["mask_nodata"].get<bool>();
        if (smoothing.contains("parallel")) config.smoothing.parallel_processing = smoothing["parallel"].get<bool>();
        if (smoothing.contains("threads")) config.smoothing.num_threads = smoothing["threads"].get<int>();
    }

    if (document.contains("contour")) {
        const json& contour = document["contour"];
        if (contour.contains("interval")) config.contour.interval = contour["interval"].get<double>();
        if (contour.contains("base")) config.contour.base = contour["base"].get<double>();
        if (contour.contains("layer_name")) config.contour.layer_name = contour["layer_name"].get<std::string>();
        if (contour.contains("style")) {
            if (contour["style"].is_null()) {
                config.contour.style_file.reset();
            } else {
                config.contour.style_file = contour["style"].get<std::string>();
            }
        }
    }

    if (document.contains("log_level")) {
        // Accept 4 as well as "4" or "3,MaskedConvolver=5"
        const json& level = document["log_level"];
        config.log_level = level.is_number() ? std::to_string(level.get<int>()) : level.get<std::string>();
    }
    if (document.contains("log_file")) {
        if (document["log_file"].is_null()) {
            config.log_file.reset();
        } else {
            config.log_file = document["log_file"].get<std::string>();
        }
    }
}

bool CommandLineInterface::create_default_config_file(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    file << config_to_json(ShakeContourConfig{}).dump(2) << "\n";
    return static_cast<bool>(file);
}

bool CommandLineInterface::load_config_file(const std::string& filename) {
    try {
        std::ifstream file(filename);
        if (!file.is_open()) {
            std::cerr << "Error: Could not open config file: " << filename << std::endl;
            return false;
        }

        json document;
        file >> document;
        apply_json(document, config_);
        return true;

    } catch (const json::exception& e) {
        std::cerr << "Error parsing JSON config file: " << e.what() << std::endl;
        return false;
    } catch (const ShakeContourError& e) {
        std::cerr << "Error in config file: " << e.what() << std::endl;
        return false;
    }
}

void CommandLineInterface::print_config() const {
    std::cout << "\n=== Configuration ===\n";
    std::cout << "Input: " << config_.input_path << " (band " << config_.band << ")\n";
    std::cout << "Output: " << (config_.output_path.empty() ? "<derived from input>" : config_.output_path) << "\n";
    std::cout << "Smoothing: " << smoothing_method_name(config_.smoothing.method);
    if (config_.smoothing.method == SmoothingMethod::GAUSSIAN) {
        std::cout << " (sigma " << config_.smoothing.sigma
                  << ", truncate " << config_.smoothing.truncate << ")";
    }
    std::cout << "\n";
    std::cout << "Mask nodata: " << (config_.smoothing.mask_nodata ? "yes" : "no") << "\n";
    std::cout << "Parallel processing: " << (config_.smoothing.parallel_processing ? "yes" : "no");
    if (config_.smoothing.parallel_processing && config_.smoothing.num_threads > 0) {
        std::cout << " (" << config_.smoothing.num_threads << " threads)";
    }
    std::cout << "\n";
    std::cout << "Contours: interval " << config_.contour.interval
              << ", base " << config_.contour.base << "\n";
    if (config_.contour.style_file) {
        std::cout << "Style: " << *config_.contour.style_file << "\n";
    }
    std::cout << "=====================\n\n";
}

} // namespace shake
