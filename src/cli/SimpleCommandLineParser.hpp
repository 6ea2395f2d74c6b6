/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight long/short option parser for the shake-contour command
 */

#pragma once

#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace shake {

/**
 * @brief Simple command-line argument parser
 *
 * Supports --name VALUE, --name=VALUE, -n VALUE and boolean flags.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool required;
        bool has_value;
        std::string default_value;

        // Default constructor for std::map
        Option() : required(false), has_value(true) {}

        Option(const std::string& long_name, const std::string& short_name,
               const std::string& description, bool required = false,
               bool has_value = true, const std::string& default_value = "")
            : long_name(long_name), short_name(short_name), description(description),
              required(required), has_value(has_value), default_value(default_value) {}
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    void add_option(const std::string& long_name, const std::string& short_name,
                    const std::string& description, bool required = false,
                    const std::string& default_value = "") {
        options_[long_name] = Option(long_name, short_name, description, required, true, default_value);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        options_[long_name] = Option(long_name, short_name, description, false, false);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }

    /**
     * @brief Parse argv
     * @return false on error or when help was requested (see help_requested())
     */
    bool parse(int argc, char* argv[]) {
        args_.clear();
        parsed_values_.clear();
        positional_args_.clear();
        help_requested_ = false;

        for (int i = 1; i < argc; ++i) {
            args_.push_back(argv[i]);
        }

        for (const auto& arg : args_) {
            if (arg == "--help" || arg == "-h") {
                help_requested_ = true;
                show_help();
                return false;
            }
        }

        for (size_t i = 0; i < args_.size(); ++i) {
            const std::string& arg = args_[i];

            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);

                // Handle --option=value format
                size_t eq_pos = option_name.find('=');
                std::string value;
                bool inline_value = false;
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                    inline_value = true;
                }

                auto it = options_.find(option_name);
                if (it == options_.end()) {
                    std::cerr << "Unknown option: --" << option_name << std::endl;
                    return false;
                }

                if (it->second.has_value) {
                    if (!inline_value) {
                        if (!has_value_at(i + 1)) {
                            std::cerr << "Option --" << option_name << " requires a value" << std::endl;
                            return false;
                        }
                        value = args_[++i];
                    }
                    parsed_values_[option_name] = value;
                } else {
                    parsed_values_[option_name] = "true";
                }

            } else if (arg.starts_with("-") && arg.size() > 1) {
                std::string short_name = arg.substr(1);

                auto it = short_to_long_.find(short_name);
                if (it == short_to_long_.end()) {
                    std::cerr << "Unknown option: -" << short_name << std::endl;
                    return false;
                }

                const std::string& option_name = it->second;
                if (options_.at(option_name).has_value) {
                    if (!has_value_at(i + 1)) {
                        std::cerr << "Option -" << short_name << " requires a value" << std::endl;
                        return false;
                    }
                    parsed_values_[option_name] = args_[++i];
                } else {
                    parsed_values_[option_name] = "true";
                }
            } else {
                positional_args_.push_back(arg);
            }
        }

        for (const auto& [name, option] : options_) {
            if (option.required && parsed_values_.find(name) == parsed_values_.end()) {
                std::cerr << "Required option --" << name << " not provided" << std::endl;
                return false;
            }
        }

        for (const auto& [name, option] : options_) {
            if (parsed_values_.find(name) == parsed_values_.end() && !option.default_value.empty()) {
                parsed_values_[name] = option.default_value;
            }
        }

        return true;
    }

    bool help_requested() const { return help_requested_; }

    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }

    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value()) {
            return std::nullopt;
        }

        std::istringstream iss(value.value());
        T result;
        if (iss >> result && (iss >> std::ws).eof()) {
            return result;
        }
        return std::nullopt;
    }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }

    void show_help() const {
        std::cout << "SHAKE CONTOUR - Smoothed MMI contours from earthquake shakemap rasters\n\n";

        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " --input FILE [OPTIONS]\n";
        std::cout << "    " << program_name_ << " --config FILE [OPTIONS]\n\n";

        if (!description_.empty()) {
            std::cout << description_ << "\n\n";
        }

        std::cout << "INPUT / OUTPUT:\n";
        print_help_section("input", "Shakemap raster (any GDAL-readable format)");
        print_help_section("band", "1-based raster band (default: 1)");
        print_help_section("output", "Output vector file, driver from extension: .shp, .geojson, .gpkg\n"
                                     "                          (default: <input dir>/<input name>-contour.shp)");
        print_help_section("style", "QGIS .qml style copied next to the output");
        std::cout << "\n";

        std::cout << "SMOOTHING:\n";
        print_help_section("smoothing", "none or gaussian (default: gaussian)");
        print_help_section("sigma", "Gaussian spread in pixels (default: 0.9)");
        print_help_section("truncate", "Kernel radius in standard deviations (default: 4.0)");
        print_help_section("mask-nodata", "Keep nodata cells out of the convolution");
        print_help_section("parallel", "Split the convolution across TBB worker threads");
        print_help_section("threads", "Maximum worker threads with --parallel (default: 0 = automatic)");
        std::cout << "\n";

        std::cout << "CONTOURS:\n";
        print_help_section("interval", "MMI spacing between contour lines (default: 0.5)");
        print_help_section("base", "Contour base level (default: 0)");
        std::cout << "\n";

        std::cout << "CONFIGURATION & LOGGING:\n";
        print_help_section("config", "Load configuration from JSON file (command line wins)");
        print_help_section("create-config", "Write a default JSON configuration file and exit");
        print_help_section("log-level", "1=ERROR 2=WARNING 3=INFO (default) 4=DETAILED 5=DEBUG 6=TRACE,\n"
                                        "                          with per-component overrides, e.g. \"3,MaskedConvolver=5\"");
        print_help_section("log-file", "Also write log output to FILE (appends)");
        print_help_section("dry-run", "Validate the configuration without processing");
        print_help_section("version", "Show version information");
        std::cout << "    -h, --help              Show this help\n\n";

        std::cout << "EXAMPLES:\n";
        std::cout << "    " << program_name_ << " --input mmi.tif\n";
        std::cout << "    " << program_name_ << " --input mmi.tif --output contours.geojson --sigma 1.2\n";
        std::cout << "    " << program_name_ << " --input mmi.tif --mask-nodata --parallel --threads 4\n";
        std::cout << "    " << program_name_ << " --input mmi.tif --smoothing none --interval 1.0\n";
    }

private:
    // A following token is a value unless it looks like an option; "-1.5" is a value
    bool has_value_at(size_t index) const {
        if (index >= args_.size()) {
            return false;
        }
        const std::string& next = args_[index];
        if (!next.starts_with("-") || next.size() == 1) {
            return true;
        }
        char* end = nullptr;
        std::strtod(next.c_str(), &end);
        return end != nullptr && *end == '\0';
    }

    void print_help_section(const std::string& option_name, const std::string& description) const {
        auto it = options_.find(option_name);
        if (it == options_.end()) {
            return;
        }
        const auto& option = it->second;
        std::string usage = "--" + option.long_name;
        if (!option.short_name.empty()) {
            usage = "-" + option.short_name + ", " + usage;
        }
        if (option.has_value) {
            usage += " VALUE";
        }
        std::cout << "    " << usage;
        if (usage.size() < 22) {
            std::cout << std::string(22 - usage.size(), ' ');
        } else {
            std::cout << "  ";
        }
        std::cout << description << "\n";
    }

    std::string program_name_;
    std::string description_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> positional_args_;
    bool help_requested_ = false;
};

} // namespace shake
