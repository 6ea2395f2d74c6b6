/**
 * @file CommandLineInterface.hpp
 * @brief Command line and JSON configuration handling for shake-contour
 */

#pragma once

#include "shake_contour.hpp"
#include "SimpleCommandLineParser.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace shake {

/**
 * @brief Parses arguments, merges the JSON config file and sets up logging
 *
 * Precedence, lowest first: built-in defaults, --config file, command line.
 */
class CommandLineInterface {
public:
    enum class ParseResult {
        RUN,        // Configuration complete, continue processing
        EXIT_OK,    // Help, version or --create-config handled
        EXIT_ERROR  // Bad arguments, bad config file or invalid parameters
    };

    CommandLineInterface() = default;

    ParseResult parse_arguments(int argc, char* argv[]);

    const ShakeContourConfig& get_config() const { return config_; }

    bool is_dry_run() const { return dry_run_; }

    void print_config() const;

    /**
     * @brief Serialise a configuration to the JSON layout read by --config
     */
    static nlohmann::json config_to_json(const ShakeContourConfig& config);

    /**
     * @brief Overlay the keys present in a JSON document onto a configuration
     * @throws nlohmann::json::exception for wrongly typed values
     * @throws InvalidInputError for a non-object root or an unknown smoothing method
     */
    static void apply_json(const nlohmann::json& document, ShakeContourConfig& config);

    static bool create_default_config_file(const std::string& filename);

private:
    ShakeContourConfig config_;
    bool dry_run_ = false;

    bool load_config_file(const std::string& filename);
    bool parse_all_options(const SimpleCommandLineParser& parser);
    void configure_logging() const;
};

} // namespace shake
