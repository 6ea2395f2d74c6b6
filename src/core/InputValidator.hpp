/**
 * @file InputValidator.hpp
 * @brief Input validation for out-of-range and contradictory parameters
 *
 * Validates user inputs and provides clear error messages with suggested
 * solutions when a run cannot proceed as configured.
 */

#pragma once

#include "shake_contour.hpp"
#include <optional>
#include <string>
#include <vector>

namespace shake {

/**
 * @brief A parameter problem detected in user inputs
 */
struct ParameterConflict {
    std::string description;
    std::vector<std::string> involved_params;
    std::vector<std::string> suggestions;
    bool is_warning = false;    ///< Reported but does not stop the run
};

struct ValidationResult {
    bool is_valid = true;
    std::vector<ParameterConflict> conflicts;

    bool has_errors() const { return !is_valid; }

    std::string format_error_message() const;
};

class InputValidator {
public:
    InputValidator() = default;

    ValidationResult validate(const ShakeContourConfig& config) const;

private:
    std::optional<ParameterConflict> check_input_source(const ShakeContourConfig& config) const;

    /**
     * @brief sigma > 0, truncate >= 0, thread count >= 0
     */
    std::optional<ParameterConflict> check_smoothing_parameters(const SmoothingConfig& config) const;

    std::optional<ParameterConflict> check_contour_parameters(const ContourConfig& config) const;

    /**
     * @brief Options that only matter for Gaussian smoothing when smoothing is off
     */
    std::optional<ParameterConflict> check_smoothing_method_options(const SmoothingConfig& config) const;

    std::optional<ParameterConflict> check_output_format(const ShakeContourConfig& config) const;
};

} // namespace shake
