/**
 * @file Logger.hpp
 * @brief Facility-aware logging shared by the smoothing core and GDAL adapters
 *
 * Every component owns a Logger constructed with its facility name
 * ("GaussianKernel", "MaskedConvolver", "ContourExporter", ...). Output goes
 * through a single outputMessage() call that performs the verbosity check,
 * folds repeated messages and mirrors to an optional log file.
 */

#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace shake {

/**
 * @brief Log levels, lower is more severe
 *
 * Level 1: Errors (run cannot continue)
 * Level 2: Warnings (degraded result, e.g. oversized grid)
 * Level 3: Information (stage boundaries)
 * Level 4: Detailed information (code path taken)
 * Level 5: Basic debugging (objects, shapes, parameters)
 * Level 6: Detailed debugging (per-cell values)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

class Logger {
public:
    Logger();

    /**
     * @brief Logger for a named facility, level resolved from the registry
     * @param component_name Facility name used by setFacilityLevel()
     */
    explicit Logger(const std::string& component_name);

    /**
     * @brief Logger with an explicit level and optional append-mode file
     */
    Logger(LogLevel level, const std::optional<std::string>& log_file = std::nullopt);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief The single point of output
     *
     * A message identical to the previous one is counted instead of
     * printed; the count is reported when a different message arrives,
     * on flush() and on destruction.
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void setLogLevel(LogLevel level) { current_level_ = level; }
    LogLevel getLogLevel() const { return current_level_; }

    void setLogFile(const std::optional<std::string>& log_file);

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const { outputMessage(LogLevel::ERROR, message); }
    void warning(const std::string& message) const { outputMessage(LogLevel::WARNING, message); }
    void info(const std::string& message) const { outputMessage(LogLevel::INFO, message); }
    void detailed(const std::string& message) const { outputMessage(LogLevel::DETAILED, message); }
    void debug(const std::string& message) const { outputMessage(LogLevel::DEBUG, message); }

    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();
    }

    /**
     * @brief Emit any pending repeat summary and flush console and file
     */
    void flush() const;

    // ========================================================================
    // Facility registry
    // ========================================================================

    static void setFacilityLevel(const std::string& facility, LogLevel level);
    static void setDefaultLevel(LogLevel level);
    static LogLevel getFacilityLevel(const std::string& facility);
    static LogLevel getDefaultLevel();

    /**
     * @brief Apply a level specification
     *
     * Accepted forms:
     * - "5"                                  default level DEBUG
     * - "MaskedConvolver=6,ContourExporter=4" per-facility levels
     * - "2,RasterReader=5"                   default WARNING, RasterReader DEBUG
     * - "default=4"                          explicit default
     *
     * Levels are clamped to 1..6.
     *
     * @return false if any token could not be parsed (valid tokens still apply)
     */
    static bool parseLogConfig(const std::string& config);

    static void clearFacilityLevels();

    /**
     * @brief Facility level if registered, else instance level if changed
     *        from WARNING, else the registry default
     */
    LogLevel getEffectiveLevel() const;

    static std::string levelName(LogLevel level);

private:
    LogLevel current_level_;
    std::string component_name_;
    std::optional<std::string> log_file_path_;
    std::shared_ptr<std::ofstream> file_stream_;
    mutable std::mutex output_mutex_;

    // Repeat folding state
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::optional<std::string> default_log_file_;
    static std::mutex registry_mutex_;

    void initializeFileStream();
    void flushRepeatSummary() const;
    void doOutput(LogLevel level, const std::string& message) const;

    friend void setDefaultLogFile(const std::optional<std::string>& log_file);
};

/**
 * @brief Log file used by facility loggers created after this call
 */
void setDefaultLogFile(const std::optional<std::string>& log_file);

} // namespace shake
