/**
 * @file logger.hpp
 * @brief Structured event log for requests, calculations, rate lookups and exports
 *
 * Each event is one line: a JSON object by default, or
 * "timestamp [LEVEL] message {key=value, ...}" when JSON is off.
 * Calculation functions stay silent; the CLI and the currency client
 * report around them.
 */

#ifndef FINESSE_LOGGER_HPP
#define FINESSE_LOGGER_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <map>
#include <memory>
#include <fstream>
#include <mutex>
#include <cstddef>

namespace finesse {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

/// Unknown names map to INFO
inline LogLevel string_to_level(const std::string& name) {
    if (name == "DEBUG") return LogLevel::DEBUG;
    if (name == "WARN") return LogLevel::WARN;
    if (name == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Identifies the request an event belongs to
 */
struct CalculationContext {
    std::string request_id;
    std::string calculator;          ///< "loan", "mortgage" or "investment"
    std::string phase;               ///< parse, compute, convert or export

    CalculationContext() = default;

    CalculationContext(const std::string& id, const std::string& calc)
        : request_id(id), calculator(calc) {}
};

struct CalculationMetrics {
    double elapsed_ms = 0.0;
    size_t rows_generated = 0;
    size_t months_simulated = 0;
    bool converged = true;           ///< False when a payoff simulation hit its safety cap
};

struct LoggerConfig {
    LogLevel min_level = LogLevel::INFO;
    bool enable_console = true;      ///< stderr
    bool enable_file = false;        ///< Appends to log_file_path
    std::string log_file_path = "finesse.log";
    bool enable_json = true;
};

/**
 * @brief Process-wide event logger
 *
 * Safe to call from several threads; each event is written as one whole line.
 *
 *   @code
 *   Logger& logger = Logger::get_instance();
 *   CalculationContext ctx("req-1", "loan");
 *   logger.log_calculation_start(ctx, {{"principal", "25000"}});
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    /// Replaces the configuration and reopens the log file if one is enabled
    void configure(const LoggerConfig& config);

    /**
     * @brief Settings a request was loaded with
     *
     * Only the first 10 settings are written; when there are more the entry
     * carries settings_truncated and settings_total_count.
     */
    void log_request_loaded(const std::string& source,
                            const std::map<std::string, std::string>& settings);

    void log_calculation_start(const CalculationContext& ctx,
                               const std::map<std::string, std::string>& inputs);

    /// WARN instead of INFO when metrics.converged is false
    void log_calculation_complete(const CalculationContext& ctx,
                                  const std::map<std::string, std::string>& summary,
                                  const CalculationMetrics& metrics);

    /// DEBUG for cache hits, INFO for provider fetches
    void log_rate_lookup(const std::string& from, const std::string& to,
                         double rate, bool cache_hit);

    void log_export(const CalculationContext& ctx, const std::string& format,
                    const std::string& destination, size_t rows);

    void log_error(const CalculationContext& ctx, const std::string& error_message);
    void log_warning(const CalculationContext& ctx, const std::string& warning_message);

    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex mutex_;     // Guards config_ and file_
    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_;

    void emit(LogLevel level, const std::string& message, nlohmann::json entry);
    void write_line(const std::string& line);   // Caller holds mutex_
};

} // namespace finesse

#endif // FINESSE_LOGGER_HPP
