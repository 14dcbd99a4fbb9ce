#include "logger.hpp"
#include "io/format.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <chrono>

namespace finesse {

using json = nlohmann::json;

namespace {

constexpr size_t MAX_LOGGED_SETTINGS = 10;

// Local time with millisecond precision, e.g. 2026-03-01 14:05:09.042
std::string timestamp_now() {
    const auto now = std::chrono::system_clock::now();
    const std::tm local = io::to_local_time(std::chrono::system_clock::to_time_t(now));
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis;
    return oss.str();
}

json context_fields(const CalculationContext& ctx) {
    return json{
        {"request_id", ctx.request_id},
        {"calculator", ctx.calculator},
        {"phase", ctx.phase}
    };
}

void add_prefixed(json& entry, const std::string& prefix,
                  const std::map<std::string, std::string>& values) {
    for (const auto& [key, value] : values) {
        entry[prefix + key] = value;
    }
}

} // anonymous namespace

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_.reset();

    if (!config_.enable_file) {
        return;
    }
    file_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
    if (!file_->is_open()) {
        std::cerr << "finesse: cannot open log file " << config_.log_file_path
                  << ", logging to console only" << std::endl;
        file_.reset();
    }
}

void Logger::log_request_loaded(const std::string& source,
                                const std::map<std::string, std::string>& settings) {
    json entry{{"event", "request_loaded"}, {"source", source}};

    size_t written = 0;
    for (const auto& [key, value] : settings) {
        if (written == MAX_LOGGED_SETTINGS) {
            entry["settings_truncated"] = true;
            entry["settings_total_count"] = settings.size();
            break;
        }
        entry["setting." + key] = value;
        ++written;
    }

    emit(LogLevel::INFO, "Request loaded", std::move(entry));
}

void Logger::log_calculation_start(const CalculationContext& ctx,
                                   const std::map<std::string, std::string>& inputs) {
    json entry = context_fields(ctx);
    entry["event"] = "calculation_start";
    add_prefixed(entry, "input.", inputs);

    emit(LogLevel::INFO, "Starting " + ctx.calculator + " calculation", std::move(entry));
}

void Logger::log_calculation_complete(const CalculationContext& ctx,
                                      const std::map<std::string, std::string>& summary,
                                      const CalculationMetrics& metrics) {
    json entry = context_fields(ctx);
    entry["event"] = "calculation_complete";
    entry["elapsed_ms"] = metrics.elapsed_ms;
    entry["rows_generated"] = metrics.rows_generated;
    entry["months_simulated"] = metrics.months_simulated;
    entry["converged"] = metrics.converged;
    add_prefixed(entry, "result.", summary);

    if (metrics.converged) {
        emit(LogLevel::INFO, "Calculation completed", std::move(entry));
    } else {
        emit(LogLevel::WARN, "Calculation completed without paying off the balance", std::move(entry));
    }
}

void Logger::log_rate_lookup(const std::string& from, const std::string& to,
                             double rate, bool cache_hit) {
    json entry{
        {"event", "rate_lookup"},
        {"from", from},
        {"to", to},
        {"rate", rate},
        {"cache_hit", cache_hit}
    };

    emit(cache_hit ? LogLevel::DEBUG : LogLevel::INFO,
         "Exchange rate " + from + "-" + to, std::move(entry));
}

void Logger::log_export(const CalculationContext& ctx, const std::string& format,
                        const std::string& destination, size_t rows) {
    json entry = context_fields(ctx);
    entry["event"] = "export";
    entry["format"] = format;
    entry["destination"] = destination;
    entry["rows"] = rows;

    emit(LogLevel::INFO, "Export written", std::move(entry));
}

void Logger::log_error(const CalculationContext& ctx, const std::string& error_message) {
    json entry = context_fields(ctx);
    entry["event"] = "error";
    entry["error_message"] = error_message;

    emit(LogLevel::ERROR, "Calculation failed", std::move(entry));
}

void Logger::log_warning(const CalculationContext& ctx, const std::string& warning_message) {
    json entry = context_fields(ctx);
    entry["event"] = "warning";

    emit(LogLevel::WARN, warning_message, std::move(entry));
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_) {
        file_->flush();
    }
}

void Logger::emit(LogLevel level, const std::string& message, json entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    const std::string when = timestamp_now();

    if (config_.enable_json) {
        entry["timestamp"] = when;
        entry["level"] = level_to_string(level);
        entry["message"] = message;
        // Replace invalid UTF-8 rather than throwing from a log call
        write_line(entry.dump(-1, ' ', false, json::error_handler_t::replace));
        return;
    }

    std::ostringstream line;
    line << when << " [" << level_to_string(level) << "] " << message;
    if (!entry.empty()) {
        line << " {";
        const char* separator = "";
        for (const auto& item : entry.items()) {
            line << separator << item.key() << '=';
            if (item.value().is_string()) {
                line << item.value().get<std::string>();
            } else {
                line << item.value().dump();
            }
            separator = ", ";
        }
        line << '}';
    }
    write_line(line.str());
}

void Logger::write_line(const std::string& line) {
    if (config_.enable_console) {
        std::cerr << line << '\n';
    }
    if (config_.enable_file && file_) {
        *file_ << line << '\n';
    }
}

} // namespace finesse
