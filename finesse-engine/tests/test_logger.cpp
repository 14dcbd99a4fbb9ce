/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <regex>
#include <thread>
#include <fstream>
#include <vector>

using namespace finesse;
using json = nlohmann::json;

namespace {

// Point the logger at a fresh file with console output off
void log_to_file(const std::string& path, LogLevel min_level = LogLevel::DEBUG) {
    std::filesystem::remove(path);
    LoggerConfig config;
    config.min_level = min_level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = path;
    Logger::get_instance().configure(config);
}

std::vector<json> read_log(const std::string& path) {
    Logger::get_instance().flush();
    std::vector<json> entries;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) entries.push_back(json::parse(line));
    }
    return entries;
}

void reset_logger(const std::string& path) {
    Logger::get_instance().configure(LoggerConfig());
    std::filesystem::remove(path);
}

} // anonymous namespace

TEST_CASE("Logger Configuration", "[logger]") {
    Logger& logger = Logger::get_instance();

    SECTION("Default configuration") {
        LoggerConfig config;
        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
    }

    SECTION("Level names") {
        REQUIRE(string_to_level("DEBUG") == LogLevel::DEBUG);
        REQUIRE(string_to_level("WARN") == LogLevel::WARN);
        REQUIRE(string_to_level("bogus") == LogLevel::INFO);
        REQUIRE(level_to_string(LogLevel::ERROR) == "ERROR");
    }

    SECTION("Minimum level") {
        LoggerConfig config;
        config.min_level = LogLevel::WARN;
        config.enable_console = false;
        logger.configure(config);
        REQUIRE(logger.get_min_level() == LogLevel::WARN);
        logger.configure(LoggerConfig());
    }
}

TEST_CASE("Logger calculation events", "[logger]") {
    const std::string path = "test_calculation_events.log";
    log_to_file(path);
    Logger& logger = Logger::get_instance();

    CalculationContext ctx("req-7", "loan");
    ctx.phase = "compute";

    SECTION("Start and completion") {
        logger.log_calculation_start(ctx, {{"principal", "25000"}, {"years", "5"}});

        CalculationMetrics metrics;
        metrics.rows_generated = 60;
        metrics.months_simulated = 60;
        logger.log_calculation_complete(ctx, {{"monthly_payment", "500.95"}}, metrics);

        auto entries = read_log(path);
        REQUIRE(entries.size() == 2);

        REQUIRE(entries[0]["event"] == "calculation_start");
        REQUIRE(entries[0]["level"] == "INFO");
        REQUIRE(entries[0]["request_id"] == "req-7");
        REQUIRE(entries[0]["calculator"] == "loan");
        REQUIRE(entries[0]["input.principal"] == "25000");

        REQUIRE(entries[1]["event"] == "calculation_complete");
        REQUIRE(entries[1]["rows_generated"] == 60);
        REQUIRE(entries[1]["converged"] == true);
        REQUIRE(entries[1]["result.monthly_payment"] == "500.95");
        REQUIRE(entries[1].contains("timestamp"));
    }

    SECTION("Non-converged calculation is a warning") {
        CalculationMetrics metrics;
        metrics.converged = false;
        logger.log_calculation_complete(ctx, {}, metrics);

        auto entries = read_log(path);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0]["level"] == "WARN");
        REQUIRE(entries[0]["converged"] == false);
    }

    SECTION("Errors and exports") {
        logger.log_error(ctx, "Failed to fetch exchange rate \"USD-EUR\"");
        logger.log_export(ctx, "csv", "out/loan.csv", 5);

        auto entries = read_log(path);
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0]["level"] == "ERROR");
        REQUIRE(entries[0]["error_message"] == "Failed to fetch exchange rate \"USD-EUR\"");
        REQUIRE(entries[1]["event"] == "export");
        REQUIRE(entries[1]["format"] == "csv");
        REQUIRE(entries[1]["destination"] == "out/loan.csv");
        REQUIRE(entries[1]["rows"] == 5);
    }

    reset_logger(path);
}

TEST_CASE("Logger rate lookups and filtering", "[logger]") {
    const std::string path = "test_rate_lookup.log";

    SECTION("Cache hits log at DEBUG") {
        log_to_file(path, LogLevel::DEBUG);
        Logger::get_instance().log_rate_lookup("USD", "EUR", 0.92, true);
        Logger::get_instance().log_rate_lookup("USD", "GBP", 0.79, false);

        auto entries = read_log(path);
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0]["level"] == "DEBUG");
        REQUIRE(entries[0]["cache_hit"] == true);
        REQUIRE(entries[1]["level"] == "INFO");
        REQUIRE(entries[1]["to"] == "GBP");
    }

    SECTION("Entries below the minimum level are dropped") {
        log_to_file(path, LogLevel::WARN);
        Logger::get_instance().log_rate_lookup("USD", "EUR", 0.92, false);
        Logger::get_instance().log_warning(CalculationContext("r", "loan"), "Simulation stopped");

        auto entries = read_log(path);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0]["event"] == "warning");
    }

    reset_logger(path);
}

TEST_CASE("Logger request settings", "[logger]") {
    const std::string path = "test_request_loaded.log";
    log_to_file(path);

    std::map<std::string, std::string> settings;
    for (int i = 0; i < 12; ++i) {
        settings["key" + std::to_string(10 + i)] = std::to_string(i);
    }
    Logger::get_instance().log_request_loaded("request.json", settings);

    auto entries = read_log(path);
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0]["event"] == "request_loaded");
    REQUIRE(entries[0]["source"] == "request.json");
    REQUIRE(entries[0]["setting.key10"] == "0");
    REQUIRE_FALSE(entries[0].contains("setting.key21"));
    REQUIRE(entries[0]["settings_truncated"] == true);
    REQUIRE(entries[0]["settings_total_count"] == 12);

    reset_logger(path);
}

TEST_CASE("Logger timestamps", "[logger]") {
    const std::string path = "test_timestamps.log";
    log_to_file(path);
    Logger::get_instance().log_warning(CalculationContext("r", "loan"), "check");

    auto entries = read_log(path);
    REQUIRE(entries.size() == 1);
    const std::string stamp = entries[0]["timestamp"].get<std::string>();
    REQUIRE(std::regex_match(stamp, std::regex(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3})")));

    reset_logger(path);
}

TEST_CASE("Logger writes whole lines from several threads", "[logger]") {
    const std::string path = "test_threads.log";
    log_to_file(path);

    const int threads = 4;
    const int per_thread = 200;
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([t] {
            for (int i = 0; i < per_thread; ++i) {
                Logger::get_instance().log_rate_lookup("USD", "EUR", 0.9 + t * 0.01, i % 2 == 0);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    // read_log parses every line, so an interleaved line would throw here
    auto entries = read_log(path);
    REQUIRE(entries.size() == static_cast<size_t>(threads * per_thread));
    for (const auto& entry : entries) {
        REQUIRE(entry["event"] == "rate_lookup");
    }

    reset_logger(path);
}
