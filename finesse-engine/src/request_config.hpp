#ifndef FINESSE_REQUEST_CONFIG_HPP
#define FINESSE_REQUEST_CONFIG_HPP

#include "loan_terms.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace finesse {

/**
 * @brief Exception thrown when a request file or string cannot be parsed
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

enum class CalculatorKind : uint8_t {
    Loan = 0,
    Mortgage = 1,
    Investment = 2
};

enum class OutputFormat : uint8_t {
    Json = 0,
    Csv = 1,
    Parquet = 2
};

std::string to_string(CalculatorKind kind);
std::string to_string(OutputFormat format);
CalculatorKind parse_calculator_kind(const std::string& name);
OutputFormat parse_output_format(const std::string& name);

/**
 * @brief Currency conversion of the reported amounts
 *
 * Conversion runs only when a target different from the base is set.
 */
struct CurrencySettings {
    std::string base;               ///< Currency of the inputs (default "USD")
    std::string target;             ///< Currency to report in; empty = no conversion
    std::string rates_url;          ///< Exchange-rate service base URL
    int cache_ttl_seconds;          ///< Rate cache time-to-live
    int timeout_ms;                 ///< HTTP timeout per request

    CurrencySettings();

    bool enabled() const { return !target.empty() && target != base; }
};

/**
 * @brief A full calculation request: which calculator, its inputs, and how to report
 */
struct CalculationRequest {
    std::string request_id;
    CalculatorKind calculator;

    // Loan calculator
    LoanTerms loan;
    RepaymentType repayment;
    GracePolicy grace;
    ExtraPaymentPolicy extra;

    // Mortgage calculator
    MortgageTerms mortgage;
    std::optional<double> down_payment_percent;   ///< Percent of home price, if given that way
    std::optional<double> property_tax_percent;   ///< Annual percent of home price, if given that way

    // Investment calculator
    InvestmentTerms investment;

    // Reporting
    bool include_schedule;
    PeriodType schedule_period;
    OutputFormat format;
    std::string output_path;        ///< Empty = stdout

    CurrencySettings currency;

    CalculationRequest();
};

/**
 * @brief Recomputes percent-of-price mortgage amounts from the current home price
 *
 * Call after changing mortgage.home_price; amounts given in dollars are untouched.
 */
void resolve_price_percentages(CalculationRequest& request);

/**
 * @brief Parses a calculation request from a JSON file
 *
 * A relative output path is resolved against the request file's directory.
 *
 * @param file_path Path to the JSON request
 * @return Parsed request
 * @throws ConfigParseError if the file cannot be read or the request is invalid
 */
CalculationRequest parse_request_from_file(const std::string& file_path);

/**
 * @brief Parses a calculation request from a JSON string
 *
 * @throws ConfigParseError on malformed JSON, wrong value types, unknown enum
 *         names or a missing "calculator" field
 */
CalculationRequest parse_request_from_string(const std::string& json_string);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to the request file directory
 *
 * Absolute paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& request_file_path);

/**
 * @brief Flattened key/value view of the settings that apply to the request's calculator
 */
std::map<std::string, std::string> describe_request(const CalculationRequest& request);

} // namespace finesse

#endif // FINESSE_REQUEST_CONFIG_HPP
