#include "request_config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cctype>
#include <filesystem>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace finesse {

namespace {

const char* const DEFAULT_RATES_URL = "https://api.frankfurter.dev";

std::string format_number(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

std::string read_string(const json& j, const char* key) {
    return expand_environment_variables(j.at(key).get<std::string>());
}

CostMode parse_cost_mode(const std::string& name) {
    if (name == "dollar") return CostMode::Dollar;
    if (name == "percent") return CostMode::Percent;
    throw std::invalid_argument("Unknown cost mode: " + name);
}

CostFrequency parse_cost_frequency(const std::string& name) {
    if (name == "monthly") return CostFrequency::Monthly;
    if (name == "yearly") return CostFrequency::Yearly;
    throw std::invalid_argument("Unknown cost frequency: " + name);
}

// Either a plain dollar amount or {"value": x, "mode": "dollar"|"percent"}.
// A percent is stored in `percent` and resolved against the home price later.
void read_amount_of_price(const json& j, double& dollars, std::optional<double>& percent) {
    if (j.is_number()) {
        dollars = j.get<double>();
        percent.reset();
        return;
    }
    const double value = j.at("value").get<double>();
    const CostMode mode = j.contains("mode") ? parse_cost_mode(j["mode"].get<std::string>())
                                             : CostMode::Dollar;
    if (mode == CostMode::Percent) {
        percent = value;
    } else {
        dollars = value;
        percent.reset();
    }
}

void parse_loan(const json& j, CalculationRequest& request) {
    if (j.contains("principal")) request.loan.principal = j["principal"].get<double>();
    if (j.contains("rate")) request.loan.annual_rate_percent = j["rate"].get<double>();
    if (j.contains("years")) request.loan.years = j["years"].get<int>();
    if (j.contains("repayment")) {
        request.repayment = parse_repayment_type(j["repayment"].get<std::string>());
    }

    if (j.contains("grace")) {
        const json& grace = j["grace"];
        if (grace.contains("type")) request.grace.kind = parse_grace_kind(grace["type"].get<std::string>());
        if (grace.contains("months")) request.grace.months = grace["months"].get<int>();
    }

    if (j.contains("extra")) {
        const json& extra = j["extra"];
        if (extra.contains("type")) {
            request.extra.kind = parse_extra_payment_kind(extra["type"].get<std::string>());
        }
        if (extra.contains("monthly")) request.extra.extra_monthly = extra["monthly"].get<double>();
        if (extra.contains("yearly_amount")) {
            request.extra.extra_yearly_amount = extra["yearly_amount"].get<double>();
        }
        if (extra.contains("yearly_month")) {
            request.extra.extra_yearly_month = extra["yearly_month"].get<int>();
        }
    }
}

void parse_mortgage(const json& j, CalculationRequest& request) {
    MortgageTerms& m = request.mortgage;
    if (j.contains("home_price")) m.home_price = j["home_price"].get<double>();
    if (j.contains("rate")) m.annual_rate_percent = j["rate"].get<double>();
    if (j.contains("years")) m.years = j["years"].get<int>();
    if (j.contains("down_payment")) {
        read_amount_of_price(j["down_payment"], m.down_payment, request.down_payment_percent);
    }
    if (j.contains("property_tax")) {
        read_amount_of_price(j["property_tax"], m.annual_property_tax, request.property_tax_percent);
    }
    if (j.contains("insurance")) m.annual_insurance = j["insurance"].get<double>();
    if (j.contains("hoa")) m.monthly_hoa = j["hoa"].get<double>();

    if (j.contains("custom_costs")) {
        for (const auto& cost_json : j["custom_costs"]) {
            CustomCost cost;
            if (cost_json.contains("name")) cost.name = read_string(cost_json, "name");
            cost.value = cost_json.at("value").get<double>();
            if (cost_json.contains("mode")) cost.mode = parse_cost_mode(cost_json["mode"].get<std::string>());
            if (cost_json.contains("frequency")) {
                cost.frequency = parse_cost_frequency(cost_json["frequency"].get<std::string>());
            }
            m.custom_costs.push_back(cost);
        }
    }
}

void parse_investment(const json& j, CalculationRequest& request) {
    InvestmentTerms& inv = request.investment;
    if (j.contains("initial")) inv.initial = j["initial"].get<double>();
    if (j.contains("monthly")) inv.monthly_contribution = j["monthly"].get<double>();
    if (j.contains("rate")) inv.annual_rate_percent = j["rate"].get<double>();
    if (j.contains("years")) inv.years = j["years"].get<int>();
}

void validate_request(const CalculationRequest& request) {
    const int years[] = {request.loan.years, request.mortgage.years, request.investment.years};
    for (int y : years) {
        if (y > MAX_TERM_YEARS) {
            throw ConfigParseError("years must be at most " + std::to_string(MAX_TERM_YEARS));
        }
    }
    if (request.grace.months < 0) {
        throw ConfigParseError("grace.months must be non-negative");
    }
    if (request.extra.extra_yearly_month < 1 || request.extra.extra_yearly_month > 12) {
        throw ConfigParseError("extra.yearly_month must be between 1 and 12");
    }
    if (request.currency.cache_ttl_seconds < 0) {
        throw ConfigParseError("currency.cache_ttl_seconds must be non-negative");
    }
    if (request.currency.timeout_ms <= 0) {
        throw ConfigParseError("currency.timeout_ms must be positive");
    }
    if (request.currency.enabled() && request.currency.rates_url.empty()) {
        throw ConfigParseError("currency.rates_url is required for conversion");
    }
}

} // anonymous namespace

std::string to_string(CalculatorKind kind) {
    switch (kind) {
        case CalculatorKind::Loan: return "loan";
        case CalculatorKind::Mortgage: return "mortgage";
        case CalculatorKind::Investment: return "investment";
    }
    return "unknown";
}

std::string to_string(OutputFormat format) {
    switch (format) {
        case OutputFormat::Json: return "json";
        case OutputFormat::Csv: return "csv";
        case OutputFormat::Parquet: return "parquet";
    }
    return "unknown";
}

CalculatorKind parse_calculator_kind(const std::string& name) {
    if (name == "loan") return CalculatorKind::Loan;
    if (name == "mortgage") return CalculatorKind::Mortgage;
    if (name == "investment") return CalculatorKind::Investment;
    throw std::invalid_argument("Unknown calculator: " + name);
}

OutputFormat parse_output_format(const std::string& name) {
    if (name == "json") return OutputFormat::Json;
    if (name == "csv") return OutputFormat::Csv;
    if (name == "parquet") return OutputFormat::Parquet;
    throw std::invalid_argument("Unknown output format: " + name);
}

CurrencySettings::CurrencySettings()
    : base("USD"),
      target(""),
      rates_url(DEFAULT_RATES_URL),
      cache_ttl_seconds(3600),
      timeout_ms(30000) {}

CalculationRequest::CalculationRequest()
    : request_id(""),
      calculator(CalculatorKind::Loan),
      repayment(RepaymentType::Standard),
      include_schedule(true),
      schedule_period(PeriodType::Yearly),
      format(OutputFormat::Json),
      output_path("") {}

void resolve_price_percentages(CalculationRequest& request) {
    MortgageTerms& m = request.mortgage;
    if (request.down_payment_percent) {
        m.down_payment = down_payment_from_percent(m.home_price, *request.down_payment_percent);
    }
    if (request.property_tax_percent) {
        m.annual_property_tax = property_tax_from_percent(m.home_price, *request.property_tax_percent);
    }
}

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++;

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        size_t name_end = pos;

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                throw ConfigParseError("Unterminated ${ in: " + value);
            }
            pos++;
        }

        // A lone '$' (e.g. a price) is left as is
        if (name_end == name_start) {
            if (braces) {
                throw ConfigParseError("Empty variable name in: " + value);
            }
            continue;
        }

        std::string var_name = result.substr(name_start, name_end - name_start);
        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& request_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    fs::path request_dir = fs::path(request_file_path).parent_path();
    return (request_dir / p).string();
}

CalculationRequest parse_request_from_string(const std::string& json_string) {
    CalculationRequest request;

    try {
        json j = json::parse(json_string);

        if (!j.is_object()) {
            throw ConfigParseError("Request must be a JSON object");
        }

        if (!j.contains("calculator")) {
            throw ConfigParseError("Missing required field: calculator");
        }
        request.calculator = parse_calculator_kind(j["calculator"].get<std::string>());

        if (j.contains("request_id")) {
            request.request_id = read_string(j, "request_id");
        }

        if (j.contains("loan")) parse_loan(j["loan"], request);
        if (j.contains("mortgage")) parse_mortgage(j["mortgage"], request);
        if (j.contains("investment")) parse_investment(j["investment"], request);

        if (j.contains("schedule")) {
            const json& schedule = j["schedule"];
            if (schedule.contains("enabled")) request.include_schedule = schedule["enabled"].get<bool>();
            if (schedule.contains("period")) {
                request.schedule_period = parse_period_type(schedule["period"].get<std::string>());
            }
        }

        if (j.contains("output")) {
            const json& output = j["output"];
            if (output.contains("format")) {
                request.format = parse_output_format(output["format"].get<std::string>());
            }
            if (output.contains("path")) request.output_path = read_string(output, "path");
        }

        if (j.contains("currency")) {
            const json& currency = j["currency"];
            if (currency.contains("base")) request.currency.base = read_string(currency, "base");
            if (currency.contains("target")) request.currency.target = read_string(currency, "target");
            if (currency.contains("rates_url")) request.currency.rates_url = read_string(currency, "rates_url");
            if (currency.contains("cache_ttl_seconds")) {
                request.currency.cache_ttl_seconds = currency["cache_ttl_seconds"].get<int>();
            }
            if (currency.contains("timeout_ms")) {
                request.currency.timeout_ms = currency["timeout_ms"].get<int>();
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw ConfigParseError(std::string("Missing field: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ConfigParseError(e.what());
    }

    resolve_price_percentages(request);
    validate_request(request);

    return request;
}

CalculationRequest parse_request_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open request file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    CalculationRequest request = parse_request_from_string(buffer.str());

    if (!request.output_path.empty()) {
        request.output_path = resolve_relative_path(request.output_path, file_path);
    }

    return request;
}

std::map<std::string, std::string> describe_request(const CalculationRequest& request) {
    std::map<std::string, std::string> settings;
    settings["calculator"] = to_string(request.calculator);
    settings["format"] = to_string(request.format);
    settings["output"] = request.output_path.empty() ? "stdout" : request.output_path;
    settings["schedule"] = request.include_schedule ? to_string(request.schedule_period) : "none";
    if (request.currency.enabled()) {
        settings["currency"] = request.currency.base + "-" + request.currency.target;
    }

    switch (request.calculator) {
        case CalculatorKind::Loan:
            settings["principal"] = format_number(request.loan.principal);
            settings["rate"] = format_number(request.loan.annual_rate_percent);
            settings["years"] = std::to_string(request.loan.years);
            settings["repayment"] = to_string(request.repayment);
            settings["grace"] = to_string(request.grace.kind) + "/" + std::to_string(request.grace.months);
            settings["extra"] = to_string(request.extra.kind);
            break;
        case CalculatorKind::Mortgage:
            settings["home_price"] = format_number(request.mortgage.home_price);
            settings["down_payment"] = format_number(request.mortgage.down_payment);
            settings["rate"] = format_number(request.mortgage.annual_rate_percent);
            settings["years"] = std::to_string(request.mortgage.years);
            settings["custom_costs"] = std::to_string(request.mortgage.custom_costs.size());
            break;
        case CalculatorKind::Investment:
            settings["initial"] = format_number(request.investment.initial);
            settings["monthly"] = format_number(request.investment.monthly_contribution);
            settings["rate"] = format_number(request.investment.annual_rate_percent);
            settings["years"] = std::to_string(request.investment.years);
            break;
    }
    return settings;
}

} // namespace finesse
