#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <memory>
#include "loan_terms.hpp"
#include "report.hpp"
#include "request_config.hpp"
#include "logger.hpp"
#include "io/format.hpp"
#include "io/csv_writer.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"
#include "c++/currency_client.hpp"

using namespace finesse;

namespace {

struct CLIArgs {
    std::string request_path;
    std::optional<std::string> calculator;
    // Loan
    std::optional<double> principal;
    std::optional<double> rate;
    std::optional<int> years;
    std::optional<std::string> repayment;
    std::optional<int> grace_months;
    std::optional<std::string> grace_type;
    std::optional<std::string> extra_type;
    std::optional<double> extra_monthly;
    std::optional<double> extra_yearly;
    std::optional<int> extra_yearly_month;
    // Mortgage
    std::optional<double> home_price;
    std::optional<double> down_payment;
    std::optional<double> property_tax;
    std::optional<double> insurance;
    std::optional<double> hoa;
    // Investment
    std::optional<double> initial;
    std::optional<double> monthly;
    // Output
    std::optional<std::string> schedule;
    std::optional<std::string> format;
    std::optional<std::string> output_path;
    // Currency
    std::optional<std::string> convert_to;
    std::optional<std::string> currency;
    std::optional<std::string> rates_url;
    std::string log_level = "INFO";
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "Finesse Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Request options:\n";
    std::cerr << "  --request <path>            JSON request file (flags below override it)\n";
    std::cerr << "  --calculator <kind>         loan, mortgage or investment\n\n";
    std::cerr << "Loan options:\n";
    std::cerr << "  --principal <amount>        Amount borrowed\n";
    std::cerr << "  --rate <percent>            Annual interest rate, e.g. 6.5\n";
    std::cerr << "  --years <n>                 Term in years\n";
    std::cerr << "  --repayment <type>          standard, balloon or bullet (default: standard)\n";
    std::cerr << "  --grace-type <type>         none, interest_only or no_payment\n";
    std::cerr << "  --grace-months <n>          Length of the grace period\n";
    std::cerr << "  --extra-type <type>         none, extra_monthly, extra_yearly or biweekly\n";
    std::cerr << "  --extra-monthly <amount>    Extra principal every month\n";
    std::cerr << "  --extra-yearly <amount>     Extra principal once a year\n";
    std::cerr << "  --extra-yearly-month <m>    Month of the yearly extra, 1-12 (default: 1)\n\n";
    std::cerr << "Mortgage options:\n";
    std::cerr << "  --home-price <amount>       Purchase price\n";
    std::cerr << "  --down-payment <amount>     Down payment in dollars\n";
    std::cerr << "  --rate <percent>, --years <n>\n";
    std::cerr << "  --property-tax <amount>     Annual property tax\n";
    std::cerr << "  --insurance <amount>        Annual homeowner's insurance\n";
    std::cerr << "  --hoa <amount>              Monthly HOA dues\n\n";
    std::cerr << "Investment options:\n";
    std::cerr << "  --initial <amount>          Starting balance\n";
    std::cerr << "  --monthly <amount>          Monthly contribution\n";
    std::cerr << "  --rate <percent>, --years <n>\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --schedule <period>         monthly, yearly or none (default: yearly)\n";
    std::cerr << "  --format <format>           json, csv or parquet (default: json)\n";
    std::cerr << "  --output <path>             Output file (default: stdout; required for parquet)\n\n";
    std::cerr << "Currency options:\n";
    std::cerr << "  --currency <code>           Currency of the inputs (default: USD)\n";
    std::cerr << "  --convert-to <code>         Report amounts in this currency\n";
    std::cerr << "  --rates-url <url>           Exchange rate service (default: https://api.frankfurter.dev)\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. 30-year loan with $200 extra per month:\n";
    std::cerr << "     " << program_name << " --calculator loan --principal 300000 --rate 6.5 \\\n";
    std::cerr << "         --years 30 --extra-type extra_monthly --extra-monthly 200\n\n";
    std::cerr << "  2. Investment growth as CSV, reported in euros:\n";
    std::cerr << "     " << program_name << " --calculator investment --initial 10000 \\\n";
    std::cerr << "         --monthly 500 --rate 7 --years 20 --format csv --convert-to EUR\n\n";
    std::cerr << "  3. Request file:\n";
    std::cerr << "     " << program_name << " --request requests/mortgage.json --output mortgage.json\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--request" && i + 1 < argc) {
            args.request_path = argv[++i];
        } else if (arg == "--calculator" && i + 1 < argc) {
            args.calculator = argv[++i];
        } else if (arg == "--principal" && i + 1 < argc) {
            args.principal = std::stod(argv[++i]);
        } else if (arg == "--rate" && i + 1 < argc) {
            args.rate = std::stod(argv[++i]);
        } else if (arg == "--years" && i + 1 < argc) {
            args.years = std::stoi(argv[++i]);
        } else if (arg == "--repayment" && i + 1 < argc) {
            args.repayment = argv[++i];
        } else if (arg == "--grace-months" && i + 1 < argc) {
            args.grace_months = std::stoi(argv[++i]);
        } else if (arg == "--grace-type" && i + 1 < argc) {
            args.grace_type = argv[++i];
        } else if (arg == "--extra-type" && i + 1 < argc) {
            args.extra_type = argv[++i];
        } else if (arg == "--extra-monthly" && i + 1 < argc) {
            args.extra_monthly = std::stod(argv[++i]);
        } else if (arg == "--extra-yearly" && i + 1 < argc) {
            args.extra_yearly = std::stod(argv[++i]);
        } else if (arg == "--extra-yearly-month" && i + 1 < argc) {
            args.extra_yearly_month = std::stoi(argv[++i]);
        } else if (arg == "--home-price" && i + 1 < argc) {
            args.home_price = std::stod(argv[++i]);
        } else if (arg == "--down-payment" && i + 1 < argc) {
            args.down_payment = std::stod(argv[++i]);
        } else if (arg == "--property-tax" && i + 1 < argc) {
            args.property_tax = std::stod(argv[++i]);
        } else if (arg == "--insurance" && i + 1 < argc) {
            args.insurance = std::stod(argv[++i]);
        } else if (arg == "--hoa" && i + 1 < argc) {
            args.hoa = std::stod(argv[++i]);
        } else if (arg == "--initial" && i + 1 < argc) {
            args.initial = std::stod(argv[++i]);
        } else if (arg == "--monthly" && i + 1 < argc) {
            args.monthly = std::stod(argv[++i]);
        } else if (arg == "--schedule" && i + 1 < argc) {
            args.schedule = argv[++i];
        } else if (arg == "--format" && i + 1 < argc) {
            args.format = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--convert-to" && i + 1 < argc) {
            args.convert_to = argv[++i];
        } else if (arg == "--currency" && i + 1 < argc) {
            args.currency = argv[++i];
        } else if (arg == "--rates-url" && i + 1 < argc) {
            args.rates_url = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

// Start from the request file (if any) and apply explicit flags on top
CalculationRequest build_request(const CLIArgs& args) {
    CalculationRequest request;
    if (!args.request_path.empty()) {
        request = parse_request_from_file(args.request_path);
    }

    try {
        if (args.calculator) request.calculator = parse_calculator_kind(*args.calculator);

        if (args.rate) {
            request.loan.annual_rate_percent = *args.rate;
            request.mortgage.annual_rate_percent = *args.rate;
            request.investment.annual_rate_percent = *args.rate;
        }
        if (args.years) {
            request.loan.years = *args.years;
            request.mortgage.years = *args.years;
            request.investment.years = *args.years;
        }

        if (args.principal) request.loan.principal = *args.principal;
        if (args.repayment) request.repayment = parse_repayment_type(*args.repayment);
        if (args.grace_type) request.grace.kind = parse_grace_kind(*args.grace_type);
        if (args.grace_months) request.grace.months = *args.grace_months;
        if (args.extra_type) request.extra.kind = parse_extra_payment_kind(*args.extra_type);
        if (args.extra_monthly) request.extra.extra_monthly = *args.extra_monthly;
        if (args.extra_yearly) request.extra.extra_yearly_amount = *args.extra_yearly;
        if (args.extra_yearly_month) request.extra.extra_yearly_month = *args.extra_yearly_month;

        if (args.home_price) request.mortgage.home_price = *args.home_price;
        if (args.down_payment) {
            request.mortgage.down_payment = *args.down_payment;
            request.down_payment_percent.reset();
        }
        if (args.property_tax) {
            request.mortgage.annual_property_tax = *args.property_tax;
            request.property_tax_percent.reset();
        }
        if (args.insurance) request.mortgage.annual_insurance = *args.insurance;
        if (args.hoa) request.mortgage.monthly_hoa = *args.hoa;

        if (args.initial) request.investment.initial = *args.initial;
        if (args.monthly) request.investment.monthly_contribution = *args.monthly;

        if (args.schedule) {
            if (*args.schedule == "none") {
                request.include_schedule = false;
            } else {
                request.include_schedule = true;
                request.schedule_period = parse_period_type(*args.schedule);
            }
        }
        if (args.format) request.format = parse_output_format(*args.format);
        if (args.output_path) request.output_path = *args.output_path;

        if (args.currency) request.currency.base = *args.currency;
        if (args.convert_to) request.currency.target = *args.convert_to;
        if (args.rates_url) request.currency.rates_url = *args.rates_url;

        // Percent inputs from a request file follow an overridden home price
        resolve_price_percentages(request);
    } catch (const std::invalid_argument& e) {
        throw ConfigParseError(e.what());
    }

    return request;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (!args.request_path.empty() && !file_exists(args.request_path)) {
        std::cerr << "Error: Request file not found: " << args.request_path << "\n";
        valid = false;
    }

    if (args.request_path.empty() && !args.calculator) {
        std::cerr << "Error: --calculator is required (or use --request)\n";
        valid = false;
    }

    if (args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    return valid;
}

bool validate_request(const CalculationRequest& request) {
    bool valid = true;

    auto require_years = [&](int years) {
        if (years <= 0) {
            std::cerr << "Error: --years must be greater than 0\n";
            valid = false;
        } else if (years > MAX_TERM_YEARS) {
            std::cerr << "Error: --years must be at most " << MAX_TERM_YEARS << "\n";
            valid = false;
        }
    };
    auto require_non_negative = [&](double value, const char* flag) {
        if (value < 0.0) {
            std::cerr << "Error: " << flag << " must be non-negative\n";
            valid = false;
        }
    };

    switch (request.calculator) {
        case CalculatorKind::Loan:
            require_years(request.loan.years);
            require_non_negative(request.loan.principal, "--principal");
            require_non_negative(request.loan.annual_rate_percent, "--rate");
            require_non_negative(request.extra.extra_monthly, "--extra-monthly");
            require_non_negative(request.extra.extra_yearly_amount, "--extra-yearly");
            if (request.grace.months < 0) {
                std::cerr << "Error: --grace-months must be non-negative\n";
                valid = false;
            }
            if (request.extra.extra_yearly_month < 1 || request.extra.extra_yearly_month > 12) {
                std::cerr << "Error: --extra-yearly-month must be between 1 and 12\n";
                valid = false;
            }
            break;
        case CalculatorKind::Mortgage:
            require_years(request.mortgage.years);
            require_non_negative(request.mortgage.home_price, "--home-price");
            require_non_negative(request.mortgage.down_payment, "--down-payment");
            require_non_negative(request.mortgage.annual_rate_percent, "--rate");
            require_non_negative(request.mortgage.annual_property_tax, "--property-tax");
            require_non_negative(request.mortgage.annual_insurance, "--insurance");
            require_non_negative(request.mortgage.monthly_hoa, "--hoa");
            if (request.mortgage.down_payment > request.mortgage.home_price) {
                std::cerr << "Error: --down-payment cannot exceed --home-price\n";
                valid = false;
            }
            break;
        case CalculatorKind::Investment:
            require_years(request.investment.years);
            require_non_negative(request.investment.initial, "--initial");
            require_non_negative(request.investment.monthly_contribution, "--monthly");
            require_non_negative(request.investment.annual_rate_percent, "--rate");
            break;
    }

    if (request.format == OutputFormat::Parquet && request.output_path.empty()) {
        std::cerr << "Error: --output is required for parquet output\n";
        valid = false;
    }

    return valid;
}

double lookup_exchange_rate(const CurrencySettings& settings) {
    auto provider = std::make_shared<currency::FrankfurterRateProvider>(settings.rates_url,
                                                                        settings.timeout_ms);
    auto cache = std::make_shared<currency::RateCache>(
        std::chrono::seconds(settings.cache_ttl_seconds));
    currency::CurrencyClient client(provider, cache);
    return client.get_exchange_rate(settings.base, settings.target);
}

template <typename Report>
void convert_currency(Report& report, const CurrencySettings& settings, CalculationContext& ctx) {
    if (!settings.enabled()) {
        return;
    }
    ctx.phase = "convert";
    const std::string target = currency::normalize_currency_code(settings.target);
    const double rate = lookup_exchange_rate(settings);
    apply_exchange_rate(report, rate, target);
}

std::string destination_of(const CalculationRequest& request) {
    return request.output_path.empty() ? "stdout" : request.output_path;
}

size_t write_report(const LoanReport& report, const CalculationRequest& request) {
    const std::string& path = request.output_path;
    switch (request.format) {
        case OutputFormat::Json:
            if (path.empty()) io::write_loan_report_json(std::cout, report);
            else io::write_loan_report_json(path, report);
            break;
        case OutputFormat::Csv:
            if (path.empty()) io::write_loan_csv(std::cout, report);
            else io::write_loan_csv(path, report);
            break;
        case OutputFormat::Parquet:
            ParquetWriter::write_amortization_schedule(report.schedule, path);
            break;
    }
    return report.schedule.size();
}

size_t write_report(const MortgageReport& report, const CalculationRequest& request) {
    const std::string& path = request.output_path;
    switch (request.format) {
        case OutputFormat::Json:
            if (path.empty()) io::write_mortgage_report_json(std::cout, report);
            else io::write_mortgage_report_json(path, report);
            break;
        case OutputFormat::Csv:
            if (path.empty()) io::write_mortgage_csv(std::cout, report);
            else io::write_mortgage_csv(path, report);
            break;
        case OutputFormat::Parquet:
            ParquetWriter::write_amortization_schedule(report.schedule, path);
            break;
    }
    return report.schedule.size();
}

size_t write_report(const InvestmentReport& report, const CalculationRequest& request) {
    const std::string& path = request.output_path;
    switch (request.format) {
        case OutputFormat::Json:
            if (path.empty()) io::write_investment_report_json(std::cout, report);
            else io::write_investment_report_json(path, report);
            break;
        case OutputFormat::Csv:
            if (path.empty()) io::write_investment_csv(std::cout, report);
            else io::write_investment_csv(path, report);
            break;
        case OutputFormat::Parquet:
            ParquetWriter::write_investment_schedule(report.schedule, path);
            break;
    }
    return report.schedule.size();
}

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    auto end = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(end - start).count();
}

template <typename Report>
void finish(Report& report, const CalculationRequest& request, CalculationContext& ctx) {
    convert_currency(report, request.currency, ctx);

    ctx.phase = "export";
    size_t rows = write_report(report, request);
    Logger::get_instance().log_export(ctx, to_string(request.format), destination_of(request), rows);
}

ReportOptions report_options(const CalculationRequest& request) {
    ReportOptions options;
    options.include_schedule = request.include_schedule;
    options.period = request.schedule_period;
    options.currency = currency::normalize_currency_code(request.currency.base);
    return options;
}

void run_loan(const CalculationRequest& request, CalculationContext& ctx) {
    Logger& logger = Logger::get_instance();
    logger.log_calculation_start(ctx, {
        {"principal", io::format_number(request.loan.principal)},
        {"rate", io::format_number(request.loan.annual_rate_percent)},
        {"years", std::to_string(request.loan.years)},
        {"repayment", to_string(request.repayment)}
    });

    auto start = std::chrono::steady_clock::now();
    LoanReport report = build_loan_report(request.loan, request.repayment, request.grace,
                                          request.extra, report_options(request));

    CalculationMetrics metrics;
    metrics.elapsed_ms = elapsed_ms(start);
    metrics.rows_generated = report.schedule.size();
    metrics.months_simulated = report.has_extra_payments
        ? static_cast<size_t>(report.extra_result.actual_months) : 0;
    metrics.converged = report.converged;

    if (!report.converged) {
        logger.log_warning(ctx, "Extra payment simulation stopped at the safety cap with a balance of " +
                                io::format_currency_precise(report.extra_result.remaining_balance,
                                                            report.currency));
    }
    logger.log_calculation_complete(ctx, {
        {"monthly_payment", io::format_number(report.monthly_payment, 2)},
        {"total_payment", io::format_number(report.total_payment, 2)},
        {"total_interest", io::format_number(report.total_interest, 2)}
    }, metrics);

    finish(report, request, ctx);
}

void run_mortgage(const CalculationRequest& request, CalculationContext& ctx) {
    Logger& logger = Logger::get_instance();
    logger.log_calculation_start(ctx, {
        {"home_price", io::format_number(request.mortgage.home_price)},
        {"down_payment", io::format_number(request.mortgage.down_payment)},
        {"rate", io::format_number(request.mortgage.annual_rate_percent)},
        {"years", std::to_string(request.mortgage.years)}
    });

    auto start = std::chrono::steady_clock::now();
    MortgageReport report = build_mortgage_report(request.mortgage, report_options(request));

    CalculationMetrics metrics;
    metrics.elapsed_ms = elapsed_ms(start);
    metrics.rows_generated = report.schedule.size();
    logger.log_calculation_complete(ctx, {
        {"loan_amount", io::format_number(report.result.loan_amount, 2)},
        {"total_monthly", io::format_number(report.result.total_monthly, 2)},
        {"total_cost", io::format_number(report.result.total_cost, 2)}
    }, metrics);

    finish(report, request, ctx);
}

void run_investment(const CalculationRequest& request, CalculationContext& ctx) {
    Logger& logger = Logger::get_instance();
    logger.log_calculation_start(ctx, {
        {"initial", io::format_number(request.investment.initial)},
        {"monthly", io::format_number(request.investment.monthly_contribution)},
        {"rate", io::format_number(request.investment.annual_rate_percent)},
        {"years", std::to_string(request.investment.years)}
    });

    auto start = std::chrono::steady_clock::now();
    InvestmentReport report = build_investment_report(request.investment, report_options(request));

    CalculationMetrics metrics;
    metrics.elapsed_ms = elapsed_ms(start);
    metrics.rows_generated = report.schedule.size();
    logger.log_calculation_complete(ctx, {
        {"future_value", io::format_number(report.result.future_value, 2)},
        {"total_contributions", io::format_number(report.result.total_contributions, 2)},
        {"total_interest", io::format_number(report.result.total_interest, 2)}
    }, metrics);

    finish(report, request, ctx);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    try {
        if (!parse_args(argc, argv, args)) {
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        // std::stod / std::stoi on a malformed number
        std::cerr << "Error: Invalid numeric argument (" << e.what() << ")\n";
        return 1;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    LoggerConfig log_config;
    log_config.min_level = string_to_level(args.log_level);
    Logger& logger = Logger::get_instance();
    logger.configure(log_config);

    CalculationContext ctx;
    ctx.phase = "parse";

    try {
        CalculationRequest request = build_request(args);
        ctx.request_id = request.request_id.empty() ? "cli" : request.request_id;
        ctx.calculator = to_string(request.calculator);

        if (!validate_request(request)) {
            std::cerr << "\nUse --help for usage information.\n";
            return 1;
        }

        logger.log_request_loaded(args.request_path.empty() ? "command-line" : args.request_path,
                                  describe_request(request));

        ctx.phase = "compute";
        switch (request.calculator) {
            case CalculatorKind::Loan:
                run_loan(request, ctx);
                break;
            case CalculatorKind::Mortgage:
                run_mortgage(request, ctx);
                break;
            case CalculatorKind::Investment:
                run_investment(request, ctx);
                break;
        }

        logger.flush();
        return 0;
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        logger.flush();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
