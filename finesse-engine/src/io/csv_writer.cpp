#include "csv_writer.hpp"
#include <fstream>
#include <stdexcept>
#include <vector>

namespace finesse {
namespace io {

namespace {

void write_row(std::ostream& os, const std::vector<std::string>& cells) {
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) os << ',';
        os << escape_csv(cells[i]);
    }
    os << '\n';
}

void write_header(std::ostream& os, const std::string& title, const std::string& generated) {
    write_row(os, {title});
    write_row(os, {"Generated", generated});
    os << '\n';
}

std::string years_text(int years) {
    return std::to_string(years) + (years == 1 ? " year" : " years");
}

void write_amortization_rows(std::ostream& os, const std::vector<AmortizationRow>& rows,
                             PeriodType period, const std::string& currency) {
    if (rows.empty()) {
        return;
    }

    write_row(os, {"Amortization Schedule"});
    write_row(os, {period == PeriodType::Monthly ? "Month" : "Year",
                   "Payment", "Principal", "Interest", "Balance",
                   "Total Principal", "Total Interest"});
    for (const auto& row : rows) {
        write_row(os, {std::to_string(row.period),
                       format_currency(row.payment, currency),
                       format_currency(row.principal, currency),
                       format_currency(row.interest, currency),
                       format_currency(row.balance, currency),
                       format_currency(row.total_principal, currency),
                       format_currency(row.total_interest, currency)});
    }
}

template <typename Report, typename Writer>
void write_to_file(const std::string& filepath, const Report& report, Writer writer) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    writer(file, report, current_date());
}

} // anonymous namespace

std::string escape_csv(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }

    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

// ============================================================================
// Loan
// ============================================================================

void write_loan_csv(std::ostream& os, const LoanReport& report, const std::string& generated) {
    const std::string& cur = report.currency;

    write_header(os, "Loan Calculator Export", generated);

    write_row(os, {"Loan Details"});
    write_row(os, {"Principal", format_currency(report.terms.principal, cur)});
    write_row(os, {"Interest Rate", format_percent(report.terms.annual_rate_percent)});
    write_row(os, {"Term", years_text(report.terms.years)});
    write_row(os, {"Repayment Type", to_string(report.repayment)});
    if (report.repayment == RepaymentType::Standard && report.grace.active()) {
        write_row(os, {"Grace Period", std::to_string(report.grace.months) + " months (" +
                                       to_string(report.grace.kind) + ")"});
    }
    os << '\n';

    write_row(os, {"Results"});
    write_row(os, {"Monthly Payment", format_currency(report.monthly_payment, cur)});
    write_row(os, {"Total Payment", format_currency(report.total_payment, cur)});
    write_row(os, {"Total Interest", format_currency(report.total_interest, cur)});
    switch (report.repayment) {
        case RepaymentType::Balloon:
            write_row(os, {"Balloon Payment", format_currency(report.balloon.balloon_payment, cur)});
            break;
        case RepaymentType::Bullet:
            write_row(os, {"Final Payment", format_currency(report.bullet.final_payment, cur)});
            break;
        case RepaymentType::Standard:
            if (report.grace.active()) {
                write_row(os, {"Grace Payment", format_currency(report.standard.grace_payment, cur)});
                write_row(os, {"Principal After Grace",
                               format_currency(report.standard.principal_after_grace, cur)});
            }
            break;
    }
    os << '\n';

    if (report.has_extra_payments) {
        const ExtraPaymentResult& e = report.extra_result;
        write_row(os, {"Extra Payments"});
        write_row(os, {"Strategy", to_string(report.extra.kind)});
        write_row(os, {"Payoff Months", std::to_string(e.actual_months)});
        write_row(os, {"Months Saved", std::to_string(e.months_saved)});
        write_row(os, {"Interest Saved", format_currency(e.interest_saved, cur)});
        write_row(os, {"Total Payment", format_currency(e.actual_total_payment, cur)});
        write_row(os, {"Total Interest", format_currency(e.actual_total_interest, cur)});
        if (!e.converged) {
            write_row(os, {"Remaining Balance", format_currency_precise(e.remaining_balance, cur)});
        }
        os << '\n';
    }

    write_amortization_rows(os, report.schedule, report.period, cur);
}

// ============================================================================
// Mortgage
// ============================================================================

void write_mortgage_csv(std::ostream& os, const MortgageReport& report, const std::string& generated) {
    const std::string& cur = report.currency;
    const MortgageResult& r = report.result;

    write_header(os, "Mortgage Calculator Export", generated);

    write_row(os, {"Property Details"});
    write_row(os, {"Home Price", format_currency(report.terms.home_price, cur)});
    write_row(os, {"Down Payment", format_currency(report.terms.down_payment, cur)});
    write_row(os, {"Loan Amount", format_currency(r.loan_amount, cur)});
    write_row(os, {"Interest Rate", format_percent(report.terms.annual_rate_percent)});
    write_row(os, {"Term", years_text(report.terms.years)});
    os << '\n';

    write_row(os, {"Monthly Costs"});
    write_row(os, {"Principal & Interest", format_currency(r.monthly_principal_interest, cur)});
    write_row(os, {"Property Tax", format_currency(r.monthly_property_tax, cur)});
    write_row(os, {"Insurance", format_currency(r.monthly_insurance, cur)});
    write_row(os, {"HOA", format_currency(r.monthly_hoa, cur)});
    write_row(os, {"Other Costs", format_currency(r.monthly_other, cur)});
    write_row(os, {"Total Monthly", format_currency(r.total_monthly, cur)});
    os << '\n';

    write_row(os, {"Totals"});
    write_row(os, {"Total Interest", format_currency(r.total_interest, cur)});
    write_row(os, {"Total Cost", format_currency(r.total_cost, cur)});
    os << '\n';

    write_amortization_rows(os, report.schedule, report.period, cur);
}

// ============================================================================
// Investment
// ============================================================================

void write_investment_csv(std::ostream& os, const InvestmentReport& report, const std::string& generated) {
    const std::string& cur = report.currency;

    write_header(os, "Investment Calculator Export", generated);

    write_row(os, {"Investment Details"});
    write_row(os, {"Initial Investment", format_currency(report.terms.initial, cur)});
    write_row(os, {"Monthly Contribution", format_currency(report.terms.monthly_contribution, cur)});
    write_row(os, {"Expected Return", format_percent(report.terms.annual_rate_percent)});
    write_row(os, {"Time Horizon", years_text(report.terms.years)});
    os << '\n';

    write_row(os, {"Results"});
    write_row(os, {"Future Value", format_currency(report.result.future_value, cur)});
    write_row(os, {"Total Contributions", format_currency(report.result.total_contributions, cur)});
    write_row(os, {"Total Interest Earned", format_currency(report.result.total_interest, cur)});
    os << '\n';

    if (!report.milestones.empty()) {
        write_row(os, {"Milestones"});
        for (const auto& milestone : report.milestones) {
            write_row(os, {"Year " + std::to_string(milestone.year),
                           format_currency(milestone.value, cur)});
        }
        os << '\n';
    }

    if (!report.schedule.empty()) {
        write_row(os, {"Growth Schedule"});
        write_row(os, {"Year", "Contributions", "Interest Earned", "Balance"});
        for (const auto& row : report.schedule) {
            write_row(os, {std::to_string(row.year),
                           format_currency(row.contributions, cur),
                           format_currency(row.interest, cur),
                           format_currency(row.balance, cur)});
        }
    }
}

void write_loan_csv(const std::string& filepath, const LoanReport& report) {
    write_to_file(filepath, report,
                  [](std::ostream& os, const LoanReport& r, const std::string& d) { write_loan_csv(os, r, d); });
}

void write_mortgage_csv(const std::string& filepath, const MortgageReport& report) {
    write_to_file(filepath, report,
                  [](std::ostream& os, const MortgageReport& r, const std::string& d) { write_mortgage_csv(os, r, d); });
}

void write_investment_csv(const std::string& filepath, const InvestmentReport& report) {
    write_to_file(filepath, report,
                  [](std::ostream& os, const InvestmentReport& r, const std::string& d) { write_investment_csv(os, r, d); });
}

} // namespace io
} // namespace finesse
