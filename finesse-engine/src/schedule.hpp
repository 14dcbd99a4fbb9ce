#ifndef FINESSE_SCHEDULE_HPP
#define FINESSE_SCHEDULE_HPP

#include "loan_terms.hpp"
#include <vector>

namespace finesse {

// One period of a loan schedule (a month, or a year of 12 months)
struct AmortizationRow {
    int period;                     // 1-based month or year
    double payment;                 // Paid during the period
    double principal;               // Principal portion
    double interest;                // Interest portion
    double balance;                 // Balance at the end of the period
    double total_principal;         // Cumulative principal to date
    double total_interest;          // Cumulative interest to date
};

// One year of an investment projection; year 0 is the initial state
struct InvestmentGrowthRow {
    int year;
    double contributions;           // Initial balance + contributions to date
    double interest;                // balance - contributions
    double balance;
};

struct ScheduleResult {
    std::vector<AmortizationRow> rows;
    bool converged;                 // False when the safety cap cut the schedule short

    ScheduleResult();
};

// Standard amortization schedule: years×12 monthly rows or `years` yearly rows.
// Empty when principal <= 0 or years is outside 1..MAX_TERM_YEARS.
std::vector<AmortizationRow> generate_schedule(
    double principal,
    double annual_rate_percent,
    int years,
    PeriodType period = PeriodType::Yearly
);

// Schedule with an extra payment policy. Runs the same month-by-month loop as
// simulate_extra_payments (same payoff epsilon and safety cap), so the row
// totals always match the simulator. Yearly rows group 12 months; the last
// year may be partial. A None policy gives the standard schedule.
std::vector<AmortizationRow> generate_schedule(
    double principal,
    double annual_rate_percent,
    int years,
    const ExtraPaymentPolicy& policy,
    PeriodType period = PeriodType::Yearly
);

// As above, also reporting whether the balance was paid off
ScheduleResult generate_schedule_checked(
    double principal,
    double annual_rate_percent,
    int years,
    const ExtraPaymentPolicy& policy,
    PeriodType period = PeriodType::Yearly
);

std::vector<AmortizationRow> generate_schedule(const LoanTerms& terms,
                                               const ExtraPaymentPolicy& policy,
                                               PeriodType period = PeriodType::Yearly);

// Roll monthly rows up into yearly rows (12 months each, last group may be short)
std::vector<AmortizationRow> aggregate_yearly(const std::vector<AmortizationRow>& monthly_rows);

// Year-by-year growth of an initial balance plus monthly contributions,
// compounded monthly. Always starts with the year 0 row.
std::vector<InvestmentGrowthRow> generate_investment_schedule(
    double initial,
    double monthly_contribution,
    double annual_rate_percent,
    int years
);

std::vector<InvestmentGrowthRow> generate_investment_schedule(const InvestmentTerms& terms);

} // namespace finesse

#endif // FINESSE_SCHEDULE_HPP
