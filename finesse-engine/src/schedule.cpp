#include "schedule.hpp"
#include "amortization.hpp"
#include "extra_payments.hpp"
#include <algorithm>
#include <utility>

namespace finesse {

ScheduleResult::ScheduleResult() : converged(true) {}

namespace {

struct MonthlyRun {
    std::vector<AmortizationRow> rows;
    double balance;                 // Balance after the last row
};

// Monthly rows for up to `max_months` months, stopping early once the balance
// is paid off when `stop_at_payoff` is set
MonthlyRun run_monthly(double principal, double rate, double scheduled_payment,
                       int max_months, const ExtraPaymentPolicy& policy,
                       bool stop_at_payoff)
{
    MonthlyRun run;
    run.rows.reserve(static_cast<size_t>(max_months));
    run.balance = principal;

    double total_principal = 0.0;
    double total_interest = 0.0;

    for (int month = 1; month <= max_months; ++month) {
        if (stop_at_payoff && run.balance <= PAYOFF_EPSILON) {
            break;
        }

        const double extra = extra_for_month(policy, month, scheduled_payment);
        const AmortizationStep step = amortization_step(run.balance, rate, scheduled_payment, extra);

        run.balance = step.balance;
        total_principal += step.principal;
        total_interest += step.interest;

        AmortizationRow row;
        row.period = month;
        row.payment = step.payment;
        row.principal = step.principal;
        row.interest = step.interest;
        row.balance = step.balance;
        row.total_principal = total_principal;
        row.total_interest = total_interest;
        run.rows.push_back(row);
    }

    return run;
}

} // anonymous namespace

std::vector<AmortizationRow> aggregate_yearly(const std::vector<AmortizationRow>& monthly_rows) {
    std::vector<AmortizationRow> yearly;
    yearly.reserve(monthly_rows.size() / 12 + 1);

    for (size_t start = 0; start < monthly_rows.size(); start += 12) {
        const size_t end = std::min(start + 12, monthly_rows.size());

        AmortizationRow row;
        row.period = static_cast<int>(start / 12) + 1;
        row.payment = 0.0;
        row.principal = 0.0;
        row.interest = 0.0;
        for (size_t i = start; i < end; ++i) {
            row.payment += monthly_rows[i].payment;
            row.principal += monthly_rows[i].principal;
            row.interest += monthly_rows[i].interest;
        }

        // Balance and running totals are end-of-year snapshots
        const AmortizationRow& last = monthly_rows[end - 1];
        row.balance = last.balance;
        row.total_principal = last.total_principal;
        row.total_interest = last.total_interest;
        yearly.push_back(row);
    }

    return yearly;
}

std::vector<AmortizationRow> generate_schedule(
    double principal,
    double annual_rate_percent,
    int years,
    PeriodType period)
{
    if (principal <= 0.0 || !term_in_range(years)) {
        return {};
    }

    const double rate = monthly_rate(annual_rate_percent);
    const int months = years * 12;
    const double payment = annuity_payment(principal, rate, months);

    MonthlyRun run = run_monthly(principal, rate, payment, months,
                                 ExtraPaymentPolicy::none(), false);

    if (period == PeriodType::Monthly) {
        return std::move(run.rows);
    }
    return aggregate_yearly(run.rows);
}

ScheduleResult generate_schedule_checked(
    double principal,
    double annual_rate_percent,
    int years,
    const ExtraPaymentPolicy& policy,
    PeriodType period)
{
    ScheduleResult result;
    if (principal <= 0.0 || !term_in_range(years)) {
        return result;
    }

    if (policy.kind == ExtraPaymentKind::None) {
        result.rows = generate_schedule(principal, annual_rate_percent, years, period);
        return result;
    }

    const double rate = monthly_rate(annual_rate_percent);
    const int standard_months = years * 12;
    const double payment = annuity_payment(principal, rate, standard_months);

    MonthlyRun run = run_monthly(principal, rate, payment,
                                 standard_months * SAFETY_CAP_MULTIPLIER, policy, true);
    result.converged = run.balance <= PAYOFF_EPSILON;

    if (period == PeriodType::Monthly) {
        result.rows = std::move(run.rows);
    } else {
        result.rows = aggregate_yearly(run.rows);
    }
    return result;
}

std::vector<AmortizationRow> generate_schedule(
    double principal,
    double annual_rate_percent,
    int years,
    const ExtraPaymentPolicy& policy,
    PeriodType period)
{
    return generate_schedule_checked(principal, annual_rate_percent, years, policy, period).rows;
}

std::vector<AmortizationRow> generate_schedule(const LoanTerms& terms,
                                               const ExtraPaymentPolicy& policy,
                                               PeriodType period) {
    return generate_schedule(terms.principal, terms.annual_rate_percent, terms.years, policy, period);
}

// ============================================================================
// Investment growth
// ============================================================================

std::vector<InvestmentGrowthRow> generate_investment_schedule(
    double initial,
    double monthly_contribution,
    double annual_rate_percent,
    int years)
{
    std::vector<InvestmentGrowthRow> schedule;
    const int horizon = term_in_range(years) ? years : 0;
    schedule.reserve(static_cast<size_t>(horizon) + 1);

    const double rate = monthly_rate(annual_rate_percent);
    double balance = initial;
    double contributions = initial;

    schedule.push_back(InvestmentGrowthRow{0, initial, 0.0, initial});

    for (int year = 1; year <= horizon; ++year) {
        for (int month = 1; month <= 12; ++month) {
            const double interest = balance * rate;
            balance += interest + monthly_contribution;
            contributions += monthly_contribution;
        }
        schedule.push_back(InvestmentGrowthRow{year, contributions, balance - contributions, balance});
    }

    return schedule;
}

std::vector<InvestmentGrowthRow> generate_investment_schedule(const InvestmentTerms& terms) {
    return generate_investment_schedule(terms.initial, terms.monthly_contribution,
                                        terms.annual_rate_percent, terms.years);
}

} // namespace finesse
