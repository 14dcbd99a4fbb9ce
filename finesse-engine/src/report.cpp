#include "report.hpp"
#include <utility>

namespace finesse {

namespace {

void scale_rows(std::vector<AmortizationRow>& rows, double rate) {
    for (auto& row : rows) {
        row.payment *= rate;
        row.principal *= rate;
        row.interest *= rate;
        row.balance *= rate;
        row.total_principal *= rate;
        row.total_interest *= rate;
    }
}

} // anonymous namespace

ReportOptions::ReportOptions()
    : include_schedule(true),
      period(PeriodType::Yearly),
      currency("USD") {}

LoanReport::LoanReport()
    : repayment(RepaymentType::Standard),
      currency("USD"),
      monthly_payment(0.0),
      total_payment(0.0),
      total_interest(0.0),
      has_first_month(false),
      has_extra_payments(false),
      period(PeriodType::Yearly),
      converged(true) {}

MortgageReport::MortgageReport()
    : currency("USD"),
      period(PeriodType::Yearly) {}

InvestmentReport::InvestmentReport()
    : currency("USD") {}

LoanReport build_loan_report(const LoanTerms& terms,
                             RepaymentType repayment,
                             const GracePolicy& grace,
                             const ExtraPaymentPolicy& extra,
                             const ReportOptions& options) {
    LoanReport report;
    report.terms = terms;
    report.repayment = repayment;
    report.grace = grace;
    report.extra = extra;
    report.currency = options.currency;
    report.period = options.period;

    report.standard = compute_with_grace(terms, grace);
    report.balloon = compute_balloon(terms);
    report.bullet = compute_bullet(terms);

    switch (repayment) {
        case RepaymentType::Balloon:
            report.monthly_payment = report.balloon.monthly_payment;
            report.total_payment = report.balloon.total_payment;
            report.total_interest = report.balloon.total_interest;
            return report;
        case RepaymentType::Bullet:
            report.monthly_payment = report.bullet.monthly_payment;
            report.total_payment = report.bullet.total_payment;
            report.total_interest = report.bullet.total_interest;
            return report;
        case RepaymentType::Standard:
            break;
    }

    report.monthly_payment = report.standard.monthly_payment;
    report.total_payment = report.standard.total_payment;
    report.total_interest = report.standard.total_interest;

    const double amortized = report.standard.principal_after_grace;
    if (amortized <= 0.0 || !term_in_range(terms.years)) {
        return report;
    }

    report.has_first_month = true;
    report.first_month = first_month_breakdown(amortized, terms.annual_rate_percent,
                                               report.standard.monthly_payment);

    if (extra.kind != ExtraPaymentKind::None) {
        report.has_extra_payments = true;
        report.extra_result = simulate_extra_payments(amortized, terms.annual_rate_percent,
                                                      terms.years, extra);
        report.converged = report.extra_result.converged;
    }

    if (options.include_schedule) {
        ScheduleResult schedule = generate_schedule_checked(
            amortized, terms.annual_rate_percent, terms.years, extra, options.period);
        report.schedule = std::move(schedule.rows);
        report.converged = report.converged && schedule.converged;
    }

    return report;
}

MortgageReport build_mortgage_report(const MortgageTerms& terms, const ReportOptions& options) {
    MortgageReport report;
    report.terms = terms;
    report.currency = options.currency;
    report.period = options.period;
    report.result = compute_mortgage(terms);

    if (options.include_schedule) {
        report.schedule = generate_schedule(report.result.loan_amount, terms.annual_rate_percent,
                                            terms.years, options.period);
    }
    return report;
}

InvestmentReport build_investment_report(const InvestmentTerms& terms, const ReportOptions& options) {
    InvestmentReport report;
    report.terms = terms;
    report.currency = options.currency;
    report.result = compute_investment_growth(terms);
    report.milestones = compute_milestones(terms.initial, terms.monthly_contribution,
                                           terms.annual_rate_percent, terms.years);

    if (options.include_schedule) {
        report.schedule = generate_investment_schedule(terms);
    }
    return report;
}

void apply_exchange_rate(LoanReport& report, double rate, const std::string& currency) {
    report.currency = currency;
    report.terms.principal *= rate;
    report.extra.extra_monthly *= rate;
    report.extra.extra_yearly_amount *= rate;

    report.monthly_payment *= rate;
    report.total_payment *= rate;
    report.total_interest *= rate;

    GraceResult& g = report.standard;
    g.monthly_payment *= rate;
    g.total_payment *= rate;
    g.total_interest *= rate;
    g.grace_payment *= rate;
    g.principal_after_grace *= rate;
    g.grace_interest *= rate;

    BalloonResult& b = report.balloon;
    b.monthly_payment *= rate;
    b.balloon_payment *= rate;
    b.total_payment *= rate;
    b.total_interest *= rate;

    BulletResult& u = report.bullet;
    u.monthly_payment *= rate;
    u.final_payment *= rate;
    u.total_payment *= rate;
    u.total_interest *= rate;

    report.first_month.interest *= rate;
    report.first_month.principal *= rate;

    ExtraPaymentResult& e = report.extra_result;
    e.standard_monthly_payment *= rate;
    e.standard_total_payment *= rate;
    e.standard_total_interest *= rate;
    e.actual_total_payment *= rate;
    e.actual_total_interest *= rate;
    e.interest_saved *= rate;
    e.effective_monthly_payment *= rate;
    e.remaining_balance *= rate;

    scale_rows(report.schedule, rate);
}

void apply_exchange_rate(MortgageReport& report, double rate, const std::string& currency) {
    report.currency = currency;

    MortgageTerms& t = report.terms;
    t.home_price *= rate;
    t.down_payment *= rate;
    t.annual_property_tax *= rate;
    t.annual_insurance *= rate;
    t.monthly_hoa *= rate;
    for (auto& cost : t.custom_costs) {
        if (cost.mode == CostMode::Dollar) {
            cost.value *= rate;
        }
    }

    MortgageResult& r = report.result;
    r.loan_amount *= rate;
    r.monthly_principal_interest *= rate;
    r.monthly_property_tax *= rate;
    r.monthly_insurance *= rate;
    r.monthly_hoa *= rate;
    r.monthly_other *= rate;
    r.total_monthly *= rate;
    r.total_cost *= rate;
    r.total_interest *= rate;
    r.first_month.interest *= rate;
    r.first_month.principal *= rate;

    scale_rows(report.schedule, rate);
}

void apply_exchange_rate(InvestmentReport& report, double rate, const std::string& currency) {
    report.currency = currency;
    report.terms.initial *= rate;
    report.terms.monthly_contribution *= rate;

    report.result.future_value *= rate;
    report.result.total_contributions *= rate;
    report.result.total_interest *= rate;

    for (auto& milestone : report.milestones) {
        milestone.value *= rate;
    }
    for (auto& row : report.schedule) {
        row.contributions *= rate;
        row.interest *= rate;
        row.balance *= rate;
    }
}

} // namespace finesse
