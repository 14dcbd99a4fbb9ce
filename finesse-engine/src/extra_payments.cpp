#include "extra_payments.hpp"
#include "amortization.hpp"
#include <algorithm>

namespace finesse {

ExtraPaymentResult::ExtraPaymentResult()
    : standard_monthly_payment(0.0),
      standard_total_payment(0.0),
      standard_total_interest(0.0),
      standard_months(0),
      actual_months(0),
      actual_total_payment(0.0),
      actual_total_interest(0.0),
      months_saved(0),
      interest_saved(0.0),
      effective_monthly_payment(0.0),
      converged(true),
      remaining_balance(0.0) {}

AmortizationStep amortization_step(double balance, double monthly_rate,
                                   double scheduled_payment, double extra)
{
    AmortizationStep step;
    step.interest = balance * monthly_rate;
    step.principal = std::min(scheduled_payment - step.interest + extra, balance);
    step.payment = step.interest + step.principal;
    step.balance = std::max(0.0, balance - step.principal);
    return step;
}

double extra_for_month(const ExtraPaymentPolicy& policy, int month, double standard_payment) {
    switch (policy.kind) {
        case ExtraPaymentKind::ExtraMonthly:
            return policy.extra_monthly;
        case ExtraPaymentKind::Biweekly:
            return standard_payment / 12.0;
        case ExtraPaymentKind::ExtraYearly:
            if (month % 12 == policy.extra_yearly_month % 12) {
                return policy.extra_yearly_amount;
            }
            return 0.0;
        case ExtraPaymentKind::None:
            break;
    }
    return 0.0;
}

ExtraPaymentResult simulate_extra_payments(double principal, double annual_rate_percent,
                                           int years, const ExtraPaymentPolicy& policy)
{
    ExtraPaymentResult result;
    if (principal <= 0.0 || !term_in_range(years)) {
        return result;
    }

    const double rate = monthly_rate(annual_rate_percent);
    const int standard_months = years * 12;
    const double standard_payment = annuity_payment(principal, rate, standard_months);

    result.standard_monthly_payment = standard_payment;
    result.standard_total_payment = standard_payment * standard_months;
    result.standard_total_interest = result.standard_total_payment - principal;
    result.standard_months = standard_months;

    if (policy.kind == ExtraPaymentKind::None) {
        result.actual_months = standard_months;
        result.actual_total_payment = result.standard_total_payment;
        result.actual_total_interest = result.standard_total_interest;
        result.effective_monthly_payment = standard_payment;
        return result;
    }

    const int max_months = standard_months * SAFETY_CAP_MULTIPLIER;
    double balance = principal;
    double total_paid = 0.0;
    double total_interest = 0.0;
    int months = 0;

    while (balance > PAYOFF_EPSILON && months < max_months) {
        ++months;
        const double extra = extra_for_month(policy, months, standard_payment);
        const AmortizationStep step = amortization_step(balance, rate, standard_payment, extra);
        total_interest += step.interest;
        total_paid += step.payment;
        balance = step.balance;
    }

    result.actual_months = months;
    result.actual_total_payment = total_paid;
    result.actual_total_interest = total_interest;
    result.months_saved = std::max(0, standard_months - months);
    result.interest_saved = std::max(0.0, result.standard_total_interest - total_interest);
    result.effective_monthly_payment = months > 0 ? total_paid / months : 0.0;
    result.converged = balance <= PAYOFF_EPSILON;
    result.remaining_balance = result.converged ? 0.0 : balance;
    return result;
}

ExtraPaymentResult simulate_extra_payments(const LoanTerms& terms,
                                           const ExtraPaymentPolicy& policy) {
    return simulate_extra_payments(terms.principal, terms.annual_rate_percent, terms.years, policy);
}

} // namespace finesse
