#ifndef FINESSE_EXTRA_PAYMENTS_HPP
#define FINESSE_EXTRA_PAYMENTS_HPP

#include "loan_terms.hpp"

namespace finesse {

// A balance at or below this is treated as paid off
constexpr double PAYOFF_EPSILON = 0.01;

// Simulations stop after this many multiples of the standard payment count
constexpr int SAFETY_CAP_MULTIPLIER = 2;

// One month of amortization
struct AmortizationStep {
    double interest;                // balance × monthly rate
    double principal;               // Principal actually applied (never above the balance)
    double payment;                 // interest + principal
    double balance;                 // Balance after the payment, floored at 0
};

// Advance one month:
//   principal = min(scheduled_payment - interest + extra, balance)
// Shared by the simulator and the schedule generators so both always agree.
AmortizationStep amortization_step(double balance, double monthly_rate,
                                   double scheduled_payment, double extra);

// Extra principal due in 1-based `month` under `policy`.
//   ExtraMonthly: policy.extra_monthly every month
//   ExtraYearly:  policy.extra_yearly_amount when month % 12 == extra_yearly_month % 12
//   Biweekly:     standard_payment / 12 every month (26 half payments ~ 13 full payments a year)
double extra_for_month(const ExtraPaymentPolicy& policy, int month, double standard_payment);

struct ExtraPaymentResult {
    // Standard loan
    double standard_monthly_payment;
    double standard_total_payment;
    double standard_total_interest;
    int standard_months;

    // With the extra payment policy applied
    int actual_months;
    double actual_total_payment;
    double actual_total_interest;

    // Savings, never negative
    int months_saved;
    double interest_saved;

    double effective_monthly_payment;   // actual_total_payment / actual_months

    // False when the simulation hit the safety cap with a balance left over
    bool converged;
    double remaining_balance;

    ExtraPaymentResult();
};

// Month-by-month payoff simulation with extra payments.
// Terminates when the balance drops to PAYOFF_EPSILON or after
// SAFETY_CAP_MULTIPLIER × years × 12 months.
ExtraPaymentResult simulate_extra_payments(double principal, double annual_rate_percent,
                                           int years, const ExtraPaymentPolicy& policy);
ExtraPaymentResult simulate_extra_payments(const LoanTerms& terms,
                                           const ExtraPaymentPolicy& policy);

} // namespace finesse

#endif // FINESSE_EXTRA_PAYMENTS_HPP
