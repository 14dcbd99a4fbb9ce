#ifndef FINESSE_AMORTIZATION_HPP
#define FINESSE_AMORTIZATION_HPP

#include "loan_terms.hpp"

namespace finesse {

// Fixed payment and totals for a fully amortizing loan
struct PaymentResult {
    double monthly_payment;
    double total_payment;           // monthly_payment × payment count
    double total_interest;          // total_payment - principal

    PaymentResult();
    PaymentResult(double monthly, double total, double interest);
};

// Standard amortization preceded by a grace phase
struct GraceResult {
    double monthly_payment;         // Payment during the amortization phase
    double total_payment;           // Grace-phase payments + amortization payments
    double total_interest;          // total_payment - original principal
    double grace_payment;           // Monthly payment during the grace phase
    double principal_after_grace;   // Balance entering the amortization phase
    double grace_interest;          // Interest paid or capitalized during grace

    GraceResult();
};

// Interest-only loan, principal due at maturity
struct BalloonResult {
    double monthly_payment;
    double balloon_payment;
    double total_payment;
    double total_interest;

    BalloonResult();
};

// No periodic payments, compounded balance due at maturity
struct BulletResult {
    double monthly_payment;         // Always 0
    double final_payment;
    double total_payment;
    double total_interest;

    BulletResult();
};

// Split of the first scheduled payment
struct PaymentBreakdown {
    double interest;
    double principal;
    double interest_percent;
    double principal_percent;

    PaymentBreakdown();
};

// Annuity payment for `principal` over `payment_count` months at
// `rate` per month. A zero rate divides the principal evenly.
double annuity_payment(double principal, double rate, int payment_count);

// Standard amortization.
// principal <= 0 or years outside 1..MAX_TERM_YEARS yields the zero result.
PaymentResult compute_payment(double principal, double annual_rate_percent, int years);
PaymentResult compute_payment(const LoanTerms& terms);

// Amortization with an initial grace phase.
//
// - None (or 0 months): same as compute_payment, principal_after_grace = principal
// - NoPayment: interest capitalizes monthly, principal_after_grace = P(1+r)^g
// - InterestOnly: pays P×r each grace month, principal unchanged
//
// In both grace kinds the amortization phase runs over the full years×12
// months, so the loan lives years×12 + grace_months months in total.
GraceResult compute_with_grace(double principal, double annual_rate_percent, int years,
                               int grace_months, GraceKind kind);
GraceResult compute_with_grace(const LoanTerms& terms, const GracePolicy& grace);

BalloonResult compute_balloon(double principal, double annual_rate_percent, int years);
BalloonResult compute_balloon(const LoanTerms& terms);

BulletResult compute_bullet(double principal, double annual_rate_percent, int years);
BulletResult compute_bullet(const LoanTerms& terms);

PaymentBreakdown first_month_breakdown(double principal, double annual_rate_percent,
                                       double monthly_payment);

} // namespace finesse

#endif // FINESSE_AMORTIZATION_HPP
