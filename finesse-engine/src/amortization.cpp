#include "amortization.hpp"
#include <cmath>

namespace finesse {

// ============================================================================
// Result types
// ============================================================================

PaymentResult::PaymentResult() : monthly_payment(0.0), total_payment(0.0), total_interest(0.0) {}

PaymentResult::PaymentResult(double monthly, double total, double interest)
    : monthly_payment(monthly), total_payment(total), total_interest(interest) {}

GraceResult::GraceResult()
    : monthly_payment(0.0),
      total_payment(0.0),
      total_interest(0.0),
      grace_payment(0.0),
      principal_after_grace(0.0),
      grace_interest(0.0) {}

BalloonResult::BalloonResult()
    : monthly_payment(0.0), balloon_payment(0.0), total_payment(0.0), total_interest(0.0) {}

BulletResult::BulletResult()
    : monthly_payment(0.0), final_payment(0.0), total_payment(0.0), total_interest(0.0) {}

PaymentBreakdown::PaymentBreakdown()
    : interest(0.0), principal(0.0), interest_percent(0.0), principal_percent(0.0) {}

// ============================================================================
// Standard amortization
// ============================================================================

double annuity_payment(double principal, double rate, int payment_count) {
    if (payment_count <= 0) {
        return 0.0;
    }
    if (rate == 0.0) {
        return principal / payment_count;
    }
    const double growth = std::pow(1.0 + rate, payment_count);
    return principal * (rate * growth) / (growth - 1.0);
}

PaymentResult compute_payment(double principal, double annual_rate_percent, int years) {
    if (principal <= 0.0 || !term_in_range(years)) {
        return PaymentResult();
    }

    const double rate = monthly_rate(annual_rate_percent);
    const int n = years * 12;

    if (rate == 0.0) {
        // Interest-free: exact even split, no floating residue in the totals
        return PaymentResult(principal / n, principal, 0.0);
    }

    const double monthly = annuity_payment(principal, rate, n);
    const double total = monthly * n;
    return PaymentResult(monthly, total, total - principal);
}

PaymentResult compute_payment(const LoanTerms& terms) {
    return compute_payment(terms.principal, terms.annual_rate_percent, terms.years);
}

// ============================================================================
// Grace period
// ============================================================================

GraceResult compute_with_grace(double principal, double annual_rate_percent, int years,
                               int grace_months, GraceKind kind)
{
    GraceResult result;
    if (principal <= 0.0 || !term_in_range(years)) {
        return result;
    }

    if (kind == GraceKind::None || grace_months <= 0) {
        PaymentResult standard = compute_payment(principal, annual_rate_percent, years);
        result.monthly_payment = standard.monthly_payment;
        result.total_payment = standard.total_payment;
        result.total_interest = standard.total_interest;
        result.principal_after_grace = principal;
        return result;
    }

    const double rate = monthly_rate(annual_rate_percent);
    double total_grace_payments = 0.0;

    if (kind == GraceKind::NoPayment) {
        result.principal_after_grace = principal * std::pow(1.0 + rate, grace_months);
        result.grace_interest = result.principal_after_grace - principal;
        result.grace_payment = 0.0;
    } else {
        result.grace_payment = principal * rate;
        total_grace_payments = result.grace_payment * grace_months;
        result.grace_interest = total_grace_payments;
        result.principal_after_grace = principal;
    }

    // The amortization phase always uses the full requested term
    const int n = years * 12;
    double total_regular_payments;
    if (rate == 0.0) {
        result.monthly_payment = result.principal_after_grace / n;
        total_regular_payments = result.principal_after_grace;
    } else {
        result.monthly_payment = annuity_payment(result.principal_after_grace, rate, n);
        total_regular_payments = result.monthly_payment * n;
    }

    result.total_payment = total_grace_payments + total_regular_payments;
    result.total_interest = result.total_payment - principal;
    return result;
}

GraceResult compute_with_grace(const LoanTerms& terms, const GracePolicy& grace) {
    return compute_with_grace(terms.principal, terms.annual_rate_percent, terms.years,
                              grace.months, grace.kind);
}

// ============================================================================
// Balloon and bullet
// ============================================================================

BalloonResult compute_balloon(double principal, double annual_rate_percent, int years) {
    BalloonResult result;
    if (principal <= 0.0 || !term_in_range(years)) {
        return result;
    }

    const int months = years * 12;
    result.monthly_payment = principal * monthly_rate(annual_rate_percent);
    result.balloon_payment = principal;
    result.total_interest = result.monthly_payment * months;
    result.total_payment = result.total_interest + result.balloon_payment;
    return result;
}

BalloonResult compute_balloon(const LoanTerms& terms) {
    return compute_balloon(terms.principal, terms.annual_rate_percent, terms.years);
}

BulletResult compute_bullet(double principal, double annual_rate_percent, int years) {
    BulletResult result;
    if (principal <= 0.0 || !term_in_range(years)) {
        return result;
    }

    const int months = years * 12;
    result.final_payment = principal * std::pow(1.0 + monthly_rate(annual_rate_percent), months);
    result.total_interest = result.final_payment - principal;
    result.total_payment = result.final_payment;
    return result;
}

BulletResult compute_bullet(const LoanTerms& terms) {
    return compute_bullet(terms.principal, terms.annual_rate_percent, terms.years);
}

PaymentBreakdown first_month_breakdown(double principal, double annual_rate_percent,
                                       double monthly_payment)
{
    PaymentBreakdown breakdown;
    breakdown.interest = principal * monthly_rate(annual_rate_percent);
    breakdown.principal = monthly_payment - breakdown.interest;
    if (monthly_payment > 0.0) {
        breakdown.interest_percent = breakdown.interest / monthly_payment * 100.0;
        breakdown.principal_percent = breakdown.principal / monthly_payment * 100.0;
    }
    return breakdown;
}

} // namespace finesse
