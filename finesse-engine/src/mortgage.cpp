#include "mortgage.hpp"

namespace finesse {

MortgageResult::MortgageResult()
    : loan_amount(0.0),
      monthly_principal_interest(0.0),
      monthly_property_tax(0.0),
      monthly_insurance(0.0),
      monthly_hoa(0.0),
      monthly_other(0.0),
      total_monthly(0.0),
      total_cost(0.0),
      total_interest(0.0) {}

MortgageResult compute_mortgage(const MortgageTerms& terms) {
    MortgageResult result;
    result.loan_amount = terms.loan_amount();

    PaymentResult loan = compute_payment(result.loan_amount, terms.annual_rate_percent, terms.years);
    result.monthly_principal_interest = loan.monthly_payment;
    result.total_interest = loan.total_interest;

    result.monthly_property_tax = terms.annual_property_tax / 12.0;
    result.monthly_insurance = terms.annual_insurance / 12.0;
    result.monthly_hoa = terms.monthly_hoa;

    for (const auto& cost : terms.custom_costs) {
        result.monthly_other += cost.monthly_amount(terms.home_price);
    }

    result.total_monthly = result.monthly_principal_interest + result.monthly_property_tax +
                           result.monthly_insurance + result.monthly_hoa + result.monthly_other;

    const int months = term_in_range(terms.years) ? terms.years * 12 : 0;
    result.total_cost = result.total_monthly * months;

    if (result.loan_amount > 0.0) {
        result.first_month = first_month_breakdown(result.loan_amount, terms.annual_rate_percent,
                                                   result.monthly_principal_interest);
    }
    return result;
}

} // namespace finesse
