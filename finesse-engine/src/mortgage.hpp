#ifndef FINESSE_MORTGAGE_HPP
#define FINESSE_MORTGAGE_HPP

#include "loan_terms.hpp"
#include "amortization.hpp"

namespace finesse {

// Monthly cost of ownership for a mortgaged home
struct MortgageResult {
    double loan_amount;
    double monthly_principal_interest;
    double monthly_property_tax;
    double monthly_insurance;
    double monthly_hoa;
    double monthly_other;           // Sum of custom costs
    double total_monthly;
    double total_cost;              // total_monthly × years × 12
    double total_interest;          // Interest over the life of the loan
    PaymentBreakdown first_month;   // Interest/principal split of the first payment

    MortgageResult();
};

// Mortgage costs:
// - loan amount = home price - down payment, amortized with compute_payment
// - tax and insurance are annual inputs spread over 12 months
// - HOA is monthly
// - custom costs are converted with CustomCost::monthly_amount
MortgageResult compute_mortgage(const MortgageTerms& terms);

} // namespace finesse

#endif // FINESSE_MORTGAGE_HPP
