#ifndef FINESSE_INVESTMENT_HPP
#define FINESSE_INVESTMENT_HPP

#include "loan_terms.hpp"
#include <vector>

namespace finesse {

struct InvestmentResult {
    double future_value;
    double total_contributions;     // initial + monthly × months
    double total_interest;          // future_value - total_contributions

    InvestmentResult();
};

// Projected balance at a given year
struct GrowthMilestone {
    int year;
    double value;
};

// Closed-form future value of an initial balance compounded monthly plus an
// ordinary annuity of monthly contributions. Agrees with the last row of
// generate_investment_schedule for the same inputs.
InvestmentResult compute_investment_growth(double initial, double monthly_contribution,
                                           double annual_rate_percent, int years);
InvestmentResult compute_investment_growth(const InvestmentTerms& terms);

// Years checked for milestones, in order
const std::vector<int>& milestone_years();

// Maximum number of milestones returned
constexpr size_t MAX_MILESTONES = 4;

// Future values at the standard milestone years within the horizon, followed by
// the horizon itself when it is not one of them; at most MAX_MILESTONES points.
std::vector<GrowthMilestone> compute_milestones(double initial, double monthly_contribution,
                                                double annual_rate_percent, int years);

} // namespace finesse

#endif // FINESSE_INVESTMENT_HPP
