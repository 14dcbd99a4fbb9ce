#include "investment.hpp"
#include <cmath>

namespace finesse {

InvestmentResult::InvestmentResult()
    : future_value(0.0), total_contributions(0.0), total_interest(0.0) {}

InvestmentResult compute_investment_growth(double initial, double monthly_contribution,
                                           double annual_rate_percent, int years)
{
    InvestmentResult result;
    const double rate = monthly_rate(annual_rate_percent);
    const int months = term_in_range(years) ? years * 12 : 0;

    const double growth = std::pow(1.0 + rate, months);
    const double fv_initial = initial * growth;

    double fv_contributions;
    if (rate > 0.0) {
        fv_contributions = monthly_contribution * ((growth - 1.0) / rate);
    } else {
        fv_contributions = monthly_contribution * months;
    }

    result.future_value = fv_initial + fv_contributions;
    result.total_contributions = initial + monthly_contribution * months;
    result.total_interest = result.future_value - result.total_contributions;
    return result;
}

InvestmentResult compute_investment_growth(const InvestmentTerms& terms) {
    return compute_investment_growth(terms.initial, terms.monthly_contribution,
                                     terms.annual_rate_percent, terms.years);
}

const std::vector<int>& milestone_years() {
    static const std::vector<int> years = {5, 10, 15, 20, 25, 30, 40, 50};
    return years;
}

std::vector<GrowthMilestone> compute_milestones(double initial, double monthly_contribution,
                                                double annual_rate_percent, int years)
{
    std::vector<GrowthMilestone> points;
    if (!term_in_range(years)) {
        return points;
    }
    bool horizon_listed = false;

    for (int year : milestone_years()) {
        if (year > years) {
            break;
        }
        InvestmentResult result =
            compute_investment_growth(initial, monthly_contribution, annual_rate_percent, year);
        points.push_back(GrowthMilestone{year, result.future_value});
        horizon_listed = horizon_listed || year == years;
    }

    if (!horizon_listed) {
        InvestmentResult result =
            compute_investment_growth(initial, monthly_contribution, annual_rate_percent, years);
        points.push_back(GrowthMilestone{years, result.future_value});
    }

    if (points.size() > MAX_MILESTONES) {
        points.resize(MAX_MILESTONES);
    }
    return points;
}

} // namespace finesse
