#include "loan_terms.hpp"
#include <stdexcept>

namespace finesse {

// ============================================================================
// Enum names
// ============================================================================

std::string to_string(GraceKind kind) {
    switch (kind) {
        case GraceKind::None: return "none";
        case GraceKind::InterestOnly: return "interest_only";
        case GraceKind::NoPayment: return "no_payment";
    }
    return "none";
}

std::string to_string(ExtraPaymentKind kind) {
    switch (kind) {
        case ExtraPaymentKind::None: return "none";
        case ExtraPaymentKind::ExtraMonthly: return "extra_monthly";
        case ExtraPaymentKind::ExtraYearly: return "extra_yearly";
        case ExtraPaymentKind::Biweekly: return "biweekly";
    }
    return "none";
}

std::string to_string(PeriodType period) {
    return period == PeriodType::Monthly ? "monthly" : "yearly";
}

std::string to_string(RepaymentType type) {
    switch (type) {
        case RepaymentType::Standard: return "standard";
        case RepaymentType::Balloon: return "balloon";
        case RepaymentType::Bullet: return "bullet";
    }
    return "standard";
}

GraceKind parse_grace_kind(const std::string& name) {
    if (name == "none") return GraceKind::None;
    if (name == "interest_only") return GraceKind::InterestOnly;
    if (name == "no_payment") return GraceKind::NoPayment;
    throw std::invalid_argument("Unknown grace period type: " + name);
}

ExtraPaymentKind parse_extra_payment_kind(const std::string& name) {
    if (name == "none") return ExtraPaymentKind::None;
    if (name == "extra_monthly") return ExtraPaymentKind::ExtraMonthly;
    if (name == "extra_yearly") return ExtraPaymentKind::ExtraYearly;
    if (name == "biweekly") return ExtraPaymentKind::Biweekly;
    throw std::invalid_argument("Unknown extra payment type: " + name);
}

PeriodType parse_period_type(const std::string& name) {
    if (name == "monthly") return PeriodType::Monthly;
    if (name == "yearly") return PeriodType::Yearly;
    throw std::invalid_argument("Unknown schedule period: " + name);
}

RepaymentType parse_repayment_type(const std::string& name) {
    if (name == "standard") return RepaymentType::Standard;
    if (name == "balloon") return RepaymentType::Balloon;
    if (name == "bullet") return RepaymentType::Bullet;
    throw std::invalid_argument("Unknown repayment type: " + name);
}

// ============================================================================
// Terms
// ============================================================================

LoanTerms::LoanTerms() : principal(0.0), annual_rate_percent(0.0), years(0) {}

LoanTerms::LoanTerms(double principal_, double annual_rate_percent_, int years_)
    : principal(principal_), annual_rate_percent(annual_rate_percent_), years(years_) {}

GracePolicy::GracePolicy() : kind(GraceKind::None), months(0) {}

GracePolicy::GracePolicy(GraceKind kind_, int months_)
    : kind(kind_), months(kind_ == GraceKind::None ? 0 : months_) {}

ExtraPaymentPolicy::ExtraPaymentPolicy()
    : kind(ExtraPaymentKind::None),
      extra_monthly(0.0),
      extra_yearly_amount(0.0),
      extra_yearly_month(1) {}

ExtraPaymentPolicy ExtraPaymentPolicy::none() {
    return ExtraPaymentPolicy();
}

ExtraPaymentPolicy ExtraPaymentPolicy::monthly(double amount) {
    ExtraPaymentPolicy policy;
    policy.kind = ExtraPaymentKind::ExtraMonthly;
    policy.extra_monthly = amount;
    return policy;
}

ExtraPaymentPolicy ExtraPaymentPolicy::yearly(double amount, int month) {
    ExtraPaymentPolicy policy;
    policy.kind = ExtraPaymentKind::ExtraYearly;
    policy.extra_yearly_amount = amount;
    policy.extra_yearly_month = month;
    return policy;
}

ExtraPaymentPolicy ExtraPaymentPolicy::biweekly() {
    ExtraPaymentPolicy policy;
    policy.kind = ExtraPaymentKind::Biweekly;
    return policy;
}

InvestmentTerms::InvestmentTerms()
    : initial(0.0), monthly_contribution(0.0), annual_rate_percent(0.0), years(0) {}

InvestmentTerms::InvestmentTerms(double initial_, double monthly_contribution_,
                                 double annual_rate_percent_, int years_)
    : initial(initial_),
      monthly_contribution(monthly_contribution_),
      annual_rate_percent(annual_rate_percent_),
      years(years_) {}

// ============================================================================
// Mortgage inputs
// ============================================================================

CustomCost::CustomCost()
    : value(0.0), mode(CostMode::Dollar), frequency(CostFrequency::Monthly) {}

CustomCost::CustomCost(const std::string& name_, double value_, CostMode mode_,
                       CostFrequency frequency_)
    : name(name_), value(value_), mode(mode_), frequency(frequency_) {}

double CustomCost::monthly_amount(double home_price) const {
    if (mode == CostMode::Percent) {
        return (value / 100.0) * home_price / 12.0;
    }
    return frequency == CostFrequency::Yearly ? value / 12.0 : value;
}

MortgageTerms::MortgageTerms()
    : home_price(0.0),
      down_payment(0.0),
      annual_rate_percent(0.0),
      years(0),
      annual_property_tax(0.0),
      annual_insurance(0.0),
      monthly_hoa(0.0) {}

double down_payment_from_percent(double home_price, double percent) {
    return (percent / 100.0) * home_price;
}

double down_payment_percent(double home_price, double down_payment) {
    return home_price > 0.0 ? (down_payment / home_price) * 100.0 : 0.0;
}

double property_tax_from_percent(double home_price, double percent) {
    return (percent / 100.0) * home_price;
}

} // namespace finesse
