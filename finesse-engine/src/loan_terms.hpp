#ifndef FINESSE_LOAN_TERMS_HPP
#define FINESSE_LOAN_TERMS_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace finesse {

enum class GraceKind : uint8_t {
    None = 0,
    InterestOnly = 1,
    NoPayment = 2
};

enum class ExtraPaymentKind : uint8_t {
    None = 0,
    ExtraMonthly = 1,
    ExtraYearly = 2,
    Biweekly = 3
};

enum class PeriodType : uint8_t {
    Monthly = 0,
    Yearly = 1
};

enum class RepaymentType : uint8_t {
    Standard = 0,
    Balloon = 1,
    Bullet = 2
};

// snake_case names, as used in request files and on the command line
std::string to_string(GraceKind kind);
std::string to_string(ExtraPaymentKind kind);
std::string to_string(PeriodType period);
std::string to_string(RepaymentType type);

// Throw std::invalid_argument on an unknown name
GraceKind parse_grace_kind(const std::string& name);
ExtraPaymentKind parse_extra_payment_kind(const std::string& name);
PeriodType parse_period_type(const std::string& name);
RepaymentType parse_repayment_type(const std::string& name);

// Longest accepted term. Longer terms are treated like a non-positive one.
constexpr int MAX_TERM_YEARS = 100;

inline bool term_in_range(int years) {
    return years > 0 && years <= MAX_TERM_YEARS;
}

// Monthly rate for an annual nominal percentage (6.5 -> 0.065 / 12)
inline double monthly_rate(double annual_rate_percent) {
    return annual_rate_percent / 100.0 / 12.0;
}

struct LoanTerms {
    double principal;               // Amount borrowed (>= 0)
    double annual_rate_percent;     // Nominal annual rate, percent (>= 0)
    int years;                      // Term in whole years (> 0)

    LoanTerms();
    LoanTerms(double principal_, double annual_rate_percent_, int years_);

    double monthly_rate() const { return finesse::monthly_rate(annual_rate_percent); }
    int payment_count() const { return term_in_range(years) ? years * 12 : 0; }
};

struct GracePolicy {
    GraceKind kind;
    int months;                     // 0 when kind == None

    GracePolicy();
    GracePolicy(GraceKind kind_, int months_);

    bool active() const { return kind != GraceKind::None && months > 0; }
};

struct ExtraPaymentPolicy {
    ExtraPaymentKind kind;
    double extra_monthly;           // Added to every payment (ExtraMonthly)
    double extra_yearly_amount;     // Added once a year (ExtraYearly)
    int extra_yearly_month;         // Calendar month 1-12 for the yearly extra

    ExtraPaymentPolicy();

    static ExtraPaymentPolicy none();
    static ExtraPaymentPolicy monthly(double amount);
    static ExtraPaymentPolicy yearly(double amount, int month);
    static ExtraPaymentPolicy biweekly();
};

struct InvestmentTerms {
    double initial;                 // Starting balance
    double monthly_contribution;    // Added at the end of every month
    double annual_rate_percent;
    int years;

    InvestmentTerms();
    InvestmentTerms(double initial_, double monthly_contribution_,
                    double annual_rate_percent_, int years_);
};

enum class CostMode : uint8_t {
    Dollar = 0,
    Percent = 1                     // Percent of home price, always annual
};

enum class CostFrequency : uint8_t {
    Monthly = 0,
    Yearly = 1
};

// Recurring housing cost beyond tax, insurance and HOA
struct CustomCost {
    std::string name;
    double value;
    CostMode mode;
    CostFrequency frequency;

    CustomCost();
    CustomCost(const std::string& name_, double value_, CostMode mode_, CostFrequency frequency_);

    double monthly_amount(double home_price) const;
};

struct MortgageTerms {
    double home_price;
    double down_payment;            // Dollars
    double annual_rate_percent;
    int years;
    double annual_property_tax;     // Dollars per year
    double annual_insurance;        // Dollars per year
    double monthly_hoa;
    std::vector<CustomCost> custom_costs;

    MortgageTerms();

    double loan_amount() const { return home_price - down_payment; }
};

// Down payment and property tax are entered either in dollars or as a
// percent of the home price
double down_payment_from_percent(double home_price, double percent);
double down_payment_percent(double home_price, double down_payment);
double property_tax_from_percent(double home_price, double percent);

} // namespace finesse

#endif // FINESSE_LOAN_TERMS_HPP
