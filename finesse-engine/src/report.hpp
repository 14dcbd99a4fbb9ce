#ifndef FINESSE_REPORT_HPP
#define FINESSE_REPORT_HPP

#include "loan_terms.hpp"
#include "amortization.hpp"
#include "extra_payments.hpp"
#include "schedule.hpp"
#include "investment.hpp"
#include "mortgage.hpp"
#include <string>
#include <vector>

namespace finesse {

struct ReportOptions {
    bool include_schedule;
    PeriodType period;
    std::string currency;           // ISO code the amounts are expressed in

    ReportOptions();
};

// Everything a loan calculation produces, ready for export
struct LoanReport {
    LoanTerms terms;
    RepaymentType repayment;
    GracePolicy grace;
    ExtraPaymentPolicy extra;
    std::string currency;

    // Headline figures of the selected repayment type
    double monthly_payment;
    double total_payment;
    double total_interest;

    GraceResult standard;
    BalloonResult balloon;
    BulletResult bullet;

    // Standard repayment only
    bool has_first_month;
    PaymentBreakdown first_month;
    bool has_extra_payments;
    ExtraPaymentResult extra_result;

    PeriodType period;
    std::vector<AmortizationRow> schedule;
    bool converged;

    LoanReport();
};

struct MortgageReport {
    MortgageTerms terms;
    MortgageResult result;
    std::string currency;
    PeriodType period;
    std::vector<AmortizationRow> schedule;

    MortgageReport();
};

struct InvestmentReport {
    InvestmentTerms terms;
    InvestmentResult result;
    std::string currency;
    std::vector<GrowthMilestone> milestones;
    std::vector<InvestmentGrowthRow> schedule;

    InvestmentReport();
};

// Loan report. Standard repayment amortizes principal_after_grace over the
// full term after any grace phase; the extra payment policy applies to that
// phase. Balloon and bullet loans have no schedule.
LoanReport build_loan_report(const LoanTerms& terms,
                             RepaymentType repayment,
                             const GracePolicy& grace,
                             const ExtraPaymentPolicy& extra,
                             const ReportOptions& options = ReportOptions());

MortgageReport build_mortgage_report(const MortgageTerms& terms,
                                     const ReportOptions& options = ReportOptions());

InvestmentReport build_investment_report(const InvestmentTerms& terms,
                                         const ReportOptions& options = ReportOptions());

// Multiply every money amount by `rate` and relabel the report in `currency`.
// Rates, terms in years, percentages and month counts are left alone.
void apply_exchange_rate(LoanReport& report, double rate, const std::string& currency);
void apply_exchange_rate(MortgageReport& report, double rate, const std::string& currency);
void apply_exchange_rate(InvestmentReport& report, double rate, const std::string& currency);

} // namespace finesse

#endif // FINESSE_REPORT_HPP
