#include "json_writer.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace finesse {
namespace io {

namespace {

// Layout strings shared by every writer; empty when not pretty printing
struct Layout {
    std::string indent;
    std::string newline;
    std::string space;

    explicit Layout(bool pretty)
        : indent(pretty ? "  " : ""),
          newline(pretty ? "\n" : ""),
          space(pretty ? " " : "") {}

    std::string at(int depth) const {
        std::string s;
        for (int i = 0; i < depth; ++i) s += indent;
        return s;
    }
};

std::string quote(const std::string& str) {
    std::ostringstream oss;
    oss << '"';
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    oss << '"';
    return oss.str();
}

// Writes "key": value pairs at one depth, handling the separating commas
class ObjectWriter {
public:
    ObjectWriter(std::ostream& os, const Layout& layout, int depth)
        : os_(os), layout_(layout), depth_(depth), first_(true) {}

    template <typename T>
    void field(const std::string& key, const T& value) {
        open(key);
        os_ << value;
    }

    void string_field(const std::string& key, const std::string& value) {
        open(key);
        os_ << quote(value);
    }

    void bool_field(const std::string& key, bool value) {
        open(key);
        os_ << (value ? "true" : "false");
    }

    // Starts a nested value; the caller writes it
    void open(const std::string& key) {
        if (!first_) os_ << ",";
        os_ << layout_.newline << layout_.at(depth_) << quote(key) << ":" << layout_.space;
        first_ = false;
    }

    void close() {
        os_ << layout_.newline << layout_.at(depth_ - 1) << "}";
    }

private:
    std::ostream& os_;
    const Layout& layout_;
    int depth_;
    bool first_;
};

void write_amortization_schedule(std::ostream& os, const Layout& layout, int depth,
                                 const std::vector<AmortizationRow>& rows) {
    os << "[";
    for (size_t i = 0; i < rows.size(); ++i) {
        const AmortizationRow& row = rows[i];
        if (i > 0) os << ",";
        os << layout.newline << layout.at(depth + 1) << "{"
           << "\"period\":" << layout.space << row.period << "," << layout.space
           << "\"payment\":" << layout.space << row.payment << "," << layout.space
           << "\"principal\":" << layout.space << row.principal << "," << layout.space
           << "\"interest\":" << layout.space << row.interest << "," << layout.space
           << "\"balance\":" << layout.space << row.balance << "," << layout.space
           << "\"total_principal\":" << layout.space << row.total_principal << "," << layout.space
           << "\"total_interest\":" << layout.space << row.total_interest << "}";
    }
    if (!rows.empty()) os << layout.newline << layout.at(depth);
    os << "]";
}

void write_breakdown(std::ostream& os, const Layout& layout, int depth, const PaymentBreakdown& b) {
    os << "{";
    ObjectWriter w(os, layout, depth + 1);
    w.field("interest", b.interest);
    w.field("principal", b.principal);
    w.field("interest_percent", b.interest_percent);
    w.field("principal_percent", b.principal_percent);
    w.close();
}

template <typename Report, typename Writer>
void write_to_file(const std::string& filepath, const Report& report, bool pretty_print, Writer writer) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    writer(file, report, pretty_print);
}

} // anonymous namespace

// ============================================================================
// Loan
// ============================================================================

void write_loan_report_json(std::ostream& os, const LoanReport& report, bool pretty_print) {
    const Layout layout(pretty_print);
    os << std::fixed << std::setprecision(6);

    os << "{";
    ObjectWriter root(os, layout, 1);
    root.string_field("calculator", "loan");
    root.string_field("currency", report.currency);

    root.open("inputs");
    os << "{";
    {
        ObjectWriter in(os, layout, 2);
        in.field("principal", report.terms.principal);
        in.field("annual_rate_percent", report.terms.annual_rate_percent);
        in.field("years", report.terms.years);
        in.string_field("repayment", to_string(report.repayment));
        in.string_field("grace_type", to_string(report.grace.kind));
        in.field("grace_months", report.grace.months);
        in.string_field("extra_type", to_string(report.extra.kind));
        in.field("extra_monthly", report.extra.extra_monthly);
        in.field("extra_yearly_amount", report.extra.extra_yearly_amount);
        in.field("extra_yearly_month", report.extra.extra_yearly_month);
        in.close();
    }

    root.open("result");
    os << "{";
    {
        ObjectWriter res(os, layout, 2);
        res.field("monthly_payment", report.monthly_payment);
        res.field("total_payment", report.total_payment);
        res.field("total_interest", report.total_interest);
        switch (report.repayment) {
            case RepaymentType::Balloon:
                res.field("balloon_payment", report.balloon.balloon_payment);
                break;
            case RepaymentType::Bullet:
                res.field("final_payment", report.bullet.final_payment);
                break;
            case RepaymentType::Standard:
                res.field("grace_payment", report.standard.grace_payment);
                res.field("principal_after_grace", report.standard.principal_after_grace);
                res.field("grace_interest", report.standard.grace_interest);
                break;
        }
        res.close();
    }

    if (report.has_first_month) {
        root.open("first_month");
        write_breakdown(os, layout, 1, report.first_month);
    }

    if (report.has_extra_payments) {
        const ExtraPaymentResult& e = report.extra_result;
        root.open("extra_payments");
        os << "{";
        ObjectWriter ex(os, layout, 2);
        ex.field("standard_monthly_payment", e.standard_monthly_payment);
        ex.field("standard_total_payment", e.standard_total_payment);
        ex.field("standard_total_interest", e.standard_total_interest);
        ex.field("standard_months", e.standard_months);
        ex.field("actual_months", e.actual_months);
        ex.field("actual_total_payment", e.actual_total_payment);
        ex.field("actual_total_interest", e.actual_total_interest);
        ex.field("months_saved", e.months_saved);
        ex.field("interest_saved", e.interest_saved);
        ex.field("effective_monthly_payment", e.effective_monthly_payment);
        ex.bool_field("converged", e.converged);
        ex.field("remaining_balance", e.remaining_balance);
        ex.close();
    }

    root.bool_field("converged", report.converged);
    root.string_field("schedule_period", to_string(report.period));
    root.open("schedule");
    write_amortization_schedule(os, layout, 1, report.schedule);
    root.close();
    os << layout.newline;
}

void write_loan_report_json(const std::string& filepath, const LoanReport& report, bool pretty_print) {
    write_to_file(filepath, report, pretty_print,
                  [](std::ostream& os, const LoanReport& r, bool p) { write_loan_report_json(os, r, p); });
}

// ============================================================================
// Mortgage
// ============================================================================

void write_mortgage_report_json(std::ostream& os, const MortgageReport& report, bool pretty_print) {
    const Layout layout(pretty_print);
    const MortgageTerms& t = report.terms;
    const MortgageResult& r = report.result;
    os << std::fixed << std::setprecision(6);

    os << "{";
    ObjectWriter root(os, layout, 1);
    root.string_field("calculator", "mortgage");
    root.string_field("currency", report.currency);

    root.open("inputs");
    os << "{";
    {
        ObjectWriter in(os, layout, 2);
        in.field("home_price", t.home_price);
        in.field("down_payment", t.down_payment);
        in.field("down_payment_percent", down_payment_percent(t.home_price, t.down_payment));
        in.field("annual_rate_percent", t.annual_rate_percent);
        in.field("years", t.years);
        in.field("annual_property_tax", t.annual_property_tax);
        in.field("annual_insurance", t.annual_insurance);
        in.field("monthly_hoa", t.monthly_hoa);

        in.open("custom_costs");
        os << "[";
        for (size_t i = 0; i < t.custom_costs.size(); ++i) {
            const CustomCost& cost = t.custom_costs[i];
            if (i > 0) os << ",";
            os << layout.newline << layout.at(3) << "{"
               << "\"name\":" << layout.space << quote(cost.name) << "," << layout.space
               << "\"value\":" << layout.space << cost.value << "," << layout.space
               << "\"mode\":" << layout.space
               << (cost.mode == CostMode::Percent ? "\"percent\"" : "\"dollar\"") << "," << layout.space
               << "\"frequency\":" << layout.space
               << (cost.frequency == CostFrequency::Yearly ? "\"yearly\"" : "\"monthly\"") << ","
               << layout.space
               << "\"monthly_amount\":" << layout.space << cost.monthly_amount(t.home_price) << "}";
        }
        if (!t.custom_costs.empty()) os << layout.newline << layout.at(2);
        os << "]";
        in.close();
    }

    root.open("result");
    os << "{";
    {
        ObjectWriter res(os, layout, 2);
        res.field("loan_amount", r.loan_amount);
        res.field("monthly_principal_interest", r.monthly_principal_interest);
        res.field("monthly_property_tax", r.monthly_property_tax);
        res.field("monthly_insurance", r.monthly_insurance);
        res.field("monthly_hoa", r.monthly_hoa);
        res.field("monthly_other", r.monthly_other);
        res.field("total_monthly", r.total_monthly);
        res.field("total_cost", r.total_cost);
        res.field("total_interest", r.total_interest);
        res.open("first_month");
        write_breakdown(os, layout, 2, r.first_month);
        res.close();
    }

    root.string_field("schedule_period", to_string(report.period));
    root.open("schedule");
    write_amortization_schedule(os, layout, 1, report.schedule);
    root.close();
    os << layout.newline;
}

void write_mortgage_report_json(const std::string& filepath, const MortgageReport& report, bool pretty_print) {
    write_to_file(filepath, report, pretty_print,
                  [](std::ostream& os, const MortgageReport& r, bool p) { write_mortgage_report_json(os, r, p); });
}

// ============================================================================
// Investment
// ============================================================================

void write_investment_report_json(std::ostream& os, const InvestmentReport& report, bool pretty_print) {
    const Layout layout(pretty_print);
    os << std::fixed << std::setprecision(6);

    os << "{";
    ObjectWriter root(os, layout, 1);
    root.string_field("calculator", "investment");
    root.string_field("currency", report.currency);

    root.open("inputs");
    os << "{";
    {
        ObjectWriter in(os, layout, 2);
        in.field("initial", report.terms.initial);
        in.field("monthly_contribution", report.terms.monthly_contribution);
        in.field("annual_rate_percent", report.terms.annual_rate_percent);
        in.field("years", report.terms.years);
        in.close();
    }

    root.open("result");
    os << "{";
    {
        ObjectWriter res(os, layout, 2);
        res.field("future_value", report.result.future_value);
        res.field("total_contributions", report.result.total_contributions);
        res.field("total_interest", report.result.total_interest);
        res.close();
    }

    root.open("milestones");
    os << "[";
    for (size_t i = 0; i < report.milestones.size(); ++i) {
        if (i > 0) os << ",";
        os << layout.newline << layout.at(2) << "{\"year\":" << layout.space << report.milestones[i].year
           << "," << layout.space << "\"value\":" << layout.space << report.milestones[i].value << "}";
    }
    if (!report.milestones.empty()) os << layout.newline << layout.at(1);
    os << "]";

    root.open("schedule");
    os << "[";
    for (size_t i = 0; i < report.schedule.size(); ++i) {
        const InvestmentGrowthRow& row = report.schedule[i];
        if (i > 0) os << ",";
        os << layout.newline << layout.at(2) << "{"
           << "\"year\":" << layout.space << row.year << "," << layout.space
           << "\"contributions\":" << layout.space << row.contributions << "," << layout.space
           << "\"interest\":" << layout.space << row.interest << "," << layout.space
           << "\"balance\":" << layout.space << row.balance << "}";
    }
    if (!report.schedule.empty()) os << layout.newline << layout.at(1);
    os << "]";

    root.close();
    os << layout.newline;
}

void write_investment_report_json(const std::string& filepath, const InvestmentReport& report,
                                  bool pretty_print) {
    write_to_file(filepath, report, pretty_print,
                  [](std::ostream& os, const InvestmentReport& r, bool p) {
                      write_investment_report_json(os, r, p);
                  });
}

} // namespace io
} // namespace finesse
