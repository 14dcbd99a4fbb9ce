#ifndef FINESSE_IO_JSON_WRITER_HPP
#define FINESSE_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../report.hpp"

namespace finesse {
namespace io {

// Write a LoanReport as JSON: inputs, the result of the selected repayment
// type, the first-month split, the extra payment comparison and the schedule
void write_loan_report_json(std::ostream& os, const LoanReport& report,
                            bool pretty_print = true);

// Write a LoanReport to a JSON file
void write_loan_report_json(const std::string& filepath, const LoanReport& report,
                            bool pretty_print = true);

void write_mortgage_report_json(std::ostream& os, const MortgageReport& report,
                                bool pretty_print = true);
void write_mortgage_report_json(const std::string& filepath, const MortgageReport& report,
                                bool pretty_print = true);

void write_investment_report_json(std::ostream& os, const InvestmentReport& report,
                                  bool pretty_print = true);
void write_investment_report_json(const std::string& filepath, const InvestmentReport& report,
                                  bool pretty_print = true);

} // namespace io
} // namespace finesse

#endif // FINESSE_IO_JSON_WRITER_HPP
