#ifndef FINESSE_IO_CSV_WRITER_HPP
#define FINESSE_IO_CSV_WRITER_HPP

#include <ostream>
#include <string>
#include "../report.hpp"
#include "format.hpp"

namespace finesse {
namespace io {

// Quote a cell that contains a comma, quote or newline; internal quotes are doubled
std::string escape_csv(const std::string& value);

// Sectioned CSV exports: title, "Generated,<date>", input details, results and
// (when present) the schedule. Money is formatted in the report's currency.
// `generated` defaults to today's date.
void write_loan_csv(std::ostream& os, const LoanReport& report,
                    const std::string& generated = current_date());
void write_mortgage_csv(std::ostream& os, const MortgageReport& report,
                        const std::string& generated = current_date());
void write_investment_csv(std::ostream& os, const InvestmentReport& report,
                          const std::string& generated = current_date());

// File variants; throw std::runtime_error if the file cannot be opened
void write_loan_csv(const std::string& filepath, const LoanReport& report);
void write_mortgage_csv(const std::string& filepath, const MortgageReport& report);
void write_investment_csv(const std::string& filepath, const InvestmentReport& report);

} // namespace io
} // namespace finesse

#endif // FINESSE_IO_CSV_WRITER_HPP
