#ifndef FINESSE_IO_FORMAT_HPP
#define FINESSE_IO_FORMAT_HPP

#include <ctime>
#include <string>

namespace finesse {
namespace io {

// Money with grouped thousands, rounded half away from zero:
//   format_currency(1234.5)           -> "$1,235"
//   format_currency(1234.5, "USD", 2) -> "$1,234.50"
//   format_currency(-80, "EUR")       -> "-EUR 80"
// USD is written with a "$" prefix, any other code as "<CODE> ".
std::string format_currency(double value, const std::string& currency = "USD", int decimals = 0);

// format_currency with 2 decimals
std::string format_currency_precise(double value, const std::string& currency = "USD");

// Number with up to `max_decimals` decimals, trailing zeros dropped: 6.5 -> "6.5"
std::string format_number(double value, int max_decimals = 4);

// Percentage of an already-scaled value: 6.5 -> "6.5%"
std::string format_percent(double percent);

// Thread-safe local time conversion
std::tm to_local_time(std::time_t when);

// Today's date as YYYY-MM-DD (local time)
std::string current_date();

} // namespace io
} // namespace finesse

#endif // FINESSE_IO_FORMAT_HPP
