#include "format.hpp"
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace finesse {
namespace io {

namespace {

std::string group_thousands(const std::string& digits) {
    std::string grouped;
    const size_t n = digits.size();
    for (size_t i = 0; i < n; ++i) {
        grouped += digits[i];
        const size_t remaining = n - i - 1;
        if (remaining > 0 && remaining % 3 == 0) {
            grouped += ',';
        }
    }
    return grouped;
}

} // anonymous namespace

std::string format_currency(double value, const std::string& currency, int decimals) {
    if (decimals < 0) decimals = 0;

    const double scale = std::pow(10.0, decimals);
    const double scaled = std::round(std::fabs(value) * scale);

    // Split the rounded magnitude into whole units and the fractional digits
    const double whole = std::floor(scaled / scale);
    const double fraction = scaled - whole * scale;

    std::ostringstream whole_stream;
    whole_stream << std::fixed << std::setprecision(0) << whole;

    std::ostringstream oss;
    if (value < 0.0 && scaled > 0.0) {
        oss << '-';
    }
    if (currency == "USD") {
        oss << '$';
    } else {
        oss << currency << ' ';
    }
    oss << group_thousands(whole_stream.str());
    if (decimals > 0) {
        oss << '.' << std::setw(decimals) << std::setfill('0')
            << std::fixed << std::setprecision(0) << fraction;
    }
    return oss.str();
}

std::string format_currency_precise(double value, const std::string& currency) {
    return format_currency(value, currency, 2);
}

std::string format_number(double value, int max_decimals) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(max_decimals) << value;
    std::string s = oss.str();
    if (s.find('.') != std::string::npos) {
        while (!s.empty() && s.back() == '0') s.pop_back();
        if (!s.empty() && s.back() == '.') s.pop_back();
    }
    if (s == "-0") s = "0";
    return s;
}

std::string format_percent(double percent) {
    return format_number(percent) + "%";
}

std::tm to_local_time(std::time_t when) {
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &when);
#else
    localtime_r(&when, &local);
#endif
    return local;
}

std::string current_date() {
    const std::tm local = to_local_time(
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d");
    return oss.str();
}

} // namespace io
} // namespace finesse
