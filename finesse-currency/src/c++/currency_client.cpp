#include "c++/currency_client.hpp"
#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <sstream>

using json = nlohmann::json;

namespace finesse {
namespace currency {

// ============================================================================
// Response parsing
// ============================================================================

std::string normalize_currency_code(const std::string& code) {
    if (code.size() != 3) {
        throw CurrencyError("Invalid currency code: '" + code + "'");
    }
    std::string upper;
    for (char c : code) {
        if (!std::isalpha(static_cast<unsigned char>(c))) {
            throw CurrencyError("Invalid currency code: '" + code + "'");
        }
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return upper;
}

double parse_rate_response(const std::string& body, const std::string& to) {
    try {
        auto j = json::parse(body);

        if (!j.contains("rates") || !j["rates"].is_object()) {
            throw CurrencyError("Invalid rate response: missing 'rates' object");
        }
        const auto& rates = j["rates"];
        if (!rates.contains(to) || !rates[to].is_number()) {
            throw CurrencyError("Invalid rate response: no rate for " + to);
        }

        double rate = rates[to].get<double>();
        if (!(rate > 0.0)) {
            throw CurrencyError("Invalid rate response: non-positive rate for " + to);
        }

        // Rates are requested for amount=1; normalize if the service echoed another amount
        if (j.contains("amount") && j["amount"].is_number()) {
            double amount = j["amount"].get<double>();
            if (amount > 0.0) {
                rate /= amount;
            }
        }
        return rate;

    } catch (const json::exception& e) {
        throw CurrencyError(std::string("Failed to parse rate response: ") + e.what());
    }
}

std::map<std::string, std::string> parse_currencies_response(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (!j.is_object()) {
            throw CurrencyError("Invalid currencies response: expected an object");
        }

        std::map<std::string, std::string> currencies;
        for (auto it = j.begin(); it != j.end(); ++it) {
            currencies[it.key()] = it.value().get<std::string>();
        }
        return currencies;

    } catch (const json::exception& e) {
        throw CurrencyError(std::string("Failed to parse currencies response: ") + e.what());
    }
}

// ============================================================================
// FrankfurterRateProvider
// ============================================================================

FrankfurterRateProvider::FrankfurterRateProvider(const std::string& base_url, int timeout_ms)
    : http_client_(std::make_unique<HttpClient>(base_url, timeout_ms))
{
}

double FrankfurterRateProvider::fetch_rate(const std::string& from, const std::string& to) {
    std::string path = "/v1/latest?amount=1&from=" + from + "&to=" + to;
    auto response = http_client_->get(path);
    return parse_rate_response(response.body, to);
}

std::map<std::string, std::string> FrankfurterRateProvider::fetch_currencies() {
    auto response = http_client_->get("/v1/currencies");
    return parse_currencies_response(response.body);
}

// ============================================================================
// CurrencyClient
// ============================================================================

CurrencyClient::CurrencyClient(std::shared_ptr<RateProvider> provider,
                               std::shared_ptr<RateCache> cache)
    : provider_(std::move(provider))
    , cache_(std::move(cache))
{
    if (!provider_) {
        throw CurrencyError("CurrencyClient requires a rate provider");
    }
    if (!cache_) {
        throw CurrencyError("CurrencyClient requires a rate cache");
    }
}

double CurrencyClient::get_exchange_rate(const std::string& from, const std::string& to) {
    const std::string src = normalize_currency_code(from);
    const std::string dst = normalize_currency_code(to);

    if (src == dst) {
        return 1.0;
    }

    double rate = 0.0;
    if (cache_->get(src, dst, rate)) {
        Logger::get_instance().log_rate_lookup(src, dst, rate, true);
        return rate;
    }

    try {
        rate = provider_->fetch_rate(src, dst);
    } catch (const CurrencyError& e) {
        throw CurrencyError("Failed to fetch exchange rate " + src + "-" + dst + ": " + e.what());
    } catch (const HttpClientError& e) {
        std::ostringstream oss;
        oss << "Failed to fetch exchange rate " << src << "-" << dst << ": " << e.what();
        if (e.status_code() != 0) {
            oss << " (HTTP " << e.status_code() << ")";
        }
        throw CurrencyError(oss.str());
    }

    if (!(rate > 0.0)) {
        throw CurrencyError("Provider returned a non-positive rate for " + src + "-" + dst);
    }

    cache_->put(src, dst, rate);
    Logger::get_instance().log_rate_lookup(src, dst, rate, false);
    return rate;
}

double CurrencyClient::convert_amount(double amount, const std::string& from, const std::string& to) {
    return amount * get_exchange_rate(from, to);
}

std::map<std::string, double> CurrencyClient::convert_amounts(
    const std::map<std::string, double>& amounts,
    const std::string& from,
    const std::string& to)
{
    const double rate = get_exchange_rate(from, to);

    std::map<std::string, double> converted;
    for (const auto& [name, amount] : amounts) {
        converted[name] = amount * rate;
    }
    return converted;
}

std::map<std::string, std::string> CurrencyClient::get_available_currencies() {
    try {
        return provider_->fetch_currencies();
    } catch (const CurrencyError& e) {
        throw CurrencyError(std::string("Failed to fetch currencies: ") + e.what());
    } catch (const HttpClientError& e) {
        throw CurrencyError(std::string("Failed to fetch currencies: ") + e.what());
    }
}

RateCacheStats CurrencyClient::get_cache_stats() const {
    return cache_->get_stats();
}

} // namespace currency
} // namespace finesse
