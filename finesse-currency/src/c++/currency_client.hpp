#pragma once

#include "api/http_client.hpp"
#include "cache/rate_cache.hpp"
#include <string>
#include <map>
#include <memory>
#include <stdexcept>

namespace finesse {
namespace currency {

/**
 * Currency client error
 *
 * Raised for every failed conversion. There is no fallback rate.
 */
class CurrencyError : public std::runtime_error {
public:
    explicit CurrencyError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Source of exchange rates
 */
class RateProvider {
public:
    virtual ~RateProvider() = default;

    /**
     * Units of `to` per one unit of `from`
     * @throws CurrencyError (or HttpClientError) on failure
     */
    virtual double fetch_rate(const std::string& from, const std::string& to) = 0;

    /**
     * Supported currencies, code -> display name
     */
    virtual std::map<std::string, std::string> fetch_currencies() = 0;
};

/**
 * Rate provider backed by the Frankfurter API (ECB reference rates)
 *
 *   GET /v1/latest?amount=1&from=USD&to=EUR -> {"amount":1,"base":"USD","date":"...","rates":{"EUR":0.92}}
 *   GET /v1/currencies                      -> {"EUR":"Euro","USD":"United States Dollar",...}
 */
class FrankfurterRateProvider : public RateProvider {
public:
    static constexpr const char* DEFAULT_URL = "https://api.frankfurter.dev";

    explicit FrankfurterRateProvider(const std::string& base_url = DEFAULT_URL,
                                     int timeout_ms = 30000);

    double fetch_rate(const std::string& from, const std::string& to) override;
    std::map<std::string, std::string> fetch_currencies() override;

private:
    std::unique_ptr<HttpClient> http_client_;
};

/**
 * Extract the `to` rate from a /latest response body
 * @throws CurrencyError if the body is not JSON or has no positive rate for `to`
 */
double parse_rate_response(const std::string& body, const std::string& to);

/**
 * Parse a /currencies response body
 * @throws CurrencyError if the body is not a JSON object of strings
 */
std::map<std::string, std::string> parse_currencies_response(const std::string& body);

/**
 * Normalize a currency code to upper case
 * @throws CurrencyError unless the code is three letters
 */
std::string normalize_currency_code(const std::string& code);

/**
 * Currency conversion with an injected rate cache
 *
 * Lookup order: identical codes (rate 1.0), cache, provider. Rates fetched
 * from the provider are stored in the cache. Every provider failure is
 * reported as a CurrencyError naming the pair.
 *
 * Example usage:
 *   auto cache = std::make_shared<RateCache>(std::chrono::seconds(3600));
 *   CurrencyClient client(std::make_shared<FrankfurterRateProvider>(), cache);
 *   double eur = client.convert_amount(1000.0, "USD", "EUR");
 */
class CurrencyClient {
public:
    CurrencyClient(std::shared_ptr<RateProvider> provider,
                   std::shared_ptr<RateCache> cache);

    /**
     * Units of `to` per one unit of `from`
     * @throws CurrencyError on an invalid code or a failed lookup
     */
    double get_exchange_rate(const std::string& from, const std::string& to);

    double convert_amount(double amount, const std::string& from, const std::string& to);

    /**
     * Convert several named amounts with one rate lookup
     */
    std::map<std::string, double> convert_amounts(const std::map<std::string, double>& amounts,
                                                  const std::string& from,
                                                  const std::string& to);

    /**
     * Supported currencies, code -> display name
     * @throws CurrencyError on failure
     */
    std::map<std::string, std::string> get_available_currencies();

    RateCacheStats get_cache_stats() const;

private:
    std::shared_ptr<RateProvider> provider_;
    std::shared_ptr<RateCache> cache_;
};

} // namespace currency
} // namespace finesse
