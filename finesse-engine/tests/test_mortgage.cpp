#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "mortgage.hpp"

using namespace finesse;
using Catch::Approx;

namespace {

MortgageTerms sample_terms() {
    MortgageTerms terms;
    terms.home_price = 450000.0;
    terms.down_payment = down_payment_from_percent(450000.0, 20.0);
    terms.annual_rate_percent = 6.5;
    terms.years = 30;
    terms.annual_property_tax = 6000.0;
    terms.annual_insurance = 1200.0;
    terms.monthly_hoa = 50.0;
    return terms;
}

} // anonymous namespace

TEST_CASE("Mortgage monthly costs", "[mortgage][scenario]") {
    MortgageResult r = compute_mortgage(sample_terms());

    REQUIRE(r.loan_amount == Approx(360000.0));
    REQUIRE(r.monthly_principal_interest == Approx(2275.44).margin(0.005));
    REQUIRE(r.monthly_property_tax == Approx(500.0));
    REQUIRE(r.monthly_insurance == Approx(100.0));
    REQUIRE(r.monthly_hoa == 50.0);
    REQUIRE(r.monthly_other == 0.0);
    REQUIRE(r.total_monthly == Approx(2925.44).margin(0.005));
    REQUIRE(r.total_cost == Approx(r.total_monthly * 360));
    REQUIRE(r.total_cost == Approx(1053160.16).margin(0.01));
    REQUIRE(r.total_interest == Approx(r.monthly_principal_interest * 360 - 360000.0));
}

TEST_CASE("Mortgage first payment is mostly interest", "[mortgage]") {
    MortgageResult r = compute_mortgage(sample_terms());

    REQUIRE(r.first_month.interest == Approx(1950.0));
    REQUIRE(r.first_month.principal == Approx(325.44).margin(0.005));
    REQUIRE(r.first_month.interest_percent + r.first_month.principal_percent == Approx(100.0));
}

TEST_CASE("Custom costs add to the monthly total", "[mortgage]") {
    MortgageTerms terms = sample_terms();
    terms.custom_costs.emplace_back("Maintenance", 1.0, CostMode::Percent, CostFrequency::Yearly);
    terms.custom_costs.emplace_back("Utilities", 250.0, CostMode::Dollar, CostFrequency::Monthly);
    terms.custom_costs.emplace_back("Pest control", 600.0, CostMode::Dollar, CostFrequency::Yearly);

    MortgageResult base = compute_mortgage(sample_terms());
    MortgageResult r = compute_mortgage(terms);

    REQUIRE(r.monthly_other == Approx(375.0 + 250.0 + 50.0));
    REQUIRE(r.total_monthly == Approx(base.total_monthly + 675.0));
    REQUIRE(r.monthly_principal_interest == Approx(base.monthly_principal_interest));
}

TEST_CASE("Fully paid home has no loan costs", "[mortgage]") {
    MortgageTerms terms = sample_terms();
    terms.down_payment = terms.home_price;

    MortgageResult r = compute_mortgage(terms);
    REQUIRE(r.loan_amount == 0.0);
    REQUIRE(r.monthly_principal_interest == 0.0);
    REQUIRE(r.total_interest == 0.0);
    REQUIRE(r.first_month.interest == 0.0);
    REQUIRE(r.total_monthly == Approx(650.0));
}

TEST_CASE("Zero-rate mortgage", "[mortgage]") {
    MortgageTerms terms = sample_terms();
    terms.annual_rate_percent = 0.0;

    MortgageResult r = compute_mortgage(terms);
    REQUIRE(r.monthly_principal_interest == Approx(1000.0));
    REQUIRE(r.total_interest == Approx(0.0).margin(1e-9));
    REQUIRE(r.first_month.interest == 0.0);
    REQUIRE(r.first_month.principal_percent == Approx(100.0));
}
