#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <stdexcept>
#include "loan_terms.hpp"

using namespace finesse;
using Catch::Approx;

TEST_CASE("Enum names round-trip through parse functions", "[loan_terms]") {
    SECTION("Grace kinds") {
        for (GraceKind kind : {GraceKind::None, GraceKind::InterestOnly, GraceKind::NoPayment}) {
            REQUIRE(parse_grace_kind(to_string(kind)) == kind);
        }
        REQUIRE(to_string(GraceKind::InterestOnly) == "interest_only");
        REQUIRE(to_string(GraceKind::NoPayment) == "no_payment");
    }

    SECTION("Extra payment kinds") {
        for (ExtraPaymentKind kind : {ExtraPaymentKind::None, ExtraPaymentKind::ExtraMonthly,
                                      ExtraPaymentKind::ExtraYearly, ExtraPaymentKind::Biweekly}) {
            REQUIRE(parse_extra_payment_kind(to_string(kind)) == kind);
        }
        REQUIRE(to_string(ExtraPaymentKind::ExtraMonthly) == "extra_monthly");
    }

    SECTION("Periods and repayment types") {
        REQUIRE(parse_period_type("monthly") == PeriodType::Monthly);
        REQUIRE(parse_period_type("yearly") == PeriodType::Yearly);
        REQUIRE(parse_repayment_type("standard") == RepaymentType::Standard);
        REQUIRE(parse_repayment_type("balloon") == RepaymentType::Balloon);
        REQUIRE(parse_repayment_type("bullet") == RepaymentType::Bullet);
    }
}

TEST_CASE("Unknown enum names are rejected", "[loan_terms]") {
    REQUIRE_THROWS_AS(parse_grace_kind("deferred"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_extra_payment_kind("weekly"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_period_type("daily"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_repayment_type("Standard"), std::invalid_argument);
}

TEST_CASE("Monthly rate conversion", "[loan_terms]") {
    REQUIRE(monthly_rate(6.0) == Approx(0.005));
    REQUIRE(monthly_rate(0.0) == 0.0);

    LoanTerms terms(25000.0, 7.5, 5);
    REQUIRE(terms.monthly_rate() == Approx(0.075 / 12.0));
    REQUIRE(terms.payment_count() == 60);
}

TEST_CASE("Grace policy activity", "[loan_terms]") {
    REQUIRE_FALSE(GracePolicy().active());
    REQUIRE_FALSE(GracePolicy(GraceKind::InterestOnly, 0).active());
    REQUIRE(GracePolicy(GraceKind::NoPayment, 6).active());

    // A None policy carries no months
    GracePolicy none(GraceKind::None, 12);
    REQUIRE(none.months == 0);
    REQUIRE_FALSE(none.active());
}

TEST_CASE("Extra payment policy factories", "[loan_terms]") {
    REQUIRE(ExtraPaymentPolicy::none().kind == ExtraPaymentKind::None);

    auto monthly = ExtraPaymentPolicy::monthly(150.0);
    REQUIRE(monthly.kind == ExtraPaymentKind::ExtraMonthly);
    REQUIRE(monthly.extra_monthly == 150.0);

    auto yearly = ExtraPaymentPolicy::yearly(2000.0, 6);
    REQUIRE(yearly.kind == ExtraPaymentKind::ExtraYearly);
    REQUIRE(yearly.extra_yearly_amount == 2000.0);
    REQUIRE(yearly.extra_yearly_month == 6);

    REQUIRE(ExtraPaymentPolicy::biweekly().kind == ExtraPaymentKind::Biweekly);
    REQUIRE(ExtraPaymentPolicy().extra_yearly_month == 1);
}

TEST_CASE("Custom cost monthly amounts", "[loan_terms][mortgage]") {
    const double home_price = 450000.0;

    SECTION("Monthly dollar cost is used as is") {
        CustomCost cost("Lawn care", 80.0, CostMode::Dollar, CostFrequency::Monthly);
        REQUIRE(cost.monthly_amount(home_price) == Approx(80.0));
    }

    SECTION("Yearly dollar cost is spread over 12 months") {
        CustomCost cost("Pest control", 600.0, CostMode::Dollar, CostFrequency::Yearly);
        REQUIRE(cost.monthly_amount(home_price) == Approx(50.0));
    }

    SECTION("Percent cost is an annual share of the home price") {
        CustomCost cost("Maintenance", 1.0, CostMode::Percent, CostFrequency::Monthly);
        REQUIRE(cost.monthly_amount(home_price) == Approx(375.0));
    }
}

TEST_CASE("Down payment and property tax helpers", "[loan_terms][mortgage]") {
    REQUIRE(down_payment_from_percent(450000.0, 20.0) == Approx(90000.0));
    REQUIRE(down_payment_percent(450000.0, 90000.0) == Approx(20.0));
    REQUIRE(down_payment_percent(0.0, 1000.0) == 0.0);
    REQUIRE(property_tax_from_percent(300000.0, 1.2) == Approx(3600.0));

    MortgageTerms terms;
    terms.home_price = 450000.0;
    terms.down_payment = 90000.0;
    REQUIRE(terms.loan_amount() == Approx(360000.0));
}
