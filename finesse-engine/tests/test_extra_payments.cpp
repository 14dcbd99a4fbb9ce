#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "extra_payments.hpp"
#include "amortization.hpp"

using namespace finesse;
using Catch::Approx;
using Catch::Matchers::WithinAbs;

TEST_CASE("amortization_step never overpays the balance", "[extra_payments]") {
    SECTION("Regular month") {
        AmortizationStep step = amortization_step(100000.0, 0.005, 1199.10, 0.0);
        REQUIRE(step.interest == Approx(500.0));
        REQUIRE(step.principal == Approx(699.10));
        REQUIRE(step.payment == Approx(1199.10));
        REQUIRE(step.balance == Approx(100000.0 - 699.10));
    }

    SECTION("Final month is capped at the remaining balance") {
        AmortizationStep step = amortization_step(300.0, 0.005, 1199.10, 200.0);
        REQUIRE(step.principal == 300.0);
        REQUIRE(step.payment == Approx(301.5));
        REQUIRE(step.balance == 0.0);
    }
}

TEST_CASE("extra_for_month schedules by policy", "[extra_payments]") {
    SECTION("Monthly extra applies every month") {
        auto policy = ExtraPaymentPolicy::monthly(150.0);
        for (int month = 1; month <= 24; ++month) {
            REQUIRE(extra_for_month(policy, month, 1000.0) == 150.0);
        }
    }

    SECTION("Yearly extra applies once a year in the chosen month") {
        auto june = ExtraPaymentPolicy::yearly(5000.0, 6);
        REQUIRE(extra_for_month(june, 6, 1000.0) == 5000.0);
        REQUIRE(extra_for_month(june, 18, 1000.0) == 5000.0);
        REQUIRE(extra_for_month(june, 7, 1000.0) == 0.0);
        REQUIRE(extra_for_month(june, 12, 1000.0) == 0.0);

        auto december = ExtraPaymentPolicy::yearly(5000.0, 12);
        REQUIRE(extra_for_month(december, 12, 1000.0) == 5000.0);
        REQUIRE(extra_for_month(december, 24, 1000.0) == 5000.0);
        REQUIRE(extra_for_month(december, 1, 1000.0) == 0.0);
    }

    SECTION("Biweekly adds a twelfth of the standard payment") {
        REQUIRE(extra_for_month(ExtraPaymentPolicy::biweekly(), 3, 1200.0) == Approx(100.0));
    }

    SECTION("No policy adds nothing") {
        REQUIRE(extra_for_month(ExtraPaymentPolicy::none(), 1, 1200.0) == 0.0);
    }
}

TEST_CASE("No extra payments mirrors the standard loan", "[extra_payments]") {
    ExtraPaymentResult r = simulate_extra_payments(200000.0, 6.0, 30, ExtraPaymentPolicy::none());
    PaymentResult standard = compute_payment(200000.0, 6.0, 30);

    REQUIRE(r.standard_months == 360);
    REQUIRE(r.actual_months == 360);
    REQUIRE(r.months_saved == 0);
    REQUIRE(r.interest_saved == 0.0);
    REQUIRE(r.actual_total_interest == Approx(standard.total_interest));
    REQUIRE(r.effective_monthly_payment == Approx(standard.monthly_payment));
    REQUIRE(r.converged);
}

TEST_CASE("Extra $200 a month on a 30-year loan", "[extra_payments][scenario]") {
    ExtraPaymentResult r = simulate_extra_payments(LoanTerms(200000.0, 6.0, 30),
                                                   ExtraPaymentPolicy::monthly(200.0));

    REQUIRE(r.standard_monthly_payment == Approx(1199.10).margin(0.005));
    REQUIRE(r.standard_total_interest == Approx(231676.38).margin(0.01));
    REQUIRE(r.actual_months == 252);
    REQUIRE(r.months_saved == 108);
    REQUIRE(r.actual_total_interest == Approx(151875.87).margin(0.01));
    REQUIRE(r.interest_saved == Approx(r.standard_total_interest - r.actual_total_interest));
    REQUIRE_THAT(r.actual_total_payment, WithinAbs(200000.0 + r.actual_total_interest, 0.02));
    REQUIRE(r.effective_monthly_payment == Approx(r.actual_total_payment / 252));
    REQUIRE(r.converged);
    REQUIRE(r.remaining_balance == 0.0);
}

TEST_CASE("Larger extra payments never lengthen the loan", "[extra_payments]") {
    int previous_months = 361;
    double previous_interest = 1e12;

    for (double extra : {0.0, 50.0, 100.0, 200.0, 500.0, 1000.0}) {
        ExtraPaymentResult r = simulate_extra_payments(200000.0, 6.0, 30,
                                                       ExtraPaymentPolicy::monthly(extra));
        REQUIRE(r.actual_months <= previous_months);
        REQUIRE(r.actual_total_interest <= previous_interest + 1e-6);
        REQUIRE(r.months_saved >= 0);
        REQUIRE(r.interest_saved >= 0.0);
        previous_months = r.actual_months;
        previous_interest = r.actual_total_interest;
    }
}

TEST_CASE("Biweekly and yearly strategies", "[extra_payments]") {
    SECTION("Biweekly pays a 30-year loan off early") {
        ExtraPaymentResult r = simulate_extra_payments(200000.0, 6.0, 30,
                                                       ExtraPaymentPolicy::biweekly());
        REQUIRE(r.actual_months == 295);
        REQUIRE(r.interest_saved > 0.0);
    }

    SECTION("Yearly lump sum in June") {
        ExtraPaymentResult r = simulate_extra_payments(200000.0, 6.0, 30,
                                                       ExtraPaymentPolicy::yearly(5000.0, 6));
        REQUIRE(r.actual_months == 194);
        REQUIRE(r.months_saved == 166);
    }
}

TEST_CASE("Huge extra payment settles in the first month", "[extra_payments]") {
    ExtraPaymentResult r = simulate_extra_payments(10000.0, 5.0, 1,
                                                   ExtraPaymentPolicy::monthly(1000000.0));
    REQUIRE(r.actual_months == 1);
    // Only what was actually owed is counted
    REQUIRE(r.actual_total_payment == Approx(10041.67).margin(0.01));
    REQUIRE(r.actual_total_interest == Approx(41.67).margin(0.01));
    REQUIRE(r.months_saved == 11);
}

TEST_CASE("Negative extra payments", "[extra_payments]") {
    SECTION("Small reduction still converges but saves nothing") {
        ExtraPaymentResult r = simulate_extra_payments(100000.0, 6.0, 10,
                                                       ExtraPaymentPolicy::monthly(-100.0));
        REQUIRE(r.actual_months == 137);
        REQUIRE(r.converged);
        REQUIRE(r.months_saved == 0);
        REQUIRE(r.interest_saved == 0.0);
        REQUIRE(r.actual_total_interest > r.standard_total_interest);
    }

    SECTION("Payment below interest stops at the safety cap") {
        ExtraPaymentResult r = simulate_extra_payments(100000.0, 6.0, 10,
                                                       ExtraPaymentPolicy::monthly(-700.0));
        REQUIRE(r.actual_months == 240);
        REQUIRE_FALSE(r.converged);
        REQUIRE(r.remaining_balance > 100000.0);
        REQUIRE(r.remaining_balance == Approx(141488.95).margin(0.5));
    }
}

TEST_CASE("Degenerate loans return the empty result", "[extra_payments]") {
    ExtraPaymentResult zero = simulate_extra_payments(0.0, 6.0, 10, ExtraPaymentPolicy::monthly(100.0));
    REQUIRE(zero.actual_months == 0);
    REQUIRE(zero.actual_total_payment == 0.0);
    REQUIRE(zero.converged);

    ExtraPaymentResult no_term = simulate_extra_payments(1000.0, 6.0, 0, ExtraPaymentPolicy::monthly(100.0));
    REQUIRE(no_term.standard_months == 0);
}

TEST_CASE("Zero-rate loan with extra payments", "[extra_payments]") {
    ExtraPaymentResult r = simulate_extra_payments(12000.0, 0.0, 1, ExtraPaymentPolicy::monthly(1000.0));
    REQUIRE(r.actual_months == 6);
    REQUIRE(r.actual_total_interest == 0.0);
    REQUIRE(r.actual_total_payment == Approx(12000.0));
}
