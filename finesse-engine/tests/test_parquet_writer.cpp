#include <catch2/catch_test_macros.hpp>
#include "io/parquet_writer.hpp"
#include <filesystem>
#include <stdexcept>

using namespace finesse;

TEST_CASE("Parquet schedule export", "[parquet_writer]") {
    namespace fs = std::filesystem;
    const fs::path loan_path = fs::temp_directory_path() / "finesse_loan_schedule.parquet";
    const fs::path growth_path = fs::temp_directory_path() / "finesse_growth_schedule.parquet";

    auto loan_rows = generate_schedule(25000.0, 7.5, 5, PeriodType::Monthly);
    auto growth_rows = generate_investment_schedule(10000.0, 500.0, 8.0, 20);

    if (ParquetWriter::available()) {
        SECTION("Amortization schedule") {
            ParquetWriter::write_amortization_schedule(loan_rows, loan_path.string());
            REQUIRE(fs::exists(loan_path));
            REQUIRE(fs::file_size(loan_path) > 0);
            fs::remove(loan_path);
        }

        SECTION("Investment schedule") {
            ParquetWriter::write_investment_schedule(growth_rows, growth_path.string());
            REQUIRE(fs::exists(growth_path));
            fs::remove(growth_path);
        }

        SECTION("Empty schedule is rejected") {
            REQUIRE_THROWS_AS(ParquetWriter::write_amortization_schedule({}, loan_path.string()),
                              std::runtime_error);
        }
    } else {
        SECTION("Writers report that Arrow is missing") {
            REQUIRE_THROWS_AS(ParquetWriter::write_amortization_schedule(loan_rows, loan_path.string()),
                              std::runtime_error);
            REQUIRE_THROWS_AS(ParquetWriter::write_investment_schedule(growth_rows, growth_path.string()),
                              std::runtime_error);
            REQUIRE_FALSE(fs::exists(loan_path));
        }
    }
}
