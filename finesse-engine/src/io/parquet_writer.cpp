#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace finesse {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

std::shared_ptr<arrow::Array> finish(arrow::ArrayBuilder& builder, const std::string& column) {
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + column + " array");
    return array;
}

void write_table(const std::shared_ptr<arrow::Table>& table, const std::string& filepath) {
    auto opened = arrow::io::FileOutputStream::Open(filepath);
    if (!opened.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 opened.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *opened;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

} // anonymous namespace

void ParquetWriter::write_amortization_schedule(const std::vector<AmortizationRow>& rows,
                                                const std::string& filepath) {
    if (rows.empty()) {
        throw std::runtime_error("Amortization schedule is empty; nothing to write to " + filepath);
    }

    auto schema = arrow::schema({
        arrow::field("period", arrow::int32()),
        arrow::field("payment", arrow::float64()),
        arrow::field("principal", arrow::float64()),
        arrow::field("interest", arrow::float64()),
        arrow::field("balance", arrow::float64()),
        arrow::field("total_principal", arrow::float64()),
        arrow::field("total_interest", arrow::float64())
    });

    arrow::Int32Builder period_builder;
    arrow::DoubleBuilder payment_builder;
    arrow::DoubleBuilder principal_builder;
    arrow::DoubleBuilder interest_builder;
    arrow::DoubleBuilder balance_builder;
    arrow::DoubleBuilder total_principal_builder;
    arrow::DoubleBuilder total_interest_builder;

    const int64_t n = static_cast<int64_t>(rows.size());
    check(period_builder.Reserve(n), "reserve memory for period column");
    check(payment_builder.Reserve(n), "reserve memory for payment column");
    check(principal_builder.Reserve(n), "reserve memory for principal column");
    check(interest_builder.Reserve(n), "reserve memory for interest column");
    check(balance_builder.Reserve(n), "reserve memory for balance column");
    check(total_principal_builder.Reserve(n), "reserve memory for total_principal column");
    check(total_interest_builder.Reserve(n), "reserve memory for total_interest column");

    for (const auto& row : rows) {
        check(period_builder.Append(row.period), "append period");
        check(payment_builder.Append(row.payment), "append payment");
        check(principal_builder.Append(row.principal), "append principal");
        check(interest_builder.Append(row.interest), "append interest");
        check(balance_builder.Append(row.balance), "append balance");
        check(total_principal_builder.Append(row.total_principal), "append total_principal");
        check(total_interest_builder.Append(row.total_interest), "append total_interest");
    }

    auto table = arrow::Table::Make(schema, {
        finish(period_builder, "period"),
        finish(payment_builder, "payment"),
        finish(principal_builder, "principal"),
        finish(interest_builder, "interest"),
        finish(balance_builder, "balance"),
        finish(total_principal_builder, "total_principal"),
        finish(total_interest_builder, "total_interest")
    });

    write_table(table, filepath);
}

void ParquetWriter::write_investment_schedule(const std::vector<InvestmentGrowthRow>& rows,
                                              const std::string& filepath) {
    if (rows.empty()) {
        throw std::runtime_error("Investment schedule is empty; nothing to write to " + filepath);
    }

    auto schema = arrow::schema({
        arrow::field("year", arrow::int32()),
        arrow::field("contributions", arrow::float64()),
        arrow::field("interest", arrow::float64()),
        arrow::field("balance", arrow::float64())
    });

    arrow::Int32Builder year_builder;
    arrow::DoubleBuilder contributions_builder;
    arrow::DoubleBuilder interest_builder;
    arrow::DoubleBuilder balance_builder;

    const int64_t n = static_cast<int64_t>(rows.size());
    check(year_builder.Reserve(n), "reserve memory for year column");
    check(contributions_builder.Reserve(n), "reserve memory for contributions column");
    check(interest_builder.Reserve(n), "reserve memory for interest column");
    check(balance_builder.Reserve(n), "reserve memory for balance column");

    for (const auto& row : rows) {
        check(year_builder.Append(row.year), "append year");
        check(contributions_builder.Append(row.contributions), "append contributions");
        check(interest_builder.Append(row.interest), "append interest");
        check(balance_builder.Append(row.balance), "append balance");
    }

    auto table = arrow::Table::Make(schema, {
        finish(year_builder, "year"),
        finish(contributions_builder, "contributions"),
        finish(interest_builder, "interest"),
        finish(balance_builder, "balance")
    });

    write_table(table, filepath);
}

bool ParquetWriter::available() {
    return true;
}

#else // !HAVE_ARROW

void ParquetWriter::write_amortization_schedule(const std::vector<AmortizationRow>& /* rows */,
                                                const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

void ParquetWriter::write_investment_schedule(const std::vector<InvestmentGrowthRow>& /* rows */,
                                              const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

bool ParquetWriter::available() {
    return false;
}

#endif // HAVE_ARROW

} // namespace finesse
