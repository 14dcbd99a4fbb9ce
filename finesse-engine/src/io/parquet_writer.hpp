#ifndef FINESSE_PARQUET_WRITER_HPP
#define FINESSE_PARQUET_WRITER_HPP

#include "../schedule.hpp"
#include <string>
#include <vector>

namespace finesse {

class ParquetWriter {
public:
    /**
     * Write a loan schedule to a Parquet file.
     *
     * Output schema:
     *   - period: int32 (1-based month or year)
     *   - payment, principal, interest, balance: float64
     *   - total_principal, total_interest: float64 (cumulative)
     *
     * @param rows Schedule rows (monthly or yearly)
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if the schedule is empty or the file cannot be written
     */
    static void write_amortization_schedule(const std::vector<AmortizationRow>& rows,
                                            const std::string& filepath);

    /**
     * Write an investment growth schedule to a Parquet file.
     *
     * Output schema:
     *   - year: int32 (0 = initial state)
     *   - contributions, interest, balance: float64
     *
     * @throws std::runtime_error if the schedule is empty or the file cannot be written
     */
    static void write_investment_schedule(const std::vector<InvestmentGrowthRow>& rows,
                                          const std::string& filepath);

    // True when this build can write Parquet
    static bool available();
};

} // namespace finesse

#endif // FINESSE_PARQUET_WRITER_HPP
