#ifndef RUNWAYCALC_PARQUET_WRITER_HPP
#define RUNWAYCALC_PARQUET_WRITER_HPP

#include "../simulation_result.hpp"
#include <string>

namespace runwaycalc {

class ParquetWriter {
public:
    /**
     * Write the percentile tables of a simulation result to a Parquet file,
     * one row per (series, month).
     *
     * Output schema:
     *   - series: utf8 ("cash_balance", "revenue", "expenses")
     *   - month_index: int32 (1-based)
     *   - month: utf8 (month label)
     *   - p5, p10, p25, p50, p75, p90, p95: float64
     *   - mean, std_dev: float64
     *
     * @param result SimulationResult with finalized percentile tables
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if the result is empty or the file cannot be written
     */
    static void write_percentiles(const SimulationResult& result, const std::string& filepath);
};

} // namespace runwaycalc

#endif // RUNWAYCALC_PARQUET_WRITER_HPP
