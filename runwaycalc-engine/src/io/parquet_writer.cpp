#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace runwaycalc {

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

} // anonymous namespace

void ParquetWriter::write_percentiles(const SimulationResult& result, const std::string& filepath) {
    const size_t months = result.cash_balance.months();
    if (months == 0) {
        throw std::runtime_error("SimulationResult has no percentile data to write");
    }

    const PercentileTable* tables[] = {&result.cash_balance, &result.revenue, &result.expenses};
    const auto& labels = percentile_labels();

    // Build Arrow schema
    arrow::FieldVector fields = {
        arrow::field("series", arrow::utf8()),
        arrow::field("month_index", arrow::int32()),
        arrow::field("month", arrow::utf8())
    };
    for (const auto& label : labels) {
        fields.push_back(arrow::field(label, arrow::float64()));
    }
    fields.push_back(arrow::field("mean", arrow::float64()));
    fields.push_back(arrow::field("std_dev", arrow::float64()));
    auto schema = arrow::schema(fields);

    arrow::StringBuilder series_builder;
    arrow::Int32Builder month_index_builder;
    arrow::StringBuilder month_builder;
    std::vector<arrow::DoubleBuilder> percentile_builders(NUM_PERCENTILES);
    arrow::DoubleBuilder mean_builder;
    arrow::DoubleBuilder std_dev_builder;

    for (const PercentileTable* table : tables) {
        if (table->months() != months) {
            throw std::runtime_error("Percentile tables disagree on the number of months");
        }
        const std::string series = series_to_string(table->series);

        for (size_t m = 0; m < months; ++m) {
            check(series_builder.Append(series), "append series");
            check(month_index_builder.Append(static_cast<int32_t>(m + 1)), "append month_index");

            const std::string label = m < result.month_labels.size()
                ? result.month_labels[m]
                : "Month_" + std::to_string(m + 1);
            check(month_builder.Append(label), "append month");

            for (size_t i = 0; i < NUM_PERCENTILES; ++i) {
                check(percentile_builders[i].Append(table->values[i][m]), "append " + labels[i]);
            }
            check(mean_builder.Append(table->mean[m]), "append mean");
            check(std_dev_builder.Append(table->std_dev[m]), "append std_dev");
        }
    }

    std::vector<std::shared_ptr<arrow::Array>> columns;
    columns.push_back(finish(series_builder, "series"));
    columns.push_back(finish(month_index_builder, "month_index"));
    columns.push_back(finish(month_builder, "month"));
    for (size_t i = 0; i < NUM_PERCENTILES; ++i) {
        columns.push_back(finish(percentile_builders[i], labels[i]));
    }
    columns.push_back(finish(mean_builder, "mean"));
    columns.push_back(finish(std_dev_builder, "std_dev"));

    auto table = arrow::Table::Make(schema, columns);

    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

#else // !HAVE_ARROW

void ParquetWriter::write_percentiles(const SimulationResult& /* result */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace runwaycalc
