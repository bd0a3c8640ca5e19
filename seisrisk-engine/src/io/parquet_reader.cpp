#include "hazard_table.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#endif

namespace seisrisk {
namespace io {

#ifdef HAVE_ARROW

namespace {

int require_field(const std::shared_ptr<arrow::Schema>& schema, const std::string& name) {
    int idx = schema->GetFieldIndex(name);
    if (idx < 0) {
        throw std::runtime_error("Parquet file missing required column: " + name +
                                 ". Expected: site_id, imt, realization, weight, iml, poe");
    }
    return idx;
}

} // anonymous namespace

HazardTable load_hazard_table_parquet(const std::string& filepath) {
    auto infile_result = arrow::io::ReadableFile::Open(filepath);
    if (!infile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file: " + filepath + " - " +
                                 infile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::ReadableFile> infile = *infile_result;

    std::unique_ptr<parquet::arrow::FileReader> arrow_reader;
    auto status = parquet::arrow::OpenFile(infile, arrow::default_memory_pool(), &arrow_reader);
    if (!status.ok()) {
        throw std::runtime_error("Cannot create Parquet reader: " + status.ToString());
    }

    std::shared_ptr<arrow::Table> table;
    status = arrow_reader->ReadTable(&table);
    if (!status.ok()) {
        throw std::runtime_error("Cannot read Parquet table: " + status.ToString());
    }

    // One chunk per column keeps the row loop simple
    auto combined = table->CombineChunks();
    if (!combined.ok()) {
        throw std::runtime_error("Cannot combine Parquet chunks: " + combined.status().ToString());
    }
    table = *combined;

    auto schema = table->schema();
    int site_idx = require_field(schema, "site_id");
    int imt_idx = require_field(schema, "imt");
    int rlz_idx = require_field(schema, "realization");
    int weight_idx = require_field(schema, "weight");
    int iml_idx = require_field(schema, "iml");
    int poe_idx = require_field(schema, "poe");

    int64_t num_rows = table->num_rows();
    std::vector<HazardRow> rows;
    rows.reserve(static_cast<size_t>(num_rows));
    if (num_rows == 0) {
        return build_hazard_table(std::move(rows));
    }

    auto site_column = std::static_pointer_cast<arrow::StringArray>(table->column(site_idx)->chunk(0));
    auto imt_column = std::static_pointer_cast<arrow::StringArray>(table->column(imt_idx)->chunk(0));
    auto rlz_column = std::static_pointer_cast<arrow::StringArray>(table->column(rlz_idx)->chunk(0));
    auto weight_column = std::static_pointer_cast<arrow::DoubleArray>(table->column(weight_idx)->chunk(0));
    auto iml_column = std::static_pointer_cast<arrow::DoubleArray>(table->column(iml_idx)->chunk(0));
    auto poe_column = std::static_pointer_cast<arrow::DoubleArray>(table->column(poe_idx)->chunk(0));

    for (int64_t i = 0; i < num_rows; ++i) {
        HazardRow r;
        r.site_id = site_column->GetString(i);
        r.imt = imt_column->GetString(i);
        r.realization = rlz_column->GetString(i);
        r.weight = weight_column->Value(i);
        r.iml = iml_column->Value(i);
        r.poe = poe_column->Value(i);
        rows.push_back(std::move(r));
    }

    return build_hazard_table(std::move(rows));
}

#else // !HAVE_ARROW

HazardTable load_hazard_table_parquet(const std::string& filepath) {
    (void)filepath;  // Suppress unused parameter warning
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace io
} // namespace seisrisk
