#ifndef SEISRISK_IO_HAZARD_TABLE_HPP
#define SEISRISK_IO_HAZARD_TABLE_HPP

#include "../hazard_curve.hpp"
#include <istream>
#include <map>
#include <string>
#include <vector>

namespace seisrisk {
namespace io {

// One row of the long hazard-curve format:
//   site_id,imt,realization,weight,iml,poe
struct HazardRow {
    std::string site_id;
    std::string imt;
    std::string realization;
    double weight;
    double iml;
    double poe;
};

// Per-realization hazard curves and the logic-tree weight of each realization
struct HazardTable {
    std::vector<HazardCurve> curves;
    std::map<std::string, double> weights;

    size_t realization_count() const { return weights.size(); }
};

// Groups rows into one curve per (site, imt, realization), ordered by
// intensity. Throws std::runtime_error when a realization carries two
// different weights or a curve repeats an intensity level.
HazardTable build_hazard_table(std::vector<HazardRow> rows);

HazardTable load_hazard_table_csv(const std::string& filepath);
HazardTable load_hazard_table_csv(std::istream& is);

// Same columns, read through Apache Arrow (requires HAVE_ARROW)
HazardTable load_hazard_table_parquet(const std::string& filepath);

// Picks the reader from the file extension (.parquet or .csv)
HazardTable load_hazard_table(const std::string& filepath);

} // namespace io
} // namespace seisrisk

#endif // SEISRISK_IO_HAZARD_TABLE_HPP
