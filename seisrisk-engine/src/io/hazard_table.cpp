#include "hazard_table.hpp"
#include "csv_reader.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <tuple>

namespace seisrisk {
namespace io {

HazardTable build_hazard_table(std::vector<HazardRow> rows) {
    HazardTable table;

    // Group key -> position of the first row, so curves come out in input order
    std::map<std::tuple<std::string, std::string, std::string>, size_t> first_seen;
    std::vector<std::vector<const HazardRow*>> groups;

    for (const HazardRow& row : rows) {
        auto existing = table.weights.find(row.realization);
        if (existing == table.weights.end()) {
            table.weights[row.realization] = row.weight;
        } else if (std::fabs(existing->second - row.weight) > 1e-12) {
            throw std::runtime_error("Realization '" + row.realization +
                                     "' has inconsistent weights in hazard input");
        }

        auto key = std::make_tuple(row.site_id, row.imt, row.realization);
        auto it = first_seen.find(key);
        if (it == first_seen.end()) {
            first_seen.emplace(key, groups.size());
            groups.push_back({&row});
        } else {
            groups[it->second].push_back(&row);
        }
    }

    table.curves.reserve(groups.size());
    for (auto& group : groups) {
        std::stable_sort(group.begin(), group.end(),
                         [](const HazardRow* a, const HazardRow* b) { return a->iml < b->iml; });
        std::vector<double> imls;
        std::vector<double> poes;
        imls.reserve(group.size());
        poes.reserve(group.size());
        for (const HazardRow* row : group) {
            if (!imls.empty() && row->iml == imls.back()) {
                throw std::runtime_error("Duplicate intensity level " + std::to_string(row->iml) +
                                         " for site " + row->site_id + ", realization " +
                                         row->realization);
            }
            imls.push_back(row->iml);
            poes.push_back(row->poe);
        }
        const HazardRow& head = *group.front();
        table.curves.emplace_back(head.site_id, head.imt, std::move(imls), std::move(poes),
                                  head.realization);
    }

    return table;
}

HazardTable load_hazard_table_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return load_hazard_table_csv(file);
}

HazardTable load_hazard_table_csv(std::istream& is) {
    CsvReader reader(is);
    reader.read_header();

    size_t site_col = reader.column("site_id");
    size_t imt_col = reader.column("imt");
    size_t rlz_col = reader.column("realization");
    size_t weight_col = reader.column("weight");
    size_t iml_col = reader.column("iml");
    size_t poe_col = reader.column("poe");
    size_t required = std::max({site_col, imt_col, rlz_col, weight_col, iml_col, poe_col}) + 1;

    std::vector<HazardRow> rows;
    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) {
            continue;
        }
        if (row.size() < required) {
            throw std::runtime_error("Hazard CSV line " + std::to_string(reader.line_number()) +
                                     ": expected at least " + std::to_string(required) + " fields");
        }
        HazardRow r;
        r.site_id = row[site_col];
        r.imt = row[imt_col];
        r.realization = row[rlz_col];
        r.weight = parse_double(row[weight_col], "weight", reader.line_number());
        r.iml = parse_double(row[iml_col], "iml", reader.line_number());
        r.poe = parse_double(row[poe_col], "poe", reader.line_number());
        rows.push_back(std::move(r));
    }

    return build_hazard_table(std::move(rows));
}

HazardTable load_hazard_table(const std::string& filepath) {
    const std::string suffix = ".parquet";
    if (filepath.size() >= suffix.size() &&
        filepath.compare(filepath.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return load_hazard_table_parquet(filepath);
    }
    return load_hazard_table_csv(filepath);
}

} // namespace io
} // namespace seisrisk
