#include "station_impute/pipeline/assembler.hpp"
#include "station_impute/core/errors.hpp"
#include "station_impute/io/table_io.hpp"

namespace station_impute::pipeline {

std::vector<AssembledRow> assemble_rows(const std::vector<TimeSlice>& slices,
                                        const StationCatalog& catalog) {
    size_t total = 0;
    for (const auto& s : slices) {
        total += s.stations.size();
    }

    std::vector<AssembledRow> rows;
    rows.reserve(total);
    for (const auto& slice : slices) {
        for (size_t r = 0; r < slice.stations.size(); ++r) {
            AssembledRow row;
            row.station_id = slice.stations[r];
            row.timestamp = slice.timestamp;
            const auto vals = slice.values.row(static_cast<Eigen::Index>(r));
            row.values.assign(vals.data(), vals.data() + vals.size());
            auto it = catalog.find(row.station_id);
            if (it != catalog.end()) {
                row.metadata = &it->second;
            }
            rows.push_back(std::move(row));
        }
    }
    return rows;
}

std::vector<std::string> imputed_table_header(const FeatureSchema& schema) {
    std::vector<std::string> header = io::flat_table_header(schema);
    header.push_back("Longitude");
    header.push_back("Latitude");
    header.push_back("Altitude");
    return header;
}

size_t write_imputed_csv(const std::vector<AssembledRow>& rows, const FeatureSchema& schema,
                         const fs::path& path) {
    const size_t n_features = schema.feature_count();
    io::CsvWriter writer(path, imputed_table_header(schema));

    std::vector<std::string> cells;
    for (const auto& row : rows) {
        if (row.values.size() != n_features) {
            throw PipelineError("row " + row.station_id + "@" + row.timestamp + " has " +
                                std::to_string(row.values.size()) + " values, schema has " +
                                std::to_string(n_features));
        }
        cells.clear();
        cells.push_back(row.station_id);
        cells.push_back(row.timestamp);
        for (double v : row.values) {
            cells.push_back(io::format_cell(v));
        }
        if (row.metadata) {
            cells.push_back(io::format_cell(row.metadata->longitude));
            cells.push_back(io::format_cell(row.metadata->latitude));
            cells.push_back(io::format_cell(row.metadata->altitude_m));
        } else {
            cells.insert(cells.end(), 3, std::string());
        }
        writer.write_row(cells);
    }
    writer.close();
    return writer.rows_written();
}

} // namespace station_impute::pipeline
