#include "station_impute/io/table_io.hpp"
#include "station_impute/core/errors.hpp"
#include "station_impute/core/utils.hpp"

namespace station_impute::io {

std::string csv_escape(const std::string& cell) {
    if (cell.find_first_of(",\"\r\n") == std::string::npos) {
        return cell;
    }
    std::string quoted = "\"";
    for (char c : cell) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string format_cell(const std::optional<double>& value) {
    return value ? core::format_double(*value) : std::string();
}

std::string format_cell(double value) {
    return core::format_double(value);
}

CsvWriter::CsvWriter(const fs::path& path, const std::vector<std::string>& header)
    : path_(path), columns_(header.size()) {
    core::ensure_parent_dir(path_);
    out_.open(path_, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out_) {
        throw IOError("Cannot create file: " + path_.string());
    }
    write_cells(header);
}

void CsvWriter::write_cells(const std::vector<std::string>& cells) {
    for (size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) out_ << ',';
        out_ << csv_escape(cells[i]);
    }
    out_ << '\n';
    if (!out_) {
        throw IOError("Cannot write file: " + path_.string());
    }
}

void CsvWriter::write_row(const std::vector<std::string>& cells) {
    if (cells.size() != columns_) {
        throw IOError(path_.string() + ": row has " + std::to_string(cells.size()) +
                      " cells, header has " + std::to_string(columns_));
    }
    write_cells(cells);
    ++rows_written_;
}

void CsvWriter::close() {
    if (!out_.is_open()) {
        return;
    }
    out_.flush();
    if (!out_) {
        throw IOError("Cannot write file: " + path_.string());
    }
    out_.close();
}

std::vector<std::string> flat_table_header(const FeatureSchema& schema) {
    std::vector<std::string> header = {"StationID", "DataTime"};
    for (const auto& name : schema.feature_names()) {
        header.push_back(name);
    }
    return header;
}

size_t write_flat_csv(const std::vector<FlatObservation>& observations,
                      const FeatureSchema& schema, const fs::path& path) {
    const size_t n_features = schema.feature_count();
    CsvWriter writer(path, flat_table_header(schema));

    std::vector<std::string> cells;
    cells.reserve(n_features + 2);
    for (const auto& obs : observations) {
        cells.clear();
        cells.push_back(obs.station_id);
        cells.push_back(obs.timestamp);
        for (size_t f = 0; f < n_features; ++f) {
            cells.push_back(f < obs.values.size() ? format_cell(obs.values[f]) : std::string());
        }
        writer.write_row(cells);
    }
    writer.close();
    return writer.rows_written();
}

} // namespace station_impute::io
