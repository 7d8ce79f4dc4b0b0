#pragma once

#include "station_impute/core/types.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace station_impute::io {

namespace fs = std::filesystem;

/**
 * Streaming CSV writer. Creates the parent directory, truncates the
 * target and quotes cells holding a separator, quote or newline.
 * Throws IOError when the file cannot be opened or a write fails.
 */
class CsvWriter {
public:
    CsvWriter(const fs::path& path, const std::vector<std::string>& header);

    void write_row(const std::vector<std::string>& cells);
    void close();

    size_t rows_written() const { return rows_written_; }

private:
    void write_cells(const std::vector<std::string>& cells);

    fs::path path_;
    std::ofstream out_;
    size_t columns_ = 0;
    size_t rows_written_ = 0;
};

std::string csv_escape(const std::string& cell);

// Missing -> empty cell
std::string format_cell(const std::optional<double>& value);
std::string format_cell(double value);

// StationID,DataTime,<features>
std::vector<std::string> flat_table_header(const FeatureSchema& schema);

// Snapshot of the flattened observations in flattening order.
size_t write_flat_csv(const std::vector<FlatObservation>& observations,
                      const FeatureSchema& schema, const fs::path& path);

} // namespace station_impute::io
