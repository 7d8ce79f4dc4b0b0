#pragma once

#include "station_impute/core/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace station_impute::pipeline {

namespace fs = std::filesystem;

struct AssembledRow {
    StationId station_id;
    std::string timestamp;
    std::vector<double> values; // NaN = still missing
    const StationMetadata* metadata = nullptr;
};

// Rows in slice order, stations ascending within a slice, joined to the
// catalog by StationID (metadata stays null for unknown stations).
std::vector<AssembledRow> assemble_rows(const std::vector<TimeSlice>& slices,
                                        const StationCatalog& catalog);

// StationID,DataTime,<features>,Longitude,Latitude,Altitude
std::vector<std::string> imputed_table_header(const FeatureSchema& schema);

size_t write_imputed_csv(const std::vector<AssembledRow>& rows, const FeatureSchema& schema,
                         const fs::path& path);

} // namespace station_impute::pipeline
