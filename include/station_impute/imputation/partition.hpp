#pragma once

#include "station_impute/core/types.hpp"

#include <vector>

namespace station_impute::imputation {

struct PartitionResult {
    std::vector<TimeSlice> slices;  // ascending timestamp
    size_t rows = 0;                // rows across all slices
    size_t duplicates_merged = 0;
};

// Groups observations by timestamp. Rows within a slice are the stations
// present, ascending by ID. A repeated (station, timestamp) collapses into
// one row where the first non-missing value per feature wins.
PartitionResult partition_by_timestamp(const std::vector<FlatObservation>& observations,
                                       const FeatureSchema& schema);

} // namespace station_impute::imputation
