#pragma once

#include "station_impute/imputation/parallel.hpp"
#include "station_impute/io/raw_records.hpp"
#include "station_impute/spatial/neighbor_graph.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace station_impute::pipeline {

nlohmann::json flatten_report_to_json(const io::FlattenReport& report);

struct ImputationSummaryInput {
    std::string run_id;
    const io::FlattenReport* flatten = nullptr;
    const spatial::NeighborGraphResult* neighbors = nullptr;
    const imputation::ParallelImputationResult* imputation = nullptr;
    std::vector<std::string> feature_names;
    size_t slices = 0;
    size_t rows = 0;
    size_t duplicates_merged = 0;
};

// Run-level JSON artifact: totals, per-feature counts, cache key, failures.
nlohmann::json build_imputation_summary(const ImputationSummaryInput& in);

} // namespace station_impute::pipeline
