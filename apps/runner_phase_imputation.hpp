#pragma once

#include "runner_shared.hpp"

#include "station_impute/imputation/parallel.hpp"
#include "station_impute/imputation/partition.hpp"

#include <vector>

namespace station_impute::runner {

// PARTITION
imputation::PartitionResult
run_partition_phase(const RunContext &ctx,
                    const std::vector<FlatObservation> &observations);

// IMPUTATION: fills slices in place and writes the imputation log.
// worker_override > 0 replaces the cpu_fraction sizing.
imputation::ParallelImputationResult
run_imputation_phase(const RunContext &ctx, std::vector<TimeSlice> &slices,
                     const NeighborGraph &graph, int worker_override);

// ASSEMBLY: writes the imputed table, returns its row count.
size_t run_assembly_phase(const RunContext &ctx,
                          const std::vector<TimeSlice> &slices,
                          const StationCatalog &catalog);

} // namespace station_impute::runner
