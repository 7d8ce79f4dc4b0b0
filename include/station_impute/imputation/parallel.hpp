#pragma once

#include "station_impute/core/types.hpp"
#include "station_impute/imputation/idw_worker.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace station_impute::imputation {

namespace fs = std::filesystem;

// max(1, floor(units * fraction)), then capped by max_workers (when > 0)
// and by the task count (when > 0).
int compute_worker_count(unsigned units, double fraction, int max_workers, size_t tasks);

// Host-based variant using std::thread::hardware_concurrency().
int compute_worker_count(double fraction, int max_workers, size_t tasks);

struct SliceFailure {
    size_t slice_index = 0;
    std::string timestamp;
    std::string error;
};

using SliceProcessor = std::function<SliceImputationStats(
    TimeSlice& slice, const std::string& worker, std::vector<ImputationLogEntry>& log)>;

// Called under a mutex after each slice completes.
using ProgressCallback = std::function<void(size_t done, size_t total, int workers)>;

struct ParallelImputationResult {
    int workers = 1;
    std::vector<SliceImputationStats> slice_stats; // by slice index
    std::vector<ImputationLogEntry> log;           // merged in slice order
    std::vector<SliceFailure> failures;            // ascending slice index
    SliceImputationStats totals;
};

/**
 * Runs `processor` over every slice on a pool of `workers` threads pulling
 * indices from a shared counter. An exception from one slice is recorded
 * as a SliceFailure and the slice is restored to its values before the
 * call; the other slices are unaffected.
 */
ParallelImputationResult run_parallel_imputation(std::vector<TimeSlice>& slices,
                                                 const SliceProcessor& processor,
                                                 int workers,
                                                 const ProgressCallback& on_progress = nullptr);

// Truncates the log file and writes one formatted line per entry.
void write_imputation_log(const fs::path& path, const std::vector<ImputationLogEntry>& log);

} // namespace station_impute::imputation
