#pragma once

#include "station_impute/core/types.hpp"

#include <string>
#include <vector>

namespace station_impute::imputation {

struct ImputationParams {
    int quorum = 3;
    double power = 2.0;
    ZeroDistancePolicy zero_policy = ZeroDistancePolicy::EXCLUDE;
    // Values filled earlier in the slice count as candidates for later rows
    bool chain_imputed = true;
};

struct IdwCandidate {
    double value = 0.0;
    double distance_km = 0.0;
};

struct IdwEstimate {
    double value = kMissing;
    double weight_sum = 0.0;
    bool fallback_used = false; // all weights vanished, plain mean taken
};

/**
 * Inverse-distance weighted mean, w(d) = 1/d^p. Under EXCLUDE a
 * co-located candidate gets weight 0; if every weight vanishes the
 * candidates are averaged with equal weights. Under EXACT any co-located
 * candidate overrides the weighting and the co-located values are
 * averaged. An empty candidate list yields a missing value.
 */
IdwEstimate estimate_idw(const std::vector<IdwCandidate>& candidates,
                         const ImputationParams& params);

struct SliceImputationStats {
    size_t cells_missing = 0;
    size_t cells_filled = 0;
    size_t cells_unfilled = 0;
    size_t degenerate_fallbacks = 0;
    std::vector<size_t> filled_per_feature;
    std::vector<size_t> unfilled_per_feature;

    void resize(size_t n_features);
    void accumulate(const SliceImputationStats& other);
};

// Fills missing cells of one slice in place, rows in slice order and
// features in schema order. With chain_imputed a value filled earlier is a
// candidate for the cells after it; otherwise candidates come from a copy
// of the slice taken before any cell is written. Every cell left missing
// for lack of quorum appends one entry to `log`.
SliceImputationStats impute_slice(TimeSlice& slice, const NeighborGraph& graph,
                                  const std::vector<std::string>& feature_names,
                                  const ImputationParams& params,
                                  const std::string& worker,
                                  std::vector<ImputationLogEntry>& log);

std::string format_log_line(const ImputationLogEntry& entry);

} // namespace station_impute::imputation
