#include "station_impute/imputation/idw_worker.hpp"
#include "station_impute/core/errors.hpp"

#include <cmath>

namespace station_impute::imputation {

IdwEstimate estimate_idw(const std::vector<IdwCandidate>& candidates,
                         const ImputationParams& params) {
    IdwEstimate out;
    if (candidates.empty()) {
        return out;
    }

    if (params.zero_policy == ZeroDistancePolicy::EXACT) {
        double sum = 0.0;
        size_t n = 0;
        for (const auto& c : candidates) {
            if (c.distance_km == 0.0) {
                sum += c.value;
                ++n;
            }
        }
        if (n > 0) {
            out.value = sum / static_cast<double>(n);
            out.weight_sum = static_cast<double>(n);
            return out;
        }
    }

    double wsum = 0.0;
    double vsum = 0.0;
    for (const auto& c : candidates) {
        if (!(c.distance_km > 0.0)) {
            continue;
        }
        const double w = 1.0 / std::pow(c.distance_km, params.power);
        wsum += w;
        vsum += w * c.value;
    }

    if (!(std::isfinite(wsum) && wsum > 0.0) || !std::isfinite(vsum)) {
        out.fallback_used = true;
        double sum = 0.0;
        for (const auto& c : candidates) {
            sum += c.value;
        }
        out.value = sum / static_cast<double>(candidates.size());
        out.weight_sum = static_cast<double>(candidates.size());
        return out;
    }

    out.value = vsum / wsum;
    out.weight_sum = wsum;
    return out;
}

void SliceImputationStats::resize(size_t n_features) {
    filled_per_feature.assign(n_features, 0);
    unfilled_per_feature.assign(n_features, 0);
}

void SliceImputationStats::accumulate(const SliceImputationStats& other) {
    cells_missing += other.cells_missing;
    cells_filled += other.cells_filled;
    cells_unfilled += other.cells_unfilled;
    degenerate_fallbacks += other.degenerate_fallbacks;
    if (filled_per_feature.size() < other.filled_per_feature.size()) {
        filled_per_feature.resize(other.filled_per_feature.size(), 0);
        unfilled_per_feature.resize(other.unfilled_per_feature.size(), 0);
    }
    for (size_t f = 0; f < other.filled_per_feature.size(); ++f) {
        filled_per_feature[f] += other.filled_per_feature[f];
        unfilled_per_feature[f] += other.unfilled_per_feature[f];
    }
}

SliceImputationStats impute_slice(TimeSlice& slice, const NeighborGraph& graph,
                                  const std::vector<std::string>& feature_names,
                                  const ImputationParams& params,
                                  const std::string& worker,
                                  std::vector<ImputationLogEntry>& log) {
    if (params.quorum < 1) {
        throw ValidationError("quorum must be >= 1");
    }
    const Eigen::Index n_rows = slice.values.rows();
    const Eigen::Index n_features = slice.values.cols();
    if (static_cast<size_t>(n_features) != feature_names.size()) {
        throw PipelineError("slice " + slice.timestamp + " has " +
                            std::to_string(n_features) + " columns, schema has " +
                            std::to_string(feature_names.size()));
    }

    SliceImputationStats stats;
    stats.resize(feature_names.size());

    Matrix2Dd snapshot;
    if (!params.chain_imputed) {
        snapshot = slice.values;
    }
    const Matrix2Dd& source = params.chain_imputed ? slice.values : snapshot;
    const size_t quorum = static_cast<size_t>(params.quorum);
    std::vector<IdwCandidate> candidates;
    candidates.reserve(quorum);

    for (Eigen::Index r = 0; r < n_rows; ++r) {
        const StationId& sid = slice.stations[static_cast<size_t>(r)];
        auto git = graph.find(sid);
        if (git == graph.end()) {
            throw PipelineError("station " + sid + " has no neighbor list");
        }
        const NeighborList& neighbors = git->second;

        for (Eigen::Index f = 0; f < n_features; ++f) {
            if (!is_missing(slice.values(r, f))) {
                continue;
            }
            ++stats.cells_missing;

            candidates.clear();
            for (const auto& nb : neighbors) {
                const Eigen::Index nr = slice.row_of(nb.station);
                if (nr < 0) continue;
                const double v = source(nr, f);
                if (is_missing(v)) continue;
                candidates.push_back({v, nb.distance_km});
                if (candidates.size() >= quorum) break;
            }

            const size_t fi = static_cast<size_t>(f);
            if (candidates.size() < quorum) {
                ++stats.cells_unfilled;
                ++stats.unfilled_per_feature[fi];
                ImputationLogEntry entry;
                entry.timestamp = slice.timestamp;
                entry.worker = worker;
                entry.station = sid;
                entry.feature = feature_names[fi];
                entry.reason = "insufficient_neighbors";
                entry.candidates_found = static_cast<int>(candidates.size());
                entry.quorum = params.quorum;
                log.push_back(std::move(entry));
                continue;
            }

            const IdwEstimate est = estimate_idw(candidates, params);
            slice.values(r, f) = est.value;
            ++stats.cells_filled;
            ++stats.filled_per_feature[fi];
            if (est.fallback_used) {
                ++stats.degenerate_fallbacks;
            }
        }
    }

    return stats;
}

std::string format_log_line(const ImputationLogEntry& entry) {
    return "[" + entry.timestamp + "][" + entry.worker + "] " + entry.station + "/" +
           entry.feature + " nbr<" + std::to_string(entry.quorum) + " " + entry.reason +
           " found=" + std::to_string(entry.candidates_found);
}

} // namespace station_impute::imputation
