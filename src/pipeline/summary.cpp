#include "station_impute/pipeline/summary.hpp"

namespace station_impute::pipeline {

using json = nlohmann::json;

json flatten_report_to_json(const io::FlattenReport& report) {
    json skipped = json::array();
    for (const auto& s : report.skipped_files) {
        skipped.push_back({{"path", s.path.string()}, {"reason", s.reason}});
    }
    return {
        {"stations_scanned", report.stations_scanned},
        {"stations_without_dir", report.stations_without_dir},
        {"files_read", report.files_read},
        {"files_skipped", report.skipped_files.size()},
        {"rows", report.rows},
        {"sub_entries_skipped", report.sub_entries_skipped},
        {"skipped_files", skipped}
    };
}

json build_imputation_summary(const ImputationSummaryInput& in) {
    json j;
    j["run_id"] = in.run_id;
    j["slices"] = in.slices;
    j["rows"] = in.rows;
    j["duplicates_merged"] = in.duplicates_merged;

    if (in.flatten) {
        j["flatten"] = flatten_report_to_json(*in.flatten);
    }

    if (in.neighbors) {
        j["neighbor_cache"] = {
            {"key", in.neighbors->cache_key},
            {"path", in.neighbors->cache_path.string()},
            {"hit", in.neighbors->cache_hit},
            {"written", in.neighbors->cache_written},
            {"stations", in.neighbors->graph.size()}
        };
    }

    if (in.imputation) {
        const auto& r = *in.imputation;
        j["workers"] = r.workers;
        j["totals"] = {
            {"missing", r.totals.cells_missing},
            {"filled", r.totals.cells_filled},
            {"unfilled", r.totals.cells_unfilled},
            {"degenerate_fallbacks", r.totals.degenerate_fallbacks},
            {"log_entries", r.log.size()}
        };

        json features = json::object();
        for (size_t f = 0; f < in.feature_names.size(); ++f) {
            const size_t filled =
                f < r.totals.filled_per_feature.size() ? r.totals.filled_per_feature[f] : 0;
            const size_t unfilled =
                f < r.totals.unfilled_per_feature.size() ? r.totals.unfilled_per_feature[f] : 0;
            features[in.feature_names[f]] = {{"filled", filled}, {"unfilled", unfilled}};
        }
        j["features"] = features;

        json failures = json::array();
        for (const auto& f : r.failures) {
            failures.push_back({{"slice_index", f.slice_index},
                                {"timestamp", f.timestamp},
                                {"error", f.error}});
        }
        j["slice_failures"] = failures;
    }

    return j;
}

} // namespace station_impute::pipeline
