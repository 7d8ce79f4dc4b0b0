#include "station_impute/imputation/partition.hpp"

#include <algorithm>
#include <map>

namespace station_impute::imputation {

PartitionResult partition_by_timestamp(const std::vector<FlatObservation>& observations,
                                       const FeatureSchema& schema) {
    const Eigen::Index n_features = static_cast<Eigen::Index>(schema.feature_count());

    // timestamp -> station -> indices into observations, flattening order
    std::map<std::string, std::map<StationId, std::vector<size_t>>> groups;
    for (size_t i = 0; i < observations.size(); ++i) {
        groups[observations[i].timestamp][observations[i].station_id].push_back(i);
    }

    PartitionResult result;
    result.slices.reserve(groups.size());

    for (const auto& [timestamp, by_station] : groups) {
        TimeSlice slice;
        slice.timestamp = timestamp;
        slice.values = Matrix2Dd::Constant(static_cast<Eigen::Index>(by_station.size()),
                                           n_features, kMissing);

        Eigen::Index r = 0;
        for (const auto& [sid, indices] : by_station) {
            slice.stations.push_back(sid);
            slice.row_index[sid] = r;
            result.duplicates_merged += indices.size() - 1;

            for (size_t idx : indices) {
                const auto& values = observations[idx].values;
                const Eigen::Index limit =
                    std::min<Eigen::Index>(n_features, static_cast<Eigen::Index>(values.size()));
                for (Eigen::Index f = 0; f < limit; ++f) {
                    if (is_missing(slice.values(r, f)) && values[static_cast<size_t>(f)]) {
                        slice.values(r, f) = *values[static_cast<size_t>(f)];
                    }
                }
            }
            ++r;
        }

        result.rows += slice.stations.size();
        result.slices.push_back(std::move(slice));
    }

    return result;
}

} // namespace station_impute::imputation
