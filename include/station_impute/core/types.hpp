#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <filesystem>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace station_impute {

namespace fs = std::filesystem;

// Matrix types (NaN marks a missing cell)
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXd = Eigen::VectorXd;

using StationId = std::string;

inline constexpr double kMissing = std::numeric_limits<double>::quiet_NaN();

inline bool is_missing(double v) { return std::isnan(v); }

// One measurement group and its sub-measurements, e.g.
// AirTemperature -> {Instantaneous, Maximum, Minimum}
struct FeatureGroup {
    std::string name;
    std::vector<std::string> subs;
};

// Closed, ordered feature schema. Feature i is "<group>_<sub>" in
// declaration order.
struct FeatureSchema {
    std::vector<FeatureGroup> groups;

    std::vector<std::string> feature_names() const;
    size_t feature_count() const;

    static FeatureSchema default_schema();
};

// Default placeholder codes meaning "no data"
std::vector<double> default_sentinels();

// One (station, timestamp) row after flattening; values are indexed by
// schema feature.
struct FlatObservation {
    StationId station_id;
    std::string timestamp;
    std::vector<std::optional<double>> values;
};

struct StationMetadata {
    StationId station_id;
    double longitude = 0.0;
    double latitude = 0.0;
    std::optional<double> altitude_m;
};

using StationCatalog = std::map<StationId, StationMetadata>;

struct NeighborEntry {
    StationId station;
    double distance_km = 0.0;
};

using NeighborList = std::vector<NeighborEntry>;
using NeighborGraph = std::map<StationId, NeighborList>;

// All observations at one timestamp: rows = stations present, cols = schema
struct TimeSlice {
    std::string timestamp;
    std::vector<StationId> stations;
    Matrix2Dd values;
    std::unordered_map<StationId, Eigen::Index> row_index;

    // -1 if the station has no row in this slice
    Eigen::Index row_of(const StationId& station) const {
        auto it = row_index.find(station);
        return it == row_index.end() ? -1 : it->second;
    }
};

struct ImputationLogEntry {
    std::string timestamp;
    std::string worker;
    StationId station;
    std::string feature;
    std::string reason;
    int candidates_found = 0;
    int quorum = 0;
};

// Weight given to an exactly co-located neighbor (distance 0)
enum class ZeroDistancePolicy {
    EXCLUDE, // weight 0, as 1/d^p is undefined
    EXACT    // co-located candidates decide the value
};

inline std::string zero_distance_policy_to_string(ZeroDistancePolicy p) {
    switch (p) {
        case ZeroDistancePolicy::EXCLUDE: return "exclude";
        case ZeroDistancePolicy::EXACT: return "exact";
        default: return "unknown";
    }
}

inline std::optional<ZeroDistancePolicy> string_to_zero_distance_policy(const std::string& s) {
    if (s == "exclude") return ZeroDistancePolicy::EXCLUDE;
    if (s == "exact") return ZeroDistancePolicy::EXACT;
    return std::nullopt;
}

// Pipeline phase enumeration
enum class Phase {
    LOAD_STATIONS = 0,
    FLATTEN = 1,
    STATION_CATALOG = 2,
    NEIGHBOR_GRAPH = 3,
    PARTITION = 4,
    IMPUTATION = 5,
    ASSEMBLY = 6,
    DONE = 7
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::LOAD_STATIONS: return "LOAD_STATIONS";
        case Phase::FLATTEN: return "FLATTEN";
        case Phase::STATION_CATALOG: return "STATION_CATALOG";
        case Phase::NEIGHBOR_GRAPH: return "NEIGHBOR_GRAPH";
        case Phase::PARTITION: return "PARTITION";
        case Phase::IMPUTATION: return "IMPUTATION";
        case Phase::ASSEMBLY: return "ASSEMBLY";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace station_impute
