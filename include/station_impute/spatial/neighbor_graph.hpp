#pragma once

#include "station_impute/core/types.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace station_impute::spatial {

namespace fs = std::filesystem;

inline constexpr double kEarthRadiusKm = 6371.0;
inline constexpr int kDistanceDecimals = 4;

// Great-circle distance on a sphere of radius kEarthRadiusKm, degrees in.
double haversine_km(double lat1, double lon1, double lat2, double lon2);

// sqrt(horizontal^2 + vertical^2); the vertical term is |altA - altB| / 1000
// and drops out when either altitude is unknown.
double distance_3d_km(const StationMetadata& a, const StationMetadata& b);

// Every station gets all others, ascending by distance then by ID.
NeighborGraph build_neighbor_graph(const StationCatalog& catalog);

// SHA-256 over the sorted station IDs with fixed-precision coordinates.
std::string neighbor_cache_key(const StationCatalog& catalog);

fs::path neighbor_cache_path(const fs::path& cache_dir, const std::string& key);

nlohmann::json neighbor_graph_to_json(const NeighborGraph& graph);
std::string serialize_neighbor_graph(const NeighborGraph& graph);

// Throws ValidationError if the document is not a neighbor mapping or its
// station set differs from the catalog.
NeighborGraph neighbor_graph_from_json(const nlohmann::json& doc,
                                       const StationCatalog& catalog);

NeighborGraph load_neighbor_cache(const fs::path& path, const StationCatalog& catalog);
void save_neighbor_cache(const fs::path& path, const NeighborGraph& graph);

struct NeighborGraphResult {
    NeighborGraph graph;
    std::string cache_key;
    fs::path cache_path;
    bool cache_hit = false;
    bool cache_written = false;
};

/**
 * Returns the graph for the catalog, reusing the cache file named after the
 * content key when present. A miss (or force_rebuild) builds the graph and,
 * with caching enabled, writes it back. Cache I/O and parse faults throw.
 */
NeighborGraphResult load_or_build_neighbor_graph(const StationCatalog& catalog,
                                                 const fs::path& cache_dir,
                                                 bool cache_enabled,
                                                 bool force_rebuild);

} // namespace station_impute::spatial
