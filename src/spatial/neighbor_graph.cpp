#include "station_impute/spatial/neighbor_graph.hpp"
#include "station_impute/core/errors.hpp"
#include "station_impute/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <locale>
#include <set>
#include <sstream>
#include <vector>

namespace station_impute::spatial {

using json = nlohmann::json;

namespace {

constexpr double kPi = 3.14159265358979323846;

double deg2rad(double deg) { return deg * kPi / 180.0; }

struct Candidate {
    const StationId* id;
    double distance;
};

} // namespace

double haversine_km(double lat1, double lon1, double lat2, double lon2) {
    const double phi1 = deg2rad(lat1);
    const double phi2 = deg2rad(lat2);
    const double dphi = deg2rad(lat2 - lat1);
    const double dlambda = deg2rad(lon2 - lon1);

    const double s1 = std::sin(dphi / 2.0);
    const double s2 = std::sin(dlambda / 2.0);
    double a = s1 * s1 + std::cos(phi1) * std::cos(phi2) * s2 * s2;
    a = std::min(1.0, std::max(0.0, a));
    return 2.0 * kEarthRadiusKm * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
}

double distance_3d_km(const StationMetadata& a, const StationMetadata& b) {
    const double h = haversine_km(a.latitude, a.longitude, b.latitude, b.longitude);
    double v = 0.0;
    if (a.altitude_m && b.altitude_m) {
        v = std::fabs(*a.altitude_m - *b.altitude_m) / 1000.0;
    }
    return std::sqrt(h * h + v * v);
}

NeighborGraph build_neighbor_graph(const StationCatalog& catalog) {
    std::vector<const StationMetadata*> stations;
    stations.reserve(catalog.size());
    for (const auto& kv : catalog) {
        stations.push_back(&kv.second);
    }

    const size_t n = stations.size();
    // Symmetric: compute the upper triangle once
    std::vector<double> dist(n * n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            const double d = distance_3d_km(*stations[i], *stations[j]);
            dist[i * n + j] = d;
            dist[j * n + i] = d;
        }
    }

    NeighborGraph graph;
    std::vector<Candidate> row;
    for (size_t i = 0; i < n; ++i) {
        row.clear();
        for (size_t j = 0; j < n; ++j) {
            if (j == i) continue;
            row.push_back({&stations[j]->station_id, dist[i * n + j]});
        }
        std::sort(row.begin(), row.end(), [](const Candidate& a, const Candidate& b) {
            if (a.distance != b.distance) return a.distance < b.distance;
            return *a.id < *b.id;
        });

        NeighborList list;
        list.reserve(row.size());
        for (const auto& c : row) {
            list.push_back({*c.id, core::round_to(c.distance, kDistanceDecimals)});
        }
        graph[stations[i]->station_id] = std::move(list);
    }
    return graph;
}

std::string neighbor_cache_key(const StationCatalog& catalog) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::fixed << std::setprecision(6);
    for (const auto& [sid, meta] : catalog) {
        oss << sid << '|' << meta.longitude << '|' << meta.latitude << '|';
        if (meta.altitude_m) {
            oss << *meta.altitude_m;
        } else {
            oss << "NA";
        }
        oss << '\n';
    }
    return core::sha256_text(oss.str());
}

fs::path neighbor_cache_path(const fs::path& cache_dir, const std::string& key) {
    return cache_dir / ("station_neighbors_" + key.substr(0, 16) + ".json");
}

json neighbor_graph_to_json(const NeighborGraph& graph) {
    json doc = json::object();
    for (const auto& [sid, list] : graph) {
        json arr = json::array();
        for (const auto& e : list) {
            arr.push_back({{"station", e.station}, {"distance_km", e.distance_km}});
        }
        doc[sid] = std::move(arr);
    }
    return doc;
}

std::string serialize_neighbor_graph(const NeighborGraph& graph) {
    return neighbor_graph_to_json(graph).dump(2) + "\n";
}

NeighborGraph neighbor_graph_from_json(const json& doc, const StationCatalog& catalog) {
    if (!doc.is_object()) {
        throw ValidationError("neighbor cache is not an object");
    }
    if (doc.size() != catalog.size()) {
        throw ValidationError("neighbor cache covers " + std::to_string(doc.size()) +
                              " stations, catalog has " + std::to_string(catalog.size()));
    }

    NeighborGraph graph;
    for (const auto& [sid, arr] : doc.items()) {
        if (catalog.count(sid) == 0) {
            throw ValidationError("neighbor cache has unknown station " + sid);
        }
        if (!arr.is_array() || arr.size() + 1 != catalog.size()) {
            throw ValidationError("neighbor cache list for " + sid + " is corrupt");
        }
        NeighborList list;
        list.reserve(arr.size());
        std::set<StationId> seen;
        for (const auto& e : arr) {
            if (!e.is_object() || !e.contains("station") || !e.at("station").is_string() ||
                !e.contains("distance_km") || !e.at("distance_km").is_number()) {
                throw ValidationError("neighbor cache entry for " + sid + " is corrupt");
            }
            const std::string other = e.at("station").get<std::string>();
            if (other == sid || catalog.count(other) == 0) {
                throw ValidationError("neighbor cache entry " + sid + " -> " + other +
                                      " is not a catalog station");
            }
            if (!seen.insert(other).second) {
                throw ValidationError("neighbor cache list for " + sid + " repeats " + other);
            }
            const double d = e.at("distance_km").get<double>();
            if (!list.empty() && d < list.back().distance_km) {
                throw ValidationError("neighbor cache list for " + sid +
                                      " is not sorted by distance");
            }
            list.push_back({other, d});
        }
        graph[sid] = std::move(list);
    }
    return graph;
}

NeighborGraph load_neighbor_cache(const fs::path& path, const StationCatalog& catalog) {
    const std::string text = core::read_text(path);
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw IOError("Cannot parse neighbor cache " + path.string() + ": " + e.what());
    }
    return neighbor_graph_from_json(doc, catalog);
}

void save_neighbor_cache(const fs::path& path, const NeighborGraph& graph) {
    core::write_text(path, serialize_neighbor_graph(graph));
}

NeighborGraphResult load_or_build_neighbor_graph(const StationCatalog& catalog,
                                                 const fs::path& cache_dir,
                                                 bool cache_enabled,
                                                 bool force_rebuild) {
    NeighborGraphResult result;
    result.cache_key = neighbor_cache_key(catalog);
    result.cache_path = neighbor_cache_path(cache_dir, result.cache_key);

    if (cache_enabled && !force_rebuild && fs::exists(result.cache_path)) {
        result.graph = load_neighbor_cache(result.cache_path, catalog);
        result.cache_hit = true;
        return result;
    }

    result.graph = build_neighbor_graph(catalog);
    if (cache_enabled) {
        save_neighbor_cache(result.cache_path, result.graph);
        result.cache_written = true;
    }
    return result;
}

} // namespace station_impute::spatial
