#include "station_impute/io/station_catalog.hpp"
#include "station_impute/core/errors.hpp"
#include "station_impute/core/utils.hpp"

#include <cmath>
#include <optional>
#include <sstream>
#include <vector>

namespace station_impute::io {

using json = nlohmann::json;

std::set<StationId> parse_valid_stations(const std::string& text) {
    std::set<StationId> stations;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        std::string sid = core::trim(line);
        if (!sid.empty()) {
            stations.insert(std::move(sid));
        }
    }
    return stations;
}

std::set<StationId> load_valid_stations(const fs::path& path) {
    return parse_valid_stations(core::read_text(path));
}

static std::optional<double> numeric_field(const json& item, const char* key) {
    auto it = item.find(key);
    if (it == item.end()) {
        return std::nullopt;
    }
    if (it->is_number()) {
        const double v = it->get<double>();
        return std::isfinite(v) ? std::optional<double>(v) : std::nullopt;
    }
    if (it->is_string()) {
        return core::parse_double(it->get<std::string>());
    }
    return std::nullopt;
}

static bool is_retired(const json& item) {
    auto it = item.find("stationEndDate");
    if (it == item.end() || it->is_null()) {
        return false;
    }
    if (it->is_string()) {
        return !core::trim(it->get<std::string>()).empty();
    }
    return true;
}

StationCatalog build_station_catalog(const json& catalog_doc,
                                     const std::set<StationId>& valid_stations) {
    if (!catalog_doc.is_object() || !catalog_doc.contains("data") ||
        !catalog_doc.at("data").is_array()) {
        throw ValidationError("station catalog has no 'data' group list");
    }

    StationCatalog catalog;
    for (const auto& group : catalog_doc.at("data")) {
        if (!group.is_object()) continue;
        auto items = group.find("item");
        if (items == group.end() || !items->is_array()) continue;

        for (const auto& item : *items) {
            if (!item.is_object()) continue;
            auto id = item.find("stationID");
            if (id == item.end() || !id->is_string()) continue;

            const StationId sid = id->get<std::string>();
            if (valid_stations.count(sid) == 0 || is_retired(item)) continue;

            auto lon = numeric_field(item, "longitude");
            auto lat = numeric_field(item, "latitude");
            if (!lon || !lat) continue;

            StationMetadata meta;
            meta.station_id = sid;
            meta.longitude = *lon;
            meta.latitude = *lat;
            meta.altitude_m = numeric_field(item, "altitude");
            catalog[sid] = meta;
        }
    }

    std::vector<std::string> missing;
    for (const auto& sid : valid_stations) {
        if (catalog.count(sid) == 0) {
            missing.push_back(sid);
        }
    }
    if (!missing.empty()) {
        throw MissingStationMetadataError(missing);
    }

    return catalog;
}

StationCatalog load_station_catalog(const fs::path& path,
                                    const std::set<StationId>& valid_stations) {
    const std::string text = core::read_text(path);
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw IOError("Cannot parse station catalog " + path.string() + ": " + e.what());
    }
    return build_station_catalog(doc, valid_stations);
}

} // namespace station_impute::io
