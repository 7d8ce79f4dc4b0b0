#pragma once

#include "station_impute/core/types.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <set>
#include <string>

namespace station_impute::io {

namespace fs = std::filesystem;

// Valid-station list: one ID per line, whitespace trimmed, blank lines
// ignored.
std::set<StationId> parse_valid_stations(const std::string& text);
std::set<StationId> load_valid_stations(const fs::path& path);

/**
 * Builds StationID -> StationMetadata from a catalog document of the form
 * {"data": [{"stationAttribute": ..., "item": [{"stationID", "longitude",
 * "latitude", "altitude", "stationEndDate"}, ...]}, ...]}.
 *
 * Only valid stations without a retirement marker (non-empty
 * stationEndDate) are kept. Throws MissingStationMetadataError when a valid
 * station is left without usable coordinates.
 */
StationCatalog build_station_catalog(const nlohmann::json& catalog_doc,
                                     const std::set<StationId>& valid_stations);

StationCatalog load_station_catalog(const fs::path& path,
                                    const std::set<StationId>& valid_stations);

} // namespace station_impute::io
