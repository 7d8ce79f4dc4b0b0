#pragma once

#include "station_impute/core/types.hpp"
#include "station_impute/io/sentinel.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace station_impute::io {

namespace fs = std::filesystem;

// Top-level layout of a per-station-per-day observation document
enum class RawShape {
    WRAPPER,      // {"data": [entry, ...]}
    BARE_LIST,    // [entry, ...]
    SINGLE_ENTRY, // {"StationID": ..., "dts": [...]}
    UNRECOGNIZED
};

std::string raw_shape_to_string(RawShape shape);

RawShape detect_raw_shape(const nlohmann::json& doc);

// Resolves the shape once and returns the entries it holds. Throws
// MalformedRecordError for an unrecognized shape.
std::vector<const nlohmann::json*> document_entries(const nlohmann::json& doc);

struct DocumentFlattenStats {
    size_t sub_entries = 0;
    size_t sub_entries_skipped = 0; // not an object or no DataTime
};

// One FlatObservation per timestamped sub-entry. Throws MalformedRecordError
// if an entry lacks its nested "dts"/"data" list.
std::vector<FlatObservation> flatten_document(const nlohmann::json& doc,
                                              const StationId& station_id,
                                              const FeatureSchema& schema,
                                              const SentinelNormalizer& normalizer,
                                              DocumentFlattenStats* stats = nullptr);

// Parses and flattens a single file. Throws MalformedRecordError on
// unparseable content, IOError if the file cannot be read.
std::vector<FlatObservation> read_observation_file(const fs::path& path,
                                                   const StationId& station_id,
                                                   const FeatureSchema& schema,
                                                   const SentinelNormalizer& normalizer,
                                                   DocumentFlattenStats* stats = nullptr);

struct SkippedFile {
    fs::path path;
    std::string reason;
};

struct FlattenReport {
    size_t stations_scanned = 0;
    size_t stations_without_dir = 0;
    size_t files_read = 0;
    size_t rows = 0;
    size_t sub_entries_skipped = 0;
    std::vector<SkippedFile> skipped_files;
};

struct FlattenResult {
    std::vector<FlatObservation> observations;
    FlattenReport report;
};

using WarningSink = std::function<void(const std::string&)>;

// Walks <his_root>/<station>/*.json for every valid station, stations and
// files in ascending order. Malformed files are reported through
// on_warning and skipped.
FlattenResult flatten_station_files(const std::set<StationId>& valid_stations,
                                    const fs::path& his_root,
                                    const FeatureSchema& schema,
                                    const SentinelNormalizer& normalizer,
                                    const WarningSink& on_warning = nullptr);

} // namespace station_impute::io
