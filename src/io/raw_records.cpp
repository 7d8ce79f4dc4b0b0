#include "station_impute/io/raw_records.hpp"
#include "station_impute/core/errors.hpp"
#include "station_impute/core/utils.hpp"

#include <iterator>

namespace station_impute::io {

using json = nlohmann::json;

std::string raw_shape_to_string(RawShape shape) {
    switch (shape) {
        case RawShape::WRAPPER: return "WRAPPER";
        case RawShape::BARE_LIST: return "BARE_LIST";
        case RawShape::SINGLE_ENTRY: return "SINGLE_ENTRY";
        default: return "UNRECOGNIZED";
    }
}

RawShape detect_raw_shape(const json& doc) {
    if (doc.is_object() && doc.contains("data")) {
        return doc.at("data").is_array() ? RawShape::WRAPPER : RawShape::UNRECOGNIZED;
    }
    if (doc.is_array()) {
        return RawShape::BARE_LIST;
    }
    if (doc.is_object() && doc.contains("StationID") && doc.contains("dts")) {
        return RawShape::SINGLE_ENTRY;
    }
    return RawShape::UNRECOGNIZED;
}

std::vector<const json*> document_entries(const json& doc) {
    std::vector<const json*> entries;
    switch (detect_raw_shape(doc)) {
        case RawShape::WRAPPER:
            for (const auto& e : doc.at("data")) entries.push_back(&e);
            break;
        case RawShape::BARE_LIST:
            for (const auto& e : doc) entries.push_back(&e);
            break;
        case RawShape::SINGLE_ENTRY:
            entries.push_back(&doc);
            break;
        case RawShape::UNRECOGNIZED:
            throw MalformedRecordError("unrecognized top-level shape (" +
                                       std::string(doc.type_name()) + ")");
    }
    return entries;
}

// An entry keeps its timestamped records under "dts", older payloads under
// "data". An empty "dts" falls through to "data".
static const json* timestamped_records(const json& entry) {
    if (!entry.is_object()) {
        return nullptr;
    }
    auto dts = entry.find("dts");
    if (dts != entry.end() && dts->is_array() && !dts->empty()) {
        return &*dts;
    }
    auto data = entry.find("data");
    if (data != entry.end() && data->is_array()) {
        return &*data;
    }
    if (dts != entry.end() && dts->is_array()) {
        return &*dts;
    }
    return nullptr;
}

std::vector<FlatObservation> flatten_document(const json& doc,
                                              const StationId& station_id,
                                              const FeatureSchema& schema,
                                              const SentinelNormalizer& normalizer,
                                              DocumentFlattenStats* stats) {
    std::vector<FlatObservation> rows;
    DocumentFlattenStats local;

    const auto entries = document_entries(doc);
    for (size_t ei = 0; ei < entries.size(); ++ei) {
        const json* records = timestamped_records(*entries[ei]);
        if (!records) {
            throw MalformedRecordError("entry " + std::to_string(ei) +
                                       " has no timestamped record list");
        }

        for (const auto& rec : *records) {
            ++local.sub_entries;
            if (!rec.is_object()) {
                ++local.sub_entries_skipped;
                continue;
            }
            auto dt = rec.find("DataTime");
            if (dt == rec.end() || !dt->is_string()) {
                ++local.sub_entries_skipped;
                continue;
            }

            FlatObservation row;
            row.station_id = station_id;
            row.timestamp = dt->get<std::string>();
            row.values.reserve(schema.feature_count());

            for (const auto& group : schema.groups) {
                auto g = rec.find(group.name);
                const bool has_group = g != rec.end() && g->is_object();
                for (const auto& sub : group.subs) {
                    if (!has_group) {
                        row.values.emplace_back(std::nullopt);
                        continue;
                    }
                    auto v = g->find(sub);
                    row.values.push_back(v == g->end() ? std::nullopt
                                                       : normalizer.normalize(*v));
                }
            }
            rows.push_back(std::move(row));
        }
    }

    if (stats) {
        stats->sub_entries += local.sub_entries;
        stats->sub_entries_skipped += local.sub_entries_skipped;
    }
    return rows;
}

std::vector<FlatObservation> read_observation_file(const fs::path& path,
                                                   const StationId& station_id,
                                                   const FeatureSchema& schema,
                                                   const SentinelNormalizer& normalizer,
                                                   DocumentFlattenStats* stats) {
    const std::string text = core::read_text(path);
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw MalformedRecordError(path.string() + ": " + e.what());
    }
    return flatten_document(doc, station_id, schema, normalizer, stats);
}

FlattenResult flatten_station_files(const std::set<StationId>& valid_stations,
                                    const fs::path& his_root,
                                    const FeatureSchema& schema,
                                    const SentinelNormalizer& normalizer,
                                    const WarningSink& on_warning) {
    FlattenResult out;

    for (const auto& sid : valid_stations) {
        ++out.report.stations_scanned;
        const fs::path station_dir = his_root / sid;
        if (!fs::is_directory(station_dir)) {
            ++out.report.stations_without_dir;
            continue;
        }

        for (const auto& file : core::list_files(station_dir, ".json")) {
            DocumentFlattenStats stats;
            try {
                auto rows = read_observation_file(file, sid, schema, normalizer, &stats);
                ++out.report.files_read;
                out.report.sub_entries_skipped += stats.sub_entries_skipped;
                out.observations.insert(out.observations.end(),
                                        std::make_move_iterator(rows.begin()),
                                        std::make_move_iterator(rows.end()));
            } catch (const IOError& e) {
                out.report.skipped_files.push_back({file, e.what()});
                if (on_warning) {
                    on_warning("Skipping " + file.string() + ": " + e.what());
                }
            }
        }
    }

    out.report.rows = out.observations.size();
    return out;
}

} // namespace station_impute::io
