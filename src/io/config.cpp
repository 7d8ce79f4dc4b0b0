#include "station_impute/config/configuration.hpp"
#include "station_impute/core/errors.hpp"

#include <cmath>
#include <fstream>
#include <set>

namespace station_impute::config {

static void read_string(const YAML::Node& n, const char* key, std::string& out) {
    if (n[key]) out = n[key].as<std::string>();
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["paths"]) {
            auto p = node["paths"];
            read_string(p, "his_root", cfg.paths.his_root);
            read_string(p, "stations_valid", cfg.paths.stations_valid);
            read_string(p, "station_list", cfg.paths.station_list);
            read_string(p, "neighbors_cache_dir", cfg.paths.neighbors_cache_dir);
            read_string(p, "cleaned_csv", cfg.paths.cleaned_csv);
            read_string(p, "imputed_csv", cfg.paths.imputed_csv);
            read_string(p, "imputation_log", cfg.paths.imputation_log);
            read_string(p, "events_log", cfg.paths.events_log);
            read_string(p, "summary_json", cfg.paths.summary_json);
        }

        if (node["imputation"]) {
            auto im = node["imputation"];
            if (im["min_neighbors"]) cfg.imputation.min_neighbors = im["min_neighbors"].as<int>();
            if (im["idw_power"]) cfg.imputation.idw_power = im["idw_power"].as<double>();
            read_string(im, "zero_distance_weight", cfg.imputation.zero_distance_weight);
            if (im["chain_imputed"]) cfg.imputation.chain_imputed = im["chain_imputed"].as<bool>();
        }

        if (node["neighbors"]) {
            auto nb = node["neighbors"];
            if (nb["cache_enabled"]) cfg.neighbors.cache_enabled = nb["cache_enabled"].as<bool>();
        }

        if (node["runtime"]) {
            auto rt = node["runtime"];
            if (rt["cpu_fraction"]) cfg.runtime.cpu_fraction = rt["cpu_fraction"].as<double>();
            if (rt["max_workers"]) cfg.runtime.max_workers = rt["max_workers"].as<int>();
            if (rt["abort_on_slice_failure"]) {
                cfg.runtime.abort_on_slice_failure = rt["abort_on_slice_failure"].as<bool>();
            }
        }

        if (node["schema"]) {
            auto s = node["schema"];
            if (s["fields"]) {
                if (!s["fields"].IsMap()) {
                    throw ConfigError("schema.fields must be a mapping group -> [subs]");
                }
                cfg.schema.features.groups.clear();
                for (const auto& it : s["fields"]) {
                    FeatureGroup g;
                    g.name = it.first.as<std::string>();
                    if (it.second.IsSequence()) {
                        for (const auto& sub : it.second) {
                            g.subs.push_back(sub.as<std::string>());
                        }
                    } else {
                        g.subs.push_back(it.second.as<std::string>());
                    }
                    cfg.schema.features.groups.push_back(std::move(g));
                }
            }
            if (s["sentinels"] && s["sentinels"].IsSequence()) {
                cfg.schema.sentinels.clear();
                for (const auto& v : s["sentinels"]) {
                    cfg.schema.sentinels.push_back(v.as<double>());
                }
            }
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["paths"]["his_root"] = paths.his_root;
    node["paths"]["stations_valid"] = paths.stations_valid;
    node["paths"]["station_list"] = paths.station_list;
    node["paths"]["neighbors_cache_dir"] = paths.neighbors_cache_dir;
    node["paths"]["cleaned_csv"] = paths.cleaned_csv;
    node["paths"]["imputed_csv"] = paths.imputed_csv;
    node["paths"]["imputation_log"] = paths.imputation_log;
    node["paths"]["events_log"] = paths.events_log;
    node["paths"]["summary_json"] = paths.summary_json;

    node["imputation"]["min_neighbors"] = imputation.min_neighbors;
    node["imputation"]["idw_power"] = imputation.idw_power;
    node["imputation"]["zero_distance_weight"] = imputation.zero_distance_weight;
    node["imputation"]["chain_imputed"] = imputation.chain_imputed;

    node["neighbors"]["cache_enabled"] = neighbors.cache_enabled;

    node["runtime"]["cpu_fraction"] = runtime.cpu_fraction;
    node["runtime"]["max_workers"] = runtime.max_workers;
    node["runtime"]["abort_on_slice_failure"] = runtime.abort_on_slice_failure;

    for (const auto& g : schema.features.groups) {
        for (const auto& sub : g.subs) {
            node["schema"]["fields"][g.name].push_back(sub);
        }
    }
    for (double v : schema.sentinels) {
        node["schema"]["sentinels"].push_back(v);
    }

    return node;
}

void Config::validate() const {
    if (paths.his_root.empty()) {
        throw ValidationError("paths.his_root must not be empty");
    }
    if (paths.stations_valid.empty() || paths.station_list.empty()) {
        throw ValidationError("paths.stations_valid and paths.station_list must not be empty");
    }
    if (paths.cleaned_csv.empty() || paths.imputed_csv.empty()) {
        throw ValidationError("paths.cleaned_csv and paths.imputed_csv must not be empty");
    }
    if (paths.imputation_log.empty() || paths.events_log.empty() ||
        paths.summary_json.empty()) {
        throw ValidationError(
            "paths.imputation_log, paths.events_log and paths.summary_json must not be empty");
    }
    if (neighbors.cache_enabled && paths.neighbors_cache_dir.empty()) {
        throw ValidationError("paths.neighbors_cache_dir is required when the cache is enabled");
    }

    if (imputation.min_neighbors < 1) {
        throw ValidationError("imputation.min_neighbors must be >= 1");
    }
    if (!(imputation.idw_power > 0.0) || !std::isfinite(imputation.idw_power)) {
        throw ValidationError("imputation.idw_power must be > 0");
    }
    if (!string_to_zero_distance_policy(imputation.zero_distance_weight)) {
        throw ValidationError("imputation.zero_distance_weight must be 'exclude' or 'exact'");
    }

    if (!(runtime.cpu_fraction > 0.0) || runtime.cpu_fraction > 1.0) {
        throw ValidationError("runtime.cpu_fraction must be in (0,1]");
    }
    if (runtime.max_workers < 0) {
        throw ValidationError("runtime.max_workers must be >= 0");
    }

    if (schema.features.feature_count() == 0) {
        throw ValidationError("schema.fields must declare at least one feature");
    }
    std::set<std::string> seen;
    for (const auto& name : schema.features.feature_names()) {
        if (!seen.insert(name).second) {
            throw ValidationError("schema.fields declares feature '" + name + "' twice");
        }
    }
}

void Config::resolve_paths(const fs::path& base_dir) {
    auto resolve = [&](std::string& p) {
        if (p.empty()) return;
        fs::path path(p);
        if (path.is_relative()) {
            p = (base_dir / path).lexically_normal().string();
        }
    };
    resolve(paths.his_root);
    resolve(paths.stations_valid);
    resolve(paths.station_list);
    resolve(paths.neighbors_cache_dir);
    resolve(paths.cleaned_csv);
    resolve(paths.imputed_csv);
    resolve(paths.imputation_log);
    resolve(paths.events_log);
    resolve(paths.summary_json);
}

} // namespace station_impute::config
