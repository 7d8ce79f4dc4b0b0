#pragma once

#include "station_impute/core/types.hpp"

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace station_impute::config {

namespace fs = std::filesystem;

struct PathsConfig {
  std::string his_root = "data/his_data";
  std::string stations_valid = "data/web_api/stations_valid.txt";
  std::string station_list = "data/web_api/station_list.json";
  std::string neighbors_cache_dir = "data/web_api";
  std::string cleaned_csv = "data/cleaned_initial_data.csv";
  std::string imputed_csv = "data/cleaned_initial_data_imputed.csv";
  std::string imputation_log = "data/logs/preprocess_impute.log";
  std::string events_log = "data/logs/run_events.jsonl";
  std::string summary_json = "data/logs/imputation_summary.json";
};

struct ImputationConfig {
  int min_neighbors = 3;
  double idw_power = 2.0;
  std::string zero_distance_weight = "exclude"; // exclude | exact
  bool chain_imputed = true; // filled cells feed later cells of the slice
};

struct NeighborsConfig {
  bool cache_enabled = true;
};

struct RuntimeConfig {
  double cpu_fraction = 0.8; // of std::thread::hardware_concurrency()
  int max_workers = 0;       // 0 = no cap
  bool abort_on_slice_failure = false;
};

struct SchemaConfig {
  FeatureSchema features = FeatureSchema::default_schema();
  std::vector<double> sentinels = default_sentinels();
};

struct Config {
  PathsConfig paths;
  ImputationConfig imputation;
  NeighborsConfig neighbors;
  RuntimeConfig runtime;
  SchemaConfig schema;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  // Rewrites every relative entry of `paths` to live under base_dir.
  void resolve_paths(const fs::path &base_dir);
};

} // namespace station_impute::config
