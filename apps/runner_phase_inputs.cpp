#include "runner_phase_inputs.hpp"

#include "station_impute/core/errors.hpp"
#include "station_impute/io/sentinel.hpp"
#include "station_impute/io/station_catalog.hpp"
#include "station_impute/io/table_io.hpp"
#include "station_impute/pipeline/summary.hpp"

#include <iostream>

namespace station_impute::runner {

namespace fs = std::filesystem;

std::set<StationId> run_load_stations_phase(const RunContext &ctx) {
  ctx.emitter.phase_start(ctx.run_id, Phase::LOAD_STATIONS, ctx.log);

  auto valid = io::load_valid_stations(ctx.cfg.paths.stations_valid);
  if (valid.empty()) {
    throw ValidationError("no valid stations listed in " +
                          ctx.cfg.paths.stations_valid);
  }

  std::cout << "[LOAD_STATIONS] " << valid.size() << " valid stations"
            << std::endl;
  ctx.emitter.phase_end(ctx.run_id, Phase::LOAD_STATIONS, "ok",
                        {{"stations", valid.size()},
                         {"path", ctx.cfg.paths.stations_valid}},
                        ctx.log);
  return valid;
}

io::FlattenResult run_flatten_phase(const RunContext &ctx,
                                    const std::set<StationId> &valid) {
  ctx.emitter.phase_start(ctx.run_id, Phase::FLATTEN, ctx.log);

  const auto &schema = ctx.cfg.schema.features;
  io::SentinelNormalizer normalizer(ctx.cfg.schema.sentinels);

  auto result = io::flatten_station_files(
      valid, ctx.cfg.paths.his_root, schema, normalizer,
      [&](const std::string &message) {
        ctx.emitter.warning(ctx.run_id, message,
                            {{"phase_name", phase_to_string(Phase::FLATTEN)}},
                            ctx.log);
      });

  const size_t written =
      io::write_flat_csv(result.observations, schema, ctx.cfg.paths.cleaned_csv);

  std::cout << "[FLATTEN] " << result.report.files_read << " files, "
            << result.report.skipped_files.size() << " skipped, " << written
            << " rows -> " << ctx.cfg.paths.cleaned_csv << std::endl;

  nlohmann::json extra = pipeline::flatten_report_to_json(result.report);
  extra.erase("skipped_files");
  extra["cleaned_csv"] = ctx.cfg.paths.cleaned_csv;
  ctx.emitter.phase_end(ctx.run_id, Phase::FLATTEN, "ok", extra, ctx.log);
  return result;
}

StationCatalog run_station_catalog_phase(const RunContext &ctx,
                                         const std::set<StationId> &valid) {
  ctx.emitter.phase_start(ctx.run_id, Phase::STATION_CATALOG, ctx.log);

  StationCatalog catalog =
      io::load_station_catalog(ctx.cfg.paths.station_list, valid);

  size_t without_altitude = 0;
  for (const auto &kv : catalog) {
    if (!kv.second.altitude_m) {
      ++without_altitude;
    }
  }
  std::cout << "[STATION_CATALOG] " << catalog.size() << " stations with coordinates"
            << std::endl;
  ctx.emitter.phase_end(ctx.run_id, Phase::STATION_CATALOG, "ok",
                        {{"stations", catalog.size()},
                         {"without_altitude", without_altitude}},
                        ctx.log);
  return catalog;
}

spatial::NeighborGraphResult run_neighbor_graph_phase(const RunContext &ctx,
                                                      const StationCatalog &catalog,
                                                      bool force_rebuild) {
  ctx.emitter.phase_start(ctx.run_id, Phase::NEIGHBOR_GRAPH, ctx.log);

  auto result = spatial::load_or_build_neighbor_graph(
      catalog, ctx.cfg.paths.neighbors_cache_dir, ctx.cfg.neighbors.cache_enabled,
      force_rebuild);

  std::cout << "[NEIGHBOR_GRAPH] "
            << (result.cache_hit ? "cache hit " : "built ")
            << result.cache_path.string() << std::endl;
  ctx.emitter.phase_end(ctx.run_id, Phase::NEIGHBOR_GRAPH, "ok",
                        {{"stations", result.graph.size()},
                         {"cache_key", result.cache_key},
                         {"cache_path", result.cache_path.string()},
                         {"cache_hit", result.cache_hit},
                         {"cache_written", result.cache_written}},
                        ctx.log);
  return result;
}

} // namespace station_impute::runner
