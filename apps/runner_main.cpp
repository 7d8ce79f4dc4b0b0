#include "runner_phase_imputation.hpp"
#include "runner_phase_inputs.hpp"
#include "runner_shared.hpp"

#include "station_impute/config/configuration.hpp"
#include "station_impute/core/errors.hpp"
#include "station_impute/core/events.hpp"
#include "station_impute/core/utils.hpp"
#include "station_impute/pipeline/summary.hpp"

#include <CLI/CLI.hpp>

#include <fstream>
#include <functional>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

using namespace station_impute;
using runner::RunContext;

namespace {

struct RunOptions {
  std::string config_path;
  std::string project_root;
  int workers = 0;
  bool rebuild_neighbors = false;
  bool dry_run = false;
};

using CommandBody = std::function<int(const RunContext &)>;

// Opens the event log, brackets `body` with run_start/run_end and turns
// exceptions into an error event plus exit status 1.
int with_run(const std::string &command, const RunOptions &opts,
             const CommandBody &body) {
  config::Config cfg;
  try {
    cfg = runner::load_run_config(opts.config_path, opts.project_root);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  try {
    core::ensure_parent_dir(cfg.paths.events_log);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  std::ofstream event_log_file(cfg.paths.events_log, std::ios::out | std::ios::app);
  if (!event_log_file) {
    std::cerr << "Error: Cannot open event log: " << cfg.paths.events_log
              << std::endl;
    return 1;
  }
  runner::TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_file(&tee_buf);

  const std::string run_id = core::get_run_id();
  core::EventEmitter emitter;
  RunContext ctx{cfg, run_id, emitter, log_file};

  emitter.run_start(run_id,
                    {{"command", command},
                     {"config_path", opts.config_path},
                     {"dry_run", opts.dry_run},
                     {"rebuild_neighbors", opts.rebuild_neighbors},
                     {"workers_override", opts.workers}},
                    log_file);
  std::cout << "Run ID: " << run_id << std::endl;

  try {
    const int rc = body(ctx);
    if (rc == 0) {
      emitter.run_end(run_id, true, "ok", {}, log_file);
    }
    return rc;
  } catch (const MissingStationMetadataError &e) {
    emitter.error(run_id, e.what(), log_file);
    emitter.run_end(run_id, false, "error",
                    {{"missing_stations", e.stations()}}, log_file);
    std::cerr << "Error: " << e.what() << std::endl;
  } catch (const StationImputeError &e) {
    emitter.error(run_id, e.what(), log_file);
    emitter.run_end(run_id, false, "error", {}, log_file);
    std::cerr << "Error: " << e.what() << std::endl;
  } catch (const std::exception &e) {
    emitter.error(run_id, e.what(), log_file);
    emitter.run_end(run_id, false, "error", {}, log_file);
    std::cerr << "Error: " << e.what() << std::endl;
  }
  return 1;
}

int dry_run_report(const RunContext &ctx) {
  const auto &p = ctx.cfg.paths;
  bool ok = true;
  auto check = [&](const std::string &label, const std::string &path,
                   bool want_dir) {
    const bool exists =
        want_dir ? fs::is_directory(path) : fs::is_regular_file(path);
    std::cout << "  " << label << ": " << path << (exists ? "" : " (missing)")
              << std::endl;
    ok = ok && exists;
  };
  std::cout << "Dry run, inputs:" << std::endl;
  check("his_root", p.his_root, true);
  check("stations_valid", p.stations_valid, false);
  check("station_list", p.station_list, false);

  for (Phase phase : {Phase::LOAD_STATIONS, Phase::FLATTEN,
                      Phase::STATION_CATALOG, Phase::NEIGHBOR_GRAPH,
                      Phase::PARTITION, Phase::IMPUTATION, Phase::ASSEMBLY}) {
    ctx.emitter.phase_start(ctx.run_id, phase, ctx.log);
    ctx.emitter.phase_end(ctx.run_id, phase, "skipped",
                          {{"reason", "dry_run"}}, ctx.log);
  }
  if (!ok) {
    throw IOError("dry run found missing inputs");
  }
  return 0;
}

int run_command(const RunOptions &opts) {
  return with_run("run", opts, [&](const RunContext &ctx) -> int {
    if (opts.dry_run) {
      return dry_run_report(ctx);
    }

    const auto valid = runner::run_load_stations_phase(ctx);
    const auto catalog = runner::run_station_catalog_phase(ctx, valid);
    const auto neighbors =
        runner::run_neighbor_graph_phase(ctx, catalog, opts.rebuild_neighbors);
    const auto flat = runner::run_flatten_phase(ctx, valid);

    auto partition = runner::run_partition_phase(ctx, flat.observations);
    const auto imputed = runner::run_imputation_phase(
        ctx, partition.slices, neighbors.graph, opts.workers);

    if (!imputed.failures.empty() && ctx.cfg.runtime.abort_on_slice_failure) {
      throw PipelineError(std::to_string(imputed.failures.size()) +
                          " slice(s) failed, first: " +
                          imputed.failures.front().error);
    }

    runner::run_assembly_phase(ctx, partition.slices, catalog);

    pipeline::ImputationSummaryInput summary_in;
    summary_in.run_id = ctx.run_id;
    summary_in.flatten = &flat.report;
    summary_in.neighbors = &neighbors;
    summary_in.imputation = &imputed;
    summary_in.feature_names = ctx.cfg.schema.features.feature_names();
    summary_in.slices = partition.slices.size();
    summary_in.rows = partition.rows;
    summary_in.duplicates_merged = partition.duplicates_merged;
    runner::write_json_artifact(ctx, ctx.cfg.paths.summary_json,
                                pipeline::build_imputation_summary(summary_in));

    ctx.emitter.phase_start(ctx.run_id, Phase::DONE, ctx.log);
    ctx.emitter.phase_end(ctx.run_id, Phase::DONE, "ok", {}, ctx.log);

    if (!imputed.failures.empty()) {
      ctx.emitter.run_end(ctx.run_id, false, "slice_failures",
                          {{"slice_failures", imputed.failures.size()}},
                          ctx.log);
      std::cerr << "Pipeline completed with " << imputed.failures.size()
                << " failed slice(s)" << std::endl;
      return 1;
    }

    std::cout << "Pipeline completed successfully" << std::endl;
    return 0;
  });
}

int flatten_command(const RunOptions &opts) {
  return with_run("flatten", opts, [&](const RunContext &ctx) -> int {
    const auto valid = runner::run_load_stations_phase(ctx);
    runner::run_flatten_phase(ctx, valid);
    return 0;
  });
}

int neighbors_command(const RunOptions &opts) {
  return with_run("neighbors", opts, [&](const RunContext &ctx) -> int {
    const auto valid = runner::run_load_stations_phase(ctx);
    const auto catalog = runner::run_station_catalog_phase(ctx, valid);
    runner::run_neighbor_graph_phase(ctx, catalog, opts.rebuild_neighbors);
    return 0;
  });
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Station Impute Runner"};
  app.require_subcommand(1);

  RunOptions run_opts;
  RunOptions flatten_opts;
  RunOptions neighbors_opts;

  auto run_cmd = app.add_subcommand("run", "Flatten, build neighbors and impute");
  run_cmd->add_option("--config", run_opts.config_path, "Path to config.yaml")
      ->required();
  run_cmd->add_option("--project-root", run_opts.project_root,
                      "Base directory for relative paths");
  run_cmd->add_option("--workers", run_opts.workers,
                      "Worker threads (0 = runtime.cpu_fraction)")
      ->check(CLI::NonNegativeNumber);
  run_cmd->add_flag("--rebuild-neighbors", run_opts.rebuild_neighbors,
                    "Ignore the neighbor cache");
  run_cmd->add_flag("--dry-run", run_opts.dry_run, "Dry run");

  auto flatten_cmd =
      app.add_subcommand("flatten", "Flatten raw files into the snapshot CSV");
  flatten_cmd->add_option("--config", flatten_opts.config_path, "Path to config.yaml")
      ->required();
  flatten_cmd->add_option("--project-root", flatten_opts.project_root,
                          "Base directory for relative paths");

  auto neighbors_cmd =
      app.add_subcommand("neighbors", "Build or refresh the neighbor cache");
  neighbors_cmd->add_option("--config", neighbors_opts.config_path, "Path to config.yaml")
      ->required();
  neighbors_cmd->add_option("--project-root", neighbors_opts.project_root,
                            "Base directory for relative paths");
  neighbors_cmd->add_flag("--rebuild-neighbors", neighbors_opts.rebuild_neighbors,
                          "Ignore the neighbor cache");

  CLI11_PARSE(app, argc, argv);

  if (run_cmd->parsed()) {
    return run_command(run_opts);
  }
  if (flatten_cmd->parsed()) {
    return flatten_command(flatten_opts);
  }
  if (neighbors_cmd->parsed()) {
    return neighbors_command(neighbors_opts);
  }

  std::cerr << app.help() << std::endl;
  return 1;
}
