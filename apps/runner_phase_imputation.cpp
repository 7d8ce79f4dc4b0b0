#include "runner_phase_imputation.hpp"

#include "station_impute/core/errors.hpp"
#include "station_impute/core/utils.hpp"
#include "station_impute/pipeline/assembler.hpp"

#include <algorithm>
#include <iostream>

namespace station_impute::runner {

imputation::PartitionResult
run_partition_phase(const RunContext &ctx,
                    const std::vector<FlatObservation> &observations) {
  ctx.emitter.phase_start(ctx.run_id, Phase::PARTITION, ctx.log);

  auto result =
      imputation::partition_by_timestamp(observations, ctx.cfg.schema.features);

  std::cout << "[PARTITION] " << result.slices.size() << " slices, "
            << result.rows << " rows" << std::endl;
  ctx.emitter.phase_end(ctx.run_id, Phase::PARTITION, "ok",
                        {{"slices", result.slices.size()},
                         {"rows", result.rows},
                         {"duplicates_merged", result.duplicates_merged}},
                        ctx.log);
  return result;
}

imputation::ParallelImputationResult
run_imputation_phase(const RunContext &ctx, std::vector<TimeSlice> &slices,
                     const NeighborGraph &graph, int worker_override) {
  ctx.emitter.phase_start(ctx.run_id, Phase::IMPUTATION, ctx.log);

  // Each run starts from an empty log
  core::write_text(ctx.cfg.paths.imputation_log, "");

  imputation::ImputationParams params;
  params.quorum = ctx.cfg.imputation.min_neighbors;
  params.power = ctx.cfg.imputation.idw_power;
  auto policy =
      string_to_zero_distance_policy(ctx.cfg.imputation.zero_distance_weight);
  if (!policy) {
    throw ConfigError("unknown zero_distance_weight '" +
                      ctx.cfg.imputation.zero_distance_weight + "'");
  }
  params.zero_policy = *policy;
  params.chain_imputed = ctx.cfg.imputation.chain_imputed;

  const std::vector<std::string> feature_names =
      ctx.cfg.schema.features.feature_names();

  const int workers =
      worker_override > 0
          ? imputation::compute_worker_count(
                static_cast<unsigned>(worker_override), 1.0, 0, slices.size())
          : imputation::compute_worker_count(ctx.cfg.runtime.cpu_fraction,
                                             ctx.cfg.runtime.max_workers,
                                             slices.size());
  std::cout << "[IMPUTATION] Using " << workers << " parallel workers for "
            << slices.size() << " slices" << std::endl;

  const size_t report_every = std::max<size_t>(1, slices.size() / 20);
  auto result = imputation::run_parallel_imputation(
      slices,
      [&](TimeSlice &slice, const std::string &worker,
          std::vector<ImputationLogEntry> &log) {
        return imputation::impute_slice(slice, graph, feature_names, params,
                                        worker, log);
      },
      workers,
      [&](size_t done, size_t total, int n_workers) {
        if (done % report_every == 0 || done == total) {
          ctx.emitter.phase_progress(ctx.run_id, Phase::IMPUTATION, done, total,
                                     "slices " + std::to_string(done) + "/" +
                                         std::to_string(total) + " workers=" +
                                         std::to_string(n_workers),
                                     ctx.log);
        }
      });

  imputation::write_imputation_log(ctx.cfg.paths.imputation_log, result.log);

  for (const auto &f : result.failures) {
    ctx.emitter.warning(ctx.run_id, "slice failed: " + f.error,
                        {{"phase_name", phase_to_string(Phase::IMPUTATION)},
                         {"slice_index", f.slice_index},
                         {"timestamp", f.timestamp}},
                        ctx.log);
  }

  std::cout << "[IMPUTATION] filled " << result.totals.cells_filled << "/"
            << result.totals.cells_missing << " missing cells, "
            << result.totals.cells_unfilled << " logged to "
            << ctx.cfg.paths.imputation_log << std::endl;

  ctx.emitter.phase_end(
      ctx.run_id, Phase::IMPUTATION, result.failures.empty() ? "ok" : "partial",
      {{"workers", result.workers},
       {"missing", result.totals.cells_missing},
       {"filled", result.totals.cells_filled},
       {"unfilled", result.totals.cells_unfilled},
       {"degenerate_fallbacks", result.totals.degenerate_fallbacks},
       {"slice_failures", result.failures.size()}},
      ctx.log);
  return result;
}

size_t run_assembly_phase(const RunContext &ctx,
                          const std::vector<TimeSlice> &slices,
                          const StationCatalog &catalog) {
  ctx.emitter.phase_start(ctx.run_id, Phase::ASSEMBLY, ctx.log);

  const auto rows = pipeline::assemble_rows(slices, catalog);
  const size_t written = pipeline::write_imputed_csv(
      rows, ctx.cfg.schema.features, ctx.cfg.paths.imputed_csv);

  std::cout << "[ASSEMBLY] " << written << " rows -> "
            << ctx.cfg.paths.imputed_csv << std::endl;
  ctx.emitter.phase_end(ctx.run_id, Phase::ASSEMBLY, "ok",
                        {{"rows", written},
                         {"imputed_csv", ctx.cfg.paths.imputed_csv}},
                        ctx.log);
  return written;
}

} // namespace station_impute::runner
