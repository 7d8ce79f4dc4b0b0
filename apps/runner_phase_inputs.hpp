#pragma once

#include "runner_shared.hpp"

#include "station_impute/core/types.hpp"
#include "station_impute/io/raw_records.hpp"
#include "station_impute/spatial/neighbor_graph.hpp"

#include <set>

namespace station_impute::runner {

// LOAD_STATIONS
std::set<StationId> run_load_stations_phase(const RunContext &ctx);

// FLATTEN: flattens raw files and writes the snapshot CSV.
io::FlattenResult run_flatten_phase(const RunContext &ctx,
                                    const std::set<StationId> &valid);

// STATION_CATALOG
StationCatalog run_station_catalog_phase(const RunContext &ctx,
                                         const std::set<StationId> &valid);

// NEIGHBOR_GRAPH
spatial::NeighborGraphResult run_neighbor_graph_phase(const RunContext &ctx,
                                                      const StationCatalog &catalog,
                                                      bool force_rebuild);

} // namespace station_impute::runner
