#include "station_impute/imputation/idw_worker.hpp"
#include "station_impute/imputation/partition.hpp"
#include "station_impute/io/sentinel.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>

using namespace station_impute;
using namespace station_impute::imputation;

namespace {

// Target T with neighbors at increasing distance
NeighborGraph line_graph() {
  NeighborGraph g;
  g["T"] = {{"N1", 1.0}, {"N2", 2.0}, {"N3", 4.0}, {"N4", 8.0}};
  g["N1"] = {{"T", 1.0}, {"N2", 1.0}, {"N3", 3.0}, {"N4", 7.0}};
  g["N2"] = {{"N1", 1.0}, {"T", 2.0}, {"N3", 2.0}, {"N4", 6.0}};
  g["N3"] = {{"N2", 2.0}, {"N1", 3.0}, {"T", 4.0}, {"N4", 4.0}};
  g["N4"] = {{"N3", 4.0}, {"N2", 6.0}, {"N1", 7.0}, {"T", 8.0}};
  return g;
}

TimeSlice make_slice(const std::vector<std::pair<StationId, double>> &rows) {
  TimeSlice s;
  s.timestamp = "2024-01-01T00:00:00";
  s.values = Matrix2Dd::Constant(static_cast<Eigen::Index>(rows.size()), 1, kMissing);
  for (size_t i = 0; i < rows.size(); ++i) {
    s.stations.push_back(rows[i].first);
    s.row_index[rows[i].first] = static_cast<Eigen::Index>(i);
    s.values(static_cast<Eigen::Index>(i), 0) = rows[i].second;
  }
  return s;
}

const std::vector<std::string> kFeature = {"AirTemperature_Instantaneous"};

} // namespace

TEST_CASE("idw_weights_by_inverse_square_distance") {
  ImputationParams p;
  auto est = estimate_idw({{10.0, 1.0}, {20.0, 2.0}}, p);
  // w = 1, 0.25
  REQUIRE(est.value == Catch::Approx((10.0 + 20.0 * 0.25) / 1.25));
  REQUIRE_FALSE(est.fallback_used);
}

TEST_CASE("idw_exclude_drops_colocated_candidate") {
  ImputationParams p;
  auto est = estimate_idw({{100.0, 0.0}, {10.0, 1.0}, {20.0, 1.0}}, p);
  REQUIRE(est.value == Catch::Approx(15.0));
  REQUIRE_FALSE(est.fallback_used);
}

TEST_CASE("idw_all_colocated_falls_back_to_mean") {
  ImputationParams p;
  auto est = estimate_idw({{1.0, 0.0}, {2.0, 0.0}, {6.0, 0.0}}, p);
  REQUIRE(est.fallback_used);
  REQUIRE(est.value == Catch::Approx(3.0));
}

TEST_CASE("idw_exact_policy_uses_colocated_values") {
  ImputationParams p;
  p.zero_policy = ZeroDistancePolicy::EXACT;
  auto est = estimate_idw({{100.0, 0.0}, {10.0, 1.0}, {20.0, 1.0}}, p);
  REQUIRE(est.value == 100.0);
  REQUIRE_FALSE(est.fallback_used);

  auto no_zero = estimate_idw({{10.0, 1.0}, {20.0, 1.0}}, p);
  REQUIRE(no_zero.value == Catch::Approx(15.0));
}

TEST_CASE("idw_estimate_stays_within_candidate_range") {
  ImputationParams p;
  p.power = 3.0;
  const std::vector<IdwCandidate> c = {{-5.0, 0.3}, {12.0, 7.0}, {3.0, 2.5}, {8.0, 0.0}};
  for (auto policy : {ZeroDistancePolicy::EXCLUDE, ZeroDistancePolicy::EXACT}) {
    p.zero_policy = policy;
    auto est = estimate_idw(c, p);
    REQUIRE(est.value >= -5.0);
    REQUIRE(est.value <= 12.0);
  }
}

TEST_CASE("impute_slice_fills_with_nearest_quorum") {
  auto slice = make_slice({{"N1", 10.0}, {"N2", 20.0}, {"N3", 40.0},
                           {"N4", 1000.0}, {"T", kMissing}});
  std::vector<ImputationLogEntry> log;
  auto stats = impute_slice(slice, line_graph(), kFeature, ImputationParams{}, "worker-0", log);

  REQUIRE(log.empty());
  REQUIRE(stats.cells_missing == 1);
  REQUIRE(stats.cells_filled == 1);
  // N4 lies beyond the quorum and must not contribute
  const double expected = (10.0 * 1.0 + 20.0 * 0.25 + 40.0 / 16.0) / (1.0 + 0.25 + 1.0 / 16.0);
  REQUIRE(slice.values(slice.row_of("T"), 0) == Catch::Approx(expected));
  REQUIRE(stats.filled_per_feature[0] == 1);
}

TEST_CASE("impute_slice_two_neighbors_below_quorum_logs_once") {
  auto slice = make_slice({{"N1", 10.0}, {"N3", kMissing}, {"T", kMissing}, {"N2", 20.0}});
  std::vector<ImputationLogEntry> log;
  auto stats = impute_slice(slice, line_graph(), kFeature, ImputationParams{}, "worker-3", log);

  // T and N3 each see only N1 and N2
  REQUIRE(stats.cells_missing == 2);
  REQUIRE(stats.cells_unfilled == 2);
  REQUIRE(log.size() == 2);
  REQUIRE(is_missing(slice.values(slice.row_of("T"), 0)));

  auto it = std::find_if(log.begin(), log.end(),
                         [](const ImputationLogEntry &e) { return e.station == "T"; });
  REQUIRE(it != log.end());
  REQUIRE(it->candidates_found == 2);
  REQUIRE(it->quorum == 3);
  REQUIRE(it->feature == kFeature[0]);
  REQUIRE(format_log_line(*it) ==
          "[2024-01-01T00:00:00][worker-3] T/AirTemperature_Instantaneous nbr<3 "
          "insufficient_neighbors found=2");
}

TEST_CASE("impute_slice_filled_values_feed_later_rows") {
  // N1 is filled first from N2 and N3; T then takes that value as its
  // nearest candidate.
  auto slice = make_slice({{"N1", kMissing}, {"N2", 20.0}, {"N3", 40.0}, {"T", kMissing}});
  ImputationParams p;
  p.quorum = 2;
  std::vector<ImputationLogEntry> log;
  auto stats = impute_slice(slice, line_graph(), kFeature, p, "w", log);
  REQUIRE(stats.cells_filled == 2);

  const double n1 = (20.0 + 40.0 / 9.0) / (1.0 + 1.0 / 9.0);
  const double expected_t = (n1 + 20.0 * 0.25) / 1.25;
  REQUIRE(slice.values(slice.row_of("N1"), 0) == Catch::Approx(n1));
  REQUIRE(slice.values(slice.row_of("T"), 0) == Catch::Approx(expected_t));
}

TEST_CASE("impute_slice_without_chaining_reads_original_values") {
  auto slice = make_slice({{"N1", kMissing}, {"N2", 20.0}, {"N3", 40.0}, {"T", kMissing}});
  ImputationParams p;
  p.quorum = 2;
  p.chain_imputed = false;
  std::vector<ImputationLogEntry> log;
  auto stats = impute_slice(slice, line_graph(), kFeature, p, "w", log);
  REQUIRE(stats.cells_filled == 2);
  const double expected_t = (20.0 * 0.25 + 40.0 / 16.0) / (0.25 + 1.0 / 16.0);
  REQUIRE(slice.values(slice.row_of("T"), 0) == Catch::Approx(expected_t));
}

TEST_CASE("impute_slice_chained_value_completes_quorum") {
  // T only knows A, B, C; A has no value until it is filled from B, C, D.
  NeighborGraph g;
  g["A"] = {{"B", 1.0}, {"C", 2.0}, {"D", 3.0}};
  g["B"] = {{"A", 1.0}, {"C", 1.0}, {"D", 2.0}};
  g["C"] = {{"B", 1.0}, {"A", 2.0}, {"D", 1.0}};
  g["D"] = {{"C", 1.0}, {"B", 2.0}, {"A", 3.0}};
  g["T"] = {{"A", 1.0}, {"B", 2.0}, {"C", 3.0}};
  const std::vector<std::pair<StationId, double>> rows = {
      {"A", kMissing}, {"B", 20.0}, {"C", 30.0}, {"D", 40.0}, {"T", kMissing}};

  auto chained = make_slice(rows);
  std::vector<ImputationLogEntry> log;
  auto stats = impute_slice(chained, g, kFeature, ImputationParams{}, "w", log);
  REQUIRE(stats.cells_filled == 2);
  REQUIRE(log.empty());
  const double a = (20.0 + 30.0 / 4.0 + 40.0 / 9.0) / (1.0 + 0.25 + 1.0 / 9.0);
  const double t = (a + 20.0 / 4.0 + 30.0 / 9.0) / (1.0 + 0.25 + 1.0 / 9.0);
  REQUIRE(chained.values(chained.row_of("A"), 0) == Catch::Approx(a));
  REQUIRE(chained.values(chained.row_of("T"), 0) == Catch::Approx(t));

  auto plain = make_slice(rows);
  ImputationParams p;
  p.chain_imputed = false;
  log.clear();
  stats = impute_slice(plain, g, kFeature, p, "w", log);
  REQUIRE(stats.cells_filled == 1);
  REQUIRE(stats.cells_unfilled == 1);
  REQUIRE(log.size() == 1);
  REQUIRE(log[0].station == "T");
  REQUIRE(log[0].candidates_found == 2);
  REQUIRE(is_missing(plain.values(plain.row_of("T"), 0)));
}

TEST_CASE("impute_slice_sentinel_never_enters_weighting") {
  io::SentinelNormalizer norm;
  FeatureSchema schema;
  schema.groups = {{"AirTemperature", {"Instantaneous"}}};

  auto value = [&](double raw) { return norm.normalize(raw); };
  std::vector<FlatObservation> rows = {
      {"N1", "t", {value(-99.5)}},
      {"N2", "t", {value(20.0)}},
      {"N3", "t", {value(40.0)}},
      {"N4", "t", {value(80.0)}},
      {"T", "t", {value(-99.5)}},
  };
  auto part = partition_by_timestamp(rows, schema);
  REQUIRE(part.slices.size() == 1);
  auto &slice = part.slices[0];

  std::vector<ImputationLogEntry> log;
  impute_slice(slice, line_graph(), schema.feature_names(), ImputationParams{}, "w", log);

  // N1 sorts first and is filled from N2, N3, N4 before T reads it
  const double n1 = (20.0 + 40.0 / 9.0 + 80.0 / 49.0) / (1.0 + 1.0 / 9.0 + 1.0 / 49.0);
  const double expected = (n1 + 20.0 * 0.25 + 40.0 / 16.0) / (1.0 + 0.25 + 1.0 / 16.0);
  REQUIRE(slice.values(slice.row_of("N1"), 0) == Catch::Approx(n1));
  REQUIRE(slice.values(slice.row_of("T"), 0) == Catch::Approx(expected));
  REQUIRE(slice.values(slice.row_of("T"), 0) > 0.0);
}

TEST_CASE("impute_slice_degenerate_weights_are_counted") {
  NeighborGraph g;
  g["T"] = {{"A", 0.0}, {"B", 0.0}, {"C", 0.0}};
  g["A"] = {{"T", 0.0}, {"B", 0.0}, {"C", 0.0}};
  g["B"] = {{"T", 0.0}, {"A", 0.0}, {"C", 0.0}};
  g["C"] = {{"T", 0.0}, {"A", 0.0}, {"B", 0.0}};
  auto slice = make_slice({{"A", 1.0}, {"B", 2.0}, {"C", 3.0}, {"T", kMissing}});
  std::vector<ImputationLogEntry> log;
  auto stats = impute_slice(slice, g, kFeature, ImputationParams{}, "w", log);
  REQUIRE(stats.degenerate_fallbacks == 1);
  REQUIRE(slice.values(slice.row_of("T"), 0) == Catch::Approx(2.0));
}
