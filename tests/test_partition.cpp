#include "station_impute/imputation/partition.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace station_impute;

namespace {

FeatureSchema two_features() {
  FeatureSchema s;
  s.groups = {{"T", {"a", "b"}}};
  return s;
}

FlatObservation obs(const std::string &sid, const std::string &ts,
                    std::optional<double> a, std::optional<double> b) {
  return {sid, ts, {a, b}};
}

} // namespace

TEST_CASE("partition_groups_by_timestamp_in_order") {
  std::vector<FlatObservation> rows = {
      obs("B", "2024-01-01T01:00", 1.0, 2.0),
      obs("A", "2024-01-01T00:00", 3.0, std::nullopt),
      obs("C", "2024-01-01T01:00", std::nullopt, 4.0),
      obs("A", "2024-01-01T01:00", 5.0, 6.0),
  };
  auto r = imputation::partition_by_timestamp(rows, two_features());

  REQUIRE(r.slices.size() == 2);
  REQUIRE(r.rows == rows.size());
  REQUIRE(r.duplicates_merged == 0);

  const auto &s0 = r.slices[0];
  REQUIRE(s0.timestamp == "2024-01-01T00:00");
  REQUIRE(s0.stations == std::vector<StationId>{"A"});
  REQUIRE(s0.values(0, 0) == 3.0);
  REQUIRE(is_missing(s0.values(0, 1)));

  const auto &s1 = r.slices[1];
  REQUIRE(s1.stations == std::vector<StationId>{"A", "B", "C"});
  REQUIRE(s1.values.rows() == 3);
  REQUIRE(s1.values.cols() == 2);
  REQUIRE(s1.row_of("B") == 1);
  REQUIRE(s1.row_of("Z") == -1);
  REQUIRE(s1.values(1, 1) == 2.0);
  REQUIRE(is_missing(s1.values(2, 0)));
}

TEST_CASE("partition_merges_duplicate_station_rows") {
  std::vector<FlatObservation> rows = {
      obs("A", "t", std::nullopt, 1.0),
      obs("A", "t", 7.0, 9.0),
      obs("A", "t", 8.0, std::nullopt),
  };
  auto r = imputation::partition_by_timestamp(rows, two_features());
  REQUIRE(r.slices.size() == 1);
  REQUIRE(r.rows == 1);
  REQUIRE(r.duplicates_merged == 2);
  REQUIRE(r.slices[0].values(0, 0) == 7.0);
  REQUIRE(r.slices[0].values(0, 1) == 1.0);
}

TEST_CASE("partition_of_nothing_is_empty") {
  auto r = imputation::partition_by_timestamp({}, two_features());
  REQUIRE(r.slices.empty());
  REQUIRE(r.rows == 0);
}
