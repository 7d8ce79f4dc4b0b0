#include "station_impute/imputation/partition.hpp"
#include "station_impute/io/table_io.hpp"
#include "station_impute/pipeline/assembler.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace station_impute;

namespace {

FeatureSchema one_feature() {
  FeatureSchema s;
  s.groups = {{"T", {"a"}}};
  return s;
}

} // namespace

TEST_CASE("assembly_conserves_rows_and_joins_metadata") {
  std::vector<FlatObservation> flat = {
      {"B", "t2", {1.5}},
      {"A", "t1", {std::nullopt}},
      {"A", "t2", {2.0}},
      {"X", "t1", {3.0}},
  };
  auto part = imputation::partition_by_timestamp(flat, one_feature());

  StationCatalog cat;
  cat["A"] = {"A", 121.5, 25.0, 10.0};
  cat["B"] = {"B", 121.6, 25.1, std::nullopt};

  auto rows = pipeline::assemble_rows(part.slices, cat);
  REQUIRE(rows.size() == flat.size());
  REQUIRE(rows[0].station_id == "A");
  REQUIRE(rows[0].timestamp == "t1");
  REQUIRE(rows[1].station_id == "X");
  REQUIRE(rows[1].metadata == nullptr);
  REQUIRE(rows[2].station_id == "A");
  REQUIRE(rows[3].station_id == "B");
  REQUIRE(rows[3].metadata->longitude == 121.6);

  test::TempDir tmp;
  const auto path = tmp.path() / "out" / "imputed.csv";
  REQUIRE(pipeline::write_imputed_csv(rows, one_feature(), path) == 4);
  REQUIRE(test::read_file(path) ==
          "StationID,DataTime,T_a,Longitude,Latitude,Altitude\n"
          "A,t1,,121.5,25,10\n"
          "X,t1,3,,,\n"
          "A,t2,2,121.5,25,10\n"
          "B,t2,1.5,121.6,25.1,\n");
}

TEST_CASE("flat_csv_snapshot_layout") {
  FeatureSchema s;
  s.groups = {{"AirTemperature", {"Instantaneous", "Maximum"}}};
  std::vector<FlatObservation> flat = {{"466920", "2024-01-01T00:00:00", {12.25, std::nullopt}}};

  test::TempDir tmp;
  const auto path = tmp.path() / "cleaned.csv";
  REQUIRE(io::write_flat_csv(flat, s, path) == 1);
  REQUIRE(test::read_file(path) ==
          "StationID,DataTime,AirTemperature_Instantaneous,AirTemperature_Maximum\n"
          "466920,2024-01-01T00:00:00,12.25,\n");
}

TEST_CASE("csv_cells_are_quoted_when_needed") {
  REQUIRE(io::csv_escape("plain") == "plain");
  REQUIRE(io::csv_escape("a,b") == "\"a,b\"");
  REQUIRE(io::csv_escape("say \"hi\"") == "\"say \"\"hi\"\"\"");
}

TEST_CASE("flat_csv_cells_keep_full_precision") {
  FeatureSchema s;
  s.groups = {{"AirTemperature", {"Instantaneous"}}};
  const double third = 1.0 / 3.0;
  std::vector<FlatObservation> flat = {{"466920", "2024-01-01T00:00:00", {third}}};

  test::TempDir tmp;
  const auto path = tmp.path() / "imputed.csv";
  REQUIRE(io::write_flat_csv(flat, s, path) == 1);
  REQUIRE(test::read_file(path) ==
          "StationID,DataTime,AirTemperature_Instantaneous\n"
          "466920,2024-01-01T00:00:00,0.3333333333333333\n");
}
