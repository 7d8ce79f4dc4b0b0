#include "station_impute/io/station_catalog.hpp"
#include "station_impute/core/errors.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace station_impute;
using json = nlohmann::json;

namespace {

json catalog_doc() {
  return {{"data",
           json::array(
               {{{"stationAttribute", "auto"},
                 {"item",
                  json::array(
                      {{{"stationID", "A"}, {"longitude", 121.5}, {"latitude", 25.0},
                        {"altitude", 10.0}, {"stationEndDate", ""}},
                       {{"stationID", "B"}, {"longitude", "121.6"},
                        {"latitude", "25.1"}, {"altitude", "n/a"}},
                       {{"stationID", "OLD"}, {"longitude", 120.0}, {"latitude", 23.0},
                        {"stationEndDate", "2019-12-31"}}})}},
                {{"stationAttribute", "manual"},
                 {"item", json::array({{{"stationID", "C"}, {"longitude", 121.0},
                                        {"latitude", 24.0}, {"altitude", 3000}}}})}}})}};
}

} // namespace

TEST_CASE("valid_station_list_trims_and_dedupes") {
  auto s = io::parse_valid_stations("A\n  B \n\nA\r\nC\n");
  REQUIRE(s == std::set<StationId>{"A", "B", "C"});
}

TEST_CASE("valid_station_list_missing_file_throws") {
  test::TempDir tmp;
  REQUIRE_THROWS_AS(io::load_valid_stations(tmp.path() / "nope.txt"), IOError);
}

TEST_CASE("station_catalog_keeps_valid_active_entries") {
  auto cat = io::build_station_catalog(catalog_doc(), {"A", "B", "C"});
  REQUIRE(cat.size() == 3);
  REQUIRE(cat.at("A").longitude == 121.5);
  REQUIRE(cat.at("A").altitude_m.value() == 10.0);
  REQUIRE(cat.at("B").latitude == 25.1);
  REQUIRE_FALSE(cat.at("B").altitude_m.has_value());
  REQUIRE(cat.at("C").altitude_m.value() == 3000.0);
}

TEST_CASE("station_catalog_restricts_to_valid_set") {
  auto cat = io::build_station_catalog(catalog_doc(), {"A"});
  REQUIRE(cat.size() == 1);
  REQUIRE(cat.count("A") == 1);
}

TEST_CASE("station_catalog_reports_every_uncovered_station") {
  try {
    io::build_station_catalog(catalog_doc(), {"A", "OLD", "ZZZ"});
    FAIL("expected MissingStationMetadataError");
  } catch (const MissingStationMetadataError &e) {
    REQUIRE(e.stations() == std::vector<std::string>{"OLD", "ZZZ"});
  }
}

TEST_CASE("station_catalog_load_from_file") {
  test::TempDir tmp;
  test::write_file(tmp.path() / "station_list.json", catalog_doc().dump());
  auto cat = io::load_station_catalog(tmp.path() / "station_list.json", {"C"});
  REQUIRE(cat.size() == 1);

  test::write_file(tmp.path() / "broken.json", "{");
  REQUIRE_THROWS_AS(io::load_station_catalog(tmp.path() / "broken.json", {"C"}),
                    IOError);
}
