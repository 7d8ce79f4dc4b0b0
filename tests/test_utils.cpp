#include "station_impute/core/errors.hpp"
#include "station_impute/core/utils.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <limits>

using namespace station_impute;

TEST_CASE("sha256_known_vectors") {
  REQUIRE(core::sha256_text("") ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  REQUIRE(core::sha256_text("abc") ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("format_double_is_locale_free_and_blank_for_missing") {
  REQUIRE(core::format_double(12.5) == "12.5");
  REQUIRE(core::format_double(-0.25) == "-0.25");
  REQUIRE(core::format_double(1013.0) == "1013");
  REQUIRE(core::format_double(kMissing).empty());
}

TEST_CASE("format_double_keeps_full_precision") {
  const double third = 1.0 / 3.0;
  REQUIRE(core::format_double(third) == "0.3333333333333333");
  REQUIRE(core::parse_double(core::format_double(third)).value() == third);
  REQUIRE(core::format_double(0.1) == "0.1");
  REQUIRE(core::format_double(123456.789012345678) == "123456.78901234567");
  REQUIRE(core::format_double(third, 4) == "0.3333");
}

TEST_CASE("parse_double_accepts_whole_literals_only") {
  REQUIRE(core::parse_double("3.5").value() == 3.5);
  REQUIRE(core::parse_double(" -1e2 ").value() == -100.0);
  REQUIRE_FALSE(core::parse_double("").has_value());
  REQUIRE_FALSE(core::parse_double("1.0x").has_value());
  REQUIRE_FALSE(core::parse_double("nan").has_value());
  REQUIRE_FALSE(core::parse_double("inf").has_value());
}

TEST_CASE("round_to_four_decimals") {
  REQUIRE(core::round_to(111.19492664, 4) == 111.1949);
}

TEST_CASE("list_files_filters_and_sorts") {
  test::TempDir tmp;
  test::write_file(tmp.path() / "b.json", "{}");
  test::write_file(tmp.path() / "a.JSON", "{}");
  test::write_file(tmp.path() / "c.txt", "");
  auto files = core::list_files(tmp.path(), ".json");
  REQUIRE(files.size() == 2);
  REQUIRE(files[0].filename() == "a.JSON");
  REQUIRE(files[1].filename() == "b.json");
  REQUIRE(core::list_files(tmp.path() / "missing", ".json").empty());
}

TEST_CASE("write_text_creates_parent_and_read_text_fails_cleanly") {
  test::TempDir tmp;
  const auto p = tmp.path() / "x" / "y" / "z.txt";
  core::write_text(p, "hello");
  REQUIRE(core::read_text(p) == "hello");
  REQUIRE_THROWS_AS(core::read_text(tmp.path() / "nope"), IOError);
}
