#include "aperture_view/core/errors.hpp"
#include "aperture_view/core/utils.hpp"
#include "aperture_view/io/catalog_io.hpp"
#include "aperture_view/regions/region_set.hpp"
#include "test_helpers.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace aperture_view;
using aperture_view::regions::RegionSet;
using aperture_view::testing::TempDir;
using aperture_view::testing::write_catalog;

TEST_CASE("catalog_columns_are_read_in_full") {
  TempDir tmp;
  auto cat = tmp / "proc0001.fits.phot";
  write_catalog(cat, {10, 11, 12}, {20, 21, 22}, {1, 2, 3});

  auto cols = io::read_catalog_columns(cat, CatalogSchema{});
  REQUIRE(cols.ra.size() == 3);
  REQUIRE(cols.dec[2] == Catch::Approx(22));
  REQUIRE(cols.flux[1] == Catch::Approx(2));
  REQUIRE(io::count_catalog_rows(cat, 2) == 3);
}

TEST_CASE("region_set_from_catalog_applies_flux_threshold") {
  TempDir tmp;
  auto cat = tmp / "cat.phot";
  write_catalog(cat, {10, 11, 12, 13}, {20, 21, 22, 23}, {50, 150, 99.9, 500});

  auto set = RegionSet::from_catalog_file(cat);

  REQUIRE(set.size() == 2);
  REQUIRE(set.coordinates()[0] == SkyCoord{11, 21});
  REQUIRE(set.coordinates()[1] == SkyCoord{13, 23});
  REQUIRE(set.radius_arcsec() == Catch::Approx(15.0));
}

TEST_CASE("region_set_uses_configured_column_names") {
  TempDir tmp;
  auto cat = tmp / "cat.phot";
  write_catalog(cat, {"RA_DEG", "DEC_DEG", "FLUX_AUTO"}, {{1, 2}, {3, 4}, {10, 1000}});

  CatalogSchema schema;
  schema.ra_column = "RA_DEG";
  schema.dec_column = "DEC_DEG";
  schema.flux_column = "FLUX_AUTO";
  auto set = RegionSet::from_catalog_file(cat, schema, 5.0);

  REQUIRE(set.size() == 2);
}

TEST_CASE("missing_catalog_file_is_a_catalog_read_error") {
  TempDir tmp;
  auto missing = tmp / "nope.phot";
  try {
    RegionSet::from_catalog_file(missing);
    FAIL("expected CatalogReadError");
  } catch (const CatalogReadError &e) {
    REQUIRE(std::string(e.what()).find(missing.string()) != std::string::npos);
  }
}

TEST_CASE("missing_flux_column_is_a_catalog_read_error") {
  TempDir tmp;
  auto cat = tmp / "noflux.phot";
  write_catalog(cat, {"ra", "dec"}, {{1, 2}, {3, 4}});

  REQUIRE_THROWS_AS(RegionSet::from_catalog_file(cat), CatalogReadError);
}

TEST_CASE("missing_table_hdu_is_a_catalog_read_error") {
  TempDir tmp;
  auto cat = tmp / "cat.phot";
  write_catalog(cat, {1}, {2}, {300});

  CatalogSchema schema;
  schema.hdu = 3;
  REQUIRE_THROWS_AS(RegionSet::from_catalog_file(cat, schema), CatalogReadError);
  schema.hdu = 1;
  REQUIRE_THROWS_AS(RegionSet::from_catalog_file(cat, schema), CatalogReadError);
}

TEST_CASE("from_coordinates_does_not_filter") {
  auto set = RegionSet::from_coordinates({{1, 2}, {3, 4}});
  REQUIRE(set.size() == 2);
  REQUIRE_FALSE(set.empty());
}

TEST_CASE("write_overlay_round_trips_through_the_file") {
  TempDir tmp;
  RegionSet set(std::vector<SkyCoord>{{10.123456, 20.654321}, {11, 21}});
  auto out = tmp / "overlay.reg";

  set.write_overlay(out);

  auto text = core::read_text(out);
  REQUIRE(text == set.render());
  REQUIRE(text.find("circle(10.123456,20.654321,15.0\")") != std::string::npos);

  auto circles = regions::parse_circle_regions(text);
  REQUIRE(circles.size() == 2);
  REQUIRE(circles[1].ra == Catch::Approx(11));
  REQUIRE(circles[1].dec == Catch::Approx(21));
  REQUIRE(circles[1].radius_arcsec == Catch::Approx(15.0));
}

TEST_CASE("write_overlay_twice_gives_identical_files_and_leaves_no_partial") {
  TempDir tmp;
  RegionSet set(std::vector<SkyCoord>{{1, 2}, {3, 4}, {5, 6}});

  set.write_overlay(tmp / "a.reg");
  set.write_overlay(tmp / "b.reg");

  REQUIRE(core::read_text(tmp / "a.reg") == core::read_text(tmp / "b.reg"));
  REQUIRE(testing::count_files(tmp.path()) == 2);
}

TEST_CASE("empty_region_set_writes_header_only_overlay") {
  TempDir tmp;
  RegionSet set(std::vector<SkyCoord>{});
  set.write_overlay(tmp / "empty.reg");

  auto text = core::read_text(tmp / "empty.reg");
  REQUIRE(text == regions::region_header());
}

TEST_CASE("write_overlay_into_missing_directory_throws_io_error") {
  TempDir tmp;
  RegionSet set(std::vector<SkyCoord>{{1, 2}});
  REQUIRE_THROWS_AS(set.write_overlay(tmp / "no" / "such" / "dir.reg"), IOError);
}
