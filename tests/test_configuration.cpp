#include "aperture_view/config/configuration.hpp"
#include "aperture_view/core/errors.hpp"
#include "runner_shared.hpp"
#include "test_helpers.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <fstream>

using aperture_view::ConfigError;
using aperture_view::config::Config;

TEST_CASE("default_config_matches_documented_defaults") {
  Config cfg;
  REQUIRE_NOTHROW(cfg.validate());
  REQUIRE(cfg.input.image_pattern == "proc*.fits");
  REQUIRE(cfg.input.catalog_suffix == ".phot");
  REQUIRE(cfg.catalog.hdu == 2);
  REQUIRE(cfg.catalog.flux_column == "core3_flux");
  REQUIRE(cfg.catalog.flux_threshold == Catch::Approx(100.0));
  REQUIRE(cfg.regions.radius_arcsec() == Catch::Approx(15.0));
  REQUIRE(cfg.viewer.pan_x == Catch::Approx(1024.0));
  REQUIRE(cfg.viewer.zoom == Catch::Approx(2.0));
  REQUIRE(cfg.schedule.stride == 100);
  REQUIRE(cfg.schedule.pause_seconds == Catch::Approx(2.0));
}

TEST_CASE("yaml_overrides_only_named_fields") {
  auto node = YAML::Load(R"(
catalog:
  flux_column: flux_auto
  flux_threshold: 250
viewer:
  target: ds9qa
  hide_ui: true
schedule:
  stride: 10
)");
  Config cfg = Config::from_yaml(node);

  REQUIRE(cfg.catalog.flux_column == "flux_auto");
  REQUIRE(cfg.catalog.flux_threshold == Catch::Approx(250.0));
  REQUIRE(cfg.catalog.ra_column == "ra");
  REQUIRE(cfg.viewer.target == "ds9qa");
  REQUIRE(cfg.viewer.hide_ui);
  REQUIRE(cfg.viewer.review_zoom == Catch::Approx(2.0));
  REQUIRE(cfg.schedule.stride == 10);
}

TEST_CASE("mistyped_yaml_value_is_a_config_error") {
  auto node = YAML::Load("schedule:\n  stride: lots\n");
  REQUIRE_THROWS_AS(Config::from_yaml(node), ConfigError);
}

TEST_CASE("to_yaml_and_back_preserves_values") {
  Config cfg;
  cfg.input.image_pattern = "red*.fits";
  cfg.catalog.hdu = 3;
  cfg.regions.arcsec_per_pixel = 1.5;
  cfg.viewer.pan_y = 512;
  cfg.schedule.pause_seconds = 0.25;

  Config back = Config::from_yaml(YAML::Load(YAML::Dump(cfg.to_yaml())));

  REQUIRE(back.input.image_pattern == "red*.fits");
  REQUIRE(back.catalog.hdu == 3);
  REQUIRE(back.regions.radius_arcsec() == Catch::Approx(4.5));
  REQUIRE(back.viewer.pan_y == Catch::Approx(512.0));
  REQUIRE(back.schedule.pause_seconds == Catch::Approx(0.25));
}

TEST_CASE("load_reads_file_and_rejects_missing_or_broken_files") {
  aperture_view::testing::TempDir tmp;
  {
    std::ofstream out(tmp / "config.yaml");
    out << "viewer:\n  zoom: 4\n";
  }
  REQUIRE(Config::load(tmp / "config.yaml").viewer.zoom == Catch::Approx(4.0));

  REQUIRE_THROWS_AS(Config::load(tmp / "absent.yaml"), ConfigError);

  {
    std::ofstream out(tmp / "broken.yaml");
    out << "viewer: [unclosed\n";
  }
  REQUIRE_THROWS_AS(Config::load(tmp / "broken.yaml"), ConfigError);
}

TEST_CASE("save_then_load_round_trips") {
  aperture_view::testing::TempDir tmp;
  Config cfg;
  cfg.viewer.xpaset_bin = "/opt/xpa/bin/xpaset";
  cfg.save(tmp / "saved.yaml");
  REQUIRE(Config::load(tmp / "saved.yaml").viewer.xpaset_bin == "/opt/xpa/bin/xpaset");
}

TEST_CASE("validate_rejects_out_of_range_values") {
  auto rejects = [](void (*mutate)(Config &)) {
    Config cfg;
    mutate(cfg);
    REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
  };

  rejects([](Config &c) { c.schedule.stride = 0; });
  rejects([](Config &c) { c.schedule.pause_seconds = -1.0; });
  rejects([](Config &c) { c.viewer.zoom = 0.0; });
  rejects([](Config &c) { c.viewer.review_zoom = -2.0; });
  rejects([](Config &c) { c.regions.aperture_radius_px = 0.0; });
  rejects([](Config &c) { c.regions.arcsec_per_pixel = -5.0; });
  rejects([](Config &c) { c.catalog.flux_column.clear(); });
  rejects([](Config &c) { c.catalog.hdu = 0; });
  rejects([](Config &c) { c.viewer.target.clear(); });
  rejects([](Config &c) { c.input.image_pattern.clear(); });
}

TEST_CASE("catalog_schema_carries_configured_columns") {
  Config cfg;
  cfg.catalog.hdu = 4;
  cfg.catalog.dec_column = "delta";
  auto schema = cfg.catalog_schema();
  REQUIRE(schema.hdu == 4);
  REQUIRE(schema.ra_column == "ra");
  REQUIRE(schema.dec_column == "delta");
  REQUIRE(schema.flux_column == "core3_flux");
}

TEST_CASE("runner_settings_follow_config") {
  namespace runner = aperture_view::runner;
  Config cfg;
  cfg.viewer.pan_x = 300;
  cfg.viewer.zoom = 3;
  cfg.viewer.review_zoom = 1;
  cfg.viewer.hide_ui = true;
  cfg.viewer.target = "qa";
  cfg.schedule.stride = 7;
  cfg.schedule.pause_seconds = 1.5;
  cfg.regions.aperture_radius_px = 2;

  auto viewer = runner::viewer_settings_from(cfg);
  REQUIRE(viewer.pan_x == Catch::Approx(300.0));
  REQUIRE(viewer.pan_y == Catch::Approx(1024.0));
  REQUIRE(viewer.zoom == Catch::Approx(3.0));

  auto schedule = runner::schedule_from(cfg);
  REQUIRE(schedule.stride == 7);
  REQUIRE(schedule.pause == std::chrono::milliseconds(1500));
  REQUIRE(schedule.review_zoom == Catch::Approx(1.0));
  REQUIRE(schedule.hide_ui);

  REQUIRE(runner::xpa_settings_from(cfg).target == "qa");
  REQUIRE(runner::region_options_from(cfg).radius_arcsec == Catch::Approx(10.0));
}
