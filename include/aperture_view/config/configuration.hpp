#pragma once

#include "aperture_view/core/types.hpp"

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace aperture_view::config {

namespace fs = std::filesystem;

struct InputConfig {
  std::string image_pattern = "proc*.fits";
  std::string catalog_suffix = ".phot";   // catalog = <image filename><suffix>
};

struct CatalogConfig {
  int hdu = 2;                            // 1-based; the table follows the primary HDU
  std::string ra_column = "ra";
  std::string dec_column = "dec";
  std::string flux_column = "core3_flux";
  double flux_threshold = 100.0;          // keep detections with flux > threshold
};

struct RegionsConfig {
  double aperture_radius_px = 3.0;
  double arcsec_per_pixel = 5.0;

  double radius_arcsec() const { return aperture_radius_px * arcsec_per_pixel; }
};

struct ViewerConfig {
  std::string target = "ds9";             // XPA access point
  std::string xpaset_bin = "xpaset";
  std::string xpaaccess_bin = "xpaaccess";
  double pan_x = 1024.0;                  // physical pixels
  double pan_y = 1024.0;
  double zoom = 2.0;                      // applied on every image load
  double review_zoom = 2.0;               // applied before the overlay is drawn
  bool hide_ui = false;
};

struct ScheduleConfig {
  int stride = 100;                       // show every Nth image
  double pause_seconds = 2.0;
};

struct Config {
  InputConfig input;
  CatalogConfig catalog;
  RegionsConfig regions;
  ViewerConfig viewer;
  ScheduleConfig schedule;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  CatalogSchema catalog_schema() const;
};

} // namespace aperture_view::config
