#include "aperture_view/config/configuration.hpp"
#include "aperture_view/core/errors.hpp"

#include <cmath>
#include <fstream>

namespace aperture_view::config {

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["input"]) {
            auto i = node["input"];
            if (i["image_pattern"]) cfg.input.image_pattern = i["image_pattern"].as<std::string>();
            if (i["catalog_suffix"]) cfg.input.catalog_suffix = i["catalog_suffix"].as<std::string>();
        }

        if (node["catalog"]) {
            auto c = node["catalog"];
            if (c["hdu"]) cfg.catalog.hdu = c["hdu"].as<int>();
            if (c["ra_column"]) cfg.catalog.ra_column = c["ra_column"].as<std::string>();
            if (c["dec_column"]) cfg.catalog.dec_column = c["dec_column"].as<std::string>();
            if (c["flux_column"]) cfg.catalog.flux_column = c["flux_column"].as<std::string>();
            if (c["flux_threshold"]) cfg.catalog.flux_threshold = c["flux_threshold"].as<double>();
        }

        if (node["regions"]) {
            auto r = node["regions"];
            if (r["aperture_radius_px"]) cfg.regions.aperture_radius_px = r["aperture_radius_px"].as<double>();
            if (r["arcsec_per_pixel"]) cfg.regions.arcsec_per_pixel = r["arcsec_per_pixel"].as<double>();
        }

        if (node["viewer"]) {
            auto v = node["viewer"];
            if (v["target"]) cfg.viewer.target = v["target"].as<std::string>();
            if (v["xpaset_bin"]) cfg.viewer.xpaset_bin = v["xpaset_bin"].as<std::string>();
            if (v["xpaaccess_bin"]) cfg.viewer.xpaaccess_bin = v["xpaaccess_bin"].as<std::string>();
            if (v["pan_x"]) cfg.viewer.pan_x = v["pan_x"].as<double>();
            if (v["pan_y"]) cfg.viewer.pan_y = v["pan_y"].as<double>();
            if (v["zoom"]) cfg.viewer.zoom = v["zoom"].as<double>();
            if (v["review_zoom"]) cfg.viewer.review_zoom = v["review_zoom"].as<double>();
            if (v["hide_ui"]) cfg.viewer.hide_ui = v["hide_ui"].as<bool>();
        }

        if (node["schedule"]) {
            auto s = node["schedule"];
            if (s["stride"]) cfg.schedule.stride = s["stride"].as<int>();
            if (s["pause_seconds"]) cfg.schedule.pause_seconds = s["pause_seconds"].as<double>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["input"]["image_pattern"] = input.image_pattern;
    node["input"]["catalog_suffix"] = input.catalog_suffix;

    node["catalog"]["hdu"] = catalog.hdu;
    node["catalog"]["ra_column"] = catalog.ra_column;
    node["catalog"]["dec_column"] = catalog.dec_column;
    node["catalog"]["flux_column"] = catalog.flux_column;
    node["catalog"]["flux_threshold"] = catalog.flux_threshold;

    node["regions"]["aperture_radius_px"] = regions.aperture_radius_px;
    node["regions"]["arcsec_per_pixel"] = regions.arcsec_per_pixel;

    node["viewer"]["target"] = viewer.target;
    node["viewer"]["xpaset_bin"] = viewer.xpaset_bin;
    node["viewer"]["xpaaccess_bin"] = viewer.xpaaccess_bin;
    node["viewer"]["pan_x"] = viewer.pan_x;
    node["viewer"]["pan_y"] = viewer.pan_y;
    node["viewer"]["zoom"] = viewer.zoom;
    node["viewer"]["review_zoom"] = viewer.review_zoom;
    node["viewer"]["hide_ui"] = viewer.hide_ui;

    node["schedule"]["stride"] = schedule.stride;
    node["schedule"]["pause_seconds"] = schedule.pause_seconds;

    return node;
}

void Config::validate() const {
    if (input.image_pattern.empty()) {
        throw ConfigError("input.image_pattern must not be empty");
    }

    if (catalog.hdu < 1) {
        throw ConfigError("catalog.hdu must be >= 1");
    }
    if (catalog.ra_column.empty() || catalog.dec_column.empty() || catalog.flux_column.empty()) {
        throw ConfigError("catalog column names must not be empty");
    }
    if (!std::isfinite(catalog.flux_threshold)) {
        throw ConfigError("catalog.flux_threshold must be finite");
    }

    if (!(regions.aperture_radius_px > 0.0)) {
        throw ConfigError("regions.aperture_radius_px must be > 0");
    }
    if (!(regions.arcsec_per_pixel > 0.0)) {
        throw ConfigError("regions.arcsec_per_pixel must be > 0");
    }

    if (viewer.target.empty()) {
        throw ConfigError("viewer.target must not be empty");
    }
    if (!(viewer.zoom > 0.0) || !(viewer.review_zoom > 0.0)) {
        throw ConfigError("viewer.zoom and viewer.review_zoom must be > 0");
    }

    if (schedule.stride < 1) {
        throw ConfigError("schedule.stride must be >= 1");
    }
    if (!(schedule.pause_seconds >= 0.0)) {
        throw ConfigError("schedule.pause_seconds must be >= 0");
    }
}

CatalogSchema Config::catalog_schema() const {
    CatalogSchema schema;
    schema.hdu = catalog.hdu;
    schema.ra_column = catalog.ra_column;
    schema.dec_column = catalog.dec_column;
    schema.flux_column = catalog.flux_column;
    return schema;
}

} // namespace aperture_view::config
