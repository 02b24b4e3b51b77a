#pragma once

#include "aperture_view/core/events.hpp"
#include "aperture_view/core/types.hpp"
#include "aperture_view/regions/region_set.hpp"
#include "aperture_view/viewer/viewer_control.hpp"

namespace aperture_view::viewer {

struct ViewerSettings {
    double pan_x = 1024.0;
    double pan_y = 1024.0;
    double zoom = 1.0;
};

// How load_regions turns a catalog into an overlay
struct RegionOptions {
    CatalogSchema schema;
    double flux_threshold = regions::DEFAULT_FLUX_THRESHOLD;
    double radius_arcsec = regions::DEFAULT_APERTURE_RADIUS_ARCSEC;
    fs::path temp_dir;  // empty = system temp directory
};

// The one live viewer session of a run. Tracks the pan, zoom and chrome
// state it has issued. Loading an image resets pan, scale and zoom on the
// viewer, so open_file() re-asserts the configured pan target and zoom.
class ViewerSession {
public:
    ViewerSession(ViewerControl& control, ViewerSettings settings,
                  core::DiagnosticsSink& sink, RegionOptions region_options = RegionOptions{});

    ViewerSession(const ViewerSession&) = delete;
    ViewerSession& operator=(const ViewerSession&) = delete;

    // Connects and selects fk5/degrees region coordinates.
    // Throws ViewerUnavailableError.
    void open();

    void hide_ui();
    ViewerSession& open_file(const fs::path& path);
    ViewerSession& pan_to(double x, double y);
    ViewerSession& set_zscale();
    ViewerSession& zoom_to_fit();
    ViewerSession& zoom_level(double level);

    // Filters `catalog_path`, writes a temporary overlay and loads it.
    // The temporary file is gone when this returns or throws.
    // Returns the number of apertures drawn.
    size_t load_regions(const fs::path& catalog_path);

    bool is_open() const { return open_; }
    double pan_x() const { return pan_x_; }
    double pan_y() const { return pan_y_; }
    double zoom() const { return zoom_; }
    bool ui_visible() const { return ui_visible_; }
    const ViewerSettings& settings() const { return settings_; }

private:
    ViewerControl& control_;
    core::DiagnosticsSink& sink_;
    ViewerSettings settings_;
    RegionOptions region_options_;
    double pan_x_;
    double pan_y_;
    double zoom_;
    bool ui_visible_ = true;
    bool open_ = false;
};

} // namespace aperture_view::viewer
