#include "aperture_view/viewer/viewer_session.hpp"
#include "aperture_view/viewer/temporary_overlay.hpp"

#include <sstream>
#include <utility>

namespace aperture_view::viewer {

ViewerSession::ViewerSession(ViewerControl& control, ViewerSettings settings,
                             core::DiagnosticsSink& sink, RegionOptions region_options)
    : control_(control),
      sink_(sink),
      settings_(settings),
      region_options_(std::move(region_options)),
      pan_x_(settings.pan_x),
      pan_y_(settings.pan_y),
      zoom_(settings.zoom) {}

void ViewerSession::open() {
    sink_.info("Connecting to viewer");
    control_.connect();
    control_.set_region_system_fk5_degrees();
    open_ = true;
    sink_.info("Viewer session initialized");
}

void ViewerSession::hide_ui() {
    sink_.info("Hiding ui, this may take a while");
    for (ViewElement element : ALL_VIEW_ELEMENTS) {
        control_.hide_element(element);
    }
    control_.settle();
    ui_visible_ = false;
}

ViewerSession& ViewerSession::open_file(const fs::path& path) {
    sink_.info("Opening file " + path.string());
    control_.load_image(path);
    pan_to(settings_.pan_x, settings_.pan_y);
    set_zscale();
    zoom_level(settings_.zoom);
    return *this;
}

ViewerSession& ViewerSession::pan_to(double x, double y) {
    control_.set_pan(x, y);
    pan_x_ = x;
    pan_y_ = y;
    return *this;
}

ViewerSession& ViewerSession::set_zscale() {
    control_.set_zscale();
    return *this;
}

ViewerSession& ViewerSession::zoom_to_fit() {
    control_.zoom_to_fit();
    return *this;
}

ViewerSession& ViewerSession::zoom_level(double level) {
    control_.set_zoom(level);
    zoom_ = level;
    return *this;
}

size_t ViewerSession::load_regions(const fs::path& catalog_path) {
    sink_.info("Loading regions from " + catalog_path.string());

    auto region_set = regions::RegionSet::from_catalog_file(
        catalog_path, region_options_.schema, region_options_.flux_threshold,
        region_options_.radius_arcsec);

    TemporaryOverlay overlay("regions.", ".ds9", region_options_.temp_dir);
    region_set.write_overlay(overlay.path());

    std::ostringstream msg;
    msg << "Rendering " << region_set.size() << " regions from " << overlay.path().string();
    sink_.info(msg.str());

    control_.load_overlay(overlay.path());
    return region_set.size();
}

} // namespace aperture_view::viewer
