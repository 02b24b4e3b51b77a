#include "runner_shared.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>

namespace aperture_view::runner {

viewer::ViewerSettings viewer_settings_from(const config::Config &cfg) {
  viewer::ViewerSettings s;
  s.pan_x = cfg.viewer.pan_x;
  s.pan_y = cfg.viewer.pan_y;
  s.zoom = cfg.viewer.zoom;
  return s;
}

viewer::RegionOptions region_options_from(const config::Config &cfg) {
  viewer::RegionOptions o;
  o.schema = cfg.catalog_schema();
  o.flux_threshold = cfg.catalog.flux_threshold;
  o.radius_arcsec = cfg.regions.radius_arcsec();
  return o;
}

viewer::XpaSettings xpa_settings_from(const config::Config &cfg) {
  viewer::XpaSettings s;
  s.target = cfg.viewer.target;
  s.xpaset_bin = cfg.viewer.xpaset_bin;
  s.xpaaccess_bin = cfg.viewer.xpaaccess_bin;
  return s;
}

pipeline::ScheduleSettings schedule_from(const config::Config &cfg) {
  pipeline::ScheduleSettings s;
  s.stride = static_cast<size_t>(cfg.schedule.stride);
  s.pause = std::chrono::milliseconds(
      static_cast<long long>(std::llround(cfg.schedule.pause_seconds * 1000.0)));
  s.review_zoom = cfg.viewer.review_zoom;
  s.hide_ui = cfg.viewer.hide_ui;
  return s;
}

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF)
    return EOF;
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
  int ra = a_ ? a_->pubsync() : 0;
  int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

} // namespace aperture_view::runner
