#pragma once

#include "aperture_view/config/configuration.hpp"
#include "aperture_view/pipeline/orchestration.hpp"
#include "aperture_view/viewer/viewer_session.hpp"
#include "aperture_view/viewer/xpa_viewer_control.hpp"

#include <streambuf>

namespace aperture_view::runner {

viewer::ViewerSettings viewer_settings_from(const config::Config &cfg);
viewer::RegionOptions region_options_from(const config::Config &cfg);
viewer::XpaSettings xpa_settings_from(const config::Config &cfg);
pipeline::ScheduleSettings schedule_from(const config::Config &cfg);

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

} // namespace aperture_view::runner
