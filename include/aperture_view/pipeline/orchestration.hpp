#pragma once

#include "aperture_view/core/events.hpp"
#include "aperture_view/core/types.hpp"
#include "aperture_view/viewer/viewer_session.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace aperture_view::pipeline {

constexpr size_t DEFAULT_STRIDE = 100;
constexpr std::chrono::milliseconds DEFAULT_PAUSE{2000};
constexpr double DEFAULT_REVIEW_ZOOM = 2.0;

struct ScheduleSettings {
    size_t stride = DEFAULT_STRIDE;
    std::chrono::milliseconds pause = DEFAULT_PAUSE;
    double review_zoom = DEFAULT_REVIEW_ZOOM;
    bool hide_ui = false;
};

// Pairs every image in `image_dir` matching `image_pattern` (sorted by name)
// with `catalog_dir / (<image filename> + catalog_suffix)`. Catalogs are not
// required to exist.
std::vector<DisplayCycle> pair_display_cycles(const fs::path& image_dir,
                                              const fs::path& catalog_dir,
                                              const std::string& image_pattern = "proc*.fits",
                                              const std::string& catalog_suffix = ".phot");

inline bool is_selected(size_t index, size_t stride) {
    return stride > 0 && index % stride == 0;
}

// Sleeps between cycles; throws StopRequested to end the run early.
using PauseFn = std::function<void(std::chrono::milliseconds)>;

// Shows every `stride`-th cycle: open image, optionally hide chrome, zoom,
// draw the filtered catalog, pause. Catalog failures are reported and
// skipped; viewer failures end the run by propagating. StopRequested, from
// the pause or from a viewer directive, ends the run with `stopped` set.
class OrchestrationLoop {
public:
    OrchestrationLoop(viewer::ViewerSession& session, core::DiagnosticsSink& sink,
                      ScheduleSettings settings, std::atomic<bool>* stop_flag = nullptr,
                      PauseFn pause = PauseFn());

    RunSummary run(const std::vector<DisplayCycle>& cycles);

private:
    void show(const DisplayCycle& cycle);

    viewer::ViewerSession& session_;
    core::DiagnosticsSink& sink_;
    ScheduleSettings settings_;
    std::atomic<bool>* stop_flag_;
    PauseFn pause_;
};

} // namespace aperture_view::pipeline
