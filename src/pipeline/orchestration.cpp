#include "aperture_view/pipeline/orchestration.hpp"
#include "aperture_view/core/errors.hpp"
#include "aperture_view/core/utils.hpp"

#include <utility>

namespace aperture_view::pipeline {

std::vector<DisplayCycle> pair_display_cycles(const fs::path& image_dir,
                                              const fs::path& catalog_dir,
                                              const std::string& image_pattern,
                                              const std::string& catalog_suffix) {
    std::vector<DisplayCycle> cycles;

    auto images = core::discover_files(image_dir, image_pattern);
    cycles.reserve(images.size());
    for (size_t i = 0; i < images.size(); ++i) {
        fs::path catalog = catalog_dir / (images[i].filename().string() + catalog_suffix);
        cycles.push_back({i, images[i], catalog});
    }

    return cycles;
}

OrchestrationLoop::OrchestrationLoop(viewer::ViewerSession& session,
                                     core::DiagnosticsSink& sink, ScheduleSettings settings,
                                     std::atomic<bool>* stop_flag, PauseFn pause)
    : session_(session),
      sink_(sink),
      settings_(settings),
      stop_flag_(stop_flag),
      pause_(std::move(pause)) {
    if (settings_.stride == 0) {
        throw ConfigError("stride must be >= 1");
    }
    if (!pause_) {
        std::atomic<bool>* flag = stop_flag_;
        pause_ = [flag](std::chrono::milliseconds d) { core::pause_for(d, flag); };
    }
}

void OrchestrationLoop::show(const DisplayCycle& cycle) {
    session_.open_file(cycle.image_path);
    if (settings_.hide_ui) {
        session_.hide_ui();
    }
    session_.zoom_level(settings_.review_zoom);
    session_.load_regions(cycle.catalog_path);
}

RunSummary OrchestrationLoop::run(const std::vector<DisplayCycle>& cycles) {
    RunSummary summary;
    summary.enumerated = cycles.size();

    if (!session_.is_open()) {
        session_.open();
    }

    for (const auto& cycle : cycles) {
        if (!is_selected(cycle.index, settings_.stride)) {
            continue;
        }
        if (stop_flag_ && stop_flag_->load()) {
            summary.stopped = true;
            break;
        }

        ++summary.selected;
        sink_.cycle_start(cycle);

        try {
            show(cycle);
            ++summary.displayed;
            sink_.cycle_end(cycle);
        } catch (const CatalogReadError& e) {
            ++summary.failed;
            sink_.cycle_failed(cycle, e.what());
        } catch (const StopRequested&) {
            sink_.warning("Stop requested, ending run during file " + std::to_string(cycle.index));
            summary.stopped = true;
            break;
        }

        try {
            sink_.info("Sleeping");
            pause_(settings_.pause);
        } catch (const StopRequested&) {
            sink_.warning("Stop requested, ending run after file " + std::to_string(cycle.index));
            summary.stopped = true;
            break;
        }
    }

    return summary;
}

} // namespace aperture_view::pipeline
