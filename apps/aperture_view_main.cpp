#include "aperture_view/config/configuration.hpp"
#include "aperture_view/core/errors.hpp"
#include "aperture_view/core/events.hpp"
#include "aperture_view/core/utils.hpp"
#include "aperture_view/io/catalog_io.hpp"
#include "aperture_view/pipeline/orchestration.hpp"
#include "aperture_view/regions/region_set.hpp"
#include "aperture_view/viewer/viewer_session.hpp"
#include "aperture_view/viewer/xpa_viewer_control.hpp"
#include "runner_shared.hpp"

#include <CLI/CLI.hpp>

#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace aperture_view;

namespace {

std::atomic<bool> g_stop_requested{false};

extern "C" void handle_sigint(int) { g_stop_requested.store(true); }

config::Config load_config(const std::string &config_path) {
  if (config_path.empty()) {
    return config::Config{};
  }
  return config::Config::load(config_path);
}

struct ShowOptions {
  std::string images_dir;
  std::string photfiles_dir;
  std::string config_path;
  std::string events_file;
  std::optional<int> zoom;
  std::optional<double> xcoord;
  std::optional<double> ycoord;
  std::optional<int> stride;
  std::optional<double> pause_seconds;
  bool hide_ui = false;
};

int show_command(const ShowOptions &opts) {
  config::Config cfg = load_config(opts.config_path);
  if (opts.zoom) cfg.viewer.zoom = *opts.zoom;
  if (opts.xcoord) cfg.viewer.pan_x = *opts.xcoord;
  if (opts.ycoord) cfg.viewer.pan_y = *opts.ycoord;
  if (opts.stride) cfg.schedule.stride = *opts.stride;
  if (opts.pause_seconds) cfg.schedule.pause_seconds = *opts.pause_seconds;
  if (opts.hide_ui) cfg.viewer.hide_ui = true;
  cfg.validate();

  std::ofstream events_file;
  std::unique_ptr<runner::TeeBuf> tee;
  if (!opts.events_file.empty()) {
    events_file.open(opts.events_file, std::ios::out | std::ios::trunc);
    if (!events_file) {
      throw IOError("Cannot create events file: " + opts.events_file);
    }
    tee = std::make_unique<runner::TeeBuf>(std::cout.rdbuf(), events_file.rdbuf());
  }
  std::ostream event_out(tee ? static_cast<std::streambuf *>(tee.get()) : std::cout.rdbuf());

  core::EventEmitter emitter(core::get_run_id(), event_out);

  auto cycles = pipeline::pair_display_cycles(opts.images_dir, opts.photfiles_dir,
                                              cfg.input.image_pattern,
                                              cfg.input.catalog_suffix);
  emitter.run_start({{"images_dir", opts.images_dir},
                     {"photfiles_dir", opts.photfiles_dir},
                     {"n_images", cycles.size()},
                     {"stride", cfg.schedule.stride},
                     {"zoom", cfg.viewer.zoom},
                     {"hide_ui", cfg.viewer.hide_ui}});

  if (cycles.empty()) {
    std::cerr << "[SHOW] No images matching '" << cfg.input.image_pattern << "' in "
              << opts.images_dir << std::endl;
  }

  viewer::XpaViewerControl control(runner::xpa_settings_from(cfg));
  viewer::ViewerSession session(control, runner::viewer_settings_from(cfg), emitter,
                                runner::region_options_from(cfg));

  std::signal(SIGINT, handle_sigint);

  RunSummary summary;
  try {
    session.open();
    pipeline::OrchestrationLoop loop(session, emitter, runner::schedule_from(cfg),
                                     &g_stop_requested);
    summary = loop.run(cycles);
  } catch (const StopRequested &e) {
    emitter.warning(e.what());
    summary.stopped = true;
  } catch (const ApertureViewError &e) {
    emitter.error(e.what());
    emitter.run_end(summary, "error");
    throw;
  }

  std::string status = summary.stopped ? "stopped" : (summary.failed > 0 ? "partial" : "ok");
  emitter.run_end(summary, status);
  std::cerr << "[SHOW] Displayed " << summary.displayed << " of " << summary.selected
            << " selected images (" << summary.enumerated << " found, " << summary.failed
            << " catalog failures)" << std::endl;
  return summary.failed > 0 ? 2 : 0;
}

int render_command(const std::string &catalog, const std::string &output,
                   const std::string &config_path, bool check) {
  config::Config cfg = load_config(config_path);
  cfg.validate();

  const auto schema = cfg.catalog_schema();
  long total = io::count_catalog_rows(catalog, schema.hdu);
  auto overlay = regions::RegionSet::from_catalog_file(
      catalog, schema, cfg.catalog.flux_threshold, cfg.regions.radius_arcsec());
  overlay.write_overlay(output);

  std::cerr << "[RENDER] " << overlay.size() << " of " << total << " detections above flux "
            << cfg.catalog.flux_threshold << " written to " << output << std::endl;

  if (check) {
    auto circles = regions::parse_circle_regions(core::read_text(output));
    if (circles.size() != overlay.size()) {
      throw FormatError(output + ": expected " + std::to_string(overlay.size()) +
                        " apertures, read back " + std::to_string(circles.size()));
    }
    std::cerr << "[RENDER] Check ok: " << circles.size() << " apertures" << std::endl;
  }
  return 0;
}

int config_dump_command(const std::string &config_path) {
  config::Config cfg = load_config(config_path);
  cfg.validate();
  std::cout << cfg.to_yaml() << std::endl;
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Verify aperture positions from a pipeline run"};
  app.footer("Given a directory of reduced solved images (proc*.fits) and a directory of\n"
             "photometry files (*.phot), show each sampled image in a running ds9 and\n"
             "plot the catalog apertures in equatorial coordinates to check the WCS.");
  app.require_subcommand(1);

  ShowOptions show_opts;
  auto show_cmd = app.add_subcommand("show", "Display images with their catalog apertures");
  show_cmd->add_option("images_dir", show_opts.images_dir, "Directory of proc*.fits images")
      ->required()
      ->check(CLI::ExistingDirectory);
  show_cmd->add_option("-p,--photfiles-dir", show_opts.photfiles_dir,
                       "Directory of .phot catalogs")
      ->required();
  show_cmd->add_option("-z,--zoom", show_opts.zoom, "Zoom level (default 2)");
  show_cmd->add_option("-x,--xcoord", show_opts.xcoord, "X coordinate to pan to");
  show_cmd->add_option("-y,--ycoord", show_opts.ycoord, "Y coordinate to pan to");
  show_cmd->add_flag("--hide-ui", show_opts.hide_ui, "Hide ds9 ui elements");
  show_cmd->add_option("--config", show_opts.config_path, "Path to config.yaml");
  show_cmd->add_option("--stride", show_opts.stride, "Show every Nth image (default 100)");
  show_cmd->add_option("--pause", show_opts.pause_seconds,
                       "Seconds to wait between images (default 2)");
  show_cmd->add_option("--events-file", show_opts.events_file,
                       "Also write the event stream to this file");

  std::string render_catalog, render_output, render_config;
  bool render_check = false;
  auto render_cmd = app.add_subcommand("render", "Write the filtered overlay of one catalog");
  render_cmd->add_option("catalog", render_catalog, "Photometry catalog (.phot)")
      ->required()
      ->check(CLI::ExistingFile);
  render_cmd->add_option("-o,--output", render_output, "Region file to write")->required();
  render_cmd->add_option("--config", render_config, "Path to config.yaml");
  render_cmd->add_flag("--check", render_check, "Re-read the written overlay");

  std::string dump_config;
  auto dump_cmd = app.add_subcommand("config-dump", "Print the effective configuration");
  dump_cmd->add_option("--config", dump_config, "Path to config.yaml");

  CLI11_PARSE(app, argc, argv);

  try {
    if (show_cmd->parsed()) {
      return show_command(show_opts);
    }
    if (render_cmd->parsed()) {
      return render_command(render_catalog, render_output, render_config, render_check);
    }
    if (dump_cmd->parsed()) {
      return config_dump_command(dump_config);
    }
  } catch (const std::exception &e) {
    std::cerr << "[ERROR] " << e.what() << std::endl;
    return 1;
  }

  std::cerr << app.help() << std::endl;
  return 1;
}
