#include "aperture_view/viewer/xpa_viewer_control.hpp"
#include "aperture_view/core/errors.hpp"
#include "aperture_view/core/utils.hpp"

#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>
#include <utility>
#include <sys/wait.h>

namespace aperture_view::viewer {

namespace {

// Shortest decimal form that reads back as the same double: 12345.67 -> "12345.67"
std::string format_number(double value) {
    std::string text;
    for (int precision = 1; precision <= std::numeric_limits<double>::max_digits10; ++precision) {
        std::ostringstream oss;
        oss.imbue(std::locale::classic());
        oss << std::setprecision(precision) << value;
        text = oss.str();

        std::istringstream iss(text);
        iss.imbue(std::locale::classic());
        double back = 0.0;
        if ((iss >> back) && back == value) {
            break;
        }
    }
    return text;
}

// std::system ignores SIGINT in the caller while it waits, so a Ctrl-C
// during a directive only shows up in the child's wait status.
void throw_if_interrupted(int status) {
    if (status == -1) {
        return;
    }
    bool killed = WIFSIGNALED(status) && WTERMSIG(status) == SIGINT;
    bool shell_killed = WIFEXITED(status) && WEXITSTATUS(status) == 128 + SIGINT;
    if (killed || shell_killed) {
        throw StopRequested();
    }
}

} // namespace

int run_system_command(const std::string& command) {
    return std::system(command.c_str());
}

XpaViewerControl::XpaViewerControl(XpaSettings settings, CommandRunner runner)
    : settings_(std::move(settings)), runner_(std::move(runner)) {}

std::string XpaViewerControl::command_for(const std::string& directive) const {
    return core::shell_quote(settings_.xpaset_bin) + " -p " +
           core::shell_quote(settings_.target) + " " + directive;
}

void XpaViewerControl::connect() {
    std::string cmd = core::shell_quote(settings_.xpaaccess_bin) + " " +
                      core::shell_quote(settings_.target) + " >/dev/null 2>&1";
    int ret = runner_(cmd);
    throw_if_interrupted(ret);
    if (ret != 0) {
        throw ViewerUnavailableError("no XPA access point '" + settings_.target +
                                     "' (is ds9 running?)");
    }
    connected_ = true;
}

void XpaViewerControl::set(const std::string& directive) {
    if (!connected_) {
        throw ViewerUnavailableError("not connected, cannot send '" + directive + "'");
    }
    int ret = runner_(command_for(directive));
    throw_if_interrupted(ret);
    if (ret != 0) {
        throw ViewerUnavailableError("'" + directive + "' failed on '" + settings_.target +
                                     "' (exit status " + std::to_string(ret) + ")");
    }
}

void XpaViewerControl::set_region_system_fk5_degrees() {
    set("regions system wcs sky fk5 skyformat degrees");
}

void XpaViewerControl::load_image(const fs::path& path) {
    set("file " + core::shell_quote(path.string()));
}

void XpaViewerControl::set_pan(double x, double y) {
    set("pan to " + format_number(x) + " " + format_number(y) + " physical");
}

void XpaViewerControl::set_zscale() {
    set("zscale");
}

void XpaViewerControl::set_zoom(double level) {
    set("zoom " + format_number(level));
}

void XpaViewerControl::zoom_to_fit() {
    set("zoom to fit");
}

void XpaViewerControl::hide_element(ViewElement element) {
    set("view " + view_element_to_string(element) + " no");
}

void XpaViewerControl::settle() {
    set("sleep");
}

void XpaViewerControl::load_overlay(const fs::path& path) {
    set("regions " + core::shell_quote(path.string()));
}

} // namespace aperture_view::viewer
