#pragma once

#include "aperture_view/viewer/viewer_control.hpp"

#include <functional>
#include <string>

namespace aperture_view::viewer {

// Runs a shell command and returns its exit status (0 = success)
using CommandRunner = std::function<int(const std::string& command)>;

int run_system_command(const std::string& command);

struct XpaSettings {
    std::string target = "ds9";
    std::string xpaset_bin = "xpaset";
    std::string xpaaccess_bin = "xpaaccess";
};

// SAOImage DS9 driven through the XPA command-line tools:
// every directive becomes `xpaset -p <target> <directive>`.
class XpaViewerControl : public ViewerControl {
public:
    explicit XpaViewerControl(XpaSettings settings = XpaSettings{},
                              CommandRunner runner = run_system_command);

    void connect() override;
    void set_region_system_fk5_degrees() override;
    void load_image(const fs::path& path) override;
    void set_pan(double x, double y) override;
    void set_zscale() override;
    void set_zoom(double level) override;
    void zoom_to_fit() override;
    void hide_element(ViewElement element) override;
    void settle() override;
    void load_overlay(const fs::path& path) override;

    bool connected() const { return connected_; }

    // Full shell command issued for `directive`
    std::string command_for(const std::string& directive) const;

private:
    void set(const std::string& directive);

    XpaSettings settings_;
    CommandRunner runner_;
    bool connected_ = false;
};

} // namespace aperture_view::viewer
