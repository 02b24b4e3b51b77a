#pragma once

#include "aperture_view/core/types.hpp"
#include <array>
#include <string>

namespace aperture_view::viewer {

// Chrome elements of the viewer window that can be hidden
enum class ViewElement {
    BUTTONS,
    PANNER,
    MAGNIFIER,
    FILENAME,
    OBJECT,
    INFO
};

constexpr std::array<ViewElement, 6> ALL_VIEW_ELEMENTS = {
    ViewElement::BUTTONS, ViewElement::PANNER, ViewElement::MAGNIFIER,
    ViewElement::FILENAME, ViewElement::OBJECT, ViewElement::INFO};

inline std::string view_element_to_string(ViewElement element) {
    switch (element) {
        case ViewElement::BUTTONS: return "buttons";
        case ViewElement::PANNER: return "panner";
        case ViewElement::MAGNIFIER: return "magnifier";
        case ViewElement::FILENAME: return "filename";
        case ViewElement::OBJECT: return "object";
        case ViewElement::INFO: return "info";
        default: return "unknown";
    }
}

// Control channel of an external image viewer. Every call blocks until the
// viewer has accepted the directive; failures throw ViewerUnavailableError,
// an interrupt by the user throws StopRequested.
class ViewerControl {
public:
    virtual ~ViewerControl() = default;

    virtual void connect() = 0;

    // Region coordinates are equatorial fk5, in degrees
    virtual void set_region_system_fk5_degrees() = 0;

    virtual void load_image(const fs::path& path) = 0;
    virtual void set_pan(double x, double y) = 0;
    virtual void set_zscale() = 0;
    virtual void set_zoom(double level) = 0;
    virtual void zoom_to_fit() = 0;
    virtual void hide_element(ViewElement element) = 0;
    virtual void settle() = 0;
    virtual void load_overlay(const fs::path& path) = 0;
};

} // namespace aperture_view::viewer
