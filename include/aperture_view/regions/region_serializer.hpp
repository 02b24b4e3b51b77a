#pragma once

#include "aperture_view/core/types.hpp"
#include <string>
#include <vector>

namespace aperture_view::regions {

constexpr double DEFAULT_APERTURE_RADIUS_PX = 3.0;
constexpr double DEFAULT_ARCSEC_PER_PIXEL = 5.0;
constexpr double DEFAULT_APERTURE_RADIUS_ARCSEC =
    DEFAULT_APERTURE_RADIUS_PX * DEFAULT_ARCSEC_PER_PIXEL;

// DS9 v4.1 region header: format comment, global style, fk5 system.
const std::string& region_header();

// circle(<ra>,<dec>,<radius>") with ra/dec at 6 decimals
std::string render_aperture(const SkyCoord& coord,
                            double radius_arcsec = DEFAULT_APERTURE_RADIUS_ARCSEC);

// Header followed by one aperture line per coordinate. Deterministic.
std::string render_regions(const std::vector<SkyCoord>& coords,
                           double radius_arcsec = DEFAULT_APERTURE_RADIUS_ARCSEC);

// Reads back the circle directives of an fk5 overlay.
// Comments, the global line and coordinate-system lines are skipped;
// other shapes are ignored. Throws FormatError on an ill-formed circle.
std::vector<CircleRegion> parse_circle_regions(const std::string& text);

} // namespace aperture_view::regions
