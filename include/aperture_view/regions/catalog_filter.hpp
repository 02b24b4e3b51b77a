#pragma once

#include "aperture_view/core/types.hpp"
#include <vector>

namespace aperture_view::regions {

// Flux proxy a detection must exceed to be shown
constexpr double DEFAULT_FLUX_THRESHOLD = 100.0;

// Keeps (ra[i], dec[i]) for every i with flux[i] > threshold, in input order.
// Throws FormatError if the columns differ in length.
std::vector<SkyCoord> filter_detections(const VectorXd& ra, const VectorXd& dec,
                                        const VectorXd& flux,
                                        double threshold = DEFAULT_FLUX_THRESHOLD);

std::vector<SkyCoord> filter_detections(const CatalogColumns& columns,
                                        double threshold = DEFAULT_FLUX_THRESHOLD);

} // namespace aperture_view::regions
