#include "aperture_view/regions/catalog_filter.hpp"
#include "aperture_view/core/errors.hpp"

#include <string>

namespace aperture_view::regions {

std::vector<SkyCoord> filter_detections(const VectorXd& ra, const VectorXd& dec,
                                        const VectorXd& flux, double threshold) {
    if (ra.size() != dec.size() || ra.size() != flux.size()) {
        throw FormatError("catalog columns differ in length (ra=" + std::to_string(ra.size()) +
                          ", dec=" + std::to_string(dec.size()) +
                          ", flux=" + std::to_string(flux.size()) + ")");
    }

    std::vector<SkyCoord> kept;
    kept.reserve(static_cast<size_t>((flux.array() > threshold).count()));

    for (Eigen::Index i = 0; i < flux.size(); ++i) {
        // NaN compares false and is dropped
        if (flux[i] > threshold) {
            kept.push_back({ra[i], dec[i]});
        }
    }

    return kept;
}

std::vector<SkyCoord> filter_detections(const CatalogColumns& columns, double threshold) {
    return filter_detections(columns.ra, columns.dec, columns.flux, threshold);
}

} // namespace aperture_view::regions
