#pragma once

#include "aperture_view/core/types.hpp"
#include "aperture_view/regions/catalog_filter.hpp"
#include "aperture_view/regions/region_serializer.hpp"

#include <vector>

namespace aperture_view::regions {

// Sky positions to mark on one image. Filtering happens once, when the set
// is built from a catalog; the set itself is immutable.
class RegionSet {
public:
    explicit RegionSet(std::vector<SkyCoord> coords,
                       double radius_arcsec = DEFAULT_APERTURE_RADIUS_ARCSEC);

    static RegionSet from_coordinates(std::vector<SkyCoord> coords,
                                      double radius_arcsec = DEFAULT_APERTURE_RADIUS_ARCSEC);

    // Throws CatalogReadError (unreadable file, missing HDU/column) or
    // FormatError (columns of unequal length).
    static RegionSet from_catalog_file(const fs::path& path,
                                       const CatalogSchema& schema = CatalogSchema{},
                                       double threshold = DEFAULT_FLUX_THRESHOLD,
                                       double radius_arcsec = DEFAULT_APERTURE_RADIUS_ARCSEC);

    std::string render() const;

    // Writes through a sibling ".part" file renamed into place, so readers of
    // `destination` never see a partial overlay. Throws IOError.
    void write_overlay(const fs::path& destination) const;

    const std::vector<SkyCoord>& coordinates() const { return coords_; }
    double radius_arcsec() const { return radius_arcsec_; }
    size_t size() const { return coords_.size(); }
    bool empty() const { return coords_.empty(); }

private:
    std::vector<SkyCoord> coords_;
    double radius_arcsec_;
};

} // namespace aperture_view::regions
