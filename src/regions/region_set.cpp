#include "aperture_view/regions/region_set.hpp"
#include "aperture_view/core/errors.hpp"
#include "aperture_view/io/catalog_io.hpp"

#include <fstream>
#include <system_error>
#include <utility>

namespace aperture_view::regions {

RegionSet::RegionSet(std::vector<SkyCoord> coords, double radius_arcsec)
    : coords_(std::move(coords)), radius_arcsec_(radius_arcsec) {}

RegionSet RegionSet::from_coordinates(std::vector<SkyCoord> coords, double radius_arcsec) {
    return RegionSet(std::move(coords), radius_arcsec);
}

RegionSet RegionSet::from_catalog_file(const fs::path& path, const CatalogSchema& schema,
                                       double threshold, double radius_arcsec) {
    CatalogColumns columns = io::read_catalog_columns(path, schema);
    try {
        return RegionSet(filter_detections(columns, threshold), radius_arcsec);
    } catch (const FormatError& e) {
        throw FormatError(path.string() + ": " + e.what());
    }
}

std::string RegionSet::render() const {
    return render_regions(coords_, radius_arcsec_);
}

void RegionSet::write_overlay(const fs::path& destination) const {
    const std::string text = render();
    fs::path partial = destination;
    partial += ".part";

    {
        std::ofstream out(partial, std::ios::out | std::ios::trunc);
        if (!out) {
            throw IOError("Cannot create overlay file: " + partial.string());
        }
        out << text;
        out.flush();
        if (!out) {
            out.close();
            std::error_code ec;
            fs::remove(partial, ec);
            throw IOError("Cannot write overlay file: " + partial.string());
        }
    }

    std::error_code ec;
    fs::rename(partial, destination, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(partial, rm_ec);
        throw IOError("Cannot move overlay into place: " + destination.string() + ": " +
                      ec.message());
    }
}

} // namespace aperture_view::regions
