#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace aperture_view {

namespace fs = std::filesystem;

// Catalog columns (one entry per detection)
using VectorXd = Eigen::VectorXd;

// Equatorial position, degrees
struct SkyCoord {
    double ra;
    double dec;
};

inline bool operator==(const SkyCoord& a, const SkyCoord& b) {
    return a.ra == b.ra && a.dec == b.dec;
}

inline bool operator!=(const SkyCoord& a, const SkyCoord& b) {
    return !(a == b);
}

// One circle directive as it appears in an overlay file
struct CircleRegion {
    double ra;
    double dec;
    double radius_arcsec;
};

// Names of the catalog HDU and columns read for each detection
struct CatalogSchema {
    int hdu = 2;                // 1-based, primary HDU is 1
    std::string ra_column = "ra";
    std::string dec_column = "dec";
    std::string flux_column = "core3_flux";
};

// Columns of one catalog, read in full
struct CatalogColumns {
    VectorXd ra;
    VectorXd dec;
    VectorXd flux;
};

// One unit of orchestration work: an image and the catalog derived from it
struct DisplayCycle {
    std::size_t index;
    fs::path image_path;
    fs::path catalog_path;
};

// Outcome of one orchestration run
struct RunSummary {
    std::size_t enumerated = 0;
    std::size_t selected = 0;
    std::size_t displayed = 0;
    std::size_t failed = 0;
    bool stopped = false;
};

} // namespace aperture_view
