#pragma once

#include "aperture_view/core/types.hpp"

namespace aperture_view::io {

// Reads the ra, dec and flux columns named by `schema` from the binary table
// in HDU `schema.hdu`. All three columns are read in full.
// Throws CatalogReadError when the file, HDU or a column cannot be read.
CatalogColumns read_catalog_columns(const fs::path& path, const CatalogSchema& schema);

long count_catalog_rows(const fs::path& path, int hdu);

} // namespace aperture_view::io
