#include "aperture_view/io/catalog_io.hpp"
#include "aperture_view/core/errors.hpp"

#include <fitsio.h>
#include <string>
#include <vector>

namespace aperture_view::io {

namespace {

std::string fits_status_text(int status) {
    char text[FLEN_STATUS];
    fits_get_errstatus(status, text);
    return std::string(text);
}

fitsfile* open_table(const fs::path& path, int hdu) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw CatalogReadError("Cannot open catalog " + path.string() + ": " +
                               fits_status_text(status));
    }

    int hdu_type = 0;
    fits_movabs_hdu(fptr, hdu, &hdu_type, &status);
    if (status) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw CatalogReadError("Catalog " + path.string() + " has no HDU " +
                               std::to_string(hdu));
    }

    if (hdu_type != BINARY_TBL && hdu_type != ASCII_TBL) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw CatalogReadError("HDU " + std::to_string(hdu) + " of " + path.string() +
                               " is not a table");
    }

    return fptr;
}

VectorXd read_double_column(fitsfile* fptr, const fs::path& path,
                            const std::string& name, long nrows) {
    int status = 0;
    int colnum = 0;

    fits_get_colnum(fptr, CASEINSEN, const_cast<char*>(name.c_str()), &colnum, &status);
    if (status) {
        throw CatalogReadError("Catalog " + path.string() + " has no column '" + name + "'");
    }

    VectorXd values(nrows);
    if (nrows == 0) {
        return values;
    }

    double nulval = 0.0;
    int anynul = 0;
    fits_read_col(fptr, TDOUBLE, colnum, 1, 1, nrows, &nulval, values.data(), &anynul, &status);
    if (status) {
        throw CatalogReadError("Cannot read column '" + name + "' of " + path.string() +
                               ": " + fits_status_text(status));
    }

    return values;
}

} // namespace

CatalogColumns read_catalog_columns(const fs::path& path, const CatalogSchema& schema) {
    fitsfile* fptr = open_table(path, schema.hdu);

    int status = 0;
    long nrows = 0;
    fits_get_num_rows(fptr, &nrows, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw CatalogReadError("Cannot read row count of " + path.string());
    }

    CatalogColumns columns;
    try {
        columns.ra = read_double_column(fptr, path, schema.ra_column, nrows);
        columns.dec = read_double_column(fptr, path, schema.dec_column, nrows);
        columns.flux = read_double_column(fptr, path, schema.flux_column, nrows);
    } catch (const CatalogReadError&) {
        status = 0;
        fits_close_file(fptr, &status);
        throw;
    }

    status = 0;
    fits_close_file(fptr, &status);
    return columns;
}

long count_catalog_rows(const fs::path& path, int hdu) {
    fitsfile* fptr = open_table(path, hdu);

    int status = 0;
    long nrows = 0;
    fits_get_num_rows(fptr, &nrows, &status);
    int close_status = 0;
    fits_close_file(fptr, &close_status);

    if (status) {
        throw CatalogReadError("Cannot read row count of " + path.string());
    }
    return nrows;
}

} // namespace aperture_view::io
