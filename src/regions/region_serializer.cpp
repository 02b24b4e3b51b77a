#include "aperture_view/regions/region_serializer.hpp"
#include "aperture_view/core/errors.hpp"
#include "aperture_view/core/utils.hpp"

#include <iomanip>
#include <locale>
#include <sstream>

namespace aperture_view::regions {

namespace {

std::string format_fixed(double value, int precision) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

// Fixed notation without trailing zeros, keeping one decimal: 15 -> "15.0"
std::string format_compact(double value) {
    std::string s = format_fixed(value, 6);
    auto dot = s.find('.');
    if (dot == std::string::npos) {
        return s + ".0";
    }
    auto last = s.find_last_not_of('0');
    if (last == dot) {
        ++last;
    }
    s.erase(last + 1);
    return s;
}

bool parse_double(const std::string& text, double& out) {
    std::istringstream iss(text);
    iss.imbue(std::locale::classic());
    iss >> out;
    if (iss.fail()) {
        return false;
    }
    iss >> std::ws;
    return iss.eof();
}

} // namespace

const std::string& region_header() {
    static const std::string header =
        "# Region file format: DS9 version 4.1\n"
        "global color=green dashlist=8 3 width=1 font=\"helvetica 10 normal roman\" "
        "select=1 highlite=1 dash=0 fixed=0 edit=1 move=1 delete=1 include=1 source=1\n"
        "fk5\n";
    return header;
}

std::string render_aperture(const SkyCoord& coord, double radius_arcsec) {
    return "circle(" + format_fixed(coord.ra, 6) + "," + format_fixed(coord.dec, 6) + "," +
           format_compact(radius_arcsec) + "\")";
}

std::string render_regions(const std::vector<SkyCoord>& coords, double radius_arcsec) {
    std::string out = region_header();
    for (const auto& c : coords) {
        out += render_aperture(c, radius_arcsec);
        out += '\n';
    }
    return out;
}

std::vector<CircleRegion> parse_circle_regions(const std::string& text) {
    std::vector<CircleRegion> circles;

    std::istringstream in(text);
    std::string raw;
    int lineno = 0;
    while (std::getline(in, raw)) {
        ++lineno;
        std::string line = core::trim(raw);
        if (line.empty() || line[0] == '#' || core::starts_with(line, "global")) {
            continue;
        }

        auto open = line.find('(');
        if (open == std::string::npos) {
            // coordinate system line (fk5, physical, ...)
            continue;
        }

        if (core::trim(line.substr(0, open)) != "circle") {
            continue;
        }

        auto close = line.find(')', open + 1);
        if (close == std::string::npos) {
            throw FormatError("line " + std::to_string(lineno) + ": unterminated circle");
        }

        auto args = core::split(line.substr(open + 1, close - open - 1), ',');
        if (args.size() != 3) {
            throw FormatError("line " + std::to_string(lineno) +
                              ": expected 3 circle arguments, got " +
                              std::to_string(args.size()));
        }

        std::string radius = core::trim(args[2]);
        if (!core::ends_with(radius, "\"")) {
            throw FormatError("line " + std::to_string(lineno) + ": expected radius in arcsec");
        }
        radius.pop_back();

        CircleRegion region{};
        if (!parse_double(core::trim(args[0]), region.ra) ||
            !parse_double(core::trim(args[1]), region.dec) ||
            !parse_double(radius, region.radius_arcsec)) {
            throw FormatError("line " + std::to_string(lineno) + ": could not read circle values");
        }
        circles.push_back(region);
    }

    return circles;
}

} // namespace aperture_view::regions
