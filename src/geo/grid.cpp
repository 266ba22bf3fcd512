#include "eopack/geo/grid.hpp"
#include "eopack/core/errors.hpp"

#include <cpl_conv.h>
#include <ogr_spatialref.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace eopack::geo {

namespace {

// Parses a definition into `srs`; false when GDAL does not understand it.
bool parse_srs(const std::string& definition, OGRSpatialReference& srs) {
    if (definition.empty()) return false;
    srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    return srs.SetFromUserInput(definition.c_str()) == OGRERR_NONE;
}

std::optional<int> epsg_authority_code(const OGRSpatialReference& srs) {
    const char* name = srs.GetAuthorityName(nullptr);
    const char* code = srs.GetAuthorityCode(nullptr);
    if (name && code && EQUAL(name, "EPSG")) {
        return std::atoi(code);
    }
    return std::nullopt;
}

} // namespace

Affine Affine::from_gdal(const double* gt) {
    Affine t;
    t.c = gt[0];
    t.a = gt[1];
    t.b = gt[2];
    t.f = gt[3];
    t.d = gt[4];
    t.e = gt[5];
    return t;
}

std::array<double, 6> Affine::to_gdal() const {
    return {c, a, b, f, d, e};
}

Crs::Crs(std::string definition) : definition_(std::move(definition)) {}

Crs Crs::from_epsg(int code) {
    return Crs("EPSG:" + std::to_string(code));
}

std::optional<int> Crs::epsg() const {
    OGRSpatialReference srs;
    if (!parse_srs(definition_, srs)) return std::nullopt;

    if (auto code = epsg_authority_code(srs)) {
        return code;
    }
    if (srs.AutoIdentifyEPSG() == OGRERR_NONE) {
        return epsg_authority_code(srs);
    }
    return std::nullopt;
}

Crs Crs::normalized() const {
    if (auto code = epsg()) {
        return from_epsg(*code);
    }
    return *this;
}

std::string Crs::to_wkt() const {
    OGRSpatialReference srs;
    if (!parse_srs(definition_, srs)) {
        throw ValidationError("Unrecognised CRS definition: '" + definition_ + "'");
    }
    char* wkt = nullptr;
    if (srs.exportToWkt(&wkt) != OGRERR_NONE || wkt == nullptr) {
        CPLFree(wkt);
        throw ValidationError("Cannot export CRS as WKT: '" + definition_ + "'");
    }
    std::string out(wkt);
    CPLFree(wkt);
    return out;
}

Grid::Grid(int rows, int cols, const Affine& transform, Crs crs)
    : rows_(rows), cols_(cols), transform_(transform), crs_(std::move(crs)) {
    if (rows < 0 || cols < 0) {
        throw ValidationError("Grid shape must be non-negative");
    }
}

std::pair<double, double> Grid::resolution() const {
    // Pixel width/height along each axis (handles rotated transforms)
    const double res_x = std::hypot(transform_.a, transform_.d);
    const double res_y = std::hypot(transform_.b, transform_.e);
    return {res_x, res_y};
}

BoundingBox Grid::bounding_box() const {
    const std::array<std::pair<double, double>, 4> corners = {
        transform_.apply(0.0, 0.0),
        transform_.apply(cols_, 0.0),
        transform_.apply(0.0, rows_),
        transform_.apply(cols_, rows_)
    };

    BoundingBox box{corners[0].first, corners[0].second, corners[0].first, corners[0].second};
    for (const auto& [x, y] : corners) {
        box.left = std::min(box.left, x);
        box.right = std::max(box.right, x);
        box.bottom = std::min(box.bottom, y);
        box.top = std::max(box.top, y);
    }
    return box;
}

Grid Grid::with_crs(Crs crs) const {
    return Grid(rows_, cols_, transform_, std::move(crs));
}

std::string to_string(const Grid& grid) {
    std::ostringstream oss;
    const auto& t = grid.transform();
    oss << "Grid(" << grid.rows() << "x" << grid.cols()
        << ", [" << t.a << ", " << t.b << ", " << t.c << ", "
        << t.d << ", " << t.e << ", " << t.f << "], "
        << (grid.crs().is_null() ? std::string("<no crs>") : grid.crs().definition()) << ")";
    return oss.str();
}

} // namespace eopack::geo
