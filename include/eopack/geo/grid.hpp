#pragma once

#include "eopack/core/types.hpp"

#include <array>
#include <optional>
#include <string>
#include <utility>

namespace eopack::geo {

// Affine pixel -> CRS transform:
//   x = a * col + b * row + c
//   y = d * col + e * row + f
struct Affine {
    double a = 1.0;
    double b = 0.0;
    double c = 0.0;
    double d = 0.0;
    double e = 1.0;
    double f = 0.0;

    static Affine from_gdal(const double* geotransform);
    std::array<double, 6> to_gdal() const;

    std::pair<double, double> apply(double col, double row) const {
        return {a * col + b * row + c, d * col + e * row + f};
    }

    bool operator==(const Affine& o) const {
        return a == o.a && b == o.b && c == o.c && d == o.d && e == o.e && f == o.f;
    }
    bool operator!=(const Affine& o) const { return !(*this == o); }
};

// CRS-space extent
struct BoundingBox {
    double left = 0.0;
    double bottom = 0.0;
    double right = 0.0;
    double top = 0.0;
};

// Coordinate reference descriptor. Holds the user definition ("EPSG:4326",
// WKT or PROJ string); an empty definition is the null CRS.
class Crs {
public:
    Crs() = default;
    explicit Crs(std::string definition);

    static Crs from_epsg(int code);

    bool is_null() const { return definition_.empty(); }
    const std::string& definition() const { return definition_; }

    // EPSG code if GDAL can resolve one
    std::optional<int> epsg() const;

    // "EPSG:<code>" when resolvable, otherwise the definition unchanged
    Crs normalized() const;

    std::string to_wkt() const;

    // Compares definitions; grids are normalized before they are compared.
    bool operator==(const Crs& o) const { return definition_ == o.definition_; }
    bool operator!=(const Crs& o) const { return !(*this == o); }

private:
    std::string definition_;
};

class Grid {
public:
    Grid() = default;
    Grid(int rows, int cols, const Affine& transform, Crs crs);

    int rows() const { return rows_; }
    int cols() const { return cols_; }
    std::pair<int, int> shape() const { return {rows_, cols_}; }
    const Affine& transform() const { return transform_; }
    const Crs& crs() const { return crs_; }

    // Absolute pixel size (x, y) in CRS units
    std::pair<double, double> resolution() const;

    BoundingBox bounding_box() const;

    // Pixel-space extent: (0, 0, cols, rows)
    BoundingBox pixel_bounds() const {
        return {0.0, 0.0, static_cast<double>(cols_), static_cast<double>(rows_)};
    }

    Grid with_crs(Crs crs) const;

    bool operator==(const Grid& o) const {
        return rows_ == o.rows_ && cols_ == o.cols_ && transform_ == o.transform_ && crs_ == o.crs_;
    }
    bool operator!=(const Grid& o) const { return !(*this == o); }

private:
    int rows_ = 0;
    int cols_ = 0;
    Affine transform_;
    Crs crs_;
};

std::string to_string(const Grid& grid);

} // namespace eopack::geo
