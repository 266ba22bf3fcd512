#pragma once

#include "eopack/geo/grid.hpp"

#include <geos_c.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace eopack::geo {

// Owns a reentrant GEOS context and remembers the last error it reported.
class GeosContext {
public:
    GeosContext();
    ~GeosContext();

    GeosContext(const GeosContext&) = delete;
    GeosContext& operator=(const GeosContext&) = delete;

    static std::shared_ptr<GeosContext> create();

    GEOSContextHandle_t handle() const { return handle_; }
    const std::string& last_error() const { return last_error_; }

private:
    static void on_error(const char* message, void* userdata);

    GEOSContextHandle_t handle_ = nullptr;
    std::string last_error_;
};

struct GeometryDeleter {
    std::shared_ptr<GeosContext> ctx;
    void operator()(GEOSGeometry* g) const {
        if (g && ctx) GEOSGeom_destroy_r(ctx->handle(), g);
    }
};

using GeometryPtr = std::unique_ptr<GEOSGeometry, GeometryDeleter>;

// Takes ownership of `raw`; throws GeometryError naming `operation` when null.
GeometryPtr adopt(const std::shared_ptr<GeosContext>& ctx, GEOSGeometry* raw,
                  const std::string& operation);

GeometryPtr make_box(const std::shared_ptr<GeosContext>& ctx,
                     double minx, double miny, double maxx, double maxy);

GeometryPtr make_empty_polygon(const std::shared_ptr<GeosContext>& ctx);

// Unary union of all parts (consumed). No parts gives an empty polygon.
GeometryPtr unary_union(const std::shared_ptr<GeosContext>& ctx, std::vector<GeometryPtr> parts);

// Applies `t` to every coordinate of a polygonal geometry
GeometryPtr affine_transform(const std::shared_ptr<GeosContext>& ctx,
                             const GEOSGeometry* geom, const Affine& t);

// Buffer(0) repair of an invalid geometry; valid input is returned as-is.
GeometryPtr make_valid(const std::shared_ptr<GeosContext>& ctx, GeometryPtr geom);

// The valid-data footprint of a dataset, in CRS coordinates.
class ValidDataGeometry {
public:
    ValidDataGeometry() = default;
    explicit ValidDataGeometry(GeometryPtr geom);

    bool is_empty() const;
    std::string geometry_type() const;
    double area() const;
    std::optional<BoundingBox> bounds() const;

    // True if every point lies inside `box` (boundary included), within `tolerance`
    bool within_box(const BoundingBox& box, double tolerance = 0.0) const;

    std::string to_wkt() const;
    std::string to_geojson() const;

    const GEOSGeometry* get() const { return geom_.get(); }

private:
    GeometryPtr geom_;
};

} // namespace eopack::geo
