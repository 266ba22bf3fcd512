#include "eopack/geo/geometry.hpp"
#include "eopack/core/errors.hpp"

#include <cpl_conv.h>
#include <ogr_geometry.h>

#include <algorithm>
#include <vector>

namespace eopack::geo {

namespace {

std::string describe_failure(const std::shared_ptr<GeosContext>& ctx, const std::string& operation) {
    std::string msg = "GEOS " + operation + " failed";
    if (ctx && !ctx->last_error().empty()) {
        msg += ": " + ctx->last_error();
    }
    return msg;
}

GEOSCoordSequence* transformed_sequence(const std::shared_ptr<GeosContext>& ctx,
                                        const GEOSCoordSequence* src, const Affine& t) {
    GEOSContextHandle_t h = ctx->handle();
    GEOSCoordSequence* seq = GEOSCoordSeq_clone_r(h, src);
    if (!seq) {
        throw GeometryError(describe_failure(ctx, "coordinate copy"));
    }
    unsigned int size = 0;
    GEOSCoordSeq_getSize_r(h, seq, &size);
    for (unsigned int i = 0; i < size; ++i) {
        double col = 0.0;
        double row = 0.0;
        GEOSCoordSeq_getX_r(h, seq, i, &col);
        GEOSCoordSeq_getY_r(h, seq, i, &row);
        const auto [x, y] = t.apply(col, row);
        GEOSCoordSeq_setX_r(h, seq, i, x);
        GEOSCoordSeq_setY_r(h, seq, i, y);
    }
    return seq;
}

GeometryPtr transformed_ring(const std::shared_ptr<GeosContext>& ctx,
                             const GEOSGeometry* ring, const Affine& t) {
    const GEOSCoordSequence* src = GEOSGeom_getCoordSeq_r(ctx->handle(), ring);
    if (!src) {
        throw GeometryError(describe_failure(ctx, "ring access"));
    }
    return adopt(ctx, GEOSGeom_createLinearRing_r(ctx->handle(), transformed_sequence(ctx, src, t)),
                 "ring");
}

std::vector<GEOSGeometry*> borrow(const std::vector<GeometryPtr>& parts) {
    std::vector<GEOSGeometry*> raw;
    raw.reserve(parts.size());
    for (const auto& p : parts) {
        raw.push_back(p.get());
    }
    return raw;
}

// Hands ownership to a container GEOS built successfully
void release_all(std::vector<GeometryPtr>& parts) {
    for (auto& p : parts) {
        p.release();
    }
}

GeometryPtr transformed(const std::shared_ptr<GeosContext>& ctx,
                        const GEOSGeometry* geom, const Affine& t) {
    GEOSContextHandle_t h = ctx->handle();

    if (GEOSisEmpty_r(h, geom) == 1) {
        return adopt(ctx, GEOSGeom_clone_r(h, geom), "clone");
    }

    const int type = GEOSGeomTypeId_r(h, geom);
    switch (type) {
        case GEOS_POINT:
        case GEOS_LINESTRING:
        case GEOS_LINEARRING: {
            GEOSCoordSequence* seq =
                transformed_sequence(ctx, GEOSGeom_getCoordSeq_r(h, geom), t);
            if (type == GEOS_POINT) return adopt(ctx, GEOSGeom_createPoint_r(h, seq), "point");
            if (type == GEOS_LINESTRING) {
                return adopt(ctx, GEOSGeom_createLineString_r(h, seq), "linestring");
            }
            return adopt(ctx, GEOSGeom_createLinearRing_r(h, seq), "ring");
        }
        case GEOS_POLYGON: {
            GeometryPtr shell = transformed_ring(ctx, GEOSGetExteriorRing_r(h, geom), t);
            const int n_holes = GEOSGetNumInteriorRings_r(h, geom);
            std::vector<GeometryPtr> holes;
            holes.reserve(static_cast<size_t>(std::max(n_holes, 0)));
            for (int i = 0; i < n_holes; ++i) {
                holes.push_back(transformed_ring(ctx, GEOSGetInteriorRingN_r(h, geom, i), t));
            }
            std::vector<GEOSGeometry*> raw_holes = borrow(holes);
            GEOSGeometry* poly =
                GEOSGeom_createPolygon_r(h, shell.get(),
                                         raw_holes.empty() ? nullptr : raw_holes.data(),
                                         static_cast<unsigned int>(raw_holes.size()));
            if (!poly) {
                throw GeometryError(describe_failure(ctx, "polygon"));
            }
            shell.release();
            release_all(holes);
            return adopt(ctx, poly, "polygon");
        }
        default: {
            const int n = GEOSGetNumGeometries_r(h, geom);
            std::vector<GeometryPtr> parts;
            parts.reserve(static_cast<size_t>(std::max(n, 0)));
            for (int i = 0; i < n; ++i) {
                parts.push_back(transformed(ctx, GEOSGetGeometryN_r(h, geom, i), t));
            }
            std::vector<GEOSGeometry*> raw = borrow(parts);
            GEOSGeometry* collection = GEOSGeom_createCollection_r(
                h, type, raw.data(), static_cast<unsigned int>(raw.size()));
            if (!collection) {
                throw GeometryError(describe_failure(ctx, "collection"));
            }
            release_all(parts);
            return adopt(ctx, collection, "collection");
        }
    }
}

} // namespace

GeosContext::GeosContext() : handle_(GEOS_init_r()) {
    if (!handle_) {
        throw GeometryError("Cannot initialise GEOS context");
    }
    GEOSContext_setErrorMessageHandler_r(handle_, &GeosContext::on_error, this);
}

GeosContext::~GeosContext() {
    GEOS_finish_r(handle_);
}

std::shared_ptr<GeosContext> GeosContext::create() {
    return std::make_shared<GeosContext>();
}

void GeosContext::on_error(const char* message, void* userdata) {
    auto* self = static_cast<GeosContext*>(userdata);
    if (self && message) {
        self->last_error_ = message;
    }
}

GeometryPtr adopt(const std::shared_ptr<GeosContext>& ctx, GEOSGeometry* raw,
                  const std::string& operation) {
    if (!raw) {
        throw GeometryError(describe_failure(ctx, operation));
    }
    return GeometryPtr(raw, GeometryDeleter{ctx});
}

GeometryPtr make_box(const std::shared_ptr<GeosContext>& ctx,
                     double minx, double miny, double maxx, double maxy) {
    GEOSContextHandle_t h = ctx->handle();
    GEOSCoordSequence* seq = GEOSCoordSeq_create_r(h, 5, 2);
    if (!seq) {
        throw GeometryError(describe_failure(ctx, "box"));
    }
    const double xs[5] = {minx, maxx, maxx, minx, minx};
    const double ys[5] = {miny, miny, maxy, maxy, miny};
    for (unsigned int i = 0; i < 5; ++i) {
        GEOSCoordSeq_setX_r(h, seq, i, xs[i]);
        GEOSCoordSeq_setY_r(h, seq, i, ys[i]);
    }
    GEOSGeometry* shell = GEOSGeom_createLinearRing_r(h, seq);
    if (!shell) {
        throw GeometryError(describe_failure(ctx, "box ring"));
    }
    return adopt(ctx, GEOSGeom_createPolygon_r(h, shell, nullptr, 0), "box polygon");
}

GeometryPtr make_empty_polygon(const std::shared_ptr<GeosContext>& ctx) {
    return adopt(ctx, GEOSGeom_createEmptyPolygon_r(ctx->handle()), "empty polygon");
}

GeometryPtr unary_union(const std::shared_ptr<GeosContext>& ctx, std::vector<GeometryPtr> parts) {
    if (parts.empty()) {
        return make_empty_polygon(ctx);
    }

    std::vector<GEOSGeometry*> raw = borrow(parts);
    GEOSGeometry* members = GEOSGeom_createCollection_r(
        ctx->handle(), GEOS_GEOMETRYCOLLECTION, raw.data(), static_cast<unsigned int>(raw.size()));
    if (!members) {
        throw GeometryError(describe_failure(ctx, "collection"));
    }
    release_all(parts);
    GeometryPtr collection = adopt(ctx, members, "collection");

    return adopt(ctx, GEOSUnaryUnion_r(ctx->handle(), collection.get()), "unary union");
}

GeometryPtr affine_transform(const std::shared_ptr<GeosContext>& ctx,
                             const GEOSGeometry* geom, const Affine& t) {
    return transformed(ctx, geom, t);
}

GeometryPtr make_valid(const std::shared_ptr<GeosContext>& ctx, GeometryPtr geom) {
    const char valid = GEOSisValid_r(ctx->handle(), geom.get());
    if (valid == 1) {
        return geom;
    }
    if (valid == 2) {
        throw GeometryError(describe_failure(ctx, "validity check"));
    }
    return adopt(ctx, GEOSBuffer_r(ctx->handle(), geom.get(), 0.0, 8), "zero-width buffer");
}

ValidDataGeometry::ValidDataGeometry(GeometryPtr geom) : geom_(std::move(geom)) {}

bool ValidDataGeometry::is_empty() const {
    if (!geom_) return true;
    return GEOSisEmpty_r(geom_.get_deleter().ctx->handle(), geom_.get()) == 1;
}

std::string ValidDataGeometry::geometry_type() const {
    if (!geom_) return "";
    GEOSContextHandle_t h = geom_.get_deleter().ctx->handle();
    char* type = GEOSGeomType_r(h, geom_.get());
    std::string out = type ? type : "";
    GEOSFree_r(h, type);
    return out;
}

double ValidDataGeometry::area() const {
    if (!geom_) return 0.0;
    double a = 0.0;
    if (!GEOSArea_r(geom_.get_deleter().ctx->handle(), geom_.get(), &a)) {
        throw GeometryError(describe_failure(geom_.get_deleter().ctx, "area"));
    }
    return a;
}

std::optional<BoundingBox> ValidDataGeometry::bounds() const {
    if (is_empty()) return std::nullopt;
    GEOSContextHandle_t h = geom_.get_deleter().ctx->handle();
    BoundingBox box;
    if (!GEOSGeom_getXMin_r(h, geom_.get(), &box.left) ||
        !GEOSGeom_getYMin_r(h, geom_.get(), &box.bottom) ||
        !GEOSGeom_getXMax_r(h, geom_.get(), &box.right) ||
        !GEOSGeom_getYMax_r(h, geom_.get(), &box.top)) {
        throw GeometryError(describe_failure(geom_.get_deleter().ctx, "envelope"));
    }
    return box;
}

bool ValidDataGeometry::within_box(const BoundingBox& box, double tolerance) const {
    auto b = bounds();
    if (!b) return true;
    return b->left >= box.left - tolerance && b->right <= box.right + tolerance &&
           b->bottom >= box.bottom - tolerance && b->top <= box.top + tolerance;
}

std::string ValidDataGeometry::to_wkt() const {
    if (!geom_) return "POLYGON EMPTY";
    GEOSContextHandle_t h = geom_.get_deleter().ctx->handle();
    GEOSWKTWriter* writer = GEOSWKTWriter_create_r(h);
    GEOSWKTWriter_setTrim_r(h, writer, 1);
    char* wkt = GEOSWKTWriter_write_r(h, writer, geom_.get());
    GEOSWKTWriter_destroy_r(h, writer);
    if (!wkt) {
        throw GeometryError(describe_failure(geom_.get_deleter().ctx, "WKT export"));
    }
    std::string out(wkt);
    GEOSFree_r(h, wkt);
    return out;
}

std::string ValidDataGeometry::to_geojson() const {
    if (is_empty()) {
        return R"({ "type": "Polygon", "coordinates": [ ] })";
    }
    GEOSContextHandle_t h = geom_.get_deleter().ctx->handle();
    OGRGeometryUniquePtr ogr(
        OGRGeometryFactory::createFromGEOS(h, const_cast<GEOSGeometry*>(geom_.get())));
    if (!ogr) {
        throw GeometryError("Cannot convert geometry for GeoJSON export (GDAL built without GEOS?)");
    }
    char* json = ogr->exportToJson();
    if (!json) {
        throw GeometryError("GeoJSON export failed");
    }
    std::string out(json);
    CPLFree(json);
    return out;
}

} // namespace eopack::geo
