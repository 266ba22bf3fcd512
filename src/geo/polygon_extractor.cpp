#include "eopack/geo/polygon_extractor.hpp"
#include "eopack/core/errors.hpp"
#include "eopack/io/raster_io.hpp"

#include <gdal_alg.h>
#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <opencv2/imgproc.hpp>

#include <utility>

namespace eopack::geo {

namespace {

// Buffer by one pixel with square caps and bevel joins, then simplify with a
// one pixel tolerance
constexpr double kBufferPixels = 1.0;
constexpr int kBufferQuadSegments = 16;
constexpr double kBufferMitreLimit = 5.0;
constexpr double kSimplifyTolerance = 1.0;

GDALDriver* vector_memory_driver() {
    auto* manager = GetGDALDriverManager();
    if (GDALDriver* driver = manager->GetDriverByName("Memory")) {
        return driver;
    }
    return manager->GetDriverByName("MEM");
}

} // namespace

void fill_holes(MaskMatrix& mask) {
    if (mask.size() == 0) return;

    // Pad with a zero border so every outside region is reachable from (0, 0)
    cv::Mat padded = cv::Mat::zeros(static_cast<int>(mask.rows()) + 2,
                                    static_cast<int>(mask.cols()) + 2, CV_8U);
    cv::Mat src(static_cast<int>(mask.rows()), static_cast<int>(mask.cols()), CV_8U, mask.data());
    cv::Mat inner = padded(cv::Rect(1, 1, src.cols, src.rows));
    cv::threshold(src, inner, 0, 1, cv::THRESH_BINARY);

    cv::floodFill(padded, cv::Point(0, 0), cv::Scalar(2), nullptr, cv::Scalar(), cv::Scalar(), 4);

    for (int y = 0; y < src.rows; ++y) {
        const uint8_t* row = padded.ptr<uint8_t>(y + 1) + 1;
        for (int x = 0; x < src.cols; ++x) {
            mask(y, x) = row[x] == 2 ? 0 : 1;
        }
    }
}

void convex_hull_fill(MaskMatrix& mask) {
    if (mask.size() == 0) return;

    cv::Mat m(static_cast<int>(mask.rows()), static_cast<int>(mask.cols()), CV_8U, mask.data());
    std::vector<cv::Point> points;
    cv::findNonZero(m, points);
    if (points.empty()) return;

    std::vector<cv::Point> hull;
    cv::convexHull(points, hull);
    m.setTo(0);
    cv::fillConvexPoly(m, hull, cv::Scalar(1), cv::LINE_8);
    // fillConvexPoly skips degenerate hulls; keep the original pixels lit
    for (const auto& p : points) {
        m.at<uint8_t>(p) = 1;
    }
}

PolygonExtractor::PolygonExtractor(std::shared_ptr<GeosContext> ctx)
    : PolygonExtractor(std::move(ctx), &convex_hull_fill) {}

PolygonExtractor::PolygonExtractor(std::shared_ptr<GeosContext> ctx, MaskFilter convex_hull)
    : ctx_(std::move(ctx)), convex_hull_(std::move(convex_hull)) {
    if (!ctx_) {
        throw ConfigError("PolygonExtractor requires a GEOS context");
    }
}

bool PolygonExtractor::supports(ValidDataMethod method) const {
    if (method == ValidDataMethod::CONVEX_HULL) {
        return static_cast<bool>(convex_hull_);
    }
    return true;
}

GeometryPtr PolygonExtractor::extract(const Grid& grid, MaskMatrix mask,
                                      ValidDataMethod method) const {
    switch (method) {
        case ValidDataMethod::BOUNDS:
            return grid_bounds(grid);
        case ValidDataMethod::FILLED:
            fill_holes(mask);
            return vectorize(grid, mask);
        case ValidDataMethod::CONVEX_HULL:
            if (!convex_hull_) {
                throw ConfigError("valid data method 'convex_hull' is not available "
                                  "(no convex hull filter configured)");
            }
            convex_hull_(mask);
            return vectorize(grid, mask);
        case ValidDataMethod::THOROUGH:
            return vectorize(grid, mask);
    }
    throw ConfigError("Unexpected valid data method: " + valid_data_method_to_string(method));
}

GeometryPtr PolygonExtractor::grid_bounds(const Grid& grid) const {
    const BoundingBox box = grid.bounding_box();
    return make_box(ctx_, box.left, box.bottom, box.right, box.top);
}

std::vector<GeometryPtr> PolygonExtractor::polygonize(const MaskMatrix& mask) const {
    io::register_gdal();

    const int rows = static_cast<int>(mask.rows());
    const int cols = static_cast<int>(mask.cols());

    GDALDriver* raster_driver = GetGDALDriverManager()->GetDriverByName("MEM");
    if (!raster_driver) {
        throw GeometryError("GDAL MEM driver is not available");
    }
    GDALDatasetUniquePtr raster(raster_driver->Create("", cols, rows, 1, GDT_Byte, nullptr));
    if (!raster) {
        throw GeometryError("Cannot create in-memory mask raster");
    }
    GDALRasterBand* band = raster->GetRasterBand(1);
    if (band->RasterIO(GF_Write, 0, 0, cols, rows, const_cast<uint8_t*>(mask.data()),
                       cols, rows, GDT_Byte, 0, 0, nullptr) != CE_None) {
        throw GeometryError("Cannot write mask raster: " + std::string(CPLGetLastErrorMsg()));
    }

    GDALDriver* vector_driver = vector_memory_driver();
    if (!vector_driver) {
        throw GeometryError("GDAL in-memory vector driver is not available");
    }
    GDALDatasetUniquePtr shapes(vector_driver->Create("", 0, 0, 0, GDT_Unknown, nullptr));
    if (!shapes) {
        throw GeometryError("Cannot create in-memory vector dataset");
    }
    OGRLayer* layer = shapes->CreateLayer("valid", nullptr, wkbPolygon, nullptr);
    if (!layer) {
        throw GeometryError("Cannot create polygon layer");
    }

    // The band is its own mask: only non-zero regions become polygons.
    // No geotransform on the raster keeps the output in pixel coordinates.
    if (GDALPolygonize(GDALRasterBand::ToHandle(band), GDALRasterBand::ToHandle(band),
                       OGRLayer::ToHandle(layer), -1, nullptr, nullptr, nullptr) != CE_None) {
        throw GeometryError("GDALPolygonize failed: " + std::string(CPLGetLastErrorMsg()));
    }

    std::vector<GeometryPtr> parts;
    for (auto& feature : *layer) {
        const OGRGeometry* geom = feature->GetGeometryRef();
        if (!geom) continue;
        GeometryPtr part = adopt(ctx_, geom->exportToGEOS(ctx_->handle()),
                                 "polygon export (GDAL built without GEOS?)");
        parts.push_back(make_valid(ctx_, std::move(part)));
    }
    return parts;
}

GeometryPtr PolygonExtractor::vectorize(const Grid& grid, const MaskMatrix& mask) const {
    if (mask.rows() != grid.rows() || mask.cols() != grid.cols()) {
        throw ValidationError("mask shape " + std::to_string(mask.rows()) + "x" +
                              std::to_string(mask.cols()) + " does not match " + to_string(grid));
    }

    GEOSContextHandle_t h = ctx_->handle();

    GeometryPtr shape = unary_union(ctx_, polygonize(mask));
    GeometryPtr hull = adopt(ctx_, GEOSConvexHull_r(h, shape.get()), "convex hull");
    shape.reset();

    GeometryPtr buffered = adopt(
        ctx_,
        GEOSBufferWithStyle_r(h, hull.get(), kBufferPixels, kBufferQuadSegments,
                              GEOSBUF_CAP_SQUARE, GEOSBUF_JOIN_BEVEL, kBufferMitreLimit),
        "buffer");
    GeometryPtr simplified = adopt(
        ctx_, GEOSTopologyPreserveSimplify_r(h, buffered.get(), kSimplifyTolerance), "simplify");

    const BoundingBox px = grid.pixel_bounds();
    GeometryPtr frame = make_box(ctx_, px.left, px.bottom, px.right, px.top);
    GeometryPtr clipped = adopt(ctx_, GEOSIntersection_r(h, simplified.get(), frame.get()),
                                "intersection");

    return affine_transform(ctx_, clipped.get(), grid.transform());
}

GeometryPtr PolygonExtractor::union_all(std::vector<GeometryPtr> parts) const {
    return unary_union(ctx_, std::move(parts));
}

} // namespace eopack::geo
