#pragma once

#include "eopack/core/types.hpp"
#include "eopack/geo/geometry.hpp"
#include "eopack/geo/grid.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace eopack::geo {

// In-place transformation of a coverage mask before vectorization
using MaskFilter = std::function<void(MaskMatrix&)>;

// Sets every invalid pixel not 4-connected to the mask border
void fill_holes(MaskMatrix& mask);

// Sets every pixel inside the convex hull of the valid pixels
void convex_hull_fill(MaskMatrix& mask);

class PolygonExtractor {
public:
    // Extractor with the built-in convex-hull filter
    explicit PolygonExtractor(std::shared_ptr<GeosContext> ctx);

    // A null `convex_hull` filter disables ValidDataMethod::CONVEX_HULL
    PolygonExtractor(std::shared_ptr<GeosContext> ctx, MaskFilter convex_hull);

    bool supports(ValidDataMethod method) const;

    // Pixel mask of `grid` -> CRS-space polygon. The mask is taken by value
    // so callers can hand it over with std::move.
    GeometryPtr extract(const Grid& grid, MaskMatrix mask, ValidDataMethod method) const;

    GeometryPtr grid_bounds(const Grid& grid) const;

    // Valid pixels -> hull, buffered by a pixel, simplified, clipped to the
    // grid and moved into CRS coordinates
    GeometryPtr vectorize(const Grid& grid, const MaskMatrix& mask) const;

    GeometryPtr union_all(std::vector<GeometryPtr> parts) const;

    const std::shared_ptr<GeosContext>& context() const { return ctx_; }

private:
    // Polygons of the 4-connected regions of non-zero pixels, pixel coordinates
    std::vector<GeometryPtr> polygonize(const MaskMatrix& mask) const;

    std::shared_ptr<GeosContext> ctx_;
    MaskFilter convex_hull_;
};

} // namespace eopack::geo
