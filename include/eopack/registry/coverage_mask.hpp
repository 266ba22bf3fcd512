#pragma once

#include "eopack/core/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <utility>

namespace eopack::registry {

// NaN for floating point pixels, 0 for integer pixels
double default_nodata(PixelKind kind);

// 1 where a pixel holds data: finite when `nodata` is NaN, != nodata otherwise
MaskMatrix valid_pixels(const Matrix2Dd& pixels, double nodata);

// Per-grid coverage masks, keyed by the registry's grid index. Masks only
// ever grow until they are popped.
class CoverageMasks {
public:
    // ORs `valid` into the mask of `grid`, creating it on first use
    void expand(size_t grid, const MaskMatrix& valid);

    const MaskMatrix* find(size_t grid) const;

    // Removes one mask and hands it to the caller
    std::optional<std::pair<size_t, MaskMatrix>> pop();

    bool empty() const { return masks_.empty(); }
    size_t size() const { return masks_.size(); }

private:
    std::map<size_t, MaskMatrix> masks_;
};

} // namespace eopack::registry
