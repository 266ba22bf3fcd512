#include "eopack/registry/coverage_mask.hpp"
#include "eopack/core/errors.hpp"

#include <cmath>
#include <iterator>
#include <limits>

namespace eopack::registry {

double default_nodata(PixelKind kind) {
    return kind == PixelKind::FLOATING ? std::numeric_limits<double>::quiet_NaN() : 0.0;
}

MaskMatrix valid_pixels(const Matrix2Dd& pixels, double nodata) {
    MaskMatrix mask(pixels.rows(), pixels.cols());
    const double* src = pixels.data();
    uint8_t* dst = mask.data();
    const Eigen::Index n = pixels.size();

    if (std::isnan(nodata)) {
        for (Eigen::Index i = 0; i < n; ++i) {
            dst[i] = std::isfinite(src[i]) ? 1 : 0;
        }
    } else {
        for (Eigen::Index i = 0; i < n; ++i) {
            dst[i] = src[i] != nodata ? 1 : 0;
        }
    }
    return mask;
}

void CoverageMasks::expand(size_t grid, const MaskMatrix& valid) {
    auto it = masks_.find(grid);
    if (it == masks_.end()) {
        masks_.emplace(grid, valid);
        return;
    }

    MaskMatrix& mask = it->second;
    if (mask.rows() != valid.rows() || mask.cols() != valid.cols()) {
        throw ValidationError("coverage mask shape mismatch for grid " + std::to_string(grid));
    }
    mask = mask.cwiseMax(valid);
}

const MaskMatrix* CoverageMasks::find(size_t grid) const {
    auto it = masks_.find(grid);
    return it == masks_.end() ? nullptr : &it->second;
}

std::optional<std::pair<size_t, MaskMatrix>> CoverageMasks::pop() {
    if (masks_.empty()) return std::nullopt;
    auto node = masks_.extract(std::prev(masks_.end()));
    return std::make_pair(node.key(), std::move(node.mapped()));
}

} // namespace eopack::registry
