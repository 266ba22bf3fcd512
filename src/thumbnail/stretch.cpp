#include "eopack/thumbnail/stretch.hpp"
#include "eopack/core/errors.hpp"
#include "eopack/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace eopack::thumbnail {

namespace {

double cast_to(double v, PixelType type) {
    // Integer outputs truncate toward zero
    if (is_integer_type(type)) return std::trunc(v);
    if (type == PixelType::FLOAT32) return static_cast<double>(static_cast<float>(v));
    return v;
}

} // namespace

StretchResult compute_stretch(io::ImageSequence& images, std::optional<ValueRange> percentiles) {
    StretchResult result;
    result.range = {static_cast<double>(std::numeric_limits<std::int64_t>::min()),
                    static_cast<double>(std::numeric_limits<std::int64_t>::max())};

    bool first = true;
    std::vector<double> the_data;

    while (auto image = images.next()) {
        const Matrix2Dd& px = image->values;
        if (first) {
            result.valid = MaskMatrix::Ones(px.rows(), px.cols());
            first = false;
        } else if (px.rows() != result.valid.rows() || px.cols() != result.valid.cols()) {
            throw ValidationError("band shapes differ: " + std::to_string(px.rows()) + "x" +
                                  std::to_string(px.cols()) + " vs " +
                                  std::to_string(result.valid.rows()) + "x" +
                                  std::to_string(result.valid.cols()));
        }

        const Eigen::Index n = px.size();
        const double* src = px.data();
        uint8_t* valid = result.valid.data();

        if (image->nodata) {
            const double nodata = *image->nodata;
            const bool nan_nodata = std::isnan(nodata);
            for (Eigen::Index i = 0; i < n; ++i) {
                const bool ok = nan_nodata ? !std::isnan(src[i]) : src[i] != nodata;
                if (!ok) valid[i] = 0;
            }
        }

        if (!percentiles) continue;

        the_data.clear();
        bool any_nonzero = false;
        for (Eigen::Index i = 0; i < n; ++i) {
            if (valid[i]) {
                the_data.push_back(src[i]);
                if (src[i] != 0.0) any_nonzero = true;
            }
        }
        if (!any_nonzero) continue;

        std::vector<double> scratch = the_data;
        const double low = core::percentile_nearest(scratch, percentiles->first);
        const double high = core::percentile_nearest(the_data, percentiles->second);
        result.range.first = std::max(low, result.range.first);
        result.range.second = std::min(high, result.range.second);
    }
    return result;
}

MaskMatrix invert_mask(const MaskMatrix& valid) {
    return valid.unaryExpr([](uint8_t v) -> uint8_t { return v ? 0 : 1; });
}

Matrix2Dd rescale_intensity(const Matrix2Dd& image, ValueRange in_range,
                            std::optional<ValueRange> out_range, const MaskMatrix& null_mask,
                            PixelType out_type, double out_nodata) {
    if (null_mask.rows() != image.rows() || null_mask.cols() != image.cols()) {
        throw ValidationError("null mask shape does not match image");
    }

    const auto [imin, imax] = in_range;
    const auto [omin, omax] = out_range.value_or(pixel_type_bounds(out_type));
    const double width = imax - imin;

    Matrix2Dd out(image.rows(), image.cols());
    const Eigen::Index n = image.size();
    const double* src = image.data();
    const uint8_t* null = null_mask.data();
    double* dst = out.data();

    for (Eigen::Index i = 0; i < n; ++i) {
        if (null[i]) {
            dst[i] = out_nodata;
            continue;
        }
        double v = std::min(std::max(src[i], imin), imax);
        // A zero-width input range puts everything at the bottom of the output
        v = width == 0.0 ? omin : (v - imin) / width * (omax - omin) + omin;
        dst[i] = cast_to(v, out_type);
    }
    return out;
}

Matrix2Dd rescale_intensity(const Matrix2Dd& image, ValueRange in_range,
                            std::optional<ValueRange> out_range, double image_nodata,
                            PixelType out_type, double out_nodata) {
    MaskMatrix null_mask(image.rows(), image.cols());
    const bool nan_nodata = std::isnan(image_nodata);
    const Eigen::Index n = image.size();
    for (Eigen::Index i = 0; i < n; ++i) {
        const double v = image.data()[i];
        null_mask.data()[i] = (nan_nodata ? std::isnan(v) : v == image_nodata) ? 1 : 0;
    }
    return rescale_intensity(image, in_range, out_range, null_mask, out_type, out_nodata);
}

void check_filter_args(const std::optional<int>& bit,
                       const std::optional<LookupTable>& lookup_table) {
    if (bit && lookup_table) {
        throw InvalidFilterArgsError("set either bit or lookup_table, not both");
    }
    if (!bit && !lookup_table) {
        throw InvalidFilterArgsError("set either bit or lookup_table; neither was given");
    }
    if (bit && *bit <= 0) {
        throw InvalidFilterArgsError("bit must be positive, got " + std::to_string(*bit));
    }
}

FilteredBands singleband_filter(const Matrix2Dd& data, const std::optional<int>& bit,
                                const std::optional<LookupTable>& lookup_table) {
    check_filter_args(bit, lookup_table);

    FilteredBands out;
    if (bit) {
        const double b = static_cast<double>(*bit);
        Matrix2Dd plane = data.unaryExpr([b](double v) { return v == b ? v : 0.0; });
        out.planes = {plane, plane, plane};
        out.stretch = {0.0, b};
        return out;
    }

    const Matrix2Dd black = Matrix2Dd::Zero(data.rows(), data.cols());
    out.planes.assign(3, black);
    out.stretch = {0.0, 255.0};
    const Eigen::Index n = data.size();
    for (const auto& [value, rgb] : *lookup_table) {
        const double v = static_cast<double>(value);
        for (Eigen::Index i = 0; i < n; ++i) {
            if (data.data()[i] != v) continue;
            for (size_t c = 0; c < 3; ++c) {
                out.planes[c].data()[i] = rgb[c];
            }
        }
    }
    return out;
}

} // namespace eopack::thumbnail
