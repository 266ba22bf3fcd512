#pragma once

#include "eopack/core/types.hpp"
#include "eopack/io/raster_io.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace eopack::thumbnail {

inline constexpr ValueRange kDefaultPercentiles{2.0, 98.0};

struct StretchResult {
    // Seeded with the full int64 range; narrowed by every contributing band
    ValueRange range;
    // 1 where every band holds data
    MaskMatrix valid;
};

// Walks `images` once, ANDing each band's validity into a shared mask and
// narrowing the value range to the nearest-rank percentiles of the pixels
// still valid. Bands whose remaining pixels are all zero are skipped.
// nullopt percentiles leave the range at its seed.
StretchResult compute_stretch(io::ImageSequence& images,
                              std::optional<ValueRange> percentiles = kDefaultPercentiles);

// 1 where `valid` is 0 and vice versa
MaskMatrix invert_mask(const MaskMatrix& valid);

// Clips to `in_range`, maps linearly onto `out_range` (the bounds of
// `out_type` by default), casts to `out_type` and writes `out_nodata` at
// every pixel set in `null_mask`. The input is not modified.
Matrix2Dd rescale_intensity(const Matrix2Dd& image, ValueRange in_range,
                            std::optional<ValueRange> out_range, const MaskMatrix& null_mask,
                            PixelType out_type = PixelType::UINT8, double out_nodata = 0.0);

// As above, with the null pixels being those equal to `image_nodata`
Matrix2Dd rescale_intensity(const Matrix2Dd& image, ValueRange in_range,
                            std::optional<ValueRange> out_range, double image_nodata,
                            PixelType out_type = PixelType::UINT8, double out_nodata = 0.0);

using Rgb = std::array<std::uint8_t, 3>;
using LookupTable = std::map<int, Rgb>;

struct FilteredBands {
    std::vector<Matrix2Dd> planes;  // red, green, blue
    ValueRange stretch;
};

// Throws InvalidFilterArgsError unless exactly one of bit/lookup_table is set
// and a given bit is positive
void check_filter_args(const std::optional<int>& bit,
                       const std::optional<LookupTable>& lookup_table);

// Bit mode: every pixel != bit becomes 0, stretch (0, bit), one plane used
// for all three channels. Lookup mode: mapped values become their colour,
// everything else black, stretch (0, 255).
FilteredBands singleband_filter(const Matrix2Dd& data, const std::optional<int>& bit,
                                const std::optional<LookupTable>& lookup_table);

} // namespace eopack::thumbnail
