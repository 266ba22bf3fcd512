#pragma once

#include "eopack/config/configuration.hpp"
#include "eopack/core/events.hpp"
#include "eopack/core/types.hpp"
#include "eopack/geo/grid.hpp"
#include "eopack/io/raster_io.hpp"
#include "eopack/thumbnail/stretch.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace eopack::thumbnail {

namespace fs = std::filesystem;

struct ThumbnailOptions {
    int out_scale = 10;
    Resampling resampling = Resampling::AVERAGE;
    std::optional<ValueRange> static_stretch;
    ValueRange percentile_stretch = kDefaultPercentiles;
    int compress_quality = 85;
    std::string target_crs = "EPSG:4326";
    int warp_threads = 2;
    // Nodata of caller-supplied arrays
    double array_nodata = io::ArrayImageSequence::kDefaultNodata;

    static ThumbnailOptions from_config(const config::ThumbnailConfig& cfg);
    void validate() const;
};

// `src` reprojected into `target` at full resolution (GDAL's suggested
// warp output)
geo::Grid reprojected_grid(const geo::Grid& src, const geo::Crs& target);

// Warps one 8-bit band from `src` onto `dst`. 0 is nodata on both sides.
Matrix2Du8 reproject_band(const Matrix2Du8& band, const geo::Grid& src, const geo::Grid& dst,
                          Resampling resampling, int threads);

using SequenceFactory = std::function<std::unique_ptr<io::ImageSequence>()>;
using BandSink = std::function<void(const geo::Grid& dst, int band, Matrix2Du8 pixels)>;

// Computes the shared stretch over one pass of the sequence, then rescales
// every band of a second pass to (1, 255) and warps it onto the returned
// grid, handing each warped band (1-based) and that grid to `sink`.
geo::Grid render_quicklook(const SequenceFactory& open_sequence, const geo::Grid& src,
                           const ThumbnailOptions& options, const BandSink& sink);

// Downsamples 1 or 3 bands by `out_scale` and encodes a 3-band JPEG
std::vector<std::uint8_t> encode_thumbnail(const std::vector<Matrix2Du8>& bands,
                                           const ThumbnailOptions& options);

// Red, green and blue band files (or one file for all three). Without
// `input_grid` the grid of the first file is used.
void create_thumbnail(const std::vector<fs::path>& bands, const fs::path& out,
                      const ThumbnailOptions& options = {},
                      const std::optional<geo::Grid>& input_grid = std::nullopt,
                      const core::EventEmitter* events = nullptr);

// In-memory variant; returns the JPEG bytes without touching the filesystem
std::vector<std::uint8_t> create_thumbnail_from_arrays(
    const std::vector<const Matrix2Dd*>& bands, const std::optional<geo::Grid>& grid,
    const ThumbnailOptions& options = {}, const core::EventEmitter* events = nullptr);

void create_thumbnail_singleband(const fs::path& in, const fs::path& out,
                                 const std::optional<int>& bit,
                                 const std::optional<LookupTable>& lookup_table,
                                 const ThumbnailOptions& options = {},
                                 const core::EventEmitter* events = nullptr);

std::vector<std::uint8_t> create_thumbnail_singleband_from_array(
    const Matrix2Dd& data, const std::optional<geo::Grid>& grid, const std::optional<int>& bit,
    const std::optional<LookupTable>& lookup_table, const ThumbnailOptions& options = {},
    const core::EventEmitter* events = nullptr);

} // namespace eopack::thumbnail
