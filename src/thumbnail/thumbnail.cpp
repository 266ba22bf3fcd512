#include "eopack/thumbnail/thumbnail.hpp"
#include "eopack/core/errors.hpp"
#include "eopack/core/utils.hpp"

#include <cpl_conv.h>
#include <cpl_string.h>
#include <gdal_alg.h>
#include <gdalwarper.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <utility>
#include <string>

namespace eopack::thumbnail {

namespace {

constexpr const char* kMemoryTarget = "<memory>";

GDALResampleAlg to_gdal(Resampling r) {
    switch (r) {
        case Resampling::NEAREST: return GRA_NearestNeighbour;
        case Resampling::BILINEAR: return GRA_Bilinear;
        case Resampling::CUBIC: return GRA_Cubic;
        case Resampling::AVERAGE: return GRA_Average;
    }
    return GRA_Average;
}

int to_opencv(Resampling r) {
    switch (r) {
        case Resampling::NEAREST: return cv::INTER_NEAREST;
        case Resampling::BILINEAR: return cv::INTER_LINEAR;
        case Resampling::CUBIC: return cv::INTER_CUBIC;
        case Resampling::AVERAGE: return cv::INTER_AREA;
    }
    return cv::INTER_AREA;
}

// Frees a warp options block together with the transformer it points to
struct WarpOptionsDeleter {
    void operator()(GDALWarpOptions* wo) const {
        if (!wo) return;
        if (wo->pTransformerArg) {
            GDALDestroyGenImgProjTransformer(wo->pTransformerArg);
            wo->pTransformerArg = nullptr;
        }
        GDALDestroyWarpOptions(wo);
    }
};

using WarpOptionsPtr = std::unique_ptr<GDALWarpOptions, WarpOptionsDeleter>;

void check_band_count(size_t n) {
    if (n != 1 && n != 3) {
        throw ValidationError("a thumbnail needs 1 or 3 bands, got " + std::to_string(n));
    }
}

std::pair<int, int> thumbnail_size(int rows, int cols, int out_scale) {
    return {std::max(1, rows / out_scale), std::max(1, cols / out_scale)};
}

void check_source_crs(const geo::Grid& src) {
    if (src.crs().is_null()) {
        throw ValidationError("cannot reproject " + to_string(src) + ": it has no CRS");
    }
}

} // namespace

ThumbnailOptions ThumbnailOptions::from_config(const config::ThumbnailConfig& cfg) {
    ThumbnailOptions o;
    o.out_scale = cfg.out_scale;
    auto resampling = string_to_resampling(cfg.resampling);
    if (!resampling) {
        throw ValidationError("unknown resampling '" + cfg.resampling + "'");
    }
    o.resampling = *resampling;
    o.percentile_stretch = {cfg.percentile_stretch[0], cfg.percentile_stretch[1]};
    if (cfg.static_stretch) {
        o.static_stretch = ValueRange{(*cfg.static_stretch)[0], (*cfg.static_stretch)[1]};
    }
    o.compress_quality = cfg.compress_quality;
    o.target_crs = cfg.target_crs;
    o.warp_threads = cfg.warp_threads;
    o.array_nodata = cfg.array_nodata;
    o.validate();
    return o;
}

void ThumbnailOptions::validate() const {
    if (out_scale < 1) {
        throw ValidationError("thumbnail out_scale must be >= 1");
    }
    if (!(percentile_stretch.first >= 0.0 && percentile_stretch.first < percentile_stretch.second &&
          percentile_stretch.second <= 100.0)) {
        throw ValidationError("thumbnail percentile_stretch must satisfy 0 <= low < high <= 100");
    }
    if (static_stretch && !(static_stretch->first < static_stretch->second)) {
        throw ValidationError("thumbnail static_stretch must satisfy low < high");
    }
    if (compress_quality < 1 || compress_quality > 100) {
        throw ValidationError("thumbnail compress_quality must be in [1,100]");
    }
    if (warp_threads < 1) {
        throw ValidationError("thumbnail warp_threads must be >= 1");
    }
    if (target_crs.empty()) {
        throw ValidationError("thumbnail target_crs must not be empty");
    }
}

geo::Grid reprojected_grid(const geo::Grid& src, const geo::Crs& target) {
    check_source_crs(src);
    auto ds = io::create_mem_dataset(src, 0, GDT_Byte);

    CPLStringList options;
    options.SetNameValue("DST_SRS", target.to_wkt().c_str());
    void* transformer = GDALCreateGenImgProjTransformer2(GDALDataset::ToHandle(ds.get()), nullptr,
                                                         options.List());
    if (!transformer) {
        throw IOError("Cannot build transformer to " + target.definition() + ": " +
                      CPLGetLastErrorMsg());
    }

    double gt[6] = {0.0, 1.0, 0.0, 0.0, 0.0, 1.0};
    int pixels = 0;
    int lines = 0;
    const CPLErr err = GDALSuggestedWarpOutput(GDALDataset::ToHandle(ds.get()),
                                               GDALGenImgProjTransform, transformer, gt,
                                               &pixels, &lines);
    GDALDestroyGenImgProjTransformer(transformer);
    if (err != CE_None) {
        throw IOError("Cannot compute warp output for " + to_string(src) + ": " +
                      CPLGetLastErrorMsg());
    }
    return geo::Grid(lines, pixels, geo::Affine::from_gdal(gt), target);
}

Matrix2Du8 reproject_band(const Matrix2Du8& band, const geo::Grid& src, const geo::Grid& dst,
                          Resampling resampling, int threads) {
    auto src_ds = io::create_mem_dataset(src, 1, GDT_Byte);
    io::write_band(*src_ds, 1, band);
    auto dst_ds = io::create_mem_dataset(dst, 1, GDT_Byte);
    if (src_ds->GetRasterBand(1)->SetNoDataValue(0.0) != CE_None ||
        dst_ds->GetRasterBand(1)->SetNoDataValue(0.0) != CE_None) {
        throw IOError("Cannot set nodata on warp datasets");
    }

    WarpOptionsPtr wo(GDALCreateWarpOptions());
    wo->hSrcDS = GDALDataset::ToHandle(src_ds.get());
    wo->hDstDS = GDALDataset::ToHandle(dst_ds.get());
    wo->nBandCount = 1;
    wo->panSrcBands = static_cast<int*>(CPLMalloc(sizeof(int)));
    wo->panSrcBands[0] = 1;
    wo->panDstBands = static_cast<int*>(CPLMalloc(sizeof(int)));
    wo->panDstBands[0] = 1;
    wo->padfSrcNoDataReal = static_cast<double*>(CPLMalloc(sizeof(double)));
    wo->padfSrcNoDataReal[0] = 0.0;
    wo->padfDstNoDataReal = static_cast<double*>(CPLMalloc(sizeof(double)));
    wo->padfDstNoDataReal[0] = 0.0;
    wo->eResampleAlg = to_gdal(resampling);
    wo->papszWarpOptions = CSLSetNameValue(wo->papszWarpOptions, "INIT_DEST", "0");
    wo->papszWarpOptions = CSLSetNameValue(wo->papszWarpOptions, "NUM_THREADS",
                                           std::to_string(threads).c_str());

    wo->pTransformerArg = GDALCreateGenImgProjTransformer2(wo->hSrcDS, wo->hDstDS, nullptr);
    if (!wo->pTransformerArg) {
        throw IOError(std::string("Cannot build warp transformer: ") + CPLGetLastErrorMsg());
    }
    wo->pfnTransformer = GDALGenImgProjTransform;

    GDALWarpOperation op;
    CPLErr err = op.Initialize(wo.get());
    if (err == CE_None) {
        err = op.ChunkAndWarpImage(0, 0, dst.cols(), dst.rows());
    }
    if (err != CE_None) {
        throw IOError(std::string("Warp failed: ") + CPLGetLastErrorMsg());
    }
    return io::read_band_u8(*dst_ds, 1);
}

geo::Grid render_quicklook(const SequenceFactory& open_sequence, const geo::Grid& src,
                           const ThumbnailOptions& options, const BandSink& sink) {
    check_source_crs(src);

    // First pass: shared validity mask, and the percentile range unless a
    // static one overrides it
    StretchResult stretch;
    {
        auto images = open_sequence();
        const std::optional<ValueRange> percentiles =
            options.static_stretch ? std::nullopt
                                   : std::optional<ValueRange>(options.percentile_stretch);
        stretch = compute_stretch(*images, percentiles);
    }
    if (stretch.valid.rows() != src.rows() || stretch.valid.cols() != src.cols()) {
        throw ValidationError("band shape " + std::to_string(stretch.valid.rows()) + "x" +
                              std::to_string(stretch.valid.cols()) + " does not match " +
                              to_string(src));
    }
    const ValueRange in_range = options.static_stretch.value_or(stretch.range);
    const MaskMatrix null_mask = invert_mask(stretch.valid);
    stretch.valid.resize(0, 0);

    const geo::Grid dst = reprojected_grid(src, geo::Crs(options.target_crs));

    auto images = open_sequence();
    int band = 0;
    while (auto image = images->next()) {
        ++band;
        const Matrix2Du8 scaled =
            rescale_intensity(image->values, in_range, ValueRange{1.0, 255.0}, null_mask,
                              PixelType::UINT8, 0.0)
                .cast<uint8_t>();
        image.reset();
        sink(dst, band, reproject_band(scaled, src, dst, options.resampling, options.warp_threads));
    }
    return dst;
}

std::vector<std::uint8_t> encode_thumbnail(const std::vector<Matrix2Du8>& bands,
                                           const ThumbnailOptions& options) {
    check_band_count(bands.size());
    const int rows = static_cast<int>(bands.front().rows());
    const int cols = static_cast<int>(bands.front().cols());
    for (const auto& b : bands) {
        if (b.rows() != rows || b.cols() != cols) {
            throw ValidationError("thumbnail bands differ in shape");
        }
    }

    const std::pair<int, int> size = thumbnail_size(rows, cols, options.out_scale);
    const cv::Size target(size.second, size.first);
    const int interpolation = to_opencv(options.resampling);

    auto downsample = [&](const Matrix2Du8& band) {
        cv::Mat src(rows, cols, CV_8U, const_cast<uint8_t*>(band.data()));
        cv::Mat out;
        cv::resize(src, out, target, 0, 0, interpolation);
        return out;
    };

    // OpenCV wants blue, green, red
    std::vector<cv::Mat> channels;
    if (bands.size() == 1) {
        cv::Mat grey = downsample(bands[0]);
        channels = {grey, grey, grey};
    } else {
        channels = {downsample(bands[2]), downsample(bands[1]), downsample(bands[0])};
    }
    cv::Mat bgr;
    cv::merge(channels, bgr);

    std::vector<uchar> encoded;
    const std::vector<int> params{cv::IMWRITE_JPEG_QUALITY, options.compress_quality};
    if (!cv::imencode(".jpg", bgr, encoded, params)) {
        throw IOError("JPEG encoding failed");
    }
    return std::vector<std::uint8_t>(encoded.begin(), encoded.end());
}

namespace {

// Failures are reported as events before they propagate
void report(const core::EventEmitter* events, const std::string& operation,
            const EopackError& e) {
    if (events) {
        events->error(operation, e.what());
    }
}

void write_thumbnail(const std::vector<fs::path>& bands, const fs::path& out,
                     const ThumbnailOptions& options, const std::optional<geo::Grid>& input_grid,
                     const core::EventEmitter* events) {
    options.validate();
    check_band_count(bands.size());

    const geo::Grid src = input_grid ? *input_grid : io::grid_from_path(bands.front());
    const fs::path parent = out.has_parent_path() ? out.parent_path() : fs::path(".");

    // The full-resolution reprojected quicklook lives beside the output and
    // is removed on every exit path
    io::TemporaryDirectory tmp(parent, ".thumbgen-");
    const fs::path ql_path = tmp.path() / "quicklook.tif";

    {
        GDALDatasetUniquePtr ql;
        auto open_sequence = [&bands]() -> std::unique_ptr<io::ImageSequence> {
            return std::make_unique<io::FileImageSequence>(bands);
        };
        render_quicklook(open_sequence, src, options,
                         [&](const geo::Grid& dst, int band, Matrix2Du8 pixels) {
                             if (!ql) {
                                 ql = io::create_geotiff(ql_path, dst,
                                                         static_cast<int>(bands.size()),
                                                         GDT_Byte, 0.0);
                             }
                             io::write_band(*ql, band, pixels);
                         });
    }

    std::vector<Matrix2Du8> planes;
    {
        auto ql = io::open_raster(ql_path);
        for (int i = 1; i <= ql->GetRasterCount(); ++i) {
            planes.push_back(io::read_band_u8(*ql, i));
        }
    }

    const std::vector<std::uint8_t> jpeg = encode_thumbnail(planes, options);
    core::write_bytes(out, jpeg);

    if (events) {
        const auto [h, w] = thumbnail_size(static_cast<int>(planes.front().rows()),
                                           static_cast<int>(planes.front().cols()),
                                           options.out_scale);
        events->thumbnail_written(out.string(), w, h, jpeg.size());
    }
}

std::vector<std::uint8_t> thumbnail_bytes(const std::vector<const Matrix2Dd*>& bands,
                                          const std::optional<geo::Grid>& grid,
                                          const ThumbnailOptions& options,
                                          const core::EventEmitter* events) {
    options.validate();
    check_band_count(bands.size());
    if (!grid) {
        throw MissingGeoboxError("arrays carry no grid; one must be supplied");
    }

    std::vector<Matrix2Du8> planes(bands.size());
    auto open_sequence = [&]() -> std::unique_ptr<io::ImageSequence> {
        return std::make_unique<io::ArrayImageSequence>(bands, options.array_nodata);
    };
    render_quicklook(open_sequence, *grid, options,
                     [&](const geo::Grid&, int band, Matrix2Du8 pixels) {
                         planes[static_cast<size_t>(band - 1)] = std::move(pixels);
                     });

    std::vector<std::uint8_t> jpeg = encode_thumbnail(planes, options);
    if (events) {
        const auto [h, w] = thumbnail_size(static_cast<int>(planes.front().rows()),
                                           static_cast<int>(planes.front().cols()),
                                           options.out_scale);
        events->thumbnail_written(kMemoryTarget, w, h, jpeg.size());
    }
    return jpeg;
}

void write_singleband_thumbnail(const fs::path& in, const fs::path& out,
                                const std::optional<int>& bit,
                                const std::optional<LookupTable>& lookup_table,
                                const ThumbnailOptions& options,
                                const core::EventEmitter* events) {
    check_filter_args(bit, lookup_table);

    geo::Grid grid;
    GDALDataType type = GDT_Float64;
    std::optional<double> nodata;
    FilteredBands filtered;
    {
        auto ds = io::open_raster(in);
        if (ds->GetRasterCount() != 1) {
            throw UnsupportedBandLayoutError(in.string() + " has " +
                                             std::to_string(ds->GetRasterCount()) +
                                             " bands; expected a single band");
        }
        grid = io::grid_from_dataset(*ds);
        type = ds->GetRasterBand(1)->GetRasterDataType();
        io::BandData band = io::read_band(*ds, 1);
        nodata = band.nodata;
        filtered = singleband_filter(band.raster.values, bit, lookup_table);
    }

    ThumbnailOptions stretched = options;
    stretched.static_stretch = filtered.stretch;

    io::TemporaryDirectory tmp(fs::temp_directory_path(), "eopack-singleband-");
    std::vector<fs::path> paths;
    if (bit) {
        // One file, used for all three channels
        const fs::path p = tmp.path() / "temp.tif";
        auto ds = io::create_geotiff(p, grid, 1, type, nodata);
        io::write_band(*ds, 1, filtered.planes[0]);
        paths = {p, p, p};
    } else {
        for (size_t i = 0; i < 3; ++i) {
            const fs::path p = tmp.path() / ("temp_" + std::to_string(i) + ".tif");
            auto ds = io::create_geotiff(p, grid, 1, type, nodata);
            io::write_band(*ds, 1, filtered.planes[i]);
            paths.push_back(p);
        }
    }

    write_thumbnail(paths, out, stretched, std::nullopt, events);
}

std::vector<std::uint8_t> singleband_thumbnail_bytes(
    const Matrix2Dd& data, const std::optional<geo::Grid>& grid, const std::optional<int>& bit,
    const std::optional<LookupTable>& lookup_table, const ThumbnailOptions& options,
    const core::EventEmitter* events) {
    check_filter_args(bit, lookup_table);

    const FilteredBands filtered = singleband_filter(data, bit, lookup_table);
    ThumbnailOptions stretched = options;
    stretched.static_stretch = filtered.stretch;

    std::vector<const Matrix2Dd*> bands;
    if (bit) {
        bands = {&filtered.planes[0], &filtered.planes[0], &filtered.planes[0]};
    } else {
        bands = {&filtered.planes[0], &filtered.planes[1], &filtered.planes[2]};
    }
    return thumbnail_bytes(bands, grid, stretched, events);
}

} // namespace

void create_thumbnail(const std::vector<fs::path>& bands, const fs::path& out,
                      const ThumbnailOptions& options, const std::optional<geo::Grid>& input_grid,
                      const core::EventEmitter* events) {
    try {
        write_thumbnail(bands, out, options, input_grid, events);
    } catch (const EopackError& e) {
        report(events, "create_thumbnail", e);
        throw;
    }
}

std::vector<std::uint8_t> create_thumbnail_from_arrays(const std::vector<const Matrix2Dd*>& bands,
                                                       const std::optional<geo::Grid>& grid,
                                                       const ThumbnailOptions& options,
                                                       const core::EventEmitter* events) {
    try {
        return thumbnail_bytes(bands, grid, options, events);
    } catch (const EopackError& e) {
        report(events, "create_thumbnail_from_arrays", e);
        throw;
    }
}

void create_thumbnail_singleband(const fs::path& in, const fs::path& out,
                                 const std::optional<int>& bit,
                                 const std::optional<LookupTable>& lookup_table,
                                 const ThumbnailOptions& options,
                                 const core::EventEmitter* events) {
    try {
        write_singleband_thumbnail(in, out, bit, lookup_table, options, events);
    } catch (const EopackError& e) {
        report(events, "create_thumbnail_singleband", e);
        throw;
    }
}

std::vector<std::uint8_t> create_thumbnail_singleband_from_array(
    const Matrix2Dd& data, const std::optional<geo::Grid>& grid, const std::optional<int>& bit,
    const std::optional<LookupTable>& lookup_table, const ThumbnailOptions& options,
    const core::EventEmitter* events) {
    try {
        return singleband_thumbnail_bytes(data, grid, bit, lookup_table, options, events);
    } catch (const EopackError& e) {
        report(events, "create_thumbnail_singleband_from_array", e);
        throw;
    }
}

} // namespace eopack::thumbnail
