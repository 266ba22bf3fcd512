#include "eopack/io/raster_io.hpp"
#include "eopack/core/errors.hpp"
#include "eopack/core/utils.hpp"

#include <cpl_conv.h>
#include <cpl_string.h>

#include <iostream>
#include <mutex>
#include <random>

namespace eopack::io {

namespace {

constexpr int kQuicklookBlockSize = 512;

std::string last_gdal_error() {
    const char* msg = CPLGetLastErrorMsg();
    return (msg && *msg) ? std::string(msg) : std::string("unknown GDAL error");
}

GDALRasterBand* band_or_throw(GDALDataset& ds, int band) {
    if (band < 1 || band > ds.GetRasterCount()) {
        throw IOError("Band " + std::to_string(band) + " out of range (dataset has " +
                      std::to_string(ds.GetRasterCount()) + ")");
    }
    return ds.GetRasterBand(band);
}

void check_shape(GDALDataset& ds, Eigen::Index rows, Eigen::Index cols) {
    if (rows != ds.GetRasterYSize() || cols != ds.GetRasterXSize()) {
        throw ValidationError("array shape " + std::to_string(rows) + "x" + std::to_string(cols) +
                              " does not match dataset " + std::to_string(ds.GetRasterYSize()) +
                              "x" + std::to_string(ds.GetRasterXSize()));
    }
}

void apply_grid(GDALDataset& ds, const geo::Grid& grid) {
    auto gt = grid.transform().to_gdal();
    if (ds.SetGeoTransform(gt.data()) != CE_None) {
        throw IOError("Cannot set geotransform: " + last_gdal_error());
    }
    if (!grid.crs().is_null()) {
        const std::string wkt = grid.crs().to_wkt();
        if (ds.SetProjection(wkt.c_str()) != CE_None) {
            throw IOError("Cannot set projection: " + last_gdal_error());
        }
    }
}

std::string random_suffix() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);
    const char* hex = "0123456789abcdef";
    std::string out;
    for (int i = 0; i < 8; ++i) {
        out += hex[dis(gen)];
    }
    return out;
}

} // namespace

void register_gdal() {
    static std::once_flag once;
    std::call_once(once, [] { GDALAllRegister(); });
}

GDALDatasetUniquePtr open_raster(const fs::path& path) {
    register_gdal();
    GDALDatasetUniquePtr ds(GDALDataset::FromHandle(
        GDALOpenEx(path.string().c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY,
                   nullptr, nullptr, nullptr)));
    if (!ds) {
        throw IOError("Cannot open raster: " + path.string() + " (" + last_gdal_error() + ")");
    }
    return ds;
}

geo::Grid grid_from_dataset(GDALDataset& ds) {
    double gt[6] = {0.0, 1.0, 0.0, 0.0, 0.0, 1.0};
    if (ds.GetGeoTransform(gt) != CE_None) {
        // GDAL leaves the identity transform in place
        gt[0] = 0.0; gt[1] = 1.0; gt[2] = 0.0;
        gt[3] = 0.0; gt[4] = 0.0; gt[5] = 1.0;
    }
    const char* wkt = ds.GetProjectionRef();
    return geo::Grid(ds.GetRasterYSize(), ds.GetRasterXSize(), geo::Affine::from_gdal(gt),
                     geo::Crs(wkt ? std::string(wkt) : std::string()));
}

geo::Grid grid_from_path(const fs::path& path) {
    auto ds = open_raster(path);
    return grid_from_dataset(*ds);
}

BandData read_band(GDALDataset& ds, int band) {
    GDALRasterBand* b = band_or_throw(ds, band);
    const int cols = ds.GetRasterXSize();
    const int rows = ds.GetRasterYSize();

    BandData out;
    out.raster.values.resize(rows, cols);
    out.raster.kind = GDALDataTypeIsFloating(b->GetRasterDataType()) ? PixelKind::FLOATING
                                                                      : PixelKind::INTEGER;

    int has_nodata = 0;
    const double nodata = b->GetNoDataValue(&has_nodata);
    if (has_nodata) {
        out.nodata = nodata;
    }

    const GSpacing pixel_space = sizeof(double);
    const GSpacing line_space = static_cast<GSpacing>(cols) * sizeof(double);
    for (const auto& tile : core::generate_tiles(cols, rows)) {
        const int ysize = tile.rows.second - tile.rows.first;
        const int xsize = tile.cols.second - tile.cols.first;
        double* dst = out.raster.values.data() +
                      static_cast<size_t>(tile.rows.first) * cols + tile.cols.first;
        if (b->RasterIO(GF_Read, tile.cols.first, tile.rows.first, xsize, ysize, dst,
                        xsize, ysize, GDT_Float64, pixel_space, line_space, nullptr) != CE_None) {
            throw IOError("Cannot read band " + std::to_string(band) + " of " +
                          ds.GetDescription() + ": " + last_gdal_error());
        }
    }
    return out;
}

GDALDatasetUniquePtr create_mem_dataset(const geo::Grid& grid, int bands, GDALDataType type) {
    register_gdal();
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("MEM");
    if (!driver) {
        throw IOError("GDAL MEM driver is not available");
    }
    GDALDatasetUniquePtr ds(driver->Create("", grid.cols(), grid.rows(), bands, type, nullptr));
    if (!ds) {
        throw IOError("Cannot create in-memory dataset: " + last_gdal_error());
    }
    apply_grid(*ds, grid);
    return ds;
}

GDALDatasetUniquePtr create_geotiff(const fs::path& path, const geo::Grid& grid, int bands,
                                    GDALDataType type, std::optional<double> nodata) {
    register_gdal();
    GDALDriver* driver = GetGDALDriverManager()->GetDriverByName("GTiff");
    if (!driver) {
        throw IOError("GDAL GTiff driver is not available");
    }

    CPLStringList options;
    options.SetNameValue("TILED", "YES");
    // Only set the block size on larger imagery
    if (grid.rows() > kQuicklookBlockSize) {
        options.SetNameValue("BLOCKYSIZE", std::to_string(kQuicklookBlockSize).c_str());
    }
    if (grid.cols() > kQuicklookBlockSize) {
        options.SetNameValue("BLOCKXSIZE", std::to_string(kQuicklookBlockSize).c_str());
    }

    GDALDatasetUniquePtr ds(driver->Create(path.string().c_str(), grid.cols(), grid.rows(),
                                           bands, type, options.List()));
    if (!ds) {
        throw IOError("Cannot create GeoTIFF: " + path.string() + " (" + last_gdal_error() + ")");
    }
    apply_grid(*ds, grid);
    if (nodata) {
        for (int i = 1; i <= bands; ++i) {
            if (ds->GetRasterBand(i)->SetNoDataValue(*nodata) != CE_None) {
                throw IOError("Cannot set nodata on " + path.string() + ": " + last_gdal_error());
            }
        }
    }
    return ds;
}

void write_band(GDALDataset& ds, int band, const Matrix2Du8& data) {
    check_shape(ds, data.rows(), data.cols());
    GDALRasterBand* b = band_or_throw(ds, band);
    const int cols = static_cast<int>(data.cols());
    const int rows = static_cast<int>(data.rows());
    if (b->RasterIO(GF_Write, 0, 0, cols, rows, const_cast<uint8_t*>(data.data()), cols, rows,
                    GDT_Byte, 0, 0, nullptr) != CE_None) {
        throw IOError("Cannot write band " + std::to_string(band) + ": " + last_gdal_error());
    }
}

void write_band(GDALDataset& ds, int band, const Matrix2Dd& data) {
    check_shape(ds, data.rows(), data.cols());
    GDALRasterBand* b = band_or_throw(ds, band);
    const int cols = static_cast<int>(data.cols());
    const int rows = static_cast<int>(data.rows());
    if (b->RasterIO(GF_Write, 0, 0, cols, rows, const_cast<double*>(data.data()), cols, rows,
                    GDT_Float64, 0, 0, nullptr) != CE_None) {
        throw IOError("Cannot write band " + std::to_string(band) + ": " + last_gdal_error());
    }
}

Matrix2Du8 read_band_u8(GDALDataset& ds, int band) {
    GDALRasterBand* b = band_or_throw(ds, band);
    const int cols = ds.GetRasterXSize();
    const int rows = ds.GetRasterYSize();
    Matrix2Du8 out(rows, cols);
    if (b->RasterIO(GF_Read, 0, 0, cols, rows, out.data(), cols, rows, GDT_Byte, 0, 0,
                    nullptr) != CE_None) {
        throw IOError("Cannot read band " + std::to_string(band) + ": " + last_gdal_error());
    }
    return out;
}

TemporaryDirectory::TemporaryDirectory(const fs::path& parent, const std::string& prefix) {
    constexpr int kAttempts = 16;
    for (int i = 0; i < kAttempts; ++i) {
        fs::path candidate = parent / (prefix + random_suffix());
        std::error_code ec;
        if (fs::create_directory(candidate, ec)) {
            path_ = std::move(candidate);
            return;
        }
        if (ec) {
            throw IOError("Cannot create temporary directory in " + parent.string() + ": " +
                          ec.message());
        }
    }
    throw IOError("Cannot find a free temporary directory name in " + parent.string());
}

TemporaryDirectory::~TemporaryDirectory() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        std::cerr << "[eopack] failed to remove temporary directory " << path_.string()
                  << ": " << ec.message() << std::endl;
    }
}

FileImageSequence::FileImageSequence(std::vector<fs::path> paths) : paths_(std::move(paths)) {}

std::optional<SourceImage> FileImageSequence::next() {
    if (index_ >= paths_.size()) return std::nullopt;
    const fs::path& path = paths_[index_++];

    auto ds = open_raster(path);
    if (ds->GetRasterCount() != 1) {
        throw UnsupportedBandLayoutError(path.string() + " has " +
                                         std::to_string(ds->GetRasterCount()) +
                                         " bands; multi-band measurement files are not supported");
    }
    BandData band = read_band(*ds, 1);
    return SourceImage{std::move(band.raster.values), band.nodata};
}

ArrayImageSequence::ArrayImageSequence(std::vector<const Matrix2Dd*> arrays, double nodata)
    : arrays_(std::move(arrays)), nodata_(nodata) {
    for (const auto* a : arrays_) {
        if (!a) {
            throw ValidationError("null array in image sequence");
        }
    }
}

std::optional<SourceImage> ArrayImageSequence::next() {
    if (index_ >= arrays_.size()) return std::nullopt;
    return SourceImage{*arrays_[index_++], nodata_};
}

} // namespace eopack::io
