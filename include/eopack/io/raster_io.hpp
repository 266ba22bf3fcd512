#pragma once

#include "eopack/core/types.hpp"
#include "eopack/geo/grid.hpp"

#include <gdal_priv.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace eopack::io {

namespace fs = std::filesystem;

// Registers all GDAL drivers once per process
void register_gdal();

GDALDatasetUniquePtr open_raster(const fs::path& path);

geo::Grid grid_from_dataset(GDALDataset& ds);
geo::Grid grid_from_path(const fs::path& path);

// One band of a dataset plus its nodata value (if the band declares one)
struct BandData {
    Raster raster;
    std::optional<double> nodata;
};

// Reads `band` (1-based) as doubles, 100 lines at a time
BandData read_band(GDALDataset& ds, int band = 1);

// Empty in-memory dataset laid out on `grid`
GDALDatasetUniquePtr create_mem_dataset(const geo::Grid& grid, int bands, GDALDataType type);

// Tiled GeoTIFF on `grid` (512 pixel blocks on larger images)
GDALDatasetUniquePtr create_geotiff(const fs::path& path, const geo::Grid& grid, int bands,
                                    GDALDataType type, std::optional<double> nodata);

void write_band(GDALDataset& ds, int band, const Matrix2Du8& data);
void write_band(GDALDataset& ds, int band, const Matrix2Dd& data);
Matrix2Du8 read_band_u8(GDALDataset& ds, int band);

// Uniquely named directory removed (with its contents) when the object dies
class TemporaryDirectory {
public:
    TemporaryDirectory(const fs::path& parent, const std::string& prefix);
    ~TemporaryDirectory();

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

// A single-band image and the value that marks missing pixels in it
struct SourceImage {
    Matrix2Dd values;
    std::optional<double> nodata;
};

// Single-pass stream of band images. Each call to next() yields the
// following image, or nullopt once the sequence is exhausted.
class ImageSequence {
public:
    virtual ~ImageSequence() = default;
    virtual std::optional<SourceImage> next() = 0;
    virtual size_t size() const = 0;
};

// Opens each file only when it is reached and closes it before returning
class FileImageSequence : public ImageSequence {
public:
    explicit FileImageSequence(std::vector<fs::path> paths);

    std::optional<SourceImage> next() override;
    size_t size() const override { return paths_.size(); }

private:
    std::vector<fs::path> paths_;
    size_t index_ = 0;
};

// Caller-owned arrays sharing one nodata value. The arrays must outlive
// the sequence.
class ArrayImageSequence : public ImageSequence {
public:
    static constexpr double kDefaultNodata = -999.0;

    explicit ArrayImageSequence(std::vector<const Matrix2Dd*> arrays,
                                double nodata = kDefaultNodata);

    std::optional<SourceImage> next() override;
    size_t size() const override { return arrays_.size(); }

private:
    std::vector<const Matrix2Dd*> arrays_;
    double nodata_;
    size_t index_ = 0;
};

} // namespace eopack::io
