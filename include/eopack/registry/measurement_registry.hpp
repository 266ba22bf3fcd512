#pragma once

#include "eopack/core/events.hpp"
#include "eopack/core/types.hpp"
#include "eopack/geo/geometry.hpp"
#include "eopack/geo/grid.hpp"
#include "eopack/geo/polygon_extractor.hpp"
#include "eopack/registry/coverage_mask.hpp"
#include "eopack/registry/grid_naming.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace eopack::registry {

struct MeasurementRef {
    std::string name;
    std::string path;
    std::optional<std::string> layer;
};

struct RecordOptions {
    std::optional<std::string> layer;
    // Defaults to NaN for floating point pixels, 0 for integer pixels
    std::optional<double> nodata;
    bool expand_valid_data = true;
};

struct NamedGrid {
    std::string name;
    geo::Grid grid;
    std::vector<MeasurementRef> measurements;
};

// Default grid first, then the others from most to fewest measurements
using NamedGrids = std::vector<NamedGrid>;

const NamedGrid* find_grid(const NamedGrids& grids, const std::string& name);

struct GridDoc {
    std::pair<int, int> shape;  // (rows, cols)
    geo::Affine transform;
};

struct MeasurementDoc {
    std::string path;
    std::optional<std::string> layer;
    std::optional<std::string> grid;  // absent for the default grid
};

struct GeoDocs {
    geo::Crs crs;
    std::map<std::string, GridDoc> grids;
    std::map<std::string, MeasurementDoc> measurements;

    bool empty() const { return grids.empty(); }
};

void to_json(nlohmann::json& j, const GridDoc& doc);
void to_json(nlohmann::json& j, const MeasurementDoc& doc);
void to_json(nlohmann::json& j, const GeoDocs& docs);

// Result of the single terminal step of a packaging run
struct PackagedGeometry {
    GeoDocs docs;
    geo::ValidDataGeometry valid_data;
};

struct MeasurementPath {
    geo::Grid grid;
    std::string name;
    std::string path;
};

// Rebuilds the grid called `grid_name` from previously produced docs
geo::Grid grid_from_docs(const GeoDocs& docs, const std::string& grid_name = kDefaultGridName);

// Collects the measurements of one dataset, grouped by grid, together with
// their coverage masks. Single use: once the masks are consumed the
// registry refuses further records and consumption.
class MeasurementRegistry {
public:
    MeasurementRegistry();
    explicit MeasurementRegistry(geo::PolygonExtractor extractor);

    void set_events(const core::EventEmitter* events) { events_ = events; }

    // Records a measurement without pixels (its grid gets no coverage)
    void record(const std::string& name, const geo::Grid& grid, const std::string& path,
                const RecordOptions& options = {});

    // Records a measurement and ORs its valid pixels into the grid's mask
    void record(const std::string& name, const geo::Grid& grid, const std::string& path,
                const Raster& pixels, const RecordOptions& options = {});

    NamedGrids assign_names() const;

    GeoDocs as_geo_docs() const;

    geo::ValidDataGeometry consume_valid_data(ValidDataMethod method = ValidDataMethod::THOROUGH);

    // Names the grids, then consumes the masks
    PackagedGeometry finalize(ValidDataMethod method = ValidDataMethod::THOROUGH);

    // Measurement names, grid by grid in first-recorded order
    std::vector<std::string> names() const;
    std::vector<MeasurementPath> paths() const;

    bool contains(const std::string& name) const { return index_.count(name) > 0; }
    size_t grid_count() const { return grids_.size(); }
    bool consumed() const { return consumed_; }

    // Current mask of the grid `grid` (after CRS normalization); null if none
    const MaskMatrix* coverage_mask(const geo::Grid& grid) const;

private:
    struct Entry {
        MeasurementRef ref;
        size_t grid;
    };

    void record_entry(const std::string& name, const geo::Grid& grid, const std::string& path,
                      const Raster* pixels, const RecordOptions& options);
    size_t grid_index(const geo::Grid& grid);
    std::optional<size_t> find_grid_index(const geo::Grid& grid) const;
    std::vector<GridGroup> groups() const;

    geo::PolygonExtractor extractor_;
    const core::EventEmitter* events_ = nullptr;

    std::vector<geo::Grid> grids_;
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
    CoverageMasks masks_;
    bool consumed_ = false;
};

} // namespace eopack::registry
