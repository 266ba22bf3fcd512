#include "eopack/registry/measurement_registry.hpp"
#include "eopack/core/errors.hpp"
#include "eopack/core/utils.hpp"

namespace eopack::registry {

namespace {

geo::Grid normalized_grid(const geo::Grid& grid) {
    if (grid.crs().is_null()) return grid;
    return grid.with_crs(grid.crs().normalized());
}

// Reports `error` as an event, then throws it
template <typename E>
void report_and_throw(const core::EventEmitter* events, const std::string& operation,
                      const E& error) {
    if (events) {
        events->error(operation, error.what());
    }
    throw error;
}

} // namespace

const NamedGrid* find_grid(const NamedGrids& grids, const std::string& name) {
    for (const auto& g : grids) {
        if (g.name == name) return &g;
    }
    return nullptr;
}

void to_json(nlohmann::json& j, const GridDoc& doc) {
    const auto& t = doc.transform;
    j = nlohmann::json{
        {"shape", {doc.shape.first, doc.shape.second}},
        {"transform", {t.a, t.b, t.c, t.d, t.e, t.f, 0.0, 0.0, 1.0}}
    };
}

void to_json(nlohmann::json& j, const MeasurementDoc& doc) {
    j = nlohmann::json{{"path", doc.path}};
    if (doc.layer) j["layer"] = *doc.layer;
    if (doc.grid) j["grid"] = *doc.grid;
}

void to_json(nlohmann::json& j, const GeoDocs& docs) {
    j = nlohmann::json::object();
    if (!docs.crs.is_null()) j["crs"] = docs.crs.definition();
    j["grids"] = docs.grids;
    j["measurements"] = docs.measurements;
}

geo::Grid grid_from_docs(const GeoDocs& docs, const std::string& grid_name) {
    auto it = docs.grids.find(grid_name);
    if (it == docs.grids.end()) {
        throw ValidationError("no grid named '" + grid_name + "' in the dataset docs");
    }
    return geo::Grid(it->second.shape.first, it->second.shape.second, it->second.transform,
                     docs.crs);
}

MeasurementRegistry::MeasurementRegistry()
    : extractor_(geo::GeosContext::create()) {}

MeasurementRegistry::MeasurementRegistry(geo::PolygonExtractor extractor)
    : extractor_(std::move(extractor)) {}

void MeasurementRegistry::record(const std::string& name, const geo::Grid& grid,
                                 const std::string& path, const RecordOptions& options) {
    record_entry(name, grid, path, nullptr, options);
}

void MeasurementRegistry::record(const std::string& name, const geo::Grid& grid,
                                 const std::string& path, const Raster& pixels,
                                 const RecordOptions& options) {
    record_entry(name, grid, path, &pixels, options);
}

void MeasurementRegistry::record_entry(const std::string& name, const geo::Grid& grid,
                                       const std::string& path, const Raster* pixels,
                                       const RecordOptions& options) {
    if (consumed_) {
        report_and_throw(events_, "record", RegistryConsumedError());
    }

    auto existing = index_.find(name);
    if (existing != index_.end()) {
        report_and_throw(events_, "record",
              DuplicateMeasurementError("band '" + name + "' recorded twice: original at " +
                                        entries_[existing->second].ref.path + ", now " + path));
    }

    if (pixels && (pixels->values.rows() != grid.rows() || pixels->values.cols() != grid.cols())) {
        report_and_throw(events_, "record",
              ValidationError("pixels of '" + name + "' are " +
                              std::to_string(pixels->values.rows()) + "x" +
                              std::to_string(pixels->values.cols()) + ", grid is " +
                              to_string(grid)));
    }

    const size_t gi = grid_index(normalized_grid(grid));
    index_.emplace(name, entries_.size());
    entries_.push_back({MeasurementRef{name, path, options.layer}, gi});

    const bool expand = options.expand_valid_data && pixels != nullptr;
    if (expand) {
        const double nodata = options.nodata.value_or(default_nodata(pixels->kind));
        masks_.expand(gi, valid_pixels(pixels->values, nodata));
    }

    if (events_) {
        events_->measurement_recorded(name, path, expand);
    }
}

std::optional<size_t> MeasurementRegistry::find_grid_index(const geo::Grid& grid) const {
    for (size_t i = 0; i < grids_.size(); ++i) {
        if (grids_[i] == grid) return i;
    }
    return std::nullopt;
}

size_t MeasurementRegistry::grid_index(const geo::Grid& grid) {
    if (auto found = find_grid_index(grid)) {
        return *found;
    }
    grids_.push_back(grid);
    return grids_.size() - 1;
}

std::vector<GridGroup> MeasurementRegistry::groups() const {
    std::vector<GridGroup> out;
    out.reserve(grids_.size());
    for (const auto& g : grids_) {
        out.push_back({g, {}});
    }
    for (const auto& e : entries_) {
        out[e.grid].names.push_back(e.ref.name);
    }
    return out;
}

NamedGrids MeasurementRegistry::assign_names() const {
    NamedGrids named;
    if (grids_.empty()) return named;

    GridNaming naming;
    try {
        naming = name_grids(groups());
    } catch (const EopackError& e) {
        if (events_) events_->error("assign_names", e.what());
        throw;
    }

    for (size_t i = 0; i < naming.order.size(); ++i) {
        const size_t gi = naming.order[i];
        NamedGrid ng{naming.names[i], grids_[gi], {}};
        for (const auto& e : entries_) {
            if (e.grid == gi) ng.measurements.push_back(e.ref);
        }
        named.push_back(std::move(ng));
    }

    if (events_) {
        events_->grids_named(naming.strategy, naming.names);
    }
    return named;
}

GeoDocs MeasurementRegistry::as_geo_docs() const {
    GeoDocs docs;

    for (const auto& ng : assign_names()) {
        const geo::Crs& crs = ng.grid.crs();
        if (docs.crs.is_null()) {
            docs.crs = crs;
        } else if (!crs.is_null() && crs != docs.crs) {
            report_and_throw(events_, "as_geo_docs",
                  InconsistentCrsError("measurements have different CRSes in the same dataset: '" +
                                       docs.crs.definition() + "' and '" + crs.definition() + "'"));
        }

        docs.grids[ng.name] = GridDoc{ng.grid.shape(), ng.grid.transform()};

        for (const auto& m : ng.measurements) {
            MeasurementDoc doc{m.path, m.layer, std::nullopt};
            if (ng.name != kDefaultGridName) doc.grid = ng.name;
            docs.measurements[core::replace_all(m.name, ':', '_')] = std::move(doc);
        }
    }
    return docs;
}

geo::ValidDataGeometry MeasurementRegistry::consume_valid_data(ValidDataMethod method) {
    if (consumed_) {
        report_and_throw(events_, "consume_valid_data", RegistryConsumedError());
    }
    if (!extractor_.supports(method)) {
        report_and_throw(events_, "consume_valid_data",
              ConfigError("valid data method '" + valid_data_method_to_string(method) +
                          "' is not supported by this extractor"));
    }
    consumed_ = true;

    std::vector<geo::GeometryPtr> parts;
    int grid_count = 0;
    geo::ValidDataGeometry result;
    try {
        while (auto item = masks_.pop()) {
            // The mask is released as soon as its polygon exists
            parts.push_back(extractor_.extract(grids_[item->first], std::move(item->second), method));
            ++grid_count;
        }
        result = geo::ValidDataGeometry(extractor_.union_all(std::move(parts)));
    } catch (const EopackError& e) {
        if (events_) events_->error("consume_valid_data", e.what());
        throw;
    }
    if (events_) {
        if (grid_count == 0 && !entries_.empty()) {
            events_->warning("no measurement contributed pixels; valid data is empty");
        }
        events_->valid_data_consumed(method, grid_count, result.is_empty());
    }
    return result;
}

PackagedGeometry MeasurementRegistry::finalize(ValidDataMethod method) {
    if (consumed_) {
        report_and_throw(events_, "finalize", RegistryConsumedError());
    }
    PackagedGeometry out;
    out.docs = as_geo_docs();
    out.valid_data = consume_valid_data(method);
    return out;
}

std::vector<std::string> MeasurementRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& group : groups()) {
        out.insert(out.end(), group.names.begin(), group.names.end());
    }
    return out;
}

std::vector<MeasurementPath> MeasurementRegistry::paths() const {
    std::vector<MeasurementPath> out;
    out.reserve(entries_.size());
    for (size_t gi = 0; gi < grids_.size(); ++gi) {
        for (const auto& e : entries_) {
            if (e.grid == gi) out.push_back({grids_[gi], e.ref.name, e.ref.path});
        }
    }
    return out;
}

const MaskMatrix* MeasurementRegistry::coverage_mask(const geo::Grid& grid) const {
    auto gi = find_grid_index(normalized_grid(grid));
    if (!gi) return nullptr;
    return masks_.find(*gi);
}

} // namespace eopack::registry
