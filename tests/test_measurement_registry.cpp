#include "eopack/config/configuration.hpp"
#include "eopack/core/errors.hpp"
#include "eopack/core/events.hpp"
#include "eopack/geo/polygon_extractor.hpp"
#include "eopack/registry/measurement_registry.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

namespace {

eopack::geo::Grid utm_grid(int size, double res, double x0 = 600000.0,
                           const std::string& crs = "EPSG:32655") {
    eopack::geo::Affine t{res, 0.0, x0, 0.0, -res, 6100000.0};
    return eopack::geo::Grid(size, size, t, eopack::geo::Crs(crs));
}

eopack::Raster int_raster(const eopack::Matrix2Dd& values) {
    return eopack::Raster{values, eopack::PixelKind::INTEGER};
}

} // namespace

TEST_CASE("record_rejects_duplicate_names_across_grids") {
    eopack::registry::MeasurementRegistry reg;
    reg.record("nbart_blue", utm_grid(10, 30.0), "blue.tif");

    try {
        reg.record("nbart_blue", utm_grid(20, 15.0), "pan.tif");
        FAIL("expected DuplicateMeasurementError");
    } catch (const eopack::DuplicateMeasurementError& e) {
        REQUIRE_THAT(e.what(), Catch::Matchers::ContainsSubstring("blue.tif"));
        REQUIRE_THAT(e.what(), Catch::Matchers::ContainsSubstring("pan.tif"));
    }
    REQUIRE(reg.names() == std::vector<std::string>{"nbart_blue"});
    REQUIRE(reg.grid_count() == 1);
}

TEST_CASE("record_groups_equivalent_crs_definitions") {
    eopack::registry::MeasurementRegistry reg;
    const auto grid = utm_grid(10, 30.0);
    const std::string wkt = eopack::geo::Crs("EPSG:32655").to_wkt();

    reg.record("blue", grid, "blue.tif");
    reg.record("green", grid.with_crs(eopack::geo::Crs(wkt)), "green.tif");

    REQUIRE(reg.grid_count() == 1);
    REQUIRE(reg.as_geo_docs().crs.definition() == "EPSG:32655");
}

TEST_CASE("coverage_mask_is_union_of_recorded_pixels") {
    eopack::registry::MeasurementRegistry reg;
    const auto grid = utm_grid(3, 30.0);

    eopack::Matrix2Dd a(3, 3);
    a << 0, 5, 5,
         5, 0, 5,
         5, 5, 0;
    reg.record("a", grid, "a.tif", int_raster(a));

    const eopack::MaskMatrix* mask = reg.coverage_mask(grid);
    REQUIRE(mask != nullptr);
    REQUIRE((*mask)(0, 0) == 0);
    REQUIRE((*mask)(0, 1) == 1);
    REQUIRE(mask->cast<int>().sum() == 6);

    eopack::Matrix2Dd b = eopack::Matrix2Dd::Zero(3, 3);
    b(0, 0) = 7;
    reg.record("b", grid, "b.tif", int_raster(b));

    mask = reg.coverage_mask(grid);
    REQUIRE(mask->cast<int>().sum() == 7);

    // recording an empty band never shrinks coverage
    reg.record("c", grid, "c.tif", int_raster(eopack::Matrix2Dd::Zero(3, 3)));
    REQUIRE(reg.coverage_mask(grid)->cast<int>().sum() == 7);
}

TEST_CASE("default_nodata_follows_pixel_kind") {
    eopack::registry::MeasurementRegistry reg;
    const auto grid = utm_grid(2, 30.0);
    const double nan = std::numeric_limits<double>::quiet_NaN();

    eopack::Matrix2Dd f(2, 2);
    f << nan, 0.0,
         1.5, nan;
    reg.record("f", grid, "f.tif", eopack::Raster{f, eopack::PixelKind::FLOATING});

    const eopack::MaskMatrix* mask = reg.coverage_mask(grid);
    REQUIRE(mask != nullptr);
    REQUIRE((*mask)(0, 0) == 0);
    REQUIRE((*mask)(0, 1) == 1);
    REQUIRE((*mask)(1, 0) == 1);
    REQUIRE((*mask)(1, 1) == 0);
}

TEST_CASE("explicit_nodata_and_disabled_expansion") {
    eopack::registry::MeasurementRegistry reg;
    const auto grid = utm_grid(2, 30.0);

    eopack::Matrix2Dd v(2, 2);
    v << -999, 0,
         3, -999;
    eopack::registry::RecordOptions opts;
    opts.nodata = -999.0;
    reg.record("v", grid, "v.tif", int_raster(v), opts);
    REQUIRE(reg.coverage_mask(grid)->cast<int>().sum() == 2);

    const auto other = utm_grid(2, 60.0);
    eopack::registry::RecordOptions skip;
    skip.expand_valid_data = false;
    reg.record("w", other, "w.tif", int_raster(v), skip);
    REQUIRE(reg.coverage_mask(other) == nullptr);
    REQUIRE(reg.contains("w"));
}

TEST_CASE("record_rejects_pixels_that_do_not_match_grid") {
    eopack::registry::MeasurementRegistry reg;
    REQUIRE_THROWS_AS(reg.record("a", utm_grid(4, 30.0), "a.tif",
                                 int_raster(eopack::Matrix2Dd::Ones(3, 4))),
                      eopack::ValidationError);
    REQUIRE_FALSE(reg.contains("a"));
}

TEST_CASE("assign_names_is_repeatable") {
    eopack::registry::MeasurementRegistry reg;
    reg.record("nbart_panchromatic", utm_grid(20, 15.0), "pan.tif");
    reg.record("nbart_blue", utm_grid(10, 30.0), "blue.tif");
    reg.record("nbart_green", utm_grid(10, 30.0), "green.tif");
    reg.record("nbart_red", utm_grid(10, 30.0), "red.tif");

    auto first = reg.assign_names();
    auto second = reg.assign_names();

    REQUIRE(first.size() == 2);
    REQUIRE(first[0].name == "default");
    REQUIRE(first[0].measurements.size() == 3);
    REQUIRE(first[1].name == "nbart_panchromatic");
    REQUIRE(second.size() == first.size());
    for (size_t i = 0; i < first.size(); ++i) {
        REQUIRE(second[i].name == first[i].name);
        REQUIRE(second[i].grid == first[i].grid);
    }

    REQUIRE(reg.names() == std::vector<std::string>{"nbart_panchromatic", "nbart_blue",
                                                    "nbart_green", "nbart_red"});
    REQUIRE(eopack::registry::find_grid(first, "default") != nullptr);
    REQUIRE(eopack::registry::find_grid(first, "missing") == nullptr);
}

TEST_CASE("as_geo_docs_describes_grids_and_measurements") {
    eopack::registry::MeasurementRegistry reg;
    eopack::registry::RecordOptions layered;
    layered.layer = "2";
    reg.record("oa:fmask", utm_grid(10, 30.0), "fmask.nc", layered);
    reg.record("nbart:blue", utm_grid(10, 30.0), "blue.tif");
    reg.record("nbart:panchromatic", utm_grid(20, 15.0), "pan.tif");

    const auto docs = reg.as_geo_docs();

    REQUIRE(docs.crs.definition() == "EPSG:32655");
    REQUIRE(docs.grids.size() == 2);
    REQUIRE(docs.grids.count("default") == 1);
    REQUIRE(docs.grids.count("nbart:panchromatic") == 1);
    REQUIRE(docs.grids.at("default").shape == std::make_pair(10, 10));

    REQUIRE(docs.measurements.count("oa_fmask") == 1);
    REQUIRE(docs.measurements.at("oa_fmask").layer == std::optional<std::string>("2"));
    REQUIRE_FALSE(docs.measurements.at("nbart_blue").grid.has_value());
    REQUIRE(docs.measurements.at("nbart_panchromatic").grid ==
            std::optional<std::string>("nbart:panchromatic"));

    const nlohmann::json j = docs;
    REQUIRE(j["crs"] == "EPSG:32655");
    REQUIRE(j["grids"]["default"]["shape"] == nlohmann::json::array({10, 10}));
    REQUIRE(j["grids"]["default"]["transform"].size() == 9);
    REQUIRE(j["grids"]["default"]["transform"][0].get<double>() == Catch::Approx(30.0));
    REQUIRE(j["grids"]["default"]["transform"][8].get<double>() == Catch::Approx(1.0));
    REQUIRE_FALSE(j["measurements"]["nbart_blue"].contains("grid"));
    REQUIRE_FALSE(j["measurements"]["nbart_blue"].contains("layer"));
    REQUIRE(j["measurements"]["oa_fmask"]["layer"] == "2");

    const auto rebuilt = eopack::registry::grid_from_docs(docs);
    REQUIRE(rebuilt == utm_grid(10, 30.0));
    REQUIRE_THROWS_AS(eopack::registry::grid_from_docs(docs, "nope"), eopack::ValidationError);
}

TEST_CASE("as_geo_docs_rejects_mixed_crs") {
    eopack::registry::MeasurementRegistry reg;
    reg.record("a", utm_grid(10, 30.0), "a.tif");
    reg.record("b", utm_grid(10, 30.0, 600000.0, "EPSG:32656"), "b.tif");

    REQUIRE_THROWS_AS(reg.as_geo_docs(), eopack::InconsistentCrsError);
}

TEST_CASE("empty_registry_produces_empty_outputs") {
    eopack::registry::MeasurementRegistry reg;

    REQUIRE(reg.assign_names().empty());
    REQUIRE(reg.as_geo_docs().empty());

    const nlohmann::json j = reg.as_geo_docs();
    REQUIRE_FALSE(j.contains("crs"));
    REQUIRE(j["grids"].empty());

    auto geom = reg.consume_valid_data();
    REQUIRE(geom.is_empty());
}

TEST_CASE("registry_is_single_use") {
    eopack::registry::MeasurementRegistry reg;
    const auto grid = utm_grid(4, 30.0);
    reg.record("a", grid, "a.tif", int_raster(eopack::Matrix2Dd::Ones(4, 4)));

    auto geom = reg.consume_valid_data(eopack::ValidDataMethod::BOUNDS);
    REQUIRE_FALSE(geom.is_empty());
    REQUIRE(reg.consumed());

    REQUIRE_THROWS_AS(reg.consume_valid_data(), eopack::RegistryConsumedError);
    REQUIRE_THROWS_AS(reg.finalize(), eopack::RegistryConsumedError);
    REQUIRE_THROWS_AS(reg.record("b", grid, "b.tif"), eopack::RegistryConsumedError);

    // naming still works on the recorded measurements
    REQUIRE(reg.as_geo_docs().measurements.size() == 1);
}

TEST_CASE("finalize_bounds_method_matches_grid_extent") {
    eopack::registry::MeasurementRegistry reg;
    const auto grid = utm_grid(10, 30.0);

    eopack::Matrix2Dd v = eopack::Matrix2Dd::Zero(10, 10);
    v(5, 5) = 1;
    reg.record("a", grid, "a.tif", int_raster(v));

    auto packaged = reg.finalize(eopack::ValidDataMethod::BOUNDS);
    REQUIRE(packaged.docs.grids.size() == 1);

    auto b = packaged.valid_data.bounds();
    REQUIRE(b.has_value());
    REQUIRE(b->left == Catch::Approx(600000.0));
    REQUIRE(b->right == Catch::Approx(600300.0));
    REQUIRE(b->bottom == Catch::Approx(6099700.0));
    REQUIRE(b->top == Catch::Approx(6100000.0));
}

TEST_CASE("finalize_thorough_stays_inside_grid") {
    eopack::registry::MeasurementRegistry reg;
    const auto grid = utm_grid(10, 30.0);
    reg.record("a", grid, "a.tif", int_raster(eopack::Matrix2Dd::Ones(10, 10)));

    auto packaged = reg.finalize();
    const auto& geom = packaged.valid_data;

    REQUIRE_FALSE(geom.is_empty());
    REQUIRE(geom.within_box(grid.bounding_box(), 1e-6));
    REQUIRE(geom.area() == Catch::Approx(300.0 * 300.0).epsilon(0.01));
}

TEST_CASE("measurements_without_pixels_add_no_coverage") {
    eopack::registry::MeasurementRegistry reg;
    reg.record("a", utm_grid(10, 30.0), "a.tif");
    reg.record("b", utm_grid(10, 30.0), "b.tif");

    auto geom = reg.consume_valid_data();
    REQUIRE(geom.is_empty());
}

TEST_CASE("convex_hull_needs_a_hull_filter") {
    eopack::geo::PolygonExtractor extractor(eopack::geo::GeosContext::create(), nullptr);
    eopack::registry::MeasurementRegistry reg(std::move(extractor));
    reg.record("a", utm_grid(4, 30.0), "a.tif", int_raster(eopack::Matrix2Dd::Ones(4, 4)));

    REQUIRE_THROWS_AS(reg.consume_valid_data(eopack::ValidDataMethod::CONVEX_HULL),
                      eopack::ConfigError);
    // the failed call did not consume the masks
    REQUIRE_FALSE(reg.consumed());
    REQUIRE_FALSE(reg.consume_valid_data(eopack::ValidDataMethod::FILLED).is_empty());
}

TEST_CASE("registry_emits_json_events") {
    std::ostringstream log;
    eopack::core::EventEmitter events(&log, "run-1");
    eopack::registry::MeasurementRegistry reg;
    reg.set_events(&events);

    reg.record("a", utm_grid(4, 30.0), "a.tif", int_raster(eopack::Matrix2Dd::Ones(4, 4)));
    reg.finalize(eopack::ValidDataMethod::BOUNDS);

    std::istringstream lines(log.str());
    std::string line;
    std::vector<std::string> types;
    while (std::getline(lines, line)) {
        auto event = nlohmann::json::parse(line);
        REQUIRE(event["run_id"] == "run-1");
        types.push_back(event["type"].get<std::string>());
    }
    REQUIRE(types == std::vector<std::string>{"measurement_recorded", "grids_named",
                                              "valid_data_consumed"});
}

TEST_CASE("paths_list_measurements_with_their_grids") {
    eopack::registry::MeasurementRegistry reg;
    reg.record("pan", utm_grid(20, 15.0), "pan.tif");
    reg.record("blue", utm_grid(10, 30.0), "blue.tif");

    auto paths = reg.paths();
    REQUIRE(paths.size() == 2);
    REQUIRE(paths[0].name == "pan");
    REQUIRE(paths[0].path == "pan.tif");
    REQUIRE(paths[0].grid.resolution().first == Catch::Approx(15.0));
    REQUIRE(paths[1].grid == utm_grid(10, 30.0));
}

TEST_CASE("empty_coverage_emits_a_warning") {
    std::ostringstream log;
    eopack::core::EventEmitter events(&log, "run-1");
    eopack::registry::MeasurementRegistry reg;
    reg.set_events(&events);

    reg.record("a", utm_grid(4, 30.0), "a.tif");
    auto geom = reg.consume_valid_data();

    REQUIRE(geom.is_empty());
    REQUIRE_THAT(log.str(), Catch::Matchers::ContainsSubstring("\"type\":\"warning\""));
}

TEST_CASE("failures_emit_error_events") {
    std::ostringstream log;
    eopack::core::EventEmitter events(&log, "run-1");
    eopack::registry::MeasurementRegistry reg;
    reg.set_events(&events);

    reg.record("a", utm_grid(4, 30.0), "a.tif");
    REQUIRE_THROWS_AS(reg.record("a", utm_grid(4, 30.0), "again.tif"),
                      eopack::DuplicateMeasurementError);

    std::istringstream lines(log.str());
    std::string line;
    std::vector<nlohmann::json> errors;
    while (std::getline(lines, line)) {
        auto event = nlohmann::json::parse(line);
        if (event["type"] == "error") errors.push_back(event);
    }
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0]["operation"] == "record");
    REQUIRE_THAT(errors[0]["error"].get<std::string>(),
                 Catch::Matchers::ContainsSubstring("again.tif"));

    reg.consume_valid_data(eopack::ValidDataMethod::BOUNDS);
    REQUIRE_THROWS_AS(reg.finalize(), eopack::RegistryConsumedError);
    REQUIRE_THAT(log.str(), Catch::Matchers::ContainsSubstring("\"operation\":\"finalize\""));
}

TEST_CASE("finalize_with_configured_method") {
    auto cfg = eopack::config::PackagingConfig::from_yaml(
        YAML::Load("valid_data:\n  method: bounds\n"));
    eopack::registry::MeasurementRegistry reg;
    const auto grid = utm_grid(4, 30.0);
    eopack::Matrix2Dd corner = eopack::Matrix2Dd::Zero(4, 4);
    corner(0, 0) = 1;
    reg.record("a", grid, "a.tif", int_raster(corner));

    auto packaged = reg.finalize(cfg.valid_data.resolved_method());

    // the bounds method covers the whole grid whatever the mask says
    REQUIRE(packaged.valid_data.area() == Catch::Approx(120.0 * 120.0));
}
