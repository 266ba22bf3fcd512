#include "eopack/config/configuration.hpp"
#include "eopack/core/errors.hpp"
#include "eopack/io/raster_io.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

TEST_CASE("default_config_is_valid") {
    eopack::config::PackagingConfig cfg;
    REQUIRE_NOTHROW(cfg.validate());
    REQUIRE(cfg.valid_data.method == "thorough");
    REQUIRE(cfg.thumbnail.out_scale == 10);
    REQUIRE(cfg.thumbnail.resampling == "average");
    REQUIRE(cfg.thumbnail.compress_quality == 85);
    REQUIRE(cfg.thumbnail.target_crs == "EPSG:4326");
    REQUIRE_FALSE(cfg.thumbnail.static_stretch.has_value());
}

TEST_CASE("from_yaml_reads_every_section") {
    YAML::Node node = YAML::Load(R"(
valid_data:
  method: convex_hull
thumbnail:
  out_scale: 4
  resampling: cubic
  percentile_stretch: [5, 95]
  static_stretch: [0, 3000]
  compress_quality: 60
  target_crs: EPSG:3577
  warp_threads: 4
  array_nodata: -1
)");

    auto cfg = eopack::config::PackagingConfig::from_yaml(node);

    REQUIRE(cfg.valid_data.method == "convex_hull");
    REQUIRE(cfg.thumbnail.out_scale == 4);
    REQUIRE(cfg.thumbnail.resampling == "cubic");
    REQUIRE(cfg.thumbnail.percentile_stretch[0] == Catch::Approx(5.0));
    REQUIRE(cfg.thumbnail.percentile_stretch[1] == Catch::Approx(95.0));
    REQUIRE(cfg.thumbnail.static_stretch.has_value());
    REQUIRE((*cfg.thumbnail.static_stretch)[1] == Catch::Approx(3000.0));
    REQUIRE(cfg.thumbnail.compress_quality == 60);
    REQUIRE(cfg.thumbnail.target_crs == "EPSG:3577");
    REQUIRE(cfg.thumbnail.warp_threads == 4);
    REQUIRE(cfg.thumbnail.array_nodata == Catch::Approx(-1.0));
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("from_yaml_keeps_defaults_for_missing_keys") {
    auto cfg = eopack::config::PackagingConfig::from_yaml(YAML::Load("thumbnail:\n  out_scale: 2\n"));

    REQUIRE(cfg.thumbnail.out_scale == 2);
    REQUIRE(cfg.valid_data.method == "thorough");
    REQUIRE(cfg.thumbnail.percentile_stretch[0] == Catch::Approx(2.0));
    REQUIRE(cfg.thumbnail.percentile_stretch[1] == Catch::Approx(98.0));
}

TEST_CASE("from_yaml_rejects_malformed_pairs") {
    REQUIRE_THROWS_AS(eopack::config::PackagingConfig::from_yaml(
                          YAML::Load("thumbnail:\n  percentile_stretch: [1, 2, 3]\n")),
                      eopack::ConfigError);
}

TEST_CASE("validate_rejects_out_of_range_values") {
    eopack::config::PackagingConfig cfg;

    cfg.valid_data.method = "outline";
    REQUIRE_THROWS_AS(cfg.validate(), eopack::ValidationError);
    cfg.valid_data.method = "bounds";

    cfg.thumbnail.out_scale = 0;
    REQUIRE_THROWS_AS(cfg.validate(), eopack::ValidationError);
    cfg.thumbnail.out_scale = 10;

    cfg.thumbnail.percentile_stretch = {98.0, 2.0};
    REQUIRE_THROWS_AS(cfg.validate(), eopack::ValidationError);
    cfg.thumbnail.percentile_stretch = {2.0, 98.0};

    cfg.thumbnail.static_stretch = std::array<double, 2>{5.0, 5.0};
    REQUIRE_THROWS_AS(cfg.validate(), eopack::ValidationError);
    cfg.thumbnail.static_stretch.reset();

    cfg.thumbnail.compress_quality = 101;
    REQUIRE_THROWS_AS(cfg.validate(), eopack::ValidationError);
    cfg.thumbnail.compress_quality = 85;

    cfg.thumbnail.resampling = "lanczos";
    REQUIRE_THROWS_AS(cfg.validate(), eopack::ValidationError);
    cfg.thumbnail.resampling = "nearest";

    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_save_and_load") {
    eopack::io::TemporaryDirectory tmp(eopack::fs::temp_directory_path(), "eopack-test-");
    const auto path = tmp.path() / "eopack.yaml";

    eopack::config::PackagingConfig cfg;
    cfg.valid_data.method = "filled";
    cfg.thumbnail.out_scale = 5;
    cfg.thumbnail.static_stretch = std::array<double, 2>{10.0, 500.0};
    cfg.save(path);

    auto loaded = eopack::config::PackagingConfig::load(path);
    REQUIRE(loaded.valid_data.method == "filled");
    REQUIRE(loaded.thumbnail.out_scale == 5);
    REQUIRE(loaded.thumbnail.static_stretch.has_value());
    REQUIRE((*loaded.thumbnail.static_stretch)[0] == Catch::Approx(10.0));
    REQUIRE((*loaded.thumbnail.static_stretch)[1] == Catch::Approx(500.0));
    REQUIRE(loaded.thumbnail.target_crs == "EPSG:4326");
}

TEST_CASE("load_missing_config_file_throws") {
    REQUIRE_THROWS_AS(eopack::config::PackagingConfig::load("/nonexistent/eopack.yaml"),
                      eopack::ConfigError);
}

TEST_CASE("valid_data_method_resolves_to_enum") {
    eopack::config::ValidDataConfig cfg;
    REQUIRE(cfg.resolved_method() == eopack::ValidDataMethod::THOROUGH);

    cfg.method = "convex_hull";
    REQUIRE(cfg.resolved_method() == eopack::ValidDataMethod::CONVEX_HULL);

    auto loaded = eopack::config::PackagingConfig::from_yaml(
        YAML::Load("valid_data:\n  method: bounds\n"));
    REQUIRE(loaded.valid_data.resolved_method() == eopack::ValidDataMethod::BOUNDS);

    cfg.method = "outline";
    REQUIRE_THROWS_AS(cfg.resolved_method(), eopack::ValidationError);
}
