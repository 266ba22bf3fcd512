#include "eopack/core/errors.hpp"
#include "eopack/core/types.hpp"
#include "eopack/core/utils.hpp"
#include "eopack/io/raster_io.hpp"

#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

TEST_CASE("generate_tiles_covers_image_in_row_major_windows") {
    auto tiles = eopack::core::generate_tiles(1624, 1567, 1000, 400);

    REQUIRE(tiles.size() == 8);
    REQUIRE(tiles[0] == eopack::TileWindow{{0, 400}, {0, 1000}});
    REQUIRE(tiles[1] == eopack::TileWindow{{0, 400}, {1000, 1624}});
    REQUIRE(tiles[2] == eopack::TileWindow{{400, 800}, {0, 1000}});
    REQUIRE(tiles[7] == eopack::TileWindow{{1200, 1567}, {1000, 1624}});
}

TEST_CASE("generate_tiles_defaults_to_full_rows_of_100_lines") {
    auto tiles = eopack::core::generate_tiles(50, 250);

    REQUIRE(tiles.size() == 3);
    REQUIRE(tiles[0] == eopack::TileWindow{{0, 100}, {0, 50}});
    REQUIRE(tiles[2] == eopack::TileWindow{{200, 250}, {0, 50}});

    auto small = eopack::core::generate_tiles(20, 30);
    REQUIRE(small.size() == 1);
    REQUIRE(small[0] == eopack::TileWindow{{0, 30}, {0, 20}});

    REQUIRE(eopack::core::generate_tiles(0, 10).empty());
}

TEST_CASE("percentile_nearest_rounds_index_half_to_even") {
    std::vector<double> v;
    for (int i = 1; i <= 10; ++i) v.push_back(static_cast<double>(11 - i));

    auto a = v;
    REQUIRE(eopack::core::percentile_nearest(a, 50.0) == Catch::Approx(5.0));
    auto b = v;
    REQUIRE(eopack::core::percentile_nearest(b, 2.0) == Catch::Approx(1.0));
    auto c = v;
    REQUIRE(eopack::core::percentile_nearest(c, 98.0) == Catch::Approx(10.0));

    std::vector<double> empty;
    REQUIRE(eopack::core::percentile_nearest(empty, 50.0) == 0.0);
}

TEST_CASE("format_decimal_keeps_a_fractional_part") {
    REQUIRE(eopack::core::format_decimal(0.5) == "0.5");
    REQUIRE(eopack::core::format_decimal(1.0) == "1.0");
    REQUIRE(eopack::core::format_decimal(0.25) == "0.25");
    REQUIRE(eopack::core::format_decimal(0.0001) == "0.0001");
    REQUIRE(eopack::core::format_decimal(0.00025) == "0.00025");
    REQUIRE(eopack::core::format_decimal(1e-05) == "1e-05");
    REQUIRE(eopack::core::format_decimal(30.0) == "30.0");
    REQUIRE(eopack::core::format_decimal(100000.0) == "100000.0");
}

TEST_CASE("common_prefix_and_suffix") {
    std::vector<std::string> names{"nbart_red", "nbart_green", "nbart_blue"};
    REQUIRE(eopack::core::common_prefix(names) == "nbart_");
    REQUIRE(eopack::core::common_suffix({"red_qa", "green_qa"}) == "_qa");
    REQUIRE(eopack::core::common_prefix({"a", "b"}).empty());
    REQUIRE(eopack::core::common_prefix({}).empty());
}

TEST_CASE("strip_and_replace_chars") {
    REQUIRE(eopack::core::strip_chars("__nbart:_", "_:") == "nbart");
    REQUIRE(eopack::core::strip_chars("::", "_:").empty());
    REQUIRE(eopack::core::replace_all("oa:fmask", ':', '_') == "oa_fmask");
}

TEST_CASE("bytes_round_trip_through_a_file") {
    eopack::io::TemporaryDirectory tmp(eopack::fs::temp_directory_path(), "eopack-test-");
    const auto path = tmp.path() / "blob.bin";
    std::vector<uint8_t> data{0, 1, 2, 255, 128};

    eopack::core::write_bytes(path, data);
    REQUIRE(eopack::core::read_bytes(path) == data);

    REQUIRE_THROWS_AS(eopack::core::read_bytes(tmp.path() / "missing.bin"), eopack::IOError);
}

TEST_CASE("temporary_directory_is_removed_with_its_contents") {
    eopack::fs::path kept;
    {
        eopack::io::TemporaryDirectory tmp(eopack::fs::temp_directory_path(), "eopack-test-");
        kept = tmp.path();
        REQUIRE(eopack::fs::is_directory(kept));
        eopack::core::write_bytes(kept / "x.bin", {1, 2, 3});
    }
    REQUIRE_FALSE(eopack::fs::exists(kept));
}

TEST_CASE("method_and_resampling_tokens_parse_case_insensitively") {
    REQUIRE(eopack::string_to_valid_data_method(" Convex_Hull ") == eopack::ValidDataMethod::CONVEX_HULL);
    REQUIRE_FALSE(eopack::string_to_valid_data_method("hull").has_value());
    REQUIRE(eopack::string_to_resampling("AVERAGE") == eopack::Resampling::AVERAGE);
    REQUIRE(eopack::valid_data_method_to_string(eopack::ValidDataMethod::BOUNDS) == "bounds");
}
