#include "eopack/config/configuration.hpp"
#include "eopack/core/errors.hpp"
#include "eopack/core/types.hpp"

#include <fstream>

namespace eopack::config {

static void read_double_pair(const YAML::Node& n, std::array<double, 2>& out) {
    if (n && n.IsSequence() && n.size() == 2) {
        out[0] = n[0].as<double>();
        out[1] = n[1].as<double>();
    } else if (n) {
        throw ConfigError("expected a [low, high] pair");
    }
}

PackagingConfig PackagingConfig::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node = YAML::LoadFile(path.string());
    return from_yaml(node);
}

PackagingConfig PackagingConfig::from_yaml(const YAML::Node& node) {
    PackagingConfig cfg;

    if (node["valid_data"]) {
        auto v = node["valid_data"];
        if (v["method"]) cfg.valid_data.method = v["method"].as<std::string>();
    }

    if (node["thumbnail"]) {
        auto t = node["thumbnail"];
        if (t["out_scale"]) cfg.thumbnail.out_scale = t["out_scale"].as<int>();
        if (t["resampling"]) cfg.thumbnail.resampling = t["resampling"].as<std::string>();
        read_double_pair(t["percentile_stretch"], cfg.thumbnail.percentile_stretch);
        if (t["static_stretch"] && !t["static_stretch"].IsNull()) {
            std::array<double, 2> range{0.0, 0.0};
            read_double_pair(t["static_stretch"], range);
            cfg.thumbnail.static_stretch = range;
        }
        if (t["compress_quality"]) cfg.thumbnail.compress_quality = t["compress_quality"].as<int>();
        if (t["target_crs"]) cfg.thumbnail.target_crs = t["target_crs"].as<std::string>();
        if (t["warp_threads"]) cfg.thumbnail.warp_threads = t["warp_threads"].as<int>();
        if (t["array_nodata"]) cfg.thumbnail.array_nodata = t["array_nodata"].as<double>();
    }

    return cfg;
}

void PackagingConfig::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node PackagingConfig::to_yaml() const {
    YAML::Node node;

    node["valid_data"]["method"] = valid_data.method;

    node["thumbnail"]["out_scale"] = thumbnail.out_scale;
    node["thumbnail"]["resampling"] = thumbnail.resampling;
    node["thumbnail"]["percentile_stretch"].push_back(thumbnail.percentile_stretch[0]);
    node["thumbnail"]["percentile_stretch"].push_back(thumbnail.percentile_stretch[1]);
    if (thumbnail.static_stretch) {
        node["thumbnail"]["static_stretch"].push_back((*thumbnail.static_stretch)[0]);
        node["thumbnail"]["static_stretch"].push_back((*thumbnail.static_stretch)[1]);
    }
    node["thumbnail"]["compress_quality"] = thumbnail.compress_quality;
    node["thumbnail"]["target_crs"] = thumbnail.target_crs;
    node["thumbnail"]["warp_threads"] = thumbnail.warp_threads;
    node["thumbnail"]["array_nodata"] = thumbnail.array_nodata;

    return node;
}

ValidDataMethod ValidDataConfig::resolved_method() const {
    auto m = string_to_valid_data_method(method);
    if (!m) {
        throw ValidationError("valid_data.method must be one of thorough, filled, convex_hull, bounds");
    }
    return *m;
}

void PackagingConfig::validate() const {
    valid_data.resolved_method();
    if (thumbnail.out_scale < 1) {
        throw ValidationError("thumbnail.out_scale must be >= 1");
    }
    if (!string_to_resampling(thumbnail.resampling)) {
        throw ValidationError("thumbnail.resampling must be one of nearest, bilinear, cubic, average");
    }
    const auto& p = thumbnail.percentile_stretch;
    if (!(p[0] >= 0.0 && p[0] < p[1] && p[1] <= 100.0)) {
        throw ValidationError("thumbnail.percentile_stretch must be [low, high] with 0 <= low < high <= 100");
    }
    if (thumbnail.static_stretch && !((*thumbnail.static_stretch)[0] < (*thumbnail.static_stretch)[1])) {
        throw ValidationError("thumbnail.static_stretch must be [low, high] with low < high");
    }
    if (thumbnail.compress_quality < 1 || thumbnail.compress_quality > 100) {
        throw ValidationError("thumbnail.compress_quality must be in [1,100]");
    }
    if (thumbnail.target_crs.empty()) {
        throw ValidationError("thumbnail.target_crs must not be empty");
    }
    if (thumbnail.warp_threads < 1) {
        throw ValidationError("thumbnail.warp_threads must be >= 1");
    }
}

} // namespace eopack::config
