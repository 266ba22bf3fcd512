#pragma once

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

#include "eopack/core/types.hpp"

namespace eopack::config {

namespace fs = std::filesystem;

struct ValidDataConfig {
  std::string method = "thorough"; // thorough | filled | convex_hull | bounds

  // Throws ValidationError for an unknown method name
  ValidDataMethod resolved_method() const;
};

struct ThumbnailConfig {
  int out_scale = 10;
  std::string resampling = "average"; // nearest | bilinear | cubic | average
  std::array<double, 2> percentile_stretch{2.0, 98.0};
  std::optional<std::array<double, 2>> static_stretch;
  int compress_quality = 85;
  std::string target_crs = "EPSG:4326";
  int warp_threads = 2;
  double array_nodata = -999.0;
};

struct PackagingConfig {
  ValidDataConfig valid_data;
  ThumbnailConfig thumbnail;

  static PackagingConfig load(const fs::path &path);
  static PackagingConfig from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

} // namespace eopack::config
