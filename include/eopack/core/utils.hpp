#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace eopack::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
void write_bytes(const fs::path& path, const std::vector<uint8_t>& data);

// Math utilities

// Nearest-rank percentile (numpy "nearest"): index rounded half-to-even.
// Reorders `values`. Returns 0 for an empty input.
double percentile_nearest(std::vector<double>& values, double percentile);

// String utilities
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::string replace_all(std::string str, char from, char to);
std::string strip_chars(const std::string& str, const std::string& chars);

// Longest prefix/suffix shared by every string (empty input -> "")
std::string common_prefix(const std::vector<std::string>& strings);
std::string common_suffix(const std::vector<std::string>& strings);

// Shortest round-trip decimal for a double, always with a fractional part or
// exponent ("0.5", "1.0", "0.0001", "2.5e-05"). Exponents appear only below
// 1e-4 or from 1e16 up.
std::string format_decimal(double value);

// Block windows over a (lines x samples) array. xtile <= 0 means all samples,
// ytile <= 0 means min(100, lines).
std::vector<TileWindow> generate_tiles(int samples, int lines, int xtile = -1, int ytile = -1);

} // namespace eopack::core
