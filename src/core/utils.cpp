#include "eopack/core/utils.hpp"
#include "eopack/core/errors.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

namespace eopack::core {

std::string get_iso_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_';

    const char* hex = "0123456789abcdef";
    for (int i = 0; i < 8; ++i) {
        oss << hex[dis(gen)];
    }

    return oss.str();
}

std::vector<uint8_t> read_bytes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }

    auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        throw IOError("Cannot read file: " + path.string());
    }

    return buffer;
}

void write_bytes(const fs::path& path, const std::vector<uint8_t>& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    if (!file) {
        throw IOError("Cannot write file: " + path.string());
    }
}

double percentile_nearest(std::vector<double>& values, double percentile) {
    if (values.empty()) return 0.0;

    const double clamped = std::min(std::max(percentile, 0.0), 100.0);
    const double pos = (clamped / 100.0) * static_cast<double>(values.size() - 1);
    size_t idx = static_cast<size_t>(std::nearbyint(pos));
    idx = std::min(idx, values.size() - 1);

    std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(idx), values.end());
    return values[idx];
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

std::string replace_all(std::string str, char from, char to) {
    std::replace(str.begin(), str.end(), from, to);
    return str;
}

std::string strip_chars(const std::string& str, const std::string& chars) {
    const size_t first = str.find_first_not_of(chars);
    if (first == std::string::npos) return "";
    const size_t last = str.find_last_not_of(chars);
    return str.substr(first, last - first + 1);
}

std::string common_prefix(const std::vector<std::string>& strings) {
    if (strings.empty()) return "";
    std::string prefix = strings.front();
    for (const auto& s : strings) {
        size_t n = 0;
        const size_t limit = std::min(prefix.size(), s.size());
        while (n < limit && prefix[n] == s[n]) ++n;
        prefix.resize(n);
        if (prefix.empty()) break;
    }
    return prefix;
}

std::string common_suffix(const std::vector<std::string>& strings) {
    std::vector<std::string> reversed;
    reversed.reserve(strings.size());
    for (const auto& s : strings) {
        reversed.emplace_back(s.rbegin(), s.rend());
    }
    std::string suffix = common_prefix(reversed);
    std::reverse(suffix.begin(), suffix.end());
    return suffix;
}

std::string format_decimal(double value) {
    char buf[64];
    // Fixed notation between 1e-4 and 1e16, shortest form outside it
    const double mag = std::fabs(value);
    const bool use_fixed = mag >= 1e-4 && mag < 1e16;
    auto res = use_fixed ? std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed)
                     : std::to_chars(buf, buf + sizeof(buf), value);
    std::string out(buf, res.ptr);
    if (out.find_first_of(".eEn") == std::string::npos) {
        out += ".0";
    }
    return out;
}

std::vector<TileWindow> generate_tiles(int samples, int lines, int xtile, int ytile) {
    if (xtile <= 0) xtile = samples;
    if (ytile <= 0) ytile = std::min(100, lines);

    std::vector<TileWindow> tiles;
    if (samples <= 0 || lines <= 0) return tiles;

    for (int ystart = 0; ystart < lines; ystart += ytile) {
        const int yend = std::min(ystart + ytile, lines);
        for (int xstart = 0; xstart < samples; xstart += xtile) {
            const int xend = std::min(xstart + xtile, samples);
            tiles.push_back({{ystart, yend}, {xstart, xend}});
        }
    }
    return tiles;
}

} // namespace eopack::core
