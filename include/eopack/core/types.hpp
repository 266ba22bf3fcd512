#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace eopack {

namespace fs = std::filesystem;

// Raster types (row-major, like the arrays GDAL hands back)
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Du8 = Eigen::Matrix<std::uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Boolean coverage mask: 1 = valid data, 0 = nodata
using MaskMatrix = Matrix2Du8;

// Source pixel kind; decides the default nodata value
enum class PixelKind {
    INTEGER,
    FLOATING
};

// A single band of pixels with the kind of its source data type
struct Raster {
    Matrix2Dd values;
    PixelKind kind = PixelKind::FLOATING;
};

// Output pixel type for intensity rescaling
enum class PixelType {
    UINT8,
    UINT16,
    INT16,
    INT32,
    FLOAT32,
    FLOAT64
};

inline bool is_integer_type(PixelType type) {
    return type != PixelType::FLOAT32 && type != PixelType::FLOAT64;
}

// Closed [low, high] value interval
using ValueRange = std::pair<double, double>;

inline ValueRange pixel_type_bounds(PixelType type) {
    switch (type) {
        case PixelType::UINT8: return {0.0, 255.0};
        case PixelType::UINT16: return {0.0, 65535.0};
        case PixelType::INT16: return {-32768.0, 32767.0};
        case PixelType::INT32:
            return {static_cast<double>(std::numeric_limits<std::int32_t>::min()),
                    static_cast<double>(std::numeric_limits<std::int32_t>::max())};
        case PixelType::FLOAT32:
            return {static_cast<double>(std::numeric_limits<float>::lowest()),
                    static_cast<double>(std::numeric_limits<float>::max())};
        default:
            return {std::numeric_limits<double>::lowest(), std::numeric_limits<double>::max()};
    }
}

inline std::string normalize_token(const std::string& s) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return norm;
}

// How the valid-data polygon of a grid is derived from its coverage mask
enum class ValidDataMethod {
    THOROUGH,     // vectorize the mask as-is
    FILLED,       // fill interior holes first
    CONVEX_HULL,  // convex hull of the mask first
    BOUNDS        // grid bounds, ignoring pixel values
};

inline std::string valid_data_method_to_string(ValidDataMethod method) {
    switch (method) {
        case ValidDataMethod::THOROUGH: return "thorough";
        case ValidDataMethod::FILLED: return "filled";
        case ValidDataMethod::CONVEX_HULL: return "convex_hull";
        case ValidDataMethod::BOUNDS: return "bounds";
        default: return "unknown";
    }
}

inline std::optional<ValidDataMethod> string_to_valid_data_method(const std::string& s) {
    const std::string norm = normalize_token(s);
    if (norm == "thorough") return ValidDataMethod::THOROUGH;
    if (norm == "filled") return ValidDataMethod::FILLED;
    if (norm == "convex_hull") return ValidDataMethod::CONVEX_HULL;
    if (norm == "bounds") return ValidDataMethod::BOUNDS;
    return std::nullopt;
}

// Resampling used for reprojection and thumbnail downsampling
enum class Resampling {
    NEAREST,
    BILINEAR,
    CUBIC,
    AVERAGE
};

inline std::string resampling_to_string(Resampling r) {
    switch (r) {
        case Resampling::NEAREST: return "nearest";
        case Resampling::BILINEAR: return "bilinear";
        case Resampling::CUBIC: return "cubic";
        case Resampling::AVERAGE: return "average";
        default: return "unknown";
    }
}

inline std::optional<Resampling> string_to_resampling(const std::string& s) {
    const std::string norm = normalize_token(s);
    if (norm == "nearest") return Resampling::NEAREST;
    if (norm == "bilinear") return Resampling::BILINEAR;
    if (norm == "cubic") return Resampling::CUBIC;
    if (norm == "average") return Resampling::AVERAGE;
    return std::nullopt;
}

// Pixel window ((ystart, yend), (xstart, xend)), end-exclusive
struct TileWindow {
    std::pair<int, int> rows;
    std::pair<int, int> cols;

    bool operator==(const TileWindow& other) const {
        return rows == other.rows && cols == other.cols;
    }
};

} // namespace eopack
