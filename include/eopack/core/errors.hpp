#pragma once

#include <stdexcept>
#include <string>

namespace eopack {

class EopackError : public std::runtime_error {
public:
    explicit EopackError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public EopackError {
public:
    explicit ConfigError(const std::string& message)
        : EopackError("Config error: " + message) {}
};

class ValidationError : public EopackError {
public:
    explicit ValidationError(const std::string& message)
        : EopackError("Validation error: " + message) {}
};

class IOError : public EopackError {
public:
    explicit IOError(const std::string& message)
        : EopackError("I/O error: " + message) {}
};

class GeometryError : public EopackError {
public:
    explicit GeometryError(const std::string& message)
        : EopackError("Geometry error: " + message) {}
};

// Registry errors

class DuplicateMeasurementError : public EopackError {
public:
    explicit DuplicateMeasurementError(const std::string& message)
        : EopackError("Duplicate measurement: " + message) {}
};

class InconsistentCrsError : public EopackError {
public:
    explicit InconsistentCrsError(const std::string& message)
        : EopackError("Inconsistent CRS: " + message) {}
};

class TooManyGridsError : public EopackError {
public:
    explicit TooManyGridsError(const std::string& message)
        : EopackError("Too many grids: " + message) {}
};

class RegistryConsumedError : public EopackError {
public:
    RegistryConsumedError()
        : EopackError("Measurement registry was already consumed") {}
};

// Thumbnail errors

class InvalidFilterArgsError : public EopackError {
public:
    explicit InvalidFilterArgsError(const std::string& message)
        : EopackError("Invalid filter arguments: " + message) {}
};

class MissingGeoboxError : public EopackError {
public:
    explicit MissingGeoboxError(const std::string& message)
        : EopackError("Missing grid: " + message) {}
};

class UnsupportedBandLayoutError : public IOError {
public:
    explicit UnsupportedBandLayoutError(const std::string& message)
        : IOError("Unsupported band layout: " + message) {}
};

} // namespace eopack
