#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace nineslice {

class NineSliceError : public std::runtime_error {
public:
    explicit NineSliceError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public NineSliceError {
public:
    explicit ConfigError(const std::string& message)
        : NineSliceError("Config error: " + message) {}
};

class ValidationError : public NineSliceError {
public:
    explicit ValidationError(const std::string& message)
        : NineSliceError("Validation error: " + message) {}
};

class InvalidDimensionError : public NineSliceError {
public:
    InvalidDimensionError(int width, int height)
        : NineSliceError("Invalid image dimension: " + std::to_string(width) +
                         "x" + std::to_string(height)),
          width_(width), height_(height) {}

    int width() const { return width_; }
    int height() const { return height_; }

private:
    int width_;
    int height_;
};

class InvalidPaddingError : public NineSliceError {
public:
    explicit InvalidPaddingError(int padding)
        : NineSliceError("Invalid atlas padding: " + std::to_string(padding)),
          padding_(padding) {}

    int padding() const { return padding_; }

private:
    int padding_;
};

class IOError : public NineSliceError {
public:
    explicit IOError(const std::string& message)
        : NineSliceError("I/O error: " + message) {}
};

// Raised by the exporter when the artifact writer fails. Carries which export
// was running and where it was writing to.
class ExportIOError : public IOError {
public:
    ExportIOError(const std::string& export_kind,
                  const std::filesystem::path& destination,
                  const std::string& reason)
        : IOError("export '" + export_kind + "' to " + destination.string() +
                  " failed: " + reason),
          export_kind_(export_kind), destination_(destination) {}

    const std::string& export_kind() const { return export_kind_; }
    const std::filesystem::path& destination() const { return destination_; }

private:
    std::string export_kind_;
    std::filesystem::path destination_;
};

} // namespace nineslice
