#pragma once

#include <stdexcept>
#include <string>

namespace aperture_view {

class ApertureViewError : public std::runtime_error {
public:
    explicit ApertureViewError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public ApertureViewError {
public:
    explicit ConfigError(const std::string& message)
        : ApertureViewError("Config error: " + message) {}
};

class IOError : public ApertureViewError {
public:
    explicit IOError(const std::string& message)
        : ApertureViewError("I/O error: " + message) {}
};

// Catalog missing, unreadable, or lacking an expected column.
// Recoverable for the orchestration run: only the current cycle is lost.
class CatalogReadError : public IOError {
public:
    explicit CatalogReadError(const std::string& message)
        : IOError("Catalog error: " + message) {}
};

// Malformed input contract (e.g. catalog columns of unequal length).
class FormatError : public ApertureViewError {
public:
    explicit FormatError(const std::string& message)
        : ApertureViewError("Format error: " + message) {}
};

class ViewerUnavailableError : public ApertureViewError {
public:
    explicit ViewerUnavailableError(const std::string& message)
        : ApertureViewError("Viewer unavailable: " + message) {}
};

class StopRequested : public ApertureViewError {
public:
    StopRequested() : ApertureViewError("Stop requested by user") {}
};

} // namespace aperture_view
