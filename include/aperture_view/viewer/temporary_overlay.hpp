#pragma once

#include "aperture_view/core/types.hpp"
#include <string>

namespace aperture_view::viewer {

// Uniquely named file in the temp directory, removed on destruction.
class TemporaryOverlay {
public:
    TemporaryOverlay(const std::string& prefix = "regions.", const std::string& suffix = ".ds9",
                     const fs::path& dir = fs::path());
    ~TemporaryOverlay();

    TemporaryOverlay(const TemporaryOverlay&) = delete;
    TemporaryOverlay& operator=(const TemporaryOverlay&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

} // namespace aperture_view::viewer
