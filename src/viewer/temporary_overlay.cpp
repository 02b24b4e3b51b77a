#include "aperture_view/viewer/temporary_overlay.hpp"
#include "aperture_view/core/errors.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>
#include <vector>
#include <unistd.h>

namespace aperture_view::viewer {

TemporaryOverlay::TemporaryOverlay(const std::string& prefix, const std::string& suffix,
                                   const fs::path& dir) {
    fs::path base = dir.empty() ? fs::temp_directory_path() : dir;
    std::string tmpl = (base / (prefix + "XXXXXX" + suffix)).string();

    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    int fd = mkstemps(buf.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        throw IOError("Cannot create temporary overlay " + tmpl + ": " + std::strerror(errno));
    }
    ::close(fd);
    path_ = fs::path(buf.data());
}

TemporaryOverlay::~TemporaryOverlay() {
    std::error_code ec;
    fs::remove(path_, ec);
}

} // namespace aperture_view::viewer
