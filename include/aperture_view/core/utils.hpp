#pragma once

#include "types.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace aperture_view::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// Blocks for `duration`, waking periodically to check `stop_flag`.
// Throws StopRequested if the flag is (or becomes) set.
void pause_for(std::chrono::milliseconds duration, const std::atomic<bool>* stop_flag = nullptr);

// File utilities
std::vector<fs::path> discover_files(const fs::path& dir, const std::string& pattern);
std::string read_text(const fs::path& path);

// String utilities
std::string trim(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string shell_quote(const std::string& s);

// Glob pattern matching (case-insensitive, '*' and '?')
bool glob_match(const std::string& pattern, const std::string& str);

} // namespace aperture_view::core
