#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace station_impute::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<fs::path> list_files(const fs::path& dir, const std::string& extension);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
void ensure_parent_dir(const fs::path& path);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_text(const std::string& text);

// Number utilities
double round_to(double value, int decimals);
// precision <= 0 gives the shortest text that round-trips; NaN gives ""
std::string format_double(double value, int precision = 0);
std::optional<double> parse_double(const std::string& s);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);

} // namespace station_impute::core
