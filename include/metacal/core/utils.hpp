#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace metacal::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// Math utilities
double compute_median(const Matrix2Dd& data);
double compute_median(const VectorXd& data);

// String utilities
std::string to_lower(const std::string& s);

} // namespace metacal::core
