#pragma once

#include "metacal/core/types.hpp"
#include "metacal/observation/observation.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace metacal::io {

namespace fs = std::filesystem;

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;
    std::map<std::string, bool> bool_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;
    std::optional<bool> get_bool(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);
};

// One image HDU; the first in a file becomes the primary HDU
struct FitsHdu {
    std::string extname;
    Matrix2Dd data;
    FitsHeader header;
};

bool is_fits_image_path(const fs::path& path);

// hdu is 1-based, 1 = primary
std::pair<Matrix2Dd, FitsHeader> read_fits_image(const fs::path& path, int hdu = 1);
std::optional<std::pair<Matrix2Dd, FitsHeader>> read_fits_extension(const fs::path& path,
                                                                   const std::string& extname);

void write_fits_image(const fs::path& path, const Matrix2Dd& data, const FitsHeader& header);
void write_fits_hdus(const fs::path& path, const std::vector<FitsHdu>& hdus);

// Image in the primary HDU (with jacobian keywords), WEIGHT and PSF extensions
void write_observation_fits(const fs::path& path, const Observation& obs,
                            const FitsHeader& extra = FitsHeader());
Observation read_observation_fits(const fs::path& path);

} // namespace metacal::io
