#include "metacal/io/fits_io.hpp"
#include "metacal/core/errors.hpp"
#include "metacal/core/utils.hpp"

#include <fitsio.h>
#include <stdexcept>

namespace metacal::io {

namespace {

std::string fits_status_text(int status) {
    char text[FLEN_STATUS];
    fits_get_errstatus(status, text);
    return std::string(text);
}

FitsHeader read_header(fitsfile* fptr) {
    FitsHeader header;
    int status = 0;

    char card[FLEN_CARD];
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);

    for (int i = 1; i <= nkeys; ++i) {
        fits_read_record(fptr, i, card, &status);
        if (status) {
            status = 0;
            continue;
        }

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;

        fits_get_keyname(card, keyname, &keylen, &status);
        if (status) {
            status = 0;
            continue;
        }

        std::string key(keyname);
        if (key.empty() || key == "COMMENT" || key == "HISTORY" || key == "END") {
            continue;
        }

        fits_parse_value(card, value, comment, &status);
        if (status) {
            status = 0;
            continue;
        }

        char dtype = 0;
        fits_get_keytype(value, &dtype, &status);
        if (status) {
            status = 0;
            continue;
        }

        std::string val_str(value);
        val_str.erase(0, val_str.find_first_not_of(" '"));
        val_str.erase(val_str.find_last_not_of(" '") + 1);

        switch (dtype) {
            case 'L':
                header.set(key, val_str == "T" || val_str == "1");
                break;
            case 'I':
                try {
                    header.set(key, std::stoi(val_str));
                } catch (const std::out_of_range&) {
                    header.set(key, std::stod(val_str));
                }
                break;
            case 'F':
                header.set(key, std::stod(val_str));
                break;
            default:
                header.set(key, val_str);
                break;
        }
    }
    return header;
}

Matrix2Dd read_current_image(fitsfile* fptr, const fs::path& path) {
    int status = 0;
    int naxis = 0;
    long naxes[2] = {0, 0};
    int bitpix = 0;

    fits_get_img_param(fptr, 2, &bitpix, &naxis, naxes, &status);
    if (status) {
        throw FitsError("Cannot read FITS image parameters in " + path.string() + ": " +
                        fits_status_text(status));
    }
    if (naxis != 2) {
        throw FitsError("Expected a 2D image in " + path.string() + ", got naxis=" +
                        std::to_string(naxis));
    }

    const long width = naxes[0];
    const long height = naxes[1];
    Matrix2Dd data(height, width);

    // Row-major storage matches FITS axis order (x fastest)
    long fpixel[2] = {1, 1};
    fits_read_pix(fptr, TDOUBLE, fpixel, width * height, nullptr, data.data(), nullptr, &status);
    if (status) {
        throw FitsError("Cannot read FITS pixel data in " + path.string() + ": " +
                        fits_status_text(status));
    }
    return data;
}

void write_current_header(fitsfile* fptr, const FitsHeader& header, int& status) {
    for (const auto& [key, value] : header.string_values) {
        if (key.size() <= 8) {
            fits_update_key(fptr, TSTRING, key.c_str(),
                            const_cast<char*>(value.c_str()), nullptr, &status);
        }
    }
    for (const auto& [key, value] : header.numeric_values) {
        if (key.size() <= 8) {
            double val = value;
            fits_update_key(fptr, TDOUBLE, key.c_str(), &val, nullptr, &status);
        }
    }
    for (const auto& [key, value] : header.int_values) {
        if (key.size() <= 8) {
            int val = value;
            fits_update_key(fptr, TINT, key.c_str(), &val, nullptr, &status);
        }
    }
    for (const auto& [key, value] : header.bool_values) {
        if (key.size() <= 8) {
            int val = value ? 1 : 0;
            fits_update_key(fptr, TLOGICAL, key.c_str(), &val, nullptr, &status);
        }
    }
}

double require_double(const FitsHeader& header, const std::string& key, const fs::path& path) {
    if (auto v = header.get_double(key)) return *v;
    if (auto v = header.get_int(key)) return static_cast<double>(*v);
    throw FitsError("Missing keyword " + key + " in " + path.string());
}

} // namespace

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it != string_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    auto it = numeric_values.find(key);
    if (it != numeric_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<int> FitsHeader::get_int(const std::string& key) const {
    auto it = int_values.find(key);
    if (it != int_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<bool> FitsHeader::get_bool(const std::string& key) const {
    auto it = bool_values.find(key);
    if (it != bool_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void FitsHeader::set(const std::string& key, const std::string& value) {
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, double value) {
    numeric_values[key] = value;
}

void FitsHeader::set(const std::string& key, int value) {
    int_values[key] = value;
}

void FitsHeader::set(const std::string& key, bool value) {
    bool_values[key] = value;
}

bool is_fits_image_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

std::pair<Matrix2Dd, FitsHeader> read_fits_image(const fs::path& path, int hdu) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    int hdutype = 0;
    if (fits_movabs_hdu(fptr, hdu, &hdutype, &status)) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("Cannot move to HDU " + std::to_string(hdu) + " in " + path.string());
    }

    try {
        Matrix2Dd data = read_current_image(fptr, path);
        FitsHeader header = read_header(fptr);
        fits_close_file(fptr, &status);
        return {std::move(data), std::move(header)};
    } catch (const FitsError&) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw;
    }
}

std::optional<std::pair<Matrix2Dd, FitsHeader>> read_fits_extension(const fs::path& path,
                                                                   const std::string& extname) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    std::string name = extname;
    if (fits_movnam_hdu(fptr, IMAGE_HDU, const_cast<char*>(name.c_str()), 0, &status)) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        if (status == BAD_HDU_NUM) {
            return std::nullopt;
        }
        throw FitsError("Cannot look up extension " + extname + " in " + path.string() + ": " +
                        fits_status_text(status));
    }

    try {
        Matrix2Dd data = read_current_image(fptr, path);
        FitsHeader header = read_header(fptr);
        fits_close_file(fptr, &status);
        return std::make_pair(std::move(data), std::move(header));
    } catch (const FitsError&) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw;
    }
}

void write_fits_image(const fs::path& path, const Matrix2Dd& data, const FitsHeader& header) {
    write_fits_hdus(path, {FitsHdu{"", data, header}});
}

void write_fits_hdus(const fs::path& path, const std::vector<FitsHdu>& hdus) {
    if (hdus.empty()) {
        throw FitsError("No HDUs to write to " + path.string());
    }
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }

    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();
    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    for (const auto& hdu : hdus) {
        long naxes[2] = {static_cast<long>(hdu.data.cols()), static_cast<long>(hdu.data.rows())};
        fits_create_img(fptr, DOUBLE_IMG, 2, naxes, &status);
        if (status) {
            int close_status = 0;
            fits_close_file(fptr, &close_status);
            throw FitsError("Cannot create FITS image in " + path.string() + ": " +
                            fits_status_text(status));
        }

        if (!hdu.extname.empty()) {
            fits_update_key(fptr, TSTRING, "EXTNAME",
                            const_cast<char*>(hdu.extname.c_str()), nullptr, &status);
        }
        write_current_header(fptr, hdu.header, status);

        long fpixel[2] = {1, 1};
        fits_write_pix(fptr, TDOUBLE, fpixel, static_cast<LONGLONG>(hdu.data.size()),
                       const_cast<double*>(hdu.data.data()), &status);
        if (status) {
            int close_status = 0;
            fits_close_file(fptr, &close_status);
            throw FitsError("Cannot write FITS pixel data to " + path.string() + ": " +
                            fits_status_text(status));
        }
    }

    fits_close_file(fptr, &status);
    if (status) {
        throw FitsError("Cannot close FITS file " + path.string() + ": " + fits_status_text(status));
    }
}

void write_observation_fits(const fs::path& path, const Observation& obs, const FitsHeader& extra) {
    FitsHeader primary = extra;
    const Jacobian& jac = obs.jacobian();
    primary.set("ROW0", jac.row0());
    primary.set("COL0", jac.col0());
    primary.set("DUDROW", jac.dudrow());
    primary.set("DUDCOL", jac.dudcol());
    primary.set("DVDROW", jac.dvdrow());
    primary.set("DVDCOL", jac.dvdcol());
    if (obs.meta().contains("whitened_variance")) {
        primary.set("WHITEVAR", obs.meta()["whitened_variance"].get<double>());
    }

    std::vector<FitsHdu> hdus;
    hdus.push_back(FitsHdu{"", obs.image(), primary});
    hdus.push_back(FitsHdu{"WEIGHT", obs.weight(), FitsHeader()});
    if (obs.has_psf()) {
        FitsHeader psf_header;
        psf_header.set("ROW0", obs.psf().jacobian().row0());
        psf_header.set("COL0", obs.psf().jacobian().col0());
        hdus.push_back(FitsHdu{"PSF", obs.psf().image(), psf_header});
    }
    write_fits_hdus(path, hdus);
}

Observation read_observation_fits(const fs::path& path) {
    auto [image, header] = read_fits_image(path, 1);

    const Jacobian jac(require_double(header, "ROW0", path), require_double(header, "COL0", path),
                       require_double(header, "DUDROW", path), require_double(header, "DUDCOL", path),
                       require_double(header, "DVDROW", path), require_double(header, "DVDCOL", path));

    std::optional<Matrix2Dd> weight;
    if (auto w = read_fits_extension(path, "WEIGHT")) {
        weight = std::move(w->first);
    }

    Observation obs(std::move(image), std::move(weight), jac);
    if (auto psf = read_fits_extension(path, "PSF")) {
        const Jacobian psf_jac(require_double(psf->second, "ROW0", path),
                               require_double(psf->second, "COL0", path),
                               jac.dudrow(), jac.dudcol(), jac.dvdrow(), jac.dvdcol());
        obs.set_psf(Observation(std::move(psf->first), std::nullopt, psf_jac));
    }
    if (auto wv = header.get_double("WHITEVAR")) {
        obs.update_meta(json{{"whitened_variance", *wv}});
    }
    return obs;
}

} // namespace metacal::io
