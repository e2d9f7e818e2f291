#include "metacal/config/configuration.hpp"
#include "metacal/core/errors.hpp"
#include "metacal/core/types.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>

namespace metacal::config {

namespace {

const std::vector<std::string> kKnownTypes = {
    "noshear", "1p", "1m", "2p", "2m",
    "1p_psf", "1m_psf", "2p_psf", "2m_psf"
};

template <typename T>
void read_value(const YAML::Node& section, const char* key, T& out) {
    if (section[key]) {
        try {
            out = section[key].as<T>();
        } catch (const YAML::Exception& e) {
            throw ConfigError(std::string("bad value for '") + key + "': " + e.what());
        }
    }
}

} // namespace

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["metacal"]) {
        auto m = node["metacal"];
        read_value(m, "whiten", cfg.metacal.whiten);
        read_value(m, "symmetrize", cfg.metacal.symmetrize);
        read_value(m, "same_seed", cfg.metacal.same_seed);
        read_value(m, "seed", cfg.metacal.seed);
        read_value(m, "step", cfg.metacal.step);
        if (m["types"]) {
            if (!m["types"].IsSequence()) {
                throw ConfigError("metacal.types must be a list");
            }
            cfg.metacal.types.clear();
            for (const auto& t : m["types"]) {
                cfg.metacal.types.push_back(t.as<std::string>());
            }
        }
    }

    if (node["interpolant"]) {
        auto i = node["interpolant"];
        read_value(i, "order", cfg.interpolant.order);
        read_value(i, "conserve_dc", cfg.interpolant.conserve_dc);
        read_value(i, "tolerance", cfg.interpolant.tolerance);
    }

    if (node["noise"]) {
        auto n = node["noise"];
        read_value(n, "patch_size", cfg.noise.patch_size);
        read_value(n, "symmetrize_order", cfg.noise.symmetrize_order);
        read_value(n, "max_correlation_size", cfg.noise.max_correlation_size);
    }

    if (node["fourier"]) {
        auto f = node["fourier"];
        read_value(f, "pad_factor", cfg.fourier.pad_factor);
        read_value(f, "alias_fold", cfg.fourier.alias_fold);
    }

    if (node["cache"]) {
        auto c = node["cache"];
        read_value(c, "capacity", cfg.cache.capacity);
        read_value(c, "verbose", cfg.cache.verbose);
    }

    if (node["estimator"]) {
        auto e = node["estimator"];
        read_value(e, "method", cfg.estimator.method);
        read_value(e, "chunksize", cfg.estimator.chunksize);
        read_value(e, "remainder", cfg.estimator.remainder);
        read_value(e, "nboot", cfg.estimator.nboot);
        read_value(e, "seed", cfg.estimator.seed);
    }

    if (node["simulation"]) {
        auto s = node["simulation"];
        read_value(s, "rows", cfg.simulation.rows);
        read_value(s, "cols", cfg.simulation.cols);
        read_value(s, "scale", cfg.simulation.scale);
        read_value(s, "gal_sigma", cfg.simulation.gal_sigma);
        read_value(s, "gal_flux", cfg.simulation.gal_flux);
        read_value(s, "gal_g1", cfg.simulation.gal_g1);
        read_value(s, "gal_g2", cfg.simulation.gal_g2);
        read_value(s, "psf_sigma", cfg.simulation.psf_sigma);
        read_value(s, "psf_g1", cfg.simulation.psf_g1);
        read_value(s, "psf_g2", cfg.simulation.psf_g2);
        read_value(s, "noise_sigma", cfg.simulation.noise_sigma);
        read_value(s, "seed", cfg.simulation.seed);
    }

    if (node["output"]) {
        auto o = node["output"];
        read_value(o, "dir", cfg.output.dir);
        read_value(o, "write_fits", cfg.output.write_fits);
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["metacal"]["whiten"] = metacal.whiten;
    node["metacal"]["symmetrize"] = metacal.symmetrize;
    node["metacal"]["same_seed"] = metacal.same_seed;
    node["metacal"]["seed"] = metacal.seed;
    node["metacal"]["step"] = metacal.step;
    node["metacal"]["types"] = metacal.types;

    node["interpolant"]["order"] = interpolant.order;
    node["interpolant"]["conserve_dc"] = interpolant.conserve_dc;
    node["interpolant"]["tolerance"] = interpolant.tolerance;

    node["noise"]["patch_size"] = noise.patch_size;
    node["noise"]["symmetrize_order"] = noise.symmetrize_order;
    node["noise"]["max_correlation_size"] = noise.max_correlation_size;

    node["fourier"]["pad_factor"] = fourier.pad_factor;
    node["fourier"]["alias_fold"] = fourier.alias_fold;

    node["cache"]["capacity"] = cache.capacity;
    node["cache"]["verbose"] = cache.verbose;

    node["estimator"]["method"] = estimator.method;
    node["estimator"]["chunksize"] = estimator.chunksize;
    node["estimator"]["remainder"] = estimator.remainder;
    node["estimator"]["nboot"] = estimator.nboot;
    node["estimator"]["seed"] = estimator.seed;

    node["simulation"]["rows"] = simulation.rows;
    node["simulation"]["cols"] = simulation.cols;
    node["simulation"]["scale"] = simulation.scale;
    node["simulation"]["gal_sigma"] = simulation.gal_sigma;
    node["simulation"]["gal_flux"] = simulation.gal_flux;
    node["simulation"]["gal_g1"] = simulation.gal_g1;
    node["simulation"]["gal_g2"] = simulation.gal_g2;
    node["simulation"]["psf_sigma"] = simulation.psf_sigma;
    node["simulation"]["psf_g1"] = simulation.psf_g1;
    node["simulation"]["psf_g2"] = simulation.psf_g2;
    node["simulation"]["noise_sigma"] = simulation.noise_sigma;
    node["simulation"]["seed"] = simulation.seed;

    node["output"]["dir"] = output.dir;
    node["output"]["write_fits"] = output.write_fits;

    return node;
}

void Config::validate() const {
    if (!(metacal.step > 0.0 && metacal.step < 1.0)) {
        throw ConfigError("metacal.step must be in (0, 1), got " + std::to_string(metacal.step));
    }
    if (metacal.same_seed && !metacal.whiten) {
        throw ConfigError("metacal.same_seed requires metacal.whiten");
    }
    for (const auto& t : metacal.types) {
        if (std::find(kKnownTypes.begin(), kKnownTypes.end(), t) == kKnownTypes.end()) {
            throw ConfigError("metacal.types: unknown type '" + t + "'");
        }
    }

    if (interpolant.order < 1 || interpolant.order > 10) {
        throw ConfigError("interpolant.order must be in [1, 10]");
    }
    if (!(interpolant.tolerance > 0.0 && interpolant.tolerance < 1.0)) {
        throw ConfigError("interpolant.tolerance must be in (0, 1)");
    }

    if (noise.patch_size < 16) {
        throw ConfigError("noise.patch_size must be >= 16");
    }
    if (noise.symmetrize_order < 4 || (noise.symmetrize_order % 2) != 0) {
        throw ConfigError("noise.symmetrize_order must be even and >= 4");
    }
    if (noise.max_correlation_size < 3) {
        throw ConfigError("noise.max_correlation_size must be >= 3");
    }

    if (fourier.pad_factor < 1) {
        throw ConfigError("fourier.pad_factor must be >= 1");
    }
    if (fourier.alias_fold < 0 || fourier.alias_fold > 3) {
        throw ConfigError("fourier.alias_fold must be in [0, 3]");
    }

    // Parses or throws ConfigError
    string_to_estimator_method(estimator.method);
    string_to_remainder_policy(estimator.remainder);
    if (estimator.chunksize < 1) {
        throw ConfigError("estimator.chunksize must be >= 1");
    }
    if (estimator.nboot < 2) {
        throw ConfigError("estimator.nboot must be >= 2");
    }

    if (simulation.rows < 3 || simulation.cols < 3) {
        throw ConfigError("simulation.rows and simulation.cols must be >= 3");
    }
    if (simulation.scale <= 0.0) {
        throw ConfigError("simulation.scale must be > 0");
    }
    if (simulation.gal_sigma <= 0.0 || simulation.psf_sigma <= 0.0) {
        throw ConfigError("simulation.gal_sigma and simulation.psf_sigma must be > 0");
    }
    if (std::hypot(simulation.gal_g1, simulation.gal_g2) >= 1.0 ||
        std::hypot(simulation.psf_g1, simulation.psf_g2) >= 1.0) {
        throw ConfigError("simulation shears must have |g| < 1");
    }
    if (simulation.noise_sigma < 0.0) {
        throw ConfigError("simulation.noise_sigma must be >= 0");
    }

    if (output.dir.empty()) {
        throw ConfigError("output.dir must not be empty");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "metacal": {
      "type": "object",
      "properties": {
        "whiten": {"type": "boolean"},
        "symmetrize": {"type": "boolean"},
        "same_seed": {"type": "boolean"},
        "seed": {"type": "integer", "minimum": 0},
        "step": {"type": "number", "exclusiveMinimum": 0, "exclusiveMaximum": 1},
        "types": {
          "type": "array",
          "items": {"type": "string", "enum": ["noshear", "1p", "1m", "2p", "2m",
                                              "1p_psf", "1m_psf", "2p_psf", "2m_psf"]}
        }
      }
    },
    "interpolant": {
      "type": "object",
      "properties": {
        "order": {"type": "integer", "minimum": 1, "maximum": 10},
        "conserve_dc": {"type": "boolean"},
        "tolerance": {"type": "number", "exclusiveMinimum": 0, "exclusiveMaximum": 1}
      }
    },
    "noise": {
      "type": "object",
      "properties": {
        "patch_size": {"type": "integer", "minimum": 16},
        "symmetrize_order": {"type": "integer", "minimum": 4, "multipleOf": 2},
        "max_correlation_size": {"type": "integer", "minimum": 3}
      }
    },
    "fourier": {
      "type": "object",
      "properties": {
        "pad_factor": {"type": "integer", "minimum": 1},
        "alias_fold": {"type": "integer", "minimum": 0, "maximum": 3}
      }
    },
    "cache": {
      "type": "object",
      "properties": {
        "capacity": {"type": "integer", "minimum": 0},
        "verbose": {"type": "boolean"}
      }
    },
    "estimator": {
      "type": "object",
      "properties": {
        "method": {"type": "string", "enum": ["mean", "jackknife", "jackknife_weighted", "bootstrap"]},
        "chunksize": {"type": "integer", "minimum": 1},
        "remainder": {"type": "string", "enum": ["require", "truncate"]},
        "nboot": {"type": "integer", "minimum": 2},
        "seed": {"type": "integer", "minimum": 0}
      }
    },
    "simulation": {
      "type": "object",
      "properties": {
        "rows": {"type": "integer", "minimum": 3},
        "cols": {"type": "integer", "minimum": 3},
        "scale": {"type": "number", "exclusiveMinimum": 0},
        "gal_sigma": {"type": "number", "exclusiveMinimum": 0},
        "gal_flux": {"type": "number"},
        "gal_g1": {"type": "number"},
        "gal_g2": {"type": "number"},
        "psf_sigma": {"type": "number", "exclusiveMinimum": 0},
        "psf_g1": {"type": "number"},
        "psf_g2": {"type": "number"},
        "noise_sigma": {"type": "number", "minimum": 0},
        "seed": {"type": "integer", "minimum": 0}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "dir": {"type": "string"},
        "write_fits": {"type": "boolean"}
      }
    }
  }
})";
}

} // namespace metacal::config
