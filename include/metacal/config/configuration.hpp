#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace metacal::config {

namespace fs = std::filesystem;

struct MetacalConfig {
  bool whiten = false;
  bool symmetrize = false;
  bool same_seed = false;
  std::uint32_t seed = 0; // 0 -> seeded from std::random_device
  double step = 0.01;
  std::vector<std::string> types = {"noshear", "1p", "1m", "2p", "2m"};
};

struct InterpolantConfig {
  int order = 5; // Lanczos order
  bool conserve_dc = true;
  double tolerance = 1.0e-4;
};

struct NoiseConfig {
  int patch_size = 512;
  int symmetrize_order = 4;
  int max_correlation_size = 129; // cropped correlation-function stamp
};

struct FourierConfig {
  int pad_factor = 4;
  int alias_fold = 1; // alias rings folded when drawing
};

struct CacheConfig {
  std::size_t capacity = 0; // 0 -> unbounded
  bool verbose = false;
};

struct EstimatorConfig {
  std::string method = "mean"; // mean | jackknife | jackknife_weighted | bootstrap
  int chunksize = 1;
  std::string remainder = "require"; // require | truncate
  int nboot = 100;
  std::uint32_t seed = 0;
};

struct SimulationConfig {
  int rows = 33;
  int cols = 33;
  double scale = 0.263;
  double gal_sigma = 0.5;
  double gal_flux = 100.0;
  double gal_g1 = 0.0;
  double gal_g2 = 0.0;
  double psf_sigma = 0.45;
  double psf_g1 = 0.0;
  double psf_g2 = 0.0;
  double noise_sigma = 0.0;
  std::uint32_t seed = 0;
};

struct OutputConfig {
  std::string dir = "metacal_out";
  bool write_fits = true;
};

struct Config {
  MetacalConfig metacal;
  InterpolantConfig interpolant;
  NoiseConfig noise;
  FourierConfig fourier;
  CacheConfig cache;
  EstimatorConfig estimator;
  SimulationConfig simulation;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace metacal::config
