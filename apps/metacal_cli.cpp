#include "metacal/config/configuration.hpp"
#include "metacal/core/errors.hpp"
#include "metacal/core/events.hpp"
#include "metacal/core/types.hpp"
#include "metacal/core/utils.hpp"
#include "metacal/estimator/shear_estimator.hpp"
#include "metacal/image/fourier_engine.hpp"
#include "metacal/io/ensemble_io.hpp"
#include "metacal/io/fits_io.hpp"
#include "metacal/pipeline/metacal.hpp"
#include "metacal/pipeline/simulation.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <filesystem>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;

using namespace metacal;

namespace {

void print_json(const json& j) {
  std::cout << j.dump(2) << std::endl;
}

config::Config load_config_or_default(const std::string& path) {
  config::Config cfg = path.empty() ? config::Config() : config::Config::load(path);
  cfg.validate();
  return cfg;
}

ShapeArray zeros_like(Eigen::Index n) {
  return ShapeArray::Zero(n, 2);
}

json run_estimator(const config::EstimatorConfig& ecfg, const io::Ensemble& ens) {
  const EstimatorMethod method = string_to_estimator_method(ecfg.method);
  const RemainderPolicy remainder = string_to_remainder_policy(ecfg.remainder);

  const ShapeArray gpsf = ens.gpsf ? *ens.gpsf : zeros_like(ens.g.rows());
  const ShapeArray Rpsf = ens.Rpsf ? *ens.Rpsf : zeros_like(static_cast<Eigen::Index>(ens.R.size()));

  switch (method) {
    case EstimatorMethod::Mean:
      return estimator::to_json(estimator::get_mean_shear(ens.g, gpsf, ens.R, Rpsf));
    case EstimatorMethod::Jackknife:
      return estimator::to_json(
          estimator::jackknife_shear(ens.g, ens.R, ens.Rpsf, ecfg.chunksize, remainder));
    case EstimatorMethod::JackknifeWeighted:
      return estimator::to_json(
          estimator::jackknife_shear_weighted(ens.g, ens.R, ens.weights, ecfg.chunksize, remainder));
    case EstimatorMethod::Bootstrap: {
      std::mt19937 rng(ecfg.seed != 0 ? ecfg.seed : std::random_device{}());
      return estimator::to_json(estimator::bootstrap_shear(ens.g, gpsf, ens.R, Rpsf, ecfg.nboot, rng));
    }
  }
  throw ConfigError("unhandled estimator method " + ecfg.method);
}

int cmd_estimate(const std::string& config_path, const std::string& input_path,
                 const std::string& method_override, const std::string& output_path) {
  core::EventEmitter emitter;
  const std::string run_id = core::get_run_id();
  emitter.run_start(run_id, {{"command", "estimate"}, {"input", input_path}}, std::cout);

  try {
    emitter.phase_start(run_id, Phase::LOAD_CONFIG, std::cout);
    config::Config cfg = load_config_or_default(config_path);
    if (!method_override.empty()) {
      cfg.estimator.method = method_override;
      cfg.validate();
    }
    emitter.phase_end(run_id, Phase::LOAD_CONFIG, "ok", {{"method", cfg.estimator.method}}, std::cout);

    emitter.phase_start(run_id, Phase::LOAD_INPUT, std::cout);
    const io::Ensemble ens = io::read_ensemble_json(input_path);
    emitter.phase_end(run_id, Phase::LOAD_INPUT, "ok",
                      {{"ng", ens.g.rows()}, {"nR", ens.R.size()},
                       {"input_sha256", core::sha256_file(input_path)}},
                      std::cout);

    emitter.phase_start(run_id, Phase::ESTIMATE, std::cout);
    const EstimatorMethod method = string_to_estimator_method(cfg.estimator.method);
    if ((method == EstimatorMethod::Jackknife || method == EstimatorMethod::JackknifeWeighted) &&
        string_to_remainder_policy(cfg.estimator.remainder) == RemainderPolicy::Truncate) {
      const long rem = estimator::jackknife_remainder(ens.g.rows(), cfg.estimator.chunksize);
      if (rem != 0) {
        emitter.warning(run_id,
                        "jackknife: last " + std::to_string(rem) + " of " + std::to_string(ens.g.rows()) +
                            " objects form a partial chunk of size " +
                            std::to_string(cfg.estimator.chunksize) + " and are not left out",
                        std::cout);
      }
    }
    const json result = run_estimator(cfg.estimator, ens);
    json summary = {{"shear", result["shear"]}};
    if (result.contains("shear_err")) summary["shear_err"] = result["shear_err"];
    if (result.contains("shear_cov")) summary["shear_cov"] = result["shear_cov"];
    emitter.phase_end(run_id, Phase::ESTIMATE, "ok", summary, std::cout);

    emitter.phase_start(run_id, Phase::WRITE_OUTPUT, std::cout);
    const fs::path out = output_path.empty() ? fs::path(cfg.output.dir) / "estimate.json"
                                             : fs::path(output_path);
    core::write_text(out, result.dump(2) + "\n");
    emitter.phase_end(run_id, Phase::WRITE_OUTPUT, "ok", {{"path", out.string()}}, std::cout);
  } catch (const MetacalError& e) {
    std::cerr << "[METACAL] " << e.what() << std::endl;
    emitter.error(run_id, e.what(), std::cout);
    emitter.run_end(run_id, false, "error", std::cout);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[METACAL] unexpected: " << e.what() << std::endl;
    emitter.error(run_id, e.what(), std::cout);
    emitter.run_end(run_id, false, "error", std::cout);
    return 1;
  }

  emitter.run_end(run_id, true, "ok", std::cout);
  return 0;
}

int cmd_simulate(const std::string& config_path, const std::string& output_dir) {
  core::EventEmitter emitter;
  const std::string run_id = core::get_run_id();
  emitter.run_start(run_id, {{"command", "simulate"}}, std::cout);

  try {
    emitter.phase_start(run_id, Phase::LOAD_CONFIG, std::cout);
    config::Config cfg = load_config_or_default(config_path);
    if (!output_dir.empty()) cfg.output.dir = output_dir;
    emitter.phase_end(run_id, Phase::LOAD_CONFIG, "ok",
                      {{"types", cfg.metacal.types}, {"step", cfg.metacal.step}}, std::cout);

    emitter.phase_start(run_id, Phase::LOAD_INPUT, std::cout);
    auto engine = std::make_shared<const image::FourierEngine>(cfg.fourier, cfg.noise);
    std::mt19937 rng(cfg.simulation.seed != 0 ? cfg.simulation.seed : std::random_device{}());
    const Observation obs = pipeline::make_sim_observation(cfg.simulation, *engine, rng);
    emitter.phase_end(run_id, Phase::LOAD_INPUT, "ok",
                      {{"rows", obs.rows()}, {"cols", obs.cols()}, {"s2n", obs.s2n()}}, std::cout);

    emitter.phase_start(run_id, Phase::METACAL, std::cout);
    auto cache = std::make_shared<pipeline::SymmetrizationCache>(cfg.cache.capacity);
    pipeline::Metacal mcal(obs, engine, cfg, cache);
    const auto products = mcal.get_all();

    // Moments weight matched to the observed size
    const double weight_sigma = std::hypot(cfg.simulation.gal_sigma, cfg.simulation.psf_sigma);
    json shapes = json::object();
    for (const auto& [name, o] : products) {
      const Shape e = pipeline::weighted_ellipticity(o, weight_sigma);
      json entry = {{"e", json::array({e.g1, e.g2})}, {"flux", o.image().sum()}};
      if (o.meta().contains("whitened_variance")) {
        entry["whitened_variance"] = o.meta()["whitened_variance"];
      }
      shapes[name] = entry;
    }

    json metacal_extra = {{"shapes", shapes},
                          {"cache_size", cache->size()},
                          {"cache_hits", cache->hits()},
                          {"cache_misses", cache->misses()}};

    const auto has = [&](const char* t) { return products.count(t) > 0; };
    if (has("1p") && has("1m") && has("2p") && has("2m")) {
      auto one = [&](const char* t) {
        const Shape e = pipeline::weighted_ellipticity(products.at(t), weight_sigma);
        ShapeArray a(1, 2);
        a << e.g1, e.g2;
        return a;
      };
      const ResponseArray R = estimator::finite_difference_response(
          one("1p"), one("1m"), one("2p"), one("2m"), cfg.metacal.step);
      metacal_extra["R"] = json::array({json::array({R[0](0, 0), R[0](0, 1)}),
                                        json::array({R[0](1, 0), R[0](1, 1)})});
    }
    emitter.phase_end(run_id, Phase::METACAL, "ok", metacal_extra, std::cout);

    if (cfg.output.write_fits) {
      emitter.phase_start(run_id, Phase::WRITE_OUTPUT, std::cout);
      const fs::path dir(cfg.output.dir);
      json files = json::object();

      io::FitsHeader header;
      header.set("MCALTYPE", std::string("input"));
      const fs::path input_path = dir / "input.fits";
      io::write_observation_fits(input_path, obs, header);
      files["input"] = {{"path", input_path.string()}, {"sha256", core::sha256_file(input_path)}};

      for (const auto& [name, o] : products) {
        io::FitsHeader h;
        h.set("MCALTYPE", name);
        h.set("MCALSTEP", cfg.metacal.step);
        const fs::path p = dir / (name + ".fits");
        io::write_observation_fits(p, o, h);
        files[name] = {{"path", p.string()}, {"sha256", core::sha256_file(p)}};
      }
      emitter.phase_end(run_id, Phase::WRITE_OUTPUT, "ok", {{"files", files}}, std::cout);
    }
  } catch (const MetacalError& e) {
    std::cerr << "[METACAL] " << e.what() << std::endl;
    emitter.error(run_id, e.what(), std::cout);
    emitter.run_end(run_id, false, "error", std::cout);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[METACAL] unexpected: " << e.what() << std::endl;
    emitter.error(run_id, e.what(), std::cout);
    emitter.run_end(run_id, false, "error", std::cout);
    return 1;
  }

  emitter.run_end(run_id, true, "ok", std::cout);
  return 0;
}

int cmd_get_schema() {
  std::cout << config::get_schema_json() << std::endl;
  return 0;
}

int cmd_load_config(const std::string& path) {
  json result;
  result["path"] = path;
  try {
    const config::Config cfg = config::Config::load(path);
    cfg.validate();
    YAML::Emitter out;
    out << cfg.to_yaml();
    result["ok"] = true;
    result["yaml"] = std::string(out.c_str());
  } catch (const MetacalError& e) {
    result["ok"] = false;
    result["error"] = e.what();
    print_json(result);
    return 1;
  }
  print_json(result);
  return 0;
}

int cmd_save_default_config(const std::string& path) {
  try {
    config::Config().save(path);
  } catch (const MetacalError& e) {
    std::cerr << "[METACAL] " << e.what() << std::endl;
    return 1;
  }
  print_json({{"ok", true}, {"path", path}});
  return 0;
}

} // namespace

int main(int argc, char* argv[]) {
  CLI::App app{"Metacalibration shear calibration tool"};
  app.require_subcommand(1);

  std::string config_path;
  std::string input_path;
  std::string method;
  std::string output_path;
  std::string output_dir;
  std::string load_path;
  std::string save_path;

  auto estimate_cmd = app.add_subcommand("estimate", "Estimate mean shear from a measurement ensemble");
  estimate_cmd->add_option("--config", config_path, "Path to config.yaml");
  estimate_cmd->add_option("--input", input_path, "Ensemble JSON file")->required();
  estimate_cmd->add_option("--method", method,
                           "Override estimator.method: mean|jackknife|jackknife_weighted|bootstrap");
  estimate_cmd->add_option("--output", output_path, "Result JSON path (default <output.dir>/estimate.json)");

  auto simulate_cmd = app.add_subcommand("simulate", "Run metacal on a simulated Gaussian galaxy");
  simulate_cmd->add_option("--config", config_path, "Path to config.yaml");
  simulate_cmd->add_option("--output-dir", output_dir, "Override output.dir");

  auto schema_cmd = app.add_subcommand("get-schema", "Print JSON schema for config");

  auto load_cmd = app.add_subcommand("load-config", "Load and validate a config YAML file");
  load_cmd->add_option("path", load_path, "Config path")->required();

  auto save_cmd = app.add_subcommand("save-default-config", "Write the default config YAML");
  save_cmd->add_option("path", save_path, "Output path")->required();

  CLI11_PARSE(app, argc, argv);

  if (estimate_cmd->parsed()) {
    return cmd_estimate(config_path, input_path, method, output_path);
  }
  if (simulate_cmd->parsed()) {
    return cmd_simulate(config_path, output_dir);
  }
  if (schema_cmd->parsed()) {
    return cmd_get_schema();
  }
  if (load_cmd->parsed()) {
    return cmd_load_config(load_path);
  }
  if (save_cmd->parsed()) {
    return cmd_save_default_config(save_path);
  }

  std::cerr << app.help() << std::endl;
  return 1;
}
