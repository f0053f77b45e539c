#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include "collectors/PowerBackendFactory.hpp"

namespace wattrec::app {

struct Config {
  std::filesystem::path output_dir;
  std::chrono::milliseconds interval{1000};
  wattrec::collectors::PowerBackendKind power_backend{wattrec::collectors::PowerBackendKind::Auto};
  std::chrono::milliseconds power_timeout{1000};
  bool verbose{false};
  uint64_t iterations{0}; // 0 => run until interrupted
};

// $XDG_CONFIG_HOME/wattrec/config.toml, else ~/.config/wattrec/config.toml
std::string config_file_path();

// ~/Desktop/resource-recorder/runs
std::filesystem::path default_output_dir();

// Resolve every setting TOML -> env -> compiled default. An empty path or a
// missing file skips the TOML layer.
Config load_config(const std::string& toml_path);
inline Config load_config() { return load_config(config_file_path()); }

// Accept both WATTREC_ and wattrec_ prefixes
const char* getenv_compat(const char* name);

} // namespace wattrec::app
