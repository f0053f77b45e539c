#include "minitest.hpp"
#include "app/Config.hpp"
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;
using wattrec::collectors::PowerBackendKind;

static const char* const kEnv[] = {
  "WATTREC_OUTPUT_DIR", "WATTREC_INTERVAL_MS", "WATTREC_POWER_BACKEND",
  "WATTREC_POWER_TIMEOUT_MS", "WATTREC_VERBOSE", "wattrec_VERBOSE",
};

static void clear_env() {
  for (const char* n : kEnv) unsetenv(n);
}

static std::string write_toml(const char* tag, const std::string& body) {
  auto p = fs::temp_directory_path() / (std::string("wattrec_test_config_") + tag + "_" + std::to_string(::getpid()) + ".toml");
  std::ofstream(p) << body;
  return p.string();
}

TEST(config_compiled_defaults) {
  clear_env();
  auto c = wattrec::app::load_config("");
  ASSERT_EQ(c.interval.count(), 1000);
  ASSERT_EQ(c.power_timeout.count(), 1000);
  ASSERT_TRUE(c.power_backend == PowerBackendKind::Auto);
  ASSERT_TRUE(!c.verbose);
  ASSERT_EQ(c.iterations, 0u);
  ASSERT_EQ(c.output_dir, wattrec::app::default_output_dir());
  ASSERT_EQ(c.output_dir.filename().string(), std::string("runs"));
}

TEST(config_env_overrides_defaults) {
  clear_env();
  setenv("WATTREC_OUTPUT_DIR", "/tmp/wattrec-env-runs", 1);
  setenv("WATTREC_INTERVAL_MS", "250", 1);
  setenv("WATTREC_POWER_BACKEND", "Battery", 1);
  setenv("wattrec_VERBOSE", "1", 1);
  auto c = wattrec::app::load_config("");
  ASSERT_EQ(c.output_dir, fs::path("/tmp/wattrec-env-runs"));
  ASSERT_EQ(c.interval.count(), 250);
  ASSERT_TRUE(c.power_backend == PowerBackendKind::Battery);
  ASSERT_TRUE(c.verbose);
  clear_env();
}

TEST(config_toml_beats_env) {
  clear_env();
  setenv("WATTREC_INTERVAL_MS", "250", 1);
  setenv("WATTREC_POWER_BACKEND", "battery", 1);
  auto path = write_toml("layer",
    "[sampling]\ninterval_ms = 2000\n"
    "[power]\nbackend = none\ntimeout_ms = 1500\n"
    "[log]\nverbose = false\n");
  auto c = wattrec::app::load_config(path);
  ASSERT_EQ(c.interval.count(), 2000);
  ASSERT_TRUE(c.power_backend == PowerBackendKind::None);
  ASSERT_EQ(c.power_timeout.count(), 1500);
  ASSERT_TRUE(!c.verbose);
  fs::remove(path);
  clear_env();
}

TEST(config_clamps_and_rejects) {
  clear_env();
  auto path = write_toml("clamp",
    "[sampling]\ninterval_ms = 5\n"
    "[power]\nbackend = nvml\ntimeout_ms = 999999\n");
  auto c = wattrec::app::load_config(path);
  ASSERT_EQ(c.interval.count(), 100);
  ASSERT_EQ(c.power_timeout.count(), 10000);
  ASSERT_TRUE(c.power_backend == PowerBackendKind::Auto);
  fs::remove(path);

  setenv("WATTREC_INTERVAL_MS", "not-a-number", 1);
  ASSERT_EQ(wattrec::app::load_config("").interval.count(), 1000);
  setenv("WATTREC_INTERVAL_MS", "3600000", 1);
  ASSERT_EQ(wattrec::app::load_config("").interval.count(), 60000);
  clear_env();
}

TEST(config_expands_home) {
  clear_env();
  const char* home = std::getenv("HOME");
  if (!home || !*home) return;
  auto path = write_toml("home", "[output]\ndir = \"~/wattrec-runs\"\n");
  auto c = wattrec::app::load_config(path);
  ASSERT_EQ(c.output_dir, fs::path(home) / "wattrec-runs");
  fs::remove(path);
}

TEST(config_file_path_prefers_xdg) {
  const char* old = std::getenv("XDG_CONFIG_HOME");
  std::string saved = old ? old : "";
  setenv("XDG_CONFIG_HOME", "/tmp/xdg-wattrec", 1);
  ASSERT_EQ(wattrec::app::config_file_path(), std::string("/tmp/xdg-wattrec/wattrec/config.toml"));
  if (old) setenv("XDG_CONFIG_HOME", saved.c_str(), 1); else unsetenv("XDG_CONFIG_HOME");
}
