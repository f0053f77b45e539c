#include "app/Config.hpp"
#include "util/TomlReader.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace wattrec::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("WATTREC_", 0) == 0) {
    alt = std::string("wattrec_") + n.substr(8);
  } else if (n.rfind("wattrec_", 0) == 0) {
    alt = std::string("WATTREC_") + n.substr(8);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

static std::string home_dir() {
  if (const char* home = std::getenv("HOME"); home && *home) return home;
#ifdef _WIN32
  if (const char* profile = std::getenv("USERPROFILE"); profile && *profile) return profile;
#endif
  return {};
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/wattrec/config.toml";
  auto home = home_dir();
  if (!home.empty()) return home + "/.config/wattrec/config.toml";
  return {};
}

std::filesystem::path default_output_dir() {
  auto home = home_dir();
  std::filesystem::path base = home.empty() ? std::filesystem::path(".") : std::filesystem::path(home);
  return base / "Desktop" / "resource-recorder" / "runs";
}

static std::filesystem::path expand_home(const std::string& p) {
  if (p == "~" || p.rfind("~/", 0) == 0) {
    auto home = home_dir();
    if (!home.empty()) return std::filesystem::path(home) / p.substr(std::min<size_t>(2, p.size()));
  }
  return std::filesystem::path(p);
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

static int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const wattrec::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

static bool resolve_bool(const wattrec::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

static std::string resolve_string(const wattrec::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

Config load_config(const std::string& toml_path) {
  Config c{};
  wattrec::util::TomlReader toml;
  bool have_toml = !toml_path.empty() && toml.load(toml_path);

  // --- [output] ---
  auto dir = resolve_string(toml, have_toml, "output", "dir", "WATTREC_OUTPUT_DIR", "");
  c.output_dir = dir.empty() ? default_output_dir() : expand_home(dir);

  // --- [sampling] ---
  int interval_ms = resolve_int(toml, have_toml, "sampling", "interval_ms", "WATTREC_INTERVAL_MS", 1000);
  c.interval = std::chrono::milliseconds(std::clamp(interval_ms, 100, 60000));

  // --- [power] ---
  auto backend = resolve_string(toml, have_toml, "power", "backend", "WATTREC_POWER_BACKEND", "auto");
  if (auto kind = wattrec::collectors::parse_power_backend_kind(backend)) {
    c.power_backend = *kind;
  } else {
    std::fprintf(stderr, "wattrec: Config: unknown power backend '%s', using auto\n", backend.c_str());
  }
  int timeout_ms = resolve_int(toml, have_toml, "power", "timeout_ms", "WATTREC_POWER_TIMEOUT_MS", 1000);
  c.power_timeout = std::chrono::milliseconds(std::clamp(timeout_ms, 100, 10000));

  // --- [log] ---
  c.verbose = resolve_bool(toml, have_toml, "log", "verbose", "WATTREC_VERBOSE", false);

  return c;
}

} // namespace wattrec::app
