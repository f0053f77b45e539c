#include "collectors/PowermetricsPowerBackend.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstddef>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace wattrec::collectors {

static std::optional<double> valid_watts(double w) {
  if (!std::isfinite(w) || w < 0.0) return std::nullopt;
  return w;
}

// Whole-token number parse; trailing garbage rejects the token.
static std::optional<double> parse_number(const std::string& tok) {
  if (tok.empty()) return std::nullopt;
  const char* b = tok.c_str();
  char* end = nullptr;
  double v = std::strtod(b, &end);
  if (end == b || *end != '\0') return std::nullopt;
  return v;
}

PowermetricsPowerBackend::PowermetricsPowerBackend(std::chrono::milliseconds timeout, Runner runner)
    : timeout_(timeout), runner_(std::move(runner)) {
  if (!runner_) runner_ = &wattrec::util::run_with_timeout;
}

std::vector<std::string> PowermetricsPowerBackend::base_command() {
  return {"sudo", "-n", "powermetrics", "-n1", "-i200", "--samplers", "smc"};
}

std::optional<double> PowermetricsPowerBackend::parse_json(const std::string& out) {
  auto brace = out.find('{');
  if (brace == std::string::npos) return std::nullopt;
  auto doc = nlohmann::json::parse(out.begin() + static_cast<std::ptrdiff_t>(brace), out.end(),
                                   nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded() || !doc.is_object()) return std::nullopt;
  auto smc = doc.find("smc");
  if (smc == doc.end() || !smc->is_object()) return std::nullopt;
  auto pkg = smc->find("package_watts");
  if (pkg == smc->end() || !pkg->is_number()) return std::nullopt;
  return valid_watts(pkg->get<double>());
}

std::optional<double> PowermetricsPowerBackend::parse_text(const std::string& out) {
  static const char* const keys[] = {"cpu power", "processor power", "package power", "pkg power"};
  std::istringstream ss(out);
  std::string line;
  while (std::getline(ss, line)) {
    if (line.find('W') == std::string::npos) continue;
    std::string lower = line;
    for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    bool match = false;
    for (const char* k : keys) if (lower.find(k) != std::string::npos) { match = true; break; }
    if (!match) continue;

    std::istringstream ts(line);
    std::vector<std::string> toks;
    for (std::string t; ts >> t;) toks.push_back(std::move(t));
    for (size_t i = 0; i < toks.size(); ++i) {
      std::string tok = toks[i];
      bool milli = false;
      if (tok.size() > 2 && tok.compare(tok.size() - 2, 2, "mW") == 0) { milli = true; tok.resize(tok.size() - 2); }
      else if (i + 1 < toks.size() && toks[i + 1] == "mW") milli = true;
      std::string digits;
      for (char c : tok) if (c != 'W') digits.push_back(c);
      auto v = parse_number(digits);
      if (!v) continue;
      return valid_watts(milli ? *v / 1000.0 : *v);
    }
  }
  return std::nullopt;
}

std::optional<double> PowermetricsPowerBackend::query() {
  auto cmd = base_command();
  cmd.push_back("-f");
  cmd.push_back("json");
  auto res = runner_(cmd, timeout_);
  if (res.ok()) {
    if (auto w = parse_json(res.out)) return w;
  }
  // A hung or unlaunchable helper would only fail again on the text path.
  if (!res.started || res.timed_out) {
    if (!warned_) {
      std::fprintf(stderr, "wattrec: powermetrics: %s; power readings unavailable\n",
                   res.timed_out ? "query timed out" : "could not be started");
      warned_ = true;
    }
    return std::nullopt;
  }

  auto text = runner_(base_command(), timeout_);
  if (text.ok()) {
    if (auto w = parse_text(text.out)) return w;
  }
  if (!warned_) {
    std::fprintf(stderr, "wattrec: powermetrics: no reading (exit %d); needs passwordless sudo\n",
                 text.exit_code);
    warned_ = true;
  }
  return std::nullopt;
}

std::optional<double> PowermetricsPowerBackend::sample() noexcept {
  try {
    return query();
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

} // namespace wattrec::collectors
