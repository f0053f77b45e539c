#include "app/Aggregator.hpp"
#include "app/Config.hpp"
#include "app/ReportWriter.hpp"
#include "app/Sampler.hpp"
#include "collectors/PowerBackendFactory.hpp"
#include "util/SystemInfo.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <string>
#include <utility>

static std::atomic<bool> g_stop{false};
static void on_stop_signal(int) { g_stop.store(true); }

static void print_usage() {
  std::cout << "Usage: wattrec [--iterations N] [--interval-ms MS] [--output-dir DIR] [--power-backend KIND]\n";
  std::cout << "  KIND: auto | rapl | powermetrics | battery | none\n";
  std::cout << "Notes: records until Ctrl+C, then writes summary_<timestamp>.txt.\n";
  std::cout << "       Defaults come from ~/.config/wattrec/config.toml and WATTREC_* variables.\n";
}

// Returns -1 to continue, otherwise the exit code.
static int apply_args(int argc, char** argv, wattrec::app::Config& cfg) {
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    try {
      if (a == "--iterations" && i + 1 < argc) {
        long long n = std::stoll(argv[++i]);
        cfg.iterations = n > 0 ? static_cast<uint64_t>(n) : 0;
      } else if (a == "--interval-ms" && i + 1 < argc) {
        int ms = std::stoi(argv[++i]);
        ms = std::clamp(ms, 100, 60000);
        cfg.interval = std::chrono::milliseconds(ms);
      } else if (a == "--output-dir" && i + 1 < argc) {
        cfg.output_dir = argv[++i];
      } else if (a == "--power-backend" && i + 1 < argc) {
        auto kind = wattrec::collectors::parse_power_backend_kind(argv[++i]);
        if (!kind) {
          std::fprintf(stderr, "wattrec: unknown power backend '%s'\n", argv[i]);
          return 2;
        }
        cfg.power_backend = *kind;
      } else if (a == "-h" || a == "--help") {
        print_usage();
        return 0;
      } else {
        std::fprintf(stderr, "wattrec: unrecognized argument '%s'\n", a.c_str());
        print_usage();
        return 2;
      }
    } catch (const std::exception&) {
      std::fprintf(stderr, "wattrec: invalid value for %s\n", a.c_str());
      return 2;
    }
  }
  return -1;
}

static void print_banner() {
  auto up = wattrec::util::uptime_seconds();
  std::cout << "--------- Starting resource recording software ---------\n";
  std::cout << "Uptime      : " << (up ? wattrec::util::format_uptime(*up) : std::string("unknown")) << "\n";
  std::cout << "Press Ctrl+C to stop and save summary.\n";
  std::cout << "--------------------------------------------------------\n";
  std::cout.flush();
}

int main(int argc, char** argv) {
  auto cfg = wattrec::app::load_config();
  if (int rc = apply_args(argc, argv, cfg); rc >= 0) return rc;

  auto start = std::chrono::system_clock::now();
  std::signal(SIGINT, on_stop_signal);
  std::signal(SIGTERM, on_stop_signal);
  print_banner();

  auto backend = wattrec::collectors::make_power_backend(cfg.power_backend, cfg.power_timeout);
  std::string source = backend->name();
  wattrec::app::Sampler sampler(std::move(backend), {cfg.interval, cfg.iterations, cfg.verbose});
  try {
    sampler.run(g_stop);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "wattrec: %s\n", e.what());
    return 1;
  }
  auto end = std::chrono::system_clock::now();

  auto record = wattrec::app::build_record(sampler.series(), start, end,
                                           wattrec::util::os_label(), source);
  wattrec::app::ReportWriter writer(cfg.output_dir);
  try {
    writer.publish(record, std::cout);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "wattrec: failed to save summary: %s\n", e.what());
    return 1;
  }
  return 0;
}
