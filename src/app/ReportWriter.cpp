#include "app/ReportWriter.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace wattrec::app {

static constexpr const char* kSep = " \xC2\xB7 "; // U+00B7 middle dot

static std::string fixed(double v, int decimals) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
  return buf;
}

static std::string stat_line(const char* label, const wattrec::model::StatSummary& s, int decimals) {
  std::string line(label);
  auto field = [&](double v) { return s.available ? fixed(v, decimals) : std::string("N/A"); };
  line += "min " + field(s.min);
  line += kSep;
  line += "max " + field(s.max);
  line += kSep;
  line += "avg " + field(s.mean);
  line += '\n';
  return line;
}

ReportWriter::ReportWriter(std::filesystem::path dir) : dir_(std::move(dir)) {}

std::string ReportWriter::render(const wattrec::model::RunRecord& r) {
  std::string out;
  out += "Run started : " + r.start_ts + "\n";
  out += "Run ended   : " + r.end_ts + "\n";
  out += "Duration    : " + std::to_string(r.elapsed_s) + " s\n";
  out += "OS          : " + r.os_label + "\n";
  out += "Power source: " + (r.power_source.empty() ? std::string("none") : r.power_source) + "\n";
  out += "\n";
  out += stat_line("CPU usage % : ", r.cpu, 1);
  out += stat_line("RAM used MB : ", r.ram, 1);
  out += stat_line("Watts       : ", r.watts, 2);
  out += "Energy used : " + (r.has_energy ? fixed(r.energy_wh, 3) + " Wh" : std::string("N/A")) + "\n";
  return out;
}

std::filesystem::path ReportWriter::path_for(const wattrec::model::RunRecord& r) const {
  return dir_ / ("summary_" + r.start_ts + ".txt");
}

std::filesystem::path ReportWriter::write(const wattrec::model::RunRecord& r) const {
  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec) {
    throw std::runtime_error("cannot create " + dir_.string() + ": " + ec.message());
  }
  auto path = path_for(r);
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) throw std::runtime_error("cannot open " + path.string() + " for writing");
  auto text = render(r);
  f.write(text.data(), static_cast<std::streamsize>(text.size()));
  f.flush();
  if (!f) throw std::runtime_error("failed writing " + path.string());
  return path;
}

std::filesystem::path ReportWriter::publish(const wattrec::model::RunRecord& r, std::ostream& out) const {
  out << "\n" << render(r);
  out.flush();
  auto path = write(r);
  out << "Saved -> " << path.string() << "\n";
  return path;
}

} // namespace wattrec::app
