#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include "model/Record.hpp"

namespace wattrec::app {

// Renders a finished run as the fixed text summary and stores it as
// <dir>/summary_<start-timestamp>.txt.
class ReportWriter {
public:
  explicit ReportWriter(std::filesystem::path dir);

  [[nodiscard]] static std::string render(const wattrec::model::RunRecord& r);
  [[nodiscard]] std::filesystem::path path_for(const wattrec::model::RunRecord& r) const;

  // Creates the directory tree if needed. Throws std::runtime_error when the
  // file cannot be written.
  std::filesystem::path write(const wattrec::model::RunRecord& r) const;

  // Echo the summary to 'out', write it, then report where it went.
  std::filesystem::path publish(const wattrec::model::RunRecord& r, std::ostream& out) const;

  [[nodiscard]] const std::filesystem::path& dir() const { return dir_; }

private:
  std::filesystem::path dir_;
};

} // namespace wattrec::app
