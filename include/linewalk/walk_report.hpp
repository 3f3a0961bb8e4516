#pragma once
#include "linewalk/metrics.hpp"

#include <cstdint>
#include <string>

namespace lw {

struct WalkReport {
  // Top-level KPIs
  WalkStats stats;

  // Traversal description
  std::string filename;
  std::uint64_t file_size = 0;
  std::string direction;
  std::uint64_t start_offset = 0;
  std::uint64_t resume_offset = 0;
  std::uint64_t chunk_size = 0;
  bool exhausted = false;

  // Empty when the walk ended normally.
  std::string error;
};

class WalkReportWriter {
public:
  // Serialize report to a single-line JSON object.
  static std::string to_json(const WalkReport& r);
};

// Writes `json` to `path`, creating parent directories. "-" writes to stderr.
bool write_report_file(const std::string& path, const std::string& json,
                       std::string* err_out = nullptr);

}
