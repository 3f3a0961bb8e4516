#include "linewalk/walk_report.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace lw {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char u[8];
          std::snprintf(u, sizeof(u), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o << u;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string WalkReportWriter::to_json(const WalkReport& r) {
  const WalkStats& s = r.stats;
  std::ostringstream o;
  o << "{";
  o << "\"lines\":" << s.lines << ",";
  o << "\"bytes\":" << s.bytes << ",";
  o << "\"emitted_bytes\":" << s.emitted_bytes << ",";
  o << "\"reads\":" << s.reads << ",";
  o << "\"wall_time_ms\":" << safe_num(s.wall_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(s.throughput_mb_s) << ",";
  o << "\"lines_per_sec\":" << safe_num(s.lines_per_sec) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<s.stages.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, s.stages[i].name);
    o << ",\"duration_ms\":" << safe_num(s.stages[i].duration_ms) << "}";
  }
  o << "],";

  o << "\"filename\":";  esc(o, r.filename);  o << ",";
  o << "\"file_size\":" << r.file_size << ",";
  o << "\"direction\":"; esc(o, r.direction); o << ",";
  o << "\"start_offset\":" << r.start_offset << ",";
  o << "\"resume_offset\":" << r.resume_offset << ",";
  o << "\"chunk_size\":" << r.chunk_size << ",";
  o << "\"exhausted\":" << (r.exhausted ? "true" : "false") << ",";
  o << "\"error\":";
  if (r.error.empty()) o << "null"; else esc(o, r.error);

  o << "}";
  return o.str();
}

bool write_report_file(const std::string& path, const std::string& json, std::string* err_out) {
  if (path == "-") {
    std::cerr << json << "\n";
    return true;
  }

  const std::filesystem::path p(path);
  std::error_code ec;
  if (p.has_parent_path() && !std::filesystem::exists(p.parent_path(), ec)) {
    std::filesystem::create_directories(p.parent_path(), ec);
    if (ec) {
      if (err_out) *err_out = "cannot create " + p.parent_path().string() + ": " + ec.message();
      return false;
    }
  }

  std::ofstream out(p, std::ios::binary);
  if (!out) {
    if (err_out) *err_out = "failed to write " + path;
    return false;
  }
  out.write(json.data(), static_cast<std::streamsize>(json.size()));
  out << "\n";
  if (!out) {
    if (err_out) *err_out = "failed to write " + path;
    return false;
  }
  return true;
}

}
