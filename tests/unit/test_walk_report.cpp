#include "linewalk/metrics.hpp"
#include "linewalk/walk_report.hpp"
#include <simdjson.h>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

namespace fs = std::filesystem;

int main() {
  lw::WalkMetrics m;
  m.start_stage("open");
  m.end_stage("open");
  m.start_stage("walk");
  m.add_line(3);
  m.add_line(5);
  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  m.end_stage("walk");
  m.start_stage("never-ended");
  m.set_io(1024, 2);

  lw::WalkReport r;
  r.stats = m.snapshot(4.0);
  r.filename = "dir/\"quoted\"\tname.log";
  r.file_size = 2048;
  r.direction = "backward";
  r.start_offset = 2048;
  r.resume_offset = 100;
  r.chunk_size = 512;
  r.exhausted = false;
  r.error = "read failed at offset 7";

  const std::string json = lw::WalkReportWriter::to_json(r);

  const fs::path out = fs::temp_directory_path() / "lw_report_test" / "nested" / "stats.json";
  fs::remove_all(fs::temp_directory_path() / "lw_report_test");
  std::string err;
  if (!lw::write_report_file(out.string(), json, &err)) {
    std::cerr << "[FAIL] write_report_file: " << err << "\n";
    return 1;
  }

  simdjson::padded_string padded;
  if (simdjson::padded_string::load(out.string()).get(padded)) {
    std::cerr << "[FAIL] cannot reload " << out << "\n";
    return 1;
  }
  simdjson::ondemand::parser p;
  simdjson::ondemand::document doc;
  if (p.iterate(padded).get(doc)) { std::cerr << "[FAIL] report is not JSON\n"; return 1; }

  bool ok = true;
  auto fail = [&](const char* what){ std::cerr << "[FAIL] " << what << "\n"; ok = false; };
  auto u64 = [&](const char* key){
    std::uint64_t v = 0;
    if (doc[key].get_uint64().get(v)) return ~std::uint64_t{0};
    return v;
  };
  auto str = [&](const char* key){
    std::string_view v;
    if (doc[key].get_string().get(v)) return std::string("<missing>");
    return std::string(v);
  };

  if (u64("lines") != 2) fail("lines");
  if (u64("bytes") != 1024) fail("bytes");
  if (u64("emitted_bytes") != 8) fail("emitted_bytes");
  if (u64("reads") != 2) fail("reads");
  double tput = 0.0;
  if (doc["throughput_mb_s"].get_double().get(tput) || tput <= 0.0) fail("throughput");

  std::size_t nstages = 0;
  std::string first_stage;
  simdjson::ondemand::array stages;
  if (doc["stage_times"].get_array().get(stages)) {
    fail("stage_times missing");
  } else {
    for (auto st : stages) {
      std::string_view name;
      if (st["stage"].get_string().get(name)) continue;
      if (nstages == 0) first_stage = std::string(name);
      ++nstages;
    }
  }
  if (nstages != 2 || first_stage != "open") fail("stage_times");

  if (str("filename") != "dir/\"quoted\"\tname.log") fail("filename escaping");
  if (str("direction") != "backward") fail("direction");
  if (u64("resume_offset") != 100) fail("resume_offset");
  bool exhausted = true;
  if (doc["exhausted"].get_bool().get(exhausted) || exhausted) fail("exhausted");
  if (str("error") != "read failed at offset 7") fail("error");

  // A clean run reports a null error
  r.error.clear();
  simdjson::padded_string clean(lw::WalkReportWriter::to_json(r));
  simdjson::ondemand::parser p2;
  simdjson::ondemand::document doc2;
  simdjson::ondemand::json_type t{};
  if (p2.iterate(clean).get(doc2) || doc2["error"].type().get(t) ||
      t != simdjson::ondemand::json_type::null) {
    fail("null error");
  }

  if (!ok) return 1;
  std::cout << "[PASS] walk report\n";
  return 0;
}
