#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lw {

struct StageTiming {
  std::string name;
  double duration_ms = 0.0;
};

struct WalkStats {
  std::uint64_t lines = 0;
  std::uint64_t bytes = 0;       // bytes read from the file, not bytes emitted
  std::uint64_t reads = 0;
  std::uint64_t emitted_bytes = 0;
  double wall_ms = 0.0;
  double throughput_mb_s = 0.0;
  double lines_per_sec = 0.0;
  std::vector<StageTiming> stages;
};

// Counters and stage timers for one traversal run.
class WalkMetrics {
public:
  void reset();
  void add_line(std::size_t emitted) noexcept { ++lines_; emitted_ += emitted; }
  void set_io(std::uint64_t bytes, std::uint64_t reads) noexcept { bytes_ = bytes; reads_ = reads; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  WalkStats snapshot(double wall_ms) const;

private:
  std::uint64_t lines_{0};
  std::uint64_t emitted_{0};
  std::uint64_t bytes_{0};
  std::uint64_t reads_{0};
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, double> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
