#include "linewalk/metrics.hpp"
#include <algorithm>

namespace lw {

void WalkMetrics::reset() {
  lines_ = emitted_ = bytes_ = reads_ = 0;
  stage_order_.clear();
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void WalkMetrics::start_stage(std::string_view name) {
  std::string key(name);
  if (std::find(stage_order_.begin(), stage_order_.end(), key) == stage_order_.end())
    stage_order_.push_back(key);
  stage_starts_[key] = std::chrono::steady_clock::now();
}

void WalkMetrics::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  const double ms = std::chrono::duration<double, std::milli>(
                      std::chrono::steady_clock::now() - it->second).count();
  stage_accum_ms_[key] += ms;
  stage_starts_.erase(it);
}

WalkStats WalkMetrics::snapshot(double wall_ms) const {
  WalkStats s;
  s.lines = lines_;
  s.bytes = bytes_;
  s.reads = reads_;
  s.emitted_bytes = emitted_;
  s.wall_ms = wall_ms;
  const double sec = wall_ms / 1000.0;
  s.throughput_mb_s = (sec > 0.0) ? (bytes_ / (1024.0*1024.0)) / sec : 0.0;
  s.lines_per_sec = (sec > 0.0) ? lines_ / sec : 0.0;

  // Stages keep first-start order; unfinished ones are left out.
  s.stages.reserve(stage_order_.size());
  for (const auto& name : stage_order_) {
    auto it = stage_accum_ms_.find(name);
    if (it != stage_accum_ms_.end()) s.stages.push_back(StageTiming{name, it->second});
  }
  return s;
}

}
