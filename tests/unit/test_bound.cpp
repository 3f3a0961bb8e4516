#include "linewalk/line_iterator.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using Lines = std::vector<std::string>;

static Lines walk(const fs::path& f, lw::Position pos, lw::Direction dir, lw::Position bound,
                  std::size_t chunk) {
  lw::TraversalConfig cfg;
  cfg.path = f.string();
  cfg.position = pos;
  cfg.direction = dir;
  cfg.bound = bound;
  cfg.chunk_size = chunk;
  Lines out;
  auto it = lw::open(cfg);
  if (!it) { out.push_back("<open failed>"); return out; }
  if (!it->for_each_line([&](std::string_view s){ out.emplace_back(s); return true; }))
    out.push_back("<io error>");
  return out;
}

int main() {
  using lw::Direction;
  using lw::Position;

  // line starts: a=0 bb=2 ccc=5 dddd=9, length 14
  const fs::path f = fs::temp_directory_path() / "lw_bound.txt";
  { std::ofstream out(f, std::ios::binary); out << "a\nbb\nccc\ndddd\n"; }

  struct Case {
    const char* name;
    Position pos;
    Direction dir;
    Position bound;
    Lines want;
  };
  const std::vector<Case> cases = {
    {"forward bound at line start",   Position::start(), Direction::Forward,  Position::at(5), {"a", "bb"}},
    {"forward bound mid-line",        Position::start(), Direction::Forward,  Position::at(6), {"a", "bb", "ccc"}},
    {"forward bound end",             Position::at(2),   Direction::Forward,  Position::end(), {"bb", "ccc", "dddd"}},
    {"forward bound equals start",    Position::at(5),   Direction::Forward,  Position::at(5), {}},
    {"backward bound at line start",  Position::end(),   Direction::Backward, Position::at(5), {"dddd", "ccc"}},
    {"backward bound mid-line",       Position::end(),   Direction::Backward, Position::at(6), {"dddd"}},
    {"backward bound on terminator",  Position::end(),   Direction::Backward, Position::at(4), {"dddd", "ccc"}},
    {"backward bound start",          Position::at(9),   Direction::Backward, Position::start(), {"ccc", "bb", "a"}},
    {"backward bound one",            Position::end(),   Direction::Backward, Position::at(1), {"dddd", "ccc", "bb"}},
    {"backward bound equals start",   Position::at(9),   Direction::Backward, Position::at(9), {}},
  };

  int failures = 0;
  for (const auto& c : cases) {
    for (std::size_t chunk : {1u, 3u, 4096u}) {
      Lines got = walk(f, c.pos, c.dir, c.bound, chunk);
      if (got != c.want) {
        std::cerr << "[FAIL] " << c.name << " chunk=" << chunk << ": got " << got.size()
                  << " lines, want " << c.want.size() << "\n";
        ++failures;
      }
    }
  }

  // Backward traversal stops reading at the bound.
  {
    lw::TraversalConfig cfg;
    cfg.path = f.string();
    cfg.direction = Direction::Backward;
    cfg.bound = Position::at(9);
    cfg.chunk_size = 2;
    auto it = lw::open(cfg);
    std::string line;
    while (it && it->next(line) == lw::ReadStatus::Line) {}
    // [8, 14) is all that is needed to see "dddd" and its preceding terminator
    if (!it || it->bytes_read() > 6) {
      std::cerr << "[FAIL] backward read below bound, bytes=" << (it ? it->bytes_read() : 0) << "\n";
      ++failures;
    }
  }

  if (failures) return 1;
  std::cout << "[PASS] bound\n";
  return 0;
}
