#include "linewalk/line_iterator.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using Lines = std::vector<std::string>;

struct RefLine { std::uint64_t start; std::string text; };

// Straightforward in-memory split used as the reference.
static std::vector<RefLine> reference_lines(const std::string& s, char term) {
  std::vector<RefLine> out;
  std::size_t start = 0;
  while (start < s.size()) {
    std::size_t pos = s.find(term, start);
    if (pos == std::string::npos) { out.push_back({start, s.substr(start)}); break; }
    out.push_back({start, s.substr(start, pos - start)});
    start = pos + 1;
  }
  return out;
}

static bool walk(const fs::path& f, std::uint64_t off, lw::Direction dir, std::size_t chunk, Lines* out) {
  lw::OpenError err;
  auto it = lw::open(f.string(), lw::Position::at(off), dir, chunk, &err);
  if (!it) { std::cerr << "  open: " << err.message << "\n"; return false; }
  out->clear();
  return it->for_each_line([&](std::string_view s){ out->emplace_back(s); return true; });
}

static fs::path write_fixture(const std::string& name, const std::string& content) {
  fs::path p = fs::temp_directory_path() / ("lw_chunk_" + name);
  std::ofstream out(p, std::ios::binary);
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  return p;
}

int main() {
  std::mt19937 rng(7);
  std::vector<std::string> corpora = {
    "a\nbb\nccc\n",
    "a\nbb\nccc",
    "\n\n\n",
    "x",
    "\nlead\n\ntrail",
  };
  // A random one with runs of blank lines and long lines.
  {
    std::string s;
    std::uniform_int_distribution<int> len(0, 40), blank(0, 5);
    for (int i = 0; i < 80; ++i) {
      if (blank(rng) == 0) { s += "\n"; continue; }
      s += std::string(len(rng), static_cast<char>('a' + i % 26)) + "\n";
    }
    s += "no-terminator";
    corpora.push_back(s);
  }

  const std::size_t chunks[] = {1, 2, 3, 7, 64, 64 * 1024};
  int failures = 0;
  std::uint64_t checks = 0;

  for (std::size_t c = 0; c < corpora.size(); ++c) {
    const std::string& content = corpora[c];
    const auto f = write_fixture(std::to_string(c) + ".txt", content);
    const auto ref = reference_lines(content, '\n');

    for (std::uint64_t off = 0; off <= content.size(); ++off) {
      // Forward from off: lines starting at or after off.
      Lines want_fwd, want_bwd;
      for (const auto& l : ref) {
        if (l.start >= off) want_fwd.push_back(l.text);
        else want_bwd.insert(want_bwd.begin(), l.text);
      }

      for (std::size_t chunk : chunks) {
        Lines got;
        ++checks;
        if (!walk(f, off, lw::Direction::Forward, chunk, &got) || got != want_fwd) {
          std::cerr << "[FAIL] corpus " << c << " forward off=" << off << " chunk=" << chunk
                    << " got " << got.size() << " lines, want " << want_fwd.size() << "\n";
          ++failures;
        }
        ++checks;
        if (!walk(f, off, lw::Direction::Backward, chunk, &got) || got != want_bwd) {
          std::cerr << "[FAIL] corpus " << c << " backward off=" << off << " chunk=" << chunk
                    << " got " << got.size() << " lines, want " << want_bwd.size() << "\n";
          ++failures;
        }
      }
    }
  }

  if (failures) { std::cerr << "[FAIL] " << failures << "/" << checks << " chunking checks\n"; return 1; }
  std::cout << "[PASS] chunking invariance and offset partition, checks=" << checks << "\n";
  return 0;
}
