#include "linewalk/position.hpp"
#include <charconv>
#include <system_error>

namespace lw {

bool operator==(const Position& a, const Position& b) noexcept {
  if (a.kind != b.kind) return false;
  return a.kind != Position::Kind::Offset || a.offset == b.offset;
}

bool operator!=(const Position& a, const Position& b) noexcept { return !(a == b); }

std::optional<Position> parse_position(std::string_view s) {
  if (s == "start") return Position::start();
  if (s == "end")   return Position::end();
  if (s.empty()) return std::nullopt;

  std::uint64_t n = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n, 10);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return Position::at(n);
}

std::optional<Direction> parse_direction(std::string_view s) {
  if (s == "forward")  return Direction::Forward;
  if (s == "backward") return Direction::Backward;
  return std::nullopt;
}

std::string to_string(const Position& p) {
  switch (p.kind) {
    case Position::Kind::Start: return "start";
    case Position::Kind::End:   return "end";
    case Position::Kind::Offset: break;
  }
  return std::to_string(p.offset);
}

const char* to_string(Direction d) noexcept {
  return d == Direction::Forward ? "forward" : "backward";
}

}
