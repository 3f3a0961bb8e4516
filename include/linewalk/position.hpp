#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lw {

// Where a traversal starts (or stops, when used as a bound).
struct Position {
  enum class Kind { Start, End, Offset };

  Kind kind = Kind::Start;
  std::uint64_t offset = 0; // meaningful only for Kind::Offset

  static Position start() { return Position{Kind::Start, 0}; }
  static Position end()   { return Position{Kind::End, 0}; }
  static Position at(std::uint64_t n) { return Position{Kind::Offset, n}; }

  bool is_offset() const noexcept { return kind == Kind::Offset; }
};

bool operator==(const Position& a, const Position& b) noexcept;
bool operator!=(const Position& a, const Position& b) noexcept;

enum class Direction { Forward, Backward };

// "start" | "end" | decimal byte offset. Surrounding spaces are not accepted.
std::optional<Position> parse_position(std::string_view s);

// "forward" | "backward".
std::optional<Direction> parse_direction(std::string_view s);

std::string to_string(const Position& p);
const char* to_string(Direction d) noexcept;

}
