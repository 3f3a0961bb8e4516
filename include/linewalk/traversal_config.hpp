#pragma once
#include "linewalk/errors.hpp"
#include "linewalk/position.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lw {

inline constexpr std::size_t kDefaultChunkSize = 8 * 1024; // 8 KiB

struct TraversalConfig {
  std::string path;
  std::optional<Position> position;      // unset -> Start (forward) / End (backward)
  Direction direction = Direction::Forward;
  std::size_t chunk_size = kDefaultChunkSize;
  char terminator = '\n';
  std::optional<Position> bound;         // stop limit, unset -> whole file

  // Position after direction-dependent defaulting.
  Position resolved_position() const {
    if (position) return *position;
    return direction == Direction::Forward ? Position::start() : Position::end();
  }
};

// Checks what can be checked without touching the file system.
bool validate(const TraversalConfig& cfg, ConfigError* err = nullptr);

// Incremental builder. Setters never fail; build() reports the first
// violated constraint.
class ConfigBuilder {
public:
  ConfigBuilder& path(std::string p);

  ConfigBuilder& position(Position p);
  ConfigBuilder& position(std::uint64_t offset);
  ConfigBuilder& position(std::string_view text);

  ConfigBuilder& direction(Direction d);
  ConfigBuilder& direction(std::string_view text);

  ConfigBuilder& chunk_size(std::size_t n);
  ConfigBuilder& terminator(char t);

  ConfigBuilder& bound(Position p);
  ConfigBuilder& bound(std::uint64_t offset);
  ConfigBuilder& bound(std::string_view text);

  std::optional<TraversalConfig> build(ConfigError* err = nullptr) const;

private:
  // Textual inputs are kept raw so parse errors surface at build().
  template <typename T>
  struct Slot {
    std::optional<T> value;
    std::optional<std::string> text;
  };

  std::optional<std::string> path_;
  Slot<Position> position_;
  Slot<Direction> direction_;
  std::optional<std::size_t> chunk_size_;
  std::optional<char> terminator_;
  Slot<Position> bound_;
};

}
