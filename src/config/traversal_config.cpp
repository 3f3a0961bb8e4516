#include "linewalk/traversal_config.hpp"
#include <utility>

namespace lw {

static bool fail(ConfigError* err, ConfigError::Code code, std::string msg) {
  if (err) { err->code = code; err->message = std::move(msg); }
  return false;
}

// Both explicit: the bound must not lie behind the start.
static bool bound_in_order(const Position& pos, const Position& bound, Direction dir) {
  if (!pos.is_offset() || !bound.is_offset()) return true;
  return dir == Direction::Forward ? bound.offset >= pos.offset
                                   : bound.offset <= pos.offset;
}

bool validate(const TraversalConfig& cfg, ConfigError* err) {
  if (cfg.path.empty())
    return fail(err, ConfigError::Code::MissingPath, "no path given");
  if (cfg.chunk_size == 0)
    return fail(err, ConfigError::Code::InvalidChunkSize, "chunk size must be > 0");
  if (cfg.bound && !bound_in_order(cfg.resolved_position(), *cfg.bound, cfg.direction)) {
    return fail(err, ConfigError::Code::InvalidBound,
                "bound " + to_string(*cfg.bound) + " lies " +
                (cfg.direction == Direction::Forward ? "before" : "after") +
                " position " + to_string(cfg.resolved_position()) +
                " for " + to_string(cfg.direction) + " traversal");
  }
  return true;
}

ConfigBuilder& ConfigBuilder::path(std::string p) { path_ = std::move(p); return *this; }

ConfigBuilder& ConfigBuilder::position(Position p) {
  position_.value = p; position_.text.reset(); return *this;
}
ConfigBuilder& ConfigBuilder::position(std::uint64_t offset) { return position(Position::at(offset)); }
ConfigBuilder& ConfigBuilder::position(std::string_view text) {
  position_.value.reset(); position_.text = std::string(text); return *this;
}

ConfigBuilder& ConfigBuilder::direction(Direction d) {
  direction_.value = d; direction_.text.reset(); return *this;
}
ConfigBuilder& ConfigBuilder::direction(std::string_view text) {
  direction_.value.reset(); direction_.text = std::string(text); return *this;
}

ConfigBuilder& ConfigBuilder::chunk_size(std::size_t n) { chunk_size_ = n; return *this; }
ConfigBuilder& ConfigBuilder::terminator(char t) { terminator_ = t; return *this; }

ConfigBuilder& ConfigBuilder::bound(Position p) {
  bound_.value = p; bound_.text.reset(); return *this;
}
ConfigBuilder& ConfigBuilder::bound(std::uint64_t offset) { return bound(Position::at(offset)); }
ConfigBuilder& ConfigBuilder::bound(std::string_view text) {
  bound_.value.reset(); bound_.text = std::string(text); return *this;
}

std::optional<TraversalConfig> ConfigBuilder::build(ConfigError* err) const {
  if (!path_ || path_->empty()) {
    fail(err, ConfigError::Code::MissingPath, "no path given");
    return std::nullopt;
  }

  TraversalConfig cfg;
  cfg.path = *path_;

  std::optional<Position> pos = position_.value;
  if (position_.text) {
    pos = parse_position(*position_.text);
    if (!pos) {
      fail(err, ConfigError::Code::InvalidPosition,
           "invalid position '" + *position_.text + "' (want start, end or a byte offset)");
      return std::nullopt;
    }
  }

  if (direction_.text) {
    auto d = parse_direction(*direction_.text);
    if (!d) {
      fail(err, ConfigError::Code::InvalidDirection,
           "invalid direction '" + *direction_.text + "' (want forward or backward)");
      return std::nullopt;
    }
    cfg.direction = *d;
  } else if (direction_.value) {
    cfg.direction = *direction_.value;
  }

  // Defaults depend on the direction, so resolve after it is known.
  cfg.position = pos ? *pos : cfg.resolved_position();

  if (chunk_size_) cfg.chunk_size = *chunk_size_;
  if (cfg.chunk_size == 0) {
    fail(err, ConfigError::Code::InvalidChunkSize, "chunk size must be > 0");
    return std::nullopt;
  }
  if (terminator_) cfg.terminator = *terminator_;

  cfg.bound = bound_.value;
  if (bound_.text) {
    cfg.bound = parse_position(*bound_.text);
    if (!cfg.bound) {
      fail(err, ConfigError::Code::InvalidBound,
           "invalid bound '" + *bound_.text + "' (want start, end or a byte offset)");
      return std::nullopt;
    }
  }

  if (!validate(cfg, err)) return std::nullopt;
  return cfg;
}

}
