#include "linewalk/errors.hpp"

namespace lw {

const char* to_string(ConfigError::Code c) noexcept {
  switch (c) {
    case ConfigError::Code::MissingPath:      return "MissingPath";
    case ConfigError::Code::InvalidPosition:  return "InvalidPosition";
    case ConfigError::Code::InvalidDirection: return "InvalidDirection";
    case ConfigError::Code::InvalidChunkSize: return "InvalidChunkSize";
    case ConfigError::Code::InvalidBound:     return "InvalidBound";
  }
  return "Unknown";
}

const char* to_string(OpenError::Code c) noexcept {
  switch (c) {
    case OpenError::Code::NotFound:         return "NotFound";
    case OpenError::Code::PermissionDenied: return "PermissionDenied";
    case OpenError::Code::NotRegularFile:   return "NotRegularFile";
    case OpenError::Code::OffsetOutOfRange: return "OffsetOutOfRange";
    case OpenError::Code::BoundOutOfOrder:  return "BoundOutOfOrder";
    case OpenError::Code::InvalidConfig:    return "InvalidConfig";
    case OpenError::Code::Io:               return "IoError";
  }
  return "Unknown";
}

}
