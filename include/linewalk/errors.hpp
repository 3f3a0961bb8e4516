#pragma once
#include <cstdint>
#include <string>

namespace lw {

// Raised by ConfigBuilder::build() and validate().
struct ConfigError {
  enum class Code {
    MissingPath,
    InvalidPosition,
    InvalidDirection,
    InvalidChunkSize,
    InvalidBound,
  };

  Code code = Code::MissingPath;
  std::string message;
};

// Raised by open().
struct OpenError {
  enum class Code {
    NotFound,
    PermissionDenied,
    NotRegularFile,
    OffsetOutOfRange,
    BoundOutOfOrder,
    InvalidConfig,
    Io,
  };

  Code code = Code::Io;
  int sys_errno = 0;     // errno of the failing call, 0 if not an OS error
  std::string message;
};

// Raised by LineIterator::next() when a read fails mid-traversal.
struct IoError {
  int sys_errno = 0;
  std::uint64_t offset = 0; // absolute offset of the failed read
  std::string message;
};

const char* to_string(ConfigError::Code c) noexcept;
const char* to_string(OpenError::Code c) noexcept;

}
