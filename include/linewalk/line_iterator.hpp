#pragma once
#include "linewalk/errors.hpp"
#include "linewalk/position.hpp"
#include "linewalk/traversal_config.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace lw {

enum class ReadStatus { Line, End, Error };

class LineIterator;

std::optional<LineIterator> open(const TraversalConfig& cfg, OpenError* err = nullptr);

// Pull-based line producer over one exclusively owned file handle.
// Created by open(); move-only; closes the file on destruction.
//
// Forward traversal from offset o yields the lines starting at or after o.
// Backward traversal from o yields the lines starting before o, most
// recent first. Lines never include the terminator byte. Backward from an
// offset inside a line yields that whole line first, not the one before it.
class LineIterator {
public:
  LineIterator(LineIterator&& other) noexcept;
  LineIterator& operator=(LineIterator&& other) noexcept;
  LineIterator(const LineIterator&) = delete;
  LineIterator& operator=(const LineIterator&) = delete;
  ~LineIterator();

  // Line: `line` holds the next line. End: exhausted, `line` untouched.
  // Error: a read failed, see error(); the iterator is exhausted.
  ReadStatus next(std::string& line);

  // Callback returns false to stop early. Returns false only on I/O error.
  using LineCallback = std::function<bool(std::string_view)>;
  bool for_each_line(const LineCallback& cb);

  // Release the handle now; later next() calls return End.
  void close() noexcept;

  bool exhausted() const noexcept;
  Direction direction() const noexcept;
  std::uint64_t start_offset() const noexcept; // resolved at open
  std::uint64_t file_size() const noexcept;    // size observed at open

  // Offset that continues this traversal when reopened in the same direction.
  std::uint64_t offset() const noexcept;

  std::uint64_t lines_read() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t reads() const noexcept;

  const IoError& error() const noexcept;
  int last_error() const noexcept;

private:
  struct Impl;
  explicit LineIterator(Impl* p) noexcept;
  Impl* p_;

  friend std::optional<LineIterator> open(const TraversalConfig& cfg, OpenError* err);
};

std::optional<LineIterator> open(std::string path, Position position, Direction direction,
                                 std::size_t chunk_size = kDefaultChunkSize,
                                 OpenError* err = nullptr);

}
