#include "linewalk/line_iterator.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

namespace lw {

namespace {

bool open_fail(OpenError* err, OpenError::Code code, int sys_errno, std::string msg) {
  if (err) { err->code = code; err->sys_errno = sys_errno; err->message = std::move(msg); }
  return false;
}

OpenError::Code code_for_errno(int e) {
  switch (e) {
    case ENOENT:
    case ENOTDIR: return OpenError::Code::NotFound;
    case EACCES:
    case EPERM:   return OpenError::Code::PermissionDenied;
    case EISDIR:  return OpenError::Code::NotRegularFile;
    default:      return OpenError::Code::Io;
  }
}

constexpr long kReadError = -1;
constexpr long kTruncated = -2;

std::uint64_t resolve(const Position& p, std::uint64_t file_len) {
  switch (p.kind) {
    case Position::Kind::Start: return 0;
    case Position::Kind::End:   return file_len;
    case Position::Kind::Offset: break;
  }
  return p.offset;
}

}

struct LineIterator::Impl {
  std::FILE* f = nullptr;
  std::string path;
  Direction dir = Direction::Forward;
  std::size_t chunk = kDefaultChunkSize;
  char term = '\n';

  std::uint64_t file_len = 0;
  std::uint64_t start = 0;
  bool has_bound = false;
  std::uint64_t bound = 0;

  bool primed = false;
  bool exhausted = false;
  bool eof = false;          // forward: no more bytes after buf
  std::uint64_t pos = 0;     // file position of the next fread

  // Forward: buf holds [base, base + buf.size()), head is the next unread byte.
  // Backward: buf holds the unread region [lo, lo + buf.size()).
  std::string buf;
  std::uint64_t base = 0;
  std::size_t head = 0;
  std::uint64_t lo = 0;
  std::uint64_t floor_off = 0;   // backward never reads below this
  std::uint64_t last_start = 0;  // backward resume offset

  std::uint64_t lines = 0;
  std::uint64_t bytes = 0;
  std::uint64_t nreads = 0;
  IoError err;

  ~Impl() { close(); }

  void close() noexcept {
    if (f) { std::fclose(f); f = nullptr; }
  }

  ReadStatus io_fail(int e, std::uint64_t at, const char* what) {
    err.sys_errno = e;
    err.offset = at;
    err.message = std::string(what) + " at offset " + std::to_string(at) + " of " + path +
                  (e ? std::string(": ") + std::strerror(e) : std::string());
    exhausted = true;
    close();
    return ReadStatus::Error;
  }

  bool seek(std::uint64_t off) {
    if (std::fseek(f, static_cast<long>(off), SEEK_SET) != 0) return false;
    pos = off;
    return true;
  }

  // Append up to `want` bytes from the current file position to buf.
  // Requests never extend past the length seen at open by more than one
  // default chunk, which is what picks up bytes appended since then.
  // Returns the byte count and sets eof on a short read. kReadError on a
  // read error, kTruncated when the file now ends below the open length.
  long append(std::size_t want) {
    if (pos < file_len)
      want = static_cast<std::size_t>(std::min<std::uint64_t>(want, file_len - pos));
    else
      want = std::min(want, kDefaultChunkSize);
    const std::size_t old = buf.size();
    buf.resize(old + want);
    errno = 0;
    const std::size_t n = std::fread(&buf[old], 1, want, f);
    buf.resize(old + n);
    ++nreads;
    bytes += n;
    pos += n;
    if (n < want) {
      if (std::ferror(f)) return kReadError;
      eof = true;
      if (pos < file_len) return kTruncated;
    }
    return static_cast<long>(n);
  }

  ReadStatus read_fail(long rc, std::uint64_t at) {
    if (rc == kTruncated) return io_fail(EIO, pos, "file truncated during read");
    return io_fail(errno, at, "read failed");
  }

  // ---- forward ------------------------------------------------------------

  // prime_* return Line when traversal can proceed.
  ReadStatus prime_forward() {
    primed = true;
    if (start == 0) {
      if (!seek(0)) return io_fail(errno, 0, "seek failed");
      base = 0;
      return ReadStatus::Line;
    }

    // Start mid-line: skip to the byte after the next terminator, looking
    // one byte back so that a line start at `start` is kept.
    if (!seek(start - 1)) return io_fail(errno, start - 1, "seek failed");
    base = start - 1;
    head = 0;
    while (true) {
      std::size_t from = buf.size();
      const long rc = append(chunk);
      if (rc < 0) return read_fail(rc, base + from);
      std::size_t pos = buf.find(term, from);
      if (pos != std::string::npos) { head = pos + 1; return ReadStatus::Line; }
      if (eof) { head = buf.size(); return ReadStatus::Line; }
      // Keep memory bounded while skipping a long line.
      base += buf.size();
      buf.clear();
    }
  }

  ReadStatus next_forward(std::string& line) {
    while (true) {
      const std::uint64_t line_start = base + head;
      if (has_bound && line_start >= bound) { exhausted = true; return ReadStatus::End; }

      std::size_t pos = buf.find(term, head);
      if (pos != std::string::npos) {
        line.assign(buf, head, pos - head);
        head = pos + 1;
        ++lines;
        return ReadStatus::Line;
      }
      if (eof) {
        exhausted = true;
        if (head >= buf.size()) return ReadStatus::End;
        line.assign(buf, head, std::string::npos);
        head = buf.size();
        ++lines;
        return ReadStatus::Line;
      }

      buf.erase(0, head);
      base += head;
      head = 0;
      const long rc = append(chunk);
      if (rc < 0) return read_fail(rc, base + buf.size());
    }
  }

  // ---- backward -----------------------------------------------------------

  ReadStatus prime_backward() {
    primed = true;
    last_start = start;
    floor_off = (has_bound && bound > 0) ? bound - 1 : 0;
    if (start == 0) { exhausted = true; return ReadStatus::End; }

    // The region ends right after the first terminator at or after start-1,
    // so a line containing `start` is read whole.
    if (!seek(start - 1)) return io_fail(errno, start - 1, "seek failed");
    lo = start - 1;
    eof = false;
    while (true) {
      std::size_t from = buf.size();
      const long rc = append(chunk);
      if (rc < 0) return read_fail(rc, lo + from);
      std::size_t pos = buf.find(term, from);
      if (pos != std::string::npos) { buf.resize(pos); break; }
      if (eof) break;
    }
    return ReadStatus::Line;
  }

  ReadStatus next_backward(std::string& line) {
    while (true) {
      std::size_t pos = buf.rfind(term);
      if (pos != std::string::npos) {
        const std::uint64_t line_start = lo + pos + 1;
        if (has_bound && line_start < bound) { exhausted = true; return ReadStatus::End; }
        line.assign(buf, pos + 1, std::string::npos);
        buf.resize(pos);
        last_start = line_start;
        ++lines;
        return ReadStatus::Line;
      }

      if (lo > floor_off) {
        const std::size_t n = static_cast<std::size_t>(
            std::min<std::uint64_t>(chunk, lo - floor_off));
        const std::uint64_t at = lo - n;
        if (!seek(at)) return io_fail(errno, at, "seek failed");
        std::string tail = std::move(buf);
        buf.clear();
        eof = false;
        const long rc = append(n);
        if (rc < 0) return read_fail(rc, at);
        buf += tail;
        lo = at;
        continue;
      }

      // Nothing left above the floor: either the earliest line of the
      // file, or a line that starts before the bound.
      exhausted = true;
      if (lo != 0 || (has_bound && bound > 0)) return ReadStatus::End;
      line.swap(buf);
      buf.clear();
      last_start = 0;
      ++lines;
      return ReadStatus::Line;
    }
  }

  ReadStatus next(std::string& line) {
    if (exhausted || !f) return ReadStatus::End;
    if (!primed) {
      ReadStatus st = dir == Direction::Forward ? prime_forward() : prime_backward();
      if (st != ReadStatus::Line) return st;
    }
    return dir == Direction::Forward ? next_forward(line) : next_backward(line);
  }

  std::uint64_t offset() const noexcept {
    if (!primed) return start;
    return dir == Direction::Forward ? base + head : last_start;
  }
};

LineIterator::LineIterator(Impl* p) noexcept : p_(p) {}

LineIterator::LineIterator(LineIterator&& other) noexcept : p_(other.p_) { other.p_ = nullptr; }

LineIterator& LineIterator::operator=(LineIterator&& other) noexcept {
  if (this != &other) {
    delete p_;
    p_ = other.p_;
    other.p_ = nullptr;
  }
  return *this;
}

LineIterator::~LineIterator() { delete p_; }

ReadStatus LineIterator::next(std::string& line) {
  if (!p_) return ReadStatus::End;
  return p_->next(line);
}

bool LineIterator::for_each_line(const LineCallback& cb) {
  std::string line;
  while (true) {
    switch (next(line)) {
      case ReadStatus::Line:
        if (!cb(line)) return true;
        break;
      case ReadStatus::End:   return true;
      case ReadStatus::Error: return false;
    }
  }
}

void LineIterator::close() noexcept {
  if (!p_) return;
  p_->close();
  p_->exhausted = true;
}

bool LineIterator::exhausted() const noexcept { return !p_ || p_->exhausted; }
Direction LineIterator::direction() const noexcept { return p_ ? p_->dir : Direction::Forward; }
std::uint64_t LineIterator::start_offset() const noexcept { return p_ ? p_->start : 0; }
std::uint64_t LineIterator::file_size() const noexcept { return p_ ? p_->file_len : 0; }
std::uint64_t LineIterator::offset() const noexcept { return p_ ? p_->offset() : 0; }
std::uint64_t LineIterator::lines_read() const noexcept { return p_ ? p_->lines : 0; }
std::uint64_t LineIterator::bytes_read() const noexcept { return p_ ? p_->bytes : 0; }
std::uint64_t LineIterator::reads() const noexcept { return p_ ? p_->nreads : 0; }

const IoError& LineIterator::error() const noexcept {
  static const IoError none{};
  return p_ ? p_->err : none;
}

int LineIterator::last_error() const noexcept { return p_ ? p_->err.sys_errno : 0; }

std::optional<LineIterator> open(const TraversalConfig& cfg, OpenError* err) {
  ConfigError cerr;
  if (!validate(cfg, &cerr)) {
    open_fail(err, OpenError::Code::InvalidConfig, 0, cerr.message);
    return std::nullopt;
  }

  std::FILE* f = std::fopen(cfg.path.c_str(), "rb");
  if (!f) {
    const int e = errno;
    open_fail(err, code_for_errno(e), e, "cannot open " + cfg.path + ": " + std::strerror(e));
    return std::nullopt;
  }

  auto p = new LineIterator::Impl;
  p->f = f;
  LineIterator it(p); // owns the handle from here on

  std::error_code ec;
  auto st = std::filesystem::status(cfg.path, ec);
  if (!ec && !std::filesystem::is_regular_file(st)) {
    open_fail(err, OpenError::Code::NotRegularFile, 0, cfg.path + " is not a regular file");
    return std::nullopt;
  }

  if (std::fseek(f, 0, SEEK_END) != 0) {
    const int e = errno;
    open_fail(err, OpenError::Code::Io, e, "cannot seek " + cfg.path + ": " + std::strerror(e));
    return std::nullopt;
  }
  const long len = std::ftell(f);
  if (len < 0) {
    const int e = errno;
    open_fail(err, OpenError::Code::Io, e, "cannot size " + cfg.path + ": " + std::strerror(e));
    return std::nullopt;
  }

  p->path = cfg.path;
  p->dir = cfg.direction;
  p->chunk = cfg.chunk_size;
  p->term = cfg.terminator;
  p->file_len = static_cast<std::uint64_t>(len);

  const Position pos = cfg.resolved_position();
  if (pos.is_offset() && pos.offset > p->file_len) {
    open_fail(err, OpenError::Code::OffsetOutOfRange, 0,
              "offset " + std::to_string(pos.offset) + " beyond end of " + cfg.path +
              " (" + std::to_string(p->file_len) + " bytes)");
    return std::nullopt;
  }
  p->start = resolve(pos, p->file_len);

  if (cfg.bound) {
    if (cfg.bound->is_offset() && cfg.bound->offset > p->file_len) {
      open_fail(err, OpenError::Code::OffsetOutOfRange, 0,
                "bound " + std::to_string(cfg.bound->offset) + " beyond end of " + cfg.path +
                " (" + std::to_string(p->file_len) + " bytes)");
      return std::nullopt;
    }
    p->has_bound = true;
    p->bound = resolve(*cfg.bound, p->file_len);
    const bool ordered = cfg.direction == Direction::Forward ? p->bound >= p->start
                                                             : p->bound <= p->start;
    if (!ordered) {
      open_fail(err, OpenError::Code::BoundOutOfOrder, 0,
                "bound " + std::to_string(p->bound) + " lies " +
                (cfg.direction == Direction::Forward ? "before" : "after") +
                " start " + std::to_string(p->start));
      return std::nullopt;
    }
  }

  return std::optional<LineIterator>(std::move(it));
}

std::optional<LineIterator> open(std::string path, Position position, Direction direction,
                                 std::size_t chunk_size, OpenError* err) {
  TraversalConfig cfg;
  cfg.path = std::move(path);
  cfg.position = position;
  cfg.direction = direction;
  cfg.chunk_size = chunk_size;
  return open(cfg, err);
}

}
