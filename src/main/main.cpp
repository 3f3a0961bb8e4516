#include "linewalk/config_file.hpp"
#include "linewalk/line_iterator.hpp"
#include "linewalk/metrics.hpp"
#include "linewalk/traversal_config.hpp"
#include "linewalk/walk_report.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace {

struct Cli {
  std::string path;
  std::string config_file;
  std::optional<std::string> position;
  std::optional<std::string> direction;
  std::optional<std::string> bound;
  std::optional<std::size_t> chunk_size;
  std::optional<char> terminator;
  std::optional<std::uint64_t> limit;
  std::string stats_path;
  bool print_offset = false;
  bool verbose = false;
};

void usage(std::ostream& os) {
  os <<
    "Usage: linewalk [--position=start|end|N] [--direction=forward|backward]\n"
    "                [--chunk-size=N] [--terminator=C] [--bound=start|end|N]\n"
    "                [--limit=N] [--config=FILE.json] [--stats=FILE.json|-]\n"
    "                [--print-offset] [-v] <file>\n";
}

template <typename T>
bool parse_uint(std::string_view s, T* out) {
  if (s.empty()) return false;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), *out, 10);
  return ec == std::errc() && ptr == s.data() + s.size();
}

// "\n", "\t", "\r", "\0" or one literal byte.
std::optional<char> parse_terminator(std::string_view s) {
  if (s.size() == 1) return s[0];
  if (s == "\\n") return '\n';
  if (s == "\\t") return '\t';
  if (s == "\\r") return '\r';
  if (s == "\\0") return '\0';
  return std::nullopt;
}

// Returns 0 when parsed, otherwise the exit code to use.
int parse_cli(int argc, char** argv, Cli& c) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto val = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    std::string v;
    if (val("--position=", &v))  { c.position = v;  continue; }
    if (val("--direction=", &v)) { c.direction = v; continue; }
    if (val("--bound=", &v))     { c.bound = v;     continue; }
    if (val("--config=", &c.config_file)) continue;
    if (val("--stats=", &c.stats_path))   continue;
    if (val("--file=", &c.path))          continue;
    if (val("--chunk-size=", &v)) {
      std::size_t n = 0;
      if (!parse_uint(v, &n)) { std::cerr << "[walk] bad --chunk-size: " << v << "\n"; return 1; }
      c.chunk_size = n;
      continue;
    }
    if (val("--limit=", &v)) {
      std::uint64_t n = 0;
      if (!parse_uint(v, &n)) { std::cerr << "[walk] bad --limit: " << v << "\n"; return 1; }
      c.limit = n;
      continue;
    }
    if (val("--terminator=", &v)) {
      c.terminator = parse_terminator(v);
      if (!c.terminator) { std::cerr << "[walk] bad --terminator: " << v << "\n"; return 1; }
      continue;
    }
    if (a == "--print-offset") { c.print_offset = true; continue; }
    if (a == "-v" || a == "--verbose") { c.verbose = true; continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(0); }
    if (a.size() > 1 && a[0] == '-') {
      std::cerr << "[walk] unknown option: " << a << "\n";
      usage(std::cerr);
      return 1;
    }
    if (!c.path.empty()) { std::cerr << "[walk] more than one file given\n"; return 1; }
    c.path = a;
  }
  return 0;
}

}

int main(int argc, char** argv) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  Cli cli;
  if (int rc = parse_cli(argc, argv, cli)) return rc;

  // --- configuration: defaults < config file < flags
  lw::ConfigBuilder builder;
  if (!cli.config_file.empty()) {
    std::string err;
    if (!lw::load_config_file(cli.config_file, builder, &err)) {
      std::cerr << "[config] " << err << "\n";
      return 2;
    }
  }
  if (!cli.path.empty())  builder.path(cli.path);
  if (cli.position)       builder.position(std::string_view(*cli.position));
  if (cli.direction)      builder.direction(std::string_view(*cli.direction));
  if (cli.bound)          builder.bound(std::string_view(*cli.bound));
  if (cli.chunk_size)     builder.chunk_size(*cli.chunk_size);
  if (cli.terminator)     builder.terminator(*cli.terminator);

  lw::ConfigError cfg_err;
  auto cfg = builder.build(&cfg_err);
  if (!cfg) {
    std::cerr << "[config] " << lw::to_string(cfg_err.code) << ": " << cfg_err.message << "\n";
    if (cfg_err.code == lw::ConfigError::Code::MissingPath) usage(std::cerr);
    return 2;
  }

  lw::WalkMetrics metrics;

  // --- open
  metrics.start_stage("open");
  lw::OpenError oerr;
  auto it = lw::open(*cfg, &oerr);
  metrics.end_stage("open");
  if (!it) {
    std::cerr << "[open] " << lw::to_string(oerr.code) << ": " << oerr.message << "\n";
    return 2;
  }
  if (cli.verbose) {
    std::cerr << "[open] " << cfg->path
              << " size=" << it->file_size()
              << " start=" << it->start_offset()
              << " direction=" << lw::to_string(cfg->direction)
              << " chunk=" << cfg->chunk_size << "\n";
  }

  // --- walk
  metrics.start_stage("walk");
  std::uint64_t emitted = 0;
  const bool ok = it->for_each_line([&](std::string_view line){
    if (cli.limit && emitted >= *cli.limit) return false;
    std::cout.write(line.data(), static_cast<std::streamsize>(line.size()));
    std::cout.put('\n');
    metrics.add_line(line.size());
    ++emitted;
    return !(cli.limit && emitted >= *cli.limit);
  });
  std::cout.flush();
  metrics.end_stage("walk");
  metrics.set_io(it->bytes_read(), it->reads());

  if (!ok) std::cerr << "[walk] " << it->error().message << "\n";
  if (cli.verbose) {
    std::cerr << "[walk] lines=" << emitted << " bytes_read=" << it->bytes_read()
              << " reads=" << it->reads() << "\n";
  }
  if (cli.print_offset) std::cerr << "[walk] resume_offset=" << it->offset() << "\n";

  // --- stats
  if (!cli.stats_path.empty()) {
    const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
    lw::WalkReport r;
    r.stats = metrics.snapshot(wall_ms);
    r.filename = cfg->path;
    r.file_size = it->file_size();
    r.direction = lw::to_string(cfg->direction);
    r.start_offset = it->start_offset();
    r.resume_offset = it->offset();
    r.chunk_size = cfg->chunk_size;
    r.exhausted = it->exhausted();
    if (!ok) r.error = it->error().message;

    std::string err;
    if (!lw::write_report_file(cli.stats_path, lw::WalkReportWriter::to_json(r), &err)) {
      std::cerr << "[stats] " << err << "\n";
    } else if (cli.verbose) {
      std::cerr << "[stats] wrote " << cli.stats_path << "\n";
    }
  }

  return ok ? 0 : 3;
}
