#include "linewalk/config_file.hpp"

#include <simdjson.h>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace lw {

static bool set_err(std::string* err_out, std::string msg) {
  if (err_out) *err_out = std::move(msg);
  return false;
}

// position/bound: "start" | "end" | "123" | 123
static bool apply_position(simdjson::ondemand::value v, simdjson::ondemand::json_type t,
                           std::string_view key, bool is_bound,
                           ConfigBuilder& b, std::string* err_out) {
  switch (t) {
    case simdjson::ondemand::json_type::string: {
      std::string_view s = v.get_string().value_unsafe();
      if (is_bound) b.bound(s); else b.position(s);
      return true;
    }
    case simdjson::ondemand::json_type::number: {
      std::uint64_t n = v.get_uint64(); // throws on negative / fractional
      if (is_bound) b.bound(n); else b.position(n);
      return true;
    }
    default:
      return set_err(err_out, "config: '" + std::string(key) + "' must be a string or integer");
  }
}

static bool apply_document(simdjson::ondemand::parser& parser,
                           simdjson::padded_string& json,
                           ConfigBuilder& b, std::string* err_out) {
  try {
    auto doc = parser.iterate(json);
    simdjson::ondemand::object obj = doc.get_object();
    for (auto field : obj) {
      std::string_view key = field.unescaped_key().value_unsafe();
      simdjson::ondemand::value v = field.value();
      const auto t = v.type().value();

      if (key == "path") {
        if (t != simdjson::ondemand::json_type::string)
          return set_err(err_out, "config: 'path' must be a string");
        std::string_view s = v.get_string().value_unsafe();
        b.path(std::string(s));
      } else if (key == "position" || key == "bound") {
        if (!apply_position(v, t, key, key == "bound", b, err_out)) return false;
      } else if (key == "direction") {
        if (t != simdjson::ondemand::json_type::string)
          return set_err(err_out, "config: 'direction' must be a string");
        b.direction(v.get_string().value_unsafe());
      } else if (key == "chunk_size") {
        if (t != simdjson::ondemand::json_type::number)
          return set_err(err_out, "config: 'chunk_size' must be an integer");
        std::uint64_t n = v.get_uint64();
        b.chunk_size(static_cast<std::size_t>(n));
      } else if (key == "terminator") {
        if (t != simdjson::ondemand::json_type::string)
          return set_err(err_out, "config: 'terminator' must be a string");
        std::string_view s = v.get_string().value_unsafe();
        if (s.size() != 1)
          return set_err(err_out, "config: 'terminator' must be exactly one byte");
        b.terminator(s[0]);
      }
      // unknown keys are skipped
    }
    return true;
  } catch (const simdjson::simdjson_error& e) {
    return set_err(err_out, std::string("config: ") + e.what());
  }
}

bool load_config_file(const std::string& file, ConfigBuilder& b, std::string* err_out) {
  simdjson::padded_string json;
  auto error = simdjson::padded_string::load(file).get(json);
  if (error) {
    return set_err(err_out, "config: cannot read " + file + ": " + simdjson::error_message(error));
  }
  simdjson::ondemand::parser parser;
  return apply_document(parser, json, b, err_out);
}

bool load_config_json(std::string_view text, ConfigBuilder& b, std::string* err_out) {
  simdjson::padded_string json(text);
  simdjson::ondemand::parser parser;
  return apply_document(parser, json, b, err_out);
}

}
