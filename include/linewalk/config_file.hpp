#pragma once
#include "linewalk/traversal_config.hpp"

#include <string>

namespace lw {

// Applies a JSON config file to `b`. Recognised keys (all optional):
//   path, position, direction, chunk_size, terminator, bound
// position/bound accept "start", "end", or a non-negative integer.
// Unknown keys are ignored. Returns false and fills err_out on a
// missing file, malformed JSON, or a value of the wrong type.
bool load_config_file(const std::string& file, ConfigBuilder& b,
                      std::string* err_out = nullptr);

// Same, from an in-memory document.
bool load_config_json(std::string_view json, ConfigBuilder& b,
                      std::string* err_out = nullptr);

}
