#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace dcm::core {

// dump_json serializes JSON for storage and display. Filenames arrive as raw
// bytes, so invalid UTF-8 is replaced with U+FFFD rather than throwing
// type_error.316.
inline std::string dump_json(const nlohmann::json& j, int indent = -1) {
  return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace dcm::core
