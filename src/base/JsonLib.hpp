#pragma once

#include "nlohmann/json.hpp"

/**
 * @brief Lightweight wrapper that exposes `nlohmann::json` as `json`.
 */
using json = nlohmann::json;

namespace tg {
/**
 * @brief Serializes compactly, replacing invalid UTF-8 with U+FFFD instead of
 * throwing.
 *
 * Terminal output is arbitrary bytes, so every outbound message goes through
 * here.
 */
inline std::string dumpJson(const json &j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}
}  // namespace tg
