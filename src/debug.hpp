#pragma once

#include <cstdlib>
#include <iostream>
#include <string>

namespace whodat::detail {

inline bool engine_debug_enabled() {
  static bool enabled = [] {
    const char* env = std::getenv("WHODAT_DEBUG_ENGINE");
    if (!env) {
      return false;
    }
    std::string value(env);
    return !(value.empty() || value == "0" || value == "false" || value == "FALSE");
  }();
  return enabled;
}

inline void debug_log(const char* tag, const std::string& message) {
  if (engine_debug_enabled()) {
    std::cerr << "[" << tag << "] " << message << std::endl;
  }
}

} // namespace whodat::detail
