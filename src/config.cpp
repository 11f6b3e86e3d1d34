#include "whodat/config.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>

namespace whodat {
namespace {

template <typename Setter>
bool assign_if_present(const nlohmann::json& obj, const char* key, Setter&& setter) {
  if (!obj.contains(key)) {
    return false;
  }
  const auto& value = obj[key];
  if (value.is_null()) {
    return false;
  }
  setter(value);
  return true;
}

double json_to_double(const nlohmann::json& value, std::string_view key) {
  if (!value.is_number()) {
    throw std::invalid_argument("Expected number for field '" + std::string(key) + "'");
  }
  return value.get<double>();
}

long long json_to_integer(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_integer()) {
    return value.get<long long>();
  }
  if (value.is_number_float()) {
    const double v = value.get<double>();
    if (std::floor(v) == v) {
      return static_cast<long long>(v);
    }
  }
  throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
}

std::size_t json_to_size(const nlohmann::json& value, std::string_view key) {
  const long long v = json_to_integer(value, key);
  if (v < 0) {
    throw std::invalid_argument("Field '" + std::string(key) + "' must not be negative");
  }
  return static_cast<std::size_t>(v);
}

std::filesystem::path env_path(const char* name, const std::filesystem::path& fallback) {
  const char* env = std::getenv(name);
  if (!env || std::string_view(env).empty()) {
    return fallback;
  }
  return std::filesystem::path(env);
}

} // namespace

void EngineConfig::validate() const {
  if (!std::isfinite(margin_threshold) || margin_threshold <= 0.0) {
    throw std::invalid_argument("margin_threshold must be a positive number");
  }
  if (max_turns <= 0) {
    throw std::invalid_argument("max_turns must be greater than 0");
  }
  if (top_n == 0) {
    throw std::invalid_argument("top_n must be greater than 0");
  }
  if (window_size < 2) {
    throw std::invalid_argument("window_size must be at least 2");
  }
  if (window_fraction < 0.0 || window_fraction > 1.0) {
    throw std::invalid_argument("window_fraction must be within [0, 1]");
  }
}

EngineConfig engine_config_from_json(const nlohmann::json& json_config) {
  if (!json_config.is_object()) {
    throw std::invalid_argument("engine config must be an object");
  }
  EngineConfig config;
  assign_if_present(json_config, "margin_threshold", [&](const nlohmann::json& value) {
    config.margin_threshold = json_to_double(value, "margin_threshold");
  });
  assign_if_present(json_config, "max_turns", [&](const nlohmann::json& value) {
    config.max_turns = static_cast<int>(json_to_integer(value, "max_turns"));
  });
  assign_if_present(json_config, "top_n", [&](const nlohmann::json& value) {
    config.top_n = json_to_size(value, "top_n");
  });
  assign_if_present(json_config, "window_size", [&](const nlohmann::json& value) {
    config.window_size = json_to_size(value, "window_size");
  });
  assign_if_present(json_config, "window_fraction", [&](const nlohmann::json& value) {
    config.window_fraction = json_to_double(value, "window_fraction");
  });
  config.validate();
  return config;
}

nlohmann::json to_json(const EngineConfig& config) {
  nlohmann::json json = nlohmann::json::object();
  json["margin_threshold"] = config.margin_threshold;
  json["max_turns"] = config.max_turns;
  json["top_n"] = config.top_n;
  json["window_size"] = config.window_size;
  json["window_fraction"] = config.window_fraction;
  return json;
}

CatalogPaths catalog_paths_from_env() {
  CatalogPaths paths;
  paths.entities =
      env_path("WHODAT_DATASET_PATH", std::filesystem::path("resources") / "characters.json");
  paths.questions =
      env_path("WHODAT_QUESTIONS_PATH", std::filesystem::path("resources") / "questions.json");
  return paths;
}

} // namespace whodat
