#pragma once

#include <cstddef>
#include <filesystem>

#include <nlohmann/json.hpp>

namespace whodat {

struct EngineConfig {
  // Minimum gap between the top two scores that stops the questioning.
  double margin_threshold = 3.0;
  // Hard cap on answered questions before a guess is forced.
  int max_turns = 20;
  // Candidates shown alongside a guess.
  std::size_t top_n = 5;
  // Question selection looks at max(window_size, ceil(window_fraction * remaining))
  // of the best ranked candidates.
  std::size_t window_size = 10;
  double window_fraction = 0.2;

  void validate() const;
};

EngineConfig engine_config_from_json(const nlohmann::json& json_config);
nlohmann::json to_json(const EngineConfig& config);

struct CatalogPaths {
  std::filesystem::path entities;
  std::filesystem::path questions;
};

// WHODAT_DATASET_PATH / WHODAT_QUESTIONS_PATH, falling back to resources/.
CatalogPaths catalog_paths_from_env();

} // namespace whodat
