#include "whodat/state_codec.hpp"

#include "whodat/errors.hpp"

#include <cmath>
#include <cstdint>
#include <set>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace whodat::codec {
namespace {

const nlohmann::json& require_field(const nlohmann::json& record, const char* key) {
  if (!record.contains(key)) {
    throw StateCorruptError("State record is missing '" + std::string(key) + "'");
  }
  return record[key];
}

std::set<std::string> json_to_id_set(const nlohmann::json& value, std::string_view key) {
  if (!value.is_array()) {
    throw StateCorruptError("Expected array<string> for field '" + std::string(key) + "'");
  }
  std::set<std::string> out;
  for (const auto& item : value) {
    if (!item.is_string()) {
      throw StateCorruptError("Expected array<string> for field '" + std::string(key) + "'");
    }
    if (!out.insert(item.get<std::string>()).second) {
      throw StateCorruptError("Duplicate id '" + item.get<std::string>() + "' in field '" +
                              std::string(key) + "'");
    }
  }
  return out;
}

void require_consistent_phase(const GameState& state, const Catalog& catalog) {
  bool any_active = false;
  for (const auto& entity : catalog.entities()) {
    if (!state.is_excluded(entity.id)) {
      any_active = true;
      break;
    }
  }
  switch (state.phase) {
    case GamePhase::NoCandidates:
      if (any_active) {
        throw StateCorruptError("Phase 'no_candidates' with entities still in play");
      }
      break;
    case GamePhase::Guessing:
    case GamePhase::Won:
      if (!state.last_guess.has_value()) {
        throw StateCorruptError("Phase '" + to_string(state.phase) + "' requires 'last_guess'");
      }
      if (state.is_excluded(*state.last_guess)) {
        throw StateCorruptError("Field 'last_guess' names excluded entity '" +
                                *state.last_guess + "'");
      }
      break;
    case GamePhase::Asking:
      if (!any_active) {
        throw StateCorruptError("Phase 'asking' with every entity excluded");
      }
      break;
  }
}

nlohmann::json id_set_to_json(const std::set<std::string>& ids) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& id : ids) {
    arr.push_back(id);
  }
  return arr;
}

} // namespace

nlohmann::json encode(const GameState& state) {
  nlohmann::json record = nlohmann::json::object();
  record["version"] = kStateVersion;

  nlohmann::json scores = nlohmann::json::object();
  for (const auto& [id, score] : state.scores) {
    scores[id] = score;
  }
  record["scores"] = std::move(scores);
  record["asked"] = id_set_to_json(state.asked);
  record["excluded"] = id_set_to_json(state.excluded);
  record["turn_count"] = state.turn_count;
  record["phase"] = to_string(state.phase);
  if (state.last_guess.has_value()) {
    record["last_guess"] = *state.last_guess;
  } else {
    record["last_guess"] = nullptr;
  }
  return record;
}

GameState decode(const nlohmann::json& record, const Catalog& catalog) {
  if (!record.is_object()) {
    throw StateCorruptError("State record must be an object");
  }

  const auto& version = require_field(record, "version");
  if (!version.is_number_integer() || version.get<std::int64_t>() != kStateVersion) {
    throw StateCorruptError("Unsupported state version");
  }

  GameState state;

  const auto& scores = require_field(record, "scores");
  if (!scores.is_object()) {
    throw StateCorruptError("Expected object for field 'scores'");
  }
  for (const auto& item : scores.items()) {
    if (!catalog.find_entity(item.key())) {
      throw StateCorruptError("Unknown entity '" + item.key() + "' in scores");
    }
    if (!item.value().is_number()) {
      throw StateCorruptError("Expected number for score of '" + item.key() + "'");
    }
    const double score = item.value().get<double>();
    if (!std::isfinite(score)) {
      throw StateCorruptError("Non-finite score for '" + item.key() + "'");
    }
    state.scores.emplace(item.key(), score);
  }

  state.asked = json_to_id_set(require_field(record, "asked"), "asked");
  for (const auto& id : state.asked) {
    if (!catalog.find_question(id)) {
      throw StateCorruptError("Unknown question '" + id + "' in asked");
    }
  }

  state.excluded = json_to_id_set(require_field(record, "excluded"), "excluded");
  for (const auto& id : state.excluded) {
    if (!catalog.find_entity(id)) {
      throw StateCorruptError("Unknown entity '" + id + "' in excluded");
    }
  }

  for (const auto& entity : catalog.entities()) {
    if (!state.is_excluded(entity.id) && state.scores.count(entity.id) == 0) {
      throw StateCorruptError("Scores are missing entity '" + entity.id + "'");
    }
  }

  // Each answer consumes at least one question, so turns never outnumber them.
  const auto& turn_count = require_field(record, "turn_count");
  if (!turn_count.is_number_integer() || turn_count.get<std::int64_t>() < 0 ||
      static_cast<std::uint64_t>(turn_count.get<std::int64_t>()) > catalog.question_count()) {
    throw StateCorruptError("Field 'turn_count' must be within [0, " +
                            std::to_string(catalog.question_count()) + "]");
  }
  state.turn_count = turn_count.get<int>();

  const auto& phase = require_field(record, "phase");
  if (!phase.is_string()) {
    throw StateCorruptError("Expected string for field 'phase'");
  }
  try {
    state.phase = game_phase_from_string(phase.get<std::string>());
  } catch (const std::invalid_argument& error) {
    throw StateCorruptError(error.what());
  }

  const auto& last_guess = require_field(record, "last_guess");
  if (!last_guess.is_null()) {
    if (!last_guess.is_string() || !catalog.find_entity(last_guess.get<std::string>())) {
      throw StateCorruptError("Field 'last_guess' must name a catalog entity or be null");
    }
    state.last_guess = last_guess.get<std::string>();
  }

  require_consistent_phase(state, catalog);
  return state;
}

std::string serialize(const GameState& state) {
  return encode(state).dump();
}

GameState deserialize(const std::string& blob, const Catalog& catalog) {
  nlohmann::json record;
  try {
    record = nlohmann::json::parse(blob);
  } catch (const nlohmann::json::parse_error& error) {
    throw StateCorruptError(std::string("State blob is not valid JSON: ") + error.what());
  }
  return decode(record, catalog);
}

} // namespace whodat::codec
