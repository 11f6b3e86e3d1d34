#pragma once

#include <algorithm>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace whodat {

namespace detail {

inline double clip01(double value) {
  return std::clamp(value, 0.0, 1.0);
}

} // namespace detail

// Weight assumed for an attribute an entity does not describe.
inline constexpr double kUnknownWeight = 0.5;

struct Entity {
  std::string id;
  std::string name;
  std::unordered_map<std::string, double> attributes;

  double weight(const std::string& attribute_key) const {
    auto it = attributes.find(attribute_key);
    return it == attributes.end() ? kUnknownWeight : it->second;
  }
};

struct Question {
  std::string id;
  std::string attribute_key;
  std::string text;
};

enum class GamePhase {
  Asking,
  Guessing,
  Won,
  NoCandidates
};

inline std::string to_string(GamePhase phase) {
  switch (phase) {
    case GamePhase::Asking: return "asking";
    case GamePhase::Guessing: return "guessing";
    case GamePhase::Won: return "won";
    case GamePhase::NoCandidates: return "no_candidates";
  }
  return "asking";
}

inline GamePhase game_phase_from_string(const std::string& value) {
  if (value == "asking") {
    return GamePhase::Asking;
  }
  if (value == "guessing") {
    return GamePhase::Guessing;
  }
  if (value == "won") {
    return GamePhase::Won;
  }
  if (value == "no_candidates") {
    return GamePhase::NoCandidates;
  }
  throw std::invalid_argument("Unknown game phase: " + value);
}

inline bool is_terminal(GamePhase phase) {
  return phase == GamePhase::Won || phase == GamePhase::NoCandidates;
}

// Ordered containers keep ranking, encoding and iteration deterministic.
using ScoreMap = std::map<std::string, double>;

struct GameState {
  ScoreMap scores;
  std::set<std::string> asked;
  std::set<std::string> excluded;
  int turn_count = 0;
  GamePhase phase = GamePhase::Asking;
  std::optional<std::string> last_guess;

  bool is_excluded(const std::string& entity_id) const {
    return excluded.count(entity_id) != 0;
  }

  bool operator==(const GameState& other) const {
    return scores == other.scores && asked == other.asked && excluded == other.excluded &&
           turn_count == other.turn_count && phase == other.phase &&
           last_guess == other.last_guess;
  }
  bool operator!=(const GameState& other) const { return !(*this == other); }
};

struct RankedEntity {
  std::string entity_id;
  double score = 0.0;
};

struct Candidate {
  std::string entity_id;
  std::string name;
  double score = 0.0;
  double certainty = 0.0;
};

struct QuestionPrompt {
  std::string question_id;
  std::string attribute_key;
  std::string text;
  int turn = 0;
};

struct GuessPrompt {
  std::string entity_id;
  std::string name;
  double certainty = 0.0;
  std::vector<Candidate> top_candidates;
};

// Every entity has been excluded: the engine gives up on this round.
struct Exhausted {
  int turn_count = 0;
  std::size_t excluded_count = 0;
};

using Next = std::variant<QuestionPrompt, GuessPrompt, Exhausted>;

} // namespace whodat
