#include "whodat/guess_controller.hpp"

#include "whodat/errors.hpp"
#include "whodat/score_model.hpp"
#include "debug.hpp"

#include <sstream>
#include <utility>

namespace whodat {
namespace {

void require_open(const GameState& state, const char* operation) {
  if (is_terminal(state.phase)) {
    throw InvalidMove(std::string(operation) + ": game already finished (" +
                      to_string(state.phase) + ")");
  }
}

const Entity& require_candidate(const GameState& state, const Catalog& catalog,
                                const std::string& entity_id, const char* operation) {
  const Entity* entity = catalog.find_entity(entity_id);
  if (!entity) {
    throw InvalidMove(std::string(operation) + ": unknown entity '" + entity_id + "'");
  }
  if (state.is_excluded(entity_id)) {
    throw InvalidMove(std::string(operation) + ": entity '" + entity_id +
                      "' was already excluded");
  }
  return *entity;
}

} // namespace

GuessController::GuessController(EngineConfig config)
    : config_(std::move(config)), selector_(config_) {
  config_.validate();
}

bool GuessController::should_guess(const std::vector<RankedEntity>& ranking, int turn_count,
                                   bool has_question) const {
  if (ranking.empty()) {
    return false;
  }
  if (ranking.size() == 1 || !has_question || turn_count >= config_.max_turns) {
    return true;
  }
  return ranking[0].score - ranking[1].score >= config_.margin_threshold;
}

bool GuessController::should_guess(const GameState& state, const Catalog& catalog) const {
  const auto ranking = scoring::rank(state.scores, state.excluded);
  const bool has_question =
      selector_.next(catalog, state.asked, state.scores, state.excluded) != nullptr;
  return should_guess(ranking, state.turn_count, has_question);
}

GuessPrompt GuessController::make_guess(const GameState& state, const Catalog& catalog,
                                        const std::string& entity_id) const {
  GuessPrompt guess;
  guess.entity_id = entity_id;
  const Entity* entity = catalog.find_entity(entity_id);
  guess.name = entity ? entity->name : entity_id;
  guess.certainty = scoring::certainty(state.scores, state.excluded, entity_id);
  guess.top_candidates =
      scoring::top_candidates(state.scores, state.excluded, catalog, config_.top_n);
  return guess;
}

Next GuessController::decide(GameState& state, const Catalog& catalog) const {
  const auto ranking = scoring::rank(state.scores, state.excluded);
  if (ranking.empty()) {
    state.phase = GamePhase::NoCandidates;
    detail::debug_log("engine", "every entity excluded after " +
                                    std::to_string(state.turn_count) + " turns");
    return Exhausted{state.turn_count, state.excluded.size()};
  }

  const Question* question = selector_.next(catalog, state.asked, state.scores, state.excluded);
  if (should_guess(ranking, state.turn_count, question != nullptr)) {
    const auto& top = ranking.front();
    state.phase = GamePhase::Guessing;
    state.last_guess = top.entity_id;
    if (detail::engine_debug_enabled()) {
      std::ostringstream oss;
      oss << "guessing '" << top.entity_id << "' score=" << top.score
          << " turn=" << state.turn_count << " remaining=" << ranking.size();
      detail::debug_log("engine", oss.str());
    }
    return make_guess(state, catalog, top.entity_id);
  }

  state.phase = GamePhase::Asking;
  QuestionPrompt prompt;
  prompt.question_id = question->id;
  prompt.attribute_key = question->attribute_key;
  prompt.text = question->text;
  prompt.turn = state.turn_count + 1;
  return prompt;
}

std::vector<Candidate> GuessController::confirm(GameState& state, const Catalog& catalog,
                                                const std::string& entity_id) const {
  require_open(state, "confirm");
  require_candidate(state, catalog, entity_id, "confirm");

  auto candidates = scoring::top_candidates(state.scores, state.excluded, catalog, config_.top_n);
  state.phase = GamePhase::Won;
  state.last_guess = entity_id;
  detail::debug_log("engine", "confirmed '" + entity_id + "' after " +
                                  std::to_string(state.turn_count) + " turns");
  return candidates;
}

Next GuessController::reject(GameState& state, const Catalog& catalog,
                             const std::string& entity_id) const {
  require_open(state, "reject");
  require_candidate(state, catalog, entity_id, "reject");

  GameState updated = state;
  updated.excluded.insert(entity_id);
  detail::debug_log("engine", "excluded '" + entity_id + "'");
  Next next = decide(updated, catalog);
  state = std::move(updated);
  return next;
}

} // namespace whodat
