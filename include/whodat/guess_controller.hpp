#pragma once

#include "catalog.hpp"
#include "config.hpp"
#include "question_selector.hpp"
#include "types.hpp"

#include <string>
#include <vector>

namespace whodat {

/**
 * GuessController owns the ASKING -> GUESSING -> (WON | RETRYING) state machine.
 * Every method either fully applies its change to the GameState or throws
 * before touching it.
 */
class GuessController {
public:
  explicit GuessController(EngineConfig config = {});

  const EngineConfig& config() const noexcept { return config_; }
  const QuestionSelector& selector() const noexcept { return selector_; }

  bool should_guess(const std::vector<RankedEntity>& ranking, int turn_count,
                    bool has_question) const;
  bool should_guess(const GameState& state, const Catalog& catalog) const;

  // Resolves the state into the next prompt: a question, a guess, or
  // Exhausted when every entity has been excluded. Updates phase/last_guess.
  Next decide(GameState& state, const Catalog& catalog) const;

  std::vector<Candidate> confirm(GameState& state, const Catalog& catalog,
                                 const std::string& entity_id) const;

  Next reject(GameState& state, const Catalog& catalog, const std::string& entity_id) const;

private:
  GuessPrompt make_guess(const GameState& state, const Catalog& catalog,
                         const std::string& entity_id) const;

  EngineConfig config_;
  QuestionSelector selector_;
};

} // namespace whodat
