#pragma once

#include "catalog.hpp"
#include "config.hpp"
#include "types.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace whodat {

class GameEngine {
public:
  virtual ~GameEngine() = default;

  struct Start {
    GameState state;
    Next next;
  };

  virtual Start new_game() const = 0;

  // answer_weight must be one of the graded levels (see answers.hpp);
  // anything else throws InvalidAnswer and leaves state untouched.
  virtual Next answer(GameState& state, const std::string& attribute_key,
                      double answer_weight) const = 0;

  virtual Next answer(GameState& state, const std::string& attribute_key,
                      std::string_view answer_label) const = 0;

  virtual Next reject_guess(GameState& state, const std::string& entity_id) const = 0;

  // Ends the game as won. The returned candidates are for display only.
  virtual std::vector<Candidate> confirm_guess(GameState& state,
                                               const std::string& entity_id) const = 0;

  virtual std::string serialize(const GameState& state) const = 0;

  virtual GameState deserialize(const std::string& blob) const = 0;

  // Re-derives the pending prompt for a resumed state without mutating it.
  virtual Next current(const GameState& state) const = 0;

  virtual const Catalog& catalog() const = 0;

  virtual const EngineConfig& config() const = 0;
};

std::unique_ptr<GameEngine> make_engine(std::shared_ptr<const Catalog> catalog,
                                        EngineConfig config = {});

} // namespace whodat
