#include "whodat/game_engine.hpp"

#include "whodat/answers.hpp"
#include "whodat/errors.hpp"
#include "whodat/guess_controller.hpp"
#include "whodat/score_model.hpp"
#include "whodat/state_codec.hpp"
#include "debug.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace whodat {
namespace {

class GameEngineImpl : public GameEngine {
public:
  GameEngineImpl(std::shared_ptr<const Catalog> catalog, EngineConfig config)
      : catalog_(std::move(catalog)), controller_(std::move(config)) {
    if (!catalog_) {
      throw std::invalid_argument("GameEngine requires a catalog");
    }
  }

  Start new_game() const override {
    GameState state;
    state.scores = scoring::initialize(*catalog_);
    Next next = controller_.decide(state, *catalog_);
    return Start{std::move(state), std::move(next)};
  }

  Next answer(GameState& state, const std::string& attribute_key,
              double answer_weight) const override {
    if (is_terminal(state.phase)) {
      throw InvalidMove("answer: game already finished (" + to_string(state.phase) + ")");
    }
    if (state.phase != GamePhase::Asking) {
      throw InvalidMove("answer: a guess is awaiting confirmation");
    }
    if (state.turn_count < 0 || state.turn_count >= std::numeric_limits<int>::max()) {
      throw InvalidMove("answer: turn count out of range");
    }
    if (!std::isfinite(answer_weight) || !is_canonical_weight(answer_weight)) {
      throw InvalidAnswer("Answer weight must be one of 0, 0.25, 0.75, 1");
    }
    if (!catalog_->has_attribute(attribute_key)) {
      throw InvalidAnswer("Unknown attribute '" + attribute_key + "'");
    }
    const auto questions = catalog_->questions_for_attribute(attribute_key);
    if (questions.empty()) {
      throw InvalidAnswer("No question probes attribute '" + attribute_key + "'");
    }
    for (const Question* question : questions) {
      if (state.asked.count(question->id) != 0) {
        throw InvalidAnswer("Attribute '" + attribute_key + "' was already answered");
      }
    }

    GameState updated = state;
    scoring::update(updated.scores, *catalog_, attribute_key, answer_weight, updated.excluded);
    for (const Question* question : questions) {
      updated.asked.insert(question->id);
    }
    ++updated.turn_count;

    if (detail::engine_debug_enabled()) {
      std::ostringstream oss;
      oss << "turn " << updated.turn_count << ": " << attribute_key << "="
          << label_for_weight(answer_weight);
      detail::debug_log("engine", oss.str());
    }

    Next next = controller_.decide(updated, *catalog_);
    state = std::move(updated);
    return next;
  }

  Next answer(GameState& state, const std::string& attribute_key,
              std::string_view answer_label) const override {
    return answer(state, attribute_key, answer_weight_from_label(answer_label));
  }

  Next reject_guess(GameState& state, const std::string& entity_id) const override {
    return controller_.reject(state, *catalog_, entity_id);
  }

  std::vector<Candidate> confirm_guess(GameState& state,
                                       const std::string& entity_id) const override {
    return controller_.confirm(state, *catalog_, entity_id);
  }

  std::string serialize(const GameState& state) const override {
    return codec::serialize(state);
  }

  GameState deserialize(const std::string& blob) const override {
    return codec::deserialize(blob, *catalog_);
  }

  Next current(const GameState& state) const override {
    if (state.phase == GamePhase::Won) {
      throw InvalidMove("current: game already finished (won)");
    }
    GameState scratch = state;
    return controller_.decide(scratch, *catalog_);
  }

  const Catalog& catalog() const override { return *catalog_; }

  const EngineConfig& config() const override { return controller_.config(); }

private:
  std::shared_ptr<const Catalog> catalog_;
  GuessController controller_;
};

} // namespace

std::unique_ptr<GameEngine> make_engine(std::shared_ptr<const Catalog> catalog,
                                        EngineConfig config) {
  return std::make_unique<GameEngineImpl>(std::move(catalog), std::move(config));
}

} // namespace whodat
