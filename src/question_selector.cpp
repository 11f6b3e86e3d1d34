#include "whodat/question_selector.hpp"

#include "whodat/score_model.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <unordered_set>

namespace whodat {

QuestionSelector::QuestionSelector() : QuestionSelector(EngineConfig{}) {}

QuestionSelector::QuestionSelector(const EngineConfig& config)
    : window_size_(config.window_size), window_fraction_(config.window_fraction) {}

std::size_t QuestionSelector::window_for(std::size_t remaining) const {
  const auto fractional =
      static_cast<std::size_t>(std::ceil(window_fraction_ * static_cast<double>(remaining)));
  return std::min(remaining, std::max(window_size_, fractional));
}

double QuestionSelector::discrimination(const Catalog& catalog, const std::string& attribute_key,
                                        const std::vector<RankedEntity>& window) {
  if (window.size() < 2) {
    return 0.0;
  }
  std::vector<double> weights;
  weights.reserve(window.size());
  double sum = 0.0;
  for (const auto& ranked : window) {
    const Entity* entity = catalog.find_entity(ranked.entity_id);
    const double w = entity ? entity->weight(attribute_key) : kUnknownWeight;
    weights.push_back(w);
    sum += w;
  }
  const double mean = sum / static_cast<double>(weights.size());
  double variance = 0.0;
  for (double w : weights) {
    variance += (w - mean) * (w - mean);
  }
  return variance / static_cast<double>(weights.size());
}

const Question* QuestionSelector::next(const Catalog& catalog, const std::set<std::string>& asked,
                                       const ScoreMap& scores,
                                       const std::set<std::string>& excluded) const {
  const auto ranking = scoring::rank(scores, excluded);
  if (ranking.size() < 2) {
    return nullptr;
  }
  const auto window_end =
      ranking.begin() + static_cast<std::ptrdiff_t>(window_for(ranking.size()));
  const std::vector<RankedEntity> window(ranking.begin(), window_end);

  std::unordered_set<std::string> answered_keys;
  for (const auto& question_id : asked) {
    if (const Question* question = catalog.find_question(question_id)) {
      answered_keys.insert(question->attribute_key);
    }
  }

  const Question* best = nullptr;
  double best_value = 0.0;
  for (const auto& question : catalog.questions()) {
    if (asked.count(question.id) != 0 || answered_keys.count(question.attribute_key) != 0) {
      continue;
    }
    const double value = discrimination(catalog, question.attribute_key, window);
    if (value <= kResolvedVariance) {
      continue;
    }
    if (!best || value > best_value || (value == best_value && question.id < best->id)) {
      best = &question;
      best_value = value;
    }
  }
  return best;
}

} // namespace whodat
