#include "whodat/score_model.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace whodat::scoring {

ScoreMap initialize(const Catalog& catalog) {
  ScoreMap scores;
  for (const auto& entity : catalog.entities()) {
    scores.emplace(entity.id, kBaselineScore);
  }
  return scores;
}

void update(ScoreMap& scores, const Catalog& catalog, const std::string& attribute_key,
            double answer_weight, const std::set<std::string>& excluded) {
  for (const auto& entity : catalog.entities()) {
    if (excluded.count(entity.id) != 0) {
      continue;
    }
    auto it = scores.find(entity.id);
    if (it == scores.end()) {
      throw std::out_of_range("score map has no entry for entity '" + entity.id + "'");
    }
    it->second += contribution(entity.weight(attribute_key), answer_weight);
  }
}

std::vector<RankedEntity> rank(const ScoreMap& scores, const std::set<std::string>& excluded,
                               std::size_t top_n) {
  std::vector<RankedEntity> ranked;
  ranked.reserve(scores.size());
  for (const auto& [id, score] : scores) {
    if (excluded.count(id) != 0) {
      continue;
    }
    ranked.push_back(RankedEntity{id, score});
  }
  // The map is already ordered by id, so a stable sort keeps id order on ties.
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const RankedEntity& a, const RankedEntity& b) { return a.score > b.score; });
  if (top_n > 0 && ranked.size() > top_n) {
    ranked.resize(top_n);
  }
  return ranked;
}

double certainty(const ScoreMap& scores, const std::set<std::string>& excluded,
                 const std::string& entity_id) {
  if (excluded.count(entity_id) != 0) {
    return 0.0;
  }
  auto target = scores.find(entity_id);
  if (target == scores.end()) {
    return 0.0;
  }

  double max_score = -std::numeric_limits<double>::infinity();
  for (const auto& [id, score] : scores) {
    if (excluded.count(id) == 0) {
      max_score = std::max(max_score, score);
    }
  }

  double total = 0.0;
  for (const auto& [id, score] : scores) {
    if (excluded.count(id) == 0) {
      total += std::exp(score - max_score);
    }
  }
  return std::exp(target->second - max_score) / total;
}

std::vector<Candidate> top_candidates(const ScoreMap& scores,
                                      const std::set<std::string>& excluded,
                                      const Catalog& catalog, std::size_t top_n) {
  std::vector<Candidate> candidates;
  for (const auto& ranked : rank(scores, excluded, top_n)) {
    Candidate candidate;
    candidate.entity_id = ranked.entity_id;
    const Entity* entity = catalog.find_entity(ranked.entity_id);
    candidate.name = entity ? entity->name : ranked.entity_id;
    candidate.score = ranked.score;
    candidate.certainty = certainty(scores, excluded, ranked.entity_id);
    candidates.push_back(std::move(candidate));
  }
  return candidates;
}

} // namespace whodat::scoring
